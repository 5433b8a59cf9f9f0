/**
 * @file sentence_parser.cpp
 * @brief VoxStream Streaming - Incremental sentence segmentation
 */

#include "voxstream/streaming/sentence_parser.h"

#include <algorithm>
#include <cctype>
#include <utility>

#include "voxstream/core/vxs_logger.h"

#define LOG_TAG "Streaming.Parser"
#define LOGD(...) VXS_LOG_DEBUG(LOG_TAG, __VA_ARGS__)
#define LOGW(...) VXS_LOG_WARNING(LOG_TAG, __VA_ARGS__)
#define LOGE(...) VXS_LOG_ERROR(LOG_TAG, __VA_ARGS__)

namespace voxstream {
namespace streaming {

namespace {

constexpr size_t kMinEllipsisRun = 3;

bool is_terminal_punct(char c) {
    return c == '.' || c == '!' || c == '?';
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool is_alpha(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

bool is_upper(char c) {
    return std::isupper(static_cast<unsigned char>(c)) != 0;
}

bool is_ascii_closer(char c) {
    return c == '"' || c == '\'' || c == ')' || c == ']' || c == '}';
}

bool is_opener(char c) {
    return c == '"' || c == '\'' || c == '(' || c == '[' || c == '{';
}

// UTF-8 right double / right single quotation marks
const char kRightDoubleQuote[] = "\xE2\x80\x9D";
const char kRightSingleQuote[] = "\xE2\x80\x99";
constexpr size_t kUtf8QuoteLen = 3;

std::string normalize_abbreviation(std::string abbreviation) {
    while (!abbreviation.empty() && abbreviation.back() == '.') {
        abbreviation.pop_back();
    }
    std::transform(abbreviation.begin(), abbreviation.end(), abbreviation.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return abbreviation;
}

}  // namespace

std::string trim_whitespace(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\n\r\f\v");
    return text.substr(start, end - start + 1);
}

// =============================================================================
// CONSTRUCTION
// =============================================================================

SentenceParser::SentenceParser(const ParserConfig& config, EventEmitter events)
    : config_(config), events_(std::move(events)), next_sequence_(config.first_sequence_number) {
    for (const auto& abbreviation : config_.abbreviations) {
        std::string normalized = normalize_abbreviation(abbreviation);
        if (!normalized.empty()) {
            abbreviations_.insert(normalized);
        }
    }
}

void SentenceParser::reset() {
    buffer_.clear();
    scan_pos_ = 0;
    next_sequence_ = config_.first_sequence_number;
    finalized_ = false;
    failed_ = false;
    last_error_ = VXS_SUCCESS;
}

// =============================================================================
// SCANNING
// =============================================================================

std::vector<TextChunk> SentenceParser::add_chunk(const std::string& delta) {
    std::vector<TextChunk> chunks;
    if (failed_) {
        return chunks;
    }
    if (finalized_) {
        LOGW("add_chunk after finalize, %zu bytes ignored", delta.size());
        return chunks;
    }

    buffer_ += delta;

    size_t i = scan_pos_;
    while (i < buffer_.size()) {
        char c = buffer_[i];

        if (is_terminal_punct(c)) {
            size_t run_end = i;
            size_t chunk_end = i;
            Decision decision = classify_punctuation(i, run_end, chunk_end);
            if (decision == Decision::Undecided) {
                break;
            }
            if (decision == Decision::Boundary && try_emit(chunk_end, chunks)) {
                i = 0;
                continue;
            }
            // Held (too short) or excluded: the whole run is decided
            i = (decision == Decision::Boundary) ? chunk_end : run_end;
            continue;
        }

        if (c == '\n' && config_.break_on_blank_line) {
            Decision decision = classify_newline(i);
            if (decision == Decision::Undecided) {
                break;
            }
            if (decision == Decision::Boundary && try_emit(i, chunks)) {
                i = 0;
                continue;
            }
        }

        i++;
    }
    scan_pos_ = i;

    if (buffer_.size() > config_.max_buffer_length) {
        failed_ = true;
        last_error_ = VXS_ERROR_PARSE_BUFFER_OVERFLOW;
        LOGE("Buffer overflow: %zu bytes without a boundary (limit %zu)", buffer_.size(),
             config_.max_buffer_length);
        events_.parse_buffer_overflow(buffer_.size());
    }
    return chunks;
}

SentenceParser::Decision SentenceParser::classify_punctuation(size_t pos, size_t& run_end,
                                                              size_t& chunk_end) const {
    size_t j = pos;
    while (j < buffer_.size() && is_terminal_punct(buffer_[j])) {
        j++;
    }
    run_end = j;
    if (j == buffer_.size()) {
        return Decision::Undecided;
    }

    // Closing quotes and brackets stay with the sentence they close
    while (j < buffer_.size()) {
        if (is_ascii_closer(buffer_[j])) {
            j++;
            continue;
        }
        if (static_cast<unsigned char>(buffer_[j]) == 0xE2) {
            if (j + kUtf8QuoteLen > buffer_.size()) {
                return Decision::Undecided;
            }
            if (buffer_.compare(j, kUtf8QuoteLen, kRightDoubleQuote) == 0 ||
                buffer_.compare(j, kUtf8QuoteLen, kRightSingleQuote) == 0) {
                j += kUtf8QuoteLen;
                continue;
            }
        }
        break;
    }
    if (j == buffer_.size()) {
        return Decision::Undecided;
    }
    chunk_end = j;

    if (!is_space(buffer_[j])) {
        return Decision::NotBoundary;
    }

    size_t run_len = run_end - pos;
    bool all_periods = std::all_of(buffer_.begin() + static_cast<std::ptrdiff_t>(pos),
                                   buffer_.begin() + static_cast<std::ptrdiff_t>(run_end),
                                   [](char ch) { return ch == '.'; });
    if (all_periods && run_len >= kMinEllipsisRun) {
        return Decision::NotBoundary;
    }

    if (run_len == 1 && buffer_[pos] == '.') {
        if (is_decimal_point(pos) || is_abbreviation(pos) || is_initial(pos)) {
            return Decision::NotBoundary;
        }
    }
    return Decision::Boundary;
}

SentenceParser::Decision SentenceParser::classify_newline(size_t pos) const {
    if (pos + 1 >= buffer_.size()) {
        return Decision::Undecided;
    }
    return buffer_[pos + 1] == '\n' ? Decision::Boundary : Decision::NotBoundary;
}

bool SentenceParser::is_decimal_point(size_t period_pos) const {
    return period_pos > 0 && period_pos + 1 < buffer_.size() && is_digit(buffer_[period_pos - 1]) &&
           is_digit(buffer_[period_pos + 1]);
}

bool SentenceParser::is_abbreviation(size_t period_pos) const {
    size_t start = period_pos;
    while (start > 0 && (is_alpha(buffer_[start - 1]) || buffer_[start - 1] == '.')) {
        start--;
    }
    std::string token = normalize_abbreviation(buffer_.substr(start, period_pos - start));
    while (!token.empty() && token.front() == '.') {
        token.erase(0, 1);
    }
    return !token.empty() && abbreviations_.count(token) > 0;
}

// A lone capital letter before the period ("J." in "J.K. Rowling"). A
// standalone "I" is the pronoun and may end a sentence.
bool SentenceParser::is_initial(size_t period_pos) const {
    if (period_pos == 0 || !is_upper(buffer_[period_pos - 1])) {
        return false;
    }
    if (period_pos == 1) {
        return buffer_[0] != 'I';
    }
    char before = buffer_[period_pos - 2];
    if (before == '.') {
        return true;
    }
    if (is_space(before) || is_opener(before)) {
        return buffer_[period_pos - 1] != 'I';
    }
    return false;
}

// =============================================================================
// EMISSION
// =============================================================================

bool SentenceParser::try_emit(size_t end, std::vector<TextChunk>& out) {
    std::string raw = buffer_.substr(0, end);
    std::string text = trim_whitespace(raw);
    if (text.empty() || text.size() < static_cast<size_t>(config_.min_chunk_length)) {
        return false;
    }

    TextChunk chunk;
    chunk.sequence_number = next_sequence_++;
    chunk.raw_text = std::move(raw);
    chunk.text = std::move(text);

    buffer_.erase(0, end);
    scan_pos_ = 0;

    LOGD("Chunk %lld: %zu chars", static_cast<long long>(chunk.sequence_number),
         chunk.text.size());
    events_.chunk_detected(chunk.sequence_number, chunk.text);
    out.push_back(std::move(chunk));
    return true;
}

bool SentenceParser::finalize(TextChunk& out) {
    if (failed_) {
        return false;
    }
    if (finalized_) {
        LOGW("finalize called more than once");
        return false;
    }
    finalized_ = true;

    if (buffer_.empty()) {
        return false;
    }

    std::string text = trim_whitespace(buffer_);
    out = TextChunk();
    if (text.empty()) {
        // Whitespace tail: kept for the raw round trip, never synthesized
        out.raw_text = std::move(buffer_);
        buffer_.clear();
        scan_pos_ = 0;
        return true;
    }

    out.sequence_number = next_sequence_++;
    out.raw_text = std::move(buffer_);
    out.text = std::move(text);
    buffer_.clear();
    scan_pos_ = 0;

    events_.chunk_detected(out.sequence_number, out.text);
    return true;
}

}  // namespace streaming
}  // namespace voxstream
