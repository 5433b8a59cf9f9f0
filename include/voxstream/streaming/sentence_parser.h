/**
 * @file sentence_parser.h
 * @brief VoxStream Streaming - Incremental sentence segmentation
 *
 * Splits text that arrives a few characters at a time (LLM token deltas)
 * into sentences that can be synthesized independently. The result does not
 * depend on how the input was split into deltas.
 */

#ifndef VOXSTREAM_STREAMING_SENTENCE_PARSER_H
#define VOXSTREAM_STREAMING_SENTENCE_PARSER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

#include "voxstream/core/vxs_events.h"
#include "voxstream/core/vxs_types.h"
#include "voxstream/streaming/streaming_config.h"
#include "voxstream/streaming/streaming_types.h"

namespace voxstream {
namespace streaming {

/**
 * @brief Stateful sentence segmenter, one instance per response.
 *
 * A boundary is a run of terminal punctuation (. ! ?) plus any closing
 * quotes or brackets, followed by whitespace. Abbreviations, decimal points,
 * initials and ellipses are not boundaries. Chunks shorter than
 * min_chunk_length are held and merged with the next one.
 *
 * Not thread-safe; feed it from a single thread.
 */
class SentenceParser {
   public:
    explicit SentenceParser(const ParserConfig& config = ParserConfig{},
                            EventEmitter events = EventEmitter{});

    // Non-copyable
    SentenceParser(const SentenceParser&) = delete;
    SentenceParser& operator=(const SentenceParser&) = delete;

    /**
     * @brief Append a text delta and return every chunk it completes.
     *
     * Returns nothing once the parser is finalized or has failed.
     */
    std::vector<TextChunk> add_chunk(const std::string& delta);

    /**
     * @brief Flush the remaining text when the upstream stream ends.
     *
     * A remainder that is only whitespace comes back with empty text and no
     * sequence number, so the raw text of every chunk still adds up to the
     * input; callers skip it for synthesis.
     *
     * @param out Receives the remainder, even without terminal punctuation
     * @return false when nothing is left, the parser already finalized, or
     *         the parser failed
     */
    bool finalize(TextChunk& out);

    /** Discard all buffered text and restart numbering. */
    void reset();

    /** VXS_SUCCESS, or VXS_ERROR_PARSE_BUFFER_OVERFLOW once failed. */
    vxs_result_t last_error() const { return last_error_; }

    bool failed() const { return failed_; }
    bool finalized() const { return finalized_; }
    size_t buffered_length() const { return buffer_.size(); }
    int64_t next_sequence_number() const { return next_sequence_; }

    // Reserve a sequence number without emitting text (plain requests)
    int64_t reserve_sequence_number() { return next_sequence_++; }

   private:
    enum class Decision { Boundary, NotBoundary, Undecided };

    Decision classify_punctuation(size_t pos, size_t& run_end, size_t& chunk_end) const;
    Decision classify_newline(size_t pos) const;

    bool is_abbreviation(size_t period_pos) const;
    bool is_initial(size_t period_pos) const;
    bool is_decimal_point(size_t period_pos) const;

    // Emits buffer_[0, end) when long enough; returns true if emitted
    bool try_emit(size_t end, std::vector<TextChunk>& out);

    ParserConfig config_;
    EventEmitter events_;
    std::unordered_set<std::string> abbreviations_;

    std::string buffer_;
    size_t scan_pos_ = 0;
    int64_t next_sequence_ = 0;

    bool finalized_ = false;
    bool failed_ = false;
    vxs_result_t last_error_ = VXS_SUCCESS;
};

/** Strip ASCII whitespace from both ends. */
std::string trim_whitespace(const std::string& text);

}  // namespace streaming
}  // namespace voxstream

#endif  // VOXSTREAM_STREAMING_SENTENCE_PARSER_H
