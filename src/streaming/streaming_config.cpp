/**
 * @file streaming_config.cpp
 * @brief VoxStream Streaming - Configuration loading and validation
 */

#include "voxstream/streaming/streaming_config.h"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "voxstream/core/vxs_logger.h"

#define LOG_TAG "Config"
#define LOGI(...) VXS_LOG_INFO(LOG_TAG, __VA_ARGS__)
#define LOGW(...) VXS_LOG_WARNING(LOG_TAG, __VA_ARGS__)
#define LOGE(...) VXS_LOG_ERROR(LOG_TAG, __VA_ARGS__)

namespace voxstream {
namespace streaming {

using Json = nlohmann::json;

// =============================================================================
// STRATEGY NAMES
// =============================================================================

const char* error_strategy_to_string(ErrorStrategy strategy) {
    switch (strategy) {
        case ErrorStrategy::Skip:
            return "skip";
        case ErrorStrategy::Retry:
            return "retry";
        case ErrorStrategy::Fallback:
            return "fallback";
        default:
            return "unknown";
    }
}

const char* interruption_strategy_to_string(InterruptionStrategy strategy) {
    switch (strategy) {
        case InterruptionStrategy::Immediate:
            return "immediate";
        case InterruptionStrategy::Graceful:
            return "graceful";
        case InterruptionStrategy::Drain:
            return "drain";
        default:
            return "unknown";
    }
}

bool parse_error_strategy(const std::string& name, ErrorStrategy& out) {
    if (name == "skip") {
        out = ErrorStrategy::Skip;
    } else if (name == "retry") {
        out = ErrorStrategy::Retry;
    } else if (name == "fallback") {
        out = ErrorStrategy::Fallback;
    } else {
        return false;
    }
    return true;
}

bool parse_interruption_strategy(const std::string& name, InterruptionStrategy& out) {
    if (name == "immediate") {
        out = InterruptionStrategy::Immediate;
    } else if (name == "graceful") {
        out = InterruptionStrategy::Graceful;
    } else if (name == "drain") {
        out = InterruptionStrategy::Drain;
    } else {
        return false;
    }
    return true;
}

std::vector<std::string> default_abbreviations() {
    return {
        // Titles
        "mr", "mrs", "ms", "dr", "prof", "sr", "jr", "st",
        // Months (no "may", it is a full word)
        "jan", "feb", "mar", "apr", "jun", "jul", "aug", "sep", "sept", "oct", "nov", "dec",
        // Days
        "mon", "tue", "wed", "thu", "fri", "sat", "sun",
        // Latin and references
        "etc", "vs", "i.e", "e.g", "al", "ibid", "cf", "no", "vol", "fig", "pp", "p",
        // Addresses
        "ave", "blvd", "rd",
        // Degrees and units
        "phd", "md", "ba", "bs", "ma", "mph", "approx",
    };
}

namespace {

void set_error(std::string* error_out, const std::string& message) {
    if (error_out) {
        *error_out = message;
    }
}

// =============================================================================
// JSON FIELD READERS
// =============================================================================

bool read_int(const Json& json, const char* key, int32_t& out, std::string* error_out) {
    if (!json.contains(key)) {
        return true;
    }
    if (!json[key].is_number_integer()) {
        set_error(error_out, std::string(key) + " must be an integer");
        return false;
    }
    const Json& value = json[key];
    bool in_range = value.is_number_unsigned()
                        ? value.get<uint64_t>() <= static_cast<uint64_t>(INT32_MAX)
                        : value.get<int64_t>() >= INT32_MIN && value.get<int64_t>() <= INT32_MAX;
    if (!in_range) {
        set_error(error_out, std::string(key) + " is out of range");
        return false;
    }
    out = static_cast<int32_t>(value.get<int64_t>());
    return true;
}

bool read_bool(const Json& json, const char* key, bool& out, std::string* error_out) {
    if (!json.contains(key)) {
        return true;
    }
    if (!json[key].is_boolean()) {
        set_error(error_out, std::string(key) + " must be a boolean");
        return false;
    }
    out = json[key].get<bool>();
    return true;
}

bool read_string(const Json& json, const char* key, std::string& out, std::string* error_out) {
    if (!json.contains(key)) {
        return true;
    }
    if (!json[key].is_string()) {
        set_error(error_out, std::string(key) + " must be a string");
        return false;
    }
    out = json[key].get<std::string>();
    return true;
}

bool read_parser(const Json& json, ParserConfig& parser, std::string* error_out) {
    if (!json.is_object()) {
        set_error(error_out, "parser must be an object");
        return false;
    }
    if (!read_int(json, "min_chunk_length", parser.min_chunk_length, error_out)) return false;

    if (json.contains("max_buffer_length")) {
        if (!json["max_buffer_length"].is_number_unsigned()) {
            set_error(error_out, "max_buffer_length must be a positive integer");
            return false;
        }
        parser.max_buffer_length = json["max_buffer_length"].get<size_t>();
    }

    if (json.contains("abbreviations")) {
        const Json& list = json["abbreviations"];
        if (!list.is_array()) {
            set_error(error_out, "abbreviations must be an array of strings");
            return false;
        }
        parser.abbreviations.clear();
        for (const auto& item : list) {
            if (!item.is_string()) {
                set_error(error_out, "abbreviations must be an array of strings");
                return false;
            }
            parser.abbreviations.push_back(item.get<std::string>());
        }
    }

    if (!read_bool(json, "break_on_blank_line", parser.break_on_blank_line, error_out)) {
        return false;
    }
    return true;
}

bool read_voice(const Json& json, VoiceParams& voice, std::string* error_out) {
    if (!json.is_object()) {
        set_error(error_out, "voice must be an object");
        return false;
    }
    if (!read_string(json, "voice_id", voice.voice_id, error_out)) return false;
    if (!read_string(json, "output_format", voice.output_format, error_out)) return false;

    if (json.contains("speed")) {
        if (!json["speed"].is_number()) {
            set_error(error_out, "speed must be a number");
            return false;
        }
        voice.speed = json["speed"].get<float>();
    }

    if (json.contains("options")) {
        const Json& opts = json["options"];
        if (!opts.is_object()) {
            set_error(error_out, "voice options must be an object");
            return false;
        }
        for (auto it = opts.begin(); it != opts.end(); ++it) {
            voice.options[it.key()] = it.value().is_string() ? it.value().get<std::string>()
                                                             : it.value().dump();
        }
    }
    return true;
}

bool read_synthesis(const Json& json, SynthesisConfig& synthesis, std::string* error_out) {
    if (!json.is_object()) {
        set_error(error_out, "synthesis must be an object");
        return false;
    }
    if (!read_int(json, "max_concurrent", synthesis.max_concurrent, error_out)) return false;
    if (!read_int(json, "num_workers", synthesis.num_workers, error_out)) return false;
    if (!read_int(json, "max_retries", synthesis.max_retries, error_out)) return false;
    if (!read_int(json, "retry_backoff_ms", synthesis.retry_backoff_ms, error_out)) return false;
    if (!read_int(json, "synthesis_timeout_ms", synthesis.synthesis_timeout_ms, error_out)) {
        return false;
    }

    std::string strategy;
    if (!read_string(json, "error_strategy", strategy, error_out)) return false;
    if (!strategy.empty() && !parse_error_strategy(strategy, synthesis.error_strategy)) {
        set_error(error_out, "unknown error_strategy '" + strategy + "'");
        return false;
    }

    if (json.contains("voice") && !read_voice(json["voice"], synthesis.voice, error_out)) {
        return false;
    }
    return true;
}

bool read_playback(const Json& json, PlaybackConfig& playback, std::string* error_out) {
    if (!json.is_object()) {
        set_error(error_out, "playback must be an object");
        return false;
    }
    if (!read_int(json, "drain_count", playback.drain_count, error_out)) return false;

    std::string strategy;
    if (!read_string(json, "interruption_strategy", strategy, error_out)) return false;
    if (!strategy.empty() && !parse_interruption_strategy(strategy, playback.interruption_strategy)) {
        set_error(error_out, "unknown interruption_strategy '" + strategy + "'");
        return false;
    }
    return true;
}

// =============================================================================
// ENVIRONMENT READERS
// =============================================================================

bool env_int(const char* name, int32_t& out, std::string* error_out) {
    const char* value = std::getenv(name);
    if (value == nullptr || value[0] == '\0') {
        return true;
    }
    errno = 0;
    char* end = nullptr;
    long parsed = std::strtol(value, &end, 10);
    if (errno != 0 || end == value || *end != '\0' || parsed < INT32_MIN || parsed > INT32_MAX) {
        set_error(error_out, std::string(name) + " is not an integer: " + value);
        return false;
    }
    out = static_cast<int32_t>(parsed);
    return true;
}

bool env_bool(const char* name, bool& out, std::string* error_out) {
    const char* value = std::getenv(name);
    if (value == nullptr || value[0] == '\0') {
        return true;
    }
    std::string v(value);
    if (v == "1" || v == "true" || v == "TRUE" || v == "yes") {
        out = true;
    } else if (v == "0" || v == "false" || v == "FALSE" || v == "no") {
        out = false;
    } else {
        set_error(error_out, std::string(name) + " is not a boolean: " + value);
        return false;
    }
    return true;
}

}  // namespace

// =============================================================================
// VALIDATION
// =============================================================================

vxs_result_t StreamingConfig::validate(std::string* error_out) const {
    if (parser.min_chunk_length < 0 || parser.min_chunk_length > kMaxMinChunkLength) {
        set_error(error_out, "min_chunk_length must be between 0 and 200");
        return VXS_ERROR_INVALID_CONFIG;
    }
    if (parser.max_buffer_length == 0 ||
        parser.max_buffer_length < static_cast<size_t>(parser.min_chunk_length)) {
        set_error(error_out, "max_buffer_length must be at least min_chunk_length");
        return VXS_ERROR_INVALID_CONFIG;
    }
    for (const auto& abbreviation : parser.abbreviations) {
        if (abbreviation.empty()) {
            set_error(error_out, "abbreviations must not contain empty entries");
            return VXS_ERROR_INVALID_CONFIG;
        }
    }
    if (synthesis.max_concurrent < kMinConcurrent || synthesis.max_concurrent > kMaxConcurrent) {
        set_error(error_out, "max_concurrent must be between 1 and 8");
        return VXS_ERROR_INVALID_CONFIG;
    }
    if (synthesis.num_workers != 0 && synthesis.num_workers < synthesis.max_concurrent) {
        set_error(error_out, "num_workers must be 0 or at least max_concurrent");
        return VXS_ERROR_INVALID_CONFIG;
    }
    if (synthesis.max_retries < 0 || synthesis.max_retries > kMaxRetries) {
        set_error(error_out, "max_retries must be between 0 and 5");
        return VXS_ERROR_INVALID_CONFIG;
    }
    if (synthesis.retry_backoff_ms < 0 || synthesis.retry_backoff_ms > kMaxRetryBackoffMs) {
        set_error(error_out, "retry_backoff_ms must be between 0 and 10000");
        return VXS_ERROR_INVALID_CONFIG;
    }
    if (synthesis.synthesis_timeout_ms <= 0) {
        set_error(error_out, "synthesis_timeout_ms must be positive");
        return VXS_ERROR_INVALID_CONFIG;
    }
    if (synthesis.voice.speed < kMinSpeed || synthesis.voice.speed > kMaxSpeed) {
        set_error(error_out, "speed must be between 0.5 and 2.0");
        return VXS_ERROR_INVALID_CONFIG;
    }
    if (synthesis.voice.output_format.empty()) {
        set_error(error_out, "output_format must not be empty");
        return VXS_ERROR_INVALID_CONFIG;
    }
    if (playback.drain_count < 0 || playback.drain_count > kMaxDrainCount) {
        set_error(error_out, "drain_count must be between 0 and 8");
        return VXS_ERROR_INVALID_CONFIG;
    }
    if (parser.first_sequence_number < 0 || playback.first_sequence_number < 0) {
        set_error(error_out, "first_sequence_number must not be negative");
        return VXS_ERROR_INVALID_CONFIG;
    }
    return VXS_SUCCESS;
}

// =============================================================================
// SERIALIZATION
// =============================================================================

Json StreamingConfig::to_json() const {
    Json j;
    j["session_id"] = session_id;
    j["fallback_plain_request"] = fallback_plain_request;

    j["parser"] = {
        {"min_chunk_length", parser.min_chunk_length},
        {"max_buffer_length", parser.max_buffer_length},
        {"abbreviations", parser.abbreviations},
        {"break_on_blank_line", parser.break_on_blank_line},
    };

    j["synthesis"] = {
        {"max_concurrent", synthesis.max_concurrent},
        {"num_workers", synthesis.effective_workers()},
        {"error_strategy", error_strategy_to_string(synthesis.error_strategy)},
        {"max_retries", synthesis.max_retries},
        {"retry_backoff_ms", synthesis.retry_backoff_ms},
        {"synthesis_timeout_ms", synthesis.synthesis_timeout_ms},
        {"voice", synthesis.voice.to_json()},
    };

    j["playback"] = {
        {"interruption_strategy", interruption_strategy_to_string(playback.interruption_strategy)},
        {"drain_count", playback.drain_count},
    };
    return j;
}

vxs_result_t StreamingConfig::from_json(const Json& json, StreamingConfig& out,
                                        std::string* error_out) {
    if (!json.is_object()) {
        set_error(error_out, "configuration must be a JSON object");
        return VXS_ERROR_INVALID_CONFIG;
    }

    StreamingConfig config = out;
    try {
        if (!read_string(json, "session_id", config.session_id, error_out) ||
            !read_bool(json, "fallback_plain_request", config.fallback_plain_request,
                       error_out)) {
            return VXS_ERROR_INVALID_CONFIG;
        }
        if (json.contains("parser") && !read_parser(json["parser"], config.parser, error_out)) {
            return VXS_ERROR_INVALID_CONFIG;
        }
        if (json.contains("synthesis") &&
            !read_synthesis(json["synthesis"], config.synthesis, error_out)) {
            return VXS_ERROR_INVALID_CONFIG;
        }
        if (json.contains("playback") &&
            !read_playback(json["playback"], config.playback, error_out)) {
            return VXS_ERROR_INVALID_CONFIG;
        }
    } catch (const std::exception& e) {
        // Out-of-range numbers surface as json exceptions from get<T>()
        set_error(error_out, e.what());
        return VXS_ERROR_INVALID_CONFIG;
    }

    vxs_result_t result = config.validate(error_out);
    if (result != VXS_SUCCESS) {
        return result;
    }
    out = config;
    return VXS_SUCCESS;
}

vxs_result_t StreamingConfig::from_json_string(const std::string& text, StreamingConfig& out,
                                               std::string* error_out) {
    Json json;
    try {
        json = Json::parse(text);
    } catch (const Json::parse_error& e) {
        set_error(error_out, std::string("invalid JSON: ") + e.what());
        return VXS_ERROR_INVALID_CONFIG;
    }
    return from_json(json, out, error_out);
}

vxs_result_t StreamingConfig::load_file(const std::string& path, StreamingConfig& out,
                                        std::string* error_out) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOGE("Cannot open config file: %s", path.c_str());
        set_error(error_out, "cannot open " + path);
        return VXS_ERROR_FILE_NOT_FOUND;
    }
    std::stringstream contents;
    contents << file.rdbuf();

    vxs_result_t result = from_json_string(contents.str(), out, error_out);
    if (result == VXS_SUCCESS) {
        LOGI("Loaded streaming config from %s", path.c_str());
    } else {
        LOGE("Rejected config file %s", path.c_str());
    }
    return result;
}

vxs_result_t StreamingConfig::apply_env(StreamingConfig& out, std::string* error_out) {
    StreamingConfig config = out;

    int32_t max_buffer = static_cast<int32_t>(config.parser.max_buffer_length);
    if (!env_int("STREAMING_MIN_CHUNK_LENGTH", config.parser.min_chunk_length, error_out) ||
        !env_int("STREAMING_MAX_BUFFER_LENGTH", max_buffer, error_out) ||
        !env_int("STREAMING_MAX_CONCURRENT_TTS", config.synthesis.max_concurrent, error_out) ||
        !env_int("STREAMING_NUM_WORKERS", config.synthesis.num_workers, error_out) ||
        !env_int("STREAMING_MAX_RETRIES", config.synthesis.max_retries, error_out) ||
        !env_int("STREAMING_RETRY_BACKOFF_MS", config.synthesis.retry_backoff_ms, error_out) ||
        !env_int("STREAMING_SYNTHESIS_TIMEOUT_MS", config.synthesis.synthesis_timeout_ms,
                 error_out) ||
        !env_int("STREAMING_DRAIN_COUNT", config.playback.drain_count, error_out) ||
        !env_bool("STREAMING_FALLBACK_PLAIN_REQUEST", config.fallback_plain_request, error_out)) {
        LOGE("Invalid STREAMING_* environment value");
        return VXS_ERROR_INVALID_CONFIG;
    }
    if (max_buffer <= 0) {
        set_error(error_out, "STREAMING_MAX_BUFFER_LENGTH must be positive");
        return VXS_ERROR_INVALID_CONFIG;
    }
    config.parser.max_buffer_length = static_cast<size_t>(max_buffer);

    const char* error_strategy = std::getenv("STREAMING_ERROR_STRATEGY");
    if (error_strategy && error_strategy[0] != '\0' &&
        !parse_error_strategy(error_strategy, config.synthesis.error_strategy)) {
        set_error(error_out, std::string("unknown STREAMING_ERROR_STRATEGY: ") + error_strategy);
        return VXS_ERROR_INVALID_CONFIG;
    }

    const char* interruption = std::getenv("STREAMING_INTERRUPTION_STRATEGY");
    if (interruption && interruption[0] != '\0' &&
        !parse_interruption_strategy(interruption, config.playback.interruption_strategy)) {
        set_error(error_out,
                  std::string("unknown STREAMING_INTERRUPTION_STRATEGY: ") + interruption);
        return VXS_ERROR_INVALID_CONFIG;
    }

    const char* voice_id = std::getenv("STREAMING_VOICE_ID");
    if (voice_id && voice_id[0] != '\0') {
        config.synthesis.voice.voice_id = voice_id;
    }

    const char* speed = std::getenv("STREAMING_SPEED");
    if (speed && speed[0] != '\0') {
        char* end = nullptr;
        float parsed = std::strtof(speed, &end);
        if (end == speed || *end != '\0') {
            set_error(error_out, std::string("STREAMING_SPEED is not a number: ") + speed);
            return VXS_ERROR_INVALID_CONFIG;
        }
        config.synthesis.voice.speed = parsed;
    }

    vxs_result_t result = config.validate(error_out);
    if (result != VXS_SUCCESS) {
        LOGW("Environment overrides rejected");
        return result;
    }
    out = config;
    return VXS_SUCCESS;
}

}  // namespace streaming
}  // namespace voxstream
