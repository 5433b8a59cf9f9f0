/**
 * @file streaming_config.h
 * @brief VoxStream Streaming - Session configuration
 *
 * All knobs are read once, when a session is constructed. Values can come
 * from code, a JSON document or STREAMING_* environment variables.
 */

#ifndef VOXSTREAM_STREAMING_CONFIG_H
#define VOXSTREAM_STREAMING_CONFIG_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "voxstream/core/vxs_types.h"
#include "voxstream/streaming/streaming_types.h"

namespace voxstream {
namespace streaming {

// =============================================================================
// STRATEGIES
// =============================================================================

enum class ErrorStrategy : int {
    Skip = 0,
    Retry = 1,
    Fallback = 2,
};

enum class InterruptionStrategy : int {
    Immediate = 0,
    Graceful = 1,
    Drain = 2,
};

const char* error_strategy_to_string(ErrorStrategy strategy);
const char* interruption_strategy_to_string(InterruptionStrategy strategy);

// Case-sensitive, lowercase names ("skip", "retry", "fallback", ...)
bool parse_error_strategy(const std::string& name, ErrorStrategy& out);
bool parse_interruption_strategy(const std::string& name, InterruptionStrategy& out);

// =============================================================================
// LIMITS
// =============================================================================

constexpr int32_t kMaxMinChunkLength = 200;
constexpr int32_t kMinConcurrent = 1;
constexpr int32_t kMaxConcurrent = 8;
constexpr int32_t kMaxRetries = 5;
constexpr int32_t kMaxDrainCount = 8;
constexpr int32_t kMaxRetryBackoffMs = 10000;
constexpr float kMinSpeed = 0.5f;
constexpr float kMaxSpeed = 2.0f;

/** Abbreviations recognized by default (lowercase, without the final period). */
std::vector<std::string> default_abbreviations();

// =============================================================================
// COMPONENT CONFIGS
// =============================================================================

struct ParserConfig {
    // Chunks shorter than this (trimmed) are merged into the next one
    int32_t min_chunk_length = 10;

    // Unemitted text above this size puts the parser into a failed state
    size_t max_buffer_length = 4096;

    std::vector<std::string> abbreviations = default_abbreviations();

    // Treat a blank line as a boundary even without punctuation
    bool break_on_blank_line = false;

    int64_t first_sequence_number = 0;
};

struct SynthesisConfig {
    int32_t max_concurrent = 3;

    // 0 means one worker per concurrency slot
    int32_t num_workers = 0;

    ErrorStrategy error_strategy = ErrorStrategy::Retry;
    int32_t max_retries = 2;

    // Delay before the first retry, doubled for each further one
    int32_t retry_backoff_ms = 0;

    int32_t synthesis_timeout_ms = 60000;

    VoiceParams voice;

    int32_t effective_workers() const { return num_workers > 0 ? num_workers : max_concurrent; }
};

struct PlaybackConfig {
    InterruptionStrategy interruption_strategy = InterruptionStrategy::Graceful;

    // Segments allowed after the current one under the drain strategy
    int32_t drain_count = 2;

    int64_t first_sequence_number = 0;
};

// =============================================================================
// SESSION CONFIG
// =============================================================================

struct StreamingConfig {
    std::string session_id;

    ParserConfig parser;
    SynthesisConfig synthesis;
    PlaybackConfig playback;

    // After a fallback, synthesize the remaining text as one final request
    bool fallback_plain_request = false;

    /**
     * @brief Check every field against its allowed range.
     * @param error_out Optional, receives a description of the first problem
     * @return VXS_SUCCESS or VXS_ERROR_INVALID_CONFIG
     */
    vxs_result_t validate(std::string* error_out = nullptr) const;

    nlohmann::json to_json() const;

    /**
     * @brief Overlay the fields present in a JSON object onto out.
     *
     * Unknown keys are ignored. Present keys with the wrong type, or values
     * that fail validation, are rejected.
     */
    static vxs_result_t from_json(const nlohmann::json& json, StreamingConfig& out,
                                  std::string* error_out = nullptr);
    static vxs_result_t from_json_string(const std::string& text, StreamingConfig& out,
                                         std::string* error_out = nullptr);
    static vxs_result_t load_file(const std::string& path, StreamingConfig& out,
                                  std::string* error_out = nullptr);

    /**
     * @brief Overlay STREAMING_* environment variables onto out.
     *
     * Recognized: STREAMING_MIN_CHUNK_LENGTH, STREAMING_MAX_BUFFER_LENGTH,
     * STREAMING_MAX_CONCURRENT_TTS, STREAMING_NUM_WORKERS,
     * STREAMING_ERROR_STRATEGY, STREAMING_MAX_RETRIES,
     * STREAMING_RETRY_BACKOFF_MS, STREAMING_SYNTHESIS_TIMEOUT_MS,
     * STREAMING_INTERRUPTION_STRATEGY, STREAMING_DRAIN_COUNT,
     * STREAMING_FALLBACK_PLAIN_REQUEST, STREAMING_VOICE_ID, STREAMING_SPEED.
     */
    static vxs_result_t apply_env(StreamingConfig& out, std::string* error_out = nullptr);
};

}  // namespace streaming
}  // namespace voxstream

#endif  // VOXSTREAM_STREAMING_CONFIG_H
