/**
 * @file streaming_types.h
 * @brief VoxStream Streaming - Data passed between pipeline stages
 */

#ifndef VOXSTREAM_STREAMING_TYPES_H
#define VOXSTREAM_STREAMING_TYPES_H

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "voxstream/core/vxs_types.h"

namespace voxstream {
namespace streaming {

// =============================================================================
// TEXT
// =============================================================================

/**
 * @brief One semantic unit (normally a sentence) emitted by the parser.
 *
 * raw_text is the exact input span the chunk covers, including whitespace
 * that preceded it. text is raw_text with surrounding whitespace trimmed and
 * is what gets synthesized.
 */
struct TextChunk {
    int64_t sequence_number = kNoSequence;
    std::string text;
    std::string raw_text;
};

// =============================================================================
// VOICE
// =============================================================================

/**
 * @brief Voice parameters forwarded opaquely to the synthesis provider.
 */
struct VoiceParams {
    std::string voice_id = "default";
    float speed = 1.0f;
    std::string output_format = "wav";

    // Provider-specific knobs (temperature, exaggeration, cfg_weight, ...)
    std::map<std::string, std::string> options;

    nlohmann::json to_json() const;
};

// =============================================================================
// SYNTHESIS
// =============================================================================

enum class TaskStatus : int {
    Queued = 0,
    Running,
    Completed,
    Failed,
    Cancelled,
};

const char* task_status_to_string(TaskStatus status);

inline bool is_terminal(TaskStatus status) {
    return status == TaskStatus::Completed || status == TaskStatus::Failed ||
           status == TaskStatus::Cancelled;
}

struct SynthesisTask {
    std::string task_id;
    int64_t sequence_number = kNoSequence;
    std::string text;
    VoiceParams voice;
    TaskStatus status = TaskStatus::Queued;

    // Re-runs after the first attempt
    int32_t retry_count = 0;

    // Combined remaining text submitted after a fallback
    bool is_plain_request = false;

    int64_t created_ms = 0;
    int64_t started_ms = 0;
    int64_t finished_ms = 0;
};

/** Returned by SynthesisQueueManager::enqueue. */
struct TaskHandle {
    int64_t sequence_number = kNoSequence;
    std::string task_id;

    bool valid() const { return sequence_number != kNoSequence; }
};

/**
 * @brief Synthesized audio for one chunk. Owned by the playback queue once
 * enqueued there.
 */
struct AudioSegment {
    int64_t sequence_number = kNoSequence;
    std::vector<uint8_t> audio;
    std::string source_text;
    double synth_latency_ms = 0.0;
};

// =============================================================================
// PLAYBACK
// =============================================================================

enum class PlaybackStatus : int {
    Queued = 0,
    Playing,
    Completed,
    Interrupted,
    Failed,
};

const char* playback_status_to_string(PlaybackStatus status);

struct PlaybackMetadata {
    int64_t sequence_number = kNoSequence;
    std::string source_text;
    size_t audio_size_bytes = 0;
    PlaybackStatus status = PlaybackStatus::Queued;

    // From enqueue to hand-off to the sink
    double queue_wait_ms = 0.0;
    double play_duration_ms = 0.0;
    double synth_latency_ms = 0.0;

    nlohmann::json to_json() const;
};

}  // namespace streaming
}  // namespace voxstream

#endif  // VOXSTREAM_STREAMING_TYPES_H
