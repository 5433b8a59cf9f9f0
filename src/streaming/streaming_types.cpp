/**
 * @file streaming_types.cpp
 * @brief VoxStream Streaming - Pipeline data helpers
 */

#include "voxstream/streaming/streaming_types.h"

namespace voxstream {
namespace streaming {

nlohmann::json VoiceParams::to_json() const {
    nlohmann::json j;
    j["voice_id"] = voice_id;
    j["speed"] = speed;
    j["output_format"] = output_format;
    nlohmann::json opts = nlohmann::json::object();
    for (const auto& kv : options) {
        opts[kv.first] = kv.second;
    }
    j["options"] = opts;
    return j;
}

const char* task_status_to_string(TaskStatus status) {
    switch (status) {
        case TaskStatus::Queued:
            return "queued";
        case TaskStatus::Running:
            return "synthesizing";
        case TaskStatus::Completed:
            return "completed";
        case TaskStatus::Failed:
            return "failed";
        case TaskStatus::Cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

const char* playback_status_to_string(PlaybackStatus status) {
    switch (status) {
        case PlaybackStatus::Queued:
            return "queued";
        case PlaybackStatus::Playing:
            return "playing";
        case PlaybackStatus::Completed:
            return "completed";
        case PlaybackStatus::Interrupted:
            return "interrupted";
        case PlaybackStatus::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

nlohmann::json PlaybackMetadata::to_json() const {
    nlohmann::json j;
    j["sequence_number"] = sequence_number;
    j["text"] = source_text;
    j["audio_size_bytes"] = audio_size_bytes;
    j["status"] = playback_status_to_string(status);
    j["queue_wait_ms"] = queue_wait_ms;
    j["play_duration_ms"] = play_duration_ms;
    j["synth_latency_ms"] = synth_latency_ms;
    return j;
}

}  // namespace streaming
}  // namespace voxstream
