/**
 * @file metrics_recorder.cpp
 * @brief VoxStream Streaming - In-process metrics sink
 */

#include "voxstream/streaming/metrics_recorder.h"

namespace voxstream {
namespace streaming {

void MetricsRecorder::record(const StreamingEvent& event) {
    switch (event.type) {
        case EventType::SynthesisCompleted:
            synthesis_latency_.record(event.duration_ms);
            break;
        case EventType::PlaybackQueueWait:
            queue_wait_.record(event.duration_ms);
            break;
        case EventType::PlaybackCompleted:
            play_duration_.record(event.duration_ms);
            break;
        default:
            break;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    counts_[event.type]++;
    if (event.type == EventType::ChunkDetected && first_chunk_ms_ == 0) {
        first_chunk_ms_ = event.timestamp_ms;
    }
    if (event.type == EventType::PlaybackQueueWait && first_audio_ms_ == 0) {
        first_audio_ms_ = event.timestamp_ms;
    }
}

EventCallback MetricsRecorder::callback() {
    return [this](const StreamingEvent& event) { record(event); };
}

int64_t MetricsRecorder::count(EventType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counts_.find(type);
    return it == counts_.end() ? 0 : it->second;
}

double MetricsRecorder::first_audio_latency_ms() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (first_chunk_ms_ == 0 || first_audio_ms_ == 0) {
        return 0.0;
    }
    return static_cast<double>(first_audio_ms_ - first_chunk_ms_);
}

void MetricsRecorder::reset() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        counts_.clear();
        first_chunk_ms_ = 0;
        first_audio_ms_ = 0;
    }
    synthesis_latency_.reset();
    queue_wait_.reset();
    play_duration_.reset();
}

nlohmann::json MetricsRecorder::to_json() const {
    nlohmann::json j;
    nlohmann::json counts = nlohmann::json::object();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& kv : counts_) {
            counts[event_type_to_string(kv.first)] = kv.second;
        }
    }
    j["events"] = counts;
    j["chunks_detected"] = count(EventType::ChunkDetected);
    j["synthesis_attempts_failed"] = count(EventType::SynthesisFailed);
    j["synthesis_retries"] = count(EventType::SynthesisRetry);
    j["first_audio_latency_ms"] = first_audio_latency_ms();
    j["synthesis_latency"] = synthesis_latency_.to_json();
    j["playback_queue_wait"] = queue_wait_.to_json();
    j["playback_duration"] = play_duration_.to_json();
    return j;
}

}  // namespace streaming
}  // namespace voxstream
