/**
 * @file metrics_recorder.h
 * @brief VoxStream Streaming - In-process metrics sink
 *
 * Aggregates pipeline events into counters and latency distributions.
 * Attach it to a session through its event callback.
 */

#ifndef VOXSTREAM_STREAMING_METRICS_RECORDER_H
#define VOXSTREAM_STREAMING_METRICS_RECORDER_H

#include <cstdint>
#include <map>
#include <mutex>

#include <nlohmann/json.hpp>

#include "voxstream/core/vxs_events.h"
#include "voxstream/core/vxs_latency_stats.h"

namespace voxstream {
namespace streaming {

class MetricsRecorder {
   public:
    MetricsRecorder() = default;

    // Non-copyable
    MetricsRecorder(const MetricsRecorder&) = delete;
    MetricsRecorder& operator=(const MetricsRecorder&) = delete;

    void record(const StreamingEvent& event);

    /** Callback forwarding to record(); the recorder must outlive it. */
    EventCallback callback();

    int64_t count(EventType type) const;

    // From the first chunk detected to the first segment handed to the sink
    double first_audio_latency_ms() const;

    const LatencyStats& synthesis_latency() const { return synthesis_latency_; }
    const LatencyStats& queue_wait() const { return queue_wait_; }
    const LatencyStats& play_duration() const { return play_duration_; }

    void reset();
    nlohmann::json to_json() const;

   private:
    mutable std::mutex mutex_;
    std::map<EventType, int64_t> counts_;
    int64_t first_chunk_ms_ = 0;
    int64_t first_audio_ms_ = 0;

    LatencyStats synthesis_latency_;
    LatencyStats queue_wait_;
    LatencyStats play_duration_;
};

}  // namespace streaming
}  // namespace voxstream

#endif  // VOXSTREAM_STREAMING_METRICS_RECORDER_H
