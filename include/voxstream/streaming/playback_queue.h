/**
 * @file playback_queue.h
 * @brief VoxStream Streaming - Ordered, interruptible audio playback
 *
 * Segments arrive in whatever order synthesis finishes them and are played
 * strictly by sequence number, one at a time. Early arrivals wait in a
 * reorder buffer until their predecessors have been handed to the sink.
 */

#ifndef VOXSTREAM_STREAMING_PLAYBACK_QUEUE_H
#define VOXSTREAM_STREAMING_PLAYBACK_QUEUE_H

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <thread>

#include <nlohmann/json.hpp>

#include "voxstream/core/vxs_error.h"
#include "voxstream/core/vxs_events.h"
#include "voxstream/core/vxs_types.h"
#include "voxstream/core/vxs_util.h"
#include "voxstream/streaming/streaming_config.h"
#include "voxstream/streaming/streaming_types.h"

namespace voxstream {
namespace streaming {

// =============================================================================
// SINK INTERFACE
// =============================================================================

/**
 * @brief Audio output (speaker, voice channel, file).
 */
class AudioSink {
   public:
    virtual ~AudioSink() = default;

    /**
     * @brief Play one segment, blocking until it has finished.
     *
     * Implementations should poll stop_flag between writes and return early
     * once it is set.
     */
    virtual vxs_result_t play(const AudioSegment& segment, const std::atomic<bool>& stop_flag) = 0;

    /** Force the segment currently playing to end. Called from another thread. */
    virtual void stop() {}

    virtual const char* name() const { return "sink"; }
};

// =============================================================================
// CALLBACKS AND STATS
// =============================================================================

struct PlaybackCallbacks {
    std::function<void(const PlaybackMetadata& metadata)> on_complete;
    std::function<void(const StreamingError& error, const PlaybackMetadata& metadata)> on_error;
};

struct PlaybackStats {
    bool running = false;
    bool playing = false;
    bool interrupted = false;
    int64_t current_sequence = kNoSequence;
    int64_t next_expected = 0;
    int32_t ready = 0;
    int32_t buffered = 0;
    int64_t total_queued = 0;
    int64_t total_played = 0;
    int64_t total_interrupted = 0;
    int64_t total_failed = 0;
    int64_t total_skipped = 0;
    int64_t total_discarded = 0;
    int64_t total_rejected = 0;

    nlohmann::json to_json() const;
};

struct PlaybackItem {
    AudioSegment segment;
    Clock::time_point enqueued_at;
};

// =============================================================================
// PLAYBACK QUEUE
// =============================================================================

class PlaybackQueue {
   public:
    PlaybackQueue(const PlaybackConfig& config, AudioSink* sink, PlaybackCallbacks callbacks,
                  EventEmitter events = EventEmitter{});
    ~PlaybackQueue();

    // Non-copyable
    PlaybackQueue(const PlaybackQueue&) = delete;
    PlaybackQueue& operator=(const PlaybackQueue&) = delete;

    /**
     * @brief Hand over a synthesized segment.
     *
     * @return VXS_ERROR_INVALID_SEQUENCE for a number already played, skipped
     *         or buffered; VXS_ERROR_CANCELLED when an interruption excludes
     *         it; VXS_ERROR_NOT_RUNNING after stop()
     */
    vxs_result_t enqueue(int64_t sequence_number, AudioSegment segment);

    /**
     * @brief Declare that a sequence number will never arrive, so ordering
     * moves past it.
     */
    vxs_result_t skip(int64_t sequence_number);

    /** Interrupt with the configured strategy and drain count. */
    int32_t interrupt();

    /**
     * @brief Truncate playback.
     *
     * immediate stops the current segment now, graceful lets it finish, drain
     * also plays up to drain_count segments that are already eligible (next
     * in line, not parked behind a gap). Everything else is discarded and
     * segments arriving afterwards are rejected.
     *
     * @return Number of segments discarded
     */
    int32_t interrupt(InterruptionStrategy strategy, int32_t drain_count);

    /**
     * @brief Wait until nothing is playing or ready to play.
     *
     * Segments parked behind a missing sequence number do not count.
     */
    bool wait_until_idle(int32_t timeout_ms);

    /** Stop the worker; unplayed segments are dropped. */
    void stop();

    PlaybackStats stats() const;
    int64_t next_expected() const;
    bool interrupted() const;

   private:
    void worker_loop();
    void advance_locked();
    void play_item(PlaybackItem item);
    int64_t playback_base_locked() const;

    PlaybackConfig config_;
    AudioSink* sink_;
    PlaybackCallbacks callbacks_;
    EventEmitter events_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;

    std::map<int64_t, PlaybackItem> reorder_;
    std::set<int64_t> skipped_;
    std::deque<PlaybackItem> ready_;
    int64_t next_expected_ = 0;

    // Highest sequence number handed to the sink so far
    int64_t last_dispatched_ = kNoSequence;
    int64_t current_sequence_ = kNoSequence;
    bool playing_ = false;

    // Sequence numbers above this are rejected after an interruption
    int64_t accept_limit_ = INT64_MAX;
    bool interrupted_ = false;

    std::atomic<bool> stop_flag_{false};
    std::atomic<bool> stopping_{false};
    std::thread worker_;

    int64_t total_queued_ = 0;
    int64_t total_played_ = 0;
    int64_t total_interrupted_ = 0;
    int64_t total_failed_ = 0;
    int64_t total_skipped_ = 0;
    int64_t total_discarded_ = 0;
    int64_t total_rejected_ = 0;
};

}  // namespace streaming
}  // namespace voxstream

#endif  // VOXSTREAM_STREAMING_PLAYBACK_QUEUE_H
