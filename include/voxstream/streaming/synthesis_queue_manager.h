/**
 * @file synthesis_queue_manager.h
 * @brief VoxStream Streaming - Bounded-concurrency speech synthesis
 *
 * Takes chunks from the sentence parser and synthesizes them on a pool of
 * worker threads, never more than max_concurrent at once. Results are
 * reported per sequence number and may complete out of order; the playback
 * queue restores the order.
 */

#ifndef VOXSTREAM_STREAMING_SYNTHESIS_QUEUE_MANAGER_H
#define VOXSTREAM_STREAMING_SYNTHESIS_QUEUE_MANAGER_H

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "voxstream/core/vxs_error.h"
#include "voxstream/core/vxs_events.h"
#include "voxstream/core/vxs_types.h"
#include "voxstream/streaming/streaming_config.h"
#include "voxstream/streaming/streaming_types.h"

namespace voxstream {
namespace streaming {

// =============================================================================
// PROVIDER INTERFACE
// =============================================================================

/**
 * @brief Text-to-speech backend. Must be safe to call from several worker
 * threads at once.
 */
class SynthesisProvider {
   public:
    virtual ~SynthesisProvider() = default;

    /**
     * @brief Synthesize text into encoded audio.
     *
     * @param timeout_ms Deadline for the call; results arriving later are
     *                   discarded as VXS_ERROR_SYNTHESIS_TIMEOUT
     * @param audio_out Receives the audio bytes on success
     * @return VXS_SUCCESS, VXS_ERROR_SYNTHESIS_TIMEOUT or
     *         VXS_ERROR_SYNTHESIS_PROVIDER
     */
    virtual vxs_result_t synthesize(const std::string& text, const VoiceParams& voice,
                                    int32_t timeout_ms, std::vector<uint8_t>& audio_out) = 0;

    virtual const char* name() const { return "synthesis"; }
};

// =============================================================================
// CALLBACKS
// =============================================================================

/**
 * @brief Reported once when the fallback strategy abandons chunked
 * synthesis for the current response.
 */
struct FallbackRequest {
    int64_t failed_sequence_number = kNoSequence;

    // Queued and in-flight tasks dropped by the fallback, ascending
    std::vector<int64_t> dropped_sequence_numbers;

    // Text of the failed task and every dropped task, in order
    std::string remaining_text;

    StreamingError error;
};

struct SynthesisCallbacks {
    std::function<void(int64_t sequence_number, AudioSegment segment)> on_complete;
    std::function<void(int64_t sequence_number, const StreamingError& error)> on_error;
    std::function<void(int64_t sequence_number)> on_cancelled;
    std::function<void(const FallbackRequest& request)> on_fallback;
};

struct SynthesisStats {
    bool running = false;
    bool fallback_active = false;
    int32_t max_concurrent = 0;
    int32_t num_workers = 0;
    int32_t queue_size = 0;
    int32_t in_flight = 0;
    int32_t peak_in_flight = 0;
    int64_t total_enqueued = 0;
    int64_t total_completed = 0;
    int64_t total_failed = 0;
    int64_t total_cancelled = 0;
    int64_t total_retries = 0;

    nlohmann::json to_json() const;
};

// =============================================================================
// SYNTHESIS QUEUE MANAGER
// =============================================================================

/**
 * @brief Per-session synthesis scheduler.
 *
 * Every admitted task ends in exactly one of on_complete, on_error or
 * on_cancelled. Callbacks run on worker threads (or on the thread calling a
 * cancel method) without internal locks held.
 */
class SynthesisQueueManager {
   public:
    SynthesisQueueManager(const SynthesisConfig& config, SynthesisProvider* provider,
                          SynthesisCallbacks callbacks, EventEmitter events = EventEmitter{});
    ~SynthesisQueueManager();

    // Non-copyable
    SynthesisQueueManager(const SynthesisQueueManager&) = delete;
    SynthesisQueueManager& operator=(const SynthesisQueueManager&) = delete;

    /**
     * @brief Admit a chunk for synthesis. Never blocks on synthesis.
     *
     * A chunk without a sequence number gets the next one; otherwise the
     * number must be greater than every number admitted before.
     *
     * @return VXS_ERROR_INVALID_SEQUENCE, VXS_ERROR_INVALID_ARGUMENT (empty
     *         text), VXS_ERROR_CANCELLED (fallback active) or
     *         VXS_ERROR_NOT_RUNNING (shut down)
     */
    vxs_result_t enqueue(const TextChunk& chunk, TaskHandle* handle_out = nullptr);

    /**
     * @brief Submit the combined remaining text after a fallback. Single
     * attempt, accepted only while the fallback is active.
     */
    vxs_result_t submit_plain_request(const TextChunk& chunk, TaskHandle* handle_out = nullptr);

    // Drop everything queued; discard in-flight results on arrival
    int32_t cancel_all();

    // Drop everything queued; in-flight tasks finish normally
    int32_t cancel_pending();

    // Keep the next num_to_keep queued tasks, drop the rest
    int32_t cancel_after(int32_t num_to_keep);

    /** Block until nothing is queued or in flight. */
    bool wait_until_idle(int32_t timeout_ms);

    /** Stop the workers. Queued tasks are reported cancelled. */
    void shutdown();

    bool task_status(int64_t sequence_number, TaskStatus& out) const;
    bool task_info(int64_t sequence_number, SynthesisTask& out) const;

    SynthesisStats stats() const;
    bool fallback_active() const;
    int64_t last_sequence_number() const;

   private:
    struct CallResult {
        vxs_result_t result = VXS_SUCCESS;
        std::vector<uint8_t> audio;
    };

    void worker_loop(int32_t worker_index);
    void run_task(int64_t sequence_number);

    vxs_result_t attempt_synthesis(const SynthesisTask& task, std::vector<uint8_t>& audio,
                                   std::string& message, double& latency_ms);
    void abandon_call(std::future<CallResult> call);
    bool is_discarded(int64_t sequence_number) const;
    bool wait_backoff(int64_t sequence_number, int32_t delay_ms);

    vxs_result_t admit(const TextChunk& chunk, bool plain_request, TaskHandle* handle_out);
    std::vector<int64_t> drop_queued_locked(size_t keep);

    void finish_completed(SynthesisTask task, std::vector<uint8_t> audio, double latency_ms);
    void finish_failed(int64_t sequence_number, const StreamingError& error);
    void finish_cancelled(int64_t sequence_number);
    void trigger_fallback(int64_t sequence_number, const StreamingError& error);
    void notify_cancelled(const std::vector<int64_t>& dropped);

    SynthesisConfig config_;
    SynthesisProvider* provider_;
    SynthesisCallbacks callbacks_;
    EventEmitter events_;

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;

    std::deque<int64_t> queue_;
    std::map<int64_t, SynthesisTask> tasks_;
    std::set<int64_t> in_flight_;

    // In-flight tasks whose results are dropped on arrival
    std::set<int64_t> discarded_;

    // Provider calls that outlived their deadline; results are dropped
    std::vector<std::future<CallResult>> abandoned_;

    // Dropped tasks whose on_cancelled has not run yet
    int32_t pending_notifications_ = 0;

    int64_t last_sequence_ = kNoSequence;
    bool fallback_active_ = false;
    bool plain_request_submitted_ = false;

    std::atomic<bool> stopping_{false};
    std::vector<std::thread> workers_;

    int32_t peak_in_flight_ = 0;
    int64_t total_enqueued_ = 0;
    int64_t total_completed_ = 0;
    int64_t total_failed_ = 0;
    int64_t total_cancelled_ = 0;
    int64_t total_retries_ = 0;
};

}  // namespace streaming
}  // namespace voxstream

#endif  // VOXSTREAM_STREAMING_SYNTHESIS_QUEUE_MANAGER_H
