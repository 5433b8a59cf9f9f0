/**
 * @file vxs_events.h
 * @brief VoxStream Core - Per-session pipeline events
 *
 * Pipeline components report what they are doing through an EventEmitter
 * owned by the session. There is no process-wide event callback: each
 * session passes its own sink down to its parser, synthesis queue and
 * playback queue.
 */

#ifndef VOXSTREAM_CORE_EVENTS_H
#define VOXSTREAM_CORE_EVENTS_H

#include <cstdint>
#include <functional>
#include <string>

#include "voxstream/core/vxs_types.h"
#include "voxstream/core/vxs_util.h"

namespace voxstream {

// =============================================================================
// EVENT TYPES
// =============================================================================

enum class EventType : int {
    ChunkDetected = 0,
    SynthesisStarted,
    SynthesisCompleted,
    SynthesisFailed,
    SynthesisRetry,
    SynthesisCancelled,
    PlaybackQueueWait,
    PlaybackCompleted,
    PlaybackFailed,
    InterruptionTriggered,
    FallbackTriggered,
    ParseBufferOverflow,
};

const char* event_type_to_string(EventType type);

struct StreamingEvent {
    EventType type = EventType::ChunkDetected;
    std::string session_id;
    int64_t sequence_number = kNoSequence;
    int64_t timestamp_ms = 0;

    // Latency or wait time attached to the event, 0 when not applicable
    double duration_ms = 0.0;

    int32_t attempt = 0;
    int32_t count = 0;
    vxs_result_t error_code = VXS_SUCCESS;

    // Chunk text, error message or strategy name depending on type
    std::string detail;
};

using EventCallback = std::function<void(const StreamingEvent&)>;

// =============================================================================
// EVENT EMITTER
// =============================================================================

/**
 * Stamps events with the session id and forwards them to the session's
 * callback. Copyable; every component holds its own copy.
 */
class EventEmitter {
   public:
    EventEmitter() = default;
    EventEmitter(std::string session_id, EventCallback callback);

    bool enabled() const { return static_cast<bool>(callback_); }
    const std::string& session_id() const { return session_id_; }

    void emit(StreamingEvent event) const;

    void chunk_detected(int64_t seq, const std::string& text) const;
    void synthesis_started(int64_t seq, int32_t attempt) const;
    void synthesis_completed(int64_t seq, double latency_ms, int32_t attempt) const;
    void synthesis_failed(int64_t seq, vxs_result_t code, const std::string& message,
                          int32_t attempt) const;
    void synthesis_retry(int64_t seq, int32_t attempt, vxs_result_t code) const;
    void synthesis_cancelled(int64_t seq) const;
    void playback_queue_wait(int64_t seq, double wait_ms) const;
    void playback_completed(int64_t seq, double play_ms) const;
    void playback_failed(int64_t seq, vxs_result_t code, const std::string& message) const;
    void interruption_triggered(const char* strategy, int32_t discarded) const;
    void fallback_triggered(int64_t failed_seq, int32_t dropped) const;
    void parse_buffer_overflow(size_t buffered) const;

   private:
    std::string session_id_;
    EventCallback callback_;
};

}  // namespace voxstream

#endif  // VOXSTREAM_CORE_EVENTS_H
