/**
 * @file vxs_events.cpp
 * @brief VoxStream Core - Per-session event emitter
 */

#include "voxstream/core/vxs_events.h"

#include <exception>
#include <utility>

#include "voxstream/core/vxs_logger.h"

namespace voxstream {

const char* event_type_to_string(EventType type) {
    switch (type) {
        case EventType::ChunkDetected:
            return "chunk_detected";
        case EventType::SynthesisStarted:
            return "synthesis_started";
        case EventType::SynthesisCompleted:
            return "synthesis_completed";
        case EventType::SynthesisFailed:
            return "synthesis_failed";
        case EventType::SynthesisRetry:
            return "synthesis_retry";
        case EventType::SynthesisCancelled:
            return "synthesis_cancelled";
        case EventType::PlaybackQueueWait:
            return "playback_queue_wait";
        case EventType::PlaybackCompleted:
            return "playback_completed";
        case EventType::PlaybackFailed:
            return "playback_failed";
        case EventType::InterruptionTriggered:
            return "interruption_triggered";
        case EventType::FallbackTriggered:
            return "fallback_triggered";
        case EventType::ParseBufferOverflow:
            return "parse_buffer_overflow";
        default:
            return "unknown";
    }
}

EventEmitter::EventEmitter(std::string session_id, EventCallback callback)
    : session_id_(std::move(session_id)), callback_(std::move(callback)) {}

void EventEmitter::emit(StreamingEvent event) const {
    if (!callback_) {
        return;
    }
    event.session_id = session_id_;
    if (event.timestamp_ms == 0) {
        event.timestamp_ms = now_ms();
    }
    try {
        callback_(event);
    } catch (const std::exception& e) {
        VXS_LOG_ERROR("Events", "Event callback threw on %s: %s", event_type_to_string(event.type),
                      e.what());
    }
}

// =============================================================================
// EMIT HELPERS
// =============================================================================

void EventEmitter::chunk_detected(int64_t seq, const std::string& text) const {
    StreamingEvent event;
    event.type = EventType::ChunkDetected;
    event.sequence_number = seq;
    event.detail = text;
    emit(std::move(event));
}

void EventEmitter::synthesis_started(int64_t seq, int32_t attempt) const {
    StreamingEvent event;
    event.type = EventType::SynthesisStarted;
    event.sequence_number = seq;
    event.attempt = attempt;
    emit(std::move(event));
}

void EventEmitter::synthesis_completed(int64_t seq, double latency_ms, int32_t attempt) const {
    StreamingEvent event;
    event.type = EventType::SynthesisCompleted;
    event.sequence_number = seq;
    event.duration_ms = latency_ms;
    event.attempt = attempt;
    emit(std::move(event));
}

void EventEmitter::synthesis_failed(int64_t seq, vxs_result_t code, const std::string& message,
                                    int32_t attempt) const {
    StreamingEvent event;
    event.type = EventType::SynthesisFailed;
    event.sequence_number = seq;
    event.error_code = code;
    event.detail = message;
    event.attempt = attempt;
    emit(std::move(event));
}

void EventEmitter::synthesis_retry(int64_t seq, int32_t attempt, vxs_result_t code) const {
    StreamingEvent event;
    event.type = EventType::SynthesisRetry;
    event.sequence_number = seq;
    event.attempt = attempt;
    event.error_code = code;
    emit(std::move(event));
}

void EventEmitter::synthesis_cancelled(int64_t seq) const {
    StreamingEvent event;
    event.type = EventType::SynthesisCancelled;
    event.sequence_number = seq;
    event.error_code = VXS_ERROR_CANCELLED;
    emit(std::move(event));
}

void EventEmitter::playback_queue_wait(int64_t seq, double wait_ms) const {
    StreamingEvent event;
    event.type = EventType::PlaybackQueueWait;
    event.sequence_number = seq;
    event.duration_ms = wait_ms;
    emit(std::move(event));
}

void EventEmitter::playback_completed(int64_t seq, double play_ms) const {
    StreamingEvent event;
    event.type = EventType::PlaybackCompleted;
    event.sequence_number = seq;
    event.duration_ms = play_ms;
    emit(std::move(event));
}

void EventEmitter::playback_failed(int64_t seq, vxs_result_t code,
                                   const std::string& message) const {
    StreamingEvent event;
    event.type = EventType::PlaybackFailed;
    event.sequence_number = seq;
    event.error_code = code;
    event.detail = message;
    emit(std::move(event));
}

void EventEmitter::interruption_triggered(const char* strategy, int32_t discarded) const {
    StreamingEvent event;
    event.type = EventType::InterruptionTriggered;
    event.count = discarded;
    event.detail = strategy ? strategy : "";
    emit(std::move(event));
}

void EventEmitter::fallback_triggered(int64_t failed_seq, int32_t dropped) const {
    StreamingEvent event;
    event.type = EventType::FallbackTriggered;
    event.sequence_number = failed_seq;
    event.count = dropped;
    emit(std::move(event));
}

void EventEmitter::parse_buffer_overflow(size_t buffered) const {
    StreamingEvent event;
    event.type = EventType::ParseBufferOverflow;
    event.count = static_cast<int32_t>(buffered);
    event.error_code = VXS_ERROR_PARSE_BUFFER_OVERFLOW;
    emit(std::move(event));
}

}  // namespace voxstream
