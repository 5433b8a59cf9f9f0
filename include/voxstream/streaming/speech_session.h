/**
 * @file speech_session.h
 * @brief VoxStream Streaming - Per-response speech session
 *
 * Wires one SentenceParser, one SynthesisQueueManager and one PlaybackQueue
 * together for a single spoken response:
 *
 *   feed(delta) -> parser -> synthesis workers -> reorder buffer -> sink
 *
 * Sessions share nothing; run as many side by side as there are channels.
 */

#ifndef VOXSTREAM_STREAMING_SPEECH_SESSION_H
#define VOXSTREAM_STREAMING_SPEECH_SESSION_H

#include <atomic>
#include <functional>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "voxstream/core/vxs_error.h"
#include "voxstream/core/vxs_events.h"
#include "voxstream/core/vxs_types.h"
#include "voxstream/streaming/playback_queue.h"
#include "voxstream/streaming/streaming_config.h"
#include "voxstream/streaming/synthesis_queue_manager.h"

namespace voxstream {
namespace streaming {

// =============================================================================
// Session Callbacks
// =============================================================================

struct SessionCallbacks {
    std::function<void(const PlaybackMetadata&)> on_segment_played;
    std::function<void(const StreamingError&)> on_error;            // Synthesis, sink or parser failure
    std::function<void(const FallbackRequest&)> on_fallback;        // Chunked synthesis abandoned
    EventCallback on_event;                                         // Every pipeline event
};

// =============================================================================
// Session State
// =============================================================================

enum class SessionState {
    NotInitialized,
    Streaming,     // Accepting text
    Finishing,     // Input closed, audio still playing
    Interrupted,
    Failed
};

// =============================================================================
// Speech Session
// =============================================================================

class SpeechSession {
   public:
    // provider and sink must outlive the session
    SpeechSession(const StreamingConfig& config, SynthesisProvider* provider, AudioSink* sink,
                  SessionCallbacks callbacks = SessionCallbacks{});
    ~SpeechSession();

    // Non-copyable
    SpeechSession(const SpeechSession&) = delete;
    SpeechSession& operator=(const SpeechSession&) = delete;

    // Validate the config and start the synthesis and playback workers
    vxs_result_t initialize();

    // Text input (call from one thread)
    vxs_result_t feed(const std::string& delta);
    vxs_result_t finish();

    // Truncate the response (configured strategy, or an explicit one)
    int32_t interrupt();
    int32_t interrupt(InterruptionStrategy strategy);

    // Wait until every admitted chunk has been played, failed or dropped
    bool wait_until_done(int32_t timeout_ms);

    SessionState state() const { return state_.load(); }
    std::string state_string() const;

    const std::string& session_id() const { return session_id_; }
    const StreamingConfig& config() const { return config_; }

    bool fallback_active() const;
    vxs_result_t last_error() const { return last_error_.load(); }

    nlohmann::json stats() const;

   private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    StreamingConfig config_;
    std::string session_id_;
    std::atomic<SessionState> state_{SessionState::NotInitialized};
    std::atomic<vxs_result_t> last_error_{VXS_SUCCESS};
};

}  // namespace streaming
}  // namespace voxstream

#endif  // VOXSTREAM_STREAMING_SPEECH_SESSION_H
