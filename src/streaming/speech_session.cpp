/**
 * @file speech_session.cpp
 * @brief VoxStream Streaming - Per-response speech session
 */

#include "voxstream/streaming/speech_session.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "voxstream/core/vxs_logger.h"
#include "voxstream/core/vxs_util.h"
#include "voxstream/streaming/metrics_recorder.h"
#include "voxstream/streaming/sentence_parser.h"

#define LOG_TAG "Streaming.Session"
#define LOGD(...) VXS_LOG_DEBUG(LOG_TAG, __VA_ARGS__)
#define LOGI(...) VXS_LOG_INFO(LOG_TAG, __VA_ARGS__)
#define LOGW(...) VXS_LOG_WARNING(LOG_TAG, __VA_ARGS__)
#define LOGE(...) VXS_LOG_ERROR(LOG_TAG, __VA_ARGS__)

namespace voxstream {
namespace streaming {

// =============================================================================
// Implementation
// =============================================================================

struct SpeechSession::Impl {
    SynthesisProvider* provider = nullptr;
    AudioSink* sink = nullptr;
    SessionCallbacks callbacks;

    MetricsRecorder metrics;
    EventEmitter events;

    std::unique_ptr<SentenceParser> parser;

    // Declared before synthesis so that synthesis shuts down first and its
    // final on_cancelled calls still reach a live playback queue
    std::unique_ptr<PlaybackQueue> playback;
    std::unique_ptr<SynthesisQueueManager> synthesis;

    // Fallback bookkeeping, shared between the feeding thread and workers
    std::mutex fallback_mutex;
    bool fallback = false;
    bool input_finished = false;
    bool plain_request_submitted = false;
    std::string fallback_text;
    int64_t plain_request_sequence = kNoSequence;

    void report_error(const StreamingError& error) {
        if (!callbacks.on_error) {
            return;
        }
        try {
            callbacks.on_error(error);
        } catch (const std::exception& e) {
            LOGE("on_error threw: %s", e.what());
        }
    }

    // Chunk text that will never be synthesized on its own after a fallback
    void absorb_into_fallback(const TextChunk& chunk) {
        {
            std::lock_guard<std::mutex> lock(fallback_mutex);
            if (!fallback_text.empty()) {
                fallback_text += " ";
            }
            fallback_text += chunk.text;
        }
        vxs_result_t result = playback->skip(chunk.sequence_number);
        if (result != VXS_SUCCESS) {
            LOGW("skip(%lld) returned %s", static_cast<long long>(chunk.sequence_number),
                 vxs_result_to_string(result));
        }
    }

    void dispatch(const TextChunk& chunk) {
        bool in_fallback = false;
        {
            std::lock_guard<std::mutex> lock(fallback_mutex);
            in_fallback = fallback;
        }
        if (in_fallback) {
            absorb_into_fallback(chunk);
            return;
        }

        vxs_result_t result = synthesis->enqueue(chunk);
        if (result == VXS_ERROR_CANCELLED) {
            // Fallback began between the check above and the enqueue
            absorb_into_fallback(chunk);
            return;
        }
        if (result != VXS_SUCCESS) {
            LOGE("enqueue(%lld) failed: %s", static_cast<long long>(chunk.sequence_number),
                 vxs_result_to_string(result));
            playback->skip(chunk.sequence_number);
            report_error(make_error(result, "chunk could not be queued for synthesis",
                                    chunk.sequence_number));
        }
    }

    // Submits the combined remaining text once both the fallback has fired
    // and the input has ended
    void maybe_submit_plain_request(bool enabled) {
        TextChunk plain;
        {
            std::lock_guard<std::mutex> lock(fallback_mutex);
            if (!enabled || !fallback || !input_finished || plain_request_submitted ||
                fallback_text.empty()) {
                return;
            }
            plain_request_submitted = true;
            plain.sequence_number = parser->reserve_sequence_number();
            plain.text = fallback_text;
            plain.raw_text = fallback_text;
            plain_request_sequence = plain.sequence_number;
        }

        LOGI("Submitting plain request seq=%lld (%zu chars)",
             static_cast<long long>(plain.sequence_number), plain.text.size());
        vxs_result_t result = synthesis->submit_plain_request(plain);
        if (result != VXS_SUCCESS) {
            LOGE("Plain request rejected: %s", vxs_result_to_string(result));
            playback->skip(plain.sequence_number);
            report_error(make_error(result, "plain request rejected", plain.sequence_number));
        }
    }
};

// =============================================================================
// Construction
// =============================================================================

SpeechSession::SpeechSession(const StreamingConfig& config, SynthesisProvider* provider,
                             AudioSink* sink, SessionCallbacks callbacks)
    : impl_(std::make_unique<Impl>()), config_(config) {
    impl_->provider = provider;
    impl_->sink = sink;
    impl_->callbacks = std::move(callbacks);
    session_id_ = config_.session_id.empty() ? generate_id("session-") : config_.session_id;
    config_.session_id = session_id_;
}

SpeechSession::~SpeechSession() {
    if (impl_->synthesis) {
        impl_->synthesis->shutdown();
    }
    if (impl_->playback) {
        impl_->playback->stop();
    }
}

vxs_result_t SpeechSession::initialize() {
    if (state_.load() != SessionState::NotInitialized) {
        return VXS_ERROR_INVALID_STATE;
    }
    if (impl_->provider == nullptr || impl_->sink == nullptr) {
        LOGE("[%s] provider and sink are required", session_id_.c_str());
        last_error_.store(VXS_ERROR_NULL_POINTER);
        state_.store(SessionState::Failed);
        return VXS_ERROR_NULL_POINTER;
    }

    std::string problem;
    vxs_result_t result = config_.validate(&problem);
    if (result != VXS_SUCCESS) {
        LOGE("[%s] invalid config: %s", session_id_.c_str(), problem.c_str());
        last_error_.store(result);
        state_.store(SessionState::Failed);
        return result;
    }

    // Both queues number from the parser's first sequence number
    config_.playback.first_sequence_number = config_.parser.first_sequence_number;

    Impl* impl = impl_.get();
    EventCallback user_events = impl->callbacks.on_event;
    impl->events = EventEmitter(session_id_, [impl, user_events](const StreamingEvent& event) {
        impl->metrics.record(event);
        if (user_events) {
            user_events(event);
        }
    });

    impl->parser = std::make_unique<SentenceParser>(config_.parser, impl->events);

    PlaybackCallbacks playback_callbacks;
    playback_callbacks.on_complete = [impl](const PlaybackMetadata& metadata) {
        if (impl->callbacks.on_segment_played) {
            impl->callbacks.on_segment_played(metadata);
        }
    };
    playback_callbacks.on_error = [impl](const StreamingError& error, const PlaybackMetadata&) {
        impl->report_error(error);
    };
    impl->playback = std::make_unique<PlaybackQueue>(config_.playback, impl->sink,
                                                     std::move(playback_callbacks), impl->events);

    SynthesisCallbacks synthesis_callbacks;
    synthesis_callbacks.on_complete = [impl](int64_t seq, AudioSegment segment) {
        vxs_result_t rc = impl->playback->enqueue(seq, std::move(segment));
        if (rc != VXS_SUCCESS && rc != VXS_ERROR_CANCELLED) {
            LOGW("Playback rejected seq=%lld: %s", static_cast<long long>(seq),
                 vxs_result_to_string(rc));
        }
    };
    synthesis_callbacks.on_error = [impl](int64_t seq, const StreamingError& error) {
        impl->playback->skip(seq);
        impl->report_error(error);
    };
    synthesis_callbacks.on_cancelled = [impl](int64_t seq) { impl->playback->skip(seq); };

    bool plain_enabled = config_.fallback_plain_request;
    synthesis_callbacks.on_fallback = [impl, plain_enabled](const FallbackRequest& request) {
        {
            std::lock_guard<std::mutex> lock(impl->fallback_mutex);
            impl->fallback = true;
            // Chunks absorbed while the fallback was in progress come after
            std::string later = std::move(impl->fallback_text);
            impl->fallback_text = request.remaining_text;
            if (!later.empty()) {
                impl->fallback_text += " " + later;
            }
        }
        if (impl->callbacks.on_fallback) {
            try {
                impl->callbacks.on_fallback(request);
            } catch (const std::exception& e) {
                LOGE("on_fallback threw: %s", e.what());
            }
        }
        impl->maybe_submit_plain_request(plain_enabled);
    };

    impl->synthesis = std::make_unique<SynthesisQueueManager>(
        config_.synthesis, impl->provider, std::move(synthesis_callbacks), impl->events);

    state_.store(SessionState::Streaming);
    LOGI("[%s] initialized (min_chunk=%d, max_concurrent=%d, errors=%s, interruption=%s)",
         session_id_.c_str(), config_.parser.min_chunk_length, config_.synthesis.max_concurrent,
         error_strategy_to_string(config_.synthesis.error_strategy),
         interruption_strategy_to_string(config_.playback.interruption_strategy));
    return VXS_SUCCESS;
}

// =============================================================================
// Text Input
// =============================================================================

vxs_result_t SpeechSession::feed(const std::string& delta) {
    if (state_.load() != SessionState::Streaming) {
        return VXS_ERROR_INVALID_STATE;
    }

    std::vector<TextChunk> chunks = impl_->parser->add_chunk(delta);
    for (const auto& chunk : chunks) {
        impl_->dispatch(chunk);
    }

    if (impl_->parser->failed()) {
        vxs_result_t error = impl_->parser->last_error();
        LOGE("[%s] parser failed (%s), abandoning response", session_id_.c_str(),
             vxs_result_to_string(error));
        last_error_.store(error);
        state_.store(SessionState::Failed);
        impl_->playback->interrupt(InterruptionStrategy::Immediate, 0);
        impl_->synthesis->cancel_all();
        impl_->report_error(make_error(error, "no sentence boundary within buffer limit"));
        return error;
    }
    return VXS_SUCCESS;
}

vxs_result_t SpeechSession::finish() {
    if (state_.load() != SessionState::Streaming) {
        return VXS_ERROR_INVALID_STATE;
    }

    TextChunk remainder;
    if (impl_->parser->finalize(remainder) && !remainder.text.empty()) {
        impl_->dispatch(remainder);
    }
    {
        std::lock_guard<std::mutex> lock(impl_->fallback_mutex);
        impl_->input_finished = true;
    }
    state_.store(SessionState::Finishing);
    impl_->maybe_submit_plain_request(config_.fallback_plain_request);

    LOGD("[%s] input finished after %lld chunk(s)", session_id_.c_str(),
         static_cast<long long>(impl_->parser->next_sequence_number() -
                                config_.parser.first_sequence_number));
    return VXS_SUCCESS;
}

// =============================================================================
// Interruption
// =============================================================================

int32_t SpeechSession::interrupt() {
    return interrupt(config_.playback.interruption_strategy);
}

int32_t SpeechSession::interrupt(InterruptionStrategy strategy) {
    SessionState current = state_.load();
    if (current != SessionState::Streaming && current != SessionState::Finishing) {
        return 0;
    }
    state_.store(SessionState::Interrupted);

    // Playback decides what still plays; nothing synthesized from here on
    // would be accepted, whatever the strategy
    int32_t discarded = impl_->playback->interrupt(strategy, config_.playback.drain_count);
    int32_t dropped = impl_->synthesis->cancel_all();

    LOGI("[%s] interrupted (%s): %d segment(s) discarded, %d task(s) dropped",
         session_id_.c_str(), interruption_strategy_to_string(strategy), discarded, dropped);
    return discarded + dropped;
}

// =============================================================================
// Status
// =============================================================================

bool SpeechSession::wait_until_done(int32_t timeout_ms) {
    if (!impl_->synthesis || !impl_->playback) {
        return true;
    }
    auto deadline = Clock::now() + std::chrono::milliseconds(std::max(timeout_ms, 0));
    auto remaining = [&deadline, timeout_ms]() -> int32_t {
        if (timeout_ms < 0) {
            return -1;
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        return static_cast<int32_t>(std::max<int64_t>(left.count(), 0));
    };

    if (!impl_->synthesis->wait_until_idle(remaining())) {
        return false;
    }
    return impl_->playback->wait_until_idle(remaining());
}

std::string SpeechSession::state_string() const {
    switch (state_.load()) {
        case SessionState::NotInitialized:
            return "NOT_INITIALIZED";
        case SessionState::Streaming:
            return "STREAMING";
        case SessionState::Finishing:
            return "FINISHING";
        case SessionState::Interrupted:
            return "INTERRUPTED";
        case SessionState::Failed:
            return "FAILED";
        default:
            return "UNKNOWN";
    }
}

bool SpeechSession::fallback_active() const {
    std::lock_guard<std::mutex> lock(impl_->fallback_mutex);
    return impl_->fallback;
}

nlohmann::json SpeechSession::stats() const {
    nlohmann::json j;
    j["session_id"] = session_id_;
    j["state"] = state_string();
    j["last_error"] = vxs_result_to_string(last_error_.load());
    j["config"] = config_.to_json();

    if (impl_->parser) {
        j["parser"] = {
            {"buffered", impl_->parser->buffered_length()},
            {"next_sequence_number", impl_->parser->next_sequence_number()},
            {"failed", impl_->parser->failed()},
        };
    }
    if (impl_->synthesis) {
        nlohmann::json synthesis = impl_->synthesis->stats().to_json();
        synthesis["sentences_failed"] = synthesis["total_failed"];
        j["synthesis"] = synthesis;
    }
    if (impl_->playback) {
        j["playback"] = impl_->playback->stats().to_json();
    }
    {
        std::lock_guard<std::mutex> lock(impl_->fallback_mutex);
        j["fallback"] = {
            {"active", impl_->fallback},
            {"plain_request_submitted", impl_->plain_request_submitted},
            {"plain_request_sequence", impl_->plain_request_sequence},
        };
    }
    j["metrics"] = impl_->metrics.to_json();
    return j;
}

}  // namespace streaming
}  // namespace voxstream
