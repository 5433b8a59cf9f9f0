/**
 * @file playback_queue.cpp
 * @brief VoxStream Streaming - Ordered, interruptible audio playback
 */

#include "voxstream/streaming/playback_queue.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <string>
#include <utility>

#include "voxstream/core/vxs_logger.h"

#define LOG_TAG "Streaming.Playback"
#define LOGD(...) VXS_LOG_DEBUG(LOG_TAG, __VA_ARGS__)
#define LOGI(...) VXS_LOG_INFO(LOG_TAG, __VA_ARGS__)
#define LOGW(...) VXS_LOG_WARNING(LOG_TAG, __VA_ARGS__)
#define LOGE(...) VXS_LOG_ERROR(LOG_TAG, __VA_ARGS__)

namespace voxstream {
namespace streaming {

nlohmann::json PlaybackStats::to_json() const {
    nlohmann::json j;
    j["running"] = running;
    j["playing"] = playing;
    j["interrupted"] = interrupted;
    j["current_sequence"] = current_sequence;
    j["next_expected"] = next_expected;
    j["ready"] = ready;
    j["buffered"] = buffered;
    j["total_queued"] = total_queued;
    j["total_played"] = total_played;
    j["total_interrupted"] = total_interrupted;
    j["total_failed"] = total_failed;
    j["total_skipped"] = total_skipped;
    j["total_discarded"] = total_discarded;
    j["total_rejected"] = total_rejected;
    return j;
}

PlaybackQueue::PlaybackQueue(const PlaybackConfig& config, AudioSink* sink,
                             PlaybackCallbacks callbacks, EventEmitter events)
    : config_(config),
      sink_(sink),
      callbacks_(std::move(callbacks)),
      events_(std::move(events)),
      next_expected_(config.first_sequence_number) {
    if (sink_ == nullptr) {
        LOGE("No audio sink; every enqueue will be rejected");
    }
    worker_ = std::thread(&PlaybackQueue::worker_loop, this);
}

PlaybackQueue::~PlaybackQueue() {
    stop();
}

void PlaybackQueue::stop() {
    bool was_playing = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_.load()) {
            return;
        }
        stopping_.store(true);
        stop_flag_.store(true);
        was_playing = playing_;
        total_discarded_ += static_cast<int64_t>(ready_.size() + reorder_.size());
        ready_.clear();
        reorder_.clear();
    }
    if (was_playing && sink_ != nullptr) {
        sink_->stop();
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    idle_cv_.notify_all();
}

// =============================================================================
// ORDERING
// =============================================================================

vxs_result_t PlaybackQueue::enqueue(int64_t seq, AudioSegment segment) {
    if (sink_ == nullptr) {
        return VXS_ERROR_NULL_POINTER;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_.load()) {
            return VXS_ERROR_NOT_RUNNING;
        }
        if (seq > accept_limit_) {
            total_rejected_++;
            LOGD("seq=%lld rejected after interruption", static_cast<long long>(seq));
            return VXS_ERROR_CANCELLED;
        }
        if (seq < next_expected_ || reorder_.count(seq) > 0 || skipped_.count(seq) > 0) {
            total_rejected_++;
            LOGW("Stale or duplicate seq=%lld (next expected %lld)", static_cast<long long>(seq),
                 static_cast<long long>(next_expected_));
            return VXS_ERROR_INVALID_SEQUENCE;
        }

        segment.sequence_number = seq;
        PlaybackItem item;
        item.segment = std::move(segment);
        item.enqueued_at = Clock::now();
        reorder_.emplace(seq, std::move(item));
        total_queued_++;

        if (seq != next_expected_) {
            LOGD("Buffered seq=%lld, waiting for %lld", static_cast<long long>(seq),
                 static_cast<long long>(next_expected_));
        }
        advance_locked();
    }
    cv_.notify_one();
    return VXS_SUCCESS;
}

vxs_result_t PlaybackQueue::skip(int64_t seq) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_.load()) {
            return VXS_ERROR_NOT_RUNNING;
        }
        if (seq > accept_limit_) {
            return VXS_SUCCESS;
        }
        if (seq < next_expected_ || reorder_.count(seq) > 0) {
            return VXS_ERROR_INVALID_SEQUENCE;
        }
        if (skipped_.insert(seq).second) {
            total_skipped_++;
        }
        advance_locked();
    }
    cv_.notify_one();
    idle_cv_.notify_all();
    return VXS_SUCCESS;
}

// Move every segment that is now next in line to the ready queue
void PlaybackQueue::advance_locked() {
    while (true) {
        auto it = reorder_.find(next_expected_);
        if (it != reorder_.end()) {
            ready_.push_back(std::move(it->second));
            reorder_.erase(it);
            next_expected_++;
            continue;
        }
        auto skipped = skipped_.find(next_expected_);
        if (skipped != skipped_.end()) {
            skipped_.erase(skipped);
            next_expected_++;
            continue;
        }
        break;
    }
}

// =============================================================================
// WORKER
// =============================================================================

void PlaybackQueue::worker_loop() {
    while (true) {
        PlaybackItem item;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_.load() || !ready_.empty(); });
            if (stopping_.load()) {
                break;
            }
            item = std::move(ready_.front());
            ready_.pop_front();
            playing_ = true;
            current_sequence_ = item.segment.sequence_number;
            last_dispatched_ = current_sequence_;
            stop_flag_.store(false);
        }

        play_item(std::move(item));

        {
            std::lock_guard<std::mutex> lock(mutex_);
            playing_ = false;
            current_sequence_ = kNoSequence;
        }
        idle_cv_.notify_all();
    }
}

void PlaybackQueue::play_item(PlaybackItem item) {
    const AudioSegment& segment = item.segment;

    PlaybackMetadata metadata;
    metadata.sequence_number = segment.sequence_number;
    metadata.source_text = segment.source_text;
    metadata.audio_size_bytes = segment.audio.size();
    metadata.synth_latency_ms = segment.synth_latency_ms;
    metadata.queue_wait_ms = elapsed_ms(item.enqueued_at);
    metadata.status = PlaybackStatus::Playing;
    events_.playback_queue_wait(segment.sequence_number, metadata.queue_wait_ms);

    auto start = Clock::now();
    vxs_result_t result = VXS_SUCCESS;
    std::string message;
    try {
        result = sink_->play(segment, stop_flag_);
        if (result != VXS_SUCCESS) {
            message = std::string(sink_->name()) + " returned " + vxs_result_to_string(result);
        }
    } catch (const std::exception& e) {
        result = VXS_ERROR_PLAYBACK_SINK;
        message = std::string(sink_->name()) + " threw: " + e.what();
    }
    metadata.play_duration_ms = elapsed_ms(start);

    bool interrupted = stop_flag_.load();
    if (interrupted) {
        metadata.status = PlaybackStatus::Interrupted;
        std::lock_guard<std::mutex> lock(mutex_);
        total_interrupted_++;
    } else if (result != VXS_SUCCESS) {
        metadata.status = PlaybackStatus::Failed;
        std::lock_guard<std::mutex> lock(mutex_);
        total_failed_++;
    } else {
        metadata.status = PlaybackStatus::Completed;
        std::lock_guard<std::mutex> lock(mutex_);
        total_played_++;
    }

    if (metadata.status == PlaybackStatus::Interrupted) {
        LOGI("seq=%lld interrupted after %.1f ms", static_cast<long long>(metadata.sequence_number),
             metadata.play_duration_ms);
        return;
    }

    if (metadata.status == PlaybackStatus::Failed) {
        LOGE("seq=%lld failed: %s", static_cast<long long>(metadata.sequence_number),
             message.c_str());
        events_.playback_failed(metadata.sequence_number, VXS_ERROR_PLAYBACK_SINK, message);
        if (callbacks_.on_error) {
            StreamingError error =
                make_error(VXS_ERROR_PLAYBACK_SINK, message, metadata.sequence_number);
            try {
                callbacks_.on_error(error, metadata);
            } catch (const std::exception& e) {
                LOGE("on_error threw: %s", e.what());
            }
        }
        return;
    }

    LOGD("seq=%lld played in %.1f ms (waited %.1f ms)",
         static_cast<long long>(metadata.sequence_number), metadata.play_duration_ms,
         metadata.queue_wait_ms);
    events_.playback_completed(metadata.sequence_number, metadata.play_duration_ms);
    if (callbacks_.on_complete) {
        try {
            callbacks_.on_complete(metadata);
        } catch (const std::exception& e) {
            LOGE("on_complete threw: %s", e.what());
        }
    }
}

// =============================================================================
// INTERRUPTION
// =============================================================================

int64_t PlaybackQueue::playback_base_locked() const {
    if (playing_) {
        return current_sequence_;
    }
    if (last_dispatched_ != kNoSequence) {
        return last_dispatched_;
    }
    return config_.first_sequence_number - 1;
}

int32_t PlaybackQueue::interrupt() {
    return interrupt(config_.interruption_strategy, config_.drain_count);
}

int32_t PlaybackQueue::interrupt(InterruptionStrategy strategy, int32_t drain_count) {
    int32_t discarded = 0;
    bool stop_sink = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Only segments already in the ready queue are eligible to drain;
        // anything parked behind a gap or arriving later is dropped
        size_t keep = 0;
        if (strategy == InterruptionStrategy::Drain && drain_count > 0) {
            keep = std::min(ready_.size(), static_cast<size_t>(drain_count));
        }
        int64_t limit = keep > 0 ? ready_[keep - 1].segment.sequence_number
                                 : playback_base_locked();

        while (ready_.size() > keep) {
            ready_.pop_back();
            discarded++;
        }
        discarded += static_cast<int32_t>(reorder_.size());
        reorder_.clear();
        skipped_.erase(skipped_.upper_bound(limit), skipped_.end());

        if (limit < accept_limit_) {
            accept_limit_ = limit;
        }
        interrupted_ = true;
        total_discarded_ += discarded;

        if (strategy == InterruptionStrategy::Immediate && playing_) {
            stop_flag_.store(true);
            stop_sink = true;
        }
    }

    if (stop_sink) {
        sink_->stop();
    }

    LOGI("Interrupted (%s): %d segment(s) discarded", interruption_strategy_to_string(strategy),
         discarded);
    events_.interruption_triggered(interruption_strategy_to_string(strategy), discarded);
    cv_.notify_all();
    idle_cv_.notify_all();
    return discarded;
}

// =============================================================================
// QUERIES
// =============================================================================

bool PlaybackQueue::wait_until_idle(int32_t timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto idle = [this] { return stopping_.load() || (ready_.empty() && !playing_); };
    if (timeout_ms < 0) {
        idle_cv_.wait(lock, idle);
        return true;
    }
    return idle_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), idle);
}

PlaybackStats PlaybackQueue::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    PlaybackStats stats;
    stats.running = !stopping_.load();
    stats.playing = playing_;
    stats.interrupted = interrupted_;
    stats.current_sequence = current_sequence_;
    stats.next_expected = next_expected_;
    stats.ready = static_cast<int32_t>(ready_.size());
    stats.buffered = static_cast<int32_t>(reorder_.size());
    stats.total_queued = total_queued_;
    stats.total_played = total_played_;
    stats.total_interrupted = total_interrupted_;
    stats.total_failed = total_failed_;
    stats.total_skipped = total_skipped_;
    stats.total_discarded = total_discarded_;
    stats.total_rejected = total_rejected_;
    return stats;
}

int64_t PlaybackQueue::next_expected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_expected_;
}

bool PlaybackQueue::interrupted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return interrupted_;
}

}  // namespace streaming
}  // namespace voxstream
