/**
 * @file synthesis_queue_manager.cpp
 * @brief VoxStream Streaming - Bounded-concurrency speech synthesis
 */

#include "voxstream/streaming/synthesis_queue_manager.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <system_error>
#include <utility>

#include "voxstream/core/vxs_logger.h"
#include "voxstream/core/vxs_util.h"
#include "voxstream/streaming/sentence_parser.h"

#define LOG_TAG "Streaming.Synthesis"
#define LOGD(...) VXS_LOG_DEBUG(LOG_TAG, __VA_ARGS__)
#define LOGI(...) VXS_LOG_INFO(LOG_TAG, __VA_ARGS__)
#define LOGW(...) VXS_LOG_WARNING(LOG_TAG, __VA_ARGS__)
#define LOGE(...) VXS_LOG_ERROR(LOG_TAG, __VA_ARGS__)

namespace voxstream {
namespace streaming {

nlohmann::json SynthesisStats::to_json() const {
    nlohmann::json j;
    j["running"] = running;
    j["fallback_active"] = fallback_active;
    j["max_concurrent"] = max_concurrent;
    j["num_workers"] = num_workers;
    j["queue_size"] = queue_size;
    j["in_flight"] = in_flight;
    j["peak_in_flight"] = peak_in_flight;
    j["total_enqueued"] = total_enqueued;
    j["total_completed"] = total_completed;
    j["total_failed"] = total_failed;
    j["total_cancelled"] = total_cancelled;
    j["total_retries"] = total_retries;
    return j;
}

// =============================================================================
// LIFECYCLE
// =============================================================================

SynthesisQueueManager::SynthesisQueueManager(const SynthesisConfig& config,
                                             SynthesisProvider* provider,
                                             SynthesisCallbacks callbacks, EventEmitter events)
    : config_(config),
      provider_(provider),
      callbacks_(std::move(callbacks)),
      events_(std::move(events)) {
    if (config_.max_concurrent < kMinConcurrent) {
        LOGW("max_concurrent %d raised to %d", config_.max_concurrent, kMinConcurrent);
        config_.max_concurrent = kMinConcurrent;
    }
    if (provider_ == nullptr) {
        LOGE("No synthesis provider; every enqueue will be rejected");
    }

    int32_t num_workers = config_.effective_workers();
    workers_.reserve(static_cast<size_t>(num_workers));
    for (int32_t i = 0; i < num_workers; ++i) {
        workers_.emplace_back(&SynthesisQueueManager::worker_loop, this, i);
    }
    LOGI("Started %d workers (max_concurrent=%d, strategy=%s)", num_workers,
         config_.max_concurrent, error_strategy_to_string(config_.error_strategy));
}

SynthesisQueueManager::~SynthesisQueueManager() {
    shutdown();
}

void SynthesisQueueManager::shutdown() {
    std::vector<int64_t> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_.load()) {
            return;
        }
        stopping_.store(true);
        dropped = drop_queued_locked(0);
    }
    work_cv_.notify_all();
    notify_cancelled(dropped);

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    std::vector<std::future<CallResult>> abandoned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        abandoned.swap(abandoned_);
    }
    for (auto& call : abandoned) {
        call.wait();
    }
    idle_cv_.notify_all();
    LOGI("Stopped (%zu queued tasks cancelled)", dropped.size());
}

// =============================================================================
// ADMISSION
// =============================================================================

vxs_result_t SynthesisQueueManager::enqueue(const TextChunk& chunk, TaskHandle* handle_out) {
    return admit(chunk, false, handle_out);
}

vxs_result_t SynthesisQueueManager::submit_plain_request(const TextChunk& chunk,
                                                         TaskHandle* handle_out) {
    return admit(chunk, true, handle_out);
}

vxs_result_t SynthesisQueueManager::admit(const TextChunk& chunk, bool plain_request,
                                          TaskHandle* handle_out) {
    if (provider_ == nullptr) {
        return VXS_ERROR_NULL_POINTER;
    }
    std::string text = trim_whitespace(chunk.text);
    if (text.empty()) {
        return VXS_ERROR_INVALID_ARGUMENT;
    }

    SynthesisTask task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_.load()) {
            return VXS_ERROR_NOT_RUNNING;
        }
        if (plain_request) {
            if (!fallback_active_ || plain_request_submitted_) {
                LOGW("Plain request rejected (fallback_active=%d)", fallback_active_ ? 1 : 0);
                return VXS_ERROR_INVALID_STATE;
            }
        } else if (fallback_active_) {
            return VXS_ERROR_CANCELLED;
        }

        int64_t seq = chunk.sequence_number;
        if (seq == kNoSequence) {
            seq = (last_sequence_ == kNoSequence) ? 0 : last_sequence_ + 1;
        } else if (seq < 0 || (last_sequence_ != kNoSequence && seq <= last_sequence_)) {
            LOGE("Sequence %lld rejected, last admitted %lld", static_cast<long long>(seq),
                 static_cast<long long>(last_sequence_));
            return VXS_ERROR_INVALID_SEQUENCE;
        }

        task.task_id = generate_id("tts-");
        task.sequence_number = seq;
        task.text = std::move(text);
        task.voice = config_.voice;
        task.status = TaskStatus::Queued;
        task.is_plain_request = plain_request;
        task.created_ms = now_ms();

        tasks_[seq] = task;
        queue_.push_back(seq);
        last_sequence_ = seq;
        total_enqueued_++;
        if (plain_request) {
            plain_request_submitted_ = true;
        }
    }
    work_cv_.notify_all();

    LOGD("Enqueued %s seq=%lld (%zu chars)%s", task.task_id.c_str(),
         static_cast<long long>(task.sequence_number), task.text.size(),
         plain_request ? " [plain]" : "");

    if (handle_out) {
        handle_out->sequence_number = task.sequence_number;
        handle_out->task_id = task.task_id;
    }
    return VXS_SUCCESS;
}

// =============================================================================
// WORKERS
// =============================================================================

void SynthesisQueueManager::worker_loop(int32_t worker_index) {
    LOGD("Worker %d started", worker_index);
    while (true) {
        int64_t seq = kNoSequence;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            // in_flight_ doubles as the concurrency semaphore
            work_cv_.wait(lock, [this] {
                return stopping_.load() ||
                       (!queue_.empty() &&
                        static_cast<int32_t>(in_flight_.size()) < config_.max_concurrent);
            });
            if (stopping_.load()) {
                break;
            }

            seq = queue_.front();
            queue_.pop_front();
            in_flight_.insert(seq);
            peak_in_flight_ = std::max(peak_in_flight_, static_cast<int32_t>(in_flight_.size()));

            SynthesisTask& task = tasks_[seq];
            task.status = TaskStatus::Running;
            task.started_ms = now_ms();
        }
        run_task(seq);
    }
    LOGD("Worker %d exiting", worker_index);
}

void SynthesisQueueManager::run_task(int64_t seq) {
    SynthesisTask task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        task = tasks_[seq];
    }

    int32_t max_attempts = 1;
    if (config_.error_strategy == ErrorStrategy::Retry && !task.is_plain_request) {
        max_attempts += config_.max_retries;
    }

    StreamingError error;
    for (int32_t attempt = 1; attempt <= max_attempts; ++attempt) {
        if (is_discarded(seq)) {
            finish_cancelled(seq);
            return;
        }

        if (attempt > 1) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                tasks_[seq].retry_count = attempt - 1;
                total_retries_++;
            }
            task.retry_count = attempt - 1;
            LOGW("Retrying seq=%lld (attempt %d/%d) after %s", static_cast<long long>(seq),
                 attempt, max_attempts, vxs_result_to_string(error.code));
            events_.synthesis_retry(seq, attempt, error.code);

            int32_t delay_ms = 0;
            if (config_.retry_backoff_ms > 0) {
                int64_t backoff = static_cast<int64_t>(config_.retry_backoff_ms) << (attempt - 2);
                delay_ms = static_cast<int32_t>(
                    std::min<int64_t>(backoff, static_cast<int64_t>(kMaxRetryBackoffMs)));
            }
            if (!wait_backoff(seq, delay_ms)) {
                finish_cancelled(seq);
                return;
            }
        }

        events_.synthesis_started(seq, attempt);

        std::vector<uint8_t> audio;
        std::string message;
        double latency_ms = 0.0;
        vxs_result_t result = attempt_synthesis(task, audio, message, latency_ms);

        if (is_discarded(seq)) {
            finish_cancelled(seq);
            return;
        }
        if (result == VXS_SUCCESS) {
            events_.synthesis_completed(seq, latency_ms, attempt);
            finish_completed(std::move(task), std::move(audio), latency_ms);
            return;
        }

        error = make_error(result, message, seq);
        error.attempts = attempt;
        events_.synthesis_failed(seq, result, message, attempt);
    }

    if (config_.error_strategy == ErrorStrategy::Fallback && !task.is_plain_request) {
        trigger_fallback(seq, error);
    } else {
        finish_failed(seq, error);
    }
}

vxs_result_t SynthesisQueueManager::attempt_synthesis(const SynthesisTask& task,
                                                      std::vector<uint8_t>& audio,
                                                      std::string& message, double& latency_ms) {
    SynthesisProvider* provider = provider_;
    int32_t timeout_ms = config_.synthesis_timeout_ms;
    std::string text = task.text;
    VoiceParams voice = task.voice;

    auto start = Clock::now();
    std::future<CallResult> call;
    try {
        call = std::async(std::launch::async, [provider, text, voice, timeout_ms]() {
            CallResult out;
            out.result = provider->synthesize(text, voice, timeout_ms, out.audio);
            return out;
        });
    } catch (const std::system_error& e) {
        message = std::string("cannot start synthesis call: ") + e.what();
        LOGE("seq=%lld: %s", static_cast<long long>(task.sequence_number), message.c_str());
        return VXS_ERROR_SYNTHESIS_PROVIDER;
    }

    // The deadline is enforced here even if the provider ignores timeout_ms
    if (call.wait_for(std::chrono::milliseconds(timeout_ms)) != std::future_status::ready) {
        latency_ms = elapsed_ms(start);
        message = std::string(provider_->name()) + " gave no result within " +
                  std::to_string(timeout_ms) + " ms";
        LOGW("seq=%lld: %s", static_cast<long long>(task.sequence_number), message.c_str());
        abandon_call(std::move(call));
        return VXS_ERROR_SYNTHESIS_TIMEOUT;
    }

    vxs_result_t result = VXS_ERROR_SYNTHESIS_PROVIDER;
    try {
        CallResult out = call.get();
        result = out.result;
        audio = std::move(out.audio);
    } catch (const std::exception& e) {
        message = std::string(provider_->name()) + " threw: " + e.what();
        LOGE("seq=%lld: %s", static_cast<long long>(task.sequence_number), message.c_str());
        return VXS_ERROR_SYNTHESIS_PROVIDER;
    }
    latency_ms = elapsed_ms(start);

    if (result == VXS_SUCCESS && audio.empty()) {
        message = std::string(provider_->name()) + " returned no audio";
        result = VXS_ERROR_SYNTHESIS_PROVIDER;
    } else if (result == VXS_ERROR_SYNTHESIS_TIMEOUT) {
        message = std::string(provider_->name()) + " timed out";
    } else if (result != VXS_SUCCESS) {
        message = std::string(provider_->name()) + " failed: " + vxs_result_to_string(result);
        result = VXS_ERROR_SYNTHESIS_PROVIDER;
    }

    if (result != VXS_SUCCESS) {
        LOGW("seq=%lld: %s", static_cast<long long>(task.sequence_number), message.c_str());
    }
    return result;
}

void SynthesisQueueManager::abandon_call(std::future<CallResult> call) {
    std::lock_guard<std::mutex> lock(mutex_);
    abandoned_.erase(std::remove_if(abandoned_.begin(), abandoned_.end(),
                                    [](const std::future<CallResult>& pending) {
                                        return pending.wait_for(std::chrono::seconds(0)) ==
                                               std::future_status::ready;
                                    }),
                     abandoned_.end());
    abandoned_.push_back(std::move(call));
}

bool SynthesisQueueManager::is_discarded(int64_t seq) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopping_.load() || discarded_.count(seq) > 0;
}

bool SynthesisQueueManager::wait_backoff(int64_t seq, int32_t delay_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (delay_ms > 0) {
        work_cv_.wait_for(lock, std::chrono::milliseconds(delay_ms),
                          [this, seq] { return stopping_.load() || discarded_.count(seq) > 0; });
    }
    return !stopping_.load() && discarded_.count(seq) == 0;
}

// =============================================================================
// TERMINAL STATES
// =============================================================================

void SynthesisQueueManager::finish_completed(SynthesisTask task, std::vector<uint8_t> audio,
                                             double latency_ms) {
    int64_t seq = task.sequence_number;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        SynthesisTask& stored = tasks_[seq];
        stored.status = TaskStatus::Completed;
        stored.finished_ms = now_ms();
        total_completed_++;
        discarded_.erase(seq);
    }

    LOGD("Completed seq=%lld in %.1f ms (%zu bytes, %d retries)", static_cast<long long>(seq),
         latency_ms, audio.size(), task.retry_count);

    AudioSegment segment;
    segment.sequence_number = seq;
    segment.audio = std::move(audio);
    segment.source_text = std::move(task.text);
    segment.synth_latency_ms = latency_ms;

    if (callbacks_.on_complete) {
        try {
            callbacks_.on_complete(seq, std::move(segment));
        } catch (const std::exception& e) {
            LOGE("on_complete threw for seq=%lld: %s", static_cast<long long>(seq), e.what());
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_.erase(seq);
    }
    work_cv_.notify_all();
    idle_cv_.notify_all();
}

void SynthesisQueueManager::finish_failed(int64_t seq, const StreamingError& error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        SynthesisTask& stored = tasks_[seq];
        stored.status = TaskStatus::Failed;
        stored.finished_ms = now_ms();
        total_failed_++;
        discarded_.erase(seq);
    }

    LOGE("Giving up on seq=%lld after %d attempt(s): %s", static_cast<long long>(seq),
         error.attempts, error.message.c_str());

    if (callbacks_.on_error) {
        try {
            callbacks_.on_error(seq, error);
        } catch (const std::exception& e) {
            LOGE("on_error threw for seq=%lld: %s", static_cast<long long>(seq), e.what());
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_.erase(seq);
    }
    work_cv_.notify_all();
    idle_cv_.notify_all();
}

void SynthesisQueueManager::finish_cancelled(int64_t seq) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        SynthesisTask& stored = tasks_[seq];
        stored.status = TaskStatus::Cancelled;
        stored.finished_ms = now_ms();
        total_cancelled_++;
        discarded_.erase(seq);
    }

    LOGD("Discarded in-flight seq=%lld", static_cast<long long>(seq));
    events_.synthesis_cancelled(seq);
    if (callbacks_.on_cancelled) {
        try {
            callbacks_.on_cancelled(seq);
        } catch (const std::exception& e) {
            LOGE("on_cancelled threw for seq=%lld: %s", static_cast<long long>(seq), e.what());
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_.erase(seq);
    }
    work_cv_.notify_all();
    idle_cv_.notify_all();
}

void SynthesisQueueManager::trigger_fallback(int64_t seq, const StreamingError& error) {
    FallbackRequest request;
    std::vector<int64_t> dropped_queued;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fallback_active_ || discarded_.count(seq) > 0) {
            // Another task triggered the fallback first; this one was dropped by it
            discarded_.insert(seq);
        } else {
            fallback_active_ = true;
            dropped_queued = drop_queued_locked(0);

            std::vector<int64_t> dropped = dropped_queued;
            for (int64_t other : in_flight_) {
                if (other != seq) {
                    discarded_.insert(other);
                    dropped.push_back(other);
                }
            }
            std::sort(dropped.begin(), dropped.end());

            SynthesisTask& failed = tasks_[seq];
            failed.status = TaskStatus::Failed;
            failed.finished_ms = now_ms();
            total_failed_++;

            request.failed_sequence_number = seq;
            request.dropped_sequence_numbers = dropped;
            request.error = error;
            std::vector<int64_t> ordered = dropped;
            ordered.insert(std::upper_bound(ordered.begin(), ordered.end(), seq), seq);
            for (int64_t other : ordered) {
                if (!request.remaining_text.empty()) {
                    request.remaining_text += " ";
                }
                request.remaining_text += tasks_[other].text;
            }
        }
    }

    if (request.failed_sequence_number == kNoSequence) {
        finish_cancelled(seq);
        return;
    }

    LOGW("Fallback after seq=%lld failed: %zu task(s) dropped", static_cast<long long>(seq),
         request.dropped_sequence_numbers.size());
    events_.fallback_triggered(seq, static_cast<int32_t>(request.dropped_sequence_numbers.size()));

    if (callbacks_.on_error) {
        try {
            callbacks_.on_error(seq, error);
        } catch (const std::exception& e) {
            LOGE("on_error threw for seq=%lld: %s", static_cast<long long>(seq), e.what());
        }
    }
    if (callbacks_.on_fallback) {
        try {
            callbacks_.on_fallback(request);
        } catch (const std::exception& e) {
            LOGE("on_fallback threw: %s", e.what());
        }
    }
    notify_cancelled(dropped_queued);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_.erase(seq);
    }
    work_cv_.notify_all();
    idle_cv_.notify_all();
}

// =============================================================================
// CANCELLATION
// =============================================================================

std::vector<int64_t> SynthesisQueueManager::drop_queued_locked(size_t keep) {
    std::vector<int64_t> dropped;
    if (queue_.size() <= keep) {
        return dropped;
    }
    auto first = queue_.begin() + static_cast<std::ptrdiff_t>(keep);
    dropped.assign(first, queue_.end());
    queue_.erase(first, queue_.end());

    int64_t now = now_ms();
    for (int64_t seq : dropped) {
        SynthesisTask& task = tasks_[seq];
        task.status = TaskStatus::Cancelled;
        task.finished_ms = now;
        total_cancelled_++;
    }
    pending_notifications_ += static_cast<int32_t>(dropped.size());
    return dropped;
}

void SynthesisQueueManager::notify_cancelled(const std::vector<int64_t>& dropped) {
    if (dropped.empty()) {
        return;
    }
    for (int64_t seq : dropped) {
        events_.synthesis_cancelled(seq);
        if (callbacks_.on_cancelled) {
            try {
                callbacks_.on_cancelled(seq);
            } catch (const std::exception& e) {
                LOGE("on_cancelled threw for seq=%lld: %s", static_cast<long long>(seq),
                     e.what());
            }
        }
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_notifications_ -= static_cast<int32_t>(dropped.size());
    }
    idle_cv_.notify_all();
}

int32_t SynthesisQueueManager::cancel_all() {
    std::vector<int64_t> dropped;
    int32_t discarded = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped = drop_queued_locked(0);
        for (int64_t seq : in_flight_) {
            if (discarded_.insert(seq).second) {
                discarded++;
            }
        }
    }
    work_cv_.notify_all();
    LOGI("cancel_all: %zu queued dropped, %d in-flight discarded", dropped.size(), discarded);
    notify_cancelled(dropped);
    return static_cast<int32_t>(dropped.size()) + discarded;
}

int32_t SynthesisQueueManager::cancel_pending() {
    std::vector<int64_t> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped = drop_queued_locked(0);
    }
    LOGI("cancel_pending: %zu queued dropped", dropped.size());
    notify_cancelled(dropped);
    return static_cast<int32_t>(dropped.size());
}

int32_t SynthesisQueueManager::cancel_after(int32_t num_to_keep) {
    std::vector<int64_t> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped = drop_queued_locked(static_cast<size_t>(std::max(num_to_keep, 0)));
    }
    LOGI("cancel_after(%d): %zu queued dropped", num_to_keep, dropped.size());
    notify_cancelled(dropped);
    return static_cast<int32_t>(dropped.size());
}

// =============================================================================
// QUERIES
// =============================================================================

bool SynthesisQueueManager::wait_until_idle(int32_t timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto idle = [this] {
        return queue_.empty() && in_flight_.empty() && pending_notifications_ == 0;
    };
    if (timeout_ms < 0) {
        idle_cv_.wait(lock, idle);
        return true;
    }
    return idle_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), idle);
}

bool SynthesisQueueManager::task_status(int64_t seq, TaskStatus& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(seq);
    if (it == tasks_.end()) {
        return false;
    }
    out = it->second.status;
    return true;
}

bool SynthesisQueueManager::task_info(int64_t seq, SynthesisTask& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(seq);
    if (it == tasks_.end()) {
        return false;
    }
    out = it->second;
    return true;
}

SynthesisStats SynthesisQueueManager::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SynthesisStats stats;
    stats.running = !stopping_.load();
    stats.fallback_active = fallback_active_;
    stats.max_concurrent = config_.max_concurrent;
    stats.num_workers = static_cast<int32_t>(workers_.size());
    stats.queue_size = static_cast<int32_t>(queue_.size());
    stats.in_flight = static_cast<int32_t>(in_flight_.size());
    stats.peak_in_flight = peak_in_flight_;
    stats.total_enqueued = total_enqueued_;
    stats.total_completed = total_completed_;
    stats.total_failed = total_failed_;
    stats.total_cancelled = total_cancelled_;
    stats.total_retries = total_retries_;
    return stats;
}

bool SynthesisQueueManager::fallback_active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fallback_active_;
}

int64_t SynthesisQueueManager::last_sequence_number() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_sequence_;
}

}  // namespace streaming
}  // namespace voxstream
