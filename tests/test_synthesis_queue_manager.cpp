/**
 * @file test_synthesis_queue_manager.cpp
 * @brief Tests for bounded-concurrency synthesis, error strategies and cancellation
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "test_fakes.h"
#include "voxstream/streaming/synthesis_queue_manager.h"

using namespace voxstream;
using namespace voxstream::streaming;
using voxstream::testing::FakeProvider;

namespace {

// Collects every callback the manager fires
struct Recorder {
    std::mutex mutex;
    std::map<int64_t, AudioSegment> completed;
    std::map<int64_t, StreamingError> errors;
    std::vector<int64_t> cancelled;
    std::vector<FallbackRequest> fallbacks;
    std::vector<StreamingEvent> events;

    SynthesisCallbacks callbacks() {
        SynthesisCallbacks cb;
        cb.on_complete = [this](int64_t seq, AudioSegment segment) {
            std::lock_guard<std::mutex> lock(mutex);
            completed[seq] = std::move(segment);
        };
        cb.on_error = [this](int64_t seq, const StreamingError& error) {
            std::lock_guard<std::mutex> lock(mutex);
            errors[seq] = error;
        };
        cb.on_cancelled = [this](int64_t seq) {
            std::lock_guard<std::mutex> lock(mutex);
            cancelled.push_back(seq);
        };
        cb.on_fallback = [this](const FallbackRequest& request) {
            std::lock_guard<std::mutex> lock(mutex);
            fallbacks.push_back(request);
        };
        return cb;
    }

    EventEmitter emitter() {
        return EventEmitter("test-session", [this](const StreamingEvent& event) {
            std::lock_guard<std::mutex> lock(mutex);
            events.push_back(event);
        });
    }

    std::set<int64_t> completed_set() {
        std::lock_guard<std::mutex> lock(mutex);
        std::set<int64_t> out;
        for (const auto& entry : completed) {
            out.insert(entry.first);
        }
        return out;
    }

    std::set<int64_t> cancelled_set() {
        std::lock_guard<std::mutex> lock(mutex);
        return std::set<int64_t>(cancelled.begin(), cancelled.end());
    }

    int count_events(EventType type) {
        std::lock_guard<std::mutex> lock(mutex);
        return static_cast<int>(std::count_if(events.begin(), events.end(),
                                              [type](const StreamingEvent& e) {
                                                  return e.type == type;
                                              }));
    }
};

TextChunk chunk(int64_t seq, const std::string& text) {
    TextChunk c;
    c.sequence_number = seq;
    c.text = text;
    c.raw_text = text;
    return c;
}

SynthesisConfig make_config(int32_t max_concurrent, ErrorStrategy strategy) {
    SynthesisConfig config;
    config.max_concurrent = max_concurrent;
    config.error_strategy = strategy;
    config.max_retries = 2;
    config.synthesis_timeout_ms = 5000;
    return config;
}

}  // namespace

// =============================================================================
// SCHEDULING
// =============================================================================

TEST(SynthesisQueueManager, CompletesEveryChunk) {
    Recorder recorder;
    FakeProvider provider(5);
    SynthesisQueueManager manager(make_config(2, ErrorStrategy::Retry), &provider,
                                  recorder.callbacks());

    for (int64_t seq = 0; seq < 6; ++seq) {
        ASSERT_EQ(manager.enqueue(chunk(seq, "sentence " + std::to_string(seq))), VXS_SUCCESS);
    }
    ASSERT_TRUE(manager.wait_until_idle(5000));

    EXPECT_EQ(recorder.completed_set(), std::set<int64_t>({0, 1, 2, 3, 4, 5}));
    EXPECT_EQ(recorder.completed[3].source_text, "sentence 3");
    EXPECT_EQ(std::string(recorder.completed[3].audio.begin(), recorder.completed[3].audio.end()),
              "sentence 3");
    EXPECT_TRUE(recorder.errors.empty());

    TaskStatus status;
    ASSERT_TRUE(manager.task_status(3, status));
    EXPECT_EQ(status, TaskStatus::Completed);
    EXPECT_FALSE(manager.task_status(42, status));
}

TEST(SynthesisQueueManager, NeverExceedsMaxConcurrent) {
    Recorder recorder;
    FakeProvider provider(20);
    SynthesisConfig config = make_config(2, ErrorStrategy::Retry);
    config.num_workers = 4;
    SynthesisQueueManager manager(config, &provider, recorder.callbacks());

    for (int64_t seq = 0; seq < 8; ++seq) {
        ASSERT_EQ(manager.enqueue(chunk(seq, "text " + std::to_string(seq))), VXS_SUCCESS);
    }
    ASSERT_TRUE(manager.wait_until_idle(5000));

    EXPECT_EQ(recorder.completed_set().size(), 8u);
    EXPECT_LE(provider.peak_in_flight(), 2);
    EXPECT_GE(provider.peak_in_flight(), 1);

    SynthesisStats stats = manager.stats();
    EXPECT_LE(stats.peak_in_flight, 2);
    EXPECT_EQ(stats.num_workers, 4);
    EXPECT_EQ(stats.total_completed, 8);
}

TEST(SynthesisQueueManager, AssignsSequenceNumbersWhenMissing) {
    Recorder recorder;
    FakeProvider provider;
    SynthesisQueueManager manager(make_config(1, ErrorStrategy::Skip), &provider,
                                  recorder.callbacks());

    TaskHandle handle;
    ASSERT_EQ(manager.enqueue(chunk(kNoSequence, "first"), &handle), VXS_SUCCESS);
    EXPECT_EQ(handle.sequence_number, 0);
    EXPECT_FALSE(handle.task_id.empty());

    ASSERT_EQ(manager.enqueue(chunk(5, "explicit")), VXS_SUCCESS);
    ASSERT_EQ(manager.enqueue(chunk(kNoSequence, "next"), &handle), VXS_SUCCESS);
    EXPECT_EQ(handle.sequence_number, 6);
    EXPECT_EQ(manager.last_sequence_number(), 6);

    ASSERT_TRUE(manager.wait_until_idle(2000));
}

TEST(SynthesisQueueManager, RejectsInvalidInput) {
    Recorder recorder;
    FakeProvider provider;
    SynthesisQueueManager manager(make_config(1, ErrorStrategy::Skip), &provider,
                                  recorder.callbacks());

    ASSERT_EQ(manager.enqueue(chunk(5, "five")), VXS_SUCCESS);
    EXPECT_EQ(manager.enqueue(chunk(5, "again")), VXS_ERROR_INVALID_SEQUENCE);
    EXPECT_EQ(manager.enqueue(chunk(3, "older")), VXS_ERROR_INVALID_SEQUENCE);
    EXPECT_EQ(manager.enqueue(chunk(6, "")), VXS_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(manager.enqueue(chunk(6, "   ")), VXS_ERROR_INVALID_ARGUMENT);

    ASSERT_TRUE(manager.wait_until_idle(2000));
    EXPECT_EQ(manager.stats().total_enqueued, 1);
}

TEST(SynthesisQueueManager, ForwardsVoiceAndTimeout) {
    Recorder recorder;
    FakeProvider provider;
    SynthesisConfig config = make_config(1, ErrorStrategy::Skip);
    config.voice.voice_id = "narrator";
    config.voice.speed = 1.25f;
    config.synthesis_timeout_ms = 1234;
    SynthesisQueueManager manager(config, &provider, recorder.callbacks());

    ASSERT_EQ(manager.enqueue(chunk(0, "hello")), VXS_SUCCESS);
    ASSERT_TRUE(manager.wait_until_idle(2000));

    EXPECT_EQ(provider.last_voice().voice_id, "narrator");
    EXPECT_FLOAT_EQ(provider.last_voice().speed, 1.25f);
    EXPECT_EQ(provider.last_timeout_ms(), 1234);
}

// =============================================================================
// ERROR STRATEGIES
// =============================================================================

TEST(SynthesisQueueManager, RetryRecoversTransparently) {
    Recorder recorder;
    FakeProvider provider(0, [](const std::string& text, int attempt) {
        return (text == "flaky" && attempt < 3) ? VXS_ERROR_SYNTHESIS_PROVIDER : VXS_SUCCESS;
    });
    SynthesisQueueManager manager(make_config(1, ErrorStrategy::Retry), &provider,
                                  recorder.callbacks(), recorder.emitter());

    ASSERT_EQ(manager.enqueue(chunk(0, "flaky")), VXS_SUCCESS);
    ASSERT_TRUE(manager.wait_until_idle(2000));

    EXPECT_EQ(recorder.completed_set(), std::set<int64_t>({0}));
    EXPECT_TRUE(recorder.errors.empty());
    EXPECT_EQ(provider.attempts("flaky"), 3);
    EXPECT_EQ(recorder.count_events(EventType::SynthesisRetry), 2);
    EXPECT_EQ(manager.stats().total_retries, 2);

    SynthesisTask task;
    ASSERT_TRUE(manager.task_info(0, task));
    EXPECT_EQ(task.retry_count, 2);
}

TEST(SynthesisQueueManager, RetryExhaustedReportsOneError) {
    Recorder recorder;
    FakeProvider provider(0, [](const std::string&, int) { return VXS_ERROR_SYNTHESIS_PROVIDER; });
    SynthesisQueueManager manager(make_config(1, ErrorStrategy::Retry), &provider,
                                  recorder.callbacks());

    ASSERT_EQ(manager.enqueue(chunk(0, "always fails")), VXS_SUCCESS);
    ASSERT_TRUE(manager.wait_until_idle(2000));

    EXPECT_TRUE(recorder.completed.empty());
    ASSERT_EQ(recorder.errors.size(), 1u);
    EXPECT_EQ(recorder.errors[0].code, VXS_ERROR_SYNTHESIS_PROVIDER);
    EXPECT_EQ(recorder.errors[0].attempts, 3);
    EXPECT_EQ(recorder.errors[0].sequence_number, 0);
    EXPECT_EQ(provider.attempts("always fails"), 3);

    TaskStatus status;
    ASSERT_TRUE(manager.task_status(0, status));
    EXPECT_EQ(status, TaskStatus::Failed);
}

TEST(SynthesisQueueManager, SkipReportsFailureAndContinues) {
    Recorder recorder;
    FakeProvider provider(0, [](const std::string& text, int) {
        return text == "bad" ? VXS_ERROR_SYNTHESIS_PROVIDER : VXS_SUCCESS;
    });
    SynthesisQueueManager manager(make_config(1, ErrorStrategy::Skip), &provider,
                                  recorder.callbacks());

    ASSERT_EQ(manager.enqueue(chunk(0, "good one")), VXS_SUCCESS);
    ASSERT_EQ(manager.enqueue(chunk(1, "bad")), VXS_SUCCESS);
    ASSERT_EQ(manager.enqueue(chunk(2, "good two")), VXS_SUCCESS);
    ASSERT_TRUE(manager.wait_until_idle(2000));

    EXPECT_EQ(recorder.completed_set(), std::set<int64_t>({0, 2}));
    ASSERT_EQ(recorder.errors.size(), 1u);
    EXPECT_EQ(recorder.errors.count(1), 1u);
    EXPECT_EQ(provider.attempts("bad"), 1);
}

TEST(SynthesisQueueManager, FallbackDropsRemainingWork) {
    Recorder recorder;
    FakeProvider provider(0, [](const std::string& text, int) {
        return text == "second fails" ? VXS_ERROR_SYNTHESIS_PROVIDER : VXS_SUCCESS;
    });
    provider.block("first");
    SynthesisQueueManager manager(make_config(1, ErrorStrategy::Fallback), &provider,
                                  recorder.callbacks(), recorder.emitter());

    ASSERT_EQ(manager.enqueue(chunk(0, "first")), VXS_SUCCESS);
    ASSERT_EQ(manager.enqueue(chunk(1, "second fails")), VXS_SUCCESS);
    ASSERT_EQ(manager.enqueue(chunk(2, "third")), VXS_SUCCESS);
    ASSERT_EQ(manager.enqueue(chunk(3, "fourth")), VXS_SUCCESS);
    ASSERT_TRUE(provider.wait_for_calls(1));
    provider.unblock("first");
    ASSERT_TRUE(manager.wait_until_idle(2000));

    EXPECT_EQ(recorder.completed_set(), std::set<int64_t>({0}));
    EXPECT_EQ(recorder.errors.count(1), 1u);
    EXPECT_EQ(recorder.cancelled_set(), std::set<int64_t>({2, 3}));
    ASSERT_EQ(recorder.fallbacks.size(), 1u);

    const FallbackRequest& request = recorder.fallbacks[0];
    EXPECT_EQ(request.failed_sequence_number, 1);
    EXPECT_EQ(request.dropped_sequence_numbers, std::vector<int64_t>({2, 3}));
    EXPECT_EQ(request.remaining_text, "second fails third fourth");
    EXPECT_EQ(provider.attempts("second fails"), 1);
    EXPECT_EQ(recorder.count_events(EventType::FallbackTriggered), 1);

    EXPECT_TRUE(manager.fallback_active());
    EXPECT_EQ(manager.enqueue(chunk(4, "late chunk")), VXS_ERROR_CANCELLED);

    // One plain request with the remaining text is accepted
    ASSERT_EQ(manager.submit_plain_request(chunk(5, request.remaining_text)), VXS_SUCCESS);
    EXPECT_EQ(manager.submit_plain_request(chunk(6, "another")), VXS_ERROR_INVALID_STATE);
    ASSERT_TRUE(manager.wait_until_idle(2000));

    EXPECT_EQ(recorder.completed_set(), std::set<int64_t>({0, 5}));
    EXPECT_EQ(recorder.completed[5].source_text, "second fails third fourth");
}

TEST(SynthesisQueueManager, PlainRequestRejectedWithoutFallback) {
    Recorder recorder;
    FakeProvider provider;
    SynthesisQueueManager manager(make_config(1, ErrorStrategy::Fallback), &provider,
                                  recorder.callbacks());

    EXPECT_EQ(manager.submit_plain_request(chunk(0, "everything")), VXS_ERROR_INVALID_STATE);
}

TEST(SynthesisQueueManager, TimeoutIsReportedAsSynthesisTimeout) {
    Recorder recorder;
    FakeProvider provider(60);
    SynthesisConfig config = make_config(1, ErrorStrategy::Skip);
    config.synthesis_timeout_ms = 20;
    SynthesisQueueManager manager(config, &provider, recorder.callbacks());

    ASSERT_EQ(manager.enqueue(chunk(0, "slow")), VXS_SUCCESS);
    ASSERT_TRUE(manager.wait_until_idle(2000));

    EXPECT_TRUE(recorder.completed.empty());
    ASSERT_EQ(recorder.errors.count(0), 1u);
    EXPECT_EQ(recorder.errors[0].code, VXS_ERROR_SYNTHESIS_TIMEOUT);
}

TEST(SynthesisQueueManager, DeadlineHoldsWhenProviderIgnoresIt) {
    Recorder recorder;
    FakeProvider provider;
    provider.block("stalled");
    SynthesisConfig config = make_config(1, ErrorStrategy::Skip);
    config.synthesis_timeout_ms = 50;
    SynthesisQueueManager manager(config, &provider, recorder.callbacks());

    auto start = std::chrono::steady_clock::now();
    ASSERT_EQ(manager.enqueue(chunk(0, "stalled")), VXS_SUCCESS);
    ASSERT_EQ(manager.enqueue(chunk(1, "next")), VXS_SUCCESS);

    // The stalled call is still blocked inside the provider here
    ASSERT_TRUE(manager.wait_until_idle(1000));
    auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    EXPECT_LT(waited.count(), 1000);

    {
        std::lock_guard<std::mutex> lock(recorder.mutex);
        ASSERT_EQ(recorder.errors.count(0), 1u);
        EXPECT_EQ(recorder.errors[0].code, VXS_ERROR_SYNTHESIS_TIMEOUT);
    }
    EXPECT_EQ(recorder.completed_set(), std::set<int64_t>({1}));

    provider.unblock("stalled");
    manager.shutdown();
    EXPECT_EQ(recorder.completed_set(), std::set<int64_t>({1}));
}

TEST(SynthesisQueueManager, ProviderExceptionBecomesError) {
    Recorder recorder;
    FakeProvider provider(0, [](const std::string&, int) -> vxs_result_t {
        throw std::runtime_error("engine crashed");
    });
    SynthesisQueueManager manager(make_config(1, ErrorStrategy::Skip), &provider,
                                  recorder.callbacks());

    ASSERT_EQ(manager.enqueue(chunk(0, "boom")), VXS_SUCCESS);
    ASSERT_TRUE(manager.wait_until_idle(2000));

    ASSERT_EQ(recorder.errors.count(0), 1u);
    EXPECT_EQ(recorder.errors[0].code, VXS_ERROR_SYNTHESIS_PROVIDER);
    EXPECT_NE(recorder.errors[0].message.find("engine crashed"), std::string::npos);
}

// =============================================================================
// CANCELLATION
// =============================================================================

TEST(SynthesisQueueManager, CancelAllDiscardsInFlightResults) {
    Recorder recorder;
    FakeProvider provider;
    provider.block("a");
    SynthesisQueueManager manager(make_config(1, ErrorStrategy::Retry), &provider,
                                  recorder.callbacks());

    ASSERT_EQ(manager.enqueue(chunk(0, "a")), VXS_SUCCESS);
    ASSERT_EQ(manager.enqueue(chunk(1, "b")), VXS_SUCCESS);
    ASSERT_EQ(manager.enqueue(chunk(2, "c")), VXS_SUCCESS);
    ASSERT_TRUE(provider.wait_for_calls(1));

    EXPECT_EQ(manager.cancel_all(), 3);
    provider.unblock("a");
    ASSERT_TRUE(manager.wait_until_idle(2000));

    EXPECT_TRUE(recorder.completed.empty());
    EXPECT_EQ(recorder.cancelled_set(), std::set<int64_t>({0, 1, 2}));
    EXPECT_EQ(provider.calls(), std::vector<std::string>({"a"}));

    TaskStatus status;
    ASSERT_TRUE(manager.task_status(0, status));
    EXPECT_EQ(status, TaskStatus::Cancelled);
    EXPECT_EQ(manager.stats().total_cancelled, 3);
}

TEST(SynthesisQueueManager, CancelPendingLetsInFlightFinish) {
    Recorder recorder;
    FakeProvider provider;
    provider.block("a");
    SynthesisQueueManager manager(make_config(1, ErrorStrategy::Retry), &provider,
                                  recorder.callbacks());

    ASSERT_EQ(manager.enqueue(chunk(0, "a")), VXS_SUCCESS);
    ASSERT_EQ(manager.enqueue(chunk(1, "b")), VXS_SUCCESS);
    ASSERT_EQ(manager.enqueue(chunk(2, "c")), VXS_SUCCESS);
    ASSERT_TRUE(provider.wait_for_calls(1));

    EXPECT_EQ(manager.cancel_pending(), 2);
    provider.unblock("a");
    ASSERT_TRUE(manager.wait_until_idle(2000));

    EXPECT_EQ(recorder.completed_set(), std::set<int64_t>({0}));
    EXPECT_EQ(recorder.cancelled_set(), std::set<int64_t>({1, 2}));
}

TEST(SynthesisQueueManager, CancelAfterKeepsOldestQueued) {
    Recorder recorder;
    FakeProvider provider;
    provider.block("a");
    SynthesisQueueManager manager(make_config(1, ErrorStrategy::Retry), &provider,
                                  recorder.callbacks());

    ASSERT_EQ(manager.enqueue(chunk(0, "a")), VXS_SUCCESS);
    ASSERT_EQ(manager.enqueue(chunk(1, "b")), VXS_SUCCESS);
    ASSERT_EQ(manager.enqueue(chunk(2, "c")), VXS_SUCCESS);
    ASSERT_EQ(manager.enqueue(chunk(3, "d")), VXS_SUCCESS);
    ASSERT_TRUE(provider.wait_for_calls(1));

    EXPECT_EQ(manager.cancel_after(1), 2);
    provider.unblock("a");
    ASSERT_TRUE(manager.wait_until_idle(2000));

    EXPECT_EQ(recorder.completed_set(), std::set<int64_t>({0, 1}));
    EXPECT_EQ(recorder.cancelled_set(), std::set<int64_t>({2, 3}));
}

TEST(SynthesisQueueManager, ShutdownRejectsNewWork) {
    Recorder recorder;
    FakeProvider provider;
    SynthesisQueueManager manager(make_config(2, ErrorStrategy::Retry), &provider,
                                  recorder.callbacks());

    manager.shutdown();
    EXPECT_EQ(manager.enqueue(chunk(0, "too late")), VXS_ERROR_NOT_RUNNING);
    EXPECT_FALSE(manager.stats().running);
    manager.shutdown();
}

TEST(SynthesisQueueManager, StatsSerializeToJson) {
    Recorder recorder;
    FakeProvider provider;
    SynthesisQueueManager manager(make_config(2, ErrorStrategy::Retry), &provider,
                                  recorder.callbacks());
    ASSERT_EQ(manager.enqueue(chunk(0, "one")), VXS_SUCCESS);
    ASSERT_TRUE(manager.wait_until_idle(2000));

    nlohmann::json json = manager.stats().to_json();
    EXPECT_EQ(json["max_concurrent"], 2);
    EXPECT_EQ(json["total_enqueued"], 1);
    EXPECT_EQ(json["total_completed"], 1);
    EXPECT_EQ(json["in_flight"], 0);
    EXPECT_FALSE(json["fallback_active"].get<bool>());
}
