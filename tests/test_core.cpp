/**
 * @file test_core.cpp
 * @brief Tests for result codes, errors, logging, events, latency stats and WAV helpers
 */

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "voxstream/core/vxs_audio_utils.h"
#include "voxstream/core/vxs_error.h"
#include "voxstream/core/vxs_events.h"
#include "voxstream/core/vxs_latency_stats.h"
#include "voxstream/core/vxs_logger.h"
#include "voxstream/core/vxs_util.h"
#include "voxstream/streaming/metrics_recorder.h"

using namespace voxstream;

namespace {

struct CapturedLog {
    LogLevel level;
    std::string category;
    std::string message;
};

void capture_log(LogLevel level, const char* category, const char* message, void* user_data) {
    auto* logs = static_cast<std::vector<CapturedLog>*>(user_data);
    logs->push_back({level, category, message});
}

}  // namespace

// =============================================================================
// RESULT CODES AND ERRORS
// =============================================================================

TEST(ResultCodes, NamesAndMacros) {
    EXPECT_STREQ(vxs_result_to_string(VXS_SUCCESS), "SUCCESS");
    EXPECT_STREQ(vxs_result_to_string(VXS_ERROR_PARSE_BUFFER_OVERFLOW), "PARSE_BUFFER_OVERFLOW");
    EXPECT_STREQ(vxs_result_to_string(VXS_ERROR_SYNTHESIS_TIMEOUT), "SYNTHESIS_TIMEOUT");
    EXPECT_STREQ(vxs_result_to_string(VXS_ERROR_CANCELLED), "CANCELLED");
    EXPECT_STREQ(vxs_result_to_string(-12345), "UNKNOWN_ERROR");

    EXPECT_TRUE(VXS_SUCCEEDED(VXS_SUCCESS));
    EXPECT_TRUE(VXS_FAILED(VXS_ERROR_INVALID_SEQUENCE));
}

TEST(StreamingError, CategoryFollowsCodeRange) {
    EXPECT_EQ(error_category_for(VXS_SUCCESS), ErrorCategory::None);
    EXPECT_EQ(error_category_for(VXS_ERROR_PARSE_BUFFER_OVERFLOW), ErrorCategory::Parser);
    EXPECT_EQ(error_category_for(VXS_ERROR_SYNTHESIS_PROVIDER), ErrorCategory::Synthesis);
    EXPECT_EQ(error_category_for(VXS_ERROR_PLAYBACK_SINK), ErrorCategory::Playback);
    EXPECT_EQ(error_category_for(VXS_ERROR_INVALID_CONFIG), ErrorCategory::Config);
    EXPECT_EQ(error_category_for(VXS_ERROR_CANCELLED), ErrorCategory::Control);
}

TEST(StreamingError, ToStringIncludesSequenceAndMessage) {
    StreamingError error = make_error(VXS_ERROR_SYNTHESIS_TIMEOUT, "provider took too long", 4);
    EXPECT_EQ(error.to_string(), "[Synthesis] SYNTHESIS_TIMEOUT (seq 4): provider took too long");
    EXPECT_FALSE(error.ok());
    EXPECT_FALSE(error.is_cancellation());

    StreamingError cancelled = make_error(VXS_ERROR_CANCELLED, "");
    EXPECT_EQ(cancelled.to_string(), "[Control] CANCELLED");
    EXPECT_TRUE(cancelled.is_cancellation());

    EXPECT_TRUE(StreamingError().ok());
}

// =============================================================================
// LOGGER
// =============================================================================

TEST(Logger, RoutesToCallbackAboveMinLevel) {
    std::vector<CapturedLog> logs;
    Logger& logger = Logger::instance();
    LogLevel previous = logger.minLevel();
    logger.setCallback(capture_log, &logs);
    logger.setMinLevel(LogLevel::Warning);

    VXS_LOG_INFO("Test", "dropped %d", 1);
    VXS_LOG_WARNING("Test", "kept %d of %s", 2, "three");
    VXS_LOG_ERROR("Other", "also kept");

    logger.setCallback(nullptr);
    logger.setMinLevel(previous);

    ASSERT_EQ(logs.size(), 2u);
    EXPECT_EQ(logs[0].level, LogLevel::Warning);
    EXPECT_EQ(logs[0].category, "Test");
    EXPECT_EQ(logs[0].message, "kept 2 of three");
    EXPECT_EQ(logs[1].level, LogLevel::Error);
    EXPECT_EQ(logs[1].category, "Other");
}

TEST(Logger, LevelNames) {
    EXPECT_STREQ(log_level_to_string(LogLevel::Debug), "DEBUG");
    EXPECT_STREQ(log_level_to_string(LogLevel::Warning), "WARN");
}

// =============================================================================
// EVENTS
// =============================================================================

TEST(EventEmitter, StampsSessionAndTimestamp) {
    std::vector<StreamingEvent> events;
    EventEmitter emitter("abc", [&events](const StreamingEvent& event) {
        events.push_back(event);
    });
    EXPECT_TRUE(emitter.enabled());

    emitter.synthesis_failed(7, VXS_ERROR_SYNTHESIS_PROVIDER, "engine down", 2);
    emitter.interruption_triggered("drain", 3);

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].type, EventType::SynthesisFailed);
    EXPECT_EQ(events[0].session_id, "abc");
    EXPECT_EQ(events[0].sequence_number, 7);
    EXPECT_EQ(events[0].attempt, 2);
    EXPECT_EQ(events[0].error_code, VXS_ERROR_SYNTHESIS_PROVIDER);
    EXPECT_EQ(events[0].detail, "engine down");
    EXPECT_GT(events[0].timestamp_ms, 0);
    EXPECT_EQ(events[1].count, 3);
    EXPECT_STREQ(event_type_to_string(events[1].type), "interruption_triggered");
}

TEST(EventEmitter, DisabledAndThrowingCallbacksAreHarmless) {
    EventEmitter disabled;
    EXPECT_FALSE(disabled.enabled());
    disabled.chunk_detected(0, "nothing listens");

    EventEmitter throwing("s", [](const StreamingEvent&) { throw std::runtime_error("bad sink"); });
    EXPECT_NO_THROW(throwing.chunk_detected(0, "text"));
}

// =============================================================================
// LATENCY STATS
// =============================================================================

TEST(LatencyStats, NearestRankPercentiles) {
    LatencyStats stats;
    for (int i = 100; i >= 1; --i) {
        stats.record(static_cast<double>(i));
    }

    LatencySummary summary;
    ASSERT_EQ(stats.get_summary(summary), VXS_SUCCESS);
    EXPECT_EQ(summary.count, 100);
    EXPECT_DOUBLE_EQ(summary.p50_ms, 50.0);
    EXPECT_DOUBLE_EQ(summary.p95_ms, 95.0);
    EXPECT_DOUBLE_EQ(summary.p99_ms, 99.0);
    EXPECT_DOUBLE_EQ(summary.min_ms, 1.0);
    EXPECT_DOUBLE_EQ(summary.max_ms, 100.0);
    EXPECT_DOUBLE_EQ(summary.mean_ms, 50.5);
}

TEST(LatencyStats, CountsOutliers) {
    LatencyStats stats;
    for (int i = 0; i < 9; ++i) {
        stats.record(10.0);
    }
    stats.record(100.0);

    LatencySummary summary;
    ASSERT_EQ(stats.get_summary(summary), VXS_SUCCESS);
    EXPECT_DOUBLE_EQ(summary.mean_ms, 19.0);
    EXPECT_DOUBLE_EQ(summary.stddev_ms, 27.0);
    EXPECT_EQ(summary.outlier_count, 1);
}

TEST(LatencyStats, EmptyAndReset) {
    LatencyStats stats;
    LatencySummary summary;
    EXPECT_EQ(stats.get_summary(summary), VXS_ERROR_INVALID_STATE);
    EXPECT_EQ(stats.to_json()["count"], 0);

    stats.record(5.0);
    stats.record(-1.0);
    EXPECT_EQ(stats.count(), 1);

    stats.reset();
    EXPECT_EQ(stats.count(), 0);
}

TEST(MetricsRecorder, AggregatesEvents) {
    streaming::MetricsRecorder metrics;
    EventEmitter emitter("m", metrics.callback());

    StreamingEvent chunk;
    chunk.type = EventType::ChunkDetected;
    chunk.timestamp_ms = 1000;
    emitter.emit(chunk);

    emitter.synthesis_completed(0, 120.0, 1);
    emitter.synthesis_completed(1, 80.0, 1);

    StreamingEvent wait;
    wait.type = EventType::PlaybackQueueWait;
    wait.timestamp_ms = 1250;
    wait.duration_ms = 3.0;
    emitter.emit(wait);

    EXPECT_EQ(metrics.count(EventType::ChunkDetected), 1);
    EXPECT_EQ(metrics.count(EventType::SynthesisCompleted), 2);
    EXPECT_EQ(metrics.count(EventType::SynthesisRetry), 0);
    EXPECT_DOUBLE_EQ(metrics.first_audio_latency_ms(), 250.0);
    EXPECT_EQ(metrics.synthesis_latency().count(), 2);

    nlohmann::json json = metrics.to_json();
    EXPECT_EQ(json["chunks_detected"], 1);
    EXPECT_EQ(json["events"]["synthesis_completed"], 2);
    EXPECT_DOUBLE_EQ(json["synthesis_latency"]["max_ms"].get<double>(), 120.0);

    metrics.reset();
    EXPECT_EQ(metrics.count(EventType::ChunkDetected), 0);
    EXPECT_DOUBLE_EQ(metrics.first_audio_latency_ms(), 0.0);
}

// =============================================================================
// UTILITIES
// =============================================================================

TEST(Util, GeneratedIdsArePrefixedAndUnique) {
    std::string a = generate_id("tts-");
    std::string b = generate_id("tts-");
    EXPECT_EQ(a.rfind("tts-", 0), 0u);
    EXPECT_EQ(a.size(), 4u + 16u);
    EXPECT_NE(a, b);
}

TEST(AudioUtils, WavHeaderRoundTrip) {
    std::vector<int16_t> samples(22050, 0);
    samples[1] = -2;

    std::vector<uint8_t> wav;
    ASSERT_EQ(int16_to_wav(samples, 22050, wav), VXS_SUCCESS);
    ASSERT_EQ(wav.size(), kWavHeaderSize + samples.size() * 2);
    EXPECT_EQ(std::string(wav.begin(), wav.begin() + 4), "RIFF");
    EXPECT_EQ(wav[kWavHeaderSize + 2], 0xFE);
    EXPECT_EQ(wav[kWavHeaderSize + 3], 0xFF);

    WavInfo info;
    ASSERT_EQ(parse_wav_header(wav, info), VXS_SUCCESS);
    EXPECT_EQ(info.sample_rate, 22050);
    EXPECT_EQ(info.channels, 1);
    EXPECT_EQ(info.bits_per_sample, 16);
    EXPECT_EQ(info.data_size, samples.size() * 2);
    EXPECT_DOUBLE_EQ(info.duration_ms(), 1000.0);
}

TEST(AudioUtils, RejectsInvalidInput) {
    std::vector<uint8_t> wav;
    EXPECT_EQ(int16_to_wav({}, 16000, wav), VXS_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(int16_to_wav({1, 2, 3}, 0, wav), VXS_ERROR_INVALID_ARGUMENT);

    WavInfo info;
    std::vector<uint8_t> truncated(10, 0);
    EXPECT_EQ(parse_wav_header(truncated, info), VXS_ERROR_INVALID_ARGUMENT);

    std::vector<uint8_t> not_wav(64, 'x');
    EXPECT_EQ(parse_wav_header(not_wav, info), VXS_ERROR_INVALID_ARGUMENT);
}
