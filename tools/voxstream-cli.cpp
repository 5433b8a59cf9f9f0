/**
 * @file voxstream-cli.cpp
 * @brief VoxStream CLI - Stream text through a speech session
 *
 * Feeds text to a SpeechSession in small deltas, the way an LLM client
 * would, using a tone-generating synthesis provider and a WAV file sink.
 * Useful for exercising chunking, concurrency and interruption settings
 * without a real TTS service.
 *
 * Usage:
 *   voxstream-cli [options] [--text "..." | --file <path>]
 *
 * Options:
 *   --text, -t <text>          Text to speak (default: read stdin)
 *   --file, -f <path>          Read text from a file
 *   --config, -c <path>        JSON session configuration
 *   --output, -o <path>        Output WAV file (default: voxstream-out.wav)
 *   --delta-size <n>           Characters per delta (default: 4)
 *   --delta-delay-ms <n>       Delay between deltas (default: 20)
 *   --synth-ms-per-char <n>    Simulated synthesis latency (default: 2)
 *   --fail-every <n>           Fail every n-th synthesis call (default: never)
 *   --interrupt-after-ms <n>   Interrupt the session after n ms
 *   --strategy <name>          immediate | graceful | drain
 *   --min-chunk <n>            Minimum chunk length
 *   --max-concurrent <n>       Concurrent synthesis requests
 *   --error-strategy <name>    skip | retry | fallback
 *   --realtime                 Sink blocks for the audio duration
 *   --verbose, -v              Enable debug logging
 *   --help, -h                 Show this help message
 *
 * Environment Variables:
 *   STREAMING_*                Applied after --config, before other flags
 */

#include "voxstream/core/vxs_audio_utils.h"
#include "voxstream/core/vxs_logger.h"
#include "voxstream/streaming/speech_session.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace voxstream;
using namespace voxstream::streaming;

// =============================================================================
// SIGNAL HANDLING
// =============================================================================

static volatile sig_atomic_t g_shouldStop = 0;

static void signalHandler(int signum) {
    (void)signum;
    g_shouldStop = 1;
}

// =============================================================================
// TONE PROVIDER
// =============================================================================

// Stands in for a TTS service: a short sine tone per chunk, length
// proportional to the text
class ToneSynthesisProvider : public SynthesisProvider {
   public:
    ToneSynthesisProvider(int32_t msPerChar, int32_t failEvery)
        : msPerChar_(msPerChar), failEvery_(failEvery) {}

    vxs_result_t synthesize(const std::string& text, const VoiceParams& voice, int32_t timeout_ms,
                            std::vector<uint8_t>& audio_out) override {
        int64_t call = ++calls_;
        int64_t delay = static_cast<int64_t>(msPerChar_) * static_cast<int64_t>(text.size());
        if (delay > timeout_ms) {
            std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms));
            return VXS_ERROR_SYNTHESIS_TIMEOUT;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(delay));

        if (failEvery_ > 0 && call % failEvery_ == 0) {
            return VXS_ERROR_SYNTHESIS_PROVIDER;
        }

        const double durationSec = std::max(0.15, 0.045 * text.size() / voice.speed);
        const size_t numSamples = static_cast<size_t>(durationSec * kSampleRate);
        const double frequency = 220.0 + 20.0 * static_cast<double>(text.size() % 12);

        std::vector<int16_t> samples(numSamples);
        for (size_t i = 0; i < numSamples; ++i) {
            double t = static_cast<double>(i) / kSampleRate;
            samples[i] = static_cast<int16_t>(6000.0 * std::sin(kTwoPi * frequency * t));
        }
        return int16_to_wav(samples, kSampleRate, audio_out);
    }

    const char* name() const override { return "tone"; }

    static constexpr int32_t kSampleRate = 22050;

   private:
    static constexpr double kTwoPi = 6.283185307179586;

    int32_t msPerChar_;
    int32_t failEvery_;
    std::atomic<int64_t> calls_{0};
};

// =============================================================================
// WAV FILE SINK
// =============================================================================

class WavFileSink : public AudioSink {
   public:
    explicit WavFileSink(bool realtime) : realtime_(realtime) {}

    vxs_result_t play(const AudioSegment& segment, const std::atomic<bool>& stop_flag) override {
        WavInfo info;
        if (parse_wav_header(segment.audio, info) != VXS_SUCCESS || info.bits_per_sample != 16) {
            return VXS_ERROR_PLAYBACK_SINK;
        }
        stopRequested_.store(false);

        const size_t numSamples = info.data_size / 2;
        const uint8_t* data = segment.audio.data() + info.data_offset;
        const size_t samplesPer10ms = static_cast<size_t>(info.sample_rate / 100);

        // Write in 10 ms blocks so an interruption cuts the segment short
        for (size_t offset = 0; offset < numSamples; offset += samplesPer10ms) {
            if (stop_flag.load() || stopRequested_.load()) {
                break;
            }
            size_t end = std::min(numSamples, offset + samplesPer10ms);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                for (size_t i = offset; i < end; ++i) {
                    pcm_.push_back(static_cast<int16_t>(data[i * 2] | (data[i * 2 + 1] << 8)));
                }
            }
            if (realtime_) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
        }
        return VXS_SUCCESS;
    }

    void stop() override { stopRequested_.store(true); }

    const char* name() const override { return "wav-file"; }

    bool save(const std::string& path) {
        std::vector<uint8_t> wav;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (int16_to_wav(pcm_, ToneSynthesisProvider::kSampleRate, wav) != VXS_SUCCESS) {
                return false;
            }
        }
        std::ofstream file(path, std::ios::binary);
        if (!file.is_open()) {
            return false;
        }
        file.write(reinterpret_cast<const char*>(wav.data()),
                   static_cast<std::streamsize>(wav.size()));
        return file.good();
    }

   private:
    bool realtime_;
    std::atomic<bool> stopRequested_{false};
    std::mutex mutex_;
    std::vector<int16_t> pcm_;
};

// =============================================================================
// ARGUMENT PARSING
// =============================================================================

struct CliOptions {
    std::string text;
    std::string textFile;
    std::string configPath;
    std::string outputPath = "voxstream-out.wav";
    int32_t deltaSize = 4;
    int32_t deltaDelayMs = 20;
    int32_t synthMsPerChar = 2;
    int32_t failEvery = 0;
    int32_t interruptAfterMs = -1;
    std::string strategy;
    int32_t minChunk = -1;
    int32_t maxConcurrent = -1;
    std::string errorStrategy;
    bool realtime = false;
    bool verbose = false;
    bool showHelp = false;
};

static void printUsage(const char* programName) {
    printf("VoxStream CLI - stream text through a speech session\n\n");
    printf("Usage: %s [options] [--text \"...\" | --file <path>]\n\n", programName);
    printf("Options:\n");
    printf("  --text, -t <text>          Text to speak (default: read stdin)\n");
    printf("  --file, -f <path>          Read text from a file\n");
    printf("  --config, -c <path>        JSON session configuration\n");
    printf("  --output, -o <path>        Output WAV file (default: voxstream-out.wav)\n");
    printf("  --delta-size <n>           Characters per delta (default: 4)\n");
    printf("  --delta-delay-ms <n>       Delay between deltas (default: 20)\n");
    printf("  --synth-ms-per-char <n>    Simulated synthesis latency (default: 2)\n");
    printf("  --fail-every <n>           Fail every n-th synthesis call\n");
    printf("  --interrupt-after-ms <n>   Interrupt the session after n ms\n");
    printf("  --strategy <name>          immediate | graceful | drain\n");
    printf("  --min-chunk <n>            Minimum chunk length\n");
    printf("  --max-concurrent <n>       Concurrent synthesis requests\n");
    printf("  --error-strategy <name>    skip | retry | fallback\n");
    printf("  --realtime                 Sink blocks for the audio duration\n");
    printf("  --verbose, -v              Enable debug logging\n");
    printf("  --help, -h                 Show this help message\n\n");
    printf("Example:\n");
    printf("  %s -t \"Hello there. This is a test.\" --max-concurrent 2 -o hello.wav\n\n",
           programName);
}

static CliOptions parseArgs(int argc, char* argv[]) {
    CliOptions opts;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            opts.showHelp = true;
        } else if (std::strcmp(arg, "--verbose") == 0 || std::strcmp(arg, "-v") == 0) {
            opts.verbose = true;
        } else if (std::strcmp(arg, "--realtime") == 0) {
            opts.realtime = true;
        } else if ((std::strcmp(arg, "--text") == 0 || std::strcmp(arg, "-t") == 0) &&
                   i + 1 < argc) {
            opts.text = argv[++i];
        } else if ((std::strcmp(arg, "--file") == 0 || std::strcmp(arg, "-f") == 0) &&
                   i + 1 < argc) {
            opts.textFile = argv[++i];
        } else if ((std::strcmp(arg, "--config") == 0 || std::strcmp(arg, "-c") == 0) &&
                   i + 1 < argc) {
            opts.configPath = argv[++i];
        } else if ((std::strcmp(arg, "--output") == 0 || std::strcmp(arg, "-o") == 0) &&
                   i + 1 < argc) {
            opts.outputPath = argv[++i];
        } else if (std::strcmp(arg, "--delta-size") == 0 && i + 1 < argc) {
            opts.deltaSize = std::atoi(argv[++i]);
        } else if (std::strcmp(arg, "--delta-delay-ms") == 0 && i + 1 < argc) {
            opts.deltaDelayMs = std::atoi(argv[++i]);
        } else if (std::strcmp(arg, "--synth-ms-per-char") == 0 && i + 1 < argc) {
            opts.synthMsPerChar = std::atoi(argv[++i]);
        } else if (std::strcmp(arg, "--fail-every") == 0 && i + 1 < argc) {
            opts.failEvery = std::atoi(argv[++i]);
        } else if (std::strcmp(arg, "--interrupt-after-ms") == 0 && i + 1 < argc) {
            opts.interruptAfterMs = std::atoi(argv[++i]);
        } else if (std::strcmp(arg, "--strategy") == 0 && i + 1 < argc) {
            opts.strategy = argv[++i];
        } else if (std::strcmp(arg, "--min-chunk") == 0 && i + 1 < argc) {
            opts.minChunk = std::atoi(argv[++i]);
        } else if (std::strcmp(arg, "--max-concurrent") == 0 && i + 1 < argc) {
            opts.maxConcurrent = std::atoi(argv[++i]);
        } else if (std::strcmp(arg, "--error-strategy") == 0 && i + 1 < argc) {
            opts.errorStrategy = argv[++i];
        } else {
            fprintf(stderr, "Warning: ignoring unknown argument '%s'\n", arg);
        }
    }

    return opts;
}

static bool loadText(const CliOptions& opts, std::string& text) {
    if (!opts.text.empty()) {
        text = opts.text;
        return true;
    }
    if (!opts.textFile.empty()) {
        std::ifstream file(opts.textFile);
        if (!file.is_open()) {
            return false;
        }
        std::stringstream ss;
        ss << file.rdbuf();
        text = ss.str();
        return true;
    }
    text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    return true;
}

static bool buildConfig(const CliOptions& opts, StreamingConfig& config) {
    std::string error;
    if (!opts.configPath.empty() &&
        StreamingConfig::load_file(opts.configPath, config, &error) != VXS_SUCCESS) {
        fprintf(stderr, "Error: %s\n", error.c_str());
        return false;
    }
    if (StreamingConfig::apply_env(config, &error) != VXS_SUCCESS) {
        fprintf(stderr, "Error: %s\n", error.c_str());
        return false;
    }

    if (opts.minChunk >= 0) config.parser.min_chunk_length = opts.minChunk;
    if (opts.maxConcurrent > 0) config.synthesis.max_concurrent = opts.maxConcurrent;
    if (!opts.errorStrategy.empty() &&
        !parse_error_strategy(opts.errorStrategy, config.synthesis.error_strategy)) {
        fprintf(stderr, "Error: unknown error strategy '%s'\n", opts.errorStrategy.c_str());
        return false;
    }
    if (!opts.strategy.empty() &&
        !parse_interruption_strategy(opts.strategy, config.playback.interruption_strategy)) {
        fprintf(stderr, "Error: unknown interruption strategy '%s'\n", opts.strategy.c_str());
        return false;
    }

    if (config.validate(&error) != VXS_SUCCESS) {
        fprintf(stderr, "Error: %s\n", error.c_str());
        return false;
    }
    return true;
}

// =============================================================================
// MAIN
// =============================================================================

int main(int argc, char* argv[]) {
    CliOptions opts = parseArgs(argc, argv);

    if (opts.showHelp) {
        printUsage(argv[0]);
        return 0;
    }

    Logger::instance().setMinLevel(opts.verbose ? LogLevel::Debug : LogLevel::Warning);

    std::string text;
    if (!loadText(opts, text)) {
        fprintf(stderr, "Error: cannot read %s\n", opts.textFile.c_str());
        return 1;
    }
    if (text.empty()) {
        fprintf(stderr, "Error: no input text\n\n");
        printUsage(argv[0]);
        return 1;
    }

    StreamingConfig config;
    if (!buildConfig(opts, config)) {
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    ToneSynthesisProvider provider(opts.synthMsPerChar, opts.failEvery);
    WavFileSink sink(opts.realtime);

    auto start = std::chrono::steady_clock::now();
    auto elapsedMs = [&start]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::steady_clock::now() - start)
            .count();
    };

    SessionCallbacks callbacks;
    callbacks.on_segment_played = [&elapsedMs](const PlaybackMetadata& metadata) {
        printf("[%6lld ms] #%lld %s\n", static_cast<long long>(elapsedMs()),
               static_cast<long long>(metadata.sequence_number), metadata.source_text.c_str());
        fflush(stdout);
    };
    callbacks.on_error = [](const StreamingError& error) {
        fprintf(stderr, "  ! %s\n", error.to_string().c_str());
    };
    callbacks.on_fallback = [](const FallbackRequest& request) {
        fprintf(stderr, "  ! fallback after #%lld, %zu chunk(s) dropped\n",
                static_cast<long long>(request.failed_sequence_number),
                request.dropped_sequence_numbers.size());
    };

    SpeechSession session(config, &provider, &sink, callbacks);
    vxs_result_t result = session.initialize();
    if (VXS_FAILED(result)) {
        fprintf(stderr, "Error: session failed to start (%s)\n", vxs_result_to_string(result));
        return 1;
    }

    printf("Session %s: %zu chars, delta %d every %d ms\n", session.session_id().c_str(),
           text.size(), opts.deltaSize, opts.deltaDelayMs);

    std::atomic<bool> interrupted{false};
    std::mutex doneMutex;
    std::condition_variable doneCv;
    bool done = false;
    std::thread interrupter;
    if (opts.interruptAfterMs >= 0) {
        interrupter = std::thread([&]() {
            std::unique_lock<std::mutex> lock(doneMutex);
            if (doneCv.wait_for(lock, std::chrono::milliseconds(opts.interruptAfterMs),
                                [&done] { return done; })) {
                return;
            }
            lock.unlock();
            interrupted.store(true);
            int32_t dropped = session.interrupt();
            printf("[%6lld ms] interrupted, %d item(s) dropped\n",
                   static_cast<long long>(elapsedMs()), dropped);
        });
    }

    // Stream the text the way a token producer would
    size_t step = static_cast<size_t>(std::max(opts.deltaSize, 1));
    for (size_t pos = 0; pos < text.size() && !interrupted.load(); pos += step) {
        if (g_shouldStop) {
            session.interrupt(InterruptionStrategy::Immediate);
            break;
        }
        if (session.feed(text.substr(pos, step)) != VXS_SUCCESS) {
            break;
        }
        if (opts.deltaDelayMs > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(opts.deltaDelayMs));
        }
    }
    result = session.finish();
    if (VXS_FAILED(result)) {
        VXS_LOG_DEBUG("CLI", "finish skipped: session is %s", session.state_string().c_str());
    }

    while (!session.wait_until_done(100)) {
        if (g_shouldStop) {
            session.interrupt(InterruptionStrategy::Immediate);
        }
    }
    {
        std::lock_guard<std::mutex> lock(doneMutex);
        done = true;
    }
    doneCv.notify_all();
    if (interrupter.joinable()) {
        interrupter.join();
    }

    printf("\n%s\n", session.stats().dump(2).c_str());

    if (!sink.save(opts.outputPath)) {
        fprintf(stderr, "Warning: nothing written to %s\n", opts.outputPath.c_str());
        return session.state() == SessionState::Failed ? 1 : 0;
    }
    printf("Wrote %s\n", opts.outputPath.c_str());
    return session.state() == SessionState::Failed ? 1 : 0;
}
