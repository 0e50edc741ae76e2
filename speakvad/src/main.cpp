#include "speakvad.h"
#include "vad_model.h"
#include "vad_worker.h"
#include "wav_file.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

using namespace speakvad;

static std::atomic<bool> g_stop_requested{false};

static void handle_sigint(int) {
    g_stop_requested.store(true);
}

struct CliOptions {
    std::string audio_path;
    std::string output_path;
    const char* vad_model = nullptr;
    StreamingVadConfig vad;
    int chunk_ms = 100;
    int n_threads = 1;
    double duration_s = 0.0;  // 0 = whole file
    int queue_chunks = 64;
    bool oneshot = false;
    bool async = false;
    bool realtime = false;
    bool use_gpu = false;
    bool verbose = false;
    bool quiet = false;
    bool no_prints = false;
};

struct LiveState {
    bool last_is_speech = false;
    const LogContext* log = nullptr;
};

static void print_usage(const char* program) {
    fprintf(stderr, "Usage: %s <audio.wav> --vad-model <path> [options]\n", program);
    fprintf(stderr, "\n");
    fprintf(stderr, "Positional arguments:\n");
    fprintf(stderr, "  audio.wav                Input audio (16-bit PCM mono WAV, any sample rate)\n");
    fprintf(stderr, "\n");
    fprintf(stderr, "Options:\n");
    fprintf(stderr, "  --vad-model <path>       Silero VAD model (ggml format, required)\n");
    fprintf(stderr, "  --vad-rate <hz>          VAD sample rate, 8000 or 16000 (default: 16000)\n");
    fprintf(stderr, "  --threshold <p>          Speech probability threshold (default: 0.5)\n");
    fprintf(stderr, "  --min-silence-ms <ms>    Silence needed to close a segment (default: 100)\n");
    fprintf(stderr, "  --min-speech-ms <ms>     Minimum speech duration (default: 250)\n");
    fprintf(stderr, "  --chunk-ms <ms>          Capture chunk duration (default: 100)\n");
    fprintf(stderr, "  --duration <sec>         Only process the first <sec> seconds\n");
    fprintf(stderr, "  --threads <n>            VAD inference threads (default: 1)\n");
    fprintf(stderr, "  --gpu                    Run VAD inference on the GPU\n");
    fprintf(stderr, "  --oneshot                Classify the whole clip once instead of streaming\n");
    fprintf(stderr, "  --async                  Run VAD on a worker thread behind a bounded queue\n");
    fprintf(stderr, "  --queue <n>              Worker queue capacity in chunks (default: 64)\n");
    fprintf(stderr, "  --realtime               Pace capture at 1x real-time speed\n");
    fprintf(stderr, "  -o, --output <path>      Write retained speech to a WAV file\n");
    fprintf(stderr, "  -v, --verbose            Print live speech/silence transitions\n");
    fprintf(stderr, "  -q, --quiet              Only print errors\n");
    fprintf(stderr, "  --no-prints              Suppress whisper.cpp log output\n");
    fprintf(stderr, "  --help                   Print this help message\n");
}

static bool parse_int(const char* s, int& out) {
    char* end = nullptr;
    const long v = std::strtol(s, &end, 10);
    if (end == s || *end != '\0') return false;
    out = static_cast<int>(v);
    return true;
}

static bool parse_float(const char* s, double& out) {
    char* end = nullptr;
    const double v = std::strtod(s, &end);
    if (end == s || *end != '\0') return false;
    out = v;
    return true;
}

// Returns 0 to continue, 1 on error, 2 when help was printed.
static int parse_args(int argc, char** argv, CliOptions& opts) {
    int i = 1;
    if (i < argc) {
        std::string first = argv[i];
        if (first.rfind("-", 0) != 0) {
            opts.audio_path = first;
            ++i;
        }
    }

    for (; i < argc; ++i) {
        std::string arg = argv[i];
        bool ok = true;
        double d = 0.0;
        if (arg == "--vad-model" && i + 1 < argc) {
            opts.vad_model = argv[++i];
        } else if (arg == "--vad-rate" && i + 1 < argc) {
            ok = parse_int(argv[++i], opts.vad.vad_sample_rate);
        } else if (arg == "--threshold" && i + 1 < argc) {
            ok = parse_float(argv[++i], d);
            opts.vad.threshold = static_cast<float>(d);
        } else if (arg == "--min-silence-ms" && i + 1 < argc) {
            ok = parse_int(argv[++i], opts.vad.min_silence_duration_ms);
        } else if (arg == "--min-speech-ms" && i + 1 < argc) {
            ok = parse_int(argv[++i], opts.vad.min_speech_duration_ms);
        } else if (arg == "--chunk-ms" && i + 1 < argc) {
            ok = parse_int(argv[++i], opts.chunk_ms) && opts.chunk_ms > 0;
        } else if (arg == "--duration" && i + 1 < argc) {
            ok = parse_float(argv[++i], opts.duration_s) && opts.duration_s > 0.0;
        } else if (arg == "--threads" && i + 1 < argc) {
            ok = parse_int(argv[++i], opts.n_threads) && opts.n_threads > 0;
        } else if (arg == "--queue" && i + 1 < argc) {
            ok = parse_int(argv[++i], opts.queue_chunks) && opts.queue_chunks > 0;
        } else if (arg == "--gpu") {
            opts.use_gpu = true;
        } else if (arg == "--oneshot") {
            opts.oneshot = true;
        } else if (arg == "--async") {
            opts.async = true;
        } else if (arg == "--realtime") {
            opts.realtime = true;
        } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            opts.output_path = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            opts.quiet = true;
        } else if (arg == "--no-prints") {
            opts.no_prints = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 2;
        } else {
            fprintf(stderr, "Error: unknown or incomplete option '%s'\n\n", argv[i]);
            print_usage(argv[0]);
            return 1;
        }

        if (!ok) {
            fprintf(stderr, "Error: invalid value for '%s'\n\n", arg.c_str());
            print_usage(argv[0]);
            return 1;
        }
    }

    if (opts.audio_path.empty()) {
        fprintf(stderr, "Error: missing positional argument <audio.wav>\n\n");
        print_usage(argv[0]);
        return 1;
    }

    return 0;
}

static void report_live(LiveState& live, const VadPushResult& res) {
    if (res.pending || res.is_speech == live.last_is_speech) {
        return;
    }
    live.last_is_speech = res.is_speech;
    SPEAKVAD_LOG_DEBUG(live.log, "[%s] p=%.2f", res.is_speech ? "speech" : "silence", res.probability);
}

static void on_worker_result(const VadPushResult& res, void* user_data) {
    report_live(*static_cast<LiveState*>(user_data), res);
}

static int run_oneshot(const CliOptions& opts, const VadModel& model, const LogContext* log) {
    std::vector<float> audio;
    uint32_t sample_rate = 0;
    if (!wav_load_file(opts.audio_path, audio, sample_rate, log)) {
        return 1;
    }

    if (opts.duration_s > 0.0) {
        const size_t max_samples = static_cast<size_t>(opts.duration_s * sample_rate);
        if (audio.size() > max_samples) {
            audio.resize(max_samples);
        }
    }

    VadClipResult clip;
    if (!vad_classify_clip(opts.vad, model, audio.data(), static_cast<int>(audio.size()),
                           static_cast<int>(sample_rate), clip, log)) {
        return 1;
    }

    printf("{\"speech\": %s, \"probability\": %.4f, \"frames\": %d}\n",
           clip.is_speech ? "true" : "false", clip.probability, clip.num_frames);
    return 0;
}

static int run_streaming(const CliOptions& opts, const VadModel& model, const LogContext* log) {
    WavReader reader;
    if (!wav_reader_open(reader, opts.audio_path, log)) {
        return 1;
    }

    StreamingVadConfig config = opts.vad;
    config.input_sample_rate = static_cast<int>(reader.sample_rate);

    if (config.input_sample_rate != config.vad_sample_rate) {
        SPEAKVAD_LOG_INFO(log, "Resampling %d Hz -> %d Hz for VAD",
                          config.input_sample_rate, config.vad_sample_rate);
    }

    StreamingVad* sv = streaming_vad_init(config, model, log);
    if (!sv) {
        return 1;
    }

    LiveState live;
    live.log = log;

    VadWorker* worker = nullptr;
    if (opts.async) {
        VadWorkerConfig wcfg;
        wcfg.max_queued_chunks = opts.queue_chunks;
        worker = vad_worker_start(sv, wcfg, on_worker_result, &live, log);
        if (!worker) {
            streaming_vad_free(sv);
            return 1;
        }
    }

    const int chunk_samples = std::max(1, static_cast<int>(static_cast<int64_t>(config.input_sample_rate) * opts.chunk_ms / 1000));
    const int64_t max_samples = opts.duration_s > 0.0
        ? static_cast<int64_t>(opts.duration_s * config.input_sample_rate)
        : static_cast<int64_t>(reader.total_samples);

    std::signal(SIGINT, handle_sigint);
    SPEAKVAD_LOG_INFO(log, "Processing %s (press Ctrl+C to stop)...", opts.audio_path.c_str());

    const auto t_start = std::chrono::steady_clock::now();
    int64_t fed = 0;
    std::vector<float> chunk;

    while (!g_stop_requested.load() && fed < max_samples) {
        const int want = static_cast<int>(std::min<int64_t>(chunk_samples, max_samples - fed));
        const int got = wav_reader_read(reader, chunk, want);
        if (got <= 0) {
            break;
        }

        if (worker) {
            vad_worker_enqueue(worker, chunk.data(), got);
        } else {
            report_live(live, streaming_vad_push(sv, chunk.data(), got));
        }
        fed += got;

        if (opts.realtime) {
            const auto due = t_start + std::chrono::microseconds(fed * 1000000 / config.input_sample_rate);
            std::this_thread::sleep_until(due);
        }
    }

    std::signal(SIGINT, SIG_DFL);
    if (g_stop_requested.load()) {
        SPEAKVAD_LOG_INFO(log, "Stopped by user");
    }

    if (worker) {
        vad_worker_stop(worker);
        const int64_t dropped = vad_worker_dropped_chunks(worker);
        if (dropped > 0) {
            SPEAKVAD_LOG_WARN(log, "%lld capture chunks were dropped", (long long)dropped);
        }
        vad_worker_free(worker);
    }

    const VadStatistics stats = streaming_vad_get_statistics(sv);
    const double fed_s = static_cast<double>(fed) / config.input_sample_rate;

    std::vector<float> speech;
    const bool has_speech = streaming_vad_get_speech_audio(sv, speech);
    const double speech_s = static_cast<double>(speech.size()) / config.input_sample_rate;

    printf("{\"audio_seconds\": %.3f, \"speech_seconds\": %.3f, \"segments\": %d, "
           "\"total_windows\": %lld, \"speech_windows\": %lld, \"failed_windows\": %lld, "
           "\"speech_ratio\": %.4f}\n",
           fed_s, speech_s, streaming_vad_segment_count(sv),
           (long long)stats.total_windows, (long long)stats.speech_windows,
           (long long)stats.failed_windows, stats.speech_ratio);

    int rc = 0;
    if (!has_speech) {
        SPEAKVAD_LOG_WARN(log, "No speech detected, nothing to transcribe");
    } else {
        const double min_speech_s =
            static_cast<double>(streaming_vad_min_speech_samples(sv)) / config.vad_sample_rate;
        if (speech_s < min_speech_s) {
            SPEAKVAD_LOG_INFO(log, "Retained speech is shorter than --min-speech-ms");
        }
        SPEAKVAD_LOG_INFO(log, "Kept %.2fs of %.2fs (%.0f%% removed)", speech_s, fed_s,
                          fed_s > 0.0 ? 100.0 * (1.0 - speech_s / fed_s) : 0.0);

        if (!opts.output_path.empty() &&
            !wav_write_file(opts.output_path, speech.data(), static_cast<int>(speech.size()),
                            static_cast<uint32_t>(config.input_sample_rate), log)) {
            rc = 1;
        }
    }

    streaming_vad_free(sv);
    return rc;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    CliOptions opts;
    const int parse_rc = parse_args(argc, argv, opts);
    if (parse_rc != 0) {
        return parse_rc == 2 ? 0 : 1;
    }

    LogContext log;
    log.min_level = opts.quiet ? LOG_LEVEL_ERROR : (opts.verbose ? LOG_LEVEL_DEBUG : LOG_LEVEL_INFO);

    if (opts.no_prints) {
        log_silence_backend();
    } else {
        log_route_backend(&log);
    }

    if (!streaming_vad_config_validate(opts.vad, &log)) {
        return 1;
    }

    if (opts.vad.vad_sample_rate != 16000) {
        SPEAKVAD_LOG_ERROR(&log, "the Silero ggml model only runs at 16000 Hz, got --vad-rate %d",
                           opts.vad.vad_sample_rate);
        return 1;
    }

    WhisperVadModelConfig mcfg;
    mcfg.model_path = opts.vad_model;
    mcfg.n_threads = opts.n_threads;
    mcfg.use_gpu = opts.use_gpu;

    // Fail before any audio is read when the model cannot be loaded.
    WhisperVadModel* vad_model = whisper_vad_model_load(mcfg, &log);
    if (!vad_model) {
        return 1;
    }

    const int rc = opts.oneshot ? run_oneshot(opts, vad_model->model, &log)
                                : run_streaming(opts, vad_model->model, &log);

    whisper_vad_model_free(vad_model);
    return rc;
}
