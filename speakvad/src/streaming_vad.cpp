#include "speakvad.h"

#include "frame_accumulator.h"
#include "resampler.h"
#include "segmenter.h"
#include "vad_classifier.h"

#include <chrono>
#include <vector>

using namespace speakvad;

struct StreamingVad {
    StreamingVadConfig config;
    VadModel model;
    const LogContext* log = nullptr;

    int frame_samples = 0;
    int min_speech_samples = 0;

    FrameAccumulator accumulator;
    Segmenter segmenter;

    int64_t total_windows = 0;
    int64_t speech_windows = 0;
    int64_t failed_windows = 0;

    // scratch buffers reused across pushes
    std::vector<float> buffered;
    std::vector<float> resampled;

    StreamingVad(const StreamingVadConfig& cfg, int frame_len)
        : config(cfg),
          frame_samples(frame_len),
          accumulator(cfg.input_sample_rate, cfg.vad_sample_rate, frame_len) {}
};

bool streaming_vad_config_validate(const StreamingVadConfig& config, const LogContext* log) {
    if (config.input_sample_rate <= 0) {
        SPEAKVAD_LOG_ERROR(log, "invalid input_sample_rate %d", config.input_sample_rate);
        return false;
    }
    if (vad_frame_samples(config.vad_sample_rate) == 0) {
        SPEAKVAD_LOG_ERROR(log, "invalid vad_sample_rate %d (expected 8000 or 16000)",
                           config.vad_sample_rate);
        return false;
    }
    if (!(config.threshold >= 0.0f && config.threshold <= 1.0f)) {
        SPEAKVAD_LOG_ERROR(log, "invalid threshold %.3f (expected 0.0 to 1.0)", config.threshold);
        return false;
    }
    if (config.min_silence_duration_ms < 0) {
        SPEAKVAD_LOG_ERROR(log, "invalid min_silence_duration_ms %d", config.min_silence_duration_ms);
        return false;
    }
    if (config.min_speech_duration_ms < 0) {
        SPEAKVAD_LOG_ERROR(log, "invalid min_speech_duration_ms %d", config.min_speech_duration_ms);
        return false;
    }
    return true;
}

StreamingVad* streaming_vad_init(const StreamingVadConfig& config, const VadModel& model,
                                 const LogContext* log) {
    if (!streaming_vad_config_validate(config, log)) {
        return nullptr;
    }
    if (!vad_model_is_available(model)) {
        SPEAKVAD_LOG_ERROR(log, "streaming_vad_init: VAD model not loaded");
        return nullptr;
    }

    auto* sv = new StreamingVad(config, vad_frame_samples(config.vad_sample_rate));
    sv->model = model;
    sv->log = log;
    sv->min_speech_samples =
        static_cast<int>(static_cast<int64_t>(config.vad_sample_rate) * config.min_speech_duration_ms / 1000);
    sv->segmenter.min_silence_duration_ms = config.min_silence_duration_ms;
    vad_model_reset(model);

    SPEAKVAD_LOG_DEBUG(log, "streaming VAD: %d Hz -> %d Hz, frame %d, buffer target %d samples",
                       config.input_sample_rate, config.vad_sample_rate, sv->frame_samples,
                       sv->accumulator.target_buffer_samples());
    return sv;
}

VadPushResult streaming_vad_push(StreamingVad* sv, const float* samples, int n) {
    VadPushResult result{false, 0.0f, true};
    if (!sv) {
        return result;
    }

    result.is_speech = sv->segmenter.in_speech;

    if (!sv->accumulator.push(samples, n)) {
        return result;
    }

    sv->accumulator.take(sv->buffered);
    const int n_buffered = static_cast<int>(sv->buffered.size());

    if (!resample_linear(sv->buffered.data(), n_buffered,
                         sv->config.input_sample_rate, sv->config.vad_sample_rate,
                         sv->resampled, sv->log)) {
        return result;
    }

    const auto t0 = std::chrono::steady_clock::now();
    const SpeechWindow window = classify_frames(sv->model, sv->resampled.data(),
                                                static_cast<int>(sv->resampled.size()),
                                                sv->config.vad_sample_rate, sv->frame_samples,
                                                sv->config.threshold, sv->log);
    const auto t1 = std::chrono::steady_clock::now();

    if (window.num_frames == 0) {
        return result;
    }

    const double buffer_ms = 1000.0 * n_buffered / sv->config.input_sample_rate;
    const double infer_ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
    if (infer_ms > buffer_ms) {
        SPEAKVAD_LOG_WARN(sv->log, "VAD inference took %.1f ms for %.1f ms of audio, capture may drop",
                          infer_ms, buffer_ms);
    }

    sv->total_windows += window.num_frames;
    sv->failed_windows += window.num_failed;
    if (window.is_speech) {
        sv->speech_windows += window.num_frames;
    }

    const segmenter_event ev = segmenter_push(sv->segmenter, window.is_speech,
                                              sv->buffered.data(), n_buffered, buffer_ms);
    if (ev == SEGMENTER_SPEECH_START) {
        SPEAKVAD_LOG_DEBUG(sv->log, "Speech started (p=%.2f)", window.probability);
    } else if (ev == SEGMENTER_SPEECH_END) {
        SPEAKVAD_LOG_DEBUG(sv->log, "Speech ended");
    }

    result.is_speech = window.is_speech;
    result.probability = window.probability;
    result.pending = false;
    return result;
}

bool streaming_vad_is_in_speech(const StreamingVad* sv) {
    return sv && sv->segmenter.in_speech;
}

bool streaming_vad_get_speech_audio(const StreamingVad* sv, std::vector<float>& out) {
    out.clear();
    if (!sv || sv->segmenter.retained_buffers == 0) {
        return false;
    }
    out = sv->segmenter.retained;
    return true;
}

VadStatistics streaming_vad_get_statistics(const StreamingVad* sv) {
    VadStatistics stats;
    if (!sv) {
        return stats;
    }
    stats.total_windows = sv->total_windows;
    stats.speech_windows = sv->speech_windows;
    stats.failed_windows = sv->failed_windows;
    stats.speech_ratio = sv->total_windows > 0
        ? static_cast<double>(sv->speech_windows) / static_cast<double>(sv->total_windows)
        : 0.0;
    return stats;
}

int streaming_vad_segment_count(const StreamingVad* sv) {
    return sv ? sv->segmenter.segments : 0;
}

int streaming_vad_min_speech_samples(const StreamingVad* sv) {
    return sv ? sv->min_speech_samples : 0;
}

void streaming_vad_reset(StreamingVad* sv) {
    if (!sv) return;

    sv->accumulator.reset();
    segmenter_reset(sv->segmenter);
    sv->total_windows = 0;
    sv->speech_windows = 0;
    sv->failed_windows = 0;
    vad_model_reset(sv->model);
    sv->buffered.clear();
    sv->resampled.clear();
    SPEAKVAD_LOG_DEBUG(sv->log, "VAD state reset");
}

void streaming_vad_free(StreamingVad* sv) {
    delete sv;
}
