#include "speakvad.h"

#include "resampler.h"
#include "vad_classifier.h"

#include <vector>

using namespace speakvad;

bool vad_classify_clip(const StreamingVadConfig& config, const VadModel& model,
                       const float* samples, int n, int original_rate,
                       VadClipResult& result, const LogContext* log) {
    result = VadClipResult();

    const int frame_samples = vad_frame_samples(config.vad_sample_rate);
    if (frame_samples == 0) {
        SPEAKVAD_LOG_ERROR(log, "vad_classify_clip: invalid vad_sample_rate %d", config.vad_sample_rate);
        return false;
    }
    if (!vad_model_is_available(model)) {
        SPEAKVAD_LOG_ERROR(log, "vad_classify_clip: VAD model not loaded");
        return false;
    }

    std::vector<float> resampled;
    if (!resample_linear(samples, n, original_rate, config.vad_sample_rate, resampled, log)) {
        return false;
    }
    if (resampled.empty()) {
        SPEAKVAD_LOG_ERROR(log, "vad_classify_clip: empty clip");
        return false;
    }

    if (static_cast<int>(resampled.size()) < frame_samples) {
        resampled.resize(frame_samples, 0.0f);
    }

    vad_model_reset(model);
    const SpeechWindow window = classify_frames(model, resampled.data(),
                                                static_cast<int>(resampled.size()),
                                                config.vad_sample_rate, frame_samples,
                                                config.threshold, log);

    result.is_speech = window.is_speech;
    result.probability = window.probability;
    result.num_frames = window.num_frames;
    return true;
}
