#include "vad_classifier.h"

#include <vector>

namespace speakvad {

SpeechWindow classify_frames(const VadModel& model, const float* samples, int n_samples,
                             int sample_rate, int frame_samples, float threshold,
                             const LogContext* log) {
    SpeechWindow window;
    if (!samples || n_samples <= 0 || frame_samples <= 0) {
        return window;
    }

    const int num_frames = n_samples / frame_samples;
    if (num_frames == 0) {
        return window;
    }

    double sum = 0.0;
    if (model.infer_frames != nullptr) {
        // one call per buffer keeps recurrent state across its frames
        std::vector<float> probs(static_cast<size_t>(num_frames), 0.0f);
        if (model.infer_frames(model.user_data, samples, num_frames, frame_samples, sample_rate,
                               probs.data())) {
            for (float p : probs) {
                sum += p;
            }
        } else {
            SPEAKVAD_LOG_WARN(log, "VAD inference failed on %d frames, treating as silence", num_frames);
            window.num_failed = num_frames;
        }
    } else {
        for (int i = 0; i < num_frames; ++i) {
            const float* frame = samples + static_cast<size_t>(i) * frame_samples;

            float prob = 0.0f;
            const bool ok = model.infer != nullptr &&
                            model.infer(model.user_data, frame, frame_samples, sample_rate, &prob);
            if (!ok) {
                SPEAKVAD_LOG_WARN(log, "VAD inference failed on frame %d, treating as silence", i);
                window.num_failed += 1;
                prob = 0.0f;
            }
            sum += prob;
        }
    }

    window.num_frames = num_frames;
    window.probability = static_cast<float>(sum / num_frames);
    window.is_speech = window.probability >= threshold;
    return window;
}

}  // namespace speakvad
