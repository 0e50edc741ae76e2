#pragma once

#include "log.h"
#include "vad_model.h"

namespace speakvad {

struct SpeechWindow {
    bool is_speech = false;
    float probability = 0.0f;   // mean over the frames of one buffer
    int num_frames = 0;
    int num_failed = 0;         // frames whose inference failed (counted as 0.0)
};

// Split model-rate audio into whole frames of frame_samples, run the model on
// them (one infer_frames call when the model has it, else infer per frame)
// and average the probabilities. Samples past the last whole frame are
// ignored. Returns a window with num_frames == 0 when no whole frame fits.
SpeechWindow classify_frames(const VadModel& model, const float* samples, int n_samples,
                             int sample_rate, int frame_samples, float threshold,
                             const LogContext* log);

}  // namespace speakvad
