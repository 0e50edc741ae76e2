#pragma once

#include <cstdint>
#include <vector>

namespace speakvad {

enum segmenter_event {
    SEGMENTER_NONE = 0,
    SEGMENTER_SPEECH_START,
    SEGMENTER_SPEECH_END,
};

// Idle / InSpeech state machine with a minimum-silence hangover.
struct Segmenter {
    double min_silence_duration_ms = 100.0;

    bool in_speech = false;
    double silence_duration_ms = 0.0;

    // Retained input-rate audio, in arrival order. Only ever appended to.
    std::vector<float> retained;
    int retained_buffers = 0;
    int segments = 0;
};

// Apply one window decision. audio is the input-rate buffer the decision was
// made on, duration_ms its length. Silent buffers inside a segment are kept;
// the segment closes once the accumulated silence reaches the minimum.
segmenter_event segmenter_push(Segmenter& sg, bool is_speech,
                               const float* audio, int n, double duration_ms);

void segmenter_reset(Segmenter& sg);

}  // namespace speakvad
