#include "segmenter.h"

namespace speakvad {

static void retain(Segmenter& sg, const float* audio, int n) {
    if (audio != nullptr && n > 0) {
        sg.retained.insert(sg.retained.end(), audio, audio + n);
    }
    sg.retained_buffers += 1;
}

segmenter_event segmenter_push(Segmenter& sg, bool is_speech,
                               const float* audio, int n, double duration_ms) {
    if (is_speech) {
        const bool started = !sg.in_speech;
        if (started) {
            sg.in_speech = true;
            sg.segments += 1;
        }
        retain(sg, audio, n);
        sg.silence_duration_ms = 0.0;
        return started ? SEGMENTER_SPEECH_START : SEGMENTER_NONE;
    }

    if (!sg.in_speech) {
        return SEGMENTER_NONE;
    }

    retain(sg, audio, n);
    sg.silence_duration_ms += duration_ms;

    if (sg.silence_duration_ms >= sg.min_silence_duration_ms) {
        sg.in_speech = false;
        sg.silence_duration_ms = 0.0;
        return SEGMENTER_SPEECH_END;
    }

    return SEGMENTER_NONE;
}

void segmenter_reset(Segmenter& sg) {
    sg.in_speech = false;
    sg.silence_duration_ms = 0.0;
    sg.retained.clear();
    sg.retained_buffers = 0;
    sg.segments = 0;
}

}  // namespace speakvad
