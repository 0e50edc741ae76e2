#include "speakvad.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <vector>

namespace {

constexpr double kPi = 3.14159265358979323846;

struct MockModel {
    int calls = 0;
    int bad_shapes = 0;
};

bool mock_infer(void* user_data, const float* frame, int n_samples, int sample_rate, float* prob_out) {
    auto* m = static_cast<MockModel*>(user_data);
    m->calls += 1;
    if (n_samples != vad_frame_samples(sample_rate)) {
        m->bad_shapes += 1;
        return false;
    }
    float peak = 0.0f;
    for (int i = 0; i < n_samples; ++i) {
        peak = std::max(peak, std::fabs(frame[i]));
    }
    *prob_out = peak > 0.05f ? 0.9f : 0.1f;
    return true;
}

std::vector<float> sine(int n, int rate) {
    std::vector<float> out(n);
    for (int i = 0; i < n; ++i) {
        out[i] = 0.5f * static_cast<float>(std::sin(2.0 * kPi * 300.0 * i / rate));
    }
    return out;
}

bool expect(bool condition, const char* message) {
    if (!condition) {
        std::fprintf(stderr, "FAIL: %s\n", message);
        return false;
    }
    return true;
}

}

int main() {
    bool ok = true;

    speakvad::LogContext log;
    log.min_level = speakvad::LOG_LEVEL_NONE;

    MockModel mock;
    VadModel model;
    model.infer = mock_infer;
    model.user_data = &mock;

    StreamingVadConfig config;

    {
        const std::vector<float> clip = sine(44100, 44100);
        VadClipResult r;
        ok &= expect(vad_classify_clip(config, model, clip.data(), 44100, 44100, r, &log),
                     "one second at 44.1 kHz classifies");
        ok &= expect(r.num_frames == 31, "16000 resampled samples hold 31 whole frames");
        ok &= expect(r.is_speech && std::fabs(r.probability - 0.9f) < 1e-6f, "tone clip is speech");
        ok &= expect(mock.bad_shapes == 0, "clip is split into exact frames");
    }

    {
        const std::vector<float> clip(32000, 0.0f);
        VadClipResult r;
        ok &= expect(vad_classify_clip(config, model, clip.data(), 32000, 16000, r, &log),
                     "silent clip classifies");
        ok &= expect(!r.is_speech && r.num_frames == 62, "silent clip is not speech");
    }

    {
        const std::vector<float> clip = sine(100, 16000);
        VadClipResult r;
        ok &= expect(vad_classify_clip(config, model, clip.data(), 100, 16000, r, &log),
                     "clip shorter than a frame classifies");
        ok &= expect(r.num_frames == 1 && r.is_speech, "short clip is padded to one frame");
    }

    {
        StreamingVadConfig narrow = config;
        narrow.vad_sample_rate = 8000;
        const std::vector<float> clip = sine(8000, 8000);
        VadClipResult r;
        ok &= expect(vad_classify_clip(narrow, model, clip.data(), 8000, 8000, r, &log) &&
                     r.num_frames == 31 && mock.bad_shapes == 0,
                     "8 kHz clip uses 256-sample frames");
    }

    {
        VadClipResult r;
        const float one = 0.5f;
        ok &= expect(!vad_classify_clip(config, model, &one, 1, 44100, r, &log),
                     "a single sample cannot be resampled");
        ok &= expect(!vad_classify_clip(config, model, nullptr, 0, 16000, r, &log),
                     "empty clip is an error");
        ok &= expect(!vad_classify_clip(config, VadModel(), &one, 1, 16000, r, &log),
                     "missing model is an error");
    }

    if (!ok) {
        return 1;
    }

    std::fprintf(stderr, "PASSED: one-shot VAD tests\n");
    return 0;
}
