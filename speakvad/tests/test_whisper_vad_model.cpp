#include "speakvad.h"
#include "vad_model.h"
#include "../src/wav_file.h"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <vector>

int main(int argc, char* argv[]) {
    const char* model_path = nullptr;
    const char* audio_path = nullptr;

    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            model_path = argv[++i];
        } else {
            audio_path = argv[i];
        }
    }

    speakvad::LogContext log;
    log.min_level = speakvad::LOG_LEVEL_WARN;

    {
        WhisperVadModelConfig bad;
        bad.model_path = "/nonexistent/ggml-silero.bin";
        speakvad::log_silence_backend();
        if (whisper_vad_model_load(bad, &log) != nullptr) {
            printf("FAIL: loading a missing model file should fail\n");
            return 1;
        }
    }

    if (!model_path) {
        printf("Usage: test_whisper_vad_model --model <ggml-silero.bin> [speech.wav]\n");
        printf("SKIP: No model provided\n");
        return 0;
    }

    WhisperVadModelConfig config;
    config.model_path = model_path;
    WhisperVadModel* m = whisper_vad_model_load(config, &log);
    if (!m) {
        printf("FAIL: whisper_vad_model_load returned null\n");
        return 1;
    }

    int failures = 0;

    std::vector<float> silence(kVadFrameSamples16k, 0.0f);
    float prob = -1.0f;
    if (!m->model.infer(m->model.user_data, silence.data(), kVadFrameSamples16k, 16000, &prob)) {
        printf("FAIL: inference on a silent frame failed\n");
        failures++;
    } else if (prob < 0.0f || prob >= 0.5f) {
        printf("FAIL: silent frame probability %.3f, expected < 0.5\n", prob);
        failures++;
    }

    if (m->model.infer(m->model.user_data, silence.data(), kVadFrameSamples8k, 16000, &prob)) {
        printf("FAIL: a 256-sample frame at 16 kHz should be rejected\n");
        failures++;
    }

    {
        std::vector<float> frames(3 * kVadFrameSamples16k, 0.0f);
        float probs[3] = {-1.0f, -1.0f, -1.0f};
        if (!m->model.infer_frames(m->model.user_data, frames.data(), 3, kVadFrameSamples16k, 16000, probs)) {
            printf("FAIL: inference on three silent frames failed\n");
            failures++;
        } else {
            for (float p : probs) {
                if (p < 0.0f || p >= 0.5f) {
                    printf("FAIL: silent frame probability %.3f in a buffer, expected < 0.5\n", p);
                    failures++;
                }
            }
        }
    }

    if (audio_path) {
        std::vector<float> audio;
        uint32_t rate = 0;
        if (!wav_load_file(audio_path, audio, rate, &log)) {
            printf("FAIL: Could not load audio file\n");
            whisper_vad_model_free(m);
            return 1;
        }

        StreamingVadConfig sc;
        sc.input_sample_rate = static_cast<int>(rate);
        StreamingVad* sv = streaming_vad_init(sc, m->model, &log);
        const int chunk = static_cast<int>(rate / 10);
        for (size_t off = 0; off < audio.size(); off += chunk) {
            const int n = static_cast<int>(std::min<size_t>(chunk, audio.size() - off));
            streaming_vad_push(sv, audio.data() + off, n);
        }

        const VadStatistics stats = streaming_vad_get_statistics(sv);
        printf("Speech ratio %.3f over %lld frames\n", stats.speech_ratio, (long long)stats.total_windows);
        std::vector<float> speech;
        if (!streaming_vad_get_speech_audio(sv, speech)) {
            printf("FAIL: expected speech in %s\n", audio_path);
            failures++;
        }
        streaming_vad_free(sv);
    }

    whisper_vad_model_free(m);

    if (failures > 0) {
        return 1;
    }

    printf("PASSED: whisper VAD model tests\n");
    return 0;
}
