#include "../src/vad_worker.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <thread>
#include <vector>

namespace {

constexpr double kPi = 3.14159265358979323846;

// Holds every inference until released, so the queue can be filled.
struct GatedModel {
    std::atomic<bool> entered{false};
    std::atomic<bool> released{true};
};

bool gated_infer(void* user_data, const float* frame, int n_samples, int, float* prob_out) {
    auto* m = static_cast<GatedModel*>(user_data);
    m->entered.store(true);
    while (!m->released.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    float peak = 0.0f;
    for (int i = 0; i < n_samples; ++i) {
        peak = std::max(peak, std::fabs(frame[i]));
    }
    *prob_out = peak > 0.05f ? 0.9f : 0.1f;
    return true;
}

struct CallbackLog {
    std::atomic<int> calls{0};
    std::atomic<int> decisions{0};
};

void on_result(const VadPushResult& res, void* user_data) {
    auto* cb = static_cast<CallbackLog*>(user_data);
    cb->calls += 1;
    if (!res.pending) cb->decisions += 1;
}

std::vector<float> chunk_for(int index, int n) {
    std::vector<float> out(n, 0.0f);
    if (index >= 3 && index <= 7) {
        for (int i = 0; i < n; ++i) {
            out[i] = 0.5f * static_cast<float>(std::sin(2.0 * kPi * 440.0 * i / 44100.0));
        }
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

    StreamingVadConfig config;
    config.input_sample_rate = 44100;

    {
        GatedModel gate;
        VadModel model;
        model.infer = gated_infer;
        model.user_data = &gate;

        StreamingVad* sv = streaming_vad_init(config, model, &log);
        CallbackLog cb;
        VadWorkerConfig wcfg;
        VadWorker* w = vad_worker_start(sv, wcfg, on_result, &cb, &log);
        ok &= expect(w != nullptr, "worker starts");

        for (int c = 1; c <= 10; ++c) {
            const std::vector<float> chunk = chunk_for(c, 4410);
            ok &= expect(vad_worker_enqueue(w, chunk.data(), 4410), "enqueue below capacity succeeds");
        }
        vad_worker_stop(w);

        ok &= expect(vad_worker_processed_chunks(w) == 10, "stop drains every queued chunk");
        ok &= expect(vad_worker_dropped_chunks(w) == 0, "nothing dropped");
        ok &= expect(cb.calls == 10 && cb.decisions == 10, "callback runs once per chunk");

        const float x = 0.0f;
        ok &= expect(!vad_worker_enqueue(w, &x, 1), "enqueue after stop is rejected");

        const VadStatistics stats = streaming_vad_get_statistics(sv);
        ok &= expect(stats.total_windows == 30 && stats.speech_windows == 15,
                     "worker produces the same statistics as direct pushes");
        std::vector<float> speech;
        ok &= expect(streaming_vad_get_speech_audio(sv, speech) && speech.size() == 6 * 4410,
                     "worker retains chunks 3 through 8");

        vad_worker_free(w);
        streaming_vad_free(sv);
    }

    {
        GatedModel gate;
        gate.released.store(false);
        VadModel model;
        model.infer = gated_infer;
        model.user_data = &gate;

        StreamingVad* sv = streaming_vad_init(config, model, &log);
        VadWorkerConfig wcfg;
        wcfg.max_queued_chunks = 2;
        VadWorker* w = vad_worker_start(sv, wcfg, nullptr, nullptr, &log);

        const std::vector<float> chunk = chunk_for(1, 4410);
        ok &= expect(vad_worker_enqueue(w, chunk.data(), 4410), "first chunk is accepted");
        while (!gate.entered.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }

        ok &= expect(vad_worker_enqueue(w, chunk.data(), 4410), "second chunk fills slot one");
        ok &= expect(vad_worker_enqueue(w, chunk.data(), 4410), "third chunk fills slot two");
        ok &= expect(!vad_worker_enqueue(w, chunk.data(), 4410), "fourth chunk overflows the queue");
        ok &= expect(vad_worker_dropped_chunks(w) == 1, "overflow is counted");

        gate.released.store(true);
        vad_worker_free(w);

        ok &= expect(streaming_vad_get_statistics(sv).total_windows == 9, "three accepted chunks were classified");
        streaming_vad_free(sv);
    }

    {
        VadWorkerConfig wcfg;
        ok &= expect(vad_worker_start(nullptr, wcfg, nullptr, nullptr, &log) == nullptr,
                     "worker needs a session");
    }

    if (!ok) {
        return 1;
    }

    std::fprintf(stderr, "PASSED: VAD worker tests\n");
    return 0;
}
