#include "vad_worker.h"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

struct VadWorker {
    StreamingVad* sv = nullptr;
    VadWorkerConfig config;
    vad_worker_callback cb = nullptr;
    void* user_data = nullptr;
    const speakvad::LogContext* log = nullptr;

    std::thread worker;
    std::mutex mtx;
    std::condition_variable cv_submit;

    std::deque<std::vector<float>> queue;
    bool closed = false;
    int64_t dropped = 0;
    int64_t processed = 0;
};

static void worker_loop(VadWorker* w) {
    while (true) {
        std::vector<float> chunk;

        {
            std::unique_lock<std::mutex> lock(w->mtx);
            w->cv_submit.wait(lock, [w]{ return !w->queue.empty() || w->closed; });

            if (w->queue.empty()) return;  // closed and drained

            chunk = std::move(w->queue.front());
            w->queue.pop_front();
        }

        const VadPushResult res = streaming_vad_push(w->sv, chunk.data(), static_cast<int>(chunk.size()));

        {
            std::lock_guard<std::mutex> lock(w->mtx);
            w->processed += 1;
        }

        if (w->cb) {
            w->cb(res, w->user_data);
        }
    }
}

VadWorker* vad_worker_start(StreamingVad* sv, const VadWorkerConfig& config,
                            vad_worker_callback cb, void* user_data,
                            const speakvad::LogContext* log) {
    if (!sv) {
        SPEAKVAD_LOG_ERROR(log, "vad_worker_start called with null session");
        return nullptr;
    }
    if (config.max_queued_chunks <= 0) {
        SPEAKVAD_LOG_ERROR(log, "invalid max_queued_chunks %d", config.max_queued_chunks);
        return nullptr;
    }

    auto* w = new VadWorker();
    w->sv = sv;
    w->config = config;
    w->cb = cb;
    w->user_data = user_data;
    w->log = log;
    w->worker = std::thread(worker_loop, w);
    return w;
}

bool vad_worker_enqueue(VadWorker* w, const float* samples, int n) {
    if (!w || !samples || n <= 0) return false;

    std::lock_guard<std::mutex> lock(w->mtx);
    if (w->closed) {
        return false;
    }
    if (static_cast<int>(w->queue.size()) >= w->config.max_queued_chunks) {
        w->dropped += 1;
        SPEAKVAD_LOG_WARN(w->log, "VAD queue full, dropped capture chunk (%lld dropped)",
                          (long long)w->dropped);
        return false;
    }

    w->queue.emplace_back(samples, samples + n);
    w->cv_submit.notify_one();
    return true;
}

void vad_worker_stop(VadWorker* w) {
    if (!w) return;

    {
        std::lock_guard<std::mutex> lock(w->mtx);
        w->closed = true;
        w->cv_submit.notify_one();
    }

    if (w->worker.joinable()) {
        w->worker.join();
    }
}

int64_t vad_worker_dropped_chunks(VadWorker* w) {
    if (!w) return 0;
    std::lock_guard<std::mutex> lock(w->mtx);
    return w->dropped;
}

int64_t vad_worker_processed_chunks(VadWorker* w) {
    if (!w) return 0;
    std::lock_guard<std::mutex> lock(w->mtx);
    return w->processed;
}

void vad_worker_free(VadWorker* w) {
    if (!w) return;

    vad_worker_stop(w);
    delete w;
}
