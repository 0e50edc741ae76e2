#pragma once

#include "speakvad.h"

#include <cstdint>

struct VadWorkerConfig {
    int max_queued_chunks = 64;  // capture chunks waiting for the worker
};

// Called on the worker thread after every processed chunk.
typedef void (*vad_worker_callback)(const VadPushResult& result, void* user_data);

struct VadWorker;

// Start a worker thread that owns sv until vad_worker_stop() returns.
// The capture side only calls vad_worker_enqueue().
VadWorker* vad_worker_start(StreamingVad* sv, const VadWorkerConfig& config,
                            vad_worker_callback cb, void* user_data,
                            const speakvad::LogContext* log);

// Copy a chunk into the queue. Returns false when the queue is full (the
// chunk is dropped and counted) or the worker has been stopped.
bool vad_worker_enqueue(VadWorker* w, const float* samples, int n);

// Close the queue, let the worker drain what is queued, join it.
void vad_worker_stop(VadWorker* w);

int64_t vad_worker_dropped_chunks(VadWorker* w);
int64_t vad_worker_processed_chunks(VadWorker* w);

void vad_worker_free(VadWorker* w);
