#pragma once

#include "log.h"
#include "vad_model.h"

#include <cstdint>
#include <vector>

struct StreamingVadConfig {
    int input_sample_rate = 44100;      // capture rate, fixed for the session
    int vad_sample_rate = 16000;        // 8000 or 16000
    float threshold = 0.5f;             // speech probability threshold
    int min_silence_duration_ms = 100;  // hangover before a segment closes
    int min_speech_duration_ms = 250;   // validated and reported only
};

struct VadStatistics {
    int64_t total_windows = 0;   // classified frames
    int64_t speech_windows = 0;  // frames from buffers whose averaged decision was speech
    int64_t failed_windows = 0;  // frames whose inference failed, counted as 0.0 in total_windows
    double speech_ratio = 0.0;   // speech_windows / total_windows, 0 when nothing classified
};

struct VadPushResult {
    bool is_speech;      // window decision, or the current segment state when pending
    float probability;   // averaged window probability, 0 when pending
    bool pending;        // no new decision (not enough buffered audio)
};

// Reject unsupported rates and out-of-range values, naming the bad field.
bool streaming_vad_config_validate(const StreamingVadConfig& config,
                                   const speakvad::LogContext* log);

struct StreamingVad;

// The model and log context are borrowed and must outlive the session.
// Returns nullptr when the config is invalid or the model is unavailable.
StreamingVad* streaming_vad_init(const StreamingVadConfig& config, const VadModel& model,
                                 const speakvad::LogContext* log);

// Feed one capture chunk at input_sample_rate. The samples are copied.
VadPushResult streaming_vad_push(StreamingVad* sv, const float* samples, int n);

bool streaming_vad_is_in_speech(const StreamingVad* sv);

// Copy of all retained audio in arrival order. Returns false (and leaves
// out empty) when no speech was ever retained.
bool streaming_vad_get_speech_audio(const StreamingVad* sv, std::vector<float>& out);

VadStatistics streaming_vad_get_statistics(const StreamingVad* sv);

// Number of completed speech segments plus the open one, if any.
int streaming_vad_segment_count(const StreamingVad* sv);

int streaming_vad_min_speech_samples(const StreamingVad* sv);

// Drop all state; the session can be fed again from scratch.
void streaming_vad_reset(StreamingVad* sv);

void streaming_vad_free(StreamingVad* sv);

struct VadClipResult {
    bool is_speech = false;
    float probability = 0.0f;
    int num_frames = 0;
};

// One-shot classification of a whole clip at original_rate. Uses the same
// whole-frame discipline as the streaming path; a clip shorter than one frame
// after resampling is zero-padded to one frame.
bool vad_classify_clip(const StreamingVadConfig& config, const VadModel& model,
                       const float* samples, int n, int original_rate,
                       VadClipResult& result, const speakvad::LogContext* log);
