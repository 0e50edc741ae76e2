#pragma once

#include "log.h"

// Silero VAD frame contract: one inference consumes exactly this many samples.
constexpr int kVadFrameSamples16k = 512;
constexpr int kVadFrameSamples8k  = 256;

struct whisper_vad_context;

// Run one inference on a single frame. Writes the speech probability in [0, 1]
// to prob_out and returns true, or returns false when inference failed.
typedef bool (*vad_infer_fn)(void* user_data, const float* frame, int n_samples,
                             int sample_rate, float* prob_out);

// Optional: classify n_frames consecutive frames in one call, writing one
// probability per frame to probs_out. Recurrent state carries from frame to
// frame within the call.
typedef bool (*vad_infer_frames_fn)(void* user_data, const float* samples, int n_frames,
                                    int frame_samples, int sample_rate, float* probs_out);

// Optional: clear recurrent model state. Called when a session starts or is reset.
typedef void (*vad_reset_fn)(void* user_data);

// The model capabilities the segmentation engine needs. At least one of
// infer / infer_frames must be set; infer_frames is preferred when present.
struct VadModel {
    vad_infer_fn infer = nullptr;
    vad_infer_frames_fn infer_frames = nullptr;
    vad_reset_fn reset = nullptr;
    void* user_data = nullptr;
};

// Required frame length for a model sample rate, or 0 for unsupported rates.
int vad_frame_samples(int sample_rate);

bool vad_model_is_available(const VadModel& model);

void vad_model_reset(const VadModel& model);

struct WhisperVadModelConfig {
    const char* model_path = nullptr;  // ggml Silero VAD model, e.g. ggml-silero-v5.1.2.bin
    int n_threads = 1;
    bool use_gpu = false;
    int gpu_device = 0;
};

// Silero VAD loaded through whisper.cpp. Only 16 kHz input is supported.
// whisper_vad_detect_speech clears the LSTM state at the start of every call,
// so the model exposes infer_frames and each buffer is scored in one call.
struct WhisperVadModel {
    whisper_vad_context* ctx = nullptr;
    VadModel model;  // infer / infer_frames bound to ctx
    const speakvad::LogContext* log = nullptr;
};

// Load the model. Returns nullptr on failure after logging a remediation hint.
WhisperVadModel* whisper_vad_model_load(const WhisperVadModelConfig& config,
                                        const speakvad::LogContext* log);
void whisper_vad_model_free(WhisperVadModel* m);

void vad_model_print_install_instructions(FILE* out);
