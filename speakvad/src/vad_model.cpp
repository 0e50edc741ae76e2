#include "vad_model.h"

#include "whisper.h"

static constexpr int WHISPER_VAD_SAMPLE_RATE = 16000;

int vad_frame_samples(int sample_rate) {
    if (sample_rate == 16000) return kVadFrameSamples16k;
    if (sample_rate == 8000)  return kVadFrameSamples8k;
    return 0;
}

bool vad_model_is_available(const VadModel& model) {
    return model.infer != nullptr || model.infer_frames != nullptr;
}

void vad_model_reset(const VadModel& model) {
    if (model.reset) {
        model.reset(model.user_data);
    }
}

static float clamp_probability(float p) {
    if (p < 0.0f) return 0.0f;
    if (p > 1.0f) return 1.0f;
    return p;
}

// Runs the model over n_frames consecutive 512-sample frames in one call.
// whisper_vad_detect_speech resets the LSTM state on entry, so context spans
// exactly this call.
static bool whisper_vad_infer_frames(void* user_data, const float* samples, int n_frames,
                                     int frame_samples, int sample_rate, float* probs_out) {
    auto* m = static_cast<WhisperVadModel*>(user_data);
    if (!m || !m->ctx || !samples || !probs_out || n_frames <= 0) {
        return false;
    }

    if (sample_rate != WHISPER_VAD_SAMPLE_RATE || frame_samples != kVadFrameSamples16k) {
        SPEAKVAD_LOG_ERROR(m->log, "whisper_vad_infer_frames: unsupported frame shape %d samples @ %d Hz",
                           frame_samples, sample_rate);
        return false;
    }

    if (!whisper_vad_detect_speech(m->ctx, samples, n_frames * frame_samples)) {
        return false;
    }

    const int n_probs = whisper_vad_n_probs(m->ctx);
    const float* probs = whisper_vad_probs(m->ctx);
    if (n_probs < n_frames || !probs) {
        SPEAKVAD_LOG_ERROR(m->log, "whisper_vad_infer_frames: got %d probabilities for %d frames",
                           n_probs, n_frames);
        return false;
    }

    for (int i = 0; i < n_frames; i++) {
        probs_out[i] = clamp_probability(probs[i]);
    }
    return true;
}

static bool whisper_vad_infer(void* user_data, const float* frame, int n_samples,
                              int sample_rate, float* prob_out) {
    auto* m = static_cast<WhisperVadModel*>(user_data);
    if (!m || !m->ctx || !frame || !prob_out) {
        return false;
    }

    if (sample_rate != WHISPER_VAD_SAMPLE_RATE || n_samples != kVadFrameSamples16k) {
        SPEAKVAD_LOG_ERROR(m->log, "whisper_vad_infer: unsupported frame shape %d samples @ %d Hz",
                           n_samples, sample_rate);
        return false;
    }

    if (!whisper_vad_detect_speech(m->ctx, frame, n_samples)) {
        return false;
    }

    const int n_probs = whisper_vad_n_probs(m->ctx);
    const float* probs = whisper_vad_probs(m->ctx);
    if (n_probs < 1 || !probs) {
        return false;
    }

    *prob_out = clamp_probability(probs[0]);
    return true;
}

WhisperVadModel* whisper_vad_model_load(const WhisperVadModelConfig& config,
                                        const speakvad::LogContext* log) {
    if (!config.model_path) {
        SPEAKVAD_LOG_ERROR(log, "whisper_vad_model_load: no VAD model path given");
        vad_model_print_install_instructions(stderr);
        return nullptr;
    }

    SPEAKVAD_LOG_INFO(log, "Loading Silero VAD model '%s'...", config.model_path);

    auto params = whisper_vad_default_context_params();
    params.n_threads  = config.n_threads;
    params.use_gpu    = config.use_gpu;
    params.gpu_device = config.gpu_device;

    whisper_vad_context* ctx = whisper_vad_init_from_file_with_params(config.model_path, params);
    if (!ctx) {
        SPEAKVAD_LOG_ERROR(log, "whisper_vad_model_load: failed to load VAD model '%s'",
                           config.model_path);
        vad_model_print_install_instructions(stderr);
        return nullptr;
    }

    auto* m = new WhisperVadModel();
    m->ctx = ctx;
    m->log = log;
    m->model.infer = whisper_vad_infer;
    m->model.infer_frames = whisper_vad_infer_frames;
    m->model.user_data = m;

    SPEAKVAD_LOG_INFO(log, "Silero VAD model loaded successfully");
    return m;
}

void whisper_vad_model_free(WhisperVadModel* m) {
    if (!m) return;

    if (m->ctx) {
        whisper_vad_free(m->ctx);
        m->ctx = nullptr;
    }

    delete m;
}

void vad_model_print_install_instructions(FILE* out) {
    fprintf(out, "\n");
    fprintf(out, "======================================================================\n");
    fprintf(out, "Voice activity detection needs the Silero VAD model in ggml format.\n");
    fprintf(out, "======================================================================\n");
    fprintf(out, "\n");
    fprintf(out, "Download it with the whisper.cpp helper script:\n");
    fprintf(out, "\n");
    fprintf(out, "  ./models/download-vad-model.sh silero-v5.1.2\n");
    fprintf(out, "\n");
    fprintf(out, "then pass the file with --vad-model models/ggml-silero-v5.1.2.bin\n");
    fprintf(out, "\n");
}
