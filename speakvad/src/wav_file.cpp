#include "wav_file.h"

#include <algorithm>
#include <cstring>

struct riff_chunk {
    char id[4];
    uint32_t size;
};

// Body of a "fmt " chunk, without any extension bytes.
struct wav_fmt {
    uint16_t audio_format;
    uint16_t num_channels;
    uint32_t sample_rate;
    uint32_t byte_rate;
    uint16_t block_align;
    uint16_t bits_per_sample;
};

// Chunk bodies are padded to an even length; the pad byte is not in size.
static std::streamoff padded_size(uint32_t size) {
    return static_cast<std::streamoff>(size) + (size & 1);
}

static bool check_wav_fmt(const wav_fmt& fmt, const speakvad::LogContext* log) {
    if (fmt.audio_format != 1) {
        SPEAKVAD_LOG_ERROR(log, "Only PCM format supported");
        return false;
    }
    if (fmt.num_channels != 1) {
        SPEAKVAD_LOG_ERROR(log, "Only mono audio supported");
        return false;
    }
    if (fmt.bits_per_sample != 16) {
        SPEAKVAD_LOG_ERROR(log, "Only 16-bit audio supported");
        return false;
    }
    if (fmt.sample_rate == 0) {
        SPEAKVAD_LOG_ERROR(log, "Invalid WAV sample rate 0");
        return false;
    }
    return true;
}

bool wav_reader_open(WavReader& reader, const std::string& path, const speakvad::LogContext* log) {
    reader.file.open(path, std::ios::binary);
    if (!reader.file.is_open()) {
        SPEAKVAD_LOG_ERROR(log, "Failed to open WAV file: %s", path.c_str());
        return false;
    }

    riff_chunk riff;
    char wave[4];
    if (!reader.file.read(reinterpret_cast<char*>(&riff), sizeof(riff)) ||
        !reader.file.read(wave, sizeof(wave))) {
        SPEAKVAD_LOG_ERROR(log, "Failed to read WAV header");
        return false;
    }
    if (std::strncmp(riff.id, "RIFF", 4) != 0 || std::strncmp(wave, "WAVE", 4) != 0) {
        SPEAKVAD_LOG_ERROR(log, "Invalid WAV file format");
        return false;
    }

    wav_fmt fmt;
    bool have_fmt = false;

    // walk the chunk list up to "data"; "fmt " must come first
    riff_chunk chunk;
    while (reader.file.read(reinterpret_cast<char*>(&chunk), sizeof(chunk))) {
        if (std::strncmp(chunk.id, "fmt ", 4) == 0) {
            if (chunk.size < sizeof(wav_fmt)) {
                SPEAKVAD_LOG_ERROR(log, "WAV fmt chunk too short (%u bytes)", chunk.size);
                return false;
            }
            if (!reader.file.read(reinterpret_cast<char*>(&fmt), sizeof(fmt))) {
                SPEAKVAD_LOG_ERROR(log, "Failed to read WAV fmt chunk");
                return false;
            }
            if (!check_wav_fmt(fmt, log)) {
                return false;
            }
            have_fmt = true;
            reader.file.seekg(padded_size(chunk.size) - static_cast<std::streamoff>(sizeof(wav_fmt)),
                              std::ios::cur);
        } else if (std::strncmp(chunk.id, "data", 4) == 0) {
            if (!have_fmt) {
                SPEAKVAD_LOG_ERROR(log, "WAV data chunk before fmt chunk");
                return false;
            }
            reader.total_samples = chunk.size / 2;
            reader.sample_rate = fmt.sample_rate;
            reader.samples_read = 0;
            reader.valid = true;
            return true;
        } else {
            reader.file.seekg(padded_size(chunk.size), std::ios::cur);
        }
    }

    SPEAKVAD_LOG_ERROR(log, "Data chunk not found");
    return false;
}

int wav_reader_read(WavReader& reader, std::vector<float>& out, int n) {
    out.clear();
    if (!reader.valid) {
        return 0;
    }

    const int remaining = static_cast<int>(reader.total_samples - reader.samples_read);
    const int to_read = std::min(n, remaining);
    if (to_read <= 0) {
        return 0;
    }

    std::vector<int16_t> pcm(to_read);
    reader.file.read(reinterpret_cast<char*>(pcm.data()), to_read * static_cast<int>(sizeof(int16_t)));
    const int actually_read = static_cast<int>(reader.file.gcount() / static_cast<std::streamsize>(sizeof(int16_t)));

    out.resize(actually_read);
    for (int i = 0; i < actually_read; ++i) {
        out[i] = static_cast<float>(pcm[i]) / 32768.0f;
    }

    reader.samples_read += static_cast<uint32_t>(actually_read);
    return actually_read;
}

bool wav_load_file(const std::string& path, std::vector<float>& samples, uint32_t& sample_rate,
                   const speakvad::LogContext* log) {
    WavReader reader;
    if (!wav_reader_open(reader, path, log)) {
        return false;
    }

    samples.clear();
    samples.reserve(reader.total_samples);

    std::vector<float> block;
    while (wav_reader_read(reader, block, 16384) > 0) {
        samples.insert(samples.end(), block.begin(), block.end());
    }

    if (samples.size() != reader.total_samples) {
        SPEAKVAD_LOG_WARN(log, "WAV file truncated: expected %u samples, read %zu",
                          reader.total_samples, samples.size());
    }

    sample_rate = reader.sample_rate;
    return true;
}

bool wav_write_file(const std::string& path, const float* samples, int n, uint32_t sample_rate,
                    const speakvad::LogContext* log) {
    if (n < 0 || (n > 0 && !samples)) {
        return false;
    }

    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        SPEAKVAD_LOG_ERROR(log, "Failed to open %s for writing", path.c_str());
        return false;
    }

    const uint32_t data_size = static_cast<uint32_t>(n) * 2;

    riff_chunk riff;
    std::memcpy(riff.id, "RIFF", 4);
    riff.size = static_cast<uint32_t>(4 + sizeof(riff_chunk) + sizeof(wav_fmt) + sizeof(riff_chunk)) + data_size;

    riff_chunk fmt_chunk;
    std::memcpy(fmt_chunk.id, "fmt ", 4);
    fmt_chunk.size = static_cast<uint32_t>(sizeof(wav_fmt));

    wav_fmt fmt;
    fmt.audio_format = 1;
    fmt.num_channels = 1;
    fmt.sample_rate = sample_rate;
    fmt.byte_rate = sample_rate * 2;
    fmt.block_align = 2;
    fmt.bits_per_sample = 16;

    riff_chunk data_chunk;
    std::memcpy(data_chunk.id, "data", 4);
    data_chunk.size = data_size;

    file.write(reinterpret_cast<const char*>(&riff), sizeof(riff));
    file.write("WAVE", 4);
    file.write(reinterpret_cast<const char*>(&fmt_chunk), sizeof(fmt_chunk));
    file.write(reinterpret_cast<const char*>(&fmt), sizeof(fmt));
    file.write(reinterpret_cast<const char*>(&data_chunk), sizeof(data_chunk));

    std::vector<int16_t> pcm(n);
    for (int i = 0; i < n; ++i) {
        const float s = std::max(-1.0f, std::min(1.0f, samples[i]));
        pcm[i] = static_cast<int16_t>(s * 32767.0f);
    }
    file.write(reinterpret_cast<const char*>(pcm.data()), static_cast<std::streamsize>(data_size));

    if (!file.good()) {
        SPEAKVAD_LOG_ERROR(log, "Failed to write WAV data to %s", path.c_str());
        return false;
    }

    SPEAKVAD_LOG_DEBUG(log, "Audio saved successfully to %s", path.c_str());
    return true;
}
