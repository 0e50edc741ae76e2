#pragma once

#include "log.h"

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

// Incremental reader for 16-bit PCM mono WAV files at any sample rate.
struct WavReader {
    std::ifstream file;
    uint32_t sample_rate = 0;
    uint32_t total_samples = 0;
    uint32_t samples_read = 0;
    bool valid = false;
};

bool wav_reader_open(WavReader& reader, const std::string& path, const speakvad::LogContext* log);

// Read up to n samples as floats in [-1, 1). Returns the number read, 0 at end.
int wav_reader_read(WavReader& reader, std::vector<float>& out, int n);

bool wav_load_file(const std::string& path, std::vector<float>& samples, uint32_t& sample_rate,
                   const speakvad::LogContext* log);

// Write float samples as 16-bit PCM mono, clamping to [-1, 1].
bool wav_write_file(const std::string& path, const float* samples, int n, uint32_t sample_rate,
                    const speakvad::LogContext* log);
