#include "resampler.h"

#include <cmath>

namespace speakvad {

int resampled_length(int n_samples, int from_rate, int to_rate) {
    if (n_samples <= 0 || from_rate <= 0 || to_rate <= 0) {
        return 0;
    }
    if (from_rate == to_rate) {
        return n_samples;
    }
    const double duration = static_cast<double>(n_samples) / static_cast<double>(from_rate);
    return static_cast<int>(std::lround(duration * static_cast<double>(to_rate)));
}

bool resample_linear(const float* samples, int n_samples, int from_rate, int to_rate,
                     std::vector<float>& out, const LogContext* log) {
    out.clear();

    if (from_rate <= 0 || to_rate <= 0) {
        SPEAKVAD_LOG_ERROR(log, "resample_linear: invalid rates %d -> %d", from_rate, to_rate);
        return false;
    }

    if (from_rate == to_rate) {
        if (samples && n_samples > 0) {
            out.assign(samples, samples + n_samples);
        }
        return true;
    }

    if (!samples || n_samples < 2) {
        SPEAKVAD_LOG_ERROR(log, "resample_linear: need at least 2 samples to interpolate, got %d",
                           n_samples);
        return false;
    }

    const int new_length = resampled_length(n_samples, from_rate, to_rate);
    if (new_length <= 0) {
        return true;
    }

    out.resize(new_length);
    if (new_length == 1) {
        out[0] = samples[0];
        return true;
    }

    // np.linspace(0, n - 1, new_length) positions
    const double step = static_cast<double>(n_samples - 1) / static_cast<double>(new_length - 1);
    for (int i = 0; i < new_length; ++i) {
        const double pos = (i == new_length - 1) ? static_cast<double>(n_samples - 1) : i * step;
        const int i0 = static_cast<int>(pos);
        if (i0 >= n_samples - 1) {
            out[i] = samples[n_samples - 1];
            continue;
        }
        const double frac = pos - static_cast<double>(i0);
        const double a = samples[i0];
        const double b = samples[i0 + 1];
        out[i] = static_cast<float>(a + (b - a) * frac);
    }

    return true;
}

}  // namespace speakvad
