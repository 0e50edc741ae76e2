#pragma once

#include "log.h"

#include <vector>

namespace speakvad {

// Output length for a linear resample from from_rate to to_rate.
int resampled_length(int n_samples, int from_rate, int to_rate);

// Linear-interpolation resampler. Equal rates copy the input unchanged.
// Otherwise the output holds round(n / from_rate * to_rate) samples taken at
// uniformly spaced positions over [0, n - 1] of the input.
// Returns false (and leaves out empty) for non-positive rates, or when the
// rates differ and fewer than 2 input samples are given.
bool resample_linear(const float* samples, int n_samples, int from_rate, int to_rate,
                     std::vector<float>& out, const LogContext* log = nullptr);

}  // namespace speakvad
