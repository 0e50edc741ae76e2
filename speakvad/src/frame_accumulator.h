#pragma once

#include <vector>

// Collects input-rate audio until one buffer is large enough to yield at least
// one model frame after resampling. Samples below the trigger size stay
// pending across calls.
class FrameAccumulator {
public:
    FrameAccumulator(int input_rate, int vad_rate, int frame_samples);

    // Returns true when the pending buffer reached target_buffer_samples().
    bool push(const float* samples, int n);

    // Moves the whole pending buffer into out and clears it.
    void take(std::vector<float>& out);

    void reset();

    int pending() const;
    int target_buffer_samples() const;

private:
    std::vector<float> pending_;
    int target_buffer_samples_;
};
