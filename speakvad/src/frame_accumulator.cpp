#include "frame_accumulator.h"

#include <cmath>

FrameAccumulator::FrameAccumulator(int input_rate, int vad_rate, int frame_samples)
    : target_buffer_samples_(1) {
    if (input_rate > 0 && vad_rate > 0 && frame_samples > 0) {
        // ceil so that round(target * vad_rate / input_rate) >= frame_samples
        const double exact = static_cast<double>(frame_samples) * input_rate / vad_rate;
        target_buffer_samples_ = static_cast<int>(std::ceil(exact - 1e-9));
        if (target_buffer_samples_ < 2) {
            target_buffer_samples_ = 2;
        }
    }
    pending_.reserve(static_cast<size_t>(target_buffer_samples_) * 4);
}

bool FrameAccumulator::push(const float* samples, int n) {
    if (samples != nullptr && n > 0) {
        pending_.insert(pending_.end(), samples, samples + n);
    }
    return static_cast<int>(pending_.size()) >= target_buffer_samples_;
}

void FrameAccumulator::take(std::vector<float>& out) {
    out.swap(pending_);
    pending_.clear();
}

void FrameAccumulator::reset() {
    pending_.clear();
}

int FrameAccumulator::pending() const {
    return static_cast<int>(pending_.size());
}

int FrameAccumulator::target_buffer_samples() const {
    return target_buffer_samples_;
}
