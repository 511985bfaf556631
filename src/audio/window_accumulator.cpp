#include "audio/window_accumulator.hpp"

#include "core/pipeline_config.hpp"

#include <string>

WindowAccumulator::WindowAccumulator(int windowSize) : windowSize_(windowSize) {
    if (windowSize_ <= 0) {
        throw ConfigurationError("window size must be positive: " + std::to_string(windowSize_));
    }
    buffer_.reserve((size_t)windowSize_ * 2);
}

std::vector<Window> WindowAccumulator::push(const std::vector<float>& samples) {
    buffer_.insert(buffer_.end(), samples.begin(), samples.end());

    const size_t numWindows = buffer_.size() / (size_t)windowSize_;
    std::vector<Window> windows;
    windows.reserve(numWindows);

    for (size_t i = 0; i < numWindows; ++i) {
        auto first = buffer_.begin() + (std::ptrdiff_t)(i * windowSize_);
        windows.emplace_back(first, first + windowSize_);
    }

    buffer_.erase(buffer_.begin(), buffer_.begin() + (std::ptrdiff_t)(numWindows * windowSize_));
    return windows;
}

std::vector<float> WindowAccumulator::drain() {
    std::vector<float> rest;
    rest.swap(buffer_);
    return rest;
}
