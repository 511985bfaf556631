#ifndef WINDOW_ACCUMULATOR_HPP
#define WINDOW_ACCUMULATOR_HPP

#include <cstddef>
#include <vector>

using Window = std::vector<float>;

// Buffers samples across chunk boundaries and cuts them into fixed-size windows.
// Never emits a partial window; the remainder waits for the next push.
class WindowAccumulator {
public:
    explicit WindowAccumulator(int windowSize);

    std::vector<Window> push(const std::vector<float>& samples);

    size_t pending() const { return buffer_.size(); }
    int windowSize() const { return windowSize_; }

    // Hands back the unconsumed remainder and empties the buffer.
    std::vector<float> drain();

private:
    int windowSize_;
    std::vector<float> buffer_;
};

#endif
