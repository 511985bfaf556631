#ifndef TEST_AUDIO_HPP
#define TEST_AUDIO_HPP

#include <cmath>
#include <cstdint>
#include <vector>

#include "audio/chunk_decoder.hpp"
#include "audio/wav_codec.hpp"

namespace test_audio {

constexpr double kPi = 3.14159265358979323846;

inline std::vector<float> constant(float seconds, float level, int rate = 16000) {
    return std::vector<float>((size_t)std::lround(seconds * rate), level);
}

inline std::vector<float> silence(float seconds, int rate = 16000) {
    return constant(seconds, 0.0f, rate);
}

inline std::vector<float> sine(size_t samples, float amp = 0.5f, float hz = 440.0f, int rate = 16000) {
    std::vector<float> out(samples);
    for (size_t i = 0; i < samples; ++i) {
        out[i] = amp * (float)std::sin(2.0 * kPi * hz * (double)i / rate);
    }
    return out;
}

inline std::vector<float> concat(std::vector<float> a, const std::vector<float>& b) {
    a.insert(a.end(), b.begin(), b.end());
    return a;
}

// Floats -> 16-bit LE PCM bytes.
inline AudioChunk to_chunk(const std::vector<float>& samples) {
    AudioChunk out;
    out.reserve(samples.size() * 2);
    for (float s : samples) {
        const uint16_t v = (uint16_t)quantize_sample(s);
        out.push_back((uint8_t)(v & 0xff));
        out.push_back((uint8_t)(v >> 8));
    }
    return out;
}

} // namespace test_audio

#endif
