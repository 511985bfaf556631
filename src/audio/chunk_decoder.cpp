#include "audio/chunk_decoder.hpp"

std::vector<float> decode_chunk(const AudioChunk& chunk) {
    return decode_chunk(chunk.data(), chunk.size());
}

std::vector<float> decode_chunk(const uint8_t* data, size_t size) {
    if (size % 2 != 0) {
        throw MalformedAudioChunk("odd chunk length for 16-bit PCM: " + std::to_string(size));
    }

    const size_t n = size / 2;
    std::vector<float> out(n);
    for (size_t i = 0; i < n; ++i) {
        const int16_t s = (int16_t)((uint16_t)data[2 * i] | ((uint16_t)data[2 * i + 1] << 8));
        out[i] = (float)s / 32768.0f;
    }
    return out;
}
