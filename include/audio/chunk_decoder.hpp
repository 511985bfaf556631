#ifndef CHUNK_DECODER_HPP
#define CHUNK_DECODER_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

using AudioChunk = std::vector<uint8_t>;

class MalformedAudioChunk : public std::invalid_argument {
public:
    explicit MalformedAudioChunk(const std::string& what) : std::invalid_argument(what) {}
};

// 16-bit little-endian mono PCM -> floats in [-1, 1). Throws MalformedAudioChunk on odd length.
std::vector<float> decode_chunk(const AudioChunk& chunk);

std::vector<float> decode_chunk(const uint8_t* data, size_t size);

#endif
