#ifndef WAV_CODEC_HPP
#define WAV_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

class WavFormatError : public std::runtime_error {
public:
    explicit WavFormatError(const std::string& what) : std::runtime_error(what) {}
};

struct WavAudio {
    int sampleRate = 0;
    int channels = 0;
    std::vector<float> samples; // mono mix, [-1, 1]
};

constexpr size_t kWavHeaderSize = 44;

// Canonical 44-byte RIFF/WAVE header + PCM16 little-endian payload.
std::vector<uint8_t> encode_wav_pcm16(const std::vector<float>& samples, int sampleRate, int channels = 1);

// Accepts PCM16 WAV only; skips unknown chunks. Throws WavFormatError.
WavAudio decode_wav_pcm16(const std::vector<uint8_t>& wav);

int16_t quantize_sample(float s);

#endif
