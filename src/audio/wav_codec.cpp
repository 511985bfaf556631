#include "audio/wav_codec.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>

namespace {

void put_tag(std::vector<uint8_t>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

void put_u16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back((uint8_t)(v & 0xff));
    out.push_back((uint8_t)(v >> 8));
}

void put_u32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back((uint8_t)((v >> (8 * i)) & 0xff));
}

uint16_t get_u16(const std::vector<uint8_t>& in, size_t pos) {
    return (uint16_t)(in[pos] | (in[pos + 1] << 8));
}

uint32_t get_u32(const std::vector<uint8_t>& in, size_t pos) {
    return (uint32_t)in[pos] | ((uint32_t)in[pos + 1] << 8) |
           ((uint32_t)in[pos + 2] << 16) | ((uint32_t)in[pos + 3] << 24);
}

bool tag_is(const std::vector<uint8_t>& in, size_t pos, const char* tag) {
    return std::memcmp(in.data() + pos, tag, 4) == 0;
}

} // namespace

int16_t quantize_sample(float s) {
    const float c = std::max(-1.0f, std::min(1.0f, s));
    return (int16_t)std::lround(c * 32767.0f);
}

std::vector<uint8_t> encode_wav_pcm16(const std::vector<float>& samples, int sampleRate, int channels) {
    const uint16_t bitsPerSample = 16;
    const uint16_t blockAlign = (uint16_t)(channels * bitsPerSample / 8);
    const uint32_t byteRate = (uint32_t)sampleRate * blockAlign;
    const uint32_t dataSize = (uint32_t)(samples.size() * 2);

    std::vector<uint8_t> out;
    out.reserve(kWavHeaderSize + dataSize);

    put_tag(out, "RIFF");
    put_u32(out, 36 + dataSize);
    put_tag(out, "WAVE");

    put_tag(out, "fmt ");
    put_u32(out, 16);
    put_u16(out, 1); // PCM
    put_u16(out, (uint16_t)channels);
    put_u32(out, (uint32_t)sampleRate);
    put_u32(out, byteRate);
    put_u16(out, blockAlign);
    put_u16(out, bitsPerSample);

    put_tag(out, "data");
    put_u32(out, dataSize);
    for (float s : samples) put_u16(out, (uint16_t)quantize_sample(s));

    return out;
}

WavAudio decode_wav_pcm16(const std::vector<uint8_t>& wav) {
    if (wav.size() < 12 || !tag_is(wav, 0, "RIFF") || !tag_is(wav, 8, "WAVE")) {
        throw WavFormatError("not a RIFF/WAVE container");
    }

    WavAudio audio;
    bool haveFmt = false;
    size_t pos = 12;

    while (pos + 8 <= wav.size()) {
        const uint32_t size = get_u32(wav, pos + 4);
        const size_t body = pos + 8;
        if (body + size > wav.size()) throw WavFormatError("truncated chunk");

        if (tag_is(wav, pos, "fmt ")) {
            if (size < 16) throw WavFormatError("fmt chunk too small");
            const uint16_t format = get_u16(wav, body);
            audio.channels = get_u16(wav, body + 2);
            audio.sampleRate = (int)get_u32(wav, body + 4);
            const uint16_t bits = get_u16(wav, body + 14);
            if (format != 1 || bits != 16) throw WavFormatError("only PCM16 is supported");
            if (audio.channels < 1) throw WavFormatError("zero channels");
            haveFmt = true;
        } else if (tag_is(wav, pos, "data")) {
            if (!haveFmt) throw WavFormatError("data chunk before fmt chunk");
            const size_t frames = size / (2u * audio.channels);
            audio.samples.resize(frames);
            for (size_t f = 0; f < frames; ++f) {
                float acc = 0.0f;
                for (int c = 0; c < audio.channels; ++c) {
                    acc += (float)(int16_t)get_u16(wav, body + 2 * (f * audio.channels + c)) / 32768.0f;
                }
                audio.samples[f] = acc / audio.channels;
            }
            return audio;
        }

        pos = body + size + (size & 1);
    }

    throw WavFormatError("missing data chunk");
}
