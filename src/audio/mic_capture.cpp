#include "audio/mic_capture.hpp"

#include "core/log.hpp"

#include <portaudio.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace {

const char* kTag = "Mic";

void pa_check(PaError e, const char* msg) {
    if (e != paNoError) {
        throw std::runtime_error(std::string(msg) + " (" + std::to_string((int)e) + "): " + Pa_GetErrorText(e));
    }
}

} // namespace

// Constructor
MicCapture::MicCapture(Config config) : config_(config) {
    pa_check(Pa_Initialize(), "Pa_Initialize");

    PaStreamParameters inParams{};
    inParams.device = Pa_GetDefaultInputDevice();
    if (inParams.device == paNoDevice) {
        Pa_Terminate();
        throw std::runtime_error("No default input device");
    }

    const PaDeviceInfo* info = Pa_GetDeviceInfo(inParams.device);
    log_info(kTag, std::string("input device: ") + (info ? info->name : "(unknown)"));

    inParams.channelCount = 1;
    inParams.sampleFormat = paInt16;
    inParams.suggestedLatency = info ? info->defaultLowInputLatency : 0.05;
    inParams.hostApiSpecificStreamInfo = nullptr;

    const PaError e = Pa_OpenStream(&stream_, &inParams, nullptr,
                                    config_.sampleRate, config_.framesPerBuffer,
                                    paNoFlag, nullptr, nullptr);
    if (e != paNoError) {
        Pa_Terminate();
        pa_check(e, "Pa_OpenStream");
    }
}

// Destructor
MicCapture::~MicCapture() {
    if (stream_) {
        Pa_StopStream(stream_);
        Pa_CloseStream(stream_);
    }
    Pa_Terminate();
}

void MicCapture::run(const ChunkCallback& onChunk, const std::atomic<bool>& stop) {
    pa_check(Pa_StartStream(stream_), "Pa_StartStream");
    log_info(kTag, "listening...");

    std::vector<int16_t> buff(config_.framesPerBuffer);

    while (!stop.load()) {
        PaError e = Pa_ReadStream(stream_, buff.data(), config_.framesPerBuffer);
        if (e == paInputOverflowed) {
            log_warn(kTag, "input overflowed");
            continue;
        }
        pa_check(e, "Pa_ReadStream");

        AudioChunk chunk(buff.size() * 2);
        for (size_t i = 0; i < buff.size(); ++i) {
            const uint16_t s = (uint16_t)buff[i];
            chunk[2 * i] = (uint8_t)(s & 0xff);
            chunk[2 * i + 1] = (uint8_t)(s >> 8);
        }

        if (!onChunk(std::move(chunk))) break;
    }

    pa_check(Pa_StopStream(stream_), "Pa_StopStream");
}
