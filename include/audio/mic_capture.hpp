#ifndef MIC_CAPTURE_HPP
#define MIC_CAPTURE_HPP

#include "audio/chunk_decoder.hpp"

#include <atomic>
#include <functional>

typedef void PaStream;

// Default input device -> 16-bit LE mono chunks.
class MicCapture {
public:
    struct Config {
        int sampleRate = 16000;
        int framesPerBuffer = 1600; // 100 ms at 16 kHz
    };

    using ChunkCallback = std::function<bool(AudioChunk chunk)>;

    explicit MicCapture(Config config);
    ~MicCapture();

    MicCapture(const MicCapture&) = delete;
    MicCapture& operator=(const MicCapture&) = delete;

    // Blocks until stop is set or onChunk returns false.
    void run(const ChunkCallback& onChunk, const std::atomic<bool>& stop);

private:
    Config config_;
    PaStream* stream_ = nullptr;
};

#endif
