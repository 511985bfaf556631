#ifndef WHISPER_RECOGNIZER_HPP
#define WHISPER_RECOGNIZER_HPP

#include "stt/speech_recognizer.hpp"

#include <string>
#include <vector>

struct whisper_context;

class WhisperRecognizer : public SpeechRecognizer {
public:
    struct Config {
        std::string modelPath = "models/whisper/ggml-base.en-q5_1.bin";
        bool useGpu = false;
        float noSpeechThreshold = 0.6f;
    };

    explicit WhisperRecognizer(const Config& config);
    ~WhisperRecognizer() override;

    WhisperRecognizer(const WhisperRecognizer&) = delete;
    WhisperRecognizer& operator=(const WhisperRecognizer&) = delete;

    // Thread-safe: each call runs on its own whisper_state.
    std::vector<std::string> recognize(const std::vector<uint8_t>& wav,
                                       const RecognitionOptions& options,
                                       const CancellationToken* cancel) override;

private:
    Config config_;
    whisper_context* context_ = nullptr;
};

#endif
