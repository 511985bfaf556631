#ifndef SPEECH_RECOGNIZER_HPP
#define SPEECH_RECOGNIZER_HPP

#include <cstdint>
#include <string>
#include <vector>

class CancellationToken;

struct RecognitionOptions {
    int sampleRate = 16000;
    std::string language = "en";
    float temperature = 0.2f;
    int threads = 4;
};

// Black-box transcription engine. Takes a WAV container, returns text fragments in order.
// Implementations throw on failure, and throw Cancelled when the token fires mid-call.
class SpeechRecognizer {
public:
    virtual ~SpeechRecognizer() = default;

    virtual std::vector<std::string> recognize(const std::vector<uint8_t>& wav,
                                               const RecognitionOptions& options,
                                               const CancellationToken* cancel) = 0;
};

#endif
