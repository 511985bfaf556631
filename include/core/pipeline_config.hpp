#ifndef PIPELINE_CONFIG_HPP
#define PIPELINE_CONFIG_HPP

#include <stdexcept>
#include <string>

class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

struct PipelineConfig {
    int sampleRate = 16000;
    int windowSize = 512;

    float threshold = 0.3f;
    float minSpeechSeconds = 0.5f;
    float minSilenceSeconds = 0.6f;
    float maxSpeechSeconds = 15.0f;

    int threads = 4;

    std::string language = "en";
    float temperature = 0.2f;

    // Throws ConfigurationError.
    void validate() const;

    int samplesFor(float seconds) const;
    float windowMs() const { return 1000.0f * windowSize / sampleRate; }
};

// Window sizes the classification model is trained for at a given sample rate.
bool is_supported_window(int sampleRate, int windowSize);

#endif
