#include "core/pipeline_config.hpp"

#include <cmath>

bool is_supported_window(int sampleRate, int windowSize) {
    switch (sampleRate) {
    case 8000:
        return windowSize == 256 || windowSize == 512 || windowSize == 768;
    case 16000:
        return windowSize == 512 || windowSize == 1024 || windowSize == 1536;
    default:
        return false;
    }
}

int PipelineConfig::samplesFor(float seconds) const {
    return (int)std::lround((double)seconds * sampleRate);
}

void PipelineConfig::validate() const {
    if (sampleRate != 8000 && sampleRate != 16000) {
        throw ConfigurationError("unsupported sample rate: " + std::to_string(sampleRate));
    }
    if (!is_supported_window(sampleRate, windowSize)) {
        throw ConfigurationError("window size " + std::to_string(windowSize) +
                                 " is not supported at " + std::to_string(sampleRate) + " Hz");
    }
    if (!(threshold > 0.0f && threshold < 1.0f)) {
        throw ConfigurationError("threshold must be in (0, 1)");
    }
    if (minSpeechSeconds <= 0.0f || minSilenceSeconds <= 0.0f || maxSpeechSeconds <= 0.0f) {
        throw ConfigurationError("durations must be positive");
    }
    if (maxSpeechSeconds < minSpeechSeconds) {
        throw ConfigurationError("max speech duration is shorter than min speech duration");
    }
    if (samplesFor(maxSpeechSeconds) < windowSize) {
        throw ConfigurationError("max speech duration is shorter than one window");
    }
    if (threads < 1) {
        throw ConfigurationError("threads must be >= 1");
    }
}
