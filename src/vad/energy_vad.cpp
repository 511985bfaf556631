#include "vad/energy_vad.hpp"

#include "core/pipeline_config.hpp"

#include <algorithm>
#include <cmath>

EnergyVad::EnergyVad() : EnergyVad(Config{}) {}

EnergyVad::EnergyVad(Config config) : config_(config) {
    if (config_.speechRms <= 0.0f || config_.noiseFloorRms < 0.0f) {
        throw ConfigurationError("energy VAD levels must be positive");
    }
}

float EnergyVad::rms(const float* x, int n) {
    double acc = 0.0;
    for (int i = 0; i < n; ++i) acc += (double)x[i] * (double)x[i];
    acc /= std::max(1, n);
    return (float)std::sqrt(acc);
}

float EnergyVad::score(const std::vector<float>& window) {
    const float r = rms(window.data(), (int)window.size());
    if (r <= config_.noiseFloorRms) return 0.0f;
    return std::min(1.0f, r / (r + config_.speechRms));
}
