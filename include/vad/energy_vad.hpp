#ifndef ENERGY_VAD_HPP
#define ENERGY_VAD_HPP

#include "vad/vad_model.hpp"

// RMS energy detector. A window whose RMS equals speechRms scores 0.5.
class EnergyVad : public VadModel {
public:
    struct Config {
        float speechRms = 0.02f;
        float noiseFloorRms = 0.002f;
    };

    EnergyVad();
    explicit EnergyVad(Config config);

    float score(const std::vector<float>& window) override;

    static float rms(const float* x, int n);

private:
    Config config_;
};

#endif
