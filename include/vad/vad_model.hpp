#ifndef VAD_MODEL_HPP
#define VAD_MODEL_HPP

#include <vector>

// Speech probability for one window, in [0, 1].
class VadModel {
public:
    virtual ~VadModel() = default;

    virtual float score(const std::vector<float>& window) = 0;
};

#endif
