#pragma once
#include <torch/torch.h>

#include "ssa_errors.hpp"

namespace ssa {

// Seeded source of synthetic test series. Owns its own generator so that
// results do not depend on torch's global seed.
class SignalGenerator {
public:
    explicit SignalGenerator(uint64_t seed);

    // amplitude * sin(2 pi t / period + phase), t = 0..n-1
    torch::Tensor sinusoid(int64_t n, double period, double amplitude = 1.0, double phase = 0.0) const;

    // intercept + slope * t
    torch::Tensor linear_trend(int64_t n, double slope, double intercept = 0.0) const;

    // N(0, sd^2) white noise; advances the generator
    torch::Tensor gaussian_noise(int64_t n, double sd);

private:
    at::Generator gen_;
};

}
