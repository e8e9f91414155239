#include "signals.hpp"
#include "utils.hpp"
#include <ATen/CPUGeneratorImpl.h>
#include <cmath>
#include <string>

namespace ssa {

SignalGenerator::SignalGenerator(uint64_t seed)
    : gen_(at::detail::createCPUGenerator(seed)) {}

torch::Tensor SignalGenerator::sinusoid(int64_t n, double period, double amplitude, double phase) const {
    if (period <= 0.0) {
        throw SsaError("Sinusoid period must be positive, got " + std::to_string(period));
    }
    torch::Tensor t = torch::arange(n, utils::real_options());
    return amplitude * torch::sin(2.0 * M_PI * t / period + phase);
}

torch::Tensor SignalGenerator::linear_trend(int64_t n, double slope, double intercept) const {
    return intercept + slope * torch::arange(n, utils::real_options());
}

torch::Tensor SignalGenerator::gaussian_noise(int64_t n, double sd) {
    if (sd < 0.0) {
        throw SsaError("Noise standard deviation must be non-negative, got " + std::to_string(sd));
    }
    return sd * torch::randn({n}, gen_, utils::real_options());
}

}
