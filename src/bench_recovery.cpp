#include <torch/torch.h>
#include <iostream>
#include <vector>
#include <iomanip>
#include <cmath>
#include <algorithm>
#include <string>

#include "decomposition.hpp"
#include "reconstruction.hpp"
#include "signals.hpp"

// RMSE of the leading pair against the clean sinusoid
double recovery_error(const torch::Tensor& clean, const torch::Tensor& noisy, int64_t window) {
    ssa::Decomposition dec = ssa::decompose(noisy, window);
    auto rec = ssa::reconstruct(dec, ssa::GroupSpec{{"lead", {1, 2}}});
    return (rec.at("lead") - clean).pow(2).mean().sqrt().item<double>();
}

int main(int argc, char* argv[]) {
    int64_t seed = 42;
    int64_t length = 1300;
    double period = 260.0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--seed") {
            if (i + 1 < argc) seed = std::stoll(argv[++i]);
            else { std::cerr << "Error: --seed needs arg.\n"; return 1; }
        } else if (arg == "--length") {
            if (i + 1 < argc) length = std::stoll(argv[++i]);
            else { std::cerr << "Error: --length needs arg.\n"; return 1; }
        } else if (arg == "--period") {
            if (i + 1 < argc) period = std::stod(argv[++i]);
            else { std::cerr << "Error: --period needs arg.\n"; return 1; }
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return 1;
        }
    }

    std::cerr << "Config -> Seed: " << seed
              << " | Length: " << length
              << " | Period: " << period << std::endl;

    torch::NoGradGuard no_grad;

    // Window lengths as fractions of the series length
    std::vector<double> fractions = {0.1, 0.25, 0.5};

    std::cout << "NoiseSD";
    for (double f : fractions) std::cout << ",L=" << f << "N";
    std::cout << std::endl;

    for (double sd = 0.0; sd <= 2.0 + 1e-12; sd += 0.25) {
        // Same noise draw for every window length
        ssa::SignalGenerator gen(static_cast<uint64_t>(seed));
        torch::Tensor clean = gen.sinusoid(length, period);
        torch::Tensor noisy = clean + gen.gaussian_noise(length, sd);

        std::cout << std::fixed << std::setprecision(2) << sd;
        for (double f : fractions) {
            int64_t window = std::max<int64_t>(2, static_cast<int64_t>(f * length));
            try {
                std::cout << "," << std::scientific << std::setprecision(4) << recovery_error(clean, noisy, window);
            } catch (const ssa::SsaError& e) {
                std::cerr << "sd " << sd << ", L " << window << ": " << e.what() << std::endl;
                std::cout << ",nan";
            }
        }
        std::cout << std::fixed << std::endl;
    }

    return 0;
}
