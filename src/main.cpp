#include <torch/torch.h>
#include <iostream>
#include <vector>
#include <cmath>
#include <chrono>
#include <functional>
#include <string>
#include "decomposition.hpp"
#include "reconstruction.hpp"
#include "diagnostics.hpp"
#include "signals.hpp"
#include "utils.hpp"

// Decompose `x`, reconstruct `groups`, and compare the sum of all groups
// against `reference`.
void test_scenario(
    const std::string& name,
    const torch::Tensor& x,
    int64_t window,
    const ssa::GroupSpec& groups,
    const torch::Tensor& reference,
    double expected_max_error
) {
    std::cout << "Testing : " << name << std::endl;

    auto start = std::chrono::high_resolution_clock::now();
    ssa::Decomposition dec = ssa::decompose(x, window);
    auto rec = ssa::reconstruct(dec, groups);
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> elapsed = end - start;

    torch::Tensor total = torch::zeros_like(reference);
    for (auto const& entry : rec) {
        total += entry.second;
    }

    double max_error = (total - reference).abs().max().item<double>();
    double rel_error = (total - reference).norm().item<double>() / reference.norm().item<double>();

    std::vector<double> share = ssa::contributions(dec);
    double leading_share = 0.0;
    for (size_t i = 0; i < share.size() && i < 2; ++i) leading_share += share[i];

    std::cout << "N : " << dec.series_length() << ", L : " << dec.window_length()
              << ", K : " << dec.width() << ", d : " << dec.rank() << std::endl;
    std::cout << "Time : " << elapsed.count() << "s" << std::endl;
    std::cout << "Leading pair share : " << leading_share << std::endl;
    std::cout << "Max Error : " << max_error << std::endl;
    std::cout << "Relative Error : " << rel_error << std::endl;

    if (max_error < expected_max_error) {
        std::cout << "Result : SUCCESS" << std::endl;
    } else {
        std::cout << "Result : HIGH ERROR" << std::endl;
    }
    std::cout << std::endl;
}

int main(int argc, char* argv[]) {
    // Default seed
    int64_t seed = 42;

    // Check for seed
    if (argc > 1) {
        try {
            seed = std::stoll(argv[1]);
            std::cout << "Using seed : " << seed << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "Invalid seed '" << argv[1] << "', using default seed 42." << std::endl;
        }
    } else {
        std::cout << "No seed provided. Using default seed 42." << std::endl;
    }

    torch::NoGradGuard no_grad;
    ssa::SignalGenerator gen(static_cast<uint64_t>(seed));

    try {
        // Test 1: integers 1..10, all eigentriples
        torch::Tensor ramp = ssa::utils::to_series({1, 2, 3, 4, 5, 6, 7, 8, 9, 10});
        test_scenario("Full Reconstruction 1..10", ramp, 5, {{"all", {1, 2, 3, 4, 5}}}, ramp, 1e-9);

        // Test 2: noiseless sinusoid is exactly rank 2
        torch::Tensor wave = gen.sinusoid(100, 10.0);
        test_scenario("Pure Sinusoid Lead Pair", wave, 20, {{"lead", {1, 2}}}, wave, 1e-6);

        // Test 3: five periods of 260 samples with sd 0.5 noise, leading pair
        // against the clean signal
        int64_t period = 260;
        int64_t n = 5 * period;
        torch::Tensor clean = gen.sinusoid(n, static_cast<double>(period));
        torch::Tensor noisy = clean + gen.gaussian_noise(n, 0.5);
        test_scenario("Noisy Sinusoid Lead Pair", noisy, n / 2, {{"one", {1, 2}}}, clean, 0.25);

        // Test 4: trend + oscillation, split into groups that cover everything
        torch::Tensor mixed = gen.linear_trend(n, 1.0 / period) + clean + 0.5 * gen.sinusoid(n, 2.0 * period);
        ssa::Decomposition dec = ssa::decompose(mixed, 2 * period, /*truncate_to=*/6);
        std::cout << "Singular values (truncated to 6) :";
        for (double s : ssa::singular_values(dec)) std::cout << " " << s;
        std::cout << std::endl << std::endl;

        ssa::GroupSpec split = {{"trend", {1}}, {"oscillation", {2, 3, 4, 5}}};
        ssa::Decomposition full = ssa::decompose(mixed, 2 * period);
        split["residual"] = ssa::residual_indices(full, split);
        test_scenario("Trend + Oscillation + Residual", mixed, 2 * period, split, mixed, 1e-8);
    } catch (const ssa::SsaError& e) {
        std::cerr << "SSA error : " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
