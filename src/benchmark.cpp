#include <torch/torch.h>
#include <iostream>
#include <vector>
#include <chrono>
#include <iomanip>
#include <string>
#include <sys/resource.h>

#include "decomposition.hpp"
#include "reconstruction.hpp"
#include "signals.hpp"

long get_peak_memory_kb() {
    struct rusage usage;
    getrusage(RUSAGE_SELF, &usage);
    return usage.ru_maxrss;
}

void run_benchmark(int64_t length, int64_t rank, const std::string& mode) {
    // Generate Data
    ssa::SignalGenerator gen(42);
    torch::Tensor x = gen.sinusoid(length, 50.0) + gen.gaussian_noise(length, 0.5);
    int64_t window = length / 2;

    // Measure Baseline Memory (Data only)
    long mem_data_loaded = get_peak_memory_kb();

    // Run Decomposition
    auto start = std::chrono::high_resolution_clock::now();

    std::optional<int64_t> truncate_to;
    if (mode == "TRUNC") {
        truncate_to = rank;
    }
    ssa::Decomposition dec = ssa::decompose(x, window, truncate_to);

    auto mid = std::chrono::high_resolution_clock::now();

    ssa::reconstruct(dec, ssa::GroupSpec{{"lead", {1, 2}}});

    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> decompose_time = mid - start;
    std::chrono::duration<double> reconstruct_time = end - mid;

    // Measure Peak Memory
    long mem_final_peak = get_peak_memory_kb();
    double peak_mb = mem_final_peak / 1024.0;

    // Approximate overhead (Algorithm Peak - Data Load Peak)
    long mem_algo_overhead = mem_final_peak - mem_data_loaded;
    double overhead_mb = mem_algo_overhead / 1024.0;

    std::cout << length << "," << mode << "," << dec.rank() << ","
              << std::fixed << std::setprecision(6) << decompose_time.count() << ","
              << reconstruct_time.count() << ","
              << std::fixed << std::setprecision(2) << peak_mb << ","
              << overhead_mb << std::endl;
}

int main(int argc, char* argv[]) {
    torch::NoGradGuard no_grad;

    if (argc < 2) {
        std::cerr << "Usage : ./ssa_benchmark FULL/TRUNC" << std::endl;
        return 1;
    }

    std::string mode = argv[1];
    if (mode != "FULL" && mode != "TRUNC") {
        std::cerr << "Unknown mode: " << mode << std::endl;
        return 1;
    }

    std::cout << "Length,Mode,Rank,Decompose(s),Reconstruct(s),Peak Memory(MB),Algo Overhead(MB)" << std::endl;

    std::vector<int64_t> lengths = {256, 512, 1024, 2048, 4096};
    int64_t fixed_rank = 10;

    for (int64_t n : lengths) {
        try {
            run_benchmark(n, fixed_rank, mode);
        } catch (const ssa::SsaError& e) {
            std::cerr << "Length " << n << " failed: " << e.what() << std::endl;
            return 1;
        }
    }

    return 0;
}
