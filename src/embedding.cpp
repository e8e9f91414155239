#include "embedding.hpp"
#include "utils.hpp"
#include <string>

namespace ssa {

int64_t validate_window(const torch::Tensor& series, int64_t L) {
    if (series.dim() != 1) {
        throw SsaError("Series must be 1-D, got " + std::to_string(series.dim()) + " dimensions");
    }

    int64_t N = series.size(0);
    if (N < 2) {
        throw EmptySeries("Series needs at least 2 samples, got " + std::to_string(N));
    }
    if (L < 2 || L > N - 1) {
        throw InvalidWindowLength("Window length " + std::to_string(L) +
                                  " outside [2, " + std::to_string(N - 1) + "]");
    }
    return N - L + 1;
}

torch::Tensor embed(const torch::Tensor& series, int64_t L, const CancelToken* cancel) {
    validate_window(series, L);
    check_cancelled(cancel, "embedding");

    torch::Tensor x = series.to(torch::kFloat64);

    // unfold gives the K lagged windows as rows (K x L)
    torch::Tensor windows = x.unfold(/*dimension=*/0, /*size=*/L, /*step=*/1);
    return windows.t().clone(at::MemoryFormat::Contiguous);
}

torch::Tensor embed(const std::vector<double>& series, int64_t L, const CancelToken* cancel) {
    return embed(utils::to_series(series), L, cancel);
}

double trajectory_entry(const torch::Tensor& series, int64_t L, int64_t i, int64_t j) {
    int64_t K = validate_window(series, L);
    if (i < 1 || i > L || j < 1 || j > K) {
        throw IndexOutOfRange("Trajectory entry (" + std::to_string(i) + ", " + std::to_string(j) +
                              ") outside " + std::to_string(L) + " x " + std::to_string(K));
    }
    return series[i + j - 2].item<double>();
}

}
