#include "decomposition.hpp"
#include "embedding.hpp"
#include "utils.hpp"
#include <ATen/ops/linalg_svd.h>
#include <string>
#include <tuple>

namespace ssa {

Decomposition::Decomposition(int64_t L, int64_t K, torch::Tensor sigma, torch::Tensor U, torch::Tensor V, double total_energy)
    : L_(L), K_(K), sigma_(std::move(sigma)), U_(std::move(U)), V_(std::move(V)), total_energy_(total_energy) {
    if (U_.size(0) != L_ || V_.size(0) != K_ || U_.size(1) != rank() || V_.size(1) != rank()) {
        throw ShapeMismatch("Eigentriple shapes do not match a " + std::to_string(L_) + " x " +
                            std::to_string(K_) + " trajectory matrix");
    }
}

EigenTriple Decomposition::triple(int64_t index) const {
    if (index < 1 || index > rank()) {
        throw IndexOutOfRange("Eigentriple " + std::to_string(index) + " outside [1, " +
                              std::to_string(rank()) + "]");
    }
    int64_t c = index - 1;
    return EigenTriple{
        index,
        sigma_[c].item<double>(),
        U_.select(1, c).clone(),
        V_.select(1, c).clone()
    };
}

Decomposition decompose_trajectory(
    const torch::Tensor& trajectory,
    std::optional<int64_t> truncate_to,
    const CancelToken* cancel
) {
    if (trajectory.dim() != 2) {
        throw InvalidWindowLength("Trajectory matrix must be 2-D, got " + std::to_string(trajectory.dim()) + " dimensions");
    }

    int64_t L = trajectory.size(0);
    int64_t K = trajectory.size(1);
    if (L < 1 || K < 1) {
        throw InvalidWindowLength("Degenerate trajectory matrix " + std::to_string(L) + " x " + std::to_string(K));
    }
    if (truncate_to && *truncate_to < 1) {
        throw InvalidTruncation("Truncation must keep at least 1 eigentriple, got " + std::to_string(*truncate_to));
    }

    int64_t full_rank = std::min(L, K);
    int64_t d = truncate_to ? std::min(*truncate_to, full_rank) : full_rank;

    torch::NoGradGuard no_grad;
    torch::Tensor X = trajectory.to(torch::kFloat64);

    check_cancelled(cancel, "factorization");

    torch::Tensor U, S, Vh;
    try {
        std::tie(U, S, Vh) = at::linalg_svd(X, /*full_matrices=*/false);
    } catch (const c10::Error& e) {
        throw NumericFailure(std::string("SVD failed: ") + e.what_without_backtrace());
    }

    if (!torch::isfinite(S).all().item<bool>() ||
        !torch::isfinite(U).all().item<bool>() ||
        !torch::isfinite(Vh).all().item<bool>()) {
        throw NumericFailure("SVD produced non-finite values");
    }

    check_cancelled(cancel, "ordering");

    // Stable descending sort keeps the primitive's order among ties
    auto [sorted, order] = torch::sort(S, /*stable=*/true, /*dim=*/0, /*descending=*/true);
    torch::Tensor keep = order.slice(/*dim=*/0, /*start=*/0, /*end=*/d);

    torch::Tensor sigma = sorted.slice(0, 0, d).clamp_min(0.0).contiguous();
    torch::Tensor left = U.index_select(1, keep).contiguous();
    torch::Tensor factor = Vh.index_select(0, keep).t().contiguous();

    return Decomposition(L, K, sigma, left, factor, utils::frobenius_norm_sq(X));
}

Decomposition decompose(
    const torch::Tensor& series,
    int64_t L,
    std::optional<int64_t> truncate_to,
    const CancelToken* cancel
) {
    torch::Tensor X = embed(series, L, cancel);
    return decompose_trajectory(X, truncate_to, cancel);
}

Decomposition decompose(
    const std::vector<double>& series,
    int64_t L,
    std::optional<int64_t> truncate_to,
    const CancelToken* cancel
) {
    return decompose(utils::to_series(series), L, truncate_to, cancel);
}

std::vector<double> singular_values(const Decomposition& decomposition) {
    return utils::to_vector(decomposition.singular_values());
}

}
