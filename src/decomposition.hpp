#pragma once
#include <torch/torch.h>
#include <optional>
#include <vector>

#include "cancel_token.hpp"

namespace ssa {

// One rank-1 component of the trajectory matrix, 1-based index
struct EigenTriple {
    int64_t index;
    double sigma;
    torch::Tensor left;   // U_i, length L, unit norm
    torch::Tensor factor; // V_i, length K, unit norm
};

// Ordered eigentriples of one trajectory matrix. Immutable after construction;
// accessors hand out copies, so no caller can write into the stored factors.
class Decomposition {
public:
    Decomposition(int64_t L, int64_t K, torch::Tensor sigma, torch::Tensor U, torch::Tensor V, double total_energy);

    int64_t window_length() const { return L_; }
    int64_t width() const { return K_; }
    int64_t series_length() const { return L_ + K_ - 1; }
    int64_t rank() const { return sigma_.size(0); }

    // Squared Frobenius norm of the full trajectory matrix, kept when truncated
    double total_energy() const { return total_energy_; }

    // Copies; writing to them leaves the decomposition untouched
    torch::Tensor singular_values() const { return sigma_.clone(); }
    torch::Tensor left_vectors() const { return U_.clone(); }     // L x d
    torch::Tensor factor_vectors() const { return V_.clone(); }   // K x d

    // 1-based accessor. Throws IndexOutOfRange.
    EigenTriple triple(int64_t index) const;

private:
    // Reads the stored factors without copying them
    friend torch::Tensor partial_matrix(const Decomposition& decomposition, const torch::Tensor& indices);

    int64_t L_;
    int64_t K_;
    torch::Tensor sigma_;
    torch::Tensor U_;
    torch::Tensor V_;
    double total_energy_;
};

// Factorize an L x K trajectory matrix and keep the top `truncate_to`
// eigentriples (all min(L, K) when unset, clamped to min(L, K) when larger).
// Throws InvalidWindowLength, InvalidTruncation, NumericFailure, Cancelled.
Decomposition decompose_trajectory(
    const torch::Tensor& trajectory,
    std::optional<int64_t> truncate_to = std::nullopt,
    const CancelToken* cancel = nullptr
);

// Embed then factorize. Throws EmptySeries in addition to the above.
Decomposition decompose(
    const torch::Tensor& series,
    int64_t L,
    std::optional<int64_t> truncate_to = std::nullopt,
    const CancelToken* cancel = nullptr
);
Decomposition decompose(
    const std::vector<double>& series,
    int64_t L,
    std::optional<int64_t> truncate_to = std::nullopt,
    const CancelToken* cancel = nullptr
);

// Singular values in descending order
std::vector<double> singular_values(const Decomposition& decomposition);

}
