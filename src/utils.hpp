#pragma once

#include <torch/torch.h>
#include <vector>
#include <algorithm>
#include <string>

#include "ssa_errors.hpp"

namespace ssa::utils {

    // All series and matrices are held as float64 on the CPU
    inline torch::TensorOptions real_options() {
        return torch::TensorOptions().dtype(torch::kFloat64);
    }

    inline torch::TensorOptions index_options() {
        return torch::TensorOptions().dtype(torch::kLong);
    }

    // Copy a plain vector into a 1-D series tensor
    inline torch::Tensor to_series(const std::vector<double>& values) {
        return torch::tensor(at::ArrayRef<double>(values), real_options());
    }

    // Copy a 1-D tensor back out into a plain vector
    inline std::vector<double> to_vector(const torch::Tensor& tensor) {
        if (tensor.dim() != 1) {
            throw SsaError("Expected a 1-D tensor, got " + std::to_string(tensor.dim()) + " dimensions");
        }
        torch::Tensor flat = tensor.to(torch::kFloat64).contiguous();
        const double* data = flat.data_ptr<double>();
        return std::vector<double>(data, data + flat.numel());
    }

    // Squared Frobenius norm
    inline double frobenius_norm_sq(const torch::Tensor& matrix) {
        return matrix.pow(2).sum().item<double>();
    }

    // L x K matrix holding i + j (0-based) at (i, j): the output position
    // each trajectory cell lands on during diagonal averaging
    inline torch::Tensor anti_diagonal_index(int64_t L, int64_t K) {
        torch::Tensor rows = torch::arange(L, index_options()).unsqueeze(1);
        torch::Tensor cols = torch::arange(K, index_options()).unsqueeze(0);
        return rows + cols;
    }

    // Number of cells on each anti-diagonal of an L x K matrix (length L+K-1).
    // Equal to min(L, K) in the interior and smaller near both ends.
    inline torch::Tensor anti_diagonal_counts(int64_t L, int64_t K) {
        int64_t N = L + K - 1;
        torch::Tensor k = torch::arange(N, real_options());
        torch::Tensor from_start = k + 1;
        torch::Tensor from_end = static_cast<double>(N) - k;
        return torch::clamp_max(torch::minimum(from_start, from_end), static_cast<double>(std::min(L, K)));
    }
}
