#pragma once
#include <torch/torch.h>
#include <vector>

#include "cancel_token.hpp"

namespace ssa {

// Validate a (series, L) pair. Throws EmptySeries if N < 2, then
// InvalidWindowLength if L is outside [2, N-1]. Returns K = N - L + 1.
int64_t validate_window(const torch::Tensor& series, int64_t L);

// Build the L x K trajectory (Hankel) matrix, entry (i, j) = series[i + j]
// with 0-based indices. The result is a fresh float64 tensor.
torch::Tensor embed(const torch::Tensor& series, int64_t L, const CancelToken* cancel = nullptr);
torch::Tensor embed(const std::vector<double>& series, int64_t L, const CancelToken* cancel = nullptr);

// Entry (i, j) of the trajectory matrix, 1-based, read straight from the series
double trajectory_entry(const torch::Tensor& series, int64_t L, int64_t i, int64_t j);

}
