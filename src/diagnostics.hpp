#pragma once
#include <torch/torch.h>
#include <vector>

#include "decomposition.hpp"

namespace ssa {

// Share of the trajectory matrix energy carried by each eigentriple,
// sigma_i^2 / ||X||_F^2. Sums to 1 only when nothing was truncated.
std::vector<double> contributions(const Decomposition& decomposition);

// N x d matrix, column i = diagonal average of sigma_i * U_i (x) V_i
torch::Tensor elementary_components(const Decomposition& decomposition);

// d x d weighted correlation of the elementary components. Weights are the
// anti-diagonal cell counts. Symmetric, unit diagonal, entries in [0, 1].
torch::Tensor w_correlation(const Decomposition& decomposition);

}
