#pragma once
#include <torch/torch.h>
#include <map>
#include <string>
#include <vector>

#include "decomposition.hpp"
#include "grouping.hpp"

namespace ssa {

// Diagonal averaging: project an L x K matrix onto Hankel matrices and read
// off the length L+K-1 series. Each output is the mean of its anti-diagonal.
torch::Tensor hankelize(const torch::Tensor& matrix);

// Sum of sigma_i * U_i (x) V_i over the given 0-based indices (L x K)
torch::Tensor partial_matrix(const Decomposition& decomposition, const torch::Tensor& indices);

// One length-N series per group. Fresh tensors, independent of the
// decomposition. Throws IndexOutOfRange, ShapeMismatch.
std::map<std::string, torch::Tensor> reconstruct(
    const Decomposition& decomposition,
    const ValidatedGrouping& grouping
);

// Runs group() on the name -> indices map first, then reconstructs
std::map<std::string, torch::Tensor> reconstruct(
    const Decomposition& decomposition,
    const GroupSpec& spec
);

// Same as above with plain vectors on the way out
std::map<std::string, std::vector<double>> reconstruct_series(
    const Decomposition& decomposition,
    const GroupSpec& spec
);

}
