#include "reconstruction.hpp"
#include "utils.hpp"
#include <string>

namespace ssa {

torch::Tensor hankelize(const torch::Tensor& matrix) {
    if (matrix.dim() != 2) {
        throw ShapeMismatch("Diagonal averaging needs a 2-D matrix, got " + std::to_string(matrix.dim()) + " dimensions");
    }

    int64_t L = matrix.size(0);
    int64_t K = matrix.size(1);
    if (L < 1 || K < 1) {
        throw ShapeMismatch("Diagonal averaging needs a non-empty matrix, got " + std::to_string(L) +
                            " x " + std::to_string(K));
    }
    int64_t N = L + K - 1;

    // Scatter every cell onto its anti-diagonal, then divide by cell counts
    torch::Tensor target = utils::anti_diagonal_index(L, K).reshape({-1});
    torch::Tensor values = matrix.to(torch::kFloat64).reshape({-1});

    torch::Tensor sums = torch::zeros({N}, utils::real_options());
    sums.index_add_(/*dim=*/0, target, values);

    return sums / utils::anti_diagonal_counts(L, K);
}

torch::Tensor partial_matrix(const Decomposition& decomposition, const torch::Tensor& indices) {
    int64_t L = decomposition.window_length();
    int64_t K = decomposition.width();
    if (indices.numel() == 0) {
        return torch::zeros({L, K}, utils::real_options());
    }

    torch::Tensor U = decomposition.U_.index_select(1, indices);
    torch::Tensor V = decomposition.V_.index_select(1, indices);
    torch::Tensor s = decomposition.sigma_.index_select(0, indices);

    // (U * s) scales column i of U by sigma_i
    return torch::matmul(U * s, V.t());
}

std::map<std::string, torch::Tensor> reconstruct(
    const Decomposition& decomposition,
    const ValidatedGrouping& grouping
) {
    if (grouping.rank() > decomposition.rank()) {
        throw IndexOutOfRange("Grouping was validated against " + std::to_string(grouping.rank()) +
                              " eigentriples, decomposition holds " + std::to_string(decomposition.rank()));
    }

    torch::NoGradGuard no_grad;
    int64_t N = decomposition.series_length();
    std::map<std::string, torch::Tensor> out;

    for (auto const& entry : grouping.groups()) {
        const std::string& name = entry.first;
        for (int64_t c : entry.second) {
            if (c < 0 || c >= decomposition.rank()) {
                throw IndexOutOfRange("Group '" + name + "': index " + std::to_string(c + 1) +
                                      " outside [1, " + std::to_string(decomposition.rank()) + "]");
            }
        }
        torch::Tensor M = partial_matrix(decomposition, grouping.indices(name));
        torch::Tensor series = hankelize(M);

        if (series.dim() != 1 || series.size(0) != N) {
            throw ShapeMismatch("Group '" + name + "' reconstructed to " + std::to_string(series.numel()) +
                                " samples, expected " + std::to_string(N));
        }
        out.emplace(name, series);
    }

    return out;
}

std::map<std::string, torch::Tensor> reconstruct(
    const Decomposition& decomposition,
    const GroupSpec& spec
) {
    return reconstruct(decomposition, group(decomposition, spec));
}

std::map<std::string, std::vector<double>> reconstruct_series(
    const Decomposition& decomposition,
    const GroupSpec& spec
) {
    std::map<std::string, std::vector<double>> out;
    for (auto const& [name, series] : reconstruct(decomposition, spec)) {
        out.emplace(name, utils::to_vector(series));
    }
    return out;
}

}
