#include "diagnostics.hpp"
#include "reconstruction.hpp"
#include "utils.hpp"

namespace ssa {

std::vector<double> contributions(const Decomposition& decomposition) {
    double total = decomposition.total_energy();
    torch::Tensor energy = decomposition.singular_values().pow(2);
    if (total <= 0.0) {
        return utils::to_vector(torch::zeros_like(energy));
    }
    return utils::to_vector(energy / total);
}

torch::Tensor elementary_components(const Decomposition& decomposition) {
    torch::NoGradGuard no_grad;
    int64_t N = decomposition.series_length();
    int64_t d = decomposition.rank();

    torch::Tensor F = torch::zeros({N, d}, utils::real_options());
    for (int64_t i = 0; i < d; ++i) {
        torch::Tensor idx = torch::tensor({i}, utils::index_options());
        F.select(1, i).copy_(hankelize(partial_matrix(decomposition, idx)));
    }
    return F;
}

torch::Tensor w_correlation(const Decomposition& decomposition) {
    torch::NoGradGuard no_grad;
    torch::Tensor F = elementary_components(decomposition);
    torch::Tensor w = utils::anti_diagonal_counts(decomposition.window_length(), decomposition.width());

    // Weighted Gram matrix G(m, n) = sum_k w_k F(k, m) F(k, n)
    torch::Tensor G = torch::matmul(F.t(), F * w.unsqueeze(1));
    torch::Tensor norms = G.diagonal().sqrt();
    torch::Tensor denom = torch::outer(norms, norms);

    // A component with zero weighted norm correlates with nothing
    torch::Tensor W = torch::where(denom > 0.0, G.abs() / denom, torch::zeros_like(G));
    W.fill_diagonal_(1.0);
    return W.clamp(0.0, 1.0);
}

}
