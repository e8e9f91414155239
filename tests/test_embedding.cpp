#include <gtest/gtest.h>
#include <torch/torch.h>

#include "embedding.hpp"
#include "signals.hpp"
#include "utils.hpp"

#include <vector>

namespace {

TEST(Embedding, FiveSamplesWindowTwo) {
    torch::Tensor X = ssa::embed(std::vector<double>{1, 2, 3, 4, 5}, 2);
    ASSERT_EQ(X.size(0), 2);
    ASSERT_EQ(X.size(1), 4);

    std::vector<double> row1 = ssa::utils::to_vector(X[0]);
    std::vector<double> row2 = ssa::utils::to_vector(X[1]);
    EXPECT_EQ(row1, (std::vector<double>{1, 2, 3, 4}));
    EXPECT_EQ(row2, (std::vector<double>{2, 3, 4, 5}));
}

TEST(Embedding, HankelProperty) {
    ssa::SignalGenerator gen(7);
    torch::Tensor x = gen.gaussian_noise(37, 1.0);
    int64_t L = 11;
    torch::Tensor X = ssa::embed(x, L);
    int64_t K = X.size(1);
    ASSERT_EQ(K, 37 - L + 1);

    auto a = X.accessor<double, 2>();
    for (int64_t i = 0; i + 1 < L; ++i) {
        for (int64_t j = 1; j < K; ++j) {
            EXPECT_EQ(a[i][j], a[i + 1][j - 1]);
        }
    }
}

TEST(Embedding, EntryMatchesSeries) {
    torch::Tensor x = ssa::utils::to_series({3, 1, 4, 1, 5, 9, 2, 6});
    torch::Tensor X = ssa::embed(x, 3);
    for (int64_t i = 1; i <= 3; ++i) {
        for (int64_t j = 1; j <= 6; ++j) {
            EXPECT_DOUBLE_EQ(ssa::trajectory_entry(x, 3, i, j), X[i - 1][j - 1].item<double>());
        }
    }
    EXPECT_THROW(ssa::trajectory_entry(x, 3, 4, 1), ssa::IndexOutOfRange);
    EXPECT_THROW(ssa::trajectory_entry(x, 3, 1, 0), ssa::IndexOutOfRange);
}

TEST(Embedding, DoesNotAliasInput) {
    torch::Tensor x = ssa::utils::to_series({1, 2, 3, 4});
    torch::Tensor X = ssa::embed(x, 2);
    x[0] = 100.0;
    EXPECT_DOUBLE_EQ(X[0][0].item<double>(), 1.0);
}

TEST(Embedding, ShortSeriesIsEmpty) {
    EXPECT_THROW(ssa::embed(std::vector<double>{1.0}, 2), ssa::EmptySeries);
    EXPECT_THROW(ssa::embed(std::vector<double>{}, 2), ssa::EmptySeries);
    // N < 2 wins over a bad L
    EXPECT_THROW(ssa::embed(std::vector<double>{1.0}, 0), ssa::EmptySeries);
}

TEST(Embedding, WindowBounds) {
    std::vector<double> x{1, 2, 3, 4, 5};
    EXPECT_THROW(ssa::embed(x, 1), ssa::InvalidWindowLength);
    EXPECT_THROW(ssa::embed(x, 5), ssa::InvalidWindowLength);
    EXPECT_NO_THROW(ssa::embed(x, 4));
    EXPECT_EQ(ssa::validate_window(ssa::utils::to_series(x), 4), 2);
}

TEST(Embedding, RejectsMatrixInput) {
    torch::Tensor m = torch::zeros({3, 3}, ssa::utils::real_options());
    EXPECT_THROW(ssa::embed(m, 2), ssa::SsaError);
}

TEST(Embedding, CancelledBeforeStart) {
    ssa::CancelToken token;
    token.cancel();
    EXPECT_THROW(ssa::embed(std::vector<double>{1, 2, 3, 4}, 2, &token), ssa::Cancelled);
}

}
