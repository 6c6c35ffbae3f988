#include <cmath>

#include <gtest/gtest.h>

#include <torch/torch.h>

#include "../include/Ugp.h"

namespace {
    Ugp::Kernel::Details::SquaredExponential make_kernel(std::int64_t input_dim, std::vector<double> length_scale,
                                                         bool iso = false, std::int64_t num_latent = 1) {
        return Ugp::Kernel::build_kernel(Ugp::Kernel::SquaredExponential({.input_dim = input_dim,
                                                                          .num_latent = num_latent,
                                                                          .length_scale = std::move(length_scale),
                                                                          .sf = 1.3,
                                                                          .iso = iso}));
    }
}

TEST(SquaredExponentialTest, CovarianceIsSymmetricPositiveSemiDefinite) {
    torch::manual_seed(7);
    auto kernel = make_kernel(3, {0.5, 1.0, 2.0}, false, 2);
    auto x = torch::randn({25, 3}, torch::kFloat64);

    auto k = kernel->cov(x);
    ASSERT_EQ(k.sizes(), (std::vector<int64_t>{2, 25, 25}));
    EXPECT_TRUE(torch::allclose(k, k.transpose(-2, -1)));

    auto eigenvalues = torch::linalg::eigvalsh(k, "L");
    EXPECT_GT(eigenvalues.min().item<double>(), -1e-8);
}

TEST(SquaredExponentialTest, DiagonalMatchesFullCovariance) {
    torch::manual_seed(11);
    auto kernel = make_kernel(2, {0.7}, true);
    auto x = torch::randn({17, 2}, torch::kFloat64);

    auto full = kernel->cov(x);
    auto diag = kernel->diag_cov(x);
    EXPECT_TRUE(torch::equal(diag, full.diagonal(0, -2, -1)));
    EXPECT_NEAR(diag[0][0].item<double>(), 1.3 * 1.3, 1e-12);
}

TEST(SquaredExponentialTest, CrossCovarianceShape) {
    auto kernel = make_kernel(2, {1.0, 1.0});
    auto a = torch::zeros({4, 2}, torch::kFloat64);
    auto b = torch::ones({6, 2}, torch::kFloat64);

    auto k = kernel->cov(a, b);
    ASSERT_EQ(k.sizes(), (std::vector<int64_t>{1, 4, 6}));
    EXPECT_NEAR(k[0][0][0].item<double>(), 1.69 * std::exp(-1.0), 1e-12);
}

TEST(SquaredExponentialTest, IsotropicAndArdParameterCounts) {
    EXPECT_EQ(make_kernel(4, {1.0}, true)->length_scale().sizes(), (std::vector<int64_t>{1, 1}));
    EXPECT_EQ(make_kernel(4, {1.0}, false)->length_scale().sizes(), (std::vector<int64_t>{1, 4}));
    EXPECT_EQ(make_kernel(2, {1.0, 3.0}, false, 3)->length_scale().sizes(), (std::vector<int64_t>{3, 2}));
}

TEST(SquaredExponentialTest, RejectsInvalidConstruction) {
    EXPECT_THROW(make_kernel(3, {1.0, 2.0}), std::invalid_argument);
    EXPECT_THROW(make_kernel(2, {1.0, 2.0}, true), std::invalid_argument);
    EXPECT_THROW(make_kernel(2, {-1.0}), std::invalid_argument);
    EXPECT_THROW(make_kernel(0, {1.0}), std::invalid_argument);
}

TEST(SquaredExponentialTest, RejectsWrongInputDimension) {
    auto kernel = make_kernel(2, {1.0});
    EXPECT_THROW((void)kernel->cov(torch::zeros({3, 5}, torch::kFloat64)), std::invalid_argument);
}
