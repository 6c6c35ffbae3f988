#include <cmath>
#include <limits>

#include <gtest/gtest.h>

#include <torch/torch.h>

#include "../include/Ugp.h"

namespace Inference = Ugp::Inference;

namespace {
    torch::Tensor grid(std::int64_t n, double low, double high) {
        return torch::linspace(low, high, n, torch::kFloat64).unsqueeze(1);
    }

    Ugp::ModelOptions exact_options(double noise) {
        return {.kernel = Ugp::Kernel::SquaredExponential({.length_scale = {1.0}}),
                .likelihood = Ugp::Likelihood::Gaussian({.variance = noise}),
                .inference = Inference::Exact({.jitter = 1e-10})};
    }
}

TEST(KullbackLeiblerTest, NonNegativeForRandomPosteriors) {
    torch::manual_seed(21);
    for (int trial = 0; trial < 10; ++trial) {
        auto mean = torch::randn({2, 6}, torch::kFloat64);
        auto raw = torch::randn({2, 6, 6}, torch::kFloat64);
        auto factor = torch::tril(raw, -1) + torch::diag_embed(raw.diagonal(0, -2, -1).exp());
        EXPECT_GE(Inference::Details::whitened_kl(mean, factor).item<double>(), 0.0);
    }
}

TEST(KullbackLeiblerTest, ZeroAtThePrior) {
    auto mean = torch::zeros({1, 4}, torch::kFloat64);
    auto factor = torch::eye(4, torch::kFloat64).unsqueeze(0);
    EXPECT_NEAR(Inference::Details::whitened_kl(mean, factor).item<double>(), 0.0, 1e-12);
}

TEST(CholeskyTest, ThrowsOnIndefiniteMatrix) {
    auto matrix = torch::tensor({{{1.0, 2.0}, {2.0, 1.0}}}, torch::kFloat64);
    EXPECT_THROW(Inference::Details::cholesky(matrix, "test matrix"), Inference::CholeskyError);
}

TEST(CholeskyTest, FactorsPositiveDefiniteMatrix) {
    auto matrix = torch::tensor({{{4.0, 2.0}, {2.0, 3.0}}}, torch::kFloat64);
    auto factor = Inference::Details::cholesky(matrix, "test matrix");
    EXPECT_TRUE(torch::allclose(torch::matmul(factor, factor.transpose(-2, -1)), matrix));
}

TEST(VariationalInferenceTest, ObjectiveTermsAndShapes) {
    Ugp::Model model(grid(5, -1.0, 1.0),
                     {.inference = Inference::Variational({.leave_one_out = true, .seed = 4})});
    auto x = grid(8, -2.0, 2.0);
    auto y = torch::sin(x);

    auto terms = model.objective(x, y, 8);
    EXPECT_TRUE(terms.count(Inference::kNelbo));
    EXPECT_TRUE(terms.count(Inference::kLooVariational));
    EXPECT_NEAR(terms.at(Inference::kLoss).item<double>(),
                (terms.at(Inference::kNelbo) + terms.at(Inference::kLooVariational)).item<double>(), 1e-9);

    auto [mean, var] = model.prediction(x);
    EXPECT_EQ(mean.sizes(), (std::vector<int64_t>{8, 1}));
    EXPECT_EQ(var.sizes(), (std::vector<int64_t>{8, 1}));
    EXPECT_TRUE((var > 0).all().item<bool>());
}

TEST(VariationalInferenceTest, LossIsNelboWithoutLeaveOneOut) {
    Ugp::Model model(grid(4, -1.0, 1.0));
    auto x = grid(6, -1.0, 1.0);
    auto terms = model.objective(x, torch::cos(x), 6);
    EXPECT_FALSE(terms.count(Inference::kLooVariational));
    EXPECT_TRUE(torch::equal(terms.at(Inference::kLoss), terms.at(Inference::kNelbo)));
}

TEST(VariationalInferenceTest, DiagonalAndSharedPosteriors) {
    Ugp::Model diagonal(grid(4, -1.0, 1.0),
                        {.inference = Inference::Variational({.diagonal_posterior = true})});
    EXPECT_EQ(diagonal.variational()->factor().sizes(), (std::vector<int64_t>{1, 4, 4}));

    auto shared_inputs = torch::randn({2, 3, 1}, torch::kFloat64);
    EXPECT_THROW(Ugp::Model(shared_inputs,
                            {.kernel = Ugp::Kernel::SquaredExponential({.num_latent = 2}),
                             .likelihood = Ugp::Likelihood::Gaussian({.output_dim = 2}),
                             .inference = Inference::Variational({.share_inducing = true})}),
                 std::invalid_argument);
}

TEST(VariationalInferenceTest, RejectsMismatchedLatentCount) {
    EXPECT_THROW(Ugp::Model(grid(4, -1.0, 1.0),
                            {.kernel = Ugp::Kernel::SquaredExponential({.num_latent = 2}),
                             .likelihood = Ugp::Likelihood::Gaussian()}),
                 std::invalid_argument);
}

TEST(ExactInferenceTest, VarianceVanishesAtTrainingPointsAsNoiseVanishes) {
    auto x = grid(6, -3.0, 3.0);
    auto y = torch::sin(x);

    double previous = std::numeric_limits<double>::infinity();
    for (const double noise : {1e-1, 1e-3, 1e-6}) {
        Ugp::Model model(x, exact_options(noise));
        model.condition(x, y);
        auto [mean, var] = model.exact()->latent_moments(x);
        const double worst = var.max().item<double>();
        EXPECT_LT(worst, previous);
        previous = worst;
    }
    EXPECT_LT(previous, 1e-4);
}

TEST(ExactInferenceTest, InterpolatesTrainingTargets) {
    auto x = grid(6, -3.0, 3.0);
    auto y = torch::sin(x);
    Ugp::Model model(x, exact_options(1e-6));
    model.condition(x, y);
    auto [mean, var] = model.exact()->latent_moments(x);
    EXPECT_TRUE(torch::allclose(mean, y, 1e-3, 1e-3));
}

TEST(ExactInferenceTest, ObjectiveIsNegativeLogMarginalLikelihood) {
    auto x = grid(4, -1.0, 1.0);
    auto y = torch::zeros({4, 1}, torch::kFloat64);
    Ugp::Model model(x, exact_options(0.5));
    auto terms = model.objective(x, y, 4);
    ASSERT_TRUE(terms.count(Inference::kNlml));

    // With zero targets the fit term vanishes: NLML = 0.5 log|K + s I| + 0.5 n log 2pi.
    auto k = model.kernel()->cov(x)[0] + 0.5 * torch::eye(4, torch::kFloat64);
    const double expected = 0.5 * torch::logdet(k).item<double>() + 2.0 * std::log(2.0 * M_PI);
    EXPECT_NEAR(terms.at(Inference::kNlml).item<double>(), expected, 1e-8);
}

TEST(ExactInferenceTest, RequiresGaussianLikelihood) {
    EXPECT_THROW(Ugp::Model(grid(3, 0.0, 1.0),
                            {.likelihood = Ugp::Likelihood::Logistic(), .inference = Inference::Exact()}),
                 std::invalid_argument);
}

TEST(ExactInferenceTest, PredictBeforeConditioningIsMisuse) {
    Ugp::Model model(grid(3, 0.0, 1.0), exact_options(0.1));
    EXPECT_THROW((void)model.prediction(grid(2, 0.0, 1.0)), std::logic_error);
    EXPECT_THROW((void)model.variational(), std::logic_error);
}

TEST(ExactInferenceTest, SingularTrainingCovarianceRaisesCholeskyError) {
    // Duplicated inputs, no jitter and a negligible noise variance leave K + noise singular.
    auto x = torch::zeros({3, 1}, torch::kFloat64);
    auto y = torch::zeros({3, 1}, torch::kFloat64);
    Ugp::Model model(x, {.likelihood = Ugp::Likelihood::Gaussian({.variance = 1e-300}),
                         .inference = Inference::Exact({.jitter = 0.0})});

    EXPECT_THROW((void)model.objective(x, y, 3), Inference::CholeskyError);
    model.condition(x, y);
    EXPECT_THROW((void)model.exact()->latent_moments(x), Inference::CholeskyError);
    EXPECT_THROW((void)model.prediction(x), Inference::CholeskyError);
}
