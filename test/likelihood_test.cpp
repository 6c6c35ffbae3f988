#include <cmath>

#include <gtest/gtest.h>

#include <torch/torch.h>

#include "../include/Ugp.h"

namespace Likelihood = Ugp::Likelihood;

namespace {
    // Monte Carlo estimate of sum_i E[log p(y_i | f_i)] with many draws.
    double monte_carlo_expectation(Likelihood::LikelihoodImpl& likelihood, const torch::Tensor& outputs,
                                   const torch::Tensor& mean, const torch::Tensor& var) {
        auto samples = likelihood.sample_latent(mean, var, 50000);
        return likelihood.log_cond_prob(outputs, samples).mean(0).sum().item<double>();
    }
}

TEST(GaussHermiteTest, WeightsAreNormalizedAndIntegrateMoments) {
    auto [nodes, weights] = Likelihood::Details::gauss_hermite(20);
    EXPECT_NEAR(weights.sum().item<double>(), 1.0, 1e-12);
    EXPECT_NEAR((weights * nodes).sum().item<double>(), 0.0, 1e-10);
    // f = sqrt(2) x with x the Hermite node: E[f^2] = 1 under N(0, 1).
    EXPECT_NEAR((weights * 2.0 * nodes.pow(2)).sum().item<double>(), 1.0, 1e-10);
    EXPECT_THROW(Likelihood::Details::gauss_hermite(0), std::invalid_argument);
}

TEST(GaussianLikelihoodTest, AnalyticExpectationMatchesMonteCarlo) {
    auto likelihood = Likelihood::build_likelihood(Likelihood::Gaussian({.variance = 0.3, .output_dim = 2, .seed = 3}));
    auto outputs = torch::tensor({{0.5, -1.0}, {1.5, 0.2}, {-0.3, 0.0}}, torch::kFloat64);
    auto mean = torch::tensor({{0.4, -0.7}, {1.0, 0.1}, {0.0, 0.3}}, torch::kFloat64);
    auto var = torch::tensor({{0.2, 0.1}, {0.05, 0.4}, {0.3, 0.3}}, torch::kFloat64);

    torch::NoGradGuard no_grad;
    const double analytic = likelihood->expected_log_likelihood(outputs, mean, var).item<double>();
    const double sampled = monte_carlo_expectation(*likelihood, outputs, mean, var);
    EXPECT_NEAR(analytic, sampled, 0.02 * std::abs(analytic));
}

TEST(GaussianLikelihoodTest, PredictAddsNoiseVariance) {
    auto likelihood = Likelihood::build_likelihood(Likelihood::Gaussian({.variance = 0.25}));
    auto mean = torch::tensor({{1.0}, {2.0}}, torch::kFloat64);
    auto var = torch::tensor({{0.5}, {0.0}}, torch::kFloat64);

    auto [predicted_mean, predicted_var] = likelihood->predict(mean, var);
    EXPECT_TRUE(torch::allclose(predicted_mean, mean));
    EXPECT_TRUE(torch::allclose(predicted_var, torch::tensor({{0.75}, {0.25}}, torch::kFloat64)));
}

TEST(GaussianLikelihoodTest, RejectsNonPositiveVariance) {
    EXPECT_THROW(Likelihood::build_likelihood(Likelihood::Gaussian({.variance = 0.0})), std::invalid_argument);
}

TEST(LogisticLikelihoodTest, QuadratureMatchesMonteCarlo) {
    auto likelihood = Likelihood::build_likelihood(Likelihood::Logistic({.num_quadrature_points = 30, .seed = 5}));
    auto outputs = torch::tensor({{1.0}, {0.0}, {1.0}, {0.0}}, torch::kFloat64);
    auto mean = torch::tensor({{0.8}, {-1.2}, {-0.5}, {2.0}}, torch::kFloat64);
    auto var = torch::tensor({{0.5}, {1.5}, {0.1}, {2.0}}, torch::kFloat64);

    torch::NoGradGuard no_grad;
    const double quadrature = likelihood->expected_log_likelihood(outputs, mean, var).item<double>();
    const double sampled = monte_carlo_expectation(*likelihood, outputs, mean, var);
    EXPECT_NEAR(quadrature, sampled, 0.02 * std::abs(quadrature));
}

TEST(LogisticLikelihoodTest, PredictsProbabilities) {
    auto likelihood = Likelihood::build_likelihood(Likelihood::Logistic());
    auto mean = torch::tensor({{0.0}, {4.0}, {-4.0}}, torch::kFloat64);
    auto var = torch::full({3, 1}, 0.5, torch::kFloat64);

    auto [probability, variance] = likelihood->predict(mean, var);
    EXPECT_NEAR(probability[0][0].item<double>(), 0.5, 1e-10);
    EXPECT_GT(probability[1][0].item<double>(), 0.9);
    EXPECT_LT(probability[2][0].item<double>(), 0.1);
    EXPECT_TRUE(torch::allclose(variance, probability * (1.0 - probability)));
}

TEST(LogisticLikelihoodTest, HasNoNoiseVariance) {
    auto likelihood = Likelihood::build_likelihood(Likelihood::Logistic());
    EXPECT_EQ(likelihood->kind(), Likelihood::Kind::Logistic);
    EXPECT_THROW((void)likelihood->noise_variance(), std::logic_error);
}

TEST(SoftmaxLikelihoodTest, PredictionsAreDistributions) {
    auto likelihood = Likelihood::build_likelihood(Likelihood::Softmax({.num_classes = 3, .num_samples = 200}));
    auto mean = torch::tensor({{2.0, 0.0, -1.0}, {0.0, 0.0, 0.0}}, torch::kFloat64);
    auto var = torch::full({2, 3}, 0.2, torch::kFloat64);

    auto [probability, variance] = likelihood->predict(mean, var);
    EXPECT_TRUE(torch::allclose(probability.sum(1), torch::ones({2}, torch::kFloat64)));
    EXPECT_EQ(probability[0].argmax().item<int64_t>(), 0);
    EXPECT_TRUE((variance >= 0).all().item<bool>());
}

TEST(SoftmaxLikelihoodTest, RejectsFewerThanTwoClasses) {
    EXPECT_THROW(Likelihood::build_likelihood(Likelihood::Softmax({.num_classes = 1})), std::invalid_argument);
}

TEST(SoftmaxLikelihoodTest, RejectsMismatchedOutputs) {
    auto likelihood = Likelihood::build_likelihood(Likelihood::Softmax({.num_classes = 3}));
    auto outputs = torch::zeros({4, 2}, torch::kFloat64);
    auto latent = torch::zeros({5, 4, 3}, torch::kFloat64);
    EXPECT_THROW((void)likelihood->log_cond_prob(outputs, latent), std::invalid_argument);
}
