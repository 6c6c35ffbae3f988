#ifndef UGP_LIKELIHOOD_LOGISTIC_HPP
#define UGP_LIKELIHOOD_LOGISTIC_HPP

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>

#include <torch/torch.h>

#include "common.hpp"

namespace Ugp::Likelihood::Details {
    struct LogisticOptions {
        std::int64_t num_quadrature_points{20};
        std::int64_t num_samples{100}; // used only by the leave-one-out estimator
        std::uint64_t seed{0};
    };

    struct LogisticDescriptor {
        LogisticOptions options{};
    };

    // Golub-Welsch: nodes are the eigenvalues of the Hermite Jacobi matrix,
    // weights sqrt(pi) * v0^2. Weights are returned normalised to sum to one.
    inline std::pair<torch::Tensor, torch::Tensor> gauss_hermite(std::int64_t points) {
        if (points <= 0) {
            throw std::invalid_argument("Gauss-Hermite quadrature requires at least one point, got "
                                        + std::to_string(points) + ".");
        }
        auto off_diagonal = torch::sqrt(torch::arange(1, points, Common::tensor_options()) / 2.0);
        auto jacobi = torch::zeros({points, points}, Common::tensor_options());
        if (points > 1) {
            jacobi = torch::diag(off_diagonal, 1) + torch::diag(off_diagonal, -1);
        }
        auto [nodes, vectors] = torch::linalg::eigh(jacobi, "L");
        auto weights = vectors.select(0, 0).pow(2);
        return {nodes, weights / weights.sum()};
    }

    // Binary classification with p(y = 1 | f) = sigmoid(f); outputs hold 0 or 1.
    class LogisticImpl final : public LikelihoodImpl {
    public:
        explicit LogisticImpl(const LogisticOptions& options)
            : LikelihoodImpl(1, options.num_samples, options.seed)
        {
            std::tie(nodes_, weights_) = gauss_hermite(options.num_quadrature_points);
        }

        [[nodiscard]] Kind kind() const noexcept override { return Kind::Logistic; }

        [[nodiscard]] torch::Tensor log_cond_prob(const torch::Tensor& outputs, const torch::Tensor& latent) const override {
            check_outputs(outputs);
            auto sign = 2.0 * outputs.unsqueeze(0) - 1.0;
            return (-torch::nn::functional::softplus(-sign * latent)).sum(-1);
        }

        [[nodiscard]] torch::Tensor expected_log_likelihood(const torch::Tensor& outputs,
                                                            const torch::Tensor& mean,
                                                            const torch::Tensor& var) override {
            auto latent = quadrature_points(mean, var);
            auto log_prob = log_cond_prob(outputs, latent);
            return (weights_.unsqueeze(1) * log_prob).sum();
        }

        [[nodiscard]] std::pair<torch::Tensor, torch::Tensor> predict(const torch::Tensor& mean,
                                                                      const torch::Tensor& var) override {
            auto latent = quadrature_points(mean, var);
            auto probability = (weights_.view({-1, 1, 1}) * torch::sigmoid(latent)).sum(0);
            return {probability, probability * (1.0 - probability)};
        }

    private:
        // [K, n, 1] abscissae of E[g(f)] under N(mean, var).
        torch::Tensor quadrature_points(const torch::Tensor& mean, const torch::Tensor& var) const {
            auto scale = (2.0 * var.clamp_min(0.0)).sqrt();
            return mean.unsqueeze(0) + scale.unsqueeze(0) * nodes_.view({-1, 1, 1});
        }

        torch::Tensor nodes_{};
        torch::Tensor weights_{};
    };

    TORCH_MODULE(Logistic);
}

#endif //UGP_LIKELIHOOD_LOGISTIC_HPP
