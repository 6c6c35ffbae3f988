#ifndef UGP_LIKELIHOOD_GAUSSIAN_HPP
#define UGP_LIKELIHOOD_GAUSSIAN_HPP

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "common.hpp"

namespace Ugp::Likelihood::Details {
    struct GaussianOptions {
        double variance{1.0};
        std::int64_t output_dim{1};
        std::int64_t num_samples{100}; // used only by the leave-one-out estimator
        std::uint64_t seed{0};
    };

    struct GaussianDescriptor {
        GaussianOptions options{};
    };

    class GaussianImpl final : public LikelihoodImpl {
    public:
        explicit GaussianImpl(const GaussianOptions& options)
            : LikelihoodImpl(options.output_dim, options.num_samples, options.seed)
        {
            if (!(options.variance > 0.0) || !std::isfinite(options.variance)) {
                throw std::invalid_argument("Gaussian likelihood requires a positive noise variance, got "
                                            + std::to_string(options.variance) + ".");
            }
            log_variance_ = register_parameter(
                "log_variance", torch::full({options.output_dim}, std::log(options.variance), Common::tensor_options()));
        }

        [[nodiscard]] Kind kind() const noexcept override { return Kind::Gaussian; }

        [[nodiscard]] torch::Tensor log_cond_prob(const torch::Tensor& outputs, const torch::Tensor& latent) const override {
            check_outputs(outputs);
            auto variance = noise_variance();
            auto residual = outputs.unsqueeze(0) - latent;
            auto log_density = -0.5 * (std::log(2.0 * M_PI) + variance.log()) - 0.5 * residual.pow(2) / variance;
            return log_density.sum(-1);
        }

        // Closed form: E[(y - f)^2] = (y - mean)^2 + var.
        [[nodiscard]] torch::Tensor expected_log_likelihood(const torch::Tensor& outputs,
                                                            const torch::Tensor& mean,
                                                            const torch::Tensor& var) override {
            check_outputs(outputs);
            auto variance = noise_variance();
            auto expected = -0.5 * (std::log(2.0 * M_PI) + variance.log())
                            - 0.5 * ((outputs - mean).pow(2) + var) / variance;
            return expected.sum();
        }

        [[nodiscard]] std::pair<torch::Tensor, torch::Tensor> predict(const torch::Tensor& mean,
                                                                      const torch::Tensor& var) override {
            return {mean, var + noise_variance()};
        }

        [[nodiscard]] torch::Tensor noise_variance() const override { return log_variance_.exp(); }

    private:
        torch::Tensor log_variance_{};
    };

    TORCH_MODULE(Gaussian);
}

#endif //UGP_LIKELIHOOD_GAUSSIAN_HPP
