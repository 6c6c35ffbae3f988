#ifndef UGP_LIKELIHOOD_SOFTMAX_HPP
#define UGP_LIKELIHOOD_SOFTMAX_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "common.hpp"

namespace Ugp::Likelihood::Details {
    struct SoftmaxOptions {
        std::int64_t num_classes{2};
        std::int64_t num_samples{100};
        std::uint64_t seed{0};
    };

    struct SoftmaxDescriptor {
        SoftmaxOptions options{};
    };

    // Multi-class likelihood over one-hot outputs, one latent function per class.
    // Expectations are Monte Carlo estimates.
    class SoftmaxImpl final : public LikelihoodImpl {
    public:
        explicit SoftmaxImpl(const SoftmaxOptions& options)
            : LikelihoodImpl(options.num_classes, options.num_samples, options.seed)
        {
            if (options.num_classes < 2) {
                throw std::invalid_argument("Softmax likelihood requires at least two classes, got "
                                            + std::to_string(options.num_classes) + ".");
            }
        }

        [[nodiscard]] Kind kind() const noexcept override { return Kind::Softmax; }

        [[nodiscard]] torch::Tensor log_cond_prob(const torch::Tensor& outputs, const torch::Tensor& latent) const override {
            check_outputs(outputs);
            return (outputs.unsqueeze(0) * torch::log_softmax(latent, -1)).sum(-1);
        }

        [[nodiscard]] std::pair<torch::Tensor, torch::Tensor> predict(const torch::Tensor& mean,
                                                                      const torch::Tensor& var) override {
            auto samples = sample_latent(mean, var, num_samples());
            auto probability = torch::softmax(samples, -1).mean(0);
            return {probability, probability * (1.0 - probability)};
        }
    };

    TORCH_MODULE(Softmax);
}

#endif //UGP_LIKELIHOOD_SOFTMAX_HPP
