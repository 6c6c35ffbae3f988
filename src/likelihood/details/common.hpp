#ifndef UGP_LIKELIHOOD_COMMON_HPP
#define UGP_LIKELIHOOD_COMMON_HPP

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <ATen/CPUGeneratorImpl.h>
#include <torch/torch.h>

#include "../../common/tensor.hpp"

namespace Ugp::Likelihood::Details {
    enum class Kind {
        Gaussian,
        Logistic,
        Softmax
    };

    inline const char* kind_name(Kind kind) {
        switch (kind) {
            case Kind::Gaussian: return "Gaussian";
            case Kind::Logistic: return "Logistic";
            case Kind::Softmax: return "Softmax";
        }
        return "Likelihood";
    }

    // Reparameterized draws f_s = mean + sqrt(var) * eps_s. mean, var: [n, L]. Returns [S, n, L].
    inline torch::Tensor draw_latent(const torch::Tensor& mean, const torch::Tensor& var, std::int64_t count,
                                     at::Generator& generator) {
        std::vector<int64_t> shape{count};
        shape.insert(shape.end(), mean.sizes().begin(), mean.sizes().end());
        auto eps = torch::randn(shape, generator, mean.options());
        return mean.unsqueeze(0) + var.clamp_min(0.0).sqrt().unsqueeze(0) * eps;
    }

    // p(y | f) for one output row per example. Shapes used below:
    //   outputs [n, O], latent samples [S, n, L], latent moments [n, L].
    class LikelihoodImpl : public torch::nn::Module {
    public:
        LikelihoodImpl(std::int64_t output_dim, std::int64_t num_samples, std::uint64_t seed)
            : output_dim_(output_dim),
              num_samples_(num_samples),
              generator_(at::detail::createCPUGenerator(seed))
        {
            if (output_dim_ <= 0) {
                throw std::invalid_argument("Likelihood requires a positive output dimension.");
            }
            if (num_samples_ <= 0) {
                throw std::invalid_argument("Likelihood requires a positive number of Monte Carlo samples.");
            }
        }

        ~LikelihoodImpl() override = default;

        [[nodiscard]] virtual Kind kind() const noexcept = 0;

        // log p(y | f) for every sample and example. Returns [S, n].
        [[nodiscard]] virtual torch::Tensor log_cond_prob(const torch::Tensor& outputs,
                                                          const torch::Tensor& latent) const = 0;

        // Output-space predictive mean and variance given latent moments. Returns ([n, O], [n, O]).
        [[nodiscard]] virtual std::pair<torch::Tensor, torch::Tensor> predict(const torch::Tensor& mean,
                                                                              const torch::Tensor& var) = 0;

        // Sum over the batch of E_q[log p(y | f)] with q(f) = N(mean, var).
        // Monte Carlo with reparameterized samples unless a likelihood knows better.
        [[nodiscard]] virtual torch::Tensor expected_log_likelihood(const torch::Tensor& outputs,
                                                                    const torch::Tensor& mean,
                                                                    const torch::Tensor& var) {
            auto samples = sample_latent(mean, var, num_samples_);
            return log_cond_prob(outputs, samples).mean(0).sum();
        }

        [[nodiscard]] virtual torch::Tensor noise_variance() const {
            throw std::logic_error(std::string(kind_name(kind())) + " likelihood has no Gaussian noise variance.");
        }

        [[nodiscard]] torch::Tensor sample_latent(const torch::Tensor& mean, const torch::Tensor& var, std::int64_t count) {
            return draw_latent(mean, var, count, generator_);
        }

        [[nodiscard]] std::int64_t output_dim() const noexcept { return output_dim_; }
        [[nodiscard]] std::int64_t num_latent() const noexcept { return output_dim_; }
        [[nodiscard]] std::int64_t num_samples() const noexcept { return num_samples_; }

    protected:
        void check_outputs(const torch::Tensor& outputs) const {
            if (!outputs.defined() || outputs.dim() != 2 || outputs.size(1) != output_dim_) {
                throw std::invalid_argument(std::string(kind_name(kind())) + " likelihood expects outputs of shape [n, "
                                            + std::to_string(output_dim_) + "], got "
                                            + (outputs.defined() ? Common::format_shape(outputs) : std::string("undefined"))
                                            + ".");
            }
        }

    private:
        std::int64_t output_dim_{1};
        std::int64_t num_samples_{1};
        at::Generator generator_;
    };
}

#endif //UGP_LIKELIHOOD_COMMON_HPP
