#ifndef UGP_INFERENCE_VARIATIONAL_HPP
#define UGP_INFERENCE_VARIATIONAL_HPP

#include <cmath>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <ATen/CPUGeneratorImpl.h>
#include <torch/torch.h>

#include "common.hpp"
#include "kl.hpp"
#include "../../common/tensor.hpp"
#include "../../kernel/kernel.hpp"
#include "../../likelihood/likelihood.hpp"

namespace Ugp::Inference::Details {
    struct VariationalOptions {
        std::int64_t num_samples{100};   // Monte Carlo draws of the leave-one-out estimator
        double jitter{1e-6};
        bool leave_one_out{false};
        bool diagonal_posterior{false};
        bool share_inducing{false};      // one set of inducing inputs for every latent function
        std::uint64_t seed{0};
    };

    struct VariationalDescriptor {
        VariationalOptions options{};
    };

    // Sparse variational inference with a whitened posterior q(v) = N(m, S S^T), u = chol(Kmm) v.
    // The kernel and likelihood are owned by the model; only the inducing inputs and the
    // variational parameters are registered here.
    class VariationalImpl : public torch::nn::Module {
    public:
        VariationalImpl(const torch::Tensor& inducing_inputs,
                        Kernel::Details::SquaredExponential kernel,
                        std::shared_ptr<Likelihood::LikelihoodImpl> likelihood,
                        VariationalOptions options)
            : options_(std::move(options)),
              kernel_(std::move(kernel)),
              likelihood_(std::move(likelihood)),
              generator_(at::detail::createCPUGenerator(options_.seed))
        {
            if (!kernel_ || !likelihood_) {
                throw std::invalid_argument("Variational inference requires a kernel and a likelihood.");
            }
            if (options_.num_samples <= 0) {
                throw std::invalid_argument("Variational inference requires a positive number of samples, got "
                                            + std::to_string(options_.num_samples) + ".");
            }
            if (!(options_.jitter >= 0.0) || !std::isfinite(options_.jitter)) {
                throw std::invalid_argument("Variational inference requires a non-negative jitter.");
            }

            const auto num_latent = kernel_->num_latent();
            auto inputs = Common::to_model_dtype(inducing_inputs);
            if (!inputs.defined() || (inputs.dim() != 2 && inputs.dim() != 3)) {
                throw std::invalid_argument("Inducing inputs must be [M, D] or [L, M, D], got "
                                            + (inputs.defined() ? Common::format_shape(inputs) : std::string("undefined"))
                                            + ".");
            }
            if (inputs.size(-1) != kernel_->input_dim()) {
                throw std::invalid_argument("Inducing inputs have dimension " + std::to_string(inputs.size(-1))
                                            + " but the kernel expects " + std::to_string(kernel_->input_dim()) + ".");
            }
            if (inputs.dim() == 3) {
                if (options_.share_inducing) {
                    throw std::invalid_argument("Shared inducing inputs must be given as [M, D], got "
                                                + Common::format_shape(inputs) + ".");
                }
                if (inputs.size(0) != num_latent) {
                    throw std::invalid_argument("Inducing inputs hold " + std::to_string(inputs.size(0))
                                                + " sets but the model has " + std::to_string(num_latent)
                                                + " latent functions.");
                }
            } else if (!options_.share_inducing) {
                inputs = inputs.unsqueeze(0).expand({num_latent, inputs.size(0), inputs.size(1)});
            }
            num_inducing_ = inputs.size(-2);
            if (num_inducing_ <= 0) {
                throw std::invalid_argument("Variational inference requires at least one inducing point.");
            }

            inducing_inputs_ = register_parameter("inducing_inputs", inputs.clone());
            mean_ = register_parameter("mean", torch::zeros({num_latent, num_inducing_}, Common::tensor_options()));
            if (options_.diagonal_posterior) {
                raw_factor_ = register_parameter(
                    "raw_factor", torch::zeros({num_latent, num_inducing_}, Common::tensor_options()));
            } else {
                raw_factor_ = register_parameter(
                    "raw_factor", torch::zeros({num_latent, num_inducing_, num_inducing_}, Common::tensor_options()));
            }
        }

        // Whitened posterior factor S: [L, M, M]. The diagonal is stored in log space.
        [[nodiscard]] torch::Tensor factor() const {
            if (options_.diagonal_posterior) {
                return torch::diag_embed(raw_factor_.exp());
            }
            auto diagonal = raw_factor_.diagonal(0, -2, -1).exp();
            return torch::tril(raw_factor_, -1) + torch::diag_embed(diagonal);
        }

        [[nodiscard]] torch::Tensor kl() const { return whitened_kl(mean_, factor()); }

        // Latent marginals at x: ([n, L], [n, L]).
        [[nodiscard]] std::pair<torch::Tensor, torch::Tensor> latent_moments(const torch::Tensor& inputs) const {
            auto kmm = kernel_->cov(inducing_inputs_);
            auto chol = cholesky(add_jitter(kmm, options_.jitter), "Kmm (inducing-point covariance)");
            auto kmn = kernel_->cov(inducing_inputs_, inputs);
            auto projection = torch::linalg_solve_triangular(chol, kmn, /*upper=*/false);

            auto mean = (projection * mean_.unsqueeze(-1)).sum(1);
            auto spread = torch::matmul(factor().transpose(-2, -1), projection);
            auto prior = (kernel_->diag_cov(inputs) - projection.pow(2).sum(1)).clamp_min(0.0);
            auto var = prior + spread.pow(2).sum(1);
            return {mean.transpose(0, 1), var.transpose(0, 1)};
        }

        // NELBO, LOO_VARIATIONAL when enabled, and their sum as loss.
        [[nodiscard]] Objective objective(const torch::Tensor& inputs, const torch::Tensor& outputs,
                                          std::int64_t num_train) {
            if (inputs.size(0) != outputs.size(0)) {
                throw std::invalid_argument("Batch holds " + std::to_string(inputs.size(0)) + " inputs but "
                                            + std::to_string(outputs.size(0)) + " outputs.");
            }
            if (inputs.size(0) == 0) {
                throw std::invalid_argument("Objective requires a non-empty batch.");
            }
            const double scale = static_cast<double>(num_train) / static_cast<double>(inputs.size(0));

            auto [mean, var] = latent_moments(inputs);
            auto expected = likelihood_->expected_log_likelihood(outputs, mean, var);

            Objective terms;
            terms[kNelbo] = -(scale * expected - kl());
            auto loss = terms[kNelbo];
            if (options_.leave_one_out) {
                terms[kLooVariational] = leave_one_out(outputs, mean, var, scale);
                loss = loss + terms[kLooVariational];
            }
            terms[kLoss] = loss;
            return terms;
        }

        [[nodiscard]] std::pair<torch::Tensor, torch::Tensor> predict(const torch::Tensor& inputs) const {
            auto [mean, var] = latent_moments(inputs);
            return likelihood_->predict(mean, var);
        }

        [[nodiscard]] std::vector<torch::Tensor> variational_parameters() const {
            return {inducing_inputs_, mean_, raw_factor_};
        }

        [[nodiscard]] const torch::Tensor& inducing_inputs() const noexcept { return inducing_inputs_; }
        [[nodiscard]] const torch::Tensor& mean() const noexcept { return mean_; }
        [[nodiscard]] std::int64_t num_inducing() const noexcept { return num_inducing_; }
        [[nodiscard]] const VariationalOptions& options() const noexcept { return options_; }

    private:
        // Importance-sampled negative leave-one-out log predictive density.
        torch::Tensor leave_one_out(const torch::Tensor& outputs, const torch::Tensor& mean,
                                    const torch::Tensor& var, double scale) {
            auto samples = Likelihood::Details::draw_latent(mean, var, options_.num_samples, generator_);
            auto log_prob = likelihood_->log_cond_prob(outputs, samples);
            auto per_point = torch::logsumexp(-log_prob, 0) - std::log(static_cast<double>(options_.num_samples));
            return scale * per_point.sum();
        }

        VariationalOptions options_{};
        Kernel::Details::SquaredExponential kernel_{nullptr};
        std::shared_ptr<Likelihood::LikelihoodImpl> likelihood_{};
        at::Generator generator_;
        std::int64_t num_inducing_{0};
        torch::Tensor inducing_inputs_{};
        torch::Tensor mean_{};
        torch::Tensor raw_factor_{};
    };

    TORCH_MODULE(Variational);
}

#endif //UGP_INFERENCE_VARIATIONAL_HPP
