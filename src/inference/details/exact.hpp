#ifndef UGP_INFERENCE_EXACT_HPP
#define UGP_INFERENCE_EXACT_HPP

#include <cmath>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "common.hpp"
#include "../../common/tensor.hpp"
#include "../../kernel/kernel.hpp"
#include "../../likelihood/likelihood.hpp"

namespace Ugp::Inference::Details {
    struct ExactOptions {
        double jitter{1e-6};
    };

    struct ExactDescriptor {
        ExactOptions options{};
    };

    // Exact GP regression. The training set is the batch passed to objective(); prediction
    // uses the targets given to condition().
    class ExactImpl : public torch::nn::Module {
    public:
        ExactImpl(Kernel::Details::SquaredExponential kernel,
                  std::shared_ptr<Likelihood::LikelihoodImpl> likelihood,
                  ExactOptions options)
            : options_(options),
              kernel_(std::move(kernel)),
              likelihood_(std::move(likelihood))
        {
            if (!kernel_ || !likelihood_) {
                throw std::invalid_argument("Exact inference requires a kernel and a likelihood.");
            }
            if (likelihood_->kind() != Likelihood::Kind::Gaussian) {
                throw std::invalid_argument(std::string("Exact inference requires a Gaussian likelihood, got ")
                                            + Likelihood::Details::kind_name(likelihood_->kind()) + ".");
            }
            if (!(options_.jitter >= 0.0) || !std::isfinite(options_.jitter)) {
                throw std::invalid_argument("Exact inference requires a non-negative jitter.");
            }
        }

        // Negative log marginal likelihood of (inputs, outputs), summed over outputs.
        [[nodiscard]] Objective objective(const torch::Tensor& inputs, const torch::Tensor& outputs) const {
            check_pair(inputs, outputs);
            auto chol = factorize(inputs);
            auto targets = outputs.transpose(0, 1).unsqueeze(-1);
            auto alpha = torch::cholesky_solve(targets, chol);

            const auto n = static_cast<double>(inputs.size(0));
            const auto num_latent = static_cast<double>(outputs.size(1));
            auto fit = 0.5 * (targets * alpha).sum();
            auto complexity = chol.diagonal(0, -2, -1).log().sum();
            auto nlml = fit + complexity + 0.5 * n * num_latent * std::log(2.0 * M_PI);

            Objective terms;
            terms[kNlml] = nlml;
            terms[kLoss] = nlml;
            return terms;
        }

        void condition(const torch::Tensor& inputs, const torch::Tensor& outputs) {
            check_pair(inputs, outputs);
            train_inputs_ = Common::to_model_dtype(inputs).detach().clone();
            train_outputs_ = Common::to_model_dtype(outputs).detach().clone();
        }

        [[nodiscard]] bool conditioned() const noexcept { return train_inputs_.defined(); }

        // Latent posterior marginals at x: ([n, L], [n, L]).
        [[nodiscard]] std::pair<torch::Tensor, torch::Tensor> latent_moments(const torch::Tensor& inputs) const {
            if (!conditioned()) {
                throw std::logic_error("Exact inference must be conditioned on training data before predicting.");
            }
            auto chol = factorize(train_inputs_);
            auto targets = train_outputs_.transpose(0, 1).unsqueeze(-1);
            auto alpha = torch::cholesky_solve(targets, chol);

            auto cross = kernel_->cov(train_inputs_, inputs);
            auto mean = (cross * alpha).sum(1);
            auto projection = torch::linalg_solve_triangular(chol, cross, /*upper=*/false);
            auto var = (kernel_->diag_cov(inputs) - projection.pow(2).sum(1)).clamp_min(0.0);
            return {mean.transpose(0, 1), var.transpose(0, 1)};
        }

        [[nodiscard]] std::pair<torch::Tensor, torch::Tensor> predict(const torch::Tensor& inputs) const {
            auto [mean, var] = latent_moments(inputs);
            return likelihood_->predict(mean, var);
        }

        [[nodiscard]] const ExactOptions& options() const noexcept { return options_; }

    private:
        torch::Tensor factorize(const torch::Tensor& inputs) const {
            auto covariance = kernel_->cov(inputs);
            auto noise = likelihood_->noise_variance() + options_.jitter;
            return cholesky(add_jitter(covariance, noise), "K + noise (training covariance)");
        }

        void check_pair(const torch::Tensor& inputs, const torch::Tensor& outputs) const {
            if (!inputs.defined() || !outputs.defined() || inputs.dim() != 2 || outputs.dim() != 2) {
                throw std::invalid_argument("Exact inference expects [n, D] inputs and [n, O] outputs.");
            }
            if (inputs.size(0) != outputs.size(0)) {
                throw std::invalid_argument("Exact inference got " + std::to_string(inputs.size(0)) + " inputs but "
                                            + std::to_string(outputs.size(0)) + " outputs.");
            }
            if (outputs.size(1) != likelihood_->output_dim()) {
                throw std::invalid_argument("Exact inference expects " + std::to_string(likelihood_->output_dim())
                                            + " output columns, got " + std::to_string(outputs.size(1)) + ".");
            }
        }

        ExactOptions options_{};
        Kernel::Details::SquaredExponential kernel_{nullptr};
        std::shared_ptr<Likelihood::LikelihoodImpl> likelihood_{};
        torch::Tensor train_inputs_{};
        torch::Tensor train_outputs_{};
    };

    TORCH_MODULE(Exact);
}

#endif //UGP_INFERENCE_EXACT_HPP
