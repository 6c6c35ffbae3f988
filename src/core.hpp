#ifndef UGP_CORE_HPP
#define UGP_CORE_HPP
/*
 * Model container.
 * ---------------------------------------------------------------------------
 *  - Builds the kernel, likelihood and inference engine from their descriptors
 *    and registers them as submodules, so parameters(), checkpoints and the
 *    optimizer all see one parameter tree.
 *  - The inference mode is fixed at construction; every entry point branches
 *    on it (Variational or Exact).
 *  - Input and output dimensionality are fixed by the inducing inputs and the
 *    likelihood. Predictions always use the current parameter values.
 */

#include <algorithm>
#include <cstdint>
#include <exception>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "common/tensor.hpp"
#include "common/visit.hpp"
#include "data/dataset.hpp"
#include "inference/inference.hpp"
#include "kernel/kernel.hpp"
#include "likelihood/likelihood.hpp"
#include "utils/terminal.hpp"

namespace Ugp {
    struct ModelOptions {
        Kernel::Descriptor kernel{Kernel::SquaredExponential()};
        Likelihood::Descriptor likelihood{Likelihood::Gaussian()};
        Inference::Descriptor inference{Inference::Variational()};
    };

    struct FitOptions {
        std::int64_t var_steps{10};
        std::int64_t epochs{200};
        std::optional<std::int64_t> batch_size{};  // empty: whole dataset
        std::int64_t display_step{1};
        std::ostream* stream{&std::cout};
    };

    // Above this size the periodic full-data objective report is skipped.
    inline constexpr std::int64_t kMaxReportExamples = 100000;

    class Model : public torch::nn::Module {
    public:
        Model(const torch::Tensor& inducing_inputs, ModelOptions options = {})
            : options_(std::move(options)),
              mode_(Inference::mode_of(options_.inference))
        {
            auto inducing = Common::to_model_dtype(inducing_inputs);
            if (!inducing.defined() || (inducing.dim() != 2 && inducing.dim() != 3)) {
                throw std::invalid_argument("Model expects inducing inputs shaped [M, D] or [L, M, D], got "
                                            + (inducing.defined() ? Common::format_shape(inducing) : std::string("undefined"))
                                            + ".");
            }
            input_dim_ = inducing.size(-1);

            likelihood_ = register_module<Likelihood::LikelihoodImpl>(
                "likelihood", Likelihood::build_likelihood(options_.likelihood));
            output_dim_ = likelihood_->output_dim();

            kernel_ = register_module("kernel", Kernel::build_kernel(options_.kernel));
            if (kernel_->input_dim() != input_dim_) {
                throw std::invalid_argument("Kernel input dimension " + std::to_string(kernel_->input_dim())
                                            + " disagrees with the inducing inputs' dimension "
                                            + std::to_string(input_dim_) + ".");
            }
            if (kernel_->num_latent() != likelihood_->num_latent()) {
                throw std::invalid_argument("Kernel has " + std::to_string(kernel_->num_latent())
                                            + " latent functions but the likelihood needs "
                                            + std::to_string(likelihood_->num_latent()) + ".");
            }

            std::visit(Common::Overloaded{
                [&](const Inference::VariationalDescriptor& descriptor) {
                    Inference::Details::Variational engine(inducing, kernel_, likelihood_, descriptor.options);
                    register_module("inference", engine);
                    engine_.emplace<Inference::Details::Variational>(std::move(engine));
                },
                [&](const Inference::ExactDescriptor& descriptor) {
                    Inference::Details::Exact engine(kernel_, likelihood_, descriptor.options);
                    register_module("inference", engine);
                    engine_.emplace<Inference::Details::Exact>(std::move(engine));
                }
            }, options_.inference);
        }

        [[nodiscard]] Inference::Mode mode() const noexcept { return mode_; }
        [[nodiscard]] std::int64_t input_dim() const noexcept { return input_dim_; }
        [[nodiscard]] std::int64_t output_dim() const noexcept { return output_dim_; }
        [[nodiscard]] const ModelOptions& options() const noexcept { return options_; }

        [[nodiscard]] const Kernel::Details::SquaredExponential& kernel() const noexcept { return kernel_; }
        [[nodiscard]] const std::shared_ptr<Likelihood::LikelihoodImpl>& likelihood() const noexcept { return likelihood_; }

        [[nodiscard]] Inference::Details::Variational& variational() {
            if (mode_ != Inference::Mode::Variational) {
                throw std::logic_error("Model uses exact inference; there is no variational engine.");
            }
            return std::get<Inference::Details::Variational>(engine_);
        }

        [[nodiscard]] Inference::Details::Exact& exact() {
            if (mode_ != Inference::Mode::Exact) {
                throw std::logic_error("Model uses variational inference; there is no exact engine.");
            }
            return std::get<Inference::Details::Exact>(engine_);
        }

        // Kernel and likelihood parameters.
        [[nodiscard]] std::vector<torch::Tensor> hyperparameters() const {
            auto values = kernel_->parameters();
            const auto likelihood_values = likelihood_->parameters();
            values.insert(values.end(), likelihood_values.begin(), likelihood_values.end());
            return values;
        }

        [[nodiscard]] std::vector<torch::Tensor> variational_parameters() const {
            if (mode_ == Inference::Mode::Variational) {
                return std::get<Inference::Details::Variational>(engine_)->variational_parameters();
            }
            return {};
        }

        void validate(const Data::Dataset& data) const {
            if (data.empty()) {
                throw std::invalid_argument("Model received an empty dataset.");
            }
            if (data.input_dim() != input_dim_) {
                throw std::invalid_argument("Dataset input dimension " + std::to_string(data.input_dim())
                                            + " disagrees with the model's " + std::to_string(input_dim_) + ".");
            }
            if (data.output_dim() != output_dim_) {
                throw std::invalid_argument("Dataset output dimension " + std::to_string(data.output_dim())
                                            + " disagrees with the model's " + std::to_string(output_dim_) + ".");
            }
        }

        // Objective terms for one batch; num_train is the size of the full training set.
        [[nodiscard]] Inference::Objective objective(const torch::Tensor& inputs, const torch::Tensor& outputs,
                                                     std::int64_t num_train) {
            auto x = checked_inputs(inputs);
            auto y = Common::to_model_dtype(outputs);
            switch (mode_) {
                case Inference::Mode::Variational:
                    return std::get<Inference::Details::Variational>(engine_)->objective(x, y, num_train);
                case Inference::Mode::Exact:
                    return std::get<Inference::Details::Exact>(engine_)->objective(x, y);
            }
            throw std::logic_error("Unknown inference mode.");
        }

        // Exact inference predicts from these targets. Variational models ignore them.
        void condition(const torch::Tensor& inputs, const torch::Tensor& outputs) {
            if (mode_ == Inference::Mode::Exact) {
                std::get<Inference::Details::Exact>(engine_)->condition(checked_inputs(inputs),
                                                                        Common::to_model_dtype(outputs));
            }
        }

        // Predictive mean and variance for one chunk of inputs: ([n, O], [n, O]).
        [[nodiscard]] std::pair<torch::Tensor, torch::Tensor> prediction(const torch::Tensor& inputs) {
            auto x = checked_inputs(inputs);
            switch (mode_) {
                case Inference::Mode::Variational:
                    return std::get<Inference::Details::Variational>(engine_)->predict(x);
                case Inference::Mode::Exact:
                    return std::get<Inference::Details::Exact>(engine_)->predict(x);
            }
            throw std::logic_error("Unknown inference mode.");
        }

        // Predicts in ceil(n / batch_size) contiguous chunks and concatenates them in order.
        [[nodiscard]] std::pair<torch::Tensor, torch::Tensor> predict(const torch::Tensor& inputs,
                                                                      std::optional<std::int64_t> batch_size = std::nullopt) {
            auto x = checked_inputs(inputs);
            const auto total = x.size(0);
            const auto chunk = batch_size.value_or(std::max<std::int64_t>(total, 1));
            if (chunk <= 0) {
                throw std::invalid_argument("Prediction batch size must be positive, got " + std::to_string(chunk) + ".");
            }

            torch::NoGradGuard no_grad;
            if (total == 0) {
                auto empty = torch::empty({0, output_dim_}, Common::tensor_options());
                return {empty, empty.clone()};
            }

            std::vector<torch::Tensor> means;
            std::vector<torch::Tensor> variances;
            const auto num_chunks = (total + chunk - 1) / chunk;
            means.reserve(static_cast<std::size_t>(num_chunks));
            variances.reserve(static_cast<std::size_t>(num_chunks));
            for (std::int64_t start = 0; start < total; start += chunk) {
                const auto length = std::min(chunk, total - start);
                auto [mean, var] = prediction(x.narrow(0, start, length));
                means.push_back(mean);
                variances.push_back(var);
            }
            return {torch::cat(means, 0), torch::cat(variances, 0)};
        }

        // Runs var_steps optimizer steps against the summed objective until the dataset has
        // completed `epochs` passes.
        void fit(Data::Dataset& data, torch::optim::Optimizer& optimizer, const FitOptions& options = {}) {
            validate(data);
            if (options.var_steps <= 0) {
                throw std::invalid_argument("FitOptions::var_steps must be positive.");
            }
            if (options.display_step <= 0) {
                throw std::invalid_argument("FitOptions::display_step must be positive.");
            }
            const auto num_train = data.num_examples();
            const auto batch_size = options.batch_size.value_or(num_train);

            torch::nn::Module::train();
            std::int64_t iteration = 0;
            while (data.epochs_completed() < options.epochs) {
                for (std::int64_t var_iter = 0; var_iter < options.var_steps; ++var_iter) {
                    auto [inputs, outputs] = data.next_batch(batch_size);
                    try {
                        optimizer.zero_grad();
                        auto terms = objective(inputs, outputs, num_train);
                        terms.at(Inference::kLoss).backward();
                        optimizer.step();
                    } catch (const std::exception& error) {
                        std::throw_with_nested(std::runtime_error("Model::fit iteration " + std::to_string(iteration)
                                                                  + " failed while evaluating '"
                                                                  + Inference::kLoss + "': " + error.what()));
                    }

                    if (var_iter % options.display_step == 0) {
                        print_state(data, iteration, options.stream);
                    }
                    ++iteration;
                }
            }
            torch::nn::Module::eval();
            condition(data.X(), data.Y());
        }

    private:
        torch::Tensor checked_inputs(const torch::Tensor& inputs) const {
            if (!inputs.defined() || inputs.dim() != 2) {
                throw std::invalid_argument("Model expects inputs shaped [n, " + std::to_string(input_dim_) + "], got "
                                            + (inputs.defined() ? Common::format_shape(inputs) : std::string("undefined"))
                                            + ".");
            }
            if (inputs.size(1) != input_dim_) {
                throw std::invalid_argument("Model expects input dimension " + std::to_string(input_dim_) + ", got "
                                            + std::to_string(inputs.size(1)) + ".");
            }
            return Common::to_model_dtype(inputs);
        }

        void print_state(const Data::Dataset& data, std::int64_t iteration, std::ostream* stream) {
            if (stream == nullptr || data.num_examples() > kMaxReportExamples) {
                return;
            }
            torch::NoGradGuard no_grad;
            auto terms = objective(data.X(), data.Y(), data.num_examples());
            std::ostringstream line;
            line << "iter=" << iteration << " [epoch=" << data.epochs_completed() << "]";
            line << std::setprecision(6);
            for (const auto& [name, value] : terms) {
                line << ' ' << name << '=' << value.item<double>();
            }
            Utils::Terminal::Info(stream, line.str());
        }

        ModelOptions options_{};
        Inference::Mode mode_{Inference::Mode::Variational};
        std::int64_t input_dim_{0};
        std::int64_t output_dim_{0};
        Kernel::Details::SquaredExponential kernel_{nullptr};
        std::shared_ptr<Likelihood::LikelihoodImpl> likelihood_{};
        std::variant<Inference::Details::Variational, Inference::Details::Exact> engine_{std::in_place_index<0>, nullptr};
    };
}

#endif //UGP_CORE_HPP
