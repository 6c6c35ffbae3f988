#ifndef UGP_KERNEL_SQUARED_EXPONENTIAL_HPP
#define UGP_KERNEL_SQUARED_EXPONENTIAL_HPP

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../common/tensor.hpp"

namespace Ugp::Kernel::Details {
    struct SquaredExponentialOptions {
        std::int64_t input_dim{1};
        std::int64_t num_latent{1};
        std::vector<double> length_scale{1.0}; // one value, or one per input dimension (ARD)
        double sf{1.0};
        bool iso{false};
    };

    struct SquaredExponentialDescriptor {
        SquaredExponentialOptions options{};
    };

    // Pairwise squared euclidean distance of already scaled points.
    // a: [L, n1, D], b: [L, n2, D] -> [L, n1, n2]
    inline torch::Tensor squared_distance(const torch::Tensor& a, const torch::Tensor& b) {
        auto a_norm = a.pow(2).sum(-1, /*keepdim=*/true);
        auto b_norm = b.pow(2).sum(-1, /*keepdim=*/true).transpose(-2, -1);
        auto cross = torch::matmul(a, b.transpose(-2, -1));
        return (a_norm + b_norm - 2.0 * cross).clamp_min(0.0);
    }

    class SquaredExponentialImpl : public torch::nn::Module {
    public:
        explicit SquaredExponentialImpl(SquaredExponentialOptions options)
            : options_(std::move(options))
        {
            if (options_.input_dim <= 0) {
                throw std::invalid_argument("SquaredExponential kernel requires a positive input dimension.");
            }
            if (options_.num_latent <= 0) {
                throw std::invalid_argument("SquaredExponential kernel requires at least one latent function.");
            }
            if (!(options_.sf > 0.0) || !std::isfinite(options_.sf)) {
                throw std::invalid_argument("SquaredExponential kernel requires a positive output scale, got "
                                            + std::to_string(options_.sf) + ".");
            }
            if (options_.length_scale.empty()) {
                throw std::invalid_argument("SquaredExponential kernel requires an initial length scale.");
            }
            for (const double value : options_.length_scale) {
                if (!(value > 0.0) || !std::isfinite(value)) {
                    throw std::invalid_argument("SquaredExponential kernel requires positive length scales, got "
                                                + std::to_string(value) + ".");
                }
            }

            const auto scales = static_cast<std::int64_t>(options_.length_scale.size());
            if (options_.iso && scales != 1) {
                throw std::invalid_argument("Isotropic SquaredExponential kernel takes a single length scale, got "
                                            + std::to_string(scales) + ".");
            }
            if (!options_.iso && scales != 1 && scales != options_.input_dim) {
                throw std::invalid_argument("ARD SquaredExponential kernel expects " + std::to_string(options_.input_dim)
                                            + " length scales (one per input dimension), got "
                                            + std::to_string(scales) + ".");
            }

            const auto width = options_.iso ? std::int64_t{1} : options_.input_dim;
            auto initial = torch::tensor(options_.length_scale, Common::tensor_options());
            initial = initial.log().expand({options_.num_latent, width}).clone();
            log_length_scale_ = register_parameter("log_length_scale", initial);
            log_sf_ = register_parameter(
                "log_sf", torch::full({options_.num_latent}, std::log(options_.sf), Common::tensor_options()));
        }

        // x1: [n1, D] or [L, n1, D]; x2: [n2, D] (defaults to x1). Returns [L, n1, n2].
        torch::Tensor cov(const torch::Tensor& x1, const torch::Tensor& x2 = {}) const {
            check_points(x1, "cov");
            auto scale = length_scale().unsqueeze(1);
            auto a = as_batched(x1) / scale;

            torch::Tensor sq_dist;
            if (x2.defined()) {
                check_points(x2, "cov");
                sq_dist = squared_distance(a, as_batched(x2) / scale);
            } else {
                // Exact zeros on the diagonal keep cov(X)[i, i] == diag_cov(X)[i].
                const auto n = a.size(-2);
                auto eye = torch::eye(n, torch::TensorOptions().dtype(torch::kBool).device(a.device()));
                sq_dist = squared_distance(a, a).masked_fill(eye, 0.0);
            }

            auto variance = sf().pow(2).view({options_.num_latent, 1, 1});
            return variance * torch::exp(-0.5 * sq_dist);
        }

        // x: [n, D] or [L, n, D]. Returns [L, n].
        torch::Tensor diag_cov(const torch::Tensor& x) const {
            check_points(x, "diag_cov");
            const auto n = x.size(-2);
            return sf().pow(2).unsqueeze(1).expand({options_.num_latent, n});
        }

        [[nodiscard]] torch::Tensor length_scale() const { return log_length_scale_.exp(); }
        [[nodiscard]] torch::Tensor sf() const { return log_sf_.exp(); }

        [[nodiscard]] std::vector<torch::Tensor> hyperparameters() const { return {log_length_scale_, log_sf_}; }

        [[nodiscard]] std::int64_t input_dim() const noexcept { return options_.input_dim; }
        [[nodiscard]] std::int64_t num_latent() const noexcept { return options_.num_latent; }
        [[nodiscard]] bool iso() const noexcept { return options_.iso; }
        [[nodiscard]] const SquaredExponentialOptions& options() const noexcept { return options_; }

    private:
        torch::Tensor as_batched(const torch::Tensor& points) const {
            return points.dim() == 2 ? points.unsqueeze(0) : points;
        }

        void check_points(const torch::Tensor& points, const char* where) const {
            if (!points.defined()) {
                throw std::invalid_argument(std::string("SquaredExponential::") + where + " requires defined inputs.");
            }
            if (points.dim() != 2 && points.dim() != 3) {
                throw std::invalid_argument(std::string("SquaredExponential::") + where
                                            + " expects [n, D] or [L, n, D] inputs, got "
                                            + Common::format_shape(points) + ".");
            }
            if (points.size(-1) != options_.input_dim) {
                throw std::invalid_argument(std::string("SquaredExponential::") + where + " expects input dimension "
                                            + std::to_string(options_.input_dim) + ", got "
                                            + std::to_string(points.size(-1)) + ".");
            }
            if (points.dim() == 3 && points.size(0) != 1 && points.size(0) != options_.num_latent) {
                throw std::invalid_argument(std::string("SquaredExponential::") + where
                                            + " batched inputs must have one set per latent function, got "
                                            + Common::format_shape(points) + ".");
            }
        }

        SquaredExponentialOptions options_{};
        torch::Tensor log_length_scale_{};
        torch::Tensor log_sf_{};
    };

    TORCH_MODULE(SquaredExponential);
}

#endif //UGP_KERNEL_SQUARED_EXPONENTIAL_HPP
