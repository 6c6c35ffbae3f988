#ifndef UGP_INFERENCE_KL_HPP
#define UGP_INFERENCE_KL_HPP

#include <torch/torch.h>

namespace Ugp::Inference::Details {
    // KL(N(m, S S^T) || N(0, I)) summed over latent functions.
    // mean: [L, M], factor: [L, M, M] lower triangular.
    inline torch::Tensor whitened_kl(const torch::Tensor& mean, const torch::Tensor& factor) {
        const auto num_latent = static_cast<double>(mean.size(0));
        const auto num_inducing = static_cast<double>(mean.size(1));
        auto trace = factor.pow(2).sum();
        auto mahalanobis = mean.pow(2).sum();
        auto log_det = factor.diagonal(0, -2, -1).abs().log().sum();
        return 0.5 * (trace + mahalanobis - num_latent * num_inducing) - log_det;
    }
}

#endif //UGP_INFERENCE_KL_HPP
