#ifndef UGP_INFERENCE_COMMON_HPP
#define UGP_INFERENCE_COMMON_HPP

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

namespace Ugp::Inference {
    enum class Mode {
        Variational,
        Exact
    };

    inline const char* mode_name(Mode mode) {
        return mode == Mode::Variational ? "Variational" : "Exact";
    }

    // Raised when a covariance matrix cannot be factorized. Retrying with a larger jitter is up to the caller.
    class CholeskyError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Objective terms of one forward evaluation, keyed by name.
    using Objective = std::map<std::string, torch::Tensor>;

    inline constexpr const char* kNelbo = "NELBO";
    inline constexpr const char* kLooVariational = "LOO_VARIATIONAL";
    inline constexpr const char* kNlml = "NLML";
    inline constexpr const char* kLoss = "loss";
}

namespace Ugp::Inference::Details {
    // matrix: [L, n, n]
    inline torch::Tensor add_jitter(const torch::Tensor& matrix, const torch::Tensor& jitter) {
        const auto n = matrix.size(-1);
        auto eye = torch::eye(n, matrix.options());
        return matrix + jitter.reshape({-1, 1, 1}) * eye;
    }

    inline torch::Tensor add_jitter(const torch::Tensor& matrix, double jitter) {
        const auto n = matrix.size(-1);
        return matrix + jitter * torch::eye(n, matrix.options());
    }

    // Lower Cholesky factor of a batch of matrices. `what` names the matrix in the error.
    inline torch::Tensor cholesky(const torch::Tensor& matrix, const std::string& what) {
        auto [factor, info] = torch::linalg_cholesky_ex(matrix, /*upper=*/false, /*check_errors=*/false);
        auto failed = info.reshape({-1}).ne(0);
        if (failed.any().item<bool>()) {
            const auto block = failed.nonzero().select(1, 0)[0].item<std::int64_t>();
            const auto minor = info.reshape({-1})[block].item<std::int64_t>();
            throw CholeskyError("Cholesky factorization of " + what + " failed for latent function "
                                + std::to_string(block) + " (leading minor of order " + std::to_string(minor)
                                + " is not positive definite); increase the jitter.");
        }
        if (!torch::isfinite(factor).all().item<bool>()) {
            throw CholeskyError("Cholesky factorization of " + what + " produced non-finite values.");
        }
        return factor;
    }
}

#endif //UGP_INFERENCE_COMMON_HPP
