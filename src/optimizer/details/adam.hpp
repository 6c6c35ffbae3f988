#ifndef UGP_ADAM_HPP
#define UGP_ADAM_HPP

#include <tuple>

#include <torch/torch.h>

#include "check.hpp"

namespace Ugp::Optimizer::Details {

    struct AdamOptions {
        double learning_rate{1e-3};
        double beta1{0.9};
        double beta2{0.999};
        double eps{1e-8};
        double weight_decay{0.0};
        bool amsgrad{false};
    };

    struct AdamDescriptor {
        AdamOptions options{};
    };

    inline torch::optim::AdamOptions to_torch_options(const AdamOptions& options) {
        check_learning_rate("Adam", options.learning_rate);
        check_beta("Adam", "beta1", options.beta1);
        check_beta("Adam", "beta2", options.beta2);
        torch::optim::AdamOptions torch_options(options.learning_rate);
        torch_options = torch_options.betas(std::make_tuple(options.beta1, options.beta2));
        torch_options = torch_options.eps(options.eps);
        torch_options = torch_options.weight_decay(options.weight_decay);
        torch_options = torch_options.amsgrad(options.amsgrad);
        return torch_options;
    }

    // Decoupled weight decay. Only the hyperparameters differ from Adam.
    struct AdamWOptions {
        double learning_rate{1e-3};
        double beta1{0.9};
        double beta2{0.999};
        double eps{1e-8};
        double weight_decay{1e-2};
        bool amsgrad{false};
    };

    struct AdamWDescriptor {
        AdamWOptions options{};
    };

    inline torch::optim::AdamWOptions to_torch_options(const AdamWOptions& options) {
        check_learning_rate("AdamW", options.learning_rate);
        check_beta("AdamW", "beta1", options.beta1);
        check_beta("AdamW", "beta2", options.beta2);
        torch::optim::AdamWOptions torch_options(options.learning_rate);
        torch_options = torch_options.betas(std::make_tuple(options.beta1, options.beta2));
        torch_options = torch_options.eps(options.eps);
        torch_options = torch_options.weight_decay(options.weight_decay);
        torch_options = torch_options.amsgrad(options.amsgrad);
        return torch_options;
    }
}

#endif // UGP_ADAM_HPP
