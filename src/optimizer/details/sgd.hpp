#ifndef UGP_SGD_HPP
#define UGP_SGD_HPP

#include <stdexcept>

#include <torch/torch.h>

#include "check.hpp"

namespace Ugp::Optimizer::Details {

    struct SGDOptions {
        double learning_rate{1e-2};
        double momentum{0.0};
        double dampening{0.0};
        double weight_decay{0.0};
        bool nesterov{false};
    };

    struct SGDDescriptor {
        SGDOptions options{};
    };

    inline torch::optim::SGDOptions to_torch_options(const SGDOptions& options) {
        check_learning_rate("SGD", options.learning_rate);
        if (options.nesterov && (options.momentum <= 0.0 || options.dampening != 0.0)) {
            throw std::invalid_argument("SGD with Nesterov momentum requires momentum > 0 and zero dampening.");
        }
        torch::optim::SGDOptions torch_options(options.learning_rate);
        torch_options = torch_options.momentum(options.momentum);
        torch_options = torch_options.dampening(options.dampening);
        torch_options = torch_options.weight_decay(options.weight_decay);
        torch_options = torch_options.nesterov(options.nesterov);
        return torch_options;
    }
}

#endif //UGP_SGD_HPP
