#ifndef UGP_OPTIMIZER_REGISTRY_HPP
#define UGP_OPTIMIZER_REGISTRY_HPP

#include <algorithm>
#include <cctype>
#include <memory>
#include <stdexcept>
#include <string>
#include <variant>

#include <torch/torch.h>

#include "optimizer.hpp"

namespace Ugp::Optimizer {
    namespace Details {
        template <class Owner>
        std::unique_ptr<torch::optim::Optimizer> build_optimizer(Owner& owner, const SGDDescriptor& descriptor) {
            return std::make_unique<torch::optim::SGD>(owner.parameters(), to_torch_options(descriptor.options));
        }

        template <class Owner>
        std::unique_ptr<torch::optim::Optimizer> build_optimizer(Owner& owner, const RMSpropDescriptor& descriptor) {
            return std::make_unique<torch::optim::RMSprop>(owner.parameters(), to_torch_options(descriptor.options));
        }

        template <class Owner>
        std::unique_ptr<torch::optim::Optimizer> build_optimizer(Owner& owner, const AdagradDescriptor& descriptor) {
            return std::make_unique<torch::optim::Adagrad>(owner.parameters(), to_torch_options(descriptor.options));
        }

        template <class Owner>
        std::unique_ptr<torch::optim::Optimizer> build_optimizer(Owner& owner, const AdamWDescriptor& descriptor) {
            return std::make_unique<torch::optim::AdamW>(owner.parameters(), to_torch_options(descriptor.options));
        }

        template <class Owner>
        std::unique_ptr<torch::optim::Optimizer> build_optimizer(Owner& owner, const AdamDescriptor& descriptor) {
            return std::make_unique<torch::optim::Adam>(owner.parameters(), to_torch_options(descriptor.options));
        }
    }

    // Optimizes every parameter the owner registers (kernel, likelihood and variational).
    template <class Owner>
    [[nodiscard]] std::unique_ptr<torch::optim::Optimizer> build_optimizer(Owner& owner, const Descriptor& descriptor) {
        return std::visit([&owner](const auto& concrete) {
            return Details::build_optimizer(owner, concrete);
        }, descriptor);
    }

    // Descriptor for a configuration name ("Adam", "AdamW", "SGD", "RMSprop", "Adagrad"), case-insensitive.
    [[nodiscard]] inline Descriptor from_name(std::string name, double learning_rate) {
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (name == "adam") {
            return Adam({.learning_rate = learning_rate});
        }
        if (name == "adamw") {
            return AdamW({.learning_rate = learning_rate});
        }
        if (name == "sgd") {
            return SGD({.learning_rate = learning_rate});
        }
        if (name == "rmsprop") {
            return RMSprop({.learning_rate = learning_rate});
        }
        if (name == "adagrad") {
            return Adagrad({.learning_rate = learning_rate});
        }
        throw std::invalid_argument("Unknown optimizer '" + name
                                    + "' (expected Adam, AdamW, SGD, RMSprop or Adagrad).");
    }
}

#endif // UGP_OPTIMIZER_REGISTRY_HPP
