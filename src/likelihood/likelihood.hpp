#ifndef UGP_LIKELIHOOD_HPP
#define UGP_LIKELIHOOD_HPP
#include <memory>
#include <variant>

#include "details/common.hpp"
#include "details/gaussian.hpp"
#include "details/logistic.hpp"
#include "details/softmax.hpp"

namespace Ugp::Likelihood {
    using Kind = Details::Kind;
    using LikelihoodImpl = Details::LikelihoodImpl;

    using GaussianOptions = Details::GaussianOptions;
    using GaussianDescriptor = Details::GaussianDescriptor;
    using LogisticOptions = Details::LogisticOptions;
    using LogisticDescriptor = Details::LogisticDescriptor;
    using SoftmaxOptions = Details::SoftmaxOptions;
    using SoftmaxDescriptor = Details::SoftmaxDescriptor;

    using Descriptor = std::variant<GaussianDescriptor, LogisticDescriptor, SoftmaxDescriptor>;

    [[nodiscard]] inline auto Gaussian(const GaussianOptions& options = {}) -> GaussianDescriptor {
        return GaussianDescriptor{.options = options};
    }

    [[nodiscard]] inline auto Logistic(const LogisticOptions& options = {}) -> LogisticDescriptor {
        return LogisticDescriptor{.options = options};
    }

    [[nodiscard]] inline auto Softmax(const SoftmaxOptions& options = {}) -> SoftmaxDescriptor {
        return SoftmaxDescriptor{.options = options};
    }
}

#include "registry.hpp"

#endif //UGP_LIKELIHOOD_HPP
