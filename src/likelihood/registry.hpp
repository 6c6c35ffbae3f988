#ifndef UGP_LIKELIHOOD_REGISTRY_HPP
#define UGP_LIKELIHOOD_REGISTRY_HPP

#include <memory>
#include <variant>

#include "likelihood.hpp"
#include "../common/visit.hpp"

namespace Ugp::Likelihood {
    [[nodiscard]] inline std::shared_ptr<LikelihoodImpl> build_likelihood(const Descriptor& descriptor) {
        return std::visit(Common::Overloaded{
            [](const GaussianDescriptor& gaussian) -> std::shared_ptr<LikelihoodImpl> {
                return std::make_shared<Details::GaussianImpl>(gaussian.options);
            },
            [](const LogisticDescriptor& logistic) -> std::shared_ptr<LikelihoodImpl> {
                return std::make_shared<Details::LogisticImpl>(logistic.options);
            },
            [](const SoftmaxDescriptor& softmax) -> std::shared_ptr<LikelihoodImpl> {
                return std::make_shared<Details::SoftmaxImpl>(softmax.options);
            }
        }, descriptor);
    }
}

#endif //UGP_LIKELIHOOD_REGISTRY_HPP
