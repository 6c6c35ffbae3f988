#ifndef UGP_INFERENCE_HPP
#define UGP_INFERENCE_HPP
#include <variant>

#include "details/common.hpp"
#include "details/kl.hpp"
#include "details/variational.hpp"
#include "details/exact.hpp"

namespace Ugp::Inference {
    using VariationalOptions = Details::VariationalOptions;
    using VariationalDescriptor = Details::VariationalDescriptor;

    using ExactOptions = Details::ExactOptions;
    using ExactDescriptor = Details::ExactDescriptor;

    using Descriptor = std::variant<VariationalDescriptor, ExactDescriptor>;

    [[nodiscard]] inline auto Variational(const VariationalOptions& options = {}) -> VariationalDescriptor {
        return VariationalDescriptor{.options = options};
    }

    [[nodiscard]] inline auto Exact(const ExactOptions& options = {}) -> ExactDescriptor {
        return ExactDescriptor{.options = options};
    }

    [[nodiscard]] inline Mode mode_of(const Descriptor& descriptor) noexcept {
        return std::holds_alternative<ExactDescriptor>(descriptor) ? Mode::Exact : Mode::Variational;
    }
}

#endif //UGP_INFERENCE_HPP
