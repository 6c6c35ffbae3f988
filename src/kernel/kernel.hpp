#ifndef UGP_KERNEL_HPP
#define UGP_KERNEL_HPP
#include <variant>

#include "details/squared_exponential.hpp"

namespace Ugp::Kernel {
    using SquaredExponentialOptions = Details::SquaredExponentialOptions;
    using SquaredExponentialDescriptor = Details::SquaredExponentialDescriptor;

    using Descriptor = std::variant<SquaredExponentialDescriptor>;

    [[nodiscard]] inline auto SquaredExponential(const SquaredExponentialOptions& options = {}) -> SquaredExponentialDescriptor {
        return SquaredExponentialDescriptor{.options = options};
    }

    [[nodiscard]] inline Details::SquaredExponential build_kernel(const Descriptor& descriptor) {
        return std::visit([](const SquaredExponentialDescriptor& se) {
            return Details::SquaredExponential(se.options);
        }, descriptor);
    }
}

#endif //UGP_KERNEL_HPP
