#ifndef UGP_OPTIMIZER_CHECK_HPP
#define UGP_OPTIMIZER_CHECK_HPP

#include <cmath>
#include <stdexcept>
#include <string>

namespace Ugp::Optimizer::Details {
    inline void check_learning_rate(const char* optimizer, double learning_rate) {
        if (!(learning_rate > 0.0) || !std::isfinite(learning_rate)) {
            throw std::invalid_argument(std::string(optimizer) + " requires a positive learning rate, got "
                                        + std::to_string(learning_rate) + ".");
        }
    }

    inline void check_beta(const char* optimizer, const char* name, double beta) {
        if (!(beta >= 0.0 && beta < 1.0)) {
            throw std::invalid_argument(std::string(optimizer) + " requires " + name + " in [0, 1), got "
                                        + std::to_string(beta) + ".");
        }
    }
}

#endif //UGP_OPTIMIZER_CHECK_HPP
