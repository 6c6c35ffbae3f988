#ifndef UGP_TRAINING_OPTIONS_HPP
#define UGP_TRAINING_OPTIONS_HPP

#include <cmath>
#include <cstdint>
#include <iostream>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

#include "../../inference/inference.hpp"

namespace Ugp::Training::Details {
    struct Options {
        // Model::fit
        std::int64_t var_steps{10};
        std::int64_t epochs{200};
        std::optional<std::int64_t> batch_size{};  // empty: whole dataset per batch
        std::int64_t display_step{1};

        // train_gp / fit / evaluate
        std::int64_t logging_steps{1};   // 0 disables step logging
        std::int64_t loo_steps{0};       // 0 disables the NELBO / LOO alternation
        std::int64_t nelbo_steps{0};     // 0 with loo_steps set: same length as loo_steps
        std::int64_t train_steps{500};
        std::int64_t eval_epochs{10};
        std::int64_t chkpnt_steps{0};    // 0: checkpoint after every cycle
        std::string save_dir{};          // empty: fresh temporary directory
        std::string model_name{"local"};
        bool plot{false};
        std::string preds_path{};

        std::string optimizer{"Adam"};
        double learning_rate{1e-3};
        std::uint64_t seed{0};

        std::ostream* stream{&std::cout};
    };

    inline void require_non_negative(std::int64_t value, const char* name) {
        if (value < 0) {
            throw std::invalid_argument(std::string("Option '") + name + "' must be non-negative, got "
                                        + std::to_string(value) + ".");
        }
    }

    inline void require_positive(std::int64_t value, const char* name) {
        if (value <= 0) {
            throw std::invalid_argument(std::string("Option '") + name + "' must be positive, got "
                                        + std::to_string(value) + ".");
        }
    }

    // Rejects contradictory or out-of-range settings at startup.
    inline void validate(const Options& options) {
        require_positive(options.var_steps, "var_steps");
        require_non_negative(options.epochs, "epochs");
        require_positive(options.display_step, "display_step");
        require_non_negative(options.logging_steps, "logging_steps");
        require_non_negative(options.loo_steps, "loo_steps");
        require_non_negative(options.train_steps, "train_steps");
        require_positive(options.eval_epochs, "eval_epochs");
        require_non_negative(options.chkpnt_steps, "chkpnt_steps");
        if (options.batch_size) {
            require_positive(*options.batch_size, "batch_size");
        }
        if (options.nelbo_steps < 0) {
            throw std::invalid_argument("Option 'nelbo_steps' must be non-negative, got "
                                        + std::to_string(options.nelbo_steps) + ".");
        }
        if (options.nelbo_steps > 0 && options.loo_steps == 0) {
            throw std::invalid_argument("Option 'nelbo_steps' only applies together with 'loo_steps'.");
        }
        if (!(options.learning_rate > 0.0) || !std::isfinite(options.learning_rate)) {
            throw std::invalid_argument("Option 'learning_rate' must be positive, got "
                                        + std::to_string(options.learning_rate) + ".");
        }
        if (options.model_name.empty()) {
            throw std::invalid_argument("Option 'model_name' must not be empty.");
        }
    }

    // Mode-dependent checks: the leave-one-out alternation needs a variational engine
    // that computes the LOO term.
    inline void validate(const Options& options, const Inference::Descriptor& inference) {
        validate(options);
        if (options.loo_steps == 0) {
            return;
        }
        const auto* variational = std::get_if<Inference::VariationalDescriptor>(&inference);
        if (variational == nullptr) {
            throw std::invalid_argument("Option 'loo_steps' requires variational inference.");
        }
        if (!variational->options.leave_one_out) {
            throw std::invalid_argument("Option 'loo_steps' requires variational inference with leave_one_out enabled.");
        }
    }

    // Objective term to differentiate at a global step.
    [[nodiscard]] inline const char* select_objective(std::int64_t step, std::int64_t loo_steps, std::int64_t nelbo_steps) {
        if (loo_steps <= 0) {
            return Inference::kLoss;
        }
        const auto nelbo = nelbo_steps > 0 ? nelbo_steps : loo_steps;
        return (step % (nelbo + loo_steps)) < nelbo ? Inference::kNelbo : Inference::kLooVariational;
    }
}

#endif //UGP_TRAINING_OPTIONS_HPP
