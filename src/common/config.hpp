#ifndef UGP_COMMON_CONFIG_HPP
#define UGP_COMMON_CONFIG_HPP
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <set>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "../core.hpp"
#include "../training/details/options.hpp"

namespace Ugp::Common::Config {
    using PropertyTree = boost::property_tree::ptree;

    // Optional "model" section of a configuration file.
    struct ModelSettings {
        std::string inference{"variational"};   // variational | exact
        std::string likelihood{"gaussian"};     // gaussian | logistic | softmax
        std::vector<double> length_scale{1.0};
        double sf{1.0};
        bool iso{false};
        double noise_variance{1.0};
        std::int64_t num_samples{100};
        std::int64_t num_quadrature_points{20};
        double jitter{1e-6};
        bool diagonal_posterior{false};
        bool share_inducing{false};
    };

    struct Settings {
        Training::Details::Options training{};
        ModelSettings model{};
    };

    inline const std::set<std::string>& training_keys() {
        static const std::set<std::string> keys{
            "var_steps", "epochs", "batch_size", "display_step", "logging_steps", "loo_steps",
            "nelbo_steps", "train_steps", "eval_epochs", "chkpnt_steps", "save_dir", "model_name",
            "plot", "preds_path", "optimizer", "learning_rate", "seed"};
        return keys;
    }

    inline const std::set<std::string>& model_keys() {
        static const std::set<std::string> keys{
            "inference", "likelihood", "length_scale", "sf", "iso", "noise_variance", "num_samples",
            "num_quadrature_points", "jitter", "diagonal_posterior", "share_inducing"};
        return keys;
    }

    namespace Detail {
        template <class T>
        T value(const PropertyTree& node, const std::string& key) {
            if (!node.empty()) {
                throw std::invalid_argument("Option '" + key + "' must be a scalar.");
            }
            const auto parsed = node.get_value_optional<T>();
            if (!parsed) {
                throw std::invalid_argument("Option '" + key + "' has an invalid value '" + node.data() + "'.");
            }
            return *parsed;
        }

        template <class T>
        void read(const PropertyTree& tree, const std::string& key, T& field) {
            if (const auto child = tree.get_child_optional(key)) {
                field = value<T>(*child, key);
            }
        }

        inline void reject_unknown(const PropertyTree& tree, const std::set<std::string>& known,
                                   const std::string& section, const std::set<std::string>& nested = {}) {
            for (const auto& [key, child] : tree) {
                if (key.empty()) {
                    throw std::invalid_argument("Configuration section '" + section + "' must be an object.");
                }
                if (!known.count(key) && !nested.count(key)) {
                    throw std::invalid_argument("Unknown option '" + key + "' in configuration section '"
                                                + section + "'.");
                }
            }
        }

        inline std::string lowercase(std::string text) {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return text;
        }
    }

    // Fills training options from the top level of a configuration tree and validates them.
    inline Training::Details::Options parse_options(const PropertyTree& tree, Training::Details::Options options = {}) {
        Detail::reject_unknown(tree, training_keys(), "root", {"model"});

        Detail::read(tree, "var_steps", options.var_steps);
        Detail::read(tree, "epochs", options.epochs);
        Detail::read(tree, "display_step", options.display_step);
        Detail::read(tree, "logging_steps", options.logging_steps);
        Detail::read(tree, "loo_steps", options.loo_steps);
        Detail::read(tree, "nelbo_steps", options.nelbo_steps);
        Detail::read(tree, "train_steps", options.train_steps);
        Detail::read(tree, "eval_epochs", options.eval_epochs);
        Detail::read(tree, "chkpnt_steps", options.chkpnt_steps);
        Detail::read(tree, "save_dir", options.save_dir);
        Detail::read(tree, "model_name", options.model_name);
        Detail::read(tree, "plot", options.plot);
        Detail::read(tree, "preds_path", options.preds_path);
        Detail::read(tree, "optimizer", options.optimizer);
        Detail::read(tree, "learning_rate", options.learning_rate);
        Detail::read(tree, "seed", options.seed);

        // null or absent: one batch holds the whole dataset
        if (const auto child = tree.get_child_optional("batch_size")) {
            if (child->data() == "null" || (child->data().empty() && child->empty())) {
                options.batch_size.reset();
            } else {
                options.batch_size = Detail::value<std::int64_t>(*child, "batch_size");
            }
        }

        Training::Details::validate(options);
        return options;
    }

    inline ModelSettings parse_model(const PropertyTree& tree) {
        Detail::reject_unknown(tree, model_keys(), "model");

        ModelSettings settings{};
        Detail::read(tree, "inference", settings.inference);
        Detail::read(tree, "likelihood", settings.likelihood);
        Detail::read(tree, "sf", settings.sf);
        Detail::read(tree, "iso", settings.iso);
        Detail::read(tree, "noise_variance", settings.noise_variance);
        Detail::read(tree, "num_samples", settings.num_samples);
        Detail::read(tree, "num_quadrature_points", settings.num_quadrature_points);
        Detail::read(tree, "jitter", settings.jitter);
        Detail::read(tree, "diagonal_posterior", settings.diagonal_posterior);
        Detail::read(tree, "share_inducing", settings.share_inducing);
        settings.inference = Detail::lowercase(settings.inference);
        settings.likelihood = Detail::lowercase(settings.likelihood);

        // A single number or an array with one entry per input dimension.
        if (const auto child = tree.get_child_optional("length_scale")) {
            settings.length_scale.clear();
            if (child->empty()) {
                settings.length_scale.push_back(Detail::value<double>(*child, "length_scale"));
            } else {
                for (const auto& [key, element] : *child) {
                    if (!key.empty()) {
                        throw std::invalid_argument("Option 'length_scale' must be a number or an array.");
                    }
                    settings.length_scale.push_back(Detail::value<double>(element, "length_scale"));
                }
            }
        }
        return settings;
    }

    inline Settings parse(const PropertyTree& tree) {
        Settings settings{};
        settings.training = parse_options(tree);
        if (const auto model = tree.get_child_optional("model")) {
            settings.model = parse_model(*model);
        }
        return settings;
    }

    inline Settings load(const std::filesystem::path& path) {
        PropertyTree tree;
        try {
            boost::property_tree::read_json(path.string(), tree);
        } catch (const boost::property_tree::json_parser_error& error) {
            throw std::invalid_argument("Failed to read configuration '" + path.string() + "': " + error.what());
        }
        return parse(tree);
    }

    inline Training::Details::Options load_options(const std::filesystem::path& path) {
        return load(path).training;
    }

    // Descriptors for a model over `input_dim` inputs and `output_dim` outputs. The
    // leave-one-out term is computed exactly when the schedule alternates to it.
    inline ModelOptions to_model_options(const ModelSettings& settings, const Training::Details::Options& training,
                                         std::int64_t input_dim, std::int64_t output_dim) {
        ModelOptions options{};
        options.kernel = Kernel::SquaredExponential({.input_dim = input_dim,
                                                     .num_latent = output_dim,
                                                     .length_scale = settings.length_scale,
                                                     .sf = settings.sf,
                                                     .iso = settings.iso});

        if (settings.likelihood == "gaussian") {
            options.likelihood = Likelihood::Gaussian({.variance = settings.noise_variance,
                                                       .output_dim = output_dim,
                                                       .num_samples = settings.num_samples,
                                                       .seed = training.seed});
        } else if (settings.likelihood == "logistic") {
            options.likelihood = Likelihood::Logistic({.num_quadrature_points = settings.num_quadrature_points,
                                                       .num_samples = settings.num_samples,
                                                       .seed = training.seed});
        } else if (settings.likelihood == "softmax") {
            options.likelihood = Likelihood::Softmax({.num_classes = output_dim,
                                                      .num_samples = settings.num_samples,
                                                      .seed = training.seed});
        } else {
            throw std::invalid_argument("Unknown likelihood '" + settings.likelihood
                                        + "' (expected gaussian, logistic or softmax).");
        }

        if (settings.inference == "variational") {
            options.inference = Inference::Variational({.num_samples = settings.num_samples,
                                                        .jitter = settings.jitter,
                                                        .leave_one_out = training.loo_steps > 0,
                                                        .diagonal_posterior = settings.diagonal_posterior,
                                                        .share_inducing = settings.share_inducing,
                                                        .seed = training.seed});
        } else if (settings.inference == "exact") {
            options.inference = Inference::Exact({.jitter = settings.jitter});
        } else {
            throw std::invalid_argument("Unknown inference '" + settings.inference
                                        + "' (expected variational or exact).");
        }

        Training::Details::validate(training, options.inference);
        return options;
    }
}
#endif // UGP_COMMON_CONFIG_HPP
