#ifndef UGP_TRAINING_HPP
#define UGP_TRAINING_HPP

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "details/options.hpp"
#include "../core.hpp"
#include "../common/save_load.hpp"
#include "../data/dataset.hpp"
#include "../evaluation/evaluation.hpp"
#include "../metric/metric.hpp"
#include "../optimizer/optimizer.hpp"
#include "../utils/terminal.hpp"

namespace Ugp::Training {
    using Options = Details::Options;
    using Details::validate;
    using Details::select_objective;

    // Global optimization step, owned by the training loop and persisted in checkpoints.
    struct TrainState {
        std::int64_t step{0};
    };

    // Receives the final predictions of train_gp (plotting and reporting live outside the library).
    using PredictionHook = std::function<void(const torch::Tensor& inputs,
                                              const torch::Tensor& mean,
                                              const torch::Tensor& var,
                                              const std::filesystem::path& out_dir)>;

    [[nodiscard]] inline std::int64_t ceil_divide(std::int64_t dividend, std::int64_t divisor) {
        return (dividend + divisor - 1) / divisor;
    }

    // One optimizer step per batch for `eval_epochs` passes over `data`, never going past
    // `train_steps` global steps. The differentiated term follows the global step schedule.
    inline void fit(Model& model, torch::optim::Optimizer& optimizer, Data::Dataset& data,
                    const Options& options, TrainState& state) {
        model.validate(data);
        const auto num_train = data.num_examples();
        const auto batch_size = std::min(options.batch_size.value_or(num_train), num_train);
        const auto scheduled = ceil_divide(num_train * options.eval_epochs, batch_size);
        const auto num_batches = std::min(scheduled, std::max<std::int64_t>(options.train_steps - state.step, 0));

        model.train();
        auto start = std::chrono::steady_clock::now();
        for (std::int64_t batch_num = 0; batch_num < num_batches; ++batch_num) {
            const char* term = select_objective(state.step, options.loo_steps, options.nelbo_steps);
            auto [inputs, outputs] = data.next_batch(batch_size);

            Inference::Objective terms;
            try {
                optimizer.zero_grad();
                terms = model.objective(inputs, outputs, num_train);
                const auto found = terms.find(term);
                if (found == terms.end()) {
                    throw std::logic_error("objective has no term named '" + std::string(term) + "'");
                }
                found->second.backward();
                optimizer.step();
            } catch (const std::exception& error) {
                // The original exception stays reachable through std::rethrow_if_nested.
                std::throw_with_nested(std::runtime_error("Training step " + std::to_string(state.step)
                                                          + " failed while evaluating '" + term + "': "
                                                          + error.what()));
            }

            if (options.logging_steps != 0 && batch_num % options.logging_steps == 0) {
                const auto now = std::chrono::steady_clock::now();
                const std::chrono::duration<double> elapsed = now - start;
                std::ostringstream line;
                line << "Step #" << state.step << " (" << std::fixed << std::setprecision(4) << elapsed.count()
                     << " sec)\t" << std::setprecision(2);
                for (const auto& [name, value] : terms) {
                    line << ' ' << name << ": " << value.item<double>();
                }
                Utils::Terminal::Info(options.stream, line.str());
                start = now;
            }
            ++state.step;
        }
        model.eval();
    }

    // No-grad pass over `data` in contiguous batches; averages the loss per batch and
    // accumulates the requested metrics on the predictive mean. The loss is scaled to the
    // training set of `num_train` examples so it compares with the training objective.
    inline Evaluation::Report evaluate(Model& model, const Data::Dataset& data, std::int64_t num_train,
                                       const std::vector<Metric::Descriptor>& metrics,
                                       const Evaluation::Options& options = {}) {
        model.validate(data);
        if (num_train <= 0) {
            throw std::invalid_argument("evaluate requires a positive training set size, got "
                                        + std::to_string(num_train) + ".");
        }
        torch::NoGradGuard no_grad;
        model.eval();

        std::vector<Evaluation::Accumulator> accumulators;
        accumulators.reserve(metrics.size());
        for (const auto& descriptor : metrics) {
            accumulators.emplace_back(descriptor);
        }

        const auto batch_size = options.batch_size > 0 ? options.batch_size : data.num_examples();
        double loss_sum = 0.0;
        std::int64_t num_batches = 0;
        for (const auto& [inputs, outputs] : data.batches(batch_size)) {
            auto [mean, var] = model.prediction(inputs);
            auto terms = model.objective(inputs, outputs, num_train);
            loss_sum += terms.at(Inference::kLoss).item<double>();
            ++num_batches;
            for (auto& accumulator : accumulators) {
                accumulator.update(inputs, outputs, mean);
            }
        }

        Evaluation::Report report{};
        report.average_loss = num_batches > 0 ? loss_sum / static_cast<double>(num_batches) : 0.0;
        report.total_samples = data.num_examples();
        for (const auto& accumulator : accumulators) {
            report.order.push_back(accumulator.kind());
            report.values.push_back(accumulator.finalize());
        }

        Utils::Terminal::Info(options.stream, "Test set: Average loss: " + Evaluation::Details::format_double(report.average_loss));
        if (options.print_summary) {
            Evaluation::Print(report, options);
        }
        return report;
    }

    [[nodiscard]] inline std::pair<torch::Tensor, torch::Tensor> predict(const torch::Tensor& test_inputs, Model& model,
                                                                         std::optional<std::int64_t> batch_size = std::nullopt) {
        return model.predict(test_inputs, batch_size);
    }

    // Rebuilds a model for `task`, restores it from `checkpoint` and predicts. Exact models
    // are conditioned on the task's training set.
    [[nodiscard]] inline std::pair<torch::Tensor, torch::Tensor> predict(const torch::Tensor& test_inputs,
                                                                         const std::filesystem::path& checkpoint,
                                                                         const Data::Task& task,
                                                                         const ModelOptions& model_options,
                                                                         const Options& options) {
        Model model(task.inducing_inputs, model_options);
        Common::SaveLoad::restore(checkpoint, model, nullptr, /*partial_ok=*/true, options.stream);
        model.eval();
        if (model.mode() == Inference::Mode::Exact) {
            model.condition(task.train.X(), task.train.Y());
        }
        return model.predict(test_inputs, options.batch_size);
    }

    // CSV with one row per input: inputs, predictive means, predictive variances.
    inline void write_predictions(const std::filesystem::path& path, const torch::Tensor& inputs,
                                  const torch::Tensor& mean, const torch::Tensor& var) {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        std::ofstream stream(path, std::ios::trunc);
        if (!stream) {
            throw std::runtime_error("Failed to open '" + path.string() + "' for writing predictions.");
        }

        auto x = inputs.to(torch::kCPU, torch::kFloat64).contiguous();
        auto m = mean.to(torch::kCPU, torch::kFloat64).contiguous();
        auto v = var.to(torch::kCPU, torch::kFloat64).contiguous();
        const auto rows = x.size(0);
        const auto input_dim = x.size(1);
        const auto output_dim = m.size(1);

        for (std::int64_t d = 0; d < input_dim; ++d) {
            stream << "x" << d << ',';
        }
        for (std::int64_t o = 0; o < output_dim; ++o) {
            stream << "mean" << o << ',';
        }
        for (std::int64_t o = 0; o < output_dim; ++o) {
            stream << "var" << o << (o + 1 < output_dim ? "," : "\n");
        }

        auto xa = x.accessor<double, 2>();
        auto ma = m.accessor<double, 2>();
        auto va = v.accessor<double, 2>();
        stream << std::setprecision(17);
        for (std::int64_t row = 0; row < rows; ++row) {
            for (std::int64_t d = 0; d < input_dim; ++d) {
                stream << xa[row][d] << ',';
            }
            for (std::int64_t o = 0; o < output_dim; ++o) {
                stream << ma[row][o] << ',';
            }
            for (std::int64_t o = 0; o < output_dim; ++o) {
                stream << va[row][o] << (o + 1 < output_dim ? "," : "\n");
            }
        }
    }

    // `save_dir/model_name`, or a fresh directory under the system temporary path.
    inline std::filesystem::path output_directory(const Options& options) {
        namespace fs = std::filesystem;
        if (!options.save_dir.empty()) {
            const auto directory = fs::path(options.save_dir) / options.model_name;
            fs::create_directories(directory);
            return directory;
        }
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        for (int counter = 0;; ++counter) {
            auto candidate = fs::temp_directory_path()
                             / ("ugp-" + options.model_name + "-" + std::to_string(stamp) + "-" + std::to_string(counter));
            if (fs::create_directory(candidate)) {
                return candidate;
            }
        }
    }

    // Builds, restores, trains, evaluates and checkpoints a model for `task` until
    // `train_steps` global steps have run, then optionally exports predictions on task.xtest.
    inline std::shared_ptr<Model> train_gp(Data::Task& task, const ModelOptions& model_options, const Options& options,
                                           const PredictionHook& on_predictions = {}) {
        validate(options, model_options.inference);

        const auto out_dir = output_directory(options);
        const auto prefix = out_dir / "model.ckpt";

        auto model = std::make_shared<Model>(task.inducing_inputs, model_options);
        model->validate(task.train);
        auto optimizer = Optimizer::build_optimizer(*model, Optimizer::from_name(options.optimizer, options.learning_rate));

        TrainState state{};
        if (const auto latest = Common::SaveLoad::latest_checkpoint(out_dir)) {
            const auto report = Common::SaveLoad::restore(*latest, *model, optimizer.get(), /*partial_ok=*/true, options.stream);
            state.step = report.step;
        } else {
            Utils::Terminal::Info(options.stream, "No checkpoint in '" + out_dir.string() + "', starting fresh.");
        }
        model->condition(task.train.X(), task.train.Y());

        Evaluation::Options evaluation_options{};
        evaluation_options.batch_size = options.batch_size.value_or(0);
        evaluation_options.stream = options.stream;
        evaluation_options.print_summary = options.stream != nullptr;
        auto run_evaluation = [&]() {
            if (!task.test.empty()) {
                (void)evaluate(*model, task.test, task.train.num_examples(), task.metrics, evaluation_options);
            }
        };

        run_evaluation();
        std::int64_t last_checkpoint = state.step;
        while (state.step < options.train_steps) {
            const auto start = std::chrono::steady_clock::now();
            fit(*model, *optimizer, task.train, options, state);
            const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;

            std::ostringstream line;
            line << "Train time for the last " << options.eval_epochs << " epochs (global step " << state.step
                 << "): " << std::fixed << std::setprecision(2) << elapsed.count() << "s";
            Utils::Terminal::Info(options.stream, line.str());

            run_evaluation();
            const bool due = options.chkpnt_steps == 0
                             || state.step - last_checkpoint >= options.chkpnt_steps
                             || state.step >= options.train_steps;
            if (due) {
                Common::SaveLoad::save(prefix, *model, optimizer.get(), state.step, options.stream);
                last_checkpoint = state.step;
            }
        }

        if ((options.plot || !options.preds_path.empty()) && task.xtest.defined()) {
            std::pair<torch::Tensor, torch::Tensor> predictions;
            if (const auto latest = Common::SaveLoad::latest_checkpoint(out_dir)) {
                predictions = predict(task.xtest, *latest, task, model_options, options);
            } else {
                predictions = model->predict(task.xtest, options.batch_size);
            }
            if (!options.preds_path.empty()) {
                write_predictions(options.preds_path, task.xtest, predictions.first, predictions.second);
                Utils::Terminal::Success(options.stream, "Predictions written to '" + options.preds_path + "'");
            }
            if (on_predictions) {
                on_predictions(task.xtest, predictions.first, predictions.second, out_dir);
            }
        }
        return model;
    }
}

#endif //UGP_TRAINING_HPP
