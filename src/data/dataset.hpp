#ifndef UGP_DATA_DATASET_HPP
#define UGP_DATA_DATASET_HPP

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <ATen/CPUGeneratorImpl.h>
#include <torch/torch.h>

#include "../common/tensor.hpp"
#include "../metric/metric.hpp"

namespace Ugp::Data {
    struct DatasetOptions {
        bool shuffle{false};   // reshuffle the example order after every completed pass
        std::uint64_t seed{0};
    };

    // In-memory (inputs [N, D], outputs [N, O]) pairs read sequentially in mini-batches.
    class Dataset {
    public:
        Dataset() = default;

        Dataset(const torch::Tensor& inputs, const torch::Tensor& outputs, DatasetOptions options = {})
            : options_(options),
              inputs_(Common::to_model_dtype(inputs)),
              outputs_(Common::to_model_dtype(outputs)),
              generator_(at::detail::createCPUGenerator(options.seed))
        {
            if (!inputs_.defined() || !outputs_.defined()) {
                throw std::invalid_argument("Dataset expects both inputs and outputs to be defined.");
            }
            if (inputs_.dim() != 2 || outputs_.dim() != 2) {
                throw std::invalid_argument("Dataset expects [N, D] inputs and [N, O] outputs, got "
                                            + Common::format_shape(inputs_) + " and "
                                            + Common::format_shape(outputs_) + ".");
            }
            if (inputs_.size(0) != outputs_.size(0)) {
                throw std::invalid_argument("Dataset inputs and outputs must contain the same number of samples ("
                                            + std::to_string(inputs_.size(0)) + " vs "
                                            + std::to_string(outputs_.size(0)) + ").");
            }
            if (inputs_.size(0) == 0) {
                throw std::invalid_argument("Dataset requires at least one example.");
            }
            order_ = torch::arange(inputs_.size(0), torch::TensorOptions().dtype(torch::kLong));
            if (options_.shuffle) {
                reshuffle();
            }
        }

        [[nodiscard]] std::int64_t num_examples() const noexcept { return inputs_.defined() ? inputs_.size(0) : 0; }
        [[nodiscard]] std::int64_t input_dim() const noexcept { return inputs_.defined() ? inputs_.size(1) : 0; }
        [[nodiscard]] std::int64_t output_dim() const noexcept { return outputs_.defined() ? outputs_.size(1) : 0; }
        [[nodiscard]] std::int64_t epochs_completed() const noexcept { return epochs_completed_; }
        [[nodiscard]] bool empty() const noexcept { return num_examples() == 0; }

        [[nodiscard]] const torch::Tensor& X() const noexcept { return inputs_; }
        [[nodiscard]] const torch::Tensor& Y() const noexcept { return outputs_; }

        // Next `size` examples in the current order. A batch that crosses the end of a pass
        // completes the epoch, reshuffles if enabled, and is filled from the start of the next pass.
        std::pair<torch::Tensor, torch::Tensor> next_batch(std::int64_t size) {
            if (empty()) {
                throw std::logic_error("next_batch called on an empty dataset.");
            }
            if (size <= 0 || size > num_examples()) {
                throw std::invalid_argument("Batch size must lie in [1, " + std::to_string(num_examples())
                                            + "], got " + std::to_string(size) + ".");
            }

            const auto total = num_examples();
            std::vector<torch::Tensor> pieces;
            if (cursor_ + size > total) {
                const auto rest = total - cursor_;
                if (rest > 0) {
                    pieces.push_back(order_.narrow(0, cursor_, rest));
                }
                ++epochs_completed_;
                if (options_.shuffle) {
                    reshuffle();
                }
                cursor_ = size - rest;
                pieces.push_back(order_.narrow(0, 0, cursor_));
            } else {
                pieces.push_back(order_.narrow(0, cursor_, size));
                cursor_ += size;
                if (cursor_ == total) {
                    ++epochs_completed_;
                    cursor_ = 0;
                    if (options_.shuffle) {
                        reshuffle();
                    }
                }
            }

            auto indices = pieces.size() == 1 ? pieces.front() : torch::cat(pieces, 0);
            return {inputs_.index_select(0, indices), outputs_.index_select(0, indices)};
        }

        // Contiguous batches of one full pass in storage order, the last one possibly smaller.
        [[nodiscard]] std::vector<std::pair<torch::Tensor, torch::Tensor>> batches(std::int64_t size) const {
            if (size <= 0) {
                throw std::invalid_argument("Batch size must be positive, got " + std::to_string(size) + ".");
            }
            std::vector<std::pair<torch::Tensor, torch::Tensor>> result;
            for (std::int64_t start = 0; start < num_examples(); start += size) {
                const auto length = std::min(size, num_examples() - start);
                result.emplace_back(inputs_.narrow(0, start, length), outputs_.narrow(0, start, length));
            }
            return result;
        }

        void reset() {
            cursor_ = 0;
            epochs_completed_ = 0;
        }

    private:
        void reshuffle() {
            order_ = torch::randperm(num_examples(), generator_, torch::TensorOptions().dtype(torch::kLong));
        }

        DatasetOptions options_{};
        torch::Tensor inputs_{};
        torch::Tensor outputs_{};
        torch::Tensor order_{};
        at::Generator generator_{at::detail::createCPUGenerator(0)};
        std::int64_t cursor_{0};
        std::int64_t epochs_completed_{0};
    };

    // Everything a training run needs about one problem.
    struct Task {
        Dataset train{};
        Dataset test{};
        torch::Tensor xtest{};            // inputs to predict after training, may be undefined
        torch::Tensor inducing_inputs{};  // initial inducing locations, [M, D] or [L, M, D]
        std::int64_t output_dim{1};
        std::vector<Metric::Descriptor> metrics{};
        std::string name{"task"};
    };
}

#endif //UGP_DATA_DATASET_HPP
