#ifndef UGP_EVALUATION_ACCUMULATOR_HPP
#define UGP_EVALUATION_ACCUMULATOR_HPP

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

#include "../../metric/metric.hpp"

namespace Ugp::Evaluation::Details {
    // Running state of one metric over the batches of an evaluation pass.
    class Accumulator {
    public:
        explicit Accumulator(Metric::Descriptor descriptor) : kind_(descriptor.kind) {}

        // targets, mean: [n, O]
        void update(const torch::Tensor& /*inputs*/, const torch::Tensor& targets, const torch::Tensor& mean) {
            if (targets.sizes() != mean.sizes()) {
                throw std::invalid_argument(std::string("Metric ") + Metric::name(kind_)
                                            + " expects predictions shaped like the targets.");
            }
            torch::NoGradGuard no_grad;
            switch (kind_) {
                case Metric::Kind::Accuracy: {
                    torch::Tensor hits;
                    if (targets.size(1) == 1) {
                        hits = mean.ge(0.5).eq(targets.ge(0.5));
                    } else {
                        hits = mean.argmax(1).eq(targets.argmax(1));
                    }
                    sum_ += hits.sum().item<double>();
                    count_ += targets.size(0);
                    break;
                }
                case Metric::Kind::RootMeanSquaredError:
                case Metric::Kind::MeanSquaredError:
                    sum_ += (mean - targets).pow(2).sum().item<double>();
                    count_ += targets.numel();
                    break;
                case Metric::Kind::MeanAbsoluteError:
                    sum_ += (mean - targets).abs().sum().item<double>();
                    count_ += targets.numel();
                    break;
            }
        }

        [[nodiscard]] double finalize() const {
            if (count_ == 0) {
                return std::numeric_limits<double>::quiet_NaN();
            }
            const double average = sum_ / static_cast<double>(count_);
            return kind_ == Metric::Kind::RootMeanSquaredError ? std::sqrt(average) : average;
        }

        [[nodiscard]] Metric::Kind kind() const noexcept { return kind_; }

    private:
        Metric::Kind kind_;
        double sum_{0.0};
        std::int64_t count_{0};
    };
}

#endif //UGP_EVALUATION_ACCUMULATOR_HPP
