#ifndef UGP_COMMON_TENSOR_HPP
#define UGP_COMMON_TENSOR_HPP

#include <cstdint>
#include <sstream>
#include <string>

#include <torch/torch.h>

namespace Ugp::Common {
    // All parameters and data flowing through a model live in float64 on the CPU.
    inline constexpr auto kScalarType = torch::kFloat64;

    [[nodiscard]] inline torch::TensorOptions tensor_options() {
        return torch::TensorOptions().dtype(kScalarType).device(torch::kCPU);
    }

    [[nodiscard]] inline torch::Tensor to_model_dtype(const torch::Tensor& tensor) {
        if (!tensor.defined()) {
            return tensor;
        }
        return tensor.to(torch::kCPU, kScalarType).contiguous();
    }

    inline std::string format_shape(torch::IntArrayRef sizes) {
        std::ostringstream stream;
        stream << '(';
        for (std::size_t index = 0; index < sizes.size(); ++index) {
            if (index > 0) {
                stream << ", ";
            }
            stream << sizes[index];
        }
        stream << ')';
        return stream.str();
    }

    inline std::string format_shape(const torch::Tensor& tensor) {
        return format_shape(tensor.sizes());
    }
}

#endif // UGP_COMMON_TENSOR_HPP
