#ifndef UGP_METRIC_HPP
#define UGP_METRIC_HPP

namespace Ugp::Metric {
    enum class Kind {
        Accuracy,
        RootMeanSquaredError,
        MeanAbsoluteError,
        MeanSquaredError,
    };

    struct Descriptor {
        Kind kind;
    };

    [[nodiscard]] constexpr auto Make(Kind kind) noexcept -> Descriptor { return Descriptor{kind}; }

    inline constexpr Descriptor Accuracy{Kind::Accuracy};
    inline constexpr Descriptor RootMeanSquaredError{Kind::RootMeanSquaredError};
    inline constexpr Descriptor MeanAbsoluteError{Kind::MeanAbsoluteError};
    inline constexpr Descriptor MeanSquaredError{Kind::MeanSquaredError};

    [[nodiscard]] constexpr const char* name(Kind kind) noexcept {
        switch (kind) {
            case Kind::Accuracy: return "Accuracy";
            case Kind::RootMeanSquaredError: return "RMSE";
            case Kind::MeanAbsoluteError: return "MAE";
            case Kind::MeanSquaredError: return "MSE";
        }
        return "Metric";
    }
}

#endif //UGP_METRIC_HPP
