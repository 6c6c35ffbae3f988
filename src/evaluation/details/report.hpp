#ifndef UGP_EVALUATION_REPORT_HPP
#define UGP_EVALUATION_REPORT_HPP

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "../../metric/metric.hpp"
#include "../../utils/terminal.hpp"

namespace Ugp::Evaluation::Details {
    struct Options {
        std::int64_t batch_size{0}; // 0: whole set in one batch
        bool print_summary{true};
        std::ostream* stream{&std::cout};
        Utils::Terminal::FrameStyle frame_style{Utils::Terminal::FrameStyle::Box};
    };

    struct Report {
        std::vector<Metric::Kind> order{};
        std::vector<double> values{};
        double average_loss{0.0};
        std::int64_t total_samples{0};

        [[nodiscard]] double value(Metric::Kind kind) const {
            for (std::size_t i = 0; i < order.size(); ++i) {
                if (order[i] == kind) {
                    return values[i];
                }
            }
            throw std::out_of_range(std::string("Report holds no ") + Metric::name(kind) + " value.");
        }
    };

    inline std::string format_double(double value) {
        if (!std::isfinite(value)) {
            return "nan";
        }
        std::ostringstream out;
        out << std::fixed << std::setprecision(6) << value;
        return out.str();
    }

    inline void Print(const Report& report, const Options& options) {
        if (!options.stream) {
            return;
        }
        auto& stream = *options.stream;

        using namespace Utils::Terminal;
        const auto color = Colors::kBrightBlue;

        std::vector<std::string> names{"Average loss"};
        std::vector<std::string> values{format_double(report.average_loss)};
        for (std::size_t i = 0; i < report.order.size() && i < report.values.size(); ++i) {
            names.emplace_back(Metric::name(report.order[i]));
            values.push_back(format_double(report.values[i]));
        }

        std::size_t name_width = std::string("Evaluation").size();
        std::size_t value_width = std::string("Value").size();
        for (std::size_t i = 0; i < names.size(); ++i) {
            name_width = std::max(name_width, names[i].size());
            value_width = std::max(value_width, values[i].size());
        }
        const std::vector<std::size_t> spacings{name_width + 2, value_width + 2};

        auto print_row = [&](std::string_view name, std::string_view value) {
            std::ostringstream row;
            row << Symbols::kBoxVertical << ' ';
            row << std::left << std::setw(static_cast<int>(name_width)) << name;
            row << ' ' << Symbols::kBoxVertical << ' ';
            row << std::right << std::setw(static_cast<int>(value_width)) << value;
            row << ' ' << Symbols::kBoxVertical;
            stream << row.str() << '\n';
        };

        stream << '\n' << HTop(spacings, color, options.frame_style) << '\n';
        print_row("Evaluation", "Value");
        stream << HMid(spacings, color) << '\n';
        for (std::size_t i = 0; i < names.size(); ++i) {
            print_row(names[i], values[i]);
        }
        stream << HBottom(spacings, color) << '\n';
        stream << "Total samples: " << report.total_samples << '\n';
    }
}

#endif //UGP_EVALUATION_REPORT_HPP
