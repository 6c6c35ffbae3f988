#ifndef UGP_TERMINAL_HPP
#define UGP_TERMINAL_HPP

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace Ugp::Utils::Terminal {
    // ---------- Colors ----------
    namespace Colors {
        inline constexpr std::string_view kReset = "\033[0m";
        inline constexpr std::string_view kBrightGreen   = "\033[92m";
        inline constexpr std::string_view kBrightBlue    = "\033[94m";

        inline constexpr std::string_view kOrange       = "\033[38;5;208m";
    }

    // ---------- Symbols ----------
    namespace Symbols {
        inline constexpr std::string_view kCheck     = "✔";
        inline constexpr std::string_view kWarn      = "⚠";

        inline constexpr std::string_view kBoxTopLeft         = "┏";
        inline constexpr std::string_view kBoxTopSeparator    = "┳";
        inline constexpr std::string_view kBoxTopRight        = "┓";
        inline constexpr std::string_view kBoxMiddleLeft      = "┣";
        inline constexpr std::string_view kBoxMiddleSeparator = "╋";
        inline constexpr std::string_view kBoxMiddleRight     = "┫";
        inline constexpr std::string_view kBoxBottomLeft      = "┗";
        inline constexpr std::string_view kBoxBottomSeparator = "┻";
        inline constexpr std::string_view kBoxBottomRight     = "┛";
        inline constexpr std::string_view kBoxHorizontal      = "━";
        inline constexpr std::string_view kBoxVertical        = "┃";

        inline constexpr std::string_view kRoundedTopLeft     = "╭";
        inline constexpr std::string_view kRoundedTopRight    = "╮";
    }

    inline constexpr std::string_view kPrefix = "[Ugp]";

    // ---------- Small helpers ----------
    inline std::string Repeat(std::string_view glyph, std::size_t count) {
        std::string s; s.reserve(glyph.size() * count);
        for (std::size_t i = 0; i < count; ++i) s.append(glyph);
        return s;
    }
    inline std::string ApplyColor(std::string_view s, std::string_view color) {
        std::string out; out.reserve(color.size() + s.size() + Colors::kReset.size());
        out.append(color).append(s).append(Colors::kReset);
        return out;
    }

    // ---------- Log lines ----------
    // Every reporting component takes an std::ostream*; nullptr means silent.
    inline void Info(std::ostream* stream, std::string_view message) {
        if (stream == nullptr) return;
        *stream << ApplyColor(kPrefix, Colors::kBrightBlue) << ' ' << message << '\n';
    }

    inline void Success(std::ostream* stream, std::string_view message) {
        if (stream == nullptr) return;
        *stream << ApplyColor(kPrefix, Colors::kBrightGreen) << ' '
                << ApplyColor(Symbols::kCheck, Colors::kBrightGreen) << ' ' << message << '\n';
    }

    inline void Warn(std::ostream* stream, std::string_view message) {
        if (stream == nullptr) return;
        *stream << ApplyColor(kPrefix, Colors::kOrange) << ' '
                << ApplyColor(Symbols::kWarn, Colors::kOrange) << ' ' << message << '\n';
    }

    // ---------- Bars and separators ----------
    enum class FrameStyle { Rounded, Box };

    enum class HSepKind { Top, Middle, Bottom };

    inline std::string HSeparator(const std::vector<std::size_t>& spacings,
                                  std::string_view color,
                                  FrameStyle style,
                                  HSepKind kind) {
        using namespace Symbols;

        std::string_view left;
        std::string_view midJunction;
        std::string_view right;
        switch (kind) {
            case HSepKind::Top:
                left  = (style == FrameStyle::Rounded) ? kRoundedTopLeft : kBoxTopLeft;
                midJunction = kBoxTopSeparator;
                right = (style == FrameStyle::Rounded) ? kRoundedTopRight : kBoxTopRight;
                break;
            case HSepKind::Middle:
                left  = kBoxMiddleLeft;
                midJunction = kBoxMiddleSeparator;
                right = kBoxMiddleRight;
                break;
            case HSepKind::Bottom:
                left  = kBoxBottomLeft;
                midJunction = kBoxBottomSeparator;
                right = kBoxBottomRight;
                break;
        }

        std::string out;
        out.reserve(16 + spacings.size() * 8);
        out.append(left);
        for (std::size_t i = 0; i < spacings.size(); ++i) {
            out.append(Repeat(kBoxHorizontal, spacings[i]));
            if (i + 1 < spacings.size()) out.append(midJunction);
        }
        out.append(right);
        return ApplyColor(out, color);
    }

    inline std::string HTop(const std::vector<std::size_t>& spacings,
                            std::string_view color,
                            FrameStyle style) {
        return HSeparator(spacings, color, style, HSepKind::Top);
    }
    inline std::string HMid(const std::vector<std::size_t>& spacings,
                            std::string_view color) {
        return HSeparator(spacings, color, FrameStyle::Box, HSepKind::Middle);
    }
    inline std::string HBottom(const std::vector<std::size_t>& spacings,
                               std::string_view color) {
        return HSeparator(spacings, color, FrameStyle::Box, HSepKind::Bottom);
    }
}

/* Instance:
using namespace Ugp::Utils::Terminal;

std::vector<std::size_t> spans{6,4,8};
auto top = HTop(spans, Colors::kBrightGreen, FrameStyle::Box);   // ┏━━━━━━┳━━━━┳━━━━━━━━┓
auto mid = HMid(spans, Colors::kBrightGreen);                    // ┣━━━━━━╋━━━━╋━━━━━━━━┫
auto bot = HBottom(spans, Colors::kBrightGreen);                 // ┗━━━━━━┻━━━━┻━━━━━━━━┛

Warn(&std::cout, "Checkpoint is missing optimizer state; continuing with fresh moments.");
*/
#endif // UGP_TERMINAL_HPP
