#ifndef INSIGHT_TERMINAL_HPP
#define INSIGHT_TERMINAL_HPP

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace Insight::Utils::Terminal {
    // ---------- Colors ----------
    namespace Colors {
        inline constexpr std::string_view kReset        = "\033[0m";
        inline constexpr std::string_view kYellow       = "\033[33m";
        inline constexpr std::string_view kBrightBlue   = "\033[94m";
        inline constexpr std::string_view kTurquoise    = "\033[38;5;49m";
    }

    // ---------- Symbols ----------
    namespace Symbols {
        inline constexpr std::string_view kInfo = "ℹ";
        inline constexpr std::string_view kWarn = "⚠";

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
    }

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

    // ---------- Table frames ----------
    enum class HSepKind { Top, Middle, Bottom };

    // spacings = widths of each cell between vertical junctions.
    inline std::string HSeparator(const std::vector<std::size_t>& spacings,
                                  std::string_view color,
                                  HSepKind kind) {
        using namespace Symbols;

        std::string_view left = kBoxMiddleLeft;
        std::string_view junction = kBoxMiddleSeparator;
        std::string_view right = kBoxMiddleRight;
        if (kind == HSepKind::Top) {
            left = kBoxTopLeft;
            junction = kBoxTopSeparator;
            right = kBoxTopRight;
        } else if (kind == HSepKind::Bottom) {
            left = kBoxBottomLeft;
            junction = kBoxBottomSeparator;
            right = kBoxBottomRight;
        }

        std::string out(left);
        for (std::size_t i = 0; i < spacings.size(); ++i) {
            out.append(Repeat(kBoxHorizontal, spacings[i]));
            if (i + 1 < spacings.size()) out.append(junction);
        }
        out.append(right);
        return ApplyColor(out, color);
    }

    inline std::string HTop(const std::vector<std::size_t>& spacings, std::string_view color) {
        return HSeparator(spacings, color, HSepKind::Top);
    }
    inline std::string HMid(const std::vector<std::size_t>& spacings, std::string_view color) {
        return HSeparator(spacings, color, HSepKind::Middle);
    }
    inline std::string HBottom(const std::vector<std::size_t>& spacings, std::string_view color) {
        return HSeparator(spacings, color, HSepKind::Bottom);
    }

    // ---------- Status lines ----------
    enum class Level { Info, Warning };

    // "[Insight] message" on `stream`; a null stream silences the call.
    inline void Log(std::ostream* stream, std::string_view message, Level level = Level::Info) {
        if (stream == nullptr) {
            return;
        }
        const auto color = level == Level::Warning ? Colors::kYellow : Colors::kTurquoise;
        const auto symbol = level == Level::Warning ? Symbols::kWarn : Symbols::kInfo;
        *stream << ApplyColor("[Insight]", color) << ' ' << symbol << ' ' << message << '\n';
    }
}

#endif // INSIGHT_TERMINAL_HPP
