#ifndef INSIGHT_DATA_REGION_HPP
#define INSIGHT_DATA_REGION_HPP

#include <cmath>
#include <stdexcept>
#include <string>
#include <string_view>

namespace Insight::Data::Details {
    // Spatial split of the arena, evaluated on the position label of a window.
    enum class Region { None, Top, Bottom, Inside, Outside, Left, Right };

    inline constexpr double kTopBottomBoundary = 0.1;
    inline constexpr double kCentreX = 0.0264;
    inline constexpr double kCentreY = 0.2185;
    inline constexpr double kInsideRadius = 0.15;
    inline constexpr double kLeftRightBoundary = 400.0;

    [[nodiscard]] inline Region parse_region(std::string_view keyword)
    {
        if (keyword.empty() || keyword == "none") return Region::None;
        if (keyword == "top") return Region::Top;
        if (keyword == "bottom") return Region::Bottom;
        if (keyword == "inside") return Region::Inside;
        if (keyword == "outside") return Region::Outside;
        if (keyword == "left") return Region::Left;
        if (keyword == "right") return Region::Right;
        throw std::invalid_argument("Unknown region keyword: '" + std::string(keyword) + "'.");
    }

    [[nodiscard]] constexpr std::string_view region_name(Region region) noexcept
    {
        switch (region) {
            case Region::Top: return "top";
            case Region::Bottom: return "bottom";
            case Region::Inside: return "inside";
            case Region::Outside: return "outside";
            case Region::Left: return "left";
            case Region::Right: return "right";
            case Region::None:
            default: return "none";
        }
    }

    // The region a test split sees when training is restricted to `region`.
    [[nodiscard]] constexpr Region complement(Region region) noexcept
    {
        switch (region) {
            case Region::Top: return Region::Bottom;
            case Region::Bottom: return Region::Top;
            case Region::Inside: return Region::Outside;
            case Region::Outside: return Region::Inside;
            case Region::Left: return Region::Right;
            case Region::Right: return Region::Left;
            case Region::None:
            default: return Region::None;
        }
    }

    [[nodiscard]] inline bool accept(Region region, double x, double y)
    {
        switch (region) {
            case Region::Top: return y > kTopBottomBoundary;
            case Region::Bottom: return y <= kTopBottomBoundary;
            case Region::Inside: return std::hypot(x - kCentreX, y - kCentreY) < kInsideRadius;
            case Region::Outside: return std::hypot(x - kCentreX, y - kCentreY) >= kInsideRadius;
            case Region::Left: return x < kLeftRightBoundary;
            case Region::Right: return x >= kLeftRightBoundary;
            case Region::None:
            default: return true;
        }
    }
}

#endif // INSIGHT_DATA_REGION_HPP
