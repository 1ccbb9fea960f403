#ifndef INSIGHT_DATA_TARGET_HPP
#define INSIGHT_DATA_TARGET_HPP

#include <stdexcept>
#include <string>
#include <string_view>

namespace Insight::Data::Details {
    enum class TargetKind { Position, Direction, HeadDirection, Speed };

    inline constexpr std::string_view kPositionChannel = "position";

    [[nodiscard]] inline TargetKind parse_target_kind(std::string_view name)
    {
        if (name == "position") return TargetKind::Position;
        if (name == "direction") return TargetKind::Direction;
        if (name == "head_direction") return TargetKind::HeadDirection;
        if (name == "speed") return TargetKind::Speed;
        throw std::invalid_argument("Unknown output target: '" + std::string(name) + "'.");
    }

    // Direction and speed are derived from the position channel, not from their own series.
    [[nodiscard]] constexpr bool derived_from_position(TargetKind kind) noexcept
    {
        return kind != TargetKind::Position;
    }
}

#endif // INSIGHT_DATA_TARGET_HPP
