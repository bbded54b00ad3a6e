/// @file league_types.cpp
/// @brief Name parsing for league enums.

#include "fcl/league/league_types.hpp"

namespace fcl::league {

std::optional<Position> parsePosition(std::string_view code) {
    for (std::size_t i = 0; i < kPositionCount; ++i) {
        auto pos = static_cast<Position>(i);
        if (positionName(pos) == code) {
            return pos;
        }
    }
    return std::nullopt;
}

std::optional<PlayerColor> parseColor(std::string_view tag) {
    for (std::size_t i = 0; i < kColorCount; ++i) {
        auto color = static_cast<PlayerColor>(i);
        if (colorName(color) == tag) {
            return color;
        }
    }
    return std::nullopt;
}

std::optional<LobbyStatus> parseLobbyStatus(std::string_view name) {
    for (auto status : {LobbyStatus::Waiting, LobbyStatus::InProgress,
                        LobbyStatus::Finished}) {
        if (lobbyStatusName(status) == name) {
            return status;
        }
    }
    return std::nullopt;
}

} // namespace fcl::league
