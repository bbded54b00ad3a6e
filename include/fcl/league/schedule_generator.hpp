#pragma once

/// @file schedule_generator.hpp
/// @brief Round-robin fixtures for one matchday.

#include <cstdint>
#include <vector>

#include "fcl/foundation/league_result.hpp"
#include "fcl/league/league_types.hpp"

namespace fcl::league {

/// An unordered pairing, home being the earlier team in input order.
struct Fixture {
    TeamId home;
    TeamId away;

    bool operator==(const Fixture&) const = default;
};

/// Static utility class producing round-robin schedules.
///
/// For teams [T1, T2, T3, T4] the fixtures are, in order:
/// T1-T2, T1-T3, T1-T4, T2-T3, T2-T4, T3-T4.
class ScheduleGenerator {
public:
    ScheduleGenerator() = delete;

    /// The 2-combinations of @p teams in lexicographic input order.
    ///
    /// @return InvalidArgument unless there are exactly kLobbyCapacity
    ///         distinct, valid team ids.
    [[nodiscard]] static foundation::LeagueResult<std::vector<Fixture>> pairings(
        const std::vector<TeamId>& teams);

    /// Materialize one matchday's fixtures as unplayed matches.
    ///
    /// Returned matches carry no id; the store assigns ids on insert.
    ///
    /// @param existing  Matches already stored for @p lobby.
    /// @return ScheduleAlreadyExists if @p existing holds any match of
    ///         @p matchday; InvalidArgument for an out-of-range matchday
    ///         or teams that belong to another lobby or matchday.
    [[nodiscard]] static foundation::LeagueResult<std::vector<Match>> generateMatchday(
        LobbyId lobby,
        uint8_t matchday,
        const std::vector<Team>& teams,
        const std::vector<Match>& existing);
};

} // namespace fcl::league
