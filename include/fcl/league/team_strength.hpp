#pragma once

/// @file team_strength.hpp
/// @brief Team strength from snapshotted ratings plus chemistry.

#include <cstdint>

#include "fcl/foundation/league_result.hpp"
#include "fcl/league/league_types.hpp"

namespace fcl::league {

struct TeamStrength {
    TeamId teamId;
    int64_t playerPoints = 0;     ///< Sum of the 11 snapshotted ratings.
    int64_t chemistryPoints = 0;  ///< ChemistryEvaluator bonus.
    int64_t totalStrength = 0;    ///< playerPoints + chemistryPoints.
};

/// Static utility class computing a team's strength.
///
/// Rejects rather than defaulting to zero: an incomplete roster fails with
/// IncompleteTeam, a layout breaking the color rule with InvalidChemistry.
class TeamStrengthCalculator {
public:
    TeamStrengthCalculator() = delete;

    [[nodiscard]] static foundation::LeagueResult<TeamStrength> calculate(
        const Team& team);
};

} // namespace fcl::league
