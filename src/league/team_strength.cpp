/// @file team_strength.cpp
/// @brief TeamStrengthCalculator implementation.

#include "fcl/league/team_strength.hpp"

#include "fcl/league/chemistry_evaluator.hpp"

#include <string>

namespace fcl::league {

using foundation::ErrorCode;
using foundation::LeagueError;
using foundation::LeagueResult;

LeagueResult<TeamStrength> TeamStrengthCalculator::calculate(const Team& team) {
    auto filled = team.filledSlots();
    if (filled < kSlotsPerTeam) {
        return LeagueResult<TeamStrength>::err(LeagueError(
            ErrorCode::IncompleteTeam,
            "team " + std::to_string(team.id.value()) + " has " +
                std::to_string(filled) + " of " + std::to_string(kSlotsPerTeam) +
                " slots filled"));
    }

    auto colors = ChemistryEvaluator::fieldedColors(team);
    auto issues = ChemistryEvaluator::validate(colors);
    if (!issues.empty()) {
        return LeagueResult<TeamStrength>::err(LeagueError(
            ErrorCode::InvalidChemistry,
            "team " + std::to_string(team.id.value()) + ": " + issues.front().message));
    }

    TeamStrength strength;
    strength.teamId = team.id;
    for (const auto& slot : team.slots) {
        strength.playerPoints += slot.rating;
    }
    strength.chemistryPoints = ChemistryEvaluator::evaluate(colors).bonus;
    strength.totalStrength = strength.playerPoints + strength.chemistryPoints;
    return LeagueResult<TeamStrength>::ok(strength);
}

} // namespace fcl::league
