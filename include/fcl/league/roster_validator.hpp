#pragma once

/// @file roster_validator.hpp
/// @brief "Fix your roster" checks for a fielded team.

#include <vector>

#include "fcl/league/chemistry_evaluator.hpp"
#include "fcl/league/league_types.hpp"

namespace fcl::league {

/// A card fielded by more than one team of the same matchday.
struct CardConflict {
    CardId cardId;
    TeamId usedInTeam;

    bool operator==(const CardConflict&) const = default;
};

struct RosterReport {
    TeamId teamId;
    std::size_t filledSlots = 0;
    std::vector<ChemistryIssue> chemistryIssues;

    /// Cards appearing in more than one slot of the team.
    std::vector<CardId> duplicateCards;

    [[nodiscard]] bool isComplete() const noexcept {
        return filledSlots == kSlotsPerTeam;
    }

    /// True when the team may be simulated.
    [[nodiscard]] bool isEligible() const noexcept {
        return isComplete() && chemistryIssues.empty() && duplicateCards.empty();
    }
};

/// Static utility class validating rosters before they are fielded.
///
/// Placeholder slots never conflict: they are skipped by every check
/// except the filled-slot count.
class RosterValidator {
public:
    RosterValidator() = delete;

    [[nodiscard]] static RosterReport validate(const Team& team);

    /// Cards of @p team already fielded by another of the owner's teams
    /// on the same matchday.
    ///
    /// @param others  The owner's other teams; teams of another matchday,
    ///                lobby or owner, and @p team itself, are ignored.
    [[nodiscard]] static std::vector<CardConflict> matchdayConflicts(
        const Team& team, const std::vector<Team>& others);
};

} // namespace fcl::league
