/// @file roster_validator.cpp
/// @brief RosterValidator implementation.

#include "fcl/league/roster_validator.hpp"

#include <unordered_map>
#include <unordered_set>

namespace fcl::league {

namespace {

std::vector<CardId> realCards(const Team& team) {
    std::vector<CardId> cards;
    for (const auto& slot : team.slots) {
        if (!slot.placeholder && slot.cardId) {
            cards.push_back(*slot.cardId);
        }
    }
    return cards;
}

} // namespace

RosterReport RosterValidator::validate(const Team& team) {
    RosterReport report;
    report.teamId = team.id;
    report.filledSlots = team.filledSlots();
    report.chemistryIssues =
        ChemistryEvaluator::validate(ChemistryEvaluator::fieldedColors(team));

    std::unordered_set<CardId> seen;
    std::unordered_set<CardId> reported;
    for (const auto& card : realCards(team)) {
        if (!seen.insert(card).second && reported.insert(card).second) {
            report.duplicateCards.push_back(card);
        }
    }
    return report;
}

std::vector<CardConflict> RosterValidator::matchdayConflicts(
    const Team& team, const std::vector<Team>& others) {
    std::unordered_map<CardId, TeamId> usage;
    for (const auto& other : others) {
        if (other.id == team.id || other.owner != team.owner ||
            other.lobby != team.lobby || other.matchday != team.matchday) {
            continue;
        }
        for (const auto& card : realCards(other)) {
            usage.emplace(card, other.id);
        }
    }

    std::vector<CardConflict> conflicts;
    std::unordered_set<CardId> reported;
    for (const auto& card : realCards(team)) {
        auto it = usage.find(card);
        if (it != usage.end() && reported.insert(card).second) {
            conflicts.push_back(CardConflict{card, it->second});
        }
    }
    return conflicts;
}

} // namespace fcl::league
