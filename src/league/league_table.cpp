/// @file league_table.cpp
/// @brief LeagueTableBuilder implementation.

#include "fcl/league/league_table.hpp"

#include "fcl/league/match_simulator.hpp"

#include <algorithm>
#include <numeric>
#include <unordered_map>

namespace fcl::league {

namespace {

void record(LeagueTableEntry& entry, int32_t scored, int32_t conceded, int32_t points) {
    ++entry.matchesPlayed;
    entry.goalsFor += scored;
    entry.goalsAgainst += conceded;
    entry.points += points;
    if (scored > conceded) {
        ++entry.wins;
    } else if (scored < conceded) {
        ++entry.losses;
    } else {
        ++entry.draws;
    }
}

} // namespace

std::vector<LeagueTableEntry> LeagueTableBuilder::build(
    const std::vector<Match>& matches,
    const std::vector<UserId>& members,
    std::optional<uint8_t> matchday) {
    std::vector<LeagueTableEntry> table;
    table.reserve(members.size());

    std::unordered_map<UserId, std::size_t> index;
    for (const auto& user : members) {
        if (index.count(user) != 0) {
            continue;
        }
        index.emplace(user, table.size());
        LeagueTableEntry entry;
        entry.userId = user;
        table.push_back(entry);
    }

    for (const auto& match : matches) {
        if (!match.played) {
            continue;
        }
        if (matchday && match.matchday != *matchday) {
            continue;
        }
        auto [homePts, awayPts] =
            MatchSimulator::leaguePoints(match.homeScore, match.awayScore);

        if (auto it = index.find(match.homeUser); it != index.end()) {
            record(table[it->second], match.homeScore, match.awayScore, homePts);
        }
        if (auto it = index.find(match.awayUser); it != index.end()) {
            record(table[it->second], match.awayScore, match.homeScore, awayPts);
        }
    }

    for (auto& entry : table) {
        entry.goalDifference = entry.goalsFor - entry.goalsAgainst;
    }

    std::sort(table.begin(), table.end(), ranksAbove);

    for (std::size_t i = 0; i < table.size(); ++i) {
        table[i].rank = static_cast<uint32_t>(i + 1);
    }
    return table;
}

bool LeagueTableBuilder::ranksAbove(const LeagueTableEntry& a,
                                    const LeagueTableEntry& b) noexcept {
    if (a.points != b.points) {
        return a.points > b.points;
    }
    if (a.goalDifference != b.goalDifference) {
        return a.goalDifference > b.goalDifference;
    }
    if (a.goalsFor != b.goalsFor) {
        return a.goalsFor > b.goalsFor;
    }
    return a.userId < b.userId;
}

int32_t LeagueTableBuilder::totalPoints(const std::vector<LeagueTableEntry>& table) {
    return std::accumulate(table.begin(), table.end(), int32_t{0},
                           [](int32_t sum, const LeagueTableEntry& e) {
                               return sum + e.points;
                           });
}

} // namespace fcl::league
