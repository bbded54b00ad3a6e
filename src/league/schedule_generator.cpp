/// @file schedule_generator.cpp
/// @brief ScheduleGenerator implementation.

#include "fcl/league/schedule_generator.hpp"

#include <algorithm>
#include <string>
#include <unordered_set>

namespace fcl::league {

using foundation::ErrorCode;
using foundation::LeagueError;
using foundation::LeagueResult;

LeagueResult<std::vector<Fixture>> ScheduleGenerator::pairings(
    const std::vector<TeamId>& teams) {
    if (teams.size() != kLobbyCapacity) {
        return LeagueResult<std::vector<Fixture>>::err(LeagueError(
            ErrorCode::InvalidArgument,
            "a matchday needs exactly " + std::to_string(kLobbyCapacity) +
                " teams, got " + std::to_string(teams.size())));
    }

    std::unordered_set<TeamId> seen;
    for (const auto& id : teams) {
        if (!id.isValid()) {
            return LeagueResult<std::vector<Fixture>>::err(
                LeagueError(ErrorCode::InvalidArgument, "invalid team id"));
        }
        if (!seen.insert(id).second) {
            return LeagueResult<std::vector<Fixture>>::err(LeagueError(
                ErrorCode::InvalidArgument,
                "team " + std::to_string(id.value()) + " listed twice"));
        }
    }

    std::vector<Fixture> fixtures;
    fixtures.reserve(kMatchesPerMatchday);
    for (std::size_t i = 0; i < teams.size(); ++i) {
        for (std::size_t j = i + 1; j < teams.size(); ++j) {
            fixtures.push_back(Fixture{teams[i], teams[j]});
        }
    }
    return LeagueResult<std::vector<Fixture>>::ok(std::move(fixtures));
}

LeagueResult<std::vector<Match>> ScheduleGenerator::generateMatchday(
    LobbyId lobby,
    uint8_t matchday,
    const std::vector<Team>& teams,
    const std::vector<Match>& existing) {
    if (matchday < 1 || matchday > kMatchdays) {
        return LeagueResult<std::vector<Match>>::err(LeagueError(
            ErrorCode::InvalidArgument,
            "matchday out of range: " + std::to_string(matchday)));
    }

    bool scheduled = std::any_of(existing.begin(), existing.end(),
                                 [&](const Match& m) {
                                     return m.lobby == lobby && m.matchday == matchday;
                                 });
    if (scheduled) {
        return LeagueResult<std::vector<Match>>::err(LeagueError(
            ErrorCode::ScheduleAlreadyExists,
            "matchday " + std::to_string(matchday) + " of lobby " +
                std::to_string(lobby.value()) + " is already scheduled"));
    }

    std::vector<TeamId> ids;
    ids.reserve(teams.size());
    for (const auto& team : teams) {
        if (team.lobby != lobby || team.matchday != matchday) {
            return LeagueResult<std::vector<Match>>::err(LeagueError(
                ErrorCode::InvalidArgument,
                "team " + std::to_string(team.id.value()) +
                    " does not belong to this lobby and matchday"));
        }
        ids.push_back(team.id);
    }

    auto fixtures = pairings(ids);
    if (!fixtures) {
        return LeagueResult<std::vector<Match>>::err(fixtures.error());
    }

    auto ownerOf = [&](TeamId id) {
        auto it = std::find_if(teams.begin(), teams.end(),
                               [&](const Team& t) { return t.id == id; });
        return it->owner;
    };

    std::vector<Match> matches;
    matches.reserve(fixtures.value().size());
    for (const auto& fixture : fixtures.value()) {
        Match m;
        m.lobby = lobby;
        m.matchday = matchday;
        m.homeTeam = fixture.home;
        m.awayTeam = fixture.away;
        m.homeUser = ownerOf(fixture.home);
        m.awayUser = ownerOf(fixture.away);
        matches.push_back(std::move(m));
    }
    return LeagueResult<std::vector<Match>>::ok(std::move(matches));
}

} // namespace fcl::league
