/// @file memory_league_store.cpp
/// @brief MemoryLeagueStore implementation.

#include "fcl/service/memory_league_store.hpp"

#include "fcl/foundation/league_logger.hpp"

#include <algorithm>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

namespace fcl::service {

using foundation::ErrorCode;
using foundation::LeagueError;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using namespace fcl::league;

struct MemoryLeagueStore::Impl {
    mutable std::mutex mutex;

    std::unordered_map<LobbyId, Lobby> lobbies;
    std::unordered_map<TeamId, Team> teams;
    std::map<MatchId, Match> matches;  // ordered for stable listing
    std::unordered_map<LobbyId, std::vector<Reward>> rewards;
    std::unordered_map<UserId, int64_t> balances;

    uint64_t nextMatchId = 1;

    bool hasMatchday(LobbyId lobby, std::optional<uint8_t> matchday) const {
        return std::any_of(matches.begin(), matches.end(), [&](const auto& kv) {
            return kv.second.lobby == lobby &&
                   (!matchday || kv.second.matchday == *matchday);
        });
    }

    std::vector<Match> insert(LobbyId lobby, std::vector<Match> batch) {
        for (auto& m : batch) {
            m.id = MatchId(nextMatchId++);
            m.lobby = lobby;
            m.played = false;
            matches.emplace(m.id, m);
        }
        return batch;
    }

    static LeagueError lobbyNotFound(LobbyId id) {
        return LeagueError(ErrorCode::LobbyNotFound,
                           "lobby " + std::to_string(id.value()) + " not found");
    }
};

MemoryLeagueStore::MemoryLeagueStore()
    : impl_(std::make_unique<Impl>()) {}

MemoryLeagueStore::~MemoryLeagueStore() = default;

// -- Collaborator data -------------------------------------------------------

LeagueResult<void> MemoryLeagueStore::saveLobby(const Lobby& lobby) {
    if (!lobby.id.isValid()) {
        return LeagueResult<void>::err(
            LeagueError(ErrorCode::InvalidArgument, "lobby id must be non-zero"));
    }
    std::lock_guard lock(impl_->mutex);
    impl_->lobbies[lobby.id] = lobby;
    return LeagueResult<void>::ok();
}

LeagueResult<void> MemoryLeagueStore::saveTeam(const Team& team) {
    if (!team.id.isValid()) {
        return LeagueResult<void>::err(
            LeagueError(ErrorCode::InvalidArgument, "team id must be non-zero"));
    }
    std::lock_guard lock(impl_->mutex);
    impl_->teams[team.id] = team;
    return LeagueResult<void>::ok();
}

LeagueResult<Lobby> MemoryLeagueStore::getLobby(LobbyId id) {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->lobbies.find(id);
    if (it == impl_->lobbies.end()) {
        return LeagueResult<Lobby>::err(Impl::lobbyNotFound(id));
    }
    return LeagueResult<Lobby>::ok(it->second);
}

LeagueResult<Team> MemoryLeagueStore::getTeam(TeamId id) {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->teams.find(id);
    if (it == impl_->teams.end()) {
        return LeagueResult<Team>::err(LeagueError(
            ErrorCode::TeamNotFound, "team " + std::to_string(id.value()) + " not found"));
    }
    return LeagueResult<Team>::ok(it->second);
}

LeagueResult<std::vector<Team>> MemoryLeagueStore::getMatchdayTeams(
    LobbyId lobby, uint8_t matchday) {
    std::lock_guard lock(impl_->mutex);
    std::vector<Team> result;
    for (const auto& [id, team] : impl_->teams) {
        if (team.lobby == lobby && team.matchday == matchday) {
            result.push_back(team);
        }
    }
    std::sort(result.begin(), result.end(),
              [](const Team& a, const Team& b) { return a.id < b.id; });
    return LeagueResult<std::vector<Team>>::ok(std::move(result));
}

// -- Schedule ----------------------------------------------------------------

LeagueResult<std::vector<Match>> MemoryLeagueStore::createSchedule(
    LobbyId lobby, std::vector<Match> matches) {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->lobbies.find(lobby);
    if (it == impl_->lobbies.end()) {
        return LeagueResult<std::vector<Match>>::err(Impl::lobbyNotFound(lobby));
    }
    if (impl_->hasMatchday(lobby, std::nullopt)) {
        return LeagueResult<std::vector<Match>>::err(LeagueError(
            ErrorCode::AlreadyScheduled,
            "lobby " + std::to_string(lobby.value()) + " already has a league"));
    }

    auto stored = impl_->insert(lobby, std::move(matches));
    it->second.status = LobbyStatus::InProgress;
    it->second.currentMatchday = 1;
    return LeagueResult<std::vector<Match>>::ok(std::move(stored));
}

LeagueResult<std::vector<Match>> MemoryLeagueStore::addMatchday(
    LobbyId lobby, uint8_t matchday, std::vector<Match> matches) {
    std::lock_guard lock(impl_->mutex);
    if (impl_->lobbies.count(lobby) == 0) {
        return LeagueResult<std::vector<Match>>::err(Impl::lobbyNotFound(lobby));
    }
    if (impl_->hasMatchday(lobby, matchday)) {
        return LeagueResult<std::vector<Match>>::err(LeagueError(
            ErrorCode::ScheduleAlreadyExists,
            "matchday " + std::to_string(matchday) + " already scheduled"));
    }
    for (auto& m : matches) {
        m.matchday = matchday;
    }
    return LeagueResult<std::vector<Match>>::ok(impl_->insert(lobby, std::move(matches)));
}

LeagueResult<void> MemoryLeagueStore::setLobbyProgress(
    LobbyId lobby, LobbyStatus status, uint8_t currentMatchday) {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->lobbies.find(lobby);
    if (it == impl_->lobbies.end()) {
        return LeagueResult<void>::err(Impl::lobbyNotFound(lobby));
    }
    it->second.status = status;
    it->second.currentMatchday = currentMatchday;
    return LeagueResult<void>::ok();
}

// -- Matches -----------------------------------------------------------------

LeagueResult<Match> MemoryLeagueStore::getMatch(MatchId id) {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->matches.find(id);
    if (it == impl_->matches.end()) {
        return LeagueResult<Match>::err(LeagueError(
            ErrorCode::MatchNotFound, "match " + std::to_string(id.value()) + " not found"));
    }
    return LeagueResult<Match>::ok(it->second);
}

LeagueResult<std::vector<Match>> MemoryLeagueStore::getLobbyMatches(LobbyId lobby) {
    std::lock_guard lock(impl_->mutex);
    std::vector<Match> result;
    for (const auto& [id, match] : impl_->matches) {
        if (match.lobby == lobby) {
            result.push_back(match);
        }
    }
    std::stable_sort(result.begin(), result.end(), [](const Match& a, const Match& b) {
        return a.matchday < b.matchday;
    });
    return LeagueResult<std::vector<Match>>::ok(std::move(result));
}

LeagueResult<Match> MemoryLeagueStore::recordResult(
    MatchId id, const MatchResultRecord& result) {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->matches.find(id);
    if (it == impl_->matches.end()) {
        return LeagueResult<Match>::err(LeagueError(
            ErrorCode::MatchNotFound, "match " + std::to_string(id.value()) + " not found"));
    }
    auto& match = it->second;
    if (match.played) {
        LogContext ctx;
        ctx.lobbyId = match.lobby;
        ctx.matchId = id;
        FCL_LOG_CTX(LogLevel::Debug, LogCategory::Store, "result rejected: already played", ctx);
        return LeagueResult<Match>::err(LeagueError(
            ErrorCode::AlreadyPlayed,
            "match " + std::to_string(id.value()) + " already played"));
    }
    match.homeScore = result.homeScore;
    match.awayScore = result.awayScore;
    match.events = result.events;
    match.playedAt = result.playedAt;
    match.played = true;
    return LeagueResult<Match>::ok(match);
}

// -- Rewards -----------------------------------------------------------------

LeagueResult<void> MemoryLeagueStore::issueRewards(
    LobbyId lobby, const std::vector<Reward>& rewards) {
    if (rewards.empty()) {
        return LeagueResult<void>::err(
            LeagueError(ErrorCode::InvalidArgument, "no rewards to issue"));
    }
    std::lock_guard lock(impl_->mutex);
    auto lobbyIt = impl_->lobbies.find(lobby);
    if (lobbyIt == impl_->lobbies.end()) {
        return LeagueResult<void>::err(Impl::lobbyNotFound(lobby));
    }
    auto& ledger = impl_->rewards[lobby];
    if (!ledger.empty()) {
        LogContext ctx;
        ctx.lobbyId = lobby;
        FCL_LOG_CTX(LogLevel::Debug, LogCategory::Store, "rewards rejected: already issued", ctx);
        return LeagueResult<void>::err(LeagueError(
            ErrorCode::RewardsAlreadyIssued,
            "rewards for lobby " + std::to_string(lobby.value()) + " already issued"));
    }

    ledger = rewards;
    for (const auto& reward : rewards) {
        impl_->balances[reward.userId] += reward.coins;
    }
    lobbyIt->second.status = LobbyStatus::Finished;
    return LeagueResult<void>::ok();
}

LeagueResult<std::vector<Reward>> MemoryLeagueStore::getRewards(LobbyId lobby) {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->rewards.find(lobby);
    if (it == impl_->rewards.end()) {
        return LeagueResult<std::vector<Reward>>::ok({});
    }
    return LeagueResult<std::vector<Reward>>::ok(it->second);
}

LeagueResult<int64_t> MemoryLeagueStore::getCoinBalance(UserId user) {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->balances.find(user);
    return LeagueResult<int64_t>::ok(it == impl_->balances.end() ? 0 : it->second);
}

} // namespace fcl::service
