#pragma once

/// @file memory_league_store.hpp
/// @brief In-process LeagueStore for tests and the demo service.

#include <memory>

#include "fcl/service/league_store.hpp"

namespace fcl::service {

/// LeagueStore backed by mutex-guarded maps.
///
/// A single mutex covers all state, so each call is trivially atomic.
class MemoryLeagueStore final : public LeagueStore {
public:
    MemoryLeagueStore();
    ~MemoryLeagueStore() override;

    MemoryLeagueStore(const MemoryLeagueStore&) = delete;
    MemoryLeagueStore& operator=(const MemoryLeagueStore&) = delete;

    LeagueResult<void> saveLobby(const league::Lobby& lobby) override;
    LeagueResult<void> saveTeam(const league::Team& team) override;
    LeagueResult<league::Lobby> getLobby(league::LobbyId id) override;
    LeagueResult<league::Team> getTeam(league::TeamId id) override;
    LeagueResult<std::vector<league::Team>> getMatchdayTeams(
        league::LobbyId lobby, uint8_t matchday) override;

    LeagueResult<std::vector<league::Match>> createSchedule(
        league::LobbyId lobby, std::vector<league::Match> matches) override;
    LeagueResult<std::vector<league::Match>> addMatchday(
        league::LobbyId lobby, uint8_t matchday, std::vector<league::Match> matches) override;
    LeagueResult<void> setLobbyProgress(
        league::LobbyId lobby, league::LobbyStatus status, uint8_t currentMatchday) override;

    LeagueResult<league::Match> getMatch(league::MatchId id) override;
    LeagueResult<std::vector<league::Match>> getLobbyMatches(league::LobbyId lobby) override;
    LeagueResult<league::Match> recordResult(
        league::MatchId id, const MatchResultRecord& result) override;

    LeagueResult<void> issueRewards(
        league::LobbyId lobby, const std::vector<league::Reward>& rewards) override;
    LeagueResult<std::vector<league::Reward>> getRewards(league::LobbyId lobby) override;
    LeagueResult<int64_t> getCoinBalance(league::UserId user) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace fcl::service
