#pragma once

/// @file league_store.hpp
/// @brief Persistence seam owned by the league orchestrator.
///
/// Every mutating call is atomic: it either applies completely or leaves
/// the store unchanged.

#include <chrono>
#include <cstdint>
#include <vector>

#include "fcl/foundation/league_result.hpp"
#include "fcl/league/league_types.hpp"

namespace fcl::service {

using foundation::LeagueResult;

/// Final score of a match as written by recordResult().
struct MatchResultRecord {
    int32_t homeScore = 0;
    int32_t awayScore = 0;
    std::vector<league::MatchEvent> events;
    std::chrono::system_clock::time_point playedAt;
};

/// Abstract league persistence.
///
/// Lobby and team writes belong to collaborators (lobby and team
/// management); the engine only reads them. Match and reward writes are
/// the orchestrator's.
class LeagueStore {
public:
    virtual ~LeagueStore() = default;

    // -- Collaborator data ---------------------------------------------------

    /// Insert or replace a lobby with its members.
    [[nodiscard]] virtual LeagueResult<void> saveLobby(const league::Lobby& lobby) = 0;

    /// Insert or replace a team with its snapshotted slots.
    [[nodiscard]] virtual LeagueResult<void> saveTeam(const league::Team& team) = 0;

    /// @return The lobby or LobbyNotFound.
    [[nodiscard]] virtual LeagueResult<league::Lobby> getLobby(league::LobbyId id) = 0;

    /// @return The team or TeamNotFound.
    [[nodiscard]] virtual LeagueResult<league::Team> getTeam(league::TeamId id) = 0;

    /// All teams of a lobby fielded for @p matchday.
    [[nodiscard]] virtual LeagueResult<std::vector<league::Team>> getMatchdayTeams(
        league::LobbyId lobby, uint8_t matchday) = 0;

    // -- Schedule ------------------------------------------------------------

    /// Store a whole league schedule and mark the lobby IN_PROGRESS on
    /// matchday 1.
    ///
    /// Assigns match ids in input order.
    /// @return The stored matches, or AlreadyScheduled if the lobby
    ///         already has any match.
    [[nodiscard]] virtual LeagueResult<std::vector<league::Match>> createSchedule(
        league::LobbyId lobby, std::vector<league::Match> matches) = 0;

    /// Store the matches of one matchday.
    ///
    /// @return The stored matches, or ScheduleAlreadyExists if that
    ///         matchday already has matches.
    [[nodiscard]] virtual LeagueResult<std::vector<league::Match>> addMatchday(
        league::LobbyId lobby, uint8_t matchday, std::vector<league::Match> matches) = 0;

    [[nodiscard]] virtual LeagueResult<void> setLobbyProgress(
        league::LobbyId lobby, league::LobbyStatus status, uint8_t currentMatchday) = 0;

    // -- Matches -------------------------------------------------------------

    /// @return The match or MatchNotFound.
    [[nodiscard]] virtual LeagueResult<league::Match> getMatch(league::MatchId id) = 0;

    /// All matches of a lobby ordered by (matchday, id).
    [[nodiscard]] virtual LeagueResult<std::vector<league::Match>> getLobbyMatches(
        league::LobbyId lobby) = 0;

    /// Compare-and-set a match from unplayed to played.
    ///
    /// First writer wins; later writers get AlreadyPlayed and the stored
    /// score is left untouched.
    /// @return The updated match.
    [[nodiscard]] virtual LeagueResult<league::Match> recordResult(
        league::MatchId id, const MatchResultRecord& result) = 0;

    // -- Rewards -------------------------------------------------------------

    /// Write the reward ledger, credit balances and mark the lobby
    /// FINISHED as one unit.
    ///
    /// @return RewardsAlreadyIssued if the lobby has any reward; nothing
    ///         is credited in that case.
    [[nodiscard]] virtual LeagueResult<void> issueRewards(
        league::LobbyId lobby, const std::vector<league::Reward>& rewards) = 0;

    [[nodiscard]] virtual LeagueResult<std::vector<league::Reward>> getRewards(
        league::LobbyId lobby) = 0;

    /// Coins credited to @p user so far (0 for an unknown user).
    [[nodiscard]] virtual LeagueResult<int64_t> getCoinBalance(league::UserId user) = 0;
};

} // namespace fcl::service
