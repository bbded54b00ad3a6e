#pragma once

/// @file league_orchestrator.hpp
/// @brief League lifecycle: scheduling, simulation, standings and rewards.
///
/// LeagueOrchestrator composes the pure league components over a
/// LeagueStore and is the only component that writes league state.

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "fcl/foundation/config_manager.hpp"
#include "fcl/foundation/league_result.hpp"
#include "fcl/league/random_source.hpp"
#include "fcl/service/league_service_types.hpp"
#include "fcl/service/league_store.hpp"

namespace fcl::service {

/// Drives a lobby through its league.
///
/// Lifecycle per lobby:
///   NO_LEAGUE -> SCHEDULED(1) -> SCHEDULED(2) -> SCHEDULED(3)
///   -> COMPLETE -> REWARDED
///
/// Operations on one lobby are serialized by a per-lobby mutex. The store
/// makes the played flag a compare-and-set, so concurrent simulateMatch()
/// calls on one match score it once and the loser sees AlreadyPlayed. The
/// completion check and reward issue run under the same lock as the
/// final match's write.
///
/// Usage:
/// @code
///   auto store = std::make_shared<MemoryLeagueStore>();
///   auto random = std::make_shared<league::MersenneRandomSource>();
///   LeagueOrchestrator orchestrator(store, random);
///
///   auto created = orchestrator.createLeague(lobbyId);
///   auto run = orchestrator.simulateEntireLeague(lobbyId);
///   auto status = orchestrator.getLeagueStatus(lobbyId);
/// @endcode
class LeagueOrchestrator {
public:
    LeagueOrchestrator(std::shared_ptr<LeagueStore> store,
                       std::shared_ptr<league::RandomSource> random,
                       LeagueConfig config = {});
    ~LeagueOrchestrator();

    LeagueOrchestrator(const LeagueOrchestrator&) = delete;
    LeagueOrchestrator& operator=(const LeagueOrchestrator&) = delete;
    LeagueOrchestrator(LeagueOrchestrator&&) noexcept;
    LeagueOrchestrator& operator=(LeagueOrchestrator&&) noexcept;

    // -- Scheduling -----------------------------------------------------------

    /// Schedule all matchdays of a full lobby in one store write.
    ///
    /// Sets the lobby IN_PROGRESS on matchday 1.
    /// Fails LobbyNotFound, LobbyNotFull, AlreadyScheduled or TeamsMissing.
    [[nodiscard]] LeagueResult<LeagueCreated> createLeague(league::LobbyId lobby);

    /// Schedule one matchday on its own.
    ///
    /// Fails ScheduleAlreadyExists if that matchday has matches.
    [[nodiscard]] LeagueResult<MatchdayScheduled> generateMatchday(
        league::LobbyId lobby, uint8_t matchday);

    // -- Simulation -----------------------------------------------------------

    /// Simulate and persist one match.
    ///
    /// Fails MatchNotFound, AlreadyPlayed, TeamNotFound, IncompleteTeam or
    /// InvalidChemistry. The 18th played match issues rewards and
    /// finishes the lobby.
    [[nodiscard]] LeagueResult<MatchOutcome> simulateMatch(league::MatchId match);

    /// Simulate the unplayed matches of one matchday.
    [[nodiscard]] LeagueResult<BatchOutcome> simulateMatchday(
        league::LobbyId lobby, uint8_t matchday);

    /// Simulate every unplayed match in (matchday, id) order.
    ///
    /// Resumable: matches already played are skipped.
    [[nodiscard]] LeagueResult<BatchOutcome> simulateEntireLeague(league::LobbyId lobby);

    // -- Queries --------------------------------------------------------------

    [[nodiscard]] LeagueResult<LeagueStatus> getLeagueStatus(league::LobbyId lobby);

    /// Standings of the whole league, or of one matchday.
    [[nodiscard]] LeagueResult<std::vector<league::LeagueTableEntry>> getLeagueTable(
        league::LobbyId lobby, std::optional<uint8_t> matchday = std::nullopt);

    [[nodiscard]] LeagueResult<std::vector<league::Match>> getLobbyMatches(
        league::LobbyId lobby);

    [[nodiscard]] LeagueResult<league::Match> getMatch(league::MatchId match);

    [[nodiscard]] LeagueResult<std::vector<league::Reward>> getRewards(league::LobbyId lobby);

    [[nodiscard]] const LeagueConfig& config() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Build a LeagueConfig from `league.*` and `store.*` keys.
///
/// Missing keys keep their defaults. Fails ConfigTypeMismatch for a value
/// of the wrong type and InvalidArgument for an unknown store backend.
[[nodiscard]] LeagueResult<LeagueConfig> leagueConfigFrom(
    const foundation::ConfigManager& config);

} // namespace fcl::service
