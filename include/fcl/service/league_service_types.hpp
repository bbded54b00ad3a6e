#pragma once

/// @file league_service_types.hpp
/// @brief Configuration and result types of the league orchestrator.

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "fcl/foundation/league_database.hpp"
#include "fcl/league/league_types.hpp"
#include "fcl/league/match_simulator.hpp"
#include "fcl/league/reward_allocator.hpp"
#include "fcl/league/team_strength.hpp"

namespace fcl::service {

/// Store backend selected by `store.backend`.
enum class StoreBackend : uint8_t {
    Memory,
    Sql
};

/// Configuration for the league orchestrator.
struct LeagueConfig {
    /// Scoring chances each side gets per match.
    uint32_t chancesPerSide = league::kDefaultChancesPerSide;

    /// Fixed seed for reproducible runs; unset seeds from the OS.
    std::optional<uint64_t> rngSeed;

    league::RewardSchedule rewards;

    StoreBackend storeBackend = StoreBackend::Memory;
    foundation::DatabaseType databaseType = foundation::DatabaseType::SQLite;
    std::string connectionString;
    std::string schemaPath = "sql/league_schema.sql";
};

/// Result of createLeague().
struct LeagueCreated {
    league::LobbyId lobbyId;
    std::size_t totalMatches = 0;
    std::array<std::size_t, league::kMatchdays> perMatchdayCounts{};
};

/// Result of generateMatchday().
struct MatchdayScheduled {
    league::LobbyId lobbyId;
    uint8_t matchday = 0;
    std::vector<league::Match> matches;
};

/// Result of a single simulated match.
struct MatchOutcome {
    league::MatchId matchId;
    uint8_t matchday = 0;
    int32_t homeScore = 0;
    int32_t awayScore = 0;
    std::vector<league::MatchEvent> events;
    league::ConversionProbabilities probabilities;
    league::TeamStrength homeStrength;
    league::TeamStrength awayStrength;

    /// True if this match completed the league.
    bool leagueComplete = false;
};

/// Result of a batch simulation.
struct BatchOutcome {
    /// Newly played matches in (matchday, match id) order.
    std::vector<MatchOutcome> results;

    /// Matches found already played by a concurrent caller.
    std::size_t skipped = 0;

    bool leagueComplete = false;
};

struct MatchdayProgress {
    uint8_t matchday = 0;
    std::size_t totalMatches = 0;
    std::size_t playedMatches = 0;

    [[nodiscard]] bool isComplete() const noexcept {
        return totalMatches > 0 && playedMatches == totalMatches;
    }
};

/// Snapshot returned by getLeagueStatus().
struct LeagueStatus {
    league::LobbyId lobbyId;
    league::LobbyStatus lobbyStatus = league::LobbyStatus::Waiting;
    std::size_t totalMatches = 0;
    std::size_t playedMatches = 0;
    uint8_t currentMatchday = 0;
    std::array<MatchdayProgress, league::kMatchdays> matchdayProgress{};
    std::vector<league::LeagueTableEntry> leagueTable;
    bool leagueComplete = false;
    bool rewardsIssued = false;
};

} // namespace fcl::service
