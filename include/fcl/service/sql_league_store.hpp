#pragma once

/// @file sql_league_store.hpp
/// @brief LeagueStore over the kcenon database adapter.

#include <filesystem>
#include <memory>
#include <string_view>

#include "fcl/foundation/league_database.hpp"
#include "fcl/service/league_store.hpp"

namespace fcl::service {

/// LeagueStore persisting to an SQL database through LeagueDatabase.
///
/// Every mutating call runs in one transaction. LeagueDatabase holds its
/// connection exclusively for the life of a transaction, so the
/// read-then-write steps (played check, reward check) cannot interleave
/// with another writer in this process.
///
/// Usage:
/// @code
///   auto db = std::make_shared<LeagueDatabase>();
///   db->connect({.connectionString = "league.db"});
///   SqlLeagueStore store(db);
///   store.initializeSchema("sql/league_schema.sql");
/// @endcode
class SqlLeagueStore final : public LeagueStore {
public:
    explicit SqlLeagueStore(std::shared_ptr<foundation::LeagueDatabase> db);
    ~SqlLeagueStore() override;

    SqlLeagueStore(const SqlLeagueStore&) = delete;
    SqlLeagueStore& operator=(const SqlLeagueStore&) = delete;

    /// Run a DDL script of ';'-separated statements.
    [[nodiscard]] LeagueResult<void> initializeSchema(const std::filesystem::path& schemaFile);

    /// Run DDL statements from an in-memory script.
    [[nodiscard]] LeagueResult<void> applySchema(std::string_view script);

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
    std::shared_ptr<foundation::LeagueDatabase> db_;
};

} // namespace fcl::service
