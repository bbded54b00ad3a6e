/// @file main.cpp
/// @brief League service entry point.
///
/// Seeds a lobby from a YAML fixture, runs its league matchday by
/// matchday and prints the final table and rewards.

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>

#include "fcl/foundation/config_manager.hpp"
#include "fcl/foundation/league_database.hpp"
#include "fcl/foundation/league_logger.hpp"
#include "fcl/foundation/league_metrics.hpp"
#include "fcl/league/roster_validator.hpp"
#include "fcl/service/league_fixture.hpp"
#include "fcl/service/league_orchestrator.hpp"
#include "fcl/service/memory_league_store.hpp"
#include "fcl/service/service_runner.hpp"
#include "fcl/service/sql_league_store.hpp"

namespace {

using fcl::foundation::LeagueResult;

LeagueResult<std::shared_ptr<fcl::service::LeagueStore>> buildStore(
    const fcl::service::LeagueConfig& cfg) {
    using StorePtr = std::shared_ptr<fcl::service::LeagueStore>;

    if (cfg.storeBackend == fcl::service::StoreBackend::Memory) {
        return LeagueResult<StorePtr>::ok(
            std::make_shared<fcl::service::MemoryLeagueStore>());
    }

    auto db = std::make_shared<fcl::foundation::LeagueDatabase>();
    auto connected = db->connect({.connectionString = cfg.connectionString,
                                  .dbType = cfg.databaseType});
    if (!connected) {
        return LeagueResult<StorePtr>::err(connected.error());
    }
    auto store = std::make_shared<fcl::service::SqlLeagueStore>(db);
    auto schema = store->initializeSchema(cfg.schemaPath);
    if (!schema) {
        return LeagueResult<StorePtr>::err(schema.error());
    }
    return LeagueResult<StorePtr>::ok(std::move(store));
}

bool rostersValid(const fcl::service::LeagueFixture& fixture) {
    bool valid = true;
    for (const auto& team : fixture.teams) {
        auto report = fcl::league::RosterValidator::validate(team);
        auto conflicts = fcl::league::RosterValidator::matchdayConflicts(team, fixture.teams);
        if (report.isEligible() && conflicts.empty()) {
            continue;
        }
        valid = false;
        std::cerr << "Team " << team.id.value() << " (user " << team.owner.value()
                  << ", matchday " << static_cast<int>(team.matchday) << "):\n";
        if (!report.isComplete()) {
            std::cerr << "  " << report.filledSlots << " of "
                      << fcl::league::kSlotsPerTeam << " slots filled\n";
        }
        for (const auto& issue : report.chemistryIssues) {
            std::cerr << "  " << issue.message << "\n";
        }
        for (const auto& card : report.duplicateCards) {
            std::cerr << "  card " << card.value() << " fielded twice\n";
        }
        for (const auto& conflict : conflicts) {
            std::cerr << "  card " << conflict.cardId.value() << " already fielded by team "
                      << conflict.usedInTeam.value() << "\n";
        }
    }
    return valid;
}

void printTable(const std::vector<fcl::league::LeagueTableEntry>& table) {
    std::cout << " # user   P   W   D   L   GF   GA   GD  Pts\n";
    for (const auto& e : table) {
        std::cout << std::setw(2) << e.rank << std::setw(5) << e.userId.value()
                  << std::setw(4) << e.matchesPlayed << std::setw(4) << e.wins
                  << std::setw(4) << e.draws << std::setw(4) << e.losses
                  << std::setw(5) << e.goalsFor << std::setw(5) << e.goalsAgainst
                  << std::setw(5) << e.goalDifference << std::setw(5) << e.points << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    fcl::service::SignalHandler signals;

    auto configPath = fcl::service::parseConfigArg(argc, argv);
    auto fixturePath = fcl::service::parsePathArg(argc, argv, "--fixture");
    if (fixturePath.empty()) {
        fixturePath = "config/demo_fixture.yaml";
    }

    fcl::foundation::ConfigManager config;
    auto loadResult = fcl::service::loadConfig(config, configPath, "config/league.yaml");
    if (!loadResult) {
        std::cerr << "Failed to load config: "
                  << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }
    auto overrides = fcl::service::applyArgOverrides(config, argc, argv);
    if (!overrides) {
        std::cerr << overrides.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto levels = fcl::service::applyLogLevels(config);
    if (!levels) {
        std::cerr << "Invalid logging config: " << levels.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto leagueCfg = fcl::service::leagueConfigFrom(config);
    if (!leagueCfg) {
        std::cerr << "Invalid league config: " << leagueCfg.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto store = buildStore(leagueCfg.value());
    if (!store) {
        std::cerr << "Failed to open store: " << store.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto fixture = fcl::service::loadFixture(fixturePath);
    if (!fixture) {
        std::cerr << "Failed to load fixture: " << fixture.error().message() << "\n";
        return EXIT_FAILURE;
    }
    if (!rostersValid(fixture.value())) {
        return EXIT_FAILURE;
    }
    // A persistent store that already holds the lobby resumes its league.
    auto known = store.value()->getLobby(fixture.value().lobby.id);
    if (!known) {
        if (known.error().code() != fcl::foundation::ErrorCode::LobbyNotFound) {
            std::cerr << "Failed to read store: " << known.error().message() << "\n";
            return EXIT_FAILURE;
        }
        auto seeded = fcl::service::seedStore(*store.value(), fixture.value());
        if (!seeded) {
            std::cerr << "Failed to seed store: " << seeded.error().message() << "\n";
            return EXIT_FAILURE;
        }
    }

    auto random = std::make_shared<fcl::league::MersenneRandomSource>(leagueCfg.value().rngSeed);
    fcl::service::LeagueOrchestrator orchestrator(store.value(), random, leagueCfg.value());

    auto lobbyId = fixture.value().lobby.id;
    auto created = orchestrator.createLeague(lobbyId);
    if (!created && created.error().code() != fcl::foundation::ErrorCode::AlreadyScheduled) {
        std::cerr << "Failed to create league: " << created.error().message() << "\n";
        return EXIT_FAILURE;
    }

    std::cout << "League for lobby " << lobbyId.value() << " started (chances per side: "
              << leagueCfg.value().chancesPerSide << ")\n";

    for (uint8_t matchday = 1; matchday <= fcl::league::kMatchdays; ++matchday) {
        if (signals.shutdownRequested()) {
            std::cout << "Interrupted; rerun to resume the league\n";
            break;
        }
        auto run = orchestrator.simulateMatchday(lobbyId, matchday);
        if (!run) {
            std::cerr << "Matchday " << static_cast<int>(matchday)
                      << " failed: " << run.error().message() << "\n";
            return EXIT_FAILURE;
        }
        std::cout << "\nMatchday " << static_cast<int>(matchday) << "\n";
        for (const auto& r : run.value().results) {
            std::cout << "  match " << r.matchId.value() << ": " << r.homeScore
                      << " - " << r.awayScore << "\n";
        }
        auto table = orchestrator.getLeagueTable(lobbyId, matchday);
        if (table) {
            printTable(table.value());
        }
    }

    auto status = orchestrator.getLeagueStatus(lobbyId);
    if (!status) {
        std::cerr << "Failed to read league status: " << status.error().message() << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "\nFinal table (" << status.value().playedMatches << "/"
              << status.value().totalMatches << " played)\n";
    printTable(status.value().leagueTable);

    auto rewards = orchestrator.getRewards(lobbyId);
    if (rewards) {
        for (const auto& reward : rewards.value()) {
            std::cout << "  user " << reward.userId.value() << " (#" << reward.position
                      << "): " << reward.coins << " coins\n";
        }
    }

    std::cout << "\n" << fcl::foundation::LeagueMetrics::instance().scrape();
    (void)fcl::foundation::LeagueLogger::instance().flush();
    return EXIT_SUCCESS;
}
