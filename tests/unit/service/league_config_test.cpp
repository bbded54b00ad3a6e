/// @file league_config_test.cpp
/// @brief Unit tests for fixture parsing, LeagueConfig loading and the
///        service runner helpers.

#include <gtest/gtest.h>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

#include "fcl/foundation/config_manager.hpp"
#include "fcl/foundation/league_logger.hpp"
#include "fcl/league/roster_validator.hpp"
#include "fcl/service/league_fixture.hpp"
#include "fcl/service/league_orchestrator.hpp"
#include "fcl/service/memory_league_store.hpp"
#include "fcl/service/service_runner.hpp"
#include "mock_logger.hpp"

using namespace fcl::league;
using namespace fcl::service;
using fcl::foundation::ConfigManager;
using fcl::foundation::DatabaseType;
using fcl::foundation::ErrorCode;
using fcl::foundation::LeagueLogger;
using fcl::foundation::LogCategory;
using fcl::foundation::LogLevel;

// ============================================================================
// Fixture parsing
// ============================================================================

namespace {

constexpr const char* kFixture = R"(
lobby:
  id: 7
  name: Friday Cup
  members: [1, 2, 3, 4]
teams:
  - id: 701
    owner: 1
    matchday: 1
    formation: 4-3-3
    groups:
      - {color: red, count: 5, rating: 30}
      - {color: yellow, count: 3, rating: 25}
      - {color: dark-blue, count: 3, rating: 20}
  - id: 702
    owner: 2
    matchday: 1
    name: Explicit XI
    slots:
      - {card: 5001, rating: 31, color: purple}
      - {card: 5002, rating: 29, color: purple}
      - {placeholder: true, rating: 15}
)";

} // namespace

TEST(LeagueFixtureTest, ParsesLobbyAndBothTeamForms) {
    auto fixture = parseFixture(kFixture);
    ASSERT_TRUE(fixture.hasValue()) << fixture.error().message();
    const auto& f = fixture.value();

    EXPECT_EQ(f.lobby.id, LobbyId(7));
    EXPECT_EQ(f.lobby.name, "Friday Cup");
    ASSERT_EQ(f.lobby.members.size(), 4u);
    EXPECT_EQ(f.lobby.members[3], UserId(4));
    ASSERT_EQ(f.teams.size(), 2u);

    const auto& compact = f.teams[0];
    EXPECT_EQ(compact.lobby, LobbyId(7));
    EXPECT_EQ(compact.formation, "4-3-3");
    EXPECT_EQ(compact.name, "Team 701");
    EXPECT_EQ(compact.filledSlots(), kSlotsPerTeam);
    EXPECT_EQ(compact.slots[0].cardId, CardId(70101));
    EXPECT_EQ(compact.slots[10].color, PlayerColor::DarkBlue);
    EXPECT_TRUE(RosterValidator::validate(compact).isEligible());

    const auto& explicitTeam = f.teams[1];
    EXPECT_EQ(explicitTeam.name, "Explicit XI");
    EXPECT_EQ(explicitTeam.slots[1].cardId, CardId(5002));
    EXPECT_EQ(explicitTeam.slots[1].rating, 29);
    EXPECT_TRUE(explicitTeam.slots[2].placeholder);
    EXPECT_FALSE(explicitTeam.slots[2].cardId.has_value());
    EXPECT_EQ(explicitTeam.filledSlots(), 3u);
}

TEST(LeagueFixtureTest, UnknownColorRejected) {
    auto fixture = parseFixture(R"(
lobby: {id: 1, members: [1]}
teams:
  - id: 1
    owner: 1
    matchday: 1
    groups: [{color: teal, count: 11, rating: 10}]
)");
    ASSERT_TRUE(fixture.hasError());
    EXPECT_EQ(fixture.error().code(), ErrorCode::InvalidArgument);
}

TEST(LeagueFixtureTest, OversizedTeamRejected) {
    auto fixture = parseFixture(R"(
lobby: {id: 1, members: [1]}
teams:
  - id: 1
    owner: 1
    matchday: 1
    groups: [{color: red, count: 12, rating: 10}]
)");
    ASSERT_TRUE(fixture.hasError());
    EXPECT_EQ(fixture.error().code(), ErrorCode::InvalidArgument);
}

TEST(LeagueFixtureTest, MalformedYamlRejected) {
    auto missingLobby = parseFixture("teams: []");
    ASSERT_TRUE(missingLobby.hasError());
    EXPECT_EQ(missingLobby.error().code(), ErrorCode::InvalidArgument);

    auto broken = parseFixture("lobby: {id: [");
    ASSERT_TRUE(broken.hasError());
    EXPECT_EQ(broken.error().code(), ErrorCode::ConfigLoadFailed);

    auto missingFile = loadFixture("/nonexistent/fixture.yaml");
    ASSERT_TRUE(missingFile.hasError());
    EXPECT_EQ(missingFile.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST(LeagueFixtureTest, SeedStoreWritesLobbyAndTeams) {
    auto fixture = parseFixture(kFixture);
    ASSERT_TRUE(fixture.hasValue());

    MemoryLeagueStore store;
    ASSERT_TRUE(seedStore(store, fixture.value()).hasValue());

    auto lobby = store.getLobby(LobbyId(7));
    ASSERT_TRUE(lobby.hasValue());
    EXPECT_EQ(lobby.value().members.size(), 4u);

    auto teams = store.getMatchdayTeams(LobbyId(7), 1);
    ASSERT_TRUE(teams.hasValue());
    EXPECT_EQ(teams.value().size(), 2u);
}

// ============================================================================
// leagueConfigFrom
// ============================================================================

TEST(LeagueConfigTest, DefaultsWithEmptyConfig) {
    ConfigManager config;
    auto cfg = leagueConfigFrom(config);
    ASSERT_TRUE(cfg.hasValue());
    EXPECT_EQ(cfg.value().chancesPerSide, kDefaultChancesPerSide);
    EXPECT_FALSE(cfg.value().rngSeed.has_value());
    EXPECT_EQ(cfg.value().rewards.total(), 700);
    EXPECT_EQ(cfg.value().storeBackend, StoreBackend::Memory);
    EXPECT_EQ(cfg.value().databaseType, DatabaseType::SQLite);
}

TEST(LeagueConfigTest, ReadsAllKeys) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"(
league:
  chances_per_side: 50
  rng_seed: 1234
  rewards: {first: 500, second: 300, third: 100, fourth: 0}
store:
  backend: sql
  database_type: postgres
  connection_string: "host=localhost dbname=league"
  schema_path: /etc/fcl/schema.sql
)").hasValue());

    auto cfg = leagueConfigFrom(config);
    ASSERT_TRUE(cfg.hasValue()) << cfg.error().message();
    EXPECT_EQ(cfg.value().chancesPerSide, 50u);
    EXPECT_EQ(cfg.value().rngSeed, 1234u);
    EXPECT_EQ(cfg.value().rewards.coinsFor(1), 500);
    EXPECT_EQ(cfg.value().rewards.coinsFor(4), 0);
    EXPECT_EQ(cfg.value().storeBackend, StoreBackend::Sql);
    EXPECT_EQ(cfg.value().databaseType, DatabaseType::PostgreSQL);
    EXPECT_EQ(cfg.value().connectionString, "host=localhost dbname=league");
    EXPECT_EQ(cfg.value().schemaPath, "/etc/fcl/schema.sql");
}

TEST(LeagueConfigTest, RejectsBadValues) {
    ConfigManager zero;
    zero.set<int>("league.chances_per_side", 0);
    auto r1 = leagueConfigFrom(zero);
    ASSERT_TRUE(r1.hasError());
    EXPECT_EQ(r1.error().code(), ErrorCode::InvalidArgument);

    ConfigManager backend;
    backend.set<std::string>("store.backend", "redis");
    auto r2 = leagueConfigFrom(backend);
    ASSERT_TRUE(r2.hasError());
    EXPECT_EQ(r2.error().code(), ErrorCode::InvalidArgument);

    ConfigManager dbType;
    dbType.set<std::string>("store.database_type", "oracle");
    auto r3 = leagueConfigFrom(dbType);
    ASSERT_TRUE(r3.hasError());
    EXPECT_EQ(r3.error().code(), ErrorCode::InvalidArgument);

    ConfigManager tooMany;
    tooMany.set<int>("league.chances_per_side", 101);
    auto r5 = leagueConfigFrom(tooMany);
    ASSERT_TRUE(r5.hasError());
    EXPECT_EQ(r5.error().code(), ErrorCode::InvalidArgument);

    ConfigManager atLimit;
    atLimit.set<int>("league.chances_per_side", 100);
    auto ok = leagueConfigFrom(atLimit);
    ASSERT_TRUE(ok.hasValue());
    EXPECT_EQ(ok.value().chancesPerSide, 100u);

    ConfigManager negativeReward;
    negativeReward.set<int>("league.rewards.fourth", -50);
    auto r6 = leagueConfigFrom(negativeReward);
    ASSERT_TRUE(r6.hasError());
    EXPECT_EQ(r6.error().code(), ErrorCode::InvalidArgument);

    ConfigManager mismatch;
    mismatch.set<std::string>("league.rewards.first", "lots");
    auto r4 = leagueConfigFrom(mismatch);
    ASSERT_TRUE(r4.hasError());
    EXPECT_EQ(r4.error().code(), ErrorCode::ConfigTypeMismatch);
}

// ============================================================================
// Service runner helpers
// ============================================================================

TEST(ServiceRunnerTest, ParsePathArgs) {
    char prog[] = "fcl_league_service";
    char configFlag[] = "--config";
    char configPath[] = "/etc/fcl/league.yaml";
    char fixtureFlag[] = "--fixture";
    char fixturePath[] = "demo.yaml";
    char* argv[] = {prog, configFlag, configPath, fixtureFlag, fixturePath};

    EXPECT_EQ(parseConfigArg(5, argv).string(), "/etc/fcl/league.yaml");
    EXPECT_EQ(parsePathArg(5, argv, "--fixture").string(), "demo.yaml");
    EXPECT_TRUE(parsePathArg(5, argv, "--missing").empty());
    // A trailing flag without a value is ignored.
    EXPECT_TRUE(parsePathArg(4, argv, "--fixture").empty());
}

TEST(ServiceRunnerTest, ApplyLogLevels) {
    auto& logger = LeagueLogger::instance();
    auto before = logger.getCategoryLevel(LogCategory::Engine);

    ConfigManager config;
    config.set<std::string>("logging.engine", "warn");
    ASSERT_TRUE(applyLogLevels(config).hasValue());
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Engine), LogLevel::Warning);

    config.set<std::string>("logging.store", "chatty");
    auto bad = applyLogLevels(config);
    ASSERT_TRUE(bad.hasError());
    EXPECT_EQ(bad.error().code(), ErrorCode::InvalidArgument);

    logger.setCategoryLevel(LogCategory::Engine, before);
}

// Writes two config files and clears FCL_CONFIG_PATH around each test.
class LoadConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "fcl_test_runner_config";
        std::filesystem::create_directories(dir_);
        flagPath_ = write("flag.yaml", 12);
        envPath_ = write("env.yaml", 34);
        ::unsetenv("FCL_CONFIG_PATH");
    }

    void TearDown() override {
        ::unsetenv("FCL_CONFIG_PATH");
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path write(const std::string& name, int chances) {
        auto path = dir_ / name;
        std::ofstream out(path);
        out << "league:\n  chances_per_side: " << chances << "\n";
        return path;
    }

    std::filesystem::path dir_;
    std::filesystem::path flagPath_;
    std::filesystem::path envPath_;
};

TEST_F(LoadConfigTest, FlagBeatsEnvironment) {
    ::setenv("FCL_CONFIG_PATH", envPath_.c_str(), 1);
    ConfigManager config;
    auto loaded = loadConfig(config, flagPath_, "/nonexistent/default.yaml");
    ASSERT_TRUE(loaded.hasValue());
    EXPECT_EQ(config.getOr<int>("league.chances_per_side", 0), 12);
}

TEST_F(LoadConfigTest, EnvironmentBeatsDefault) {
    ::setenv("FCL_CONFIG_PATH", envPath_.c_str(), 1);
    ConfigManager config;
    auto loaded = loadConfig(config, {}, flagPath_);
    ASSERT_TRUE(loaded.hasValue());
    EXPECT_EQ(config.getOr<int>("league.chances_per_side", 0), 34);
}

TEST_F(LoadConfigTest, DefaultWhenNothingElseGiven) {
    ConfigManager config;
    auto loaded = loadConfig(config, {}, envPath_);
    ASSERT_TRUE(loaded.hasValue());
    EXPECT_EQ(config.getOr<int>("league.chances_per_side", 0), 34);

    auto missing = loadConfig(config, {}, "/nonexistent/default.yaml");
    ASSERT_TRUE(missing.hasError());
    EXPECT_EQ(missing.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(LoadConfigTest, MissingFlagFileDoesNotFallBack) {
    ::setenv("FCL_CONFIG_PATH", envPath_.c_str(), 1);
    ConfigManager config;
    auto loaded = loadConfig(config, "/nonexistent/flag.yaml", envPath_);
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST(ServiceRunnerTest, UnknownLogCategoryRejected) {
    ConfigManager config;
    config.set<std::string>("logging.network", "debug");
    auto result = applyLogLevels(config);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
    EXPECT_NE(result.error().message().find("logging.network"), std::string_view::npos);
}

TEST(ServiceRunnerTest, SeedArgOverridesConfig) {
    char prog[] = "fcl_league_service";
    char seedFlag[] = "--seed";
    char seedValue[] = "1234";
    char* argv[] = {prog, seedFlag, seedValue};

    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("league:\n  rng_seed: 7\n").hasValue());
    ASSERT_TRUE(applyArgOverrides(config, 3, argv).hasValue());
    auto cfg = leagueConfigFrom(config);
    ASSERT_TRUE(cfg.hasValue());
    ASSERT_TRUE(cfg.value().rngSeed.has_value());
    EXPECT_EQ(*cfg.value().rngSeed, 1234u);

    // Without the flag the file value stands.
    ConfigManager untouched;
    ASSERT_TRUE(untouched.loadFromString("league:\n  rng_seed: 7\n").hasValue());
    ASSERT_TRUE(applyArgOverrides(untouched, 1, argv).hasValue());
    EXPECT_EQ(untouched.getOr<uint64_t>("league.rng_seed", 0), 7u);
}

TEST(ServiceRunnerTest, BadSeedArgRejected) {
    char prog[] = "fcl_league_service";
    char seedFlag[] = "--seed";
    char seedValue[] = "12abc";
    char* argv[] = {prog, seedFlag, seedValue};

    ConfigManager config;
    auto result = applyArgOverrides(config, 3, argv);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
    EXPECT_FALSE(config.hasKey("league.rng_seed"));
}

TEST(ServiceRunnerTest, RejectedConfigIsLoggedUnderConfig) {
    fcl::test::ScopedMockLogger logger;
    ConfigManager config;
    config.set<int>("league.chances_per_side", 0);
    ASSERT_TRUE(leagueConfigFrom(config).hasError());
    EXPECT_EQ(logger->countIn("Config", "league.chances_per_side"), 1u);
}
