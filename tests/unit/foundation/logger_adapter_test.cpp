#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "fcl/foundation/error_code.hpp"
#include "fcl/foundation/league_logger.hpp"

// kcenon headers for test infrastructure (mock logger registration)
#include <kcenon/common/interfaces/global_logger_registry.h>

#include "mock_logger.hpp"

using namespace fcl::foundation;
using kcenon::common::interfaces::log_level;
using kcenon::common::interfaces::GlobalLoggerRegistry;
using fcl::test::MockLogger;

// ---------------------------------------------------------------------------
// Test fixture: registers a MockLogger as the default logger
// ---------------------------------------------------------------------------

class LeagueLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& registry = GlobalLoggerRegistry::instance();
        registry.clear();
        mockLogger_ = std::make_shared<MockLogger>();
        registry.set_default_logger(mockLogger_);
    }

    void TearDown() override {
        GlobalLoggerRegistry::instance().clear();
    }

    std::shared_ptr<MockLogger> mockLogger_;
};

// ---------------------------------------------------------------------------
// ErrorCode: Logger subsystem lookup
// ---------------------------------------------------------------------------

TEST(LoggerErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerError), "Logger");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
}

// ---------------------------------------------------------------------------
// LogCategory / LogLevel helpers
// ---------------------------------------------------------------------------

TEST(LogCategoryTest, AllCategoryNamesAreValid) {
    EXPECT_EQ(logCategoryName(LogCategory::Core), "Core");
    EXPECT_EQ(logCategoryName(LogCategory::Engine), "Engine");
    EXPECT_EQ(logCategoryName(LogCategory::Schedule), "Schedule");
    EXPECT_EQ(logCategoryName(LogCategory::Table), "Table");
    EXPECT_EQ(logCategoryName(LogCategory::Rewards), "Rewards");
    EXPECT_EQ(logCategoryName(LogCategory::Store), "Store");
    EXPECT_EQ(logCategoryName(LogCategory::Database), "Database");
    EXPECT_EQ(logCategoryName(LogCategory::Config), "Config");
    EXPECT_EQ(logCategoryName(static_cast<LogCategory>(42)), "Unknown");
}

TEST(LogLevelTest, LevelNamesRoundTripThroughParse) {
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warning,
                       LogLevel::Error, LogLevel::Critical, LogLevel::Off}) {
        auto parsed = parseLogLevel(logLevelName(level));
        ASSERT_TRUE(parsed.has_value()) << logLevelName(level);
        EXPECT_EQ(*parsed, level);
    }
    EXPECT_EQ(logLevelName(LogLevel::Warning), "WARNING");
}

TEST(LogLevelTest, ParseIsCaseInsensitive) {
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("INFO"), LogLevel::Info);
    EXPECT_EQ(parseLogLevel("Critical"), LogLevel::Critical);
    EXPECT_EQ(parseLogLevel("off"), LogLevel::Off);
}

TEST(LogLevelTest, ParseAcceptsWarnAlias) {
    EXPECT_EQ(parseLogLevel("warn"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("warning"), LogLevel::Warning);
}

TEST(LogLevelTest, ParseRejectsUnknown) {
    EXPECT_FALSE(parseLogLevel("verbose").has_value());
    EXPECT_FALSE(parseLogLevel("").has_value());
}

// ---------------------------------------------------------------------------
// Default category levels
// ---------------------------------------------------------------------------

TEST(LeagueLoggerBasicTest, DefaultCategoryLevels) {
    LeagueLogger logger;
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Core), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Engine), LogLevel::Debug);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Schedule), LogLevel::Debug);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Table), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Rewards), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Store), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Database), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Config), LogLevel::Info);
}

TEST(LeagueLoggerBasicTest, MoveConstruction) {
    LeagueLogger a;
    a.setCategoryLevel(LogCategory::Table, LogLevel::Error);
    LeagueLogger b(std::move(a));
    EXPECT_EQ(b.getCategoryLevel(LogCategory::Table), LogLevel::Error);
}

// ---------------------------------------------------------------------------
// isEnabled / setCategoryLevel
// ---------------------------------------------------------------------------

TEST(LeagueLoggerBasicTest, IsEnabledRespectsDefaultLevels) {
    LeagueLogger logger;
    // Core defaults to Info
    EXPECT_FALSE(logger.isEnabled(LogLevel::Debug, LogCategory::Core));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Info, LogCategory::Core));

    // Engine defaults to Debug
    EXPECT_TRUE(logger.isEnabled(LogLevel::Debug, LogCategory::Engine));
    EXPECT_FALSE(logger.isEnabled(LogLevel::Trace, LogCategory::Engine));
}

TEST(LeagueLoggerBasicTest, SetCategoryLevelToOffDisablesAll) {
    LeagueLogger logger;
    logger.setCategoryLevel(LogCategory::Store, LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, LogCategory::Store));
}

TEST(LeagueLoggerBasicTest, InvalidCategoryReturnsOff) {
    LeagueLogger logger;
    auto invalid = static_cast<LogCategory>(99);
    EXPECT_EQ(logger.getCategoryLevel(invalid), LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, invalid));
}

// ---------------------------------------------------------------------------
// Logging through the registry
// ---------------------------------------------------------------------------

TEST_F(LeagueLoggerTest, LogFormatsMessageWithCategory) {
    LeagueLogger logger;
    logger.log(LogLevel::Info, LogCategory::Schedule, "matchday 1 scheduled");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::info);
    EXPECT_EQ(records[0].message, "[Schedule] matchday 1 scheduled");
}

TEST_F(LeagueLoggerTest, LogFiltersMessagesBelowLevel) {
    LeagueLogger logger;
    logger.setCategoryLevel(LogCategory::Table, LogLevel::Warning);
    logger.log(LogLevel::Info, LogCategory::Table, "filtered");

    EXPECT_TRUE(mockLogger_->records().empty());
}

TEST_F(LeagueLoggerTest, LogWithContextIncludesFields) {
    LeagueLogger logger;

    LogContext ctx;
    ctx.lobbyId = LobbyId(7);
    ctx.matchId = MatchId(42);
    ctx.userId = UserId(3);
    ctx.extra["score"] = "3-1";

    logger.logWithContext(LogLevel::Info, LogCategory::Engine,
                          "match simulated", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);

    const auto& msg = records[0].message;
    EXPECT_NE(msg.find("[Engine] match simulated"), std::string::npos);
    EXPECT_NE(msg.find("lobby_id=7"), std::string::npos);
    EXPECT_NE(msg.find("match_id=42"), std::string::npos);
    EXPECT_NE(msg.find("user_id=3"), std::string::npos);
    EXPECT_NE(msg.find("score=3-1"), std::string::npos);
}

TEST_F(LeagueLoggerTest, LogWithEmptyContextOmitsBraces) {
    LeagueLogger logger;

    LogContext ctx;
    logger.logWithContext(LogLevel::Info, LogCategory::Core, "No context", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Core] No context");
}

TEST_F(LeagueLoggerTest, FlushDelegatesToLogger) {
    LeagueLogger logger;
    auto result = logger.flush();
    EXPECT_TRUE(result.hasValue());
    EXPECT_TRUE(mockLogger_->wasFlushed());
}

// ---------------------------------------------------------------------------
// FCL_LOG macros
// ---------------------------------------------------------------------------

TEST_F(LeagueLoggerTest, MacroLogsWhenEnabled) {
    LeagueLogger::instance().setCategoryLevel(LogCategory::Rewards, LogLevel::Debug);

    FCL_LOG_DEBUG(LogCategory::Rewards, "macro test");

    bool found = false;
    for (const auto& r : mockLogger_->records()) {
        if (r.message.find("macro test") != std::string::npos) {
            found = true;
            break;
        }
    }
    EXPECT_TRUE(found);
}

TEST_F(LeagueLoggerTest, MacroSkipsWhenDisabled) {
    LeagueLogger::instance().setCategoryLevel(LogCategory::Rewards, LogLevel::Error);
    mockLogger_->reset();

    FCL_LOG_DEBUG(LogCategory::Rewards, "should not appear");

    EXPECT_TRUE(mockLogger_->records().empty());
    LeagueLogger::instance().setCategoryLevel(LogCategory::Rewards, LogLevel::Info);
}

TEST_F(LeagueLoggerTest, ConcurrentLobbiesLogIndependently) {
    LeagueLogger logger;

    constexpr uint64_t kLobbies = 6;
    constexpr int kMatchesPerLobby = 18;

    std::vector<std::thread> runners;
    for (uint64_t lobby = 1; lobby <= kLobbies; ++lobby) {
        runners.emplace_back([&logger, lobby] {
            for (int m = 1; m <= kMatchesPerLobby; ++m) {
                LogContext ctx;
                ctx.lobbyId = fcl::foundation::LobbyId(lobby);
                ctx.matchId = fcl::foundation::MatchId(lobby * 100 + m);
                logger.logWithContext(LogLevel::Info, LogCategory::Engine, "match simulated",
                                      ctx);
            }
        });
    }
    for (auto& runner : runners) {
        runner.join();
    }

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), static_cast<std::size_t>(kLobbies * kMatchesPerLobby));
    for (const auto& r : records) {
        EXPECT_EQ(r.message.rfind("[Engine] match simulated {lobby_id=", 0), 0u) << r.message;
    }
}
