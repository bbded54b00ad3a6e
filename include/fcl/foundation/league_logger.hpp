#pragma once

/// @file league_logger.hpp
/// @brief LeagueLogger wrapping kcenon common_system logging with
///        per-category levels and structured league context.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "fcl/foundation/league_result.hpp"
#include "fcl/foundation/types.hpp"

namespace fcl::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level one-to-one.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Subsystems that can be filtered independently.
enum class LogCategory : uint8_t {
    Core     = 0, ///< Service lifecycle
    Engine   = 1, ///< Strength and match simulation
    Schedule = 2, ///< Fixture generation
    Table    = 3, ///< Standings
    Rewards  = 4, ///< Payouts and coin balances
    Store    = 5, ///< League persistence
    Database = 6, ///< SQL adapter
    Config   = 7  ///< Configuration loading
};

inline constexpr std::size_t kLogCategoryCount = 8;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Engine", "Schedule", "Table", "Rewards", "Store", "Database", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name as written in YAML ("info", "DEBUG", ...).
std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Structured context appended to a log line as key=value pairs.
///
/// @code
///   LogContext ctx;
///   ctx.lobbyId = LobbyId(7);
///   ctx.matchId = MatchId(42);
///   ctx.extra["score"] = "3-1";
///   logger.logWithContext(LogLevel::Info, LogCategory::Engine,
///                         "match simulated", ctx);
/// @endcode
struct LogContext {
    std::optional<LobbyId> lobbyId;
    std::optional<MatchId> matchId;
    std::optional<UserId> userId;
    std::optional<std::string> traceId;
    std::unordered_map<std::string, std::string> extra;
};

/// Category-filtered logger over kcenon's GlobalLoggerRegistry.
///
/// Each category resolves a named logger ("fcl.Engine", ...) and falls back
/// to the registry default. PIMPL keeps kcenon headers out of this header.
///
/// Default levels: Engine and Schedule at Debug, everything else at Info.
class LeagueLogger {
public:
    LeagueLogger();
    ~LeagueLogger();

    LeagueLogger(const LeagueLogger&) = delete;
    LeagueLogger& operator=(const LeagueLogger&) = delete;
    LeagueLogger(LeagueLogger&&) noexcept;
    LeagueLogger& operator=(LeagueLogger&&) noexcept;

    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    LeagueResult<void> flush();

    /// Process-wide instance used by the FCL_LOG macros.
    static LeagueLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace fcl::foundation

/// @name FCL_LOG Macros
/// @brief Logging macros with a compile-time floor and a runtime category check.
///
/// Define FCL_MIN_LOG_LEVEL before including this header to compile out
/// calls below the threshold (0=Trace ... 6=Off).
/// @{

#ifndef FCL_MIN_LOG_LEVEL
    #define FCL_MIN_LOG_LEVEL 0
#endif

#define FCL_LOG(level, cat, msg)                                                   \
    do {                                                                           \
        _Pragma("GCC diagnostic push")                                             \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                        \
        if (static_cast<int>(level) >= FCL_MIN_LOG_LEVEL &&                        \
            ::fcl::foundation::LeagueLogger::instance().isEnabled((level), (cat)))  \
        {                                                                          \
            ::fcl::foundation::LeagueLogger::instance().log((level), (cat), (msg)); \
        }                                                                          \
        _Pragma("GCC diagnostic pop")                                              \
    } while (0)

#define FCL_LOG_CTX(level, cat, msg, ctx)                                          \
    do {                                                                           \
        if (static_cast<int>(level) >= FCL_MIN_LOG_LEVEL &&                        \
            ::fcl::foundation::LeagueLogger::instance().isEnabled((level), (cat)))  \
        {                                                                          \
            ::fcl::foundation::LeagueLogger::instance().logWithContext(            \
                (level), (cat), (msg), (ctx));                                     \
        }                                                                          \
    } while (0)

#define FCL_LOG_DEBUG(cat, msg) \
    FCL_LOG(::fcl::foundation::LogLevel::Debug, (cat), (msg))

#define FCL_LOG_INFO(cat, msg) \
    FCL_LOG(::fcl::foundation::LogLevel::Info, (cat), (msg))

#define FCL_LOG_WARN(cat, msg) \
    FCL_LOG(::fcl::foundation::LogLevel::Warning, (cat), (msg))

#define FCL_LOG_ERROR(cat, msg) \
    FCL_LOG(::fcl::foundation::LogLevel::Error, (cat), (msg))

/// @}
