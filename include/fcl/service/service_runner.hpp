#pragma once

/// @file service_runner.hpp
/// @brief Shared utilities for the league service entry point.
///
/// Provides signal handling, configuration loading, logging setup and
/// CLI argument parsing.

#include <atomic>
#include <filesystem>
#include <string_view>

#include "fcl/foundation/config_manager.hpp"
#include "fcl/foundation/league_result.hpp"

namespace fcl::service {

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one SignalHandler instance should exist per process.
/// The handler writes to a static atomic flag in an async-signal-safe
/// manner (relaxed store on a lock-free atomic).
///
/// On destruction the default handlers are restored so that a second
/// signal terminates the process immediately.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    /// Returns true after SIGINT or SIGTERM is received.
    [[nodiscard]] bool shutdownRequested() const noexcept;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

/// Load a YAML configuration file into the provided ConfigManager.
///
/// The config file path is resolved in order:
///   1. @p flagPath, when non-empty (from `--config`)
///   2. FCL_CONFIG_PATH environment variable (if set and non-empty)
///   3. @p defaultPath
///
/// @return Success or ConfigLoadFailed error.
[[nodiscard]] foundation::LeagueResult<void>
loadConfig(foundation::ConfigManager& config,
           const std::filesystem::path& flagPath,
           const std::filesystem::path& defaultPath);

/// Apply `logging.<category>` levels ("logging.engine: warning").
///
/// @return InvalidArgument naming the first unknown category or level;
///         keys before it are already applied.
[[nodiscard]] foundation::LeagueResult<void>
applyLogLevels(const foundation::ConfigManager& config);

/// Apply command-line overrides on top of the loaded file.
///
/// `--seed <n>` sets `league.rng_seed`.
/// @return InvalidArgument if a value does not parse.
[[nodiscard]] foundation::LeagueResult<void>
applyArgOverrides(foundation::ConfigManager& config, int argc, char* argv[]);

/// Parse `<flag> <path>` from command-line arguments.
///
/// @return The path, or an empty path if the flag is absent.
[[nodiscard]] std::filesystem::path
parsePathArg(int argc, char* argv[], std::string_view flag);

/// Parse `--config <path>` from command-line arguments.
[[nodiscard]] std::filesystem::path
parseConfigArg(int argc, char* argv[]);

} // namespace fcl::service
