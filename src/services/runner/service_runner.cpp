/// @file service_runner.cpp
/// @brief Implementation of shared service entry-point utilities.

#include "fcl/service/service_runner.hpp"

#include "fcl/foundation/league_logger.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <string>

namespace fcl::service {

using foundation::ErrorCode;
using foundation::LeagueError;
using foundation::LeagueResult;
using foundation::LogCategory;
using foundation::LogLevel;

// -- SignalHandler -----------------------------------------------------------

std::atomic<bool> SignalHandler::shutdownFlag_{false};

void SignalHandler::handler(int /*signal*/) {
    // async-signal-safe: relaxed store on a lock-free atomic.
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

SignalHandler::SignalHandler() {
    shutdownFlag_.store(false, std::memory_order_relaxed);
    std::signal(SIGINT, &SignalHandler::handler);
    std::signal(SIGTERM, &SignalHandler::handler);
}

SignalHandler::~SignalHandler() {
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
}

bool SignalHandler::shutdownRequested() const noexcept {
    return shutdownFlag_.load(std::memory_order_relaxed);
}

// -- Config loading ----------------------------------------------------------

LeagueResult<void> loadConfig(foundation::ConfigManager& config,
                              const std::filesystem::path& flagPath,
                              const std::filesystem::path& defaultPath) {
    std::filesystem::path configPath = flagPath;

    if (configPath.empty()) {
        const char* envPath = std::getenv("FCL_CONFIG_PATH");
        configPath = (envPath != nullptr && *envPath != '\0') ? envPath : defaultPath;
    }

    auto loaded = config.load(configPath);
    if (loaded) {
        FCL_LOG_INFO(LogCategory::Config, "loaded " + configPath.string());
    }
    return loaded;
}

LeagueResult<void> applyLogLevels(const foundation::ConfigManager& config) {
    auto& logger = foundation::LeagueLogger::instance();

    std::array<std::string, foundation::kLogCategoryCount> names;
    for (std::size_t i = 0; i < names.size(); ++i) {
        names[i] = foundation::logCategoryName(static_cast<LogCategory>(i));
        std::transform(names[i].begin(), names[i].end(), names[i].begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    }

    constexpr std::string_view kPrefix = "logging.";
    for (const auto& key : config.keysUnder("logging")) {
        auto name = std::string_view(key).substr(kPrefix.size());
        auto it = std::find(names.begin(), names.end(), name);
        if (it == names.end()) {
            return LeagueResult<void>::err(LeagueError(
                ErrorCode::InvalidArgument, "unknown log category: " + key));
        }
        auto cat = static_cast<LogCategory>(it - names.begin());

        auto value = config.get<std::string>(key);
        if (!value) {
            return LeagueResult<void>::err(value.error());
        }
        auto level = foundation::parseLogLevel(value.value());
        if (!level) {
            return LeagueResult<void>::err(LeagueError(
                ErrorCode::InvalidArgument,
                "unknown log level '" + value.value() + "' for " + key));
        }
        logger.setCategoryLevel(cat, *level);
        FCL_LOG(LogLevel::Debug, LogCategory::Config,
                key + " = " + std::string(foundation::logLevelName(*level)));
    }
    return LeagueResult<void>::ok();
}

LeagueResult<void> applyArgOverrides(foundation::ConfigManager& config,
                                     int argc, char* argv[]) {
    auto seedArg = parsePathArg(argc, argv, "--seed").string();
    if (seedArg.empty()) {
        return LeagueResult<void>::ok();
    }

    uint64_t seed = 0;
    auto [end, ec] = std::from_chars(seedArg.data(), seedArg.data() + seedArg.size(), seed);
    if (ec != std::errc{} || end != seedArg.data() + seedArg.size()) {
        FCL_LOG_WARN(LogCategory::Config, "rejected --seed " + seedArg);
        return LeagueResult<void>::err(LeagueError(
            ErrorCode::InvalidArgument, "--seed expects an unsigned integer, got " + seedArg));
    }
    config.set<uint64_t>("league.rng_seed", seed);
    FCL_LOG_INFO(LogCategory::Config, "league.rng_seed overridden to " + seedArg);
    return LeagueResult<void>::ok();
}

// -- CLI argument parsing ----------------------------------------------------

std::filesystem::path parsePathArg(int argc, char* argv[], std::string_view flag) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == flag) {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    return parsePathArg(argc, argv, "--config");
}

} // namespace fcl::service
