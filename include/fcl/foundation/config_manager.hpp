#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration with typed dotted-key access.

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "fcl/foundation/league_result.hpp"

namespace fcl::foundation {

/// YAML configuration flattened into dotted keys ("league.rewards.first").
///
/// The tree is flattened on load so lookups never walk yaml-cpp nodes that
/// share references with the parsed document.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    ///
    /// A file that fails to open, parse or flatten (a non-scalar map key)
    /// leaves the current entries untouched.
    /// @return Success or ConfigLoadFailed error.
    LeagueResult<void> load(const std::filesystem::path& path);

    /// Load configuration from an in-memory YAML document.
    LeagueResult<void> loadFromString(std::string_view yaml);

    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch error.
    template <typename T>
    LeagueResult<T> get(std::string_view key) const;

    /// Value for @p key, or @p fallback if missing or of the wrong type.
    template <typename T>
    T getOr(std::string_view key, T fallback) const;

    /// Set or replace a single value, e.g. a command-line override.
    template <typename T>
    void set(std::string_view key, const T& value);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// All keys below @p prefix (e.g. "logging" -> "logging.engine", ...).
    [[nodiscard]] std::vector<std::string> keysUnder(std::string_view prefix) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
};

// --- Template implementations ---

template <typename T>
LeagueResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return LeagueResult<T>::err(
            LeagueError(ErrorCode::ConfigKeyNotFound,
                        std::string("config key not found: ") + std::string(key)));
    }
    try {
        return LeagueResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return LeagueResult<T>::err(
            LeagueError(ErrorCode::ConfigTypeMismatch,
                        std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
T ConfigManager::getOr(std::string_view key, T fallback) const {
    auto result = get<T>(key);
    return result ? std::move(result).value() : std::move(fallback);
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    std::lock_guard lock(mutex_);
    entries_[std::string(key)] = YAML::Node(value);
}

} // namespace fcl::foundation
