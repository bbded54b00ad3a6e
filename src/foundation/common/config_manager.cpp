#include "fcl/foundation/config_manager.hpp"

#include "fcl/foundation/league_logger.hpp"

#include <algorithm>

namespace fcl::foundation {

namespace {

using FlatConfig = std::unordered_map<std::string, YAML::Node>;

// Throws YAML::BadConversion for a map key that is not a scalar.
void flatten(const std::string& prefix, const YAML::Node& node, FlatConfig& out) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second, out);
        }
    } else if (!prefix.empty()) {
        // Scalars, sequences and nulls are leaves.
        out[prefix] = YAML::Clone(node);
    }
}

LeagueResult<void> loadFailed(std::string message) {
    FCL_LOG_ERROR(LogCategory::Config, message);
    return LeagueResult<void>::err(LeagueError(ErrorCode::ConfigLoadFailed, std::move(message)));
}

}  // anonymous namespace

LeagueResult<void> ConfigManager::load(const std::filesystem::path& path) {
    FlatConfig flat;
    try {
        flatten("", YAML::LoadFile(path.string()), flat);
    } catch (const YAML::BadFile&) {
        return loadFailed("failed to open config file: " + path.string());
    } catch (const YAML::Exception& e) {
        return loadFailed(path.string() + ": " + e.what());
    }

    std::lock_guard lock(mutex_);
    entries_ = std::move(flat);
    return LeagueResult<void>::ok();
}

LeagueResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    FlatConfig flat;
    try {
        flatten("", YAML::Load(std::string(yaml)), flat);
    } catch (const YAML::Exception& e) {
        return loadFailed(std::string("YAML error: ") + e.what());
    }

    std::lock_guard lock(mutex_);
    entries_ = std::move(flat);
    return LeagueResult<void>::ok();
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

std::vector<std::string> ConfigManager::keysUnder(std::string_view prefix) const {
    std::lock_guard lock(mutex_);
    std::string dotted = std::string(prefix) + ".";
    std::vector<std::string> keys;
    for (const auto& [key, node] : entries_) {
        if (key.compare(0, dotted.size(), dotted) == 0) {
            keys.push_back(key);
        }
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

}  // namespace fcl::foundation
