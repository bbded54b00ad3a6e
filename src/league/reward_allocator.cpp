/// @file reward_allocator.cpp
/// @brief RewardAllocator implementation.

#include "fcl/league/reward_allocator.hpp"

#include <algorithm>
#include <chrono>
#include <string>

namespace fcl::league {

using foundation::ErrorCode;
using foundation::LeagueError;
using foundation::LeagueResult;

RewardAllocator::RewardAllocator(RewardSchedule schedule)
    : schedule_(schedule) {}

LeagueResult<std::vector<Reward>> RewardAllocator::allocate(
    LobbyId lobby,
    const std::vector<Match>& matches,
    const std::vector<LeagueTableEntry>& table) const {
    auto played = static_cast<std::size_t>(
        std::count_if(matches.begin(), matches.end(), [&](const Match& m) {
            return m.lobby == lobby && m.played;
        }));
    if (played != kTotalMatches) {
        return LeagueResult<std::vector<Reward>>::err(LeagueError(
            ErrorCode::LeagueIncomplete,
            std::to_string(played) + " of " + std::to_string(kTotalMatches) +
                " matches played"));
    }
    if (table.size() != kLobbyCapacity) {
        return LeagueResult<std::vector<Reward>>::err(LeagueError(
            ErrorCode::InvalidArgument,
            "table has " + std::to_string(table.size()) + " entries"));
    }

    if (!schedule_.isValid()) {
        return LeagueResult<std::vector<Reward>>::err(
            LeagueError(ErrorCode::InvalidArgument, "reward schedule pays a negative amount"));
    }

    auto now = std::chrono::system_clock::now();
    std::vector<Reward> rewards;
    rewards.reserve(table.size());
    for (const auto& entry : table) {
        Reward reward;
        reward.lobby = lobby;
        reward.userId = entry.userId;
        reward.position = entry.rank;
        reward.coins = schedule_.coinsFor(entry.rank);
        reward.issuedAt = now;
        rewards.push_back(reward);
    }
    return LeagueResult<std::vector<Reward>>::ok(std::move(rewards));
}

} // namespace fcl::league
