#pragma once

/// @file reward_allocator.hpp
/// @brief End-of-league coin payouts by final position.

#include <array>
#include <cstdint>
#include <vector>

#include "fcl/foundation/league_result.hpp"
#include "fcl/league/league_types.hpp"

namespace fcl::league {

/// Coins paid per final position (index 0 = 1st place).
struct RewardSchedule {
    std::array<int64_t, kLobbyCapacity> coinsByPosition{250, 200, 150, 100};

    [[nodiscard]] int64_t coinsFor(uint32_t position) const noexcept {
        if (position < 1 || position > coinsByPosition.size()) {
            return 0;
        }
        return coinsByPosition[position - 1];
    }

    /// No position pays a negative amount.
    [[nodiscard]] bool isValid() const noexcept {
        for (auto c : coinsByPosition) {
            if (c < 0) {
                return false;
            }
        }
        return true;
    }

    [[nodiscard]] int64_t total() const noexcept {
        int64_t sum = 0;
        for (auto c : coinsByPosition) {
            sum += c;
        }
        return sum;
    }
};

/// Computes the rewards of a completed league.
///
/// Pure: the allocator only decides who gets what. Crediting balances
/// exactly once is the job of the store's atomic issue step.
class RewardAllocator {
public:
    explicit RewardAllocator(RewardSchedule schedule = {});

    /// One reward per table entry, paid by rank.
    ///
    /// @return LeagueIncomplete unless all kTotalMatches matches of
    ///         @p lobby are played; InvalidArgument unless the table holds
    ///         exactly kLobbyCapacity entries or the schedule pays a
    ///         negative amount.
    [[nodiscard]] foundation::LeagueResult<std::vector<Reward>> allocate(
        LobbyId lobby,
        const std::vector<Match>& matches,
        const std::vector<LeagueTableEntry>& table) const;

    [[nodiscard]] const RewardSchedule& schedule() const noexcept { return schedule_; }

private:
    RewardSchedule schedule_;
};

} // namespace fcl::league
