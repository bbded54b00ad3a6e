/// @file match_simulator.cpp
/// @brief MatchSimulator implementation.

#include "fcl/league/match_simulator.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace fcl::league {

using foundation::ErrorCode;
using foundation::LeagueError;
using foundation::LeagueResult;

MatchSimulator::MatchSimulator(std::shared_ptr<RandomSource> random,
                               uint32_t chancesPerSide)
    : random_(std::move(random)), chancesPerSide_(chancesPerSide) {}

ConversionProbabilities MatchSimulator::conversionProbabilities(
    int64_t strengthHome, int64_t strengthAway) noexcept {
    ConversionProbabilities p;
    auto total = strengthHome + strengthAway;
    if (total <= 0) {
        return p;
    }
    p.home = static_cast<double>(strengthHome) / static_cast<double>(total);
    p.away = static_cast<double>(strengthAway) / static_cast<double>(total);
    return p;
}

std::pair<int32_t, int32_t> MatchSimulator::leaguePoints(
    int32_t homeScore, int32_t awayScore) noexcept {
    if (homeScore > awayScore) {
        return {kPointsForWin, kPointsForLoss};
    }
    if (homeScore < awayScore) {
        return {kPointsForLoss, kPointsForWin};
    }
    return {kPointsForDraw, kPointsForDraw};
}

LeagueResult<SimulationResult> MatchSimulator::simulate(
    int64_t strengthHome, int64_t strengthAway) const {
    if (strengthHome < 0 || strengthAway < 0) {
        return LeagueResult<SimulationResult>::err(LeagueError(
            ErrorCode::InvalidArgument,
            "strengths must be non-negative (home=" + std::to_string(strengthHome) +
                ", away=" + std::to_string(strengthAway) + ")"));
    }
    if (!random_) {
        return LeagueResult<SimulationResult>::err(
            LeagueError(ErrorCode::InvalidArgument, "no random source configured"));
    }
    if (chancesPerSide_ < 1 || chancesPerSide_ > kMaxChancesPerSide) {
        return LeagueResult<SimulationResult>::err(LeagueError(
            ErrorCode::InvalidArgument,
            "chances per side must be in [1, " + std::to_string(kMaxChancesPerSide) +
                "], got " + std::to_string(chancesPerSide_)));
    }

    SimulationResult result;
    result.probabilities = conversionProbabilities(strengthHome, strengthAway);

    auto runTrials = [&](Side side, double p, int32_t& score) {
        for (uint32_t i = 0; i < chancesPerSide_; ++i) {
            if (random_->nextUnit() < p) {
                ++score;
                result.events.push_back(
                    MatchEvent{random_->nextInt(1, kMinutesPerMatch), side});
            }
        }
    };

    runTrials(Side::Home, result.probabilities.home, result.homeScore);
    runTrials(Side::Away, result.probabilities.away, result.awayScore);

    // Events were appended in trial order, home before away.
    std::stable_sort(result.events.begin(), result.events.end(),
                     [](const MatchEvent& a, const MatchEvent& b) {
                         if (a.minute != b.minute) {
                             return a.minute < b.minute;
                         }
                         return a.side == Side::Home && b.side == Side::Away;
                     });

    auto [homePts, awayPts] = leaguePoints(result.homeScore, result.awayScore);
    result.homePoints = homePts;
    result.awayPoints = awayPts;
    return LeagueResult<SimulationResult>::ok(std::move(result));
}

} // namespace fcl::league
