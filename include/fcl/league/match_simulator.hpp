#pragma once

/// @file match_simulator.hpp
/// @brief Probability-weighted match simulation between two strengths.

#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

#include "fcl/foundation/league_result.hpp"
#include "fcl/league/league_types.hpp"
#include "fcl/league/random_source.hpp"

namespace fcl::league {

/// Per-chance conversion probabilities of both sides.
struct ConversionProbabilities {
    double home = 0.5;
    double away = 0.5;
};

struct SimulationResult {
    int32_t homeScore = 0;
    int32_t awayScore = 0;
    ConversionProbabilities probabilities;

    /// Converted chances, ascending by minute; ties home first, then
    /// in trial order.
    std::vector<MatchEvent> events;

    int32_t homePoints = 0;  ///< League points earned by the home side.
    int32_t awayPoints = 0;
};

/// Simulates a match as independent Bernoulli trials.
///
/// Each side gets chancesPerSide chances. A home chance converts with
/// p = home / (home + away), an away chance with the complement; two
/// zero strengths give 0.5 each. Every goal is stamped with a minute in
/// [1, kMinutesPerMatch].
///
/// Not idempotent: two calls with the same strengths draw different
/// outcomes, so callers must persist a result exactly once.
///
/// Draw order (relevant for scripted sources): home trials first, then
/// away trials; each trial draws nextUnit() and, when it converts,
/// immediately draws its minute with nextInt(1, kMinutesPerMatch).
class MatchSimulator {
public:
    explicit MatchSimulator(std::shared_ptr<RandomSource> random,
                            uint32_t chancesPerSide = kDefaultChancesPerSide);

    /// @return The simulated result, or InvalidArgument for a negative
    ///         strength or a chance count outside [1, kMaxChancesPerSide].
    [[nodiscard]] foundation::LeagueResult<SimulationResult> simulate(
        int64_t strengthHome, int64_t strengthAway) const;

    [[nodiscard]] uint32_t chancesPerSide() const noexcept { return chancesPerSide_; }

    [[nodiscard]] static ConversionProbabilities conversionProbabilities(
        int64_t strengthHome, int64_t strengthAway) noexcept;

    /// League points for a final score: {home, away}.
    [[nodiscard]] static std::pair<int32_t, int32_t> leaguePoints(
        int32_t homeScore, int32_t awayScore) noexcept;

private:
    std::shared_ptr<RandomSource> random_;
    uint32_t chancesPerSide_;
};

} // namespace fcl::league
