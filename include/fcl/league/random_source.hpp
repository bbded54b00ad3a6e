#pragma once

/// @file random_source.hpp
/// @brief Injectable randomness for the match simulator.

#include <cstdint>
#include <mutex>
#include <optional>
#include <random>

namespace fcl::league {

/// Source of the random draws a simulation consumes.
///
/// Production code uses MersenneRandomSource seeded from the OS; tests
/// substitute a scripted source to make outcomes exact.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /// Uniform draw in [0.0, 1.0).
    virtual double nextUnit() = 0;

    /// Uniform integer in [lo, hi] (inclusive).
    virtual uint32_t nextInt(uint32_t lo, uint32_t hi) = 0;
};

/// Thread-safe std::mt19937_64 source.
///
/// Without a seed the engine is seeded from std::random_device.
class MersenneRandomSource final : public RandomSource {
public:
    explicit MersenneRandomSource(std::optional<uint64_t> seed = std::nullopt);

    double nextUnit() override;
    uint32_t nextInt(uint32_t lo, uint32_t hi) override;

private:
    std::mutex mutex_;
    std::mt19937_64 engine_;
};

} // namespace fcl::league
