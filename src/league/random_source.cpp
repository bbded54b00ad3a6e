/// @file random_source.cpp
/// @brief MersenneRandomSource implementation.

#include "fcl/league/random_source.hpp"

namespace fcl::league {

MersenneRandomSource::MersenneRandomSource(std::optional<uint64_t> seed)
    : engine_(seed ? *seed : std::random_device{}()) {}

double MersenneRandomSource::nextUnit() {
    std::lock_guard lock(mutex_);
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(engine_);
}

uint32_t MersenneRandomSource::nextInt(uint32_t lo, uint32_t hi) {
    std::lock_guard lock(mutex_);
    std::uniform_int_distribution<uint32_t> dist(lo, hi);
    return dist(engine_);
}

} // namespace fcl::league
