/// @file league_metrics.cpp
/// @brief In-memory implementation of LeagueMetrics.

#include "fcl/foundation/league_metrics.hpp"

#include <atomic>
#include <cmath>
#include <map>
#include <mutex>
#include <sstream>
#include <unordered_map>

namespace fcl::foundation {

namespace {

// Atomic double add via CAS loop.
void atomicAdd(std::atomic<double>& target, double delta) {
    double current = target.load(std::memory_order_relaxed);
    while (!target.compare_exchange_weak(
        current, current + delta, std::memory_order_release, std::memory_order_relaxed)) {
    }
}

std::string formatDouble(double value) {
    if (std::isinf(value)) {
        return value > 0 ? "+Inf" : "-Inf";
    }
    if (std::isnan(value)) {
        return "NaN";
    }
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

}  // anonymous namespace

struct LeagueMetrics::Impl {
    mutable std::mutex counterMutex;
    std::unordered_map<std::string, std::atomic<uint64_t>> counters;

    mutable std::mutex gaugeMutex;
    std::unordered_map<std::string, std::atomic<double>> gauges;
};

LeagueMetrics::LeagueMetrics() : impl_(std::make_unique<Impl>()) {}

LeagueMetrics::~LeagueMetrics() = default;

LeagueMetrics::LeagueMetrics(LeagueMetrics&&) noexcept = default;

LeagueMetrics& LeagueMetrics::operator=(LeagueMetrics&&) noexcept = default;

void LeagueMetrics::incrementCounter(std::string_view name, uint64_t value) {
    std::lock_guard lock(impl_->counterMutex);
    impl_->counters[std::string(name)].fetch_add(value, std::memory_order_relaxed);
}

uint64_t LeagueMetrics::counterValue(std::string_view name) const {
    std::lock_guard lock(impl_->counterMutex);
    auto it = impl_->counters.find(std::string(name));
    if (it == impl_->counters.end()) {
        return 0;
    }
    return it->second.load(std::memory_order_relaxed);
}

void LeagueMetrics::incrementGauge(std::string_view name, double delta) {
    std::lock_guard lock(impl_->gaugeMutex);
    atomicAdd(impl_->gauges[std::string(name)], delta);
}

void LeagueMetrics::decrementGauge(std::string_view name, double delta) {
    incrementGauge(name, -delta);
}

double LeagueMetrics::gaugeValue(std::string_view name) const {
    std::lock_guard lock(impl_->gaugeMutex);
    auto it = impl_->gauges.find(std::string(name));
    if (it == impl_->gauges.end()) {
        return 0.0;
    }
    return it->second.load(std::memory_order_acquire);
}

std::string LeagueMetrics::scrape() const {
    std::ostringstream out;

    std::map<std::string, uint64_t> counters;
    {
        std::lock_guard lock(impl_->counterMutex);
        for (const auto& [name, value] : impl_->counters) {
            counters.emplace(name, value.load(std::memory_order_relaxed));
        }
    }
    for (const auto& [name, value] : counters) {
        out << "# TYPE " << name << " counter\n";
        out << name << ' ' << value << '\n';
    }

    std::map<std::string, double> gauges;
    {
        std::lock_guard lock(impl_->gaugeMutex);
        for (const auto& [name, value] : impl_->gauges) {
            gauges.emplace(name, value.load(std::memory_order_acquire));
        }
    }
    for (const auto& [name, value] : gauges) {
        out << "# TYPE " << name << " gauge\n";
        out << name << ' ' << formatDouble(value) << '\n';
    }

    return out.str();
}

void LeagueMetrics::reset() {
    {
        std::lock_guard lock(impl_->counterMutex);
        impl_->counters.clear();
    }
    std::lock_guard lock(impl_->gaugeMutex);
    impl_->gauges.clear();
}

LeagueMetrics& LeagueMetrics::instance() {
    static LeagueMetrics inst;
    return inst;
}

} // namespace fcl::foundation
