#pragma once

/// @file league_metrics.hpp
/// @brief In-process counters and gauges with Prometheus text export.

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace fcl::foundation {

/// Counters and gauges for league activity.
///
/// Thread-safe; values live in memory and are exported with scrape().
///
/// @code
///   auto& metrics = LeagueMetrics::instance();
///   metrics.incrementCounter("fcl_matches_simulated_total");
///   metrics.incrementGauge("fcl_lobbies_active");
///   std::string text = metrics.scrape();
/// @endcode
class LeagueMetrics {
public:
    LeagueMetrics();
    ~LeagueMetrics();

    LeagueMetrics(const LeagueMetrics&) = delete;
    LeagueMetrics& operator=(const LeagueMetrics&) = delete;
    LeagueMetrics(LeagueMetrics&&) noexcept;
    LeagueMetrics& operator=(LeagueMetrics&&) noexcept;

    /// Creates the counter on first use.
    void incrementCounter(std::string_view name, uint64_t value = 1);

    /// 0 if the counter does not exist.
    [[nodiscard]] uint64_t counterValue(std::string_view name) const;

    /// Creates the gauge at 0.0 on first use.
    void incrementGauge(std::string_view name, double delta = 1.0);
    void decrementGauge(std::string_view name, double delta = 1.0);

    /// 0.0 if the gauge does not exist.
    [[nodiscard]] double gaugeValue(std::string_view name) const;

    /// Prometheus text exposition format, metrics sorted by name.
    [[nodiscard]] std::string scrape() const;

    /// Clear all metrics. Intended for tests.
    void reset();

    static LeagueMetrics& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace fcl::foundation
