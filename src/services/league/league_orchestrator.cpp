/// @file league_orchestrator.cpp
/// @brief LeagueOrchestrator implementation.

#include "fcl/service/league_orchestrator.hpp"

#include "fcl/foundation/league_logger.hpp"
#include "fcl/foundation/league_metrics.hpp"
#include "fcl/league/league_table.hpp"
#include "fcl/league/match_simulator.hpp"
#include "fcl/league/reward_allocator.hpp"
#include "fcl/league/schedule_generator.hpp"
#include "fcl/league/team_strength.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

namespace fcl::service {

using foundation::ErrorCode;
using foundation::LeagueError;
using foundation::LeagueMetrics;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using namespace fcl::league;

namespace {

constexpr std::string_view kMatchesSimulated = "fcl_matches_simulated_total";
constexpr std::string_view kGoals = "fcl_goals_total";
constexpr std::string_view kLeaguesCreated = "fcl_leagues_created_total";
constexpr std::string_view kRewardsIssued = "fcl_rewards_issued_total";
constexpr std::string_view kCoinsPaid = "fcl_coins_paid_total";
// Lobbies holding a per-lobby lock entry: touched and not yet finished.
constexpr std::string_view kLobbiesActive = "fcl_lobbies_active";

/// Lowest matchday that still has an unplayed match; the last scheduled
/// matchday once everything is played; 0 with no matches.
uint8_t currentMatchdayOf(const std::vector<Match>& matches) {
    uint8_t lowestOpen = 0;
    uint8_t highest = 0;
    for (const auto& m : matches) {
        highest = std::max(highest, m.matchday);
        if (!m.played && (lowestOpen == 0 || m.matchday < lowestOpen)) {
            lowestOpen = m.matchday;
        }
    }
    return lowestOpen != 0 ? lowestOpen : highest;
}

std::size_t countPlayed(const std::vector<Match>& matches) {
    return static_cast<std::size_t>(std::count_if(
        matches.begin(), matches.end(), [](const Match& m) { return m.played; }));
}

bool matchOrder(const Match& a, const Match& b) {
    if (a.matchday != b.matchday) {
        return a.matchday < b.matchday;
    }
    return a.id < b.id;
}

LeagueError matchdayOutOfRange(uint8_t matchday) {
    return LeagueError(ErrorCode::InvalidArgument,
                       "matchday out of range: " + std::to_string(matchday));
}

template <typename T>
LeagueResult<void> readKey(const foundation::ConfigManager& config,
                           std::string_view key, T& out) {
    if (!config.hasKey(key)) {
        return LeagueResult<void>::ok();
    }
    auto value = config.get<T>(key);
    if (!value) {
        return LeagueResult<void>::err(value.error());
    }
    out = value.value();
    return LeagueResult<void>::ok();
}

} // namespace

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------

struct LeagueOrchestrator::Impl {
    std::shared_ptr<LeagueStore> store;
    LeagueConfig config;
    MatchSimulator simulator;
    RewardAllocator allocator;

    std::mutex locksMutex;
    std::unordered_map<LobbyId, std::shared_ptr<std::mutex>> lobbyLocks;

    Impl(std::shared_ptr<LeagueStore> s,
         std::shared_ptr<RandomSource> random,
         LeagueConfig cfg)
        : store(std::move(s)),
          config(std::move(cfg)),
          simulator(std::move(random), config.chancesPerSide),
          allocator(config.rewards) {}

    ~Impl() {
        std::lock_guard lock(locksMutex);
        if (!lobbyLocks.empty()) {
            LeagueMetrics::instance().decrementGauge(
                kLobbiesActive, static_cast<double>(lobbyLocks.size()));
        }
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    std::shared_ptr<std::mutex> lockFor(LobbyId lobby) {
        std::lock_guard lock(locksMutex);
        auto& entry = lobbyLocks[lobby];
        if (!entry) {
            entry = std::make_shared<std::mutex>();
            LeagueMetrics::instance().incrementGauge(kLobbiesActive);
        }
        return entry;
    }

    /// Drop the lock entry of a FINISHED lobby.
    ///
    /// Holders keep the old mutex alive through their shared_ptr. A later
    /// caller gets a fresh mutex, which is harmless once every match is
    /// played: recordResult and issueRewards are compare-and-set.
    void releaseLock(LobbyId lobby) {
        std::lock_guard lock(locksMutex);
        if (lobbyLocks.erase(lobby) > 0) {
            LeagueMetrics::instance().decrementGauge(kLobbiesActive);
        }
    }

    /// The lobby, provided it exists and is full.
    LeagueResult<Lobby> requireFullLobby(LobbyId id) {
        auto lobby = store->getLobby(id);
        if (!lobby) {
            return lobby;
        }
        if (!lobby.value().isFull()) {
            return LeagueResult<Lobby>::err(LeagueError(
                ErrorCode::LobbyNotFull,
                "lobby " + std::to_string(id.value()) + " has " +
                    std::to_string(lobby.value().members.size()) + " of " +
                    std::to_string(kLobbyCapacity) + " members"));
        }
        return lobby;
    }

    /// One team per member for @p matchday, in membership order.
    LeagueResult<std::vector<Team>> teamsForMatchday(const Lobby& lobby, uint8_t matchday) {
        auto all = store->getMatchdayTeams(lobby.id, matchday);
        if (!all) {
            return all;
        }

        std::vector<Team> ordered;
        ordered.reserve(lobby.members.size());
        for (const auto& member : lobby.members) {
            std::vector<const Team*> owned;
            for (const auto& team : all.value()) {
                if (team.owner == member) {
                    owned.push_back(&team);
                }
            }
            if (owned.empty()) {
                return LeagueResult<std::vector<Team>>::err(LeagueError(
                    ErrorCode::TeamsMissing,
                    "user " + std::to_string(member.value()) +
                        " has no team for matchday " + std::to_string(matchday)));
            }
            if (owned.size() > 1) {
                return LeagueResult<std::vector<Team>>::err(LeagueError(
                    ErrorCode::InvalidArgument,
                    "user " + std::to_string(member.value()) +
                        " fields several teams on matchday " + std::to_string(matchday)));
            }
            ordered.push_back(*owned.front());
        }
        return LeagueResult<std::vector<Team>>::ok(std::move(ordered));
    }

    /// Advance the lobby after a match and pay out once all are played.
    ///
    /// Caller holds the lobby lock.
    LeagueResult<bool> settle(LobbyId lobbyId) {
        auto lobby = store->getLobby(lobbyId);
        if (!lobby) {
            return LeagueResult<bool>::err(lobby.error());
        }
        auto matches = store->getLobbyMatches(lobbyId);
        if (!matches) {
            return LeagueResult<bool>::err(matches.error());
        }

        auto table = LeagueTableBuilder::build(matches.value(), lobby.value().members);
        auto played = countPlayed(matches.value());

        LogContext ctx;
        ctx.lobbyId = lobbyId;
        ctx.extra["played"] = std::to_string(played);
        if (!table.empty()) {
            ctx.extra["leader"] = std::to_string(table.front().userId.value());
            ctx.extra["leader_points"] = std::to_string(table.front().points);
        }
        FCL_LOG_CTX(LogLevel::Debug, LogCategory::Table, "table recomputed", ctx);

        if (played < kTotalMatches) {
            auto matchday = currentMatchdayOf(matches.value());
            if (lobby.value().currentMatchday != matchday ||
                lobby.value().status != LobbyStatus::InProgress) {
                auto r = store->setLobbyProgress(lobbyId, LobbyStatus::InProgress, matchday);
                if (!r) {
                    return LeagueResult<bool>::err(r.error());
                }
                FCL_LOG_CTX(LogLevel::Info, LogCategory::Core,
                            "lobby advanced to matchday " + std::to_string(matchday), ctx);
            }
            return LeagueResult<bool>::ok(false);
        }

        auto existing = store->getRewards(lobbyId);
        if (!existing) {
            return LeagueResult<bool>::err(existing.error());
        }
        if (!existing.value().empty()) {
            return LeagueResult<bool>::ok(true);
        }

        auto rewards = allocator.allocate(lobbyId, matches.value(), table);
        if (!rewards) {
            return LeagueResult<bool>::err(rewards.error());
        }

        auto issued = store->issueRewards(lobbyId, rewards.value());
        if (!issued) {
            if (issued.error().code() == ErrorCode::RewardsAlreadyIssued) {
                FCL_LOG_CTX(LogLevel::Debug, LogCategory::Rewards,
                            "rewards already issued", ctx);
                return LeagueResult<bool>::ok(true);
            }
            FCL_LOG_CTX(LogLevel::Error, LogCategory::Rewards,
                        "reward issue failed: " + std::string(issued.error().message()), ctx);
            return LeagueResult<bool>::err(issued.error());
        }

        auto& metrics = LeagueMetrics::instance();
        for (const auto& reward : rewards.value()) {
            metrics.incrementCounter(kRewardsIssued);
            metrics.incrementCounter(kCoinsPaid, static_cast<uint64_t>(reward.coins));

            LogContext rewardCtx;
            rewardCtx.lobbyId = lobbyId;
            rewardCtx.userId = reward.userId;
            rewardCtx.extra["position"] = std::to_string(reward.position);
            rewardCtx.extra["coins"] = std::to_string(reward.coins);
            FCL_LOG_CTX(LogLevel::Info, LogCategory::Rewards, "reward issued", rewardCtx);
        }
        FCL_LOG_CTX(LogLevel::Info, LogCategory::Core, "league finished", ctx);
        return LeagueResult<bool>::ok(true);
    }

    LeagueResult<MatchOutcome> simulate(MatchId id);

    LeagueResult<BatchOutcome> runBatch(LobbyId lobbyId, std::optional<uint8_t> matchday);
};

LeagueResult<MatchOutcome> LeagueOrchestrator::Impl::simulate(MatchId id) {
    auto found = store->getMatch(id);
    if (!found) {
        return LeagueResult<MatchOutcome>::err(found.error());
    }
    auto lobbyId = found.value().lobby;

    auto lobbyLock = lockFor(lobbyId);
    std::lock_guard guard(*lobbyLock);

    // Re-read under the lobby lock; a concurrent caller may have won.
    auto current = store->getMatch(id);
    if (!current) {
        return LeagueResult<MatchOutcome>::err(current.error());
    }
    const auto& match = current.value();
    if (match.played) {
        auto lobby = store->getLobby(lobbyId);
        if (lobby && lobby.value().status == LobbyStatus::Finished) {
            releaseLock(lobbyId);
        }
        return LeagueResult<MatchOutcome>::err(LeagueError(
            ErrorCode::AlreadyPlayed, "match " + std::to_string(id.value()) + " already played"));
    }

    LogContext ctx;
    ctx.lobbyId = lobbyId;
    ctx.matchId = id;

    std::array<TeamStrength, 2> strengths;
    std::array<TeamId, 2> teamIds = {match.homeTeam, match.awayTeam};
    for (std::size_t i = 0; i < teamIds.size(); ++i) {
        auto team = store->getTeam(teamIds[i]);
        if (!team) {
            return LeagueResult<MatchOutcome>::err(team.error());
        }
        auto strength = TeamStrengthCalculator::calculate(team.value());
        if (!strength) {
            FCL_LOG_CTX(LogLevel::Warning, LogCategory::Engine,
                        "team cannot play: " + std::string(strength.error().message()), ctx);
            return LeagueResult<MatchOutcome>::err(strength.error());
        }
        strengths[i] = strength.value();
    }

    auto sim = simulator.simulate(strengths[0].totalStrength, strengths[1].totalStrength);
    if (!sim) {
        return LeagueResult<MatchOutcome>::err(sim.error());
    }

    MatchResultRecord record;
    record.homeScore = sim.value().homeScore;
    record.awayScore = sim.value().awayScore;
    record.events = sim.value().events;
    record.playedAt = std::chrono::system_clock::now();

    auto stored = store->recordResult(id, record);
    if (!stored) {
        return LeagueResult<MatchOutcome>::err(stored.error());
    }

    auto& metrics = LeagueMetrics::instance();
    metrics.incrementCounter(kMatchesSimulated);
    metrics.incrementCounter(kGoals,
        static_cast<uint64_t>(record.homeScore + record.awayScore));

    ctx.extra["score"] = std::to_string(record.homeScore) + "-" + std::to_string(record.awayScore);
    ctx.extra["strengths"] = std::to_string(strengths[0].totalStrength) + "/" +
                             std::to_string(strengths[1].totalStrength);
    FCL_LOG_CTX(LogLevel::Debug, LogCategory::Engine, "match simulated", ctx);

    MatchOutcome outcome;
    outcome.matchId = id;
    outcome.matchday = match.matchday;
    outcome.homeScore = record.homeScore;
    outcome.awayScore = record.awayScore;
    outcome.events = std::move(record.events);
    outcome.probabilities = sim.value().probabilities;
    outcome.homeStrength = strengths[0];
    outcome.awayStrength = strengths[1];

    // The result is stored; a failed settle is retried by the next batch.
    auto settled = settle(lobbyId);
    if (!settled) {
        FCL_LOG_CTX(LogLevel::Error, LogCategory::Core,
                    "settle failed after match: " + std::string(settled.error().message()), ctx);
        return LeagueResult<MatchOutcome>::ok(std::move(outcome));
    }
    outcome.leagueComplete = settled.value();
    if (outcome.leagueComplete) {
        releaseLock(lobbyId);
    }
    return LeagueResult<MatchOutcome>::ok(std::move(outcome));
}

LeagueResult<BatchOutcome> LeagueOrchestrator::Impl::runBatch(
    LobbyId lobbyId, std::optional<uint8_t> matchday) {
    auto lobby = store->getLobby(lobbyId);
    if (!lobby) {
        return LeagueResult<BatchOutcome>::err(lobby.error());
    }
    auto matches = store->getLobbyMatches(lobbyId);
    if (!matches) {
        return LeagueResult<BatchOutcome>::err(matches.error());
    }

    auto pending = std::move(matches).value();
    bool scheduled = std::any_of(pending.begin(), pending.end(), [&](const Match& m) {
        return !matchday || m.matchday == *matchday;
    });
    if (!scheduled) {
        return LeagueResult<BatchOutcome>::err(LeagueError(
            ErrorCode::NotFound,
            matchday ? "matchday " + std::to_string(*matchday) + " is not scheduled"
                     : "lobby " + std::to_string(lobbyId.value()) + " has no league"));
    }

    pending.erase(std::remove_if(pending.begin(), pending.end(), [&](const Match& m) {
                      return m.played || (matchday && m.matchday != *matchday);
                  }),
                  pending.end());
    std::sort(pending.begin(), pending.end(), matchOrder);

    BatchOutcome batch;
    for (const auto& m : pending) {
        auto outcome = simulate(m.id);
        if (!outcome) {
            if (outcome.error().isBenign()) {
                ++batch.skipped;
                continue;
            }
            return LeagueResult<BatchOutcome>::err(outcome.error());
        }
        batch.results.push_back(std::move(outcome).value());
    }

    // Settles a league whose final payout failed on an earlier run.
    auto lobbyLock = lockFor(lobbyId);
    std::lock_guard guard(*lobbyLock);
    auto settled = settle(lobbyId);
    if (!settled) {
        return LeagueResult<BatchOutcome>::err(settled.error());
    }
    batch.leagueComplete = settled.value();
    if (batch.leagueComplete) {
        releaseLock(lobbyId);
    }

    LogContext ctx;
    ctx.lobbyId = lobbyId;
    ctx.extra["simulated"] = std::to_string(batch.results.size());
    ctx.extra["skipped"] = std::to_string(batch.skipped);
    FCL_LOG_CTX(LogLevel::Info, LogCategory::Core, "batch simulation done", ctx);
    return LeagueResult<BatchOutcome>::ok(std::move(batch));
}

// ---------------------------------------------------------------------------
// LeagueOrchestrator
// ---------------------------------------------------------------------------

LeagueOrchestrator::LeagueOrchestrator(std::shared_ptr<LeagueStore> store,
                                       std::shared_ptr<RandomSource> random,
                                       LeagueConfig config)
    : impl_(std::make_unique<Impl>(std::move(store), std::move(random), std::move(config))) {}

LeagueOrchestrator::~LeagueOrchestrator() = default;

LeagueOrchestrator::LeagueOrchestrator(LeagueOrchestrator&&) noexcept = default;
LeagueOrchestrator& LeagueOrchestrator::operator=(LeagueOrchestrator&&) noexcept = default;

LeagueResult<LeagueCreated> LeagueOrchestrator::createLeague(LobbyId lobbyId) {
    auto lobbyLock = impl_->lockFor(lobbyId);
    std::lock_guard guard(*lobbyLock);

    auto lobby = impl_->requireFullLobby(lobbyId);
    if (!lobby) {
        return LeagueResult<LeagueCreated>::err(lobby.error());
    }

    auto existing = impl_->store->getLobbyMatches(lobbyId);
    if (!existing) {
        return LeagueResult<LeagueCreated>::err(existing.error());
    }
    if (!existing.value().empty()) {
        if (lobby.value().status == LobbyStatus::Finished) {
            impl_->releaseLock(lobbyId);
        }
        return LeagueResult<LeagueCreated>::err(LeagueError(
            ErrorCode::AlreadyScheduled,
            "lobby " + std::to_string(lobbyId.value()) + " already has a league"));
    }

    std::vector<Match> schedule;
    schedule.reserve(kTotalMatches);
    for (uint8_t matchday = 1; matchday <= kMatchdays; ++matchday) {
        auto teams = impl_->teamsForMatchday(lobby.value(), matchday);
        if (!teams) {
            return LeagueResult<LeagueCreated>::err(teams.error());
        }
        auto matches = ScheduleGenerator::generateMatchday(
            lobbyId, matchday, teams.value(), existing.value());
        if (!matches) {
            return LeagueResult<LeagueCreated>::err(matches.error());
        }
        for (auto& m : matches.value()) {
            schedule.push_back(std::move(m));
        }
    }

    auto stored = impl_->store->createSchedule(lobbyId, std::move(schedule));
    if (!stored) {
        return LeagueResult<LeagueCreated>::err(stored.error());
    }

    LeagueCreated created;
    created.lobbyId = lobbyId;
    created.totalMatches = stored.value().size();
    for (const auto& m : stored.value()) {
        if (m.matchday >= 1 && m.matchday <= kMatchdays) {
            ++created.perMatchdayCounts[m.matchday - 1];
        }
    }

    LeagueMetrics::instance().incrementCounter(kLeaguesCreated);

    LogContext ctx;
    ctx.lobbyId = lobbyId;
    ctx.extra["matches"] = std::to_string(created.totalMatches);
    FCL_LOG_CTX(LogLevel::Info, LogCategory::Schedule, "league created", ctx);
    return LeagueResult<LeagueCreated>::ok(created);
}

LeagueResult<MatchdayScheduled> LeagueOrchestrator::generateMatchday(
    LobbyId lobbyId, uint8_t matchday) {
    if (matchday < 1 || matchday > kMatchdays) {
        return LeagueResult<MatchdayScheduled>::err(matchdayOutOfRange(matchday));
    }

    auto lobbyLock = impl_->lockFor(lobbyId);
    std::lock_guard guard(*lobbyLock);

    auto lobby = impl_->requireFullLobby(lobbyId);
    if (!lobby) {
        return LeagueResult<MatchdayScheduled>::err(lobby.error());
    }
    auto existing = impl_->store->getLobbyMatches(lobbyId);
    if (!existing) {
        return LeagueResult<MatchdayScheduled>::err(existing.error());
    }
    auto teams = impl_->teamsForMatchday(lobby.value(), matchday);
    if (!teams) {
        return LeagueResult<MatchdayScheduled>::err(teams.error());
    }
    auto matches = ScheduleGenerator::generateMatchday(
        lobbyId, matchday, teams.value(), existing.value());
    if (!matches) {
        if (lobby.value().status == LobbyStatus::Finished) {
            impl_->releaseLock(lobbyId);
        }
        return LeagueResult<MatchdayScheduled>::err(matches.error());
    }

    auto stored = impl_->store->addMatchday(lobbyId, matchday, std::move(matches).value());
    if (!stored) {
        return LeagueResult<MatchdayScheduled>::err(stored.error());
    }

    if (lobby.value().status == LobbyStatus::Waiting) {
        auto all = existing.value();
        all.insert(all.end(), stored.value().begin(), stored.value().end());
        auto r = impl_->store->setLobbyProgress(
            lobbyId, LobbyStatus::InProgress, currentMatchdayOf(all));
        if (!r) {
            return LeagueResult<MatchdayScheduled>::err(r.error());
        }
    }

    LogContext ctx;
    ctx.lobbyId = lobbyId;
    ctx.extra["matchday"] = std::to_string(matchday);
    FCL_LOG_CTX(LogLevel::Debug, LogCategory::Schedule, "matchday scheduled", ctx);

    MatchdayScheduled result;
    result.lobbyId = lobbyId;
    result.matchday = matchday;
    result.matches = std::move(stored).value();
    return LeagueResult<MatchdayScheduled>::ok(std::move(result));
}

LeagueResult<MatchOutcome> LeagueOrchestrator::simulateMatch(MatchId match) {
    return impl_->simulate(match);
}

LeagueResult<BatchOutcome> LeagueOrchestrator::simulateMatchday(
    LobbyId lobby, uint8_t matchday) {
    if (matchday < 1 || matchday > kMatchdays) {
        return LeagueResult<BatchOutcome>::err(matchdayOutOfRange(matchday));
    }
    return impl_->runBatch(lobby, matchday);
}

LeagueResult<BatchOutcome> LeagueOrchestrator::simulateEntireLeague(LobbyId lobby) {
    return impl_->runBatch(lobby, std::nullopt);
}

LeagueResult<LeagueStatus> LeagueOrchestrator::getLeagueStatus(LobbyId lobbyId) {
    auto lobby = impl_->store->getLobby(lobbyId);
    if (!lobby) {
        return LeagueResult<LeagueStatus>::err(lobby.error());
    }
    auto matches = impl_->store->getLobbyMatches(lobbyId);
    if (!matches) {
        return LeagueResult<LeagueStatus>::err(matches.error());
    }
    auto rewards = impl_->store->getRewards(lobbyId);
    if (!rewards) {
        return LeagueResult<LeagueStatus>::err(rewards.error());
    }

    LeagueStatus status;
    status.lobbyId = lobbyId;
    status.lobbyStatus = lobby.value().status;
    status.currentMatchday = lobby.value().currentMatchday;
    status.totalMatches = matches.value().size();
    status.playedMatches = countPlayed(matches.value());

    for (uint8_t i = 0; i < kMatchdays; ++i) {
        status.matchdayProgress[i].matchday = static_cast<uint8_t>(i + 1);
    }
    for (const auto& m : matches.value()) {
        if (m.matchday < 1 || m.matchday > kMatchdays) {
            continue;
        }
        auto& progress = status.matchdayProgress[m.matchday - 1];
        ++progress.totalMatches;
        if (m.played) {
            ++progress.playedMatches;
        }
    }

    status.leagueTable = LeagueTableBuilder::build(matches.value(), lobby.value().members);
    status.leagueComplete = status.playedMatches == kTotalMatches;
    status.rewardsIssued = !rewards.value().empty();
    return LeagueResult<LeagueStatus>::ok(std::move(status));
}

LeagueResult<std::vector<LeagueTableEntry>> LeagueOrchestrator::getLeagueTable(
    LobbyId lobbyId, std::optional<uint8_t> matchday) {
    if (matchday && (*matchday < 1 || *matchday > kMatchdays)) {
        return LeagueResult<std::vector<LeagueTableEntry>>::err(matchdayOutOfRange(*matchday));
    }
    auto lobby = impl_->store->getLobby(lobbyId);
    if (!lobby) {
        return LeagueResult<std::vector<LeagueTableEntry>>::err(lobby.error());
    }
    auto matches = impl_->store->getLobbyMatches(lobbyId);
    if (!matches) {
        return LeagueResult<std::vector<LeagueTableEntry>>::err(matches.error());
    }
    return LeagueResult<std::vector<LeagueTableEntry>>::ok(
        LeagueTableBuilder::build(matches.value(), lobby.value().members, matchday));
}

LeagueResult<std::vector<Match>> LeagueOrchestrator::getLobbyMatches(LobbyId lobby) {
    auto exists = impl_->store->getLobby(lobby);
    if (!exists) {
        return LeagueResult<std::vector<Match>>::err(exists.error());
    }
    auto matches = impl_->store->getLobbyMatches(lobby);
    if (matches) {
        std::sort(matches.value().begin(), matches.value().end(), matchOrder);
    }
    return matches;
}

LeagueResult<Match> LeagueOrchestrator::getMatch(MatchId match) {
    return impl_->store->getMatch(match);
}

LeagueResult<std::vector<Reward>> LeagueOrchestrator::getRewards(LobbyId lobby) {
    auto exists = impl_->store->getLobby(lobby);
    if (!exists) {
        return LeagueResult<std::vector<Reward>>::err(exists.error());
    }
    return impl_->store->getRewards(lobby);
}

const LeagueConfig& LeagueOrchestrator::config() const noexcept {
    return impl_->config;
}

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------

namespace {

LeagueResult<LeagueConfig> readLeagueConfig(const foundation::ConfigManager& config) {
    LeagueConfig cfg;

    uint32_t chances = cfg.chancesPerSide;
    if (auto r = readKey(config, "league.chances_per_side", chances); !r) {
        return LeagueResult<LeagueConfig>::err(r.error());
    }
    if (chances < 1 || chances > kMaxChancesPerSide) {
        return LeagueResult<LeagueConfig>::err(LeagueError(
            ErrorCode::InvalidArgument,
            "league.chances_per_side must be in [1, " + std::to_string(kMaxChancesPerSide) +
                "], got " + std::to_string(chances)));
    }
    cfg.chancesPerSide = chances;

    if (config.hasKey("league.rng_seed")) {
        uint64_t seed = 0;
        if (auto r = readKey(config, "league.rng_seed", seed); !r) {
            return LeagueResult<LeagueConfig>::err(r.error());
        }
        cfg.rngSeed = seed;
    }

    constexpr std::array<std::string_view, kLobbyCapacity> kRewardKeys = {
        "league.rewards.first", "league.rewards.second",
        "league.rewards.third", "league.rewards.fourth"};
    for (std::size_t i = 0; i < kRewardKeys.size(); ++i) {
        if (auto r = readKey(config, kRewardKeys[i], cfg.rewards.coinsByPosition[i]); !r) {
            return LeagueResult<LeagueConfig>::err(r.error());
        }
        if (cfg.rewards.coinsByPosition[i] < 0) {
            return LeagueResult<LeagueConfig>::err(LeagueError(
                ErrorCode::InvalidArgument,
                std::string(kRewardKeys[i]) + " must not be negative"));
        }
    }

    std::string backend = "memory";
    if (auto r = readKey(config, "store.backend", backend); !r) {
        return LeagueResult<LeagueConfig>::err(r.error());
    }
    if (backend == "memory") {
        cfg.storeBackend = StoreBackend::Memory;
    } else if (backend == "sql") {
        cfg.storeBackend = StoreBackend::Sql;
    } else {
        return LeagueResult<LeagueConfig>::err(LeagueError(
            ErrorCode::InvalidArgument, "unknown store.backend: " + backend));
    }

    std::string dbType = "sqlite";
    if (auto r = readKey(config, "store.database_type", dbType); !r) {
        return LeagueResult<LeagueConfig>::err(r.error());
    }
    if (dbType == "sqlite") {
        cfg.databaseType = foundation::DatabaseType::SQLite;
    } else if (dbType == "postgres") {
        cfg.databaseType = foundation::DatabaseType::PostgreSQL;
    } else if (dbType == "mysql") {
        cfg.databaseType = foundation::DatabaseType::MySQL;
    } else {
        return LeagueResult<LeagueConfig>::err(LeagueError(
            ErrorCode::InvalidArgument, "unknown store.database_type: " + dbType));
    }

    if (auto r = readKey(config, "store.connection_string", cfg.connectionString); !r) {
        return LeagueResult<LeagueConfig>::err(r.error());
    }
    if (auto r = readKey(config, "store.schema_path", cfg.schemaPath); !r) {
        return LeagueResult<LeagueConfig>::err(r.error());
    }

    return LeagueResult<LeagueConfig>::ok(std::move(cfg));
}

} // namespace

LeagueResult<LeagueConfig> leagueConfigFrom(const foundation::ConfigManager& config) {
    auto cfg = readLeagueConfig(config);
    if (!cfg) {
        FCL_LOG_WARN(LogCategory::Config,
                     "league config rejected: " + std::string(cfg.error().message()));
    }
    return cfg;
}

} // namespace fcl::service
