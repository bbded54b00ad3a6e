/// @file league_table_test.cpp
/// @brief Unit tests for LeagueTableBuilder.

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "fcl/league/league_table.hpp"
#include "league_test_support.hpp"

using namespace fcl::league;
using fcl::foundation::UserId;
using fcl::test::playedMatch;

namespace {

const std::vector<UserId> kMembers{UserId(1), UserId(2), UserId(3), UserId(4)};

std::vector<uint64_t> order(const std::vector<LeagueTableEntry>& table) {
    std::vector<uint64_t> ids;
    for (const auto& e : table) {
        ids.push_back(e.userId.value());
    }
    return ids;
}

const LeagueTableEntry& entryFor(const std::vector<LeagueTableEntry>& table, uint64_t user) {
    for (const auto& e : table) {
        if (e.userId == UserId(user)) {
            return e;
        }
    }
    throw std::logic_error("user missing from table");
}

} // namespace

TEST(LeagueTableTest, EmptyLeagueListsMembersByUserId) {
    std::vector<UserId> members{UserId(4), UserId(2), UserId(3), UserId(1)};
    auto table = LeagueTableBuilder::build({}, members);

    EXPECT_EQ(order(table), (std::vector<uint64_t>{1, 2, 3, 4}));
    for (std::size_t i = 0; i < table.size(); ++i) {
        EXPECT_EQ(table[i].rank, i + 1);
        EXPECT_EQ(table[i].points, 0);
        EXPECT_EQ(table[i].matchesPlayed, 0);
    }
}

TEST(LeagueTableTest, WinsDrawsAndLosses) {
    std::vector<Match> matches{playedMatch(1, 1, 2, 2, 0), playedMatch(1, 3, 4, 1, 1)};
    auto table = LeagueTableBuilder::build(matches, kMembers);

    // 3 and 4 are level on every stat; user id decides.
    EXPECT_EQ(order(table), (std::vector<uint64_t>{1, 3, 4, 2}));

    const auto& winner = entryFor(table, 1);
    EXPECT_EQ(winner.points, 3);
    EXPECT_EQ(winner.wins, 1);
    EXPECT_EQ(winner.goalsFor, 2);
    EXPECT_EQ(winner.goalDifference, 2);

    const auto& loser = entryFor(table, 2);
    EXPECT_EQ(loser.losses, 1);
    EXPECT_EQ(loser.goalsAgainst, 2);
    EXPECT_EQ(loser.goalDifference, -2);

    EXPECT_EQ(entryFor(table, 3).draws, 1);
    EXPECT_EQ(entryFor(table, 4).points, 1);
}

TEST(LeagueTableTest, GoalDifferenceBreaksPointsTie) {
    std::vector<Match> matches{playedMatch(1, 1, 2, 3, 0), playedMatch(1, 4, 3, 0, 1)};
    auto table = LeagueTableBuilder::build(matches, kMembers);
    EXPECT_EQ(order(table), (std::vector<uint64_t>{1, 3, 4, 2}));
}

TEST(LeagueTableTest, GoalsForBreaksGoalDifferenceTie) {
    std::vector<Match> matches{playedMatch(1, 3, 4, 1, 0), playedMatch(1, 1, 2, 3, 2)};
    auto table = LeagueTableBuilder::build(matches, kMembers);
    // 1 and 3 both +1; 2 and 4 both -1.
    EXPECT_EQ(order(table), (std::vector<uint64_t>{1, 3, 2, 4}));
}

TEST(LeagueTableTest, UnplayedAndForeignMatchesIgnored) {
    auto unplayed = playedMatch(1, 1, 2, 5, 0);
    unplayed.played = false;
    std::vector<Match> matches{unplayed, playedMatch(1, 9, 2, 0, 4)};

    auto table = LeagueTableBuilder::build(matches, kMembers);
    ASSERT_EQ(table.size(), 4u);
    EXPECT_EQ(entryFor(table, 1).matchesPlayed, 0);
    // The member side of a match against an outsider still counts.
    EXPECT_EQ(entryFor(table, 2).points, 3);
    EXPECT_EQ(entryFor(table, 2).matchesPlayed, 1);
}

TEST(LeagueTableTest, DuplicateMembersAppearOnce) {
    auto table = LeagueTableBuilder::build(
        {}, {UserId(1), UserId(2), UserId(2), UserId(3), UserId(4)});
    EXPECT_EQ(table.size(), 4u);
}

TEST(LeagueTableTest, RebuildIsIdempotent) {
    std::vector<Match> matches{playedMatch(1, 1, 2, 2, 2), playedMatch(1, 3, 4, 0, 3),
                               playedMatch(2, 2, 4, 1, 0)};
    EXPECT_EQ(LeagueTableBuilder::build(matches, kMembers),
              LeagueTableBuilder::build(matches, kMembers));
}

TEST(LeagueTableTest, TotalPointsMatchResults) {
    // Two decisive results, one draw.
    std::vector<Match> matches{playedMatch(1, 1, 2, 2, 1), playedMatch(1, 3, 4, 0, 3),
                               playedMatch(1, 1, 3, 1, 1)};
    auto table = LeagueTableBuilder::build(matches, kMembers);
    EXPECT_EQ(LeagueTableBuilder::totalPoints(table), 2 * 3 + 2);

    int32_t goalsFor = 0;
    int32_t goalsAgainst = 0;
    for (const auto& e : table) {
        goalsFor += e.goalsFor;
        goalsAgainst += e.goalsAgainst;
        EXPECT_EQ(e.points, 3 * e.wins + e.draws);
        EXPECT_EQ(e.matchesPlayed, e.wins + e.draws + e.losses);
    }
    EXPECT_EQ(goalsFor, goalsAgainst);
}

TEST(LeagueTableTest, MatchdayFilterAndPerMatchdaySums) {
    std::vector<Match> matches{playedMatch(1, 1, 2, 2, 0), playedMatch(1, 3, 4, 1, 1),
                               playedMatch(2, 2, 3, 3, 1), playedMatch(2, 1, 4, 0, 0),
                               playedMatch(3, 4, 2, 2, 1)};

    auto day2 = LeagueTableBuilder::build(matches, kMembers, 2);
    EXPECT_EQ(entryFor(day2, 1).matchesPlayed, 1);
    EXPECT_EQ(entryFor(day2, 2).points, 3);
    EXPECT_EQ(entryFor(day2, 3).points, 0);

    auto overall = LeagueTableBuilder::build(matches, kMembers);
    for (uint64_t user = 1; user <= 4; ++user) {
        int32_t points = 0;
        int32_t goals = 0;
        for (uint8_t md = 1; md <= kMatchdays; ++md) {
            auto daily = LeagueTableBuilder::build(matches, kMembers, md);
            points += entryFor(daily, user).points;
            goals += entryFor(daily, user).goalsFor;
        }
        EXPECT_EQ(points, entryFor(overall, user).points);
        EXPECT_EQ(goals, entryFor(overall, user).goalsFor);
    }
}

TEST(LeagueTableTest, RanksAboveIsStrict) {
    LeagueTableEntry a;
    a.userId = UserId(1);
    LeagueTableEntry b = a;
    EXPECT_FALSE(LeagueTableBuilder::ranksAbove(a, b));

    b.userId = UserId(2);
    EXPECT_TRUE(LeagueTableBuilder::ranksAbove(a, b));
    EXPECT_FALSE(LeagueTableBuilder::ranksAbove(b, a));
}
