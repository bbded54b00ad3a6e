/// @file schedule_generator_test.cpp
/// @brief Unit tests for ScheduleGenerator.

#include <gtest/gtest.h>

#include <set>
#include <utility>
#include <vector>

#include "fcl/league/schedule_generator.hpp"
#include "league_test_support.hpp"

using namespace fcl::league;
using fcl::foundation::ErrorCode;
using fcl::foundation::LobbyId;
using fcl::foundation::TeamId;
using fcl::foundation::UserId;
using fcl::test::makeValidTeam;

namespace {

std::vector<Team> matchdayTeams(LobbyId lobby, uint8_t matchday) {
    std::vector<Team> teams;
    for (uint64_t user = 1; user <= 4; ++user) {
        teams.push_back(makeValidTeam(TeamId(matchday * 100 + user), UserId(user),
                                      lobby, matchday));
    }
    return teams;
}

} // namespace

TEST(ScheduleGeneratorTest, PairingsInLexicographicInputOrder) {
    std::vector<TeamId> teams{TeamId(11), TeamId(7), TeamId(30), TeamId(2)};
    auto result = ScheduleGenerator::pairings(teams);
    ASSERT_TRUE(result.hasValue());

    std::vector<Fixture> expected{
        {TeamId(11), TeamId(7)},  {TeamId(11), TeamId(30)}, {TeamId(11), TeamId(2)},
        {TeamId(7), TeamId(30)},  {TeamId(7), TeamId(2)},   {TeamId(30), TeamId(2)}};
    EXPECT_EQ(result.value(), expected);
}

TEST(ScheduleGeneratorTest, EveryTeamPlaysEveryOtherExactlyOnce) {
    std::vector<TeamId> teams{TeamId(1), TeamId(2), TeamId(3), TeamId(4)};
    auto result = ScheduleGenerator::pairings(teams);
    ASSERT_TRUE(result.hasValue());
    ASSERT_EQ(result.value().size(), kMatchesPerMatchday);

    std::set<std::pair<uint64_t, uint64_t>> seen;
    for (const auto& f : result.value()) {
        EXPECT_NE(f.home, f.away);
        auto key = std::minmax(f.home.value(), f.away.value());
        EXPECT_TRUE(seen.insert(key).second);
    }
    EXPECT_EQ(seen.size(), 6u);
}

TEST(ScheduleGeneratorTest, WrongTeamCountRejected) {
    auto three = ScheduleGenerator::pairings({TeamId(1), TeamId(2), TeamId(3)});
    ASSERT_TRUE(three.hasError());
    EXPECT_EQ(three.error().code(), ErrorCode::InvalidArgument);

    auto five = ScheduleGenerator::pairings(
        {TeamId(1), TeamId(2), TeamId(3), TeamId(4), TeamId(5)});
    ASSERT_TRUE(five.hasError());
    EXPECT_EQ(five.error().code(), ErrorCode::InvalidArgument);
}

TEST(ScheduleGeneratorTest, DuplicateOrInvalidTeamRejected) {
    auto dup = ScheduleGenerator::pairings({TeamId(1), TeamId(2), TeamId(2), TeamId(4)});
    ASSERT_TRUE(dup.hasError());
    EXPECT_EQ(dup.error().code(), ErrorCode::InvalidArgument);

    auto invalid = ScheduleGenerator::pairings({TeamId(1), TeamId(2), TeamId(), TeamId(4)});
    ASSERT_TRUE(invalid.hasError());
    EXPECT_EQ(invalid.error().code(), ErrorCode::InvalidArgument);
}

TEST(ScheduleGeneratorTest, GenerateMatchdayMaterializesUnplayedMatches) {
    LobbyId lobby(9);
    auto teams = matchdayTeams(lobby, 2);

    auto result = ScheduleGenerator::generateMatchday(lobby, 2, teams, {});
    ASSERT_TRUE(result.hasValue());
    const auto& matches = result.value();
    ASSERT_EQ(matches.size(), kMatchesPerMatchday);

    EXPECT_EQ(matches[0].homeTeam, TeamId(201));
    EXPECT_EQ(matches[0].awayTeam, TeamId(202));
    EXPECT_EQ(matches[5].homeTeam, TeamId(203));
    EXPECT_EQ(matches[5].awayTeam, TeamId(204));

    for (const auto& m : matches) {
        EXPECT_FALSE(m.id.isValid());
        EXPECT_EQ(m.lobby, lobby);
        EXPECT_EQ(m.matchday, 2);
        EXPECT_FALSE(m.played);
        EXPECT_EQ(m.homeScore, 0);
        EXPECT_EQ(m.awayScore, 0);
        EXPECT_EQ(m.homeUser.value(), m.homeTeam.value() - 200);
        EXPECT_EQ(m.awayUser.value(), m.awayTeam.value() - 200);
    }
}

TEST(ScheduleGeneratorTest, ExistingMatchdayIsNotRescheduled) {
    LobbyId lobby(9);
    auto first = ScheduleGenerator::generateMatchday(lobby, 1, matchdayTeams(lobby, 1), {});
    ASSERT_TRUE(first.hasValue());

    auto again = ScheduleGenerator::generateMatchday(lobby, 1, matchdayTeams(lobby, 1),
                                                     first.value());
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::ScheduleAlreadyExists);

    // Another matchday of the same lobby is still free.
    auto second = ScheduleGenerator::generateMatchday(lobby, 2, matchdayTeams(lobby, 2),
                                                      first.value());
    EXPECT_TRUE(second.hasValue());
}

TEST(ScheduleGeneratorTest, MatchdayOutOfRangeRejected) {
    LobbyId lobby(9);
    auto zero = ScheduleGenerator::generateMatchday(lobby, 0, matchdayTeams(lobby, 1), {});
    ASSERT_TRUE(zero.hasError());
    EXPECT_EQ(zero.error().code(), ErrorCode::InvalidArgument);

    auto four = ScheduleGenerator::generateMatchday(lobby, 4, matchdayTeams(lobby, 1), {});
    ASSERT_TRUE(four.hasError());
    EXPECT_EQ(four.error().code(), ErrorCode::InvalidArgument);
}

TEST(ScheduleGeneratorTest, ForeignTeamRejected) {
    LobbyId lobby(9);
    auto teams = matchdayTeams(lobby, 1);
    teams[3].matchday = 2;

    auto result = ScheduleGenerator::generateMatchday(lobby, 1, teams, {});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}
