/// @file chemistry_evaluator_test.cpp
/// @brief Unit tests for ChemistryEvaluator and TeamStrengthCalculator.

#include <gtest/gtest.h>

#include <utility>
#include <vector>

#include "fcl/league/chemistry_evaluator.hpp"
#include "fcl/league/team_strength.hpp"
#include "league_test_support.hpp"

using namespace fcl::league;
using fcl::foundation::ErrorCode;
using fcl::foundation::LobbyId;
using fcl::foundation::TeamId;
using fcl::foundation::UserId;
using fcl::test::makeTeam;
using fcl::test::makeValidTeam;

namespace {

std::vector<PlayerColor> layout(std::initializer_list<std::pair<PlayerColor, std::size_t>> groups) {
    std::vector<PlayerColor> colors;
    for (const auto& [color, count] : groups) {
        colors.insert(colors.end(), count, color);
    }
    return colors;
}

} // namespace

// ============================================================================
// ChemistryEvaluator
// ============================================================================

TEST(ChemistryEvaluatorTest, FiveThreeThree) {
    auto report = ChemistryEvaluator::evaluate(layout(
        {{PlayerColor::Red, 5}, {PlayerColor::Yellow, 3}, {PlayerColor::Purple, 3}}));
    EXPECT_EQ(report.bonus, 43u);

    ASSERT_EQ(report.breakdown.size(), 3u);
    EXPECT_EQ(report.breakdown[0], (ColorGroup{PlayerColor::Red, 5, 25}));
    // Equal bonuses keep color order.
    EXPECT_EQ(report.breakdown[1], (ColorGroup{PlayerColor::Yellow, 3, 9}));
    EXPECT_EQ(report.breakdown[2], (ColorGroup{PlayerColor::Purple, 3, 9}));
}

TEST(ChemistryEvaluatorTest, FourFourThree) {
    auto report = ChemistryEvaluator::evaluate(layout(
        {{PlayerColor::DarkBlue, 4}, {PlayerColor::Orange, 4}, {PlayerColor::LightGreen, 3}}));
    EXPECT_EQ(report.bonus, 41u);
}

TEST(ChemistryEvaluatorTest, TwoThreeSixIsValid) {
    auto colors = layout(
        {{PlayerColor::Red, 2}, {PlayerColor::Yellow, 3}, {PlayerColor::DarkGreen, 6}});
    EXPECT_EQ(ChemistryEvaluator::evaluate(colors).bonus, 4u + 9u + 36u);
    EXPECT_TRUE(ChemistryEvaluator::isValid(colors));
}

TEST(ChemistryEvaluatorTest, SingletonsContributeNothing) {
    auto colors = layout(
        {{PlayerColor::Red, 9}, {PlayerColor::Yellow, 1}, {PlayerColor::Purple, 1}});
    auto report = ChemistryEvaluator::evaluate(colors);
    EXPECT_EQ(report.bonus, 81u);
    ASSERT_EQ(report.breakdown.size(), 1u);
    EXPECT_EQ(report.breakdown[0].color, PlayerColor::Red);
}

TEST(ChemistryEvaluatorTest, EmptyLayoutHasNoBonus) {
    auto report = ChemistryEvaluator::evaluate(std::vector<PlayerColor>{});
    EXPECT_EQ(report.bonus, 0u);
    EXPECT_TRUE(report.breakdown.empty());
}

TEST(ChemistryEvaluatorTest, MoreThanThreeQualifyingColorsAreAllSummed) {
    auto colors = layout({{PlayerColor::Red, 3},
                          {PlayerColor::Yellow, 3},
                          {PlayerColor::Purple, 3},
                          {PlayerColor::Orange, 2}});
    EXPECT_EQ(ChemistryEvaluator::evaluate(colors).bonus, 31u);
    EXPECT_FALSE(ChemistryEvaluator::isValid(colors));
}

TEST(ChemistryEvaluatorTest, ValidateReportsWrongColorCount) {
    auto issues = ChemistryEvaluator::validate(
        layout({{PlayerColor::Red, 6}, {PlayerColor::Yellow, 5}}));
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].kind, ChemistryIssue::Kind::WrongColorCount);
    EXPECT_EQ(issues[0].count, 2u);
    EXPECT_FALSE(issues[0].message.empty());
}

TEST(ChemistryEvaluatorTest, ValidateReportsEveryUnderpopulatedColor) {
    auto issues = ChemistryEvaluator::validate(
        layout({{PlayerColor::Red, 9}, {PlayerColor::Yellow, 1}, {PlayerColor::Purple, 1}}));
    ASSERT_EQ(issues.size(), 2u);
    EXPECT_EQ(issues[0].kind, ChemistryIssue::Kind::UnderpopulatedColor);
    EXPECT_EQ(issues[0].color, PlayerColor::Yellow);
    EXPECT_EQ(issues[1].color, PlayerColor::Purple);
    EXPECT_EQ(issues[1].count, 1u);
}

TEST(ChemistryEvaluatorTest, FieldedColorsSkipPlaceholdersAndEmptySlots) {
    auto team = makeTeam(TeamId(1), UserId(1), LobbyId(1), 1,
                         {{PlayerColor::Red, 4, 70}, {PlayerColor::Yellow, 3, 70},
                          {PlayerColor::Purple, 2, 70}});
    team.slots[9] = TeamSlot::makePlaceholder(50);

    auto colors = ChemistryEvaluator::fieldedColors(team);
    EXPECT_EQ(colors.size(), 9u);
    EXPECT_EQ(ChemistryEvaluator::evaluate(team).bonus, 16u + 9u + 4u);
}

// ============================================================================
// TeamStrengthCalculator
// ============================================================================

TEST(TeamStrengthTest, SumsRatingsAndChemistry) {
    auto team = makeTeam(TeamId(5), UserId(1), LobbyId(1), 1,
                         {{PlayerColor::Red, 5, 80}, {PlayerColor::Yellow, 3, 80},
                          {PlayerColor::Purple, 3, 80}});
    auto result = TeamStrengthCalculator::calculate(team);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().teamId, TeamId(5));
    EXPECT_EQ(result.value().playerPoints, 880);
    EXPECT_EQ(result.value().chemistryPoints, 43);
    EXPECT_EQ(result.value().totalStrength, 923);
}

TEST(TeamStrengthTest, PlaceholderRatingCountsButNotItsColor) {
    auto team = makeTeam(TeamId(6), UserId(1), LobbyId(1), 1,
                         {{PlayerColor::Red, 4, 80}, {PlayerColor::Yellow, 3, 80},
                          {PlayerColor::Purple, 3, 80}});
    team.slots[10] = TeamSlot::makePlaceholder(50);

    auto result = TeamStrengthCalculator::calculate(team);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().playerPoints, 850);
    EXPECT_EQ(result.value().chemistryPoints, 34);
}

TEST(TeamStrengthTest, IncompleteTeamFails) {
    auto team = makeTeam(TeamId(7), UserId(1), LobbyId(1), 1,
                         {{PlayerColor::Red, 4, 80}, {PlayerColor::Yellow, 3, 80},
                          {PlayerColor::Purple, 3, 80}});
    ASSERT_EQ(team.filledSlots(), 10u);

    auto result = TeamStrengthCalculator::calculate(team);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::IncompleteTeam);
}

TEST(TeamStrengthTest, InvalidChemistryFails) {
    auto team = makeTeam(TeamId(8), UserId(1), LobbyId(1), 1,
                         {{PlayerColor::Red, 6, 80}, {PlayerColor::Yellow, 5, 80}});
    auto result = TeamStrengthCalculator::calculate(team);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidChemistry);
}

TEST(TeamStrengthTest, SingletonColorFails) {
    auto team = makeTeam(TeamId(9), UserId(1), LobbyId(1), 1,
                         {{PlayerColor::Red, 8, 80}, {PlayerColor::Yellow, 2, 80},
                          {PlayerColor::Purple, 1, 80}});
    auto result = TeamStrengthCalculator::calculate(team);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidChemistry);
}

TEST(TeamStrengthTest, ValidHelperTeamIsEligible) {
    auto result = TeamStrengthCalculator::calculate(
        makeValidTeam(TeamId(10), UserId(2), LobbyId(1), 2, 60));
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().totalStrength, 11 * 60 + 41);
}
