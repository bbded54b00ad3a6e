/// @file chemistry_evaluator.cpp
/// @brief ChemistryEvaluator implementation.

#include "fcl/league/chemistry_evaluator.hpp"

#include <algorithm>
#include <array>

namespace fcl::league {

namespace {

std::array<uint32_t, kColorCount> countColors(const std::vector<PlayerColor>& colors) {
    std::array<uint32_t, kColorCount> counts{};
    for (auto color : colors) {
        ++counts[static_cast<std::size_t>(color)];
    }
    return counts;
}

} // namespace

ChemistryReport ChemistryEvaluator::evaluate(const std::vector<PlayerColor>& colors) {
    auto counts = countColors(colors);

    ChemistryReport report;
    for (std::size_t i = 0; i < kColorCount; ++i) {
        if (counts[i] < kMinPlayersPerColor) {
            continue;
        }
        ColorGroup group;
        group.color = static_cast<PlayerColor>(i);
        group.count = counts[i];
        group.bonus = counts[i] * counts[i];
        report.bonus += group.bonus;
        report.breakdown.push_back(group);
    }

    // Stable: equal bonuses keep color order.
    std::stable_sort(report.breakdown.begin(), report.breakdown.end(),
                     [](const ColorGroup& a, const ColorGroup& b) {
                         return a.bonus > b.bonus;
                     });
    return report;
}

ChemistryReport ChemistryEvaluator::evaluate(const Team& team) {
    return evaluate(fieldedColors(team));
}

std::vector<PlayerColor> ChemistryEvaluator::fieldedColors(const Team& team) {
    std::vector<PlayerColor> colors;
    colors.reserve(kSlotsPerTeam);
    for (const auto& slot : team.slots) {
        if (slot.placeholder || !slot.cardId || !slot.color) {
            continue;
        }
        colors.push_back(*slot.color);
    }
    return colors;
}

std::vector<ChemistryIssue> ChemistryEvaluator::validate(
    const std::vector<PlayerColor>& colors) {
    auto counts = countColors(colors);

    std::vector<ChemistryIssue> issues;

    auto distinct = static_cast<std::size_t>(
        std::count_if(counts.begin(), counts.end(),
                      [](uint32_t c) { return c > 0; }));
    if (distinct != kRequiredColors) {
        ChemistryIssue issue;
        issue.kind = ChemistryIssue::Kind::WrongColorCount;
        issue.count = static_cast<uint32_t>(distinct);
        issue.message = "team must field exactly " + std::to_string(kRequiredColors) +
                        " colors, found " + std::to_string(distinct);
        issues.push_back(std::move(issue));
    }

    for (std::size_t i = 0; i < kColorCount; ++i) {
        if (counts[i] == 0 || counts[i] >= kMinPlayersPerColor) {
            continue;
        }
        auto color = static_cast<PlayerColor>(i);
        ChemistryIssue issue;
        issue.kind = ChemistryIssue::Kind::UnderpopulatedColor;
        issue.color = color;
        issue.count = counts[i];
        issue.message = "color " + std::string(colorName(color)) + " needs at least " +
                        std::to_string(kMinPlayersPerColor) + " players, found " +
                        std::to_string(counts[i]);
        issues.push_back(std::move(issue));
    }

    return issues;
}

} // namespace fcl::league
