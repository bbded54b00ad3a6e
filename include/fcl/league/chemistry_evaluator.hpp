#pragma once

/// @file chemistry_evaluator.hpp
/// @brief Color chemistry scoring for a team's fielded cards.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "fcl/league/league_types.hpp"

namespace fcl::league {

/// Bonus contributed by one color group.
struct ColorGroup {
    PlayerColor color = PlayerColor::DarkGreen;
    uint32_t count = 0;
    uint32_t bonus = 0;  ///< count^2.

    bool operator==(const ColorGroup&) const = default;
};

struct ChemistryReport {
    uint32_t bonus = 0;

    /// Qualifying groups only, by bonus descending then color order.
    std::vector<ColorGroup> breakdown;
};

/// A violated chemistry rule.
struct ChemistryIssue {
    enum class Kind : uint8_t {
        WrongColorCount,     ///< Not exactly kRequiredColors distinct colors.
        UnderpopulatedColor  ///< A color with fewer than kMinPlayersPerColor cards.
    };

    Kind kind = Kind::WrongColorCount;
    std::optional<PlayerColor> color;
    uint32_t count = 0;
    std::string message;
};

/// Static utility class for chemistry scoring.
///
/// Every color group with at least 2 cards contributes count^2; singletons
/// contribute nothing. Groups are never capped, so a layout with more than
/// 3 qualifying colors sums them all. The arithmetic never rejects a
/// layout: validate() reports rule violations separately.
///
/// @code
///   // 5 red, 3 yellow, 3 purple -> 25 + 9 + 9
///   auto report = ChemistryEvaluator::evaluate(colors);
///   assert(report.bonus == 43);
/// @endcode
class ChemistryEvaluator {
public:
    ChemistryEvaluator() = delete;

    [[nodiscard]] static ChemistryReport evaluate(
        const std::vector<PlayerColor>& colors);

    /// Evaluate the colors of a team's filled, non-placeholder slots.
    [[nodiscard]] static ChemistryReport evaluate(const Team& team);

    /// Colors that count toward chemistry, in slot order.
    [[nodiscard]] static std::vector<PlayerColor> fieldedColors(const Team& team);

    /// Check the exactly-3-colors, at-least-2-each rule.
    ///
    /// @return Every violated rule; empty when the layout is valid.
    [[nodiscard]] static std::vector<ChemistryIssue> validate(
        const std::vector<PlayerColor>& colors);

    [[nodiscard]] static bool isValid(const std::vector<PlayerColor>& colors) {
        return validate(colors).empty();
    }
};

} // namespace fcl::league
