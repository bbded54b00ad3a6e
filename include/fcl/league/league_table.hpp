#pragma once

/// @file league_table.hpp
/// @brief Standings folded from played matches.

#include <cstdint>
#include <optional>
#include <vector>

#include "fcl/league/league_types.hpp"

namespace fcl::league {

/// Static utility class building league tables.
///
/// The table is always a full fold over the match log; no state survives
/// between calls, so rebuilding from the same matches yields the same
/// entries.
///
/// Ordering: points desc, goal difference desc, goals for desc, user id
/// asc. The user id tiebreak makes the order total.
class LeagueTableBuilder {
public:
    LeagueTableBuilder() = delete;

    /// Build one entry per member from the played matches.
    ///
    /// Unplayed matches, and matches of users outside @p members, are
    /// ignored. Members without a played match appear with zeros.
    ///
    /// @param matchday  If set, only matches of that matchday count.
    [[nodiscard]] static std::vector<LeagueTableEntry> build(
        const std::vector<Match>& matches,
        const std::vector<UserId>& members,
        std::optional<uint8_t> matchday = std::nullopt);

    /// Strict "ranks above" relation used for ordering.
    [[nodiscard]] static bool ranksAbove(const LeagueTableEntry& a,
                                         const LeagueTableEntry& b) noexcept;

    /// Sum of points across all entries.
    [[nodiscard]] static int32_t totalPoints(const std::vector<LeagueTableEntry>& table);
};

} // namespace fcl::league
