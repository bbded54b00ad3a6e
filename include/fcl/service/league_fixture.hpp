#pragma once

/// @file league_fixture.hpp
/// @brief YAML description of a lobby and its teams, used to seed a store.
///
/// @code
///   lobby:
///     id: 1
///     name: Sunday League
///     members: [1, 2, 3, 4]
///   teams:
///     - id: 101
///       owner: 1
///       matchday: 1
///       formation: 4-4-2
///       groups:                       # compact form
///         - {color: red, count: 5, rating: 28}
///         - {color: yellow, count: 3, rating: 26}
///         - {color: purple, count: 3, rating: 25}
///     - id: 102
///       owner: 2
///       matchday: 1
///       slots:                        # explicit form
///         - {card: 5001, rating: 30, color: dark-blue}
///         - {placeholder: true, rating: 20}
///         ...
/// @endcode
///
/// Card ids of the compact form are derived from the team id
/// (team * 100 + slot + 1).

#include <filesystem>
#include <string_view>
#include <vector>

#include "fcl/foundation/league_result.hpp"
#include "fcl/league/league_types.hpp"
#include "fcl/service/league_store.hpp"

namespace fcl::service {

struct LeagueFixture {
    league::Lobby lobby;
    std::vector<league::Team> teams;
};

/// Parse a fixture document.
///
/// @return The fixture, or ConfigLoadFailed for malformed YAML and
///         InvalidArgument for unknown colors or oversized teams.
[[nodiscard]] LeagueResult<LeagueFixture> parseFixture(std::string_view yaml);

[[nodiscard]] LeagueResult<LeagueFixture> loadFixture(const std::filesystem::path& path);

/// Write the fixture's lobby and teams to @p store.
[[nodiscard]] LeagueResult<void> seedStore(LeagueStore& store, const LeagueFixture& fixture);

} // namespace fcl::service
