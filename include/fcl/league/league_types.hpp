#pragma once

/// @file league_types.hpp
/// @brief Core records of the card league: cards, teams, lobbies,
///        matches, standings and rewards.
///
/// Teams carry snapshotted ratings and colors per slot so that later
/// catalog edits never change a team that has already been fielded.

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "fcl/foundation/types.hpp"

namespace fcl::league {

using foundation::CardId;
using foundation::LobbyId;
using foundation::MatchId;
using foundation::TeamId;
using foundation::UserId;

// -- League constants --------------------------------------------------------

inline constexpr std::size_t kSlotsPerTeam = 11;
inline constexpr std::size_t kRequiredColors = 3;
inline constexpr uint32_t kMinPlayersPerColor = 2;

inline constexpr std::size_t kLobbyCapacity = 4;
inline constexpr uint8_t kMatchdays = 3;
inline constexpr std::size_t kMatchesPerMatchday = 6;
inline constexpr std::size_t kTotalMatches = kMatchdays * kMatchesPerMatchday;

inline constexpr uint32_t kDefaultChancesPerSide = 100;
inline constexpr uint32_t kMaxChancesPerSide = 100;
inline constexpr uint32_t kMinutesPerMatch = 90;

inline constexpr int32_t kPointsForWin = 3;
inline constexpr int32_t kPointsForDraw = 1;
inline constexpr int32_t kPointsForLoss = 0;

// -- Catalog -----------------------------------------------------------------

/// Pitch position of a player card.
enum class Position : uint8_t {
    GK, CB, LB, RB, CDM, CM, CAM, LM, RM, LW, RW, ST, CF, LF, RF
};

inline constexpr std::size_t kPositionCount = 15;

/// Color tag used by chemistry.
enum class PlayerColor : uint8_t {
    DarkGreen,
    LightGreen,
    DarkBlue,
    LightBlue,
    Red,
    Yellow,
    Purple,
    Orange
};

inline constexpr std::size_t kColorCount = 8;

constexpr std::string_view positionName(Position pos) noexcept {
    constexpr std::array<std::string_view, kPositionCount> kNames = {
        "GK", "CB", "LB", "RB", "CDM", "CM", "CAM", "LM",
        "RM", "LW", "RW", "ST", "CF", "LF", "RF"};
    auto idx = static_cast<std::size_t>(pos);
    return idx < kNames.size() ? kNames[idx] : "UNKNOWN";
}

constexpr std::string_view colorName(PlayerColor color) noexcept {
    switch (color) {
        case PlayerColor::DarkGreen:  return "dark-green";
        case PlayerColor::LightGreen: return "light-green";
        case PlayerColor::DarkBlue:   return "dark-blue";
        case PlayerColor::LightBlue:  return "light-blue";
        case PlayerColor::Red:        return "red";
        case PlayerColor::Yellow:     return "yellow";
        case PlayerColor::Purple:     return "purple";
        case PlayerColor::Orange:     return "orange";
    }
    return "unknown";
}

/// Parse a position code ("CAM"); case-sensitive.
[[nodiscard]] std::optional<Position> parsePosition(std::string_view code);

/// Parse a color tag ("dark-blue"); case-sensitive.
[[nodiscard]] std::optional<PlayerColor> parseColor(std::string_view tag);

/// Immutable catalog record of a player card.
struct PlayerCard {
    CardId id;
    std::string name;
    int32_t rating = 0;
    Position position = Position::GK;
    PlayerColor color = PlayerColor::DarkGreen;
};

// -- Teams -------------------------------------------------------------------

/// One of a team's 11 ordered slots.
///
/// A placeholder slot stands in for a missing card: it counts as filled
/// and contributes its rating, but is ignored by chemistry and by the
/// duplicate-card checks.
struct TeamSlot {
    std::optional<CardId> cardId;
    int32_t rating = 0;                 ///< Snapshotted at fielding time.
    std::optional<PlayerColor> color;   ///< Snapshotted at fielding time.
    bool placeholder = false;

    [[nodiscard]] bool isFilled() const noexcept {
        return placeholder || cardId.has_value();
    }

    /// Build a filled slot from a catalog card.
    [[nodiscard]] static TeamSlot fromCard(const PlayerCard& card) {
        TeamSlot slot;
        slot.cardId = card.id;
        slot.rating = card.rating;
        slot.color = card.color;
        return slot;
    }

    [[nodiscard]] static TeamSlot makePlaceholder(int32_t rating) {
        TeamSlot slot;
        slot.rating = rating;
        slot.placeholder = true;
        return slot;
    }
};

/// A user's fielded team for one matchday.
struct Team {
    TeamId id;
    UserId owner;
    LobbyId lobby;
    std::string name;
    std::string formation;
    uint8_t matchday = 1;  ///< 1..kMatchdays.
    std::array<TeamSlot, kSlotsPerTeam> slots{};

    [[nodiscard]] std::size_t filledSlots() const noexcept {
        std::size_t n = 0;
        for (const auto& slot : slots) {
            if (slot.isFilled()) {
                ++n;
            }
        }
        return n;
    }
};

// -- Lobbies -----------------------------------------------------------------

enum class LobbyStatus : uint8_t {
    Waiting,
    InProgress,
    Finished
};

constexpr std::string_view lobbyStatusName(LobbyStatus status) noexcept {
    switch (status) {
        case LobbyStatus::Waiting:    return "WAITING";
        case LobbyStatus::InProgress: return "IN_PROGRESS";
        case LobbyStatus::Finished:   return "FINISHED";
    }
    return "UNKNOWN";
}

[[nodiscard]] std::optional<LobbyStatus> parseLobbyStatus(std::string_view name);

/// A lobby of exactly kLobbyCapacity members hosting one league.
struct Lobby {
    LobbyId id;
    std::string name;
    std::vector<UserId> members;
    LobbyStatus status = LobbyStatus::Waiting;
    uint8_t currentMatchday = 0;  ///< 0 until the league is created.

    [[nodiscard]] bool isFull() const noexcept {
        return members.size() == kLobbyCapacity;
    }
};

// -- Matches -----------------------------------------------------------------

enum class Side : uint8_t {
    Home,
    Away
};

/// A converted chance, stamped with its match minute.
struct MatchEvent {
    uint32_t minute = 0;  ///< 1..kMinutesPerMatch.
    Side side = Side::Home;

    bool operator==(const MatchEvent&) const = default;
};

/// One fixture between two teams of the same matchday.
struct Match {
    MatchId id;
    LobbyId lobby;
    uint8_t matchday = 1;
    TeamId homeTeam;
    TeamId awayTeam;
    UserId homeUser;
    UserId awayUser;
    int32_t homeScore = 0;
    int32_t awayScore = 0;
    bool played = false;
    std::optional<std::chrono::system_clock::time_point> playedAt;
    std::vector<MatchEvent> events;
};

// -- Standings and rewards ---------------------------------------------------

/// One row of a league table.
struct LeagueTableEntry {
    UserId userId;
    uint32_t rank = 0;  ///< 1-based.
    int32_t points = 0;
    int32_t matchesPlayed = 0;
    int32_t wins = 0;
    int32_t draws = 0;
    int32_t losses = 0;
    int32_t goalsFor = 0;
    int32_t goalsAgainst = 0;
    int32_t goalDifference = 0;

    bool operator==(const LeagueTableEntry&) const = default;
};

/// Coins paid to one user for their final league position.
struct Reward {
    LobbyId lobby;
    UserId userId;
    uint32_t position = 0;  ///< 1-based final rank.
    int64_t coins = 0;
    std::chrono::system_clock::time_point issuedAt;
};

} // namespace fcl::league
