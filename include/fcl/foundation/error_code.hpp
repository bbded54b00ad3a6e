#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the league engine.

#include <cstdint>
#include <string_view>

namespace fcl::foundation {

/// Error codes grouped by subsystem in 256-value ranges (0x100), so the
/// source of an error can be read from the code alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,

    // Config (0x0100 - 0x01FF)
    ConfigLoadFailed = 0x0100,
    ConfigKeyNotFound = 0x0101,
    ConfigTypeMismatch = 0x0102,

    // Database (0x0200 - 0x02FF)
    DatabaseError = 0x0200,
    QueryFailed = 0x0201,
    TransactionFailed = 0x0202,
    NotConnected = 0x0203,
    ConnectionTimeout = 0x0204,

    // Logger (0x0300 - 0x03FF)
    LoggerError = 0x0300,
    LoggerFlushFailed = 0x0301,

    // League / lobby lifecycle (0x1000 - 0x10FF)
    LobbyNotFound = 0x1000,
    LobbyNotFull = 0x1001,
    AlreadyScheduled = 0x1002,
    ScheduleAlreadyExists = 0x1003,
    TeamsMissing = 0x1004,
    LeagueIncomplete = 0x1005,

    // Match (0x1100 - 0x11FF)
    MatchNotFound = 0x1100,
    AlreadyPlayed = 0x1101,

    // Team (0x1200 - 0x12FF)
    TeamNotFound = 0x1200,
    IncompleteTeam = 0x1201,
    InvalidChemistry = 0x1202,

    // Reward (0x1300 - 0x13FF)
    RewardsAlreadyIssued = 0x1300,

    // Store (0x1400 - 0x14FF)
    StoreError = 0x1400,
    StoreCorrupted = 0x1401,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Config";
        case 0x0200: return "Database";
        case 0x0300: return "Logger";
        case 0x1000: return "League";
        case 0x1100: return "Match";
        case 0x1200: return "Team";
        case 0x1300: return "Reward";
        case 0x1400: return "Store";
        default: return "Unknown";
    }
}

/// Errors a batch operation may skip without losing progress.
constexpr bool isBenign(ErrorCode code) {
    return code == ErrorCode::AlreadyPlayed ||
           code == ErrorCode::RewardsAlreadyIssued;
}

} // namespace fcl::foundation
