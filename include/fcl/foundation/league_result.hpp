#pragma once

/// @file league_result.hpp
/// @brief LeagueResult<T> type alias for league error handling.

#include "fcl/core/result.hpp"
#include "fcl/foundation/league_error.hpp"

namespace fcl::foundation {

/// Result type specialized with LeagueError.
///
/// Example:
/// @code
///   LeagueResult<int> payoutFor(int rank) {
///       if (rank < 1 || rank > 4) {
///           return LeagueResult<int>::err(
///               LeagueError(ErrorCode::InvalidArgument, "rank out of range"));
///       }
///       return LeagueResult<int>::ok(kPayouts[rank - 1]);
///   }
/// @endcode
template <typename T>
using LeagueResult = fcl::Result<T, LeagueError>;

}  // namespace fcl::foundation
