#pragma once

/// @file types.hpp
/// @brief Strong ID types for league records.

#include <cstdint>
#include <functional>

namespace fcl::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// Keeps a MatchId from being passed where a TeamId is expected while
/// sharing the same underlying representation.
///
/// @tparam Tag A unique tag type to distinguish different ID types.
/// @tparam T The underlying integral type.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct UserIdTag {};
struct LobbyIdTag {};
struct TeamIdTag {};
struct MatchIdTag {};
struct CardIdTag {};

/// Account that owns teams and receives rewards.
using UserId = StrongId<UserIdTag>;

/// A 4-member lobby hosting one league.
using LobbyId = StrongId<LobbyIdTag>;

/// A fielded team for one matchday.
using TeamId = StrongId<TeamIdTag>;

/// One fixture between two teams.
using MatchId = StrongId<MatchIdTag>;

/// A player card in the catalog.
using CardId = StrongId<CardIdTag>;

} // namespace fcl::foundation

template <typename Tag, typename T>
struct std::hash<fcl::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const fcl::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
