#pragma once

/// @file league_error.hpp
/// @brief Error type used with Result<T, LeagueError>.

#include <string>
#include <string_view>
#include <utility>

#include "fcl/foundation/error_code.hpp"

namespace fcl::foundation {

/// Error carrying a categorized code and a human-readable message.
class LeagueError {
public:
    LeagueError() = default;

    explicit LeagueError(ErrorCode code)
        : code_(code) {}

    LeagueError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// True for errors that retries and batch runs may treat as no-ops.
    [[nodiscard]] bool isBenign() const noexcept {
        return fcl::foundation::isBenign(code_);
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
};

} // namespace fcl::foundation
