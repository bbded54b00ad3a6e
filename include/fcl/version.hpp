#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define FCL_VERSION_MAJOR 0
#define FCL_VERSION_MINOR 3
#define FCL_VERSION_PATCH 0
#define FCL_VERSION_STRING "0.3.0"

namespace fcl {

/// Library version known at compile time.
struct Version {
    static constexpr int major = FCL_VERSION_MAJOR;
    static constexpr int minor = FCL_VERSION_MINOR;
    static constexpr int patch = FCL_VERSION_PATCH;
    static constexpr const char* string = FCL_VERSION_STRING;
};

} // namespace fcl
