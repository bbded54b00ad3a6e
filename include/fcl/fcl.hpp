#pragma once

/// @file fcl.hpp
/// @brief Umbrella header for the football card league engine.

#include "fcl/version.hpp"
#include "fcl/core/result.hpp"
