#pragma once

/// @file version.hpp
/// @brief Release number of the combat engine and the dungeon_quest binary.

#include <string_view>

#define DQE_VERSION_MAJOR 1
#define DQE_VERSION_MINOR 0
#define DQE_VERSION_PATCH 0
#define DQE_VERSION_STRING "1.0.0"

namespace dqe {

struct Version {
    int major;
    int minor;
    int patch;
};

inline constexpr Version kVersion{DQE_VERSION_MAJOR, DQE_VERSION_MINOR, DQE_VERSION_PATCH};

inline constexpr std::string_view kVersionString = DQE_VERSION_STRING;

} // namespace dqe
