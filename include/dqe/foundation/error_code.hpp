#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the combat engine.

#include <cstdint>
#include <string_view>

namespace dqe::foundation {

/// Error codes grouped by subsystem in 256-value (0x100) ranges, so the
/// source of an error can be read off the code value.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,

    // Combat (0x0100 - 0x01FF): declined actions, never terminal.
    InsufficientMana = 0x0100,
    InvalidSelection = 0x0101,
    EmptyInventory = 0x0102,
    ActionCancelled = 0x0103,  // Cancel, or Wait while able to act
    SessionFinished = 0x0104,
    CombatantDefeated = 0x0105,

    // Content (0x0200 - 0x02FF): malformed static definitions.
    ContentLoadFailed = 0x0200,
    UnknownSkillType = 0x0201,
    InvalidContent = 0x0202,
    DuplicateContent = 0x0203,

    // Config (0x0300 - 0x03FF)
    ConfigLoadFailed = 0x0300,
    ConfigKeyNotFound = 0x0301,
    ConfigTypeMismatch = 0x0302,

    // Logger (0x0400 - 0x04FF)
    LoggerFlushFailed = 0x0401,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    switch (value & 0xFF00) {
        case 0x0000: return "General";
        case 0x0100: return "Combat";
        case 0x0200: return "Content";
        case 0x0300: return "Config";
        case 0x0400: return "Logger";
        default: return "Unknown";
    }
}

/// True for codes that describe a declined player action rather than a fault.
constexpr bool isDeclinedAction(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xFF00) == 0x0100;
}

} // namespace dqe::foundation
