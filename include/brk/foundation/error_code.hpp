#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the brick-breaker core.

#include <cstdint>
#include <string_view>

namespace breakout::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,

    // Level (0x0100 - 0x01FF)
    InvalidLevel = 0x0100,
    LevelNotFound = 0x0101,
    EmptyLevelCatalog = 0x0102,
    LevelParseFailed = 0x0103,

    // Level store (0x0200 - 0x02FF)
    LevelStoreReadFailed = 0x0200,
    LevelStoreWriteFailed = 0x0201,

    // Config (0x0300 - 0x03FF)
    ConfigLoadFailed = 0x0300,
    ConfigKeyNotFound = 0x0301,
    ConfigTypeMismatch = 0x0302,

    // Logger (0x0400 - 0x04FF)
    LoggerError = 0x0400,
    LoggerNotInitialized = 0x0401,
    LoggerFlushFailed = 0x0402,

    // Session (0x0500 - 0x05FF)
    SessionAlreadyRunning = 0x0500,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Level";
        case 0x0200: return "Store";
        case 0x0300: return "Config";
        case 0x0400: return "Logger";
        case 0x0500: return "Session";
        default: return "Unknown";
    }
}

} // namespace breakout::foundation
