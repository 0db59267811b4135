#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define BRK_VERSION_MAJOR 0
#define BRK_VERSION_MINOR 1
#define BRK_VERSION_PATCH 0
#define BRK_VERSION_STRING "0.1.0"

namespace breakout {

/// Project version information at compile time.
struct Version {
    static constexpr int major = BRK_VERSION_MAJOR;
    static constexpr int minor = BRK_VERSION_MINOR;
    static constexpr int patch = BRK_VERSION_PATCH;
    static constexpr const char* string = BRK_VERSION_STRING;
};

} // namespace breakout
