#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define LATCHKEY_VERSION_MAJOR 0
#define LATCHKEY_VERSION_MINOR 1
#define LATCHKEY_VERSION_PATCH 0
#define LATCHKEY_VERSION_STRING "0.1.0"

namespace latchkey {

/// Project version information at compile time.
struct Version {
    static constexpr int major = LATCHKEY_VERSION_MAJOR;
    static constexpr int minor = LATCHKEY_VERSION_MINOR;
    static constexpr int patch = LATCHKEY_VERSION_PATCH;
    static constexpr const char* string = LATCHKEY_VERSION_STRING;
};

} // namespace latchkey
