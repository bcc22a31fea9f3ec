#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define OPENMELEE_VERSION_MAJOR 0
#define OPENMELEE_VERSION_MINOR 3
#define OPENMELEE_VERSION_PATCH 0
#define OPENMELEE_VERSION_STRING "0.3.0"

namespace openmelee {

/// Project version information at compile time.
struct Version {
    static constexpr int major = OPENMELEE_VERSION_MAJOR;
    static constexpr int minor = OPENMELEE_VERSION_MINOR;
    static constexpr int patch = OPENMELEE_VERSION_PATCH;
    static constexpr const char* string = OPENMELEE_VERSION_STRING;
};

} // namespace openmelee
