#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define GRE_VERSION_MAJOR 0
#define GRE_VERSION_MINOR 1
#define GRE_VERSION_PATCH 0
#define GRE_VERSION_STRING "0.1.0"

namespace gre {

/// Project version information at compile time.
struct Version {
    static constexpr int major = GRE_VERSION_MAJOR;
    static constexpr int minor = GRE_VERSION_MINOR;
    static constexpr int patch = GRE_VERSION_PATCH;
    static constexpr const char* string = GRE_VERSION_STRING;
};

} // namespace gre
