#pragma once

/// @file version.hpp
/// @brief Library version information and root namespace definition.

#define LHE_VERSION_MAJOR 0
#define LHE_VERSION_MINOR 3
#define LHE_VERSION_PATCH 0
#define LHE_VERSION_STRING "0.3.0"

namespace lhe {

/// Library version information at compile time.
struct Version {
    static constexpr int major = LHE_VERSION_MAJOR;
    static constexpr int minor = LHE_VERSION_MINOR;
    static constexpr int patch = LHE_VERSION_PATCH;
    static constexpr const char* string = LHE_VERSION_STRING;
};

} // namespace lhe
