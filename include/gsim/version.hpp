#pragma once

/// @file version.hpp
/// @brief Library version and the save-format revision it writes.

#include <cstdint>

#define GSIM_VERSION_MAJOR 0
#define GSIM_VERSION_MINOR 3
#define GSIM_VERSION_PATCH 0
#define GSIM_VERSION_STRING "0.3.0"

namespace gsim {

struct Version {
    static constexpr int major = GSIM_VERSION_MAJOR;
    static constexpr int minor = GSIM_VERSION_MINOR;
    static constexpr int patch = GSIM_VERSION_PATCH;
    static constexpr const char* string = GSIM_VERSION_STRING;

    /// Bumped whenever the binary state encoding changes shape.
    static constexpr uint32_t stateFormat = 1;
};

} // namespace gsim
