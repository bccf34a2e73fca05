/*
 * Version macros for chunkwise.
 *
 * The build system passes CHUNKWISE_VERSION_* definitions derived from the CMake project
 * version; the defaults below apply when this header is used outside that build.
 */

#pragma once

#ifndef CHUNKWISE_VERSION_MAJOR
#define CHUNKWISE_VERSION_MAJOR 0
#endif

#ifndef CHUNKWISE_VERSION_MINOR
#define CHUNKWISE_VERSION_MINOR 0
#endif

#ifndef CHUNKWISE_VERSION_PATCH
#define CHUNKWISE_VERSION_PATCH 0
#endif

#ifndef CHUNKWISE_VERSION_STRING
#define CHUNKWISE_VERSION_STRING "0.0.0+dev"
#endif

#ifndef CHUNKWISE_BUILD_DATE
#define CHUNKWISE_BUILD_DATE __DATE__ " " __TIME__
#endif

// "X.Y.Z (built: Mon DD YYYY HH:MM:SS)"
#define CHUNKWISE_VERSION_LONG_STRING CHUNKWISE_VERSION_STRING " (built: " CHUNKWISE_BUILD_DATE ")"

#if defined(__cplusplus)
namespace chunkwise {
namespace version {
constexpr int major_v = CHUNKWISE_VERSION_MAJOR;
constexpr int minor_v = CHUNKWISE_VERSION_MINOR;
constexpr int patch_v = CHUNKWISE_VERSION_PATCH;
constexpr const char* string_v = CHUNKWISE_VERSION_STRING;
constexpr const char* long_string_v = CHUNKWISE_VERSION_LONG_STRING;
} // namespace version
} // namespace chunkwise
#endif
