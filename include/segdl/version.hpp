/*
 * segdl version macros
 *
 * The build passes SEGDL_VERSION_* as compile definitions derived from the
 * CMake project version; the defaults below apply to builds that do not.
 */

#pragma once

#ifndef SEGDL_VERSION_MAJOR
#define SEGDL_VERSION_MAJOR 0
#endif

#ifndef SEGDL_VERSION_MINOR
#define SEGDL_VERSION_MINOR 0
#endif

#ifndef SEGDL_VERSION_PATCH
#define SEGDL_VERSION_PATCH 0
#endif

#ifndef SEGDL_VERSION_STRING
#define SEGDL_VERSION_STRING "0.0.0+dev"
#endif

#if defined(__cplusplus)
namespace segdl::version {
constexpr int major_v = SEGDL_VERSION_MAJOR;
constexpr int minor_v = SEGDL_VERSION_MINOR;
constexpr int patch_v = SEGDL_VERSION_PATCH;
constexpr const char* string_v = SEGDL_VERSION_STRING;
} // namespace segdl::version
#endif
