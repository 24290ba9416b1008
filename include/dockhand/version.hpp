/*
 * Fallback version header for dockhand
 *
 * Provides default version macros when the build system does not inject
 * them via compile definitions.
 */

#pragma once

#ifndef DOCKHAND_VERSION_MAJOR
#define DOCKHAND_VERSION_MAJOR 0
#endif

#ifndef DOCKHAND_VERSION_MINOR
#define DOCKHAND_VERSION_MINOR 0
#endif

#ifndef DOCKHAND_VERSION_PATCH
#define DOCKHAND_VERSION_PATCH 0
#endif

#ifndef DOCKHAND_VERSION_STRING
#define DOCKHAND_VERSION_STRING "0.0.0+dev"
#endif

#ifndef DOCKHAND_GIT_COMMIT
#define DOCKHAND_GIT_COMMIT "unknown"
#endif

#ifndef DOCKHAND_BUILD_DATE
#define DOCKHAND_BUILD_DATE __DATE__ " " __TIME__
#endif

#ifndef DOCKHAND_VERSION_LONG_STRING
#define DOCKHAND_VERSION_LONG_STRING                                                               \
    DOCKHAND_VERSION_STRING " (commit: " DOCKHAND_GIT_COMMIT ", built: " DOCKHAND_BUILD_DATE ")"
#endif

#if defined(__cplusplus)
namespace dockhand {
namespace version {
constexpr int major_v = DOCKHAND_VERSION_MAJOR;
constexpr int minor_v = DOCKHAND_VERSION_MINOR;
constexpr int patch_v = DOCKHAND_VERSION_PATCH;
constexpr const char* string_v = DOCKHAND_VERSION_STRING;
constexpr const char* long_string_v = DOCKHAND_VERSION_LONG_STRING;
} // namespace version
} // namespace dockhand
#endif
