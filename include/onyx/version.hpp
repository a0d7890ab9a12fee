/*
 * Version macros for Onyx
 *
 * The build system defines ONYX_VERSION_STRING from the CMake project version. The
 * fallbacks below keep the header usable when it is consumed without those
 * definitions (e.g. by tooling that parses headers on its own).
 */

#pragma once

#ifndef ONYX_VERSION_STRING
#define ONYX_VERSION_STRING "1.0.0+dev"
#endif

#ifndef ONYX_BUILD_DATE
#define ONYX_BUILD_DATE __DATE__ " " __TIME__
#endif

// Long version string: "X.Y.Z (built: Mmm DD YYYY HH:MM:SS)"
#ifndef ONYX_VERSION_LONG_STRING
#define ONYX_VERSION_LONG_STRING ONYX_VERSION_STRING " (built: " ONYX_BUILD_DATE ")"
#endif
