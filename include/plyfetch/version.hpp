/*
 * Fallback version header for plyfetch
 *
 * Provides default version macros when the build system does not define them
 * (CMake passes PLYFETCH_VERSION_* as compile definitions from project(VERSION)).
 */

#pragma once

// Semantic version components (fallback to 0.0.0)
#ifndef PLYFETCH_VERSION_MAJOR
#define PLYFETCH_VERSION_MAJOR 0
#endif

#ifndef PLYFETCH_VERSION_MINOR
#define PLYFETCH_VERSION_MINOR 0
#endif

#ifndef PLYFETCH_VERSION_PATCH
#define PLYFETCH_VERSION_PATCH 0
#endif

// Combined version string (fallback)
#ifndef PLYFETCH_VERSION_STRING
#define PLYFETCH_VERSION_STRING "0.0.0+dev"
#endif

#ifndef PLYFETCH_BUILD_DATE
#define PLYFETCH_BUILD_DATE __DATE__ " " __TIME__
#endif
