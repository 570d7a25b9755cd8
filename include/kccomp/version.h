/**
 * @file version.h
 * @brief Unified Version Information for kccomp Library
 *
 * This is the SINGLE SOURCE OF TRUTH for all version information.
 * When releasing a new version, ONLY modify this file.
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache License 2.0
 */

#ifndef KCCOMP_VERSION_H
#define KCCOMP_VERSION_H

/**
 * @defgroup Version Library Version Information
 * @{
 */

/** Major version number (API breaking changes) */
#define KCCOMP_VERSION_MAJOR 1

/** Minor version number (new features, backward compatible) */
#define KCCOMP_VERSION_MINOR 2

/** Patch version number (bug fixes) */
#define KCCOMP_VERSION_PATCH 0

/** Full version string "major.minor.patch" */
#define KCCOMP_VERSION_STRING "1.2.0"

/** Version as single integer: (major * 10000 + minor * 100 + patch) */
#define KCCOMP_VERSION_NUMBER ((KCCOMP_VERSION_MAJOR * 10000) + \
                               (KCCOMP_VERSION_MINOR * 100) + \
                               KCCOMP_VERSION_PATCH)

/** Release date in YYYY-MM-DD format */
#define KCCOMP_RELEASE_DATE "2026-10-12"

/** Library name */
#define KCCOMP_LIBRARY_NAME "kccomp"

/** Full library description */
#define KCCOMP_DESCRIPTION "Knight's Cryptographic Composition Layer"

/** Build type identifier */
#ifdef NDEBUG
#define KCCOMP_BUILD_TYPE "Release"
#else
#define KCCOMP_BUILD_TYPE "Debug"
#endif

/**
 * @brief Check if library version is at least the specified version
 */
#define KCCOMP_VERSION_AT_LEAST(major, minor, patch) \
    (KCCOMP_VERSION_NUMBER >= ((major) * 10000 + (minor) * 100 + (patch)))

/** @} */

#endif // KCCOMP_VERSION_H
