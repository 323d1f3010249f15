#pragma once

/**
 * @file config.hpp
 * @brief Compile-time configuration. Define any of these before including ecsave headers to
 * override the defaults.
 */

#include <cassert>

/**
 * @brief Reports a violated programming contract (structural change during iteration, access to
 * a missing component, conflicting registration).
 * @details Recoverable save/load failures are exceptions (see errors.hpp), never assertions.
 */
#ifndef ECSAVE_ASSERT
#define ECSAVE_ASSERT(expr, msg) assert((expr) && (msg))
#endif

/**
 * @brief Initial log threshold, one of Trace, Debug, Info, Warn, Error, Off.
 */
#ifndef ECSAVE_LOG_LEVEL
#define ECSAVE_LOG_LEVEL Info
#endif

/**
 * @brief Version written to and accepted from save streams.
 */
#ifndef ECSAVE_STREAM_VERSION
#define ECSAVE_STREAM_VERSION 1
#endif
