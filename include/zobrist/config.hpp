#pragma once

/// Compile-time configuration.
///
/// ZOBRIST_CHECK_SET_BEHAVIOR (0/1, default 0)
///     Opt in to shadow-checking every ZobristHash::add/remove against a
///     BoundedSet. Without a predefined ZOBRIST_VERIFY_ENABLED it only takes
///     effect in builds without NDEBUG.
///
/// ZOBRIST_VERIFY_ENABLED (0/1, derived unless predefined)
///     Whether checking is compiled in. It changes the layout of
///     ZobristHash, so every translation unit of a program must agree on
///     it. Derived from NDEBUG when not predefined; the CMake target
///     predefines it once per configuration.
///
/// ZOBRIST_CHECKER_CAPACITY (default 8192)
///     Number of simultaneously present keys the embedded checker can track.
///     Exceeding it aborts.

#ifndef ZOBRIST_CHECK_SET_BEHAVIOR
#define ZOBRIST_CHECK_SET_BEHAVIOR 0
#endif

#ifndef ZOBRIST_CHECKER_CAPACITY
#define ZOBRIST_CHECKER_CAPACITY 8192
#endif

#ifndef ZOBRIST_VERIFY_ENABLED
#if ZOBRIST_CHECK_SET_BEHAVIOR && !defined(NDEBUG)
#define ZOBRIST_VERIFY_ENABLED 1
#else
#define ZOBRIST_VERIFY_ENABLED 0
#endif
#endif

#include <cstddef>

namespace zobrist {

inline constexpr std::size_t checker_capacity = ZOBRIST_CHECKER_CAPACITY;
inline constexpr bool verify_enabled = ZOBRIST_VERIFY_ENABLED != 0;

static_assert(checker_capacity > 0, "ZOBRIST_CHECKER_CAPACITY must be > 0");

} // namespace zobrist
