#pragma once

#include <cstdarg>
#include <cstdio>
#include <cstdlib>

namespace zobrist {
namespace detail {

/// Print "zobrist: fatal: <file>:<line>: <message>" to stderr and abort.
[[noreturn]] inline void fatal(const char *file, int line, const char *fmt,
                               ...) noexcept {
    std::fprintf(stderr, "zobrist: fatal: %s:%d: ", file, line);
    va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
    std::fputc('\n', stderr);
    std::fflush(stderr);
    std::abort();
}

} // namespace detail
} // namespace zobrist

/// Unconditional fatal error with a printf-style message.
#define ZOBRIST_FATAL(...) ::zobrist::detail::fatal(__FILE__, __LINE__, __VA_ARGS__)

/// Abort with a printf-style message when `cond` is false. Always evaluated,
/// independent of NDEBUG.
#define ZOBRIST_VERIFY(cond, ...)                                              \
    do {                                                                       \
        if (!(cond))                                                           \
            ZOBRIST_FATAL(__VA_ARGS__);                                        \
    } while (0)
