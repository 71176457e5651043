/**
 * @file debug_info.hpp
 * @brief Fatal-error and debug-message helpers for mcpmesh.
 *
 * `MESH_PANIC` is the single way library code reports a broken invariant (use of a
 * module before its lifecycle startup, a dependency cycle, ...). It prints the
 * source location and a stack trace to `stderr`, then aborts. `MESH_DEBUG` prints
 * a `[DBG]` line and compiles away unless `MCPMESH_ENABLE_DEBUG_MESSAGES` is set.
 * Both take `fmt` format strings checked at compile time.
 */
#pragma once

#include <cstdio>
#include <cstdlib>
#include <fmt/format.h>
#include <source_location>
#include <string>
#include <string_view>

#include "mcpmesh_utils_export.h"
#include "utils/format_tools.hpp"

/// Renders a source location as `file:line:function` (file name only, no directories).
inline std::string SRCLOC_TO_STR(std::source_location loc)
{
    return fmt::format("{}:{}:{}", mcpmesh::format_tools::filename_only(loc.file_name()),
                       loc.line(), loc.function_name());
}

namespace mcpmesh::debug
{

/**
 * @brief Prints the current call stack to `stderr`.
 *
 * POSIX builds use `backtrace` and resolve frames with `dladdr` (demangled);
 * Windows builds use `CaptureStackBackTrace` with DbgHelp symbol lookup.
 */
MCPMESH_UTILS_EXPORT void print_stack_trace() noexcept;

/**
 * @brief Prints a fatal error with its source location and a stack trace, then aborts.
 * @noreturn
 */
template <typename... Args>
[[noreturn]] inline void panic(std::source_location loc, fmt::format_string<Args...> fmt_str,
                               Args &&...args) noexcept
{
    try
    {
        fmt::print(stderr, "[PANIC] {} -- {}\n", SRCLOC_TO_STR(loc),
                   fmt::format(fmt_str, std::forward<Args>(args)...));
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[PANIC] (message formatting failed: %s)\n", e.what());
    }
    std::fflush(stderr);
    print_stack_trace();
    std::abort();
}

/// Prints a `[DBG]` line to `stderr`. Formatting failures are reported, never thrown.
template <typename... Args>
inline void debug_msg(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        fmt::print(stderr, "[DBG]  {}\n", fmt::format(fmt_str, std::forward<Args>(args)...));
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[DBG]  (message formatting failed: %s)\n", e.what());
    }
}

} // namespace mcpmesh::debug

#ifndef MESH_LOC_HERE_STR
#define MESH_LOC_HERE_STR (SRCLOC_TO_STR(std::source_location::current()))
#endif

/**
 * @brief Aborts with a formatted message, the caller's source location and a stack trace.
 * @see mcpmesh::debug::panic
 */
#ifndef MESH_PANIC
#define MESH_PANIC(fmt, ...)                                                                       \
    ::mcpmesh::debug::panic(std::source_location::current(), FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#endif

#ifndef MESH_DEBUG
#if defined(MCPMESH_ENABLE_DEBUG_MESSAGES)
#define MESH_DEBUG(fmt, ...) ::mcpmesh::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define MESH_DEBUG(fmt, ...)                                                                       \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
#endif
