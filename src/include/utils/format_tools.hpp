// String and time formatting helpers shared by the logger, registry and proxy.
#pragma once
#include <chrono>
#include <filesystem>
#include <fmt/format.h>
#include <optional>
#include <string>
#include <string_view>

#include "mcpmesh_utils_export.h"

namespace mcpmesh::format_tools
{

/**
 * @brief Formats a system_clock time_point with microsecond precision.
 * @return A string in the format "YYYY-MM-DD HH:MM:SS.uuuuuu" (local time).
 */
MCPMESH_UTILS_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Current local time as "YYYY-MM-DD HH:MM:SS".
 * @details This is the `started_at` format of registry records. It sorts
 *          lexicographically in chronological order.
 */
MCPMESH_UTILS_EXPORT std::string local_timestamp();

/// Trims ASCII whitespace from both ends.
MCPMESH_UTILS_EXPORT std::string_view trim(std::string_view str) noexcept;

/// ASCII lower-case copy of `str`.
MCPMESH_UTILS_EXPORT std::string to_lower(std::string_view str);

/// Case-insensitive (ASCII) equality.
MCPMESH_UTILS_EXPORT bool iequals(std::string_view a, std::string_view b) noexcept;

/**
 * @brief Extracts a value from a dictionary-like string ("k1=v1; k2=v2").
 * @return The trimmed value for `keyword`, or std::nullopt when absent.
 */
MCPMESH_UTILS_EXPORT std::optional<std::string>
extract_value_from_string(std::string_view keyword, std::string_view input, char separator = ';',
                          char assignment_symbol = '=');

/**
 * @brief Converts a path to its Windows long path representation (e.g., `\\?\C:\...`).
 * @return The long path, or an empty string on non-Windows platforms.
 */
MCPMESH_UTILS_EXPORT std::wstring win32_to_long_path(const std::filesystem::path &);
/// UTF-8 to UTF-16 on Windows; empty elsewhere.
MCPMESH_UTILS_EXPORT std::wstring s2ws(const std::string &s);
/// UTF-16 to UTF-8 on Windows; empty elsewhere.
MCPMESH_UTILS_EXPORT std::string ws2s(const std::wstring &w);

/**
 * @brief Creates a `fmt::memory_buffer` from a compile-time format string and arguments.
 */
template <typename... Args>
fmt::memory_buffer make_buffer(fmt::format_string<Args...> fmt_str, Args &&...args)
{
    fmt::memory_buffer mb;
    mb.reserve(128);
    fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
    return mb;
}

/**
 * @brief Extracts the filename from a full path at compile time.
 */
constexpr std::string_view filename_only(std::string_view file_path) noexcept
{
    const auto pos = file_path.find_last_of("/\\");
    return pos == std::string_view::npos ? file_path : file_path.substr(pos + 1);
}

} // namespace mcpmesh::format_tools
