// format_tools.cpp
#include "mesh_base.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>

namespace mcpmesh::format_tools
{

namespace
{
std::tm local_tm(std::time_t t)
{
    std::tm out{};
#if defined(MCPMESH_PLATFORM_WIN64)
    localtime_s(&out, &t);
#else
    localtime_r(&t, &out);
#endif
    return out;
}
} // namespace

std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>((tp_us - secs).count() % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;
    const std::tm tm = local_tm(std::chrono::system_clock::to_time_t(secs));
    return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:06d}", tm, fractional_us);
}

std::string local_timestamp()
{
    const std::tm tm = local_tm(std::time(nullptr));
    return fmt::format("{:%Y-%m-%d %H:%M:%S}", tm);
}

std::string_view trim(std::string_view str) noexcept
{
    constexpr std::string_view whitespace = " \t\n\r\f\v";
    auto first = str.find_first_not_of(whitespace);
    if (first == std::string_view::npos)
    {
        return str.substr(0, 0);
    }
    auto last = str.find_last_not_of(whitespace);
    return str.substr(first, last - first + 1);
}

std::string to_lower(std::string_view str)
{
    std::string out(str);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool iequals(std::string_view a, std::string_view b) noexcept
{
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(),
                      [](unsigned char x, unsigned char y) { return std::tolower(x) == std::tolower(y); });
}

std::optional<std::string> extract_value_from_string(std::string_view keyword, std::string_view input,
                                                     char separator, char assignment_symbol)
{
    std::string_view::size_type start = 0;
    while (start < input.size())
    {
        auto end = input.find(separator, start);
        if (end == std::string_view::npos)
        {
            end = input.size();
        }
        std::string_view segment = input.substr(start, end - start);
        start = end + 1;

        auto assignment_pos = segment.find(assignment_symbol);
        if (assignment_pos == std::string_view::npos)
        {
            continue;
        }
        if (trim(segment.substr(0, assignment_pos)) == keyword)
        {
            return std::string(trim(segment.substr(assignment_pos + 1)));
        }
    }
    return std::nullopt;
}

#if defined(MCPMESH_PLATFORM_WIN64)

std::wstring win32_to_long_path(const std::filesystem::path &p_in)
{
    std::error_code ec;
    std::filesystem::path abs = p_in.is_absolute() ? p_in : std::filesystem::absolute(p_in, ec);
    if (ec)
    {
        return std::wstring{};
    }
    std::wstring ws = abs.wstring();
    std::replace(ws.begin(), ws.end(), L'/', L'\\');
    if (ws.rfind(L"\\\\?\\", 0) == 0)
    {
        return ws;
    }
    if (ws.rfind(L"\\\\", 0) == 0)
    {
        return std::wstring(L"\\\\?\\UNC\\") + ws.substr(2);
    }
    return std::wstring(L"\\\\?\\") + ws;
}

std::wstring s2ws(const std::string &s)
{
    if (s.empty())
        return {};
    int required = MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, s.data(),
                                       static_cast<int>(s.size()), nullptr, 0);
    if (required <= 0)
        return {};
    std::wstring w(required, L'\0');
    if (MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, s.data(), static_cast<int>(s.size()),
                            w.data(), required) == 0)
        return {};
    return w;
}

std::string ws2s(const std::wstring &w)
{
    if (w.empty())
        return {};
    int required = WideCharToMultiByte(CP_UTF8, WC_ERR_INVALID_CHARS, w.data(),
                                       static_cast<int>(w.size()), nullptr, 0, nullptr, nullptr);
    if (required <= 0)
        return {};
    std::string s(required, '\0');
    if (WideCharToMultiByte(CP_UTF8, WC_ERR_INVALID_CHARS, w.data(), static_cast<int>(w.size()),
                            s.data(), required, nullptr, nullptr) == 0)
        return {};
    return s;
}

#else

std::wstring win32_to_long_path([[maybe_unused]] const std::filesystem::path &path)
{
    return {};
}

std::wstring s2ws([[maybe_unused]] const std::string &str)
{
    return {};
}

std::string ws2s([[maybe_unused]] const std::wstring &wstr)
{
    return {};
}

#endif

} // namespace mcpmesh::format_tools
