// tests/test_framework/shared_test_helpers.cpp
/**
 * @file shared_test_helpers.cpp
 * @brief Implements common helper functions for test cases.
 */
#include "mesh_service.hpp"
#include "shared_test_helpers.h"

#include <cstdlib>
#include <fstream>
#include <random>
#include <sstream>

namespace mcpmesh::tests::helper
{

bool read_file_contents(const std::string &path, std::string &out)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
        return false;
    std::ostringstream ss;
    ss << ifs.rdbuf();
    out = ss.str();
    return true;
}

size_t count_lines(std::string_view text, std::optional<std::string_view> must_include,
                   std::optional<std::string_view> must_exclude)
{
    size_t count = 0;
    size_t pos = 0;

    while (pos < text.size())
    {
        auto end = text.find('\n', pos);
        auto line = text.substr(pos, end - pos);

        if ((!must_include || line.find(*must_include) != std::string_view::npos) &&
            (!must_exclude || line.find(*must_exclude) == std::string_view::npos))
        {
            ++count;
        }

        if (end == std::string_view::npos)
            break;
        pos = end + 1;
    }
    return count;
}

bool wait_for_string_in_file(const fs::path &path, const std::string &expected,
                             std::chrono::milliseconds timeout)
{
    return wait_until(
        [&] {
            std::string contents;
            return read_file_contents(path.string(), contents) &&
                   contents.find(expected) != std::string::npos;
        },
        timeout);
}

bool wait_until(const std::function<bool()> &pred, std::chrono::milliseconds timeout)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (pred())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return pred();
}

std::string test_scale()
{
    const char *v = std::getenv("MCPMESH_TEST_SCALE");
    return v ? std::string(v) : std::string();
}

int scaled_value(int original, int small_value)
{
    return test_scale() == "small" ? small_value : original;
}

TempDir::TempDir(std::string_view prefix)
{
    std::mt19937_64 rng{std::random_device{}()};
    path_ = fs::temp_directory_path() /
            fmt::format("{}_{}_{:08x}", prefix, platform::get_pid(), rng() & 0xffffffffu);
    fs::create_directories(path_);
}

TempDir::~TempDir()
{
    std::error_code ec;
    fs::remove_all(path_, ec);
}

std::unique_ptr<utils::LifecycleGuard> make_service_lifecycle()
{
    return std::make_unique<utils::LifecycleGuard>(
        utils::MakeModDefList(utils::Logger::GetLifecycleModule(),
                              utils::FileLock::GetLifecycleModule(),
                              utils::JsonConfig::GetLifecycleModule()));
}

} // namespace mcpmesh::tests::helper
