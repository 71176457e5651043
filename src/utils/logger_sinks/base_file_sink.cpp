#include "mesh_base.hpp"

#include <system_error>

#ifdef MCPMESH_PLATFORM_WIN64
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

#include "utils/logger_sinks/base_file_sink.hpp"

namespace mcpmesh::utils
{

BaseFileSink::BaseFileSink() = default;

BaseFileSink::~BaseFileSink()
{
    close();
}

void BaseFileSink::open(const std::filesystem::path &path, bool use_flock)
{
    close();
    m_path = path;
    m_use_flock = use_flock;

    std::error_code dir_ec;
    if (path.has_parent_path())
    {
        std::filesystem::create_directories(path.parent_path(), dir_ec);
    }

#ifdef MCPMESH_PLATFORM_WIN64
    (void)m_use_flock;
    const std::wstring wpath = format_tools::win32_to_long_path(m_path);
    m_file_handle = CreateFileW(wpath.c_str(), FILE_APPEND_DATA,
                                FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr,
                                OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (m_file_handle == INVALID_HANDLE_VALUE)
    {
        m_file_handle = nullptr;
        throw std::system_error(static_cast<int>(GetLastError()), std::system_category(),
                                "CreateFileW failed for log file");
    }
#else
    m_fd = ::open(m_path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (m_fd == -1)
    {
        throw std::system_error(errno, std::generic_category(), "open failed for log file");
    }
#endif
}

void BaseFileSink::close()
{
#ifdef MCPMESH_PLATFORM_WIN64
    if (m_file_handle != nullptr)
    {
        CloseHandle(m_file_handle);
        m_file_handle = nullptr;
    }
#else
    if (m_fd != -1)
    {
        ::close(m_fd);
        m_fd = -1;
    }
#endif
}

void BaseFileSink::fwrite(const std::string &content)
{
    if (!is_open())
        return;

#ifdef MCPMESH_PLATFORM_WIN64
    DWORD bytes_written = 0;
    if (!WriteFile(m_file_handle, content.data(), static_cast<DWORD>(content.size()),
                   &bytes_written, nullptr) ||
        bytes_written != content.size())
    {
        throw std::system_error(static_cast<int>(GetLastError()), std::system_category(),
                                "Failed to write complete log message to file");
    }
#else
    if (m_use_flock)
    {
        ::flock(m_fd, LOCK_EX);
    }

    size_t total = 0;
    int write_errno = 0;
    while (total < content.size())
    {
        const ssize_t n = ::write(m_fd, content.data() + total, content.size() - total);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            write_errno = errno;
            break;
        }
        total += static_cast<size_t>(n);
    }

    if (m_use_flock)
    {
        ::flock(m_fd, LOCK_UN);
    }

    if (write_errno != 0)
    {
        throw std::system_error(write_errno, std::generic_category(),
                                "Failed to write complete log message to file");
    }
#endif
}

void BaseFileSink::fflush()
{
    if (!is_open())
        return;

#ifdef MCPMESH_PLATFORM_WIN64
    FlushFileBuffers(m_file_handle);
#else
    ::fsync(m_fd);
#endif
}

bool BaseFileSink::is_open() const
{
#ifdef MCPMESH_PLATFORM_WIN64
    return m_file_handle != nullptr;
#else
    return m_fd != -1;
#endif
}

} // namespace mcpmesh::utils
