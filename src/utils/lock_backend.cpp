#include "mesh_base.hpp"
#include "utils/lock_backend.hpp"
#include "utils/logger.hpp"

#if defined(MCPMESH_IS_POSIX)
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace mcpmesh::utils
{

namespace
{
constexpr int kLockFileMode = 0644;

void warn_reduced_safety(std::string_view reason)
{
    if (Logger::lifecycle_initialized())
    {
        LOGGER_WARN("FileLock: using the no-op lock backend ({}). Only in-process locking is "
                    "active; other processes are not excluded from shared files.",
                    reason);
    }
    else
    {
        fmt::print(stderr,
                   "[MESH] WARNING: FileLock: using the no-op lock backend ({}). Only in-process "
                   "locking is active.\n",
                   reason);
    }
}
} // namespace

std::optional<LockBackendKind> parse_lock_backend_kind(std::string_view text) noexcept
{
    const auto t = format_tools::trim(text);
    if (t.empty() || format_tools::iequals(t, "auto"))
        return LockBackendKind::Auto;
    if (format_tools::iequals(t, "flock"))
        return LockBackendKind::Flock;
    if (format_tools::iequals(t, "lockfileex"))
        return LockBackendKind::LockFileEx;
    if (format_tools::iequals(t, "none"))
        return LockBackendKind::None;
    return std::nullopt;
}

const char *to_string(LockBackendKind kind) noexcept
{
    switch (kind)
    {
    case LockBackendKind::Auto:
        return "auto";
    case LockBackendKind::Flock:
        return "flock";
    case LockBackendKind::LockFileEx:
        return "lockfileex";
    case LockBackendKind::None:
        return "none";
    }
    return "unknown";
}

// ----------------------------------------------------------------------------
// FlockBackend
// ----------------------------------------------------------------------------

bool FlockBackend::open(const std::filesystem::path &lock_file, LockHandle &handle,
                        std::error_code &ec) noexcept
{
#if defined(MCPMESH_IS_POSIX)
    int open_flags = O_CREAT | O_RDWR | O_CLOEXEC;
#ifdef O_NOFOLLOW
    open_flags |= O_NOFOLLOW;
#endif
    const int fd = ::open(lock_file.c_str(), open_flags, kLockFileMode);
    if (fd == -1)
    {
        ec = std::error_code(errno, std::generic_category());
        return false;
    }
    ec.clear();
    handle.fd = fd;
    handle.opened = true;
    return true;
#else
    (void)lock_file;
    (void)handle;
    ec = std::make_error_code(std::errc::not_supported);
    return false;
#endif
}

LockAttempt FlockBackend::try_lock(LockHandle &handle, std::error_code &ec) noexcept
{
#if defined(MCPMESH_IS_POSIX)
    if (::flock(handle.fd, LOCK_EX | LOCK_NB) == 0)
    {
        ec.clear();
        return LockAttempt::Acquired;
    }
    const int err = errno;
    if (err == EWOULDBLOCK || err == EAGAIN || err == EINTR)
    {
        ec = std::make_error_code(std::errc::resource_unavailable_try_again);
        return LockAttempt::Busy;
    }
    ec = std::error_code(err, std::generic_category());
    return LockAttempt::Failed;
#else
    (void)handle;
    ec = std::make_error_code(std::errc::not_supported);
    return LockAttempt::Failed;
#endif
}

bool FlockBackend::lock(LockHandle &handle, std::error_code &ec) noexcept
{
#if defined(MCPMESH_IS_POSIX)
    while (::flock(handle.fd, LOCK_EX) != 0)
    {
        if (errno != EINTR)
        {
            ec = std::error_code(errno, std::generic_category());
            return false;
        }
    }
    ec.clear();
    return true;
#else
    (void)handle;
    ec = std::make_error_code(std::errc::not_supported);
    return false;
#endif
}

void FlockBackend::unlock_and_close(LockHandle &handle) noexcept
{
#if defined(MCPMESH_IS_POSIX)
    if (handle.fd != -1)
    {
        ::flock(handle.fd, LOCK_UN);
        ::close(handle.fd);
    }
#endif
    handle.fd = -1;
    handle.opened = false;
}

// ----------------------------------------------------------------------------
// WinLockFileBackend
// ----------------------------------------------------------------------------

bool WinLockFileBackend::open(const std::filesystem::path &lock_file, LockHandle &handle,
                              std::error_code &ec) noexcept
{
#if defined(MCPMESH_PLATFORM_WIN64)
    std::wstring wpath;
    try
    {
        wpath = format_tools::win32_to_long_path(lock_file);
    }
    catch (const std::exception &)
    {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }
    // FILE_SHARE_DELETE keeps the target renameable while the lock file is open.
    HANDLE h = CreateFileW(wpath.c_str(), GENERIC_READ | GENERIC_WRITE,
                           FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr,
                           OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h == INVALID_HANDLE_VALUE)
    {
        ec = std::error_code(static_cast<int>(GetLastError()), std::system_category());
        return false;
    }
    ec.clear();
    handle.win_handle = h;
    handle.opened = true;
    return true;
#else
    (void)lock_file;
    (void)handle;
    ec = std::make_error_code(std::errc::not_supported);
    return false;
#endif
}

LockAttempt WinLockFileBackend::try_lock(LockHandle &handle, std::error_code &ec) noexcept
{
#if defined(MCPMESH_PLATFORM_WIN64)
    OVERLAPPED ov = {};
    if (LockFileEx(static_cast<HANDLE>(handle.win_handle),
                   LOCKFILE_EXCLUSIVE_LOCK | LOCKFILE_FAIL_IMMEDIATELY, 0, 1, 0, &ov))
    {
        ec.clear();
        return LockAttempt::Acquired;
    }
    const DWORD err = GetLastError();
    if (err == ERROR_LOCK_VIOLATION || err == ERROR_IO_PENDING)
    {
        ec = std::make_error_code(std::errc::resource_unavailable_try_again);
        return LockAttempt::Busy;
    }
    ec = std::error_code(static_cast<int>(err), std::system_category());
    return LockAttempt::Failed;
#else
    (void)handle;
    ec = std::make_error_code(std::errc::not_supported);
    return LockAttempt::Failed;
#endif
}

bool WinLockFileBackend::lock(LockHandle &handle, std::error_code &ec) noexcept
{
#if defined(MCPMESH_PLATFORM_WIN64)
    OVERLAPPED ov = {};
    if (LockFileEx(static_cast<HANDLE>(handle.win_handle), LOCKFILE_EXCLUSIVE_LOCK, 0, 1, 0, &ov))
    {
        ec.clear();
        return true;
    }
    ec = std::error_code(static_cast<int>(GetLastError()), std::system_category());
    return false;
#else
    (void)handle;
    ec = std::make_error_code(std::errc::not_supported);
    return false;
#endif
}

void WinLockFileBackend::unlock_and_close(LockHandle &handle) noexcept
{
#if defined(MCPMESH_PLATFORM_WIN64)
    if (handle.win_handle != nullptr)
    {
        OVERLAPPED ov = {};
        UnlockFileEx(static_cast<HANDLE>(handle.win_handle), 0, 1, 0, &ov);
        CloseHandle(static_cast<HANDLE>(handle.win_handle));
    }
#endif
    handle.win_handle = nullptr;
    handle.opened = false;
}

// ----------------------------------------------------------------------------

std::shared_ptr<LockBackend> make_lock_backend(LockBackendKind kind)
{
    switch (kind)
    {
    case LockBackendKind::None:
        warn_reduced_safety("selected by configuration");
        return std::make_shared<NoOpLockBackend>();
    case LockBackendKind::Flock:
#if defined(MCPMESH_IS_POSIX)
        return std::make_shared<FlockBackend>();
#else
        warn_reduced_safety("flock is not available on this platform");
        return std::make_shared<NoOpLockBackend>();
#endif
    case LockBackendKind::LockFileEx:
#if defined(MCPMESH_PLATFORM_WIN64)
        return std::make_shared<WinLockFileBackend>();
#else
        warn_reduced_safety("LockFileEx is not available on this platform");
        return std::make_shared<NoOpLockBackend>();
#endif
    case LockBackendKind::Auto:
        break;
    }
#if defined(MCPMESH_PLATFORM_WIN64)
    return std::make_shared<WinLockFileBackend>();
#elif defined(MCPMESH_IS_POSIX)
    return std::make_shared<FlockBackend>();
#else
    warn_reduced_safety("no advisory lock primitive on this platform");
    return std::make_shared<NoOpLockBackend>();
#endif
}

} // namespace mcpmesh::utils
