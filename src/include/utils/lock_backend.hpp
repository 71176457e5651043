#pragma once
/**
 * @file lock_backend.hpp
 * @brief Platform primitive behind `FileLock`: an advisory exclusive lock on a path.
 *
 * Backends:
 * - `FlockBackend` (POSIX `flock(LOCK_EX)`), the default on Linux, macOS and FreeBSD.
 * - `WinLockFileBackend` (`LockFileEx` on the first byte), the default on Windows.
 * - `NoOpLockBackend`: always succeeds. Mutual exclusion is then only what the
 *   in-process lock table of `FileLock` provides; concurrent writers in other
 *   processes are NOT excluded. Selecting it logs a warning.
 *
 * The active backend is process-wide and chosen with `FileLock::set_lock_backend()`,
 * normally from the `runtime.lock_backend` configuration key.
 */
#include "mesh_platform.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>
#include <system_error>

namespace mcpmesh::utils
{

enum class LockBackendKind
{
    Auto,
    Flock,
    LockFileEx,
    None
};

/// @brief Parses `auto|flock|lockfileex|none` (case-insensitive).
MCPMESH_UTILS_EXPORT std::optional<LockBackendKind> parse_lock_backend_kind(std::string_view text) noexcept;
MCPMESH_UTILS_EXPORT const char *to_string(LockBackendKind kind) noexcept;

/// Native handle of an opened lock file. Which member is used depends on the backend.
struct LockHandle
{
    int fd = -1;
    void *win_handle = nullptr;
    bool opened = false;
};

enum class LockAttempt
{
    Acquired,
    Busy,
    Failed
};

class MCPMESH_UTILS_EXPORT LockBackend
{
  public:
    virtual ~LockBackend() = default;

    [[nodiscard]] virtual const char *name() const noexcept = 0;

    /// @brief Opens (creating if needed) the lock file. Never follows a symlink.
    virtual bool open(const std::filesystem::path &lock_file, LockHandle &handle,
                      std::error_code &ec) noexcept = 0;

    /// @brief One non-blocking attempt. `Busy` means another holder owns the lock.
    virtual LockAttempt try_lock(LockHandle &handle, std::error_code &ec) noexcept = 0;

    /// @brief Waits until the lock is acquired.
    virtual bool lock(LockHandle &handle, std::error_code &ec) noexcept = 0;

    /// @brief Releases the lock (if held) and closes the handle.
    virtual void unlock_and_close(LockHandle &handle) noexcept = 0;
};

class MCPMESH_UTILS_EXPORT FlockBackend final : public LockBackend
{
  public:
    [[nodiscard]] const char *name() const noexcept override { return "flock"; }
    bool open(const std::filesystem::path &lock_file, LockHandle &handle,
              std::error_code &ec) noexcept override;
    LockAttempt try_lock(LockHandle &handle, std::error_code &ec) noexcept override;
    bool lock(LockHandle &handle, std::error_code &ec) noexcept override;
    void unlock_and_close(LockHandle &handle) noexcept override;
};

class MCPMESH_UTILS_EXPORT WinLockFileBackend final : public LockBackend
{
  public:
    [[nodiscard]] const char *name() const noexcept override { return "lockfileex"; }
    bool open(const std::filesystem::path &lock_file, LockHandle &handle,
              std::error_code &ec) noexcept override;
    LockAttempt try_lock(LockHandle &handle, std::error_code &ec) noexcept override;
    bool lock(LockHandle &handle, std::error_code &ec) noexcept override;
    void unlock_and_close(LockHandle &handle) noexcept override;
};

class MCPMESH_UTILS_EXPORT NoOpLockBackend final : public LockBackend
{
  public:
    [[nodiscard]] const char *name() const noexcept override { return "none"; }
    bool open(const std::filesystem::path &, LockHandle &handle, std::error_code &ec) noexcept override
    {
        ec.clear();
        handle.opened = true;
        return true;
    }
    LockAttempt try_lock(LockHandle &, std::error_code &ec) noexcept override
    {
        ec.clear();
        return LockAttempt::Acquired;
    }
    bool lock(LockHandle &, std::error_code &ec) noexcept override
    {
        ec.clear();
        return true;
    }
    void unlock_and_close(LockHandle &handle) noexcept override { handle.opened = false; }
};

/**
 * @brief Creates the backend for `kind`.
 *
 * `Auto` picks the platform primitive. Requesting a primitive the platform does
 * not have falls back to `NoOpLockBackend`. Whenever the result is the no-op
 * backend a warning is written (through the Logger when it is running, to
 * stderr otherwise).
 */
MCPMESH_UTILS_EXPORT std::shared_ptr<LockBackend> make_lock_backend(LockBackendKind kind);

} // namespace mcpmesh::utils
