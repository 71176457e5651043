#pragma once
/*******************************************************************************
 * @file file_lock.hpp
 * @brief Cross-process advisory lock on a file or directory.
 *
 * `FileLock` guards a resource path by locking a sidecar lock file next to it:
 * - `ResourceType::File`:      `/run/mesh/registry.json` -> `/run/mesh/registry.json.lock`
 * - `ResourceType::Directory`: `/run/mesh/pids`          -> `/run/mesh/pids.dir.lock`
 *
 * Two layers of exclusion are taken, in this order:
 * 1. a process-local table keyed by the lock path, so threads of one process
 *    serialize without relying on OS semantics (flock is per open file
 *    description, not per thread);
 * 2. the OS primitive of the active `LockBackend` (flock / LockFileEx / none).
 *
 * Acquisition modes:
 * - `Blocking`: waits indefinitely.
 * - `NonBlocking`: one attempt; contention reports `errc::resource_unavailable_try_again`.
 * - timed: polls the OS lock every 20 ms; expiry reports `errc::timed_out`.
 *
 * No public API throws. Failure leaves `valid() == false` with `error_code()` set,
 * or `try_lock()` returns `std::nullopt`. The lock is not re-entrant: locking the
 * same path twice from one thread in blocking mode deadlocks.
 *
 * The FileLock lifecycle module must be started before any lock is constructed.
 ******************************************************************************/
#include "mesh_platform.hpp"
#include "utils/lock_backend.hpp"
#include "utils/module_def.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <system_error>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace mcpmesh::utils
{

enum class ResourceType
{
    File,
    Directory
};

enum class LockMode
{
    Blocking,
    NonBlocking
};

struct FileLockImpl;

class MCPMESH_UTILS_EXPORT FileLock
{
  public:
    /// @brief Locks `path` with `mode`. Check `valid()` afterwards.
    FileLock(const std::filesystem::path &path, ResourceType type,
             LockMode mode = LockMode::Blocking) noexcept;

    /// @brief Locks `path`, giving up after `timeout`.
    FileLock(const std::filesystem::path &path, ResourceType type,
             std::chrono::milliseconds timeout) noexcept;

    /// @brief Factory form that returns `std::nullopt` instead of an invalid lock.
    static std::optional<FileLock> try_lock(const std::filesystem::path &path, ResourceType type,
                                            LockMode mode = LockMode::NonBlocking) noexcept;
    static std::optional<FileLock> try_lock(const std::filesystem::path &path, ResourceType type,
                                            std::chrono::milliseconds timeout) noexcept;

    ~FileLock();
    FileLock(FileLock &&) noexcept;
    FileLock &operator=(FileLock &&) noexcept;
    FileLock(const FileLock &) = delete;
    FileLock &operator=(const FileLock &) = delete;

    [[nodiscard]] bool valid() const noexcept;
    [[nodiscard]] std::error_code error_code() const noexcept;

    /// @brief Absolute path of the guarded resource, while locked.
    [[nodiscard]] std::optional<std::filesystem::path> get_locked_resource_path() const noexcept;
    /// @brief Path of the sidecar lock file, while locked.
    [[nodiscard]] std::optional<std::filesystem::path> get_canonical_lock_file_path() const noexcept;

    /**
     * @brief Sidecar lock file name for `path`.
     * @return Empty path if `path` contains control characters.
     */
    static std::filesystem::path get_expected_lock_fullname_for(const std::filesystem::path &path,
                                                                ResourceType type) noexcept;

    /// @brief Selects the process-wide OS lock primitive for locks created afterwards.
    static void set_lock_backend(LockBackendKind kind);
    /// @brief Name of the active backend (`flock`, `lockfileex`, `none`).
    [[nodiscard]] static std::string lock_backend_name();

    static bool lifecycle_initialized() noexcept;
    /// @brief Module name: "mcpmesh::utils::FileLock".
    static ModuleDef GetLifecycleModule();

  private:
    FileLock() noexcept;

    struct FileLockImplDeleter
    {
        void operator()(FileLockImpl *ptr);
    };
    std::unique_ptr<FileLockImpl, FileLockImplDeleter> pImpl;
};

} // namespace mcpmesh::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
