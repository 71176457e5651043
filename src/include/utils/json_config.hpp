#pragma once
/*******************************************************************************
 * @file json_config.hpp
 * @brief Thread-safe, process-safe JSON document backed by one file.
 *
 * `JsonConfig` keeps an in-memory `nlohmann::json` guarded by a
 * `std::shared_mutex` and synchronises it with its file under a `FileLock`:
 *
 * - `reload()` replaces memory with the file content (missing file = `{}`).
 * - `overwrite()` writes memory to the file.
 * - `locked_update(fn)` is the read-modify-write primitive used by the service
 *   registry: under one FileLock it reloads from disk, lets `fn` edit the
 *   document and, if `fn` returns true, writes it back. Other writers' changes
 *   are therefore merged rather than clobbered.
 *
 * Every write goes through `atomic_write_json()`: temp file in the same
 * directory, fsync, permissions copied from the target, rename (retried on
 * transient errors), fsync of the parent directory. A crash leaves either the
 * old or the new file, never a torn one. Symlinked targets are refused.
 *
 * Errors are reported through `std::error_code *` (may be null) and a `false`
 * return; no method throws.
 ******************************************************************************/
#include "mesh_platform.hpp"
#include "utils/file_lock.hpp"
#include "utils/module_def.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <system_error>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace mcpmesh::utils
{

class MCPMESH_UTILS_EXPORT JsonConfig
{
  public:
    JsonConfig() noexcept;
    /// @brief Equivalent to default construction followed by `init(path, createIfMissing)`.
    explicit JsonConfig(const std::filesystem::path &configFile, bool createIfMissing = false,
                        std::error_code *err_code = nullptr) noexcept;
    ~JsonConfig();

    JsonConfig(JsonConfig &&) noexcept;
    JsonConfig &operator=(JsonConfig &&) noexcept;
    JsonConfig(const JsonConfig &) = delete;
    JsonConfig &operator=(const JsonConfig &) = delete;

    /**
     * @brief Binds the object to `configFile` and loads it.
     * @param createIfMissing Write `{}` if the file does not exist yet.
     * @return false if the path is a symlink, the file cannot be created, or it does not parse.
     */
    bool init(const std::filesystem::path &configFile, bool createIfMissing,
              std::error_code *err_code = nullptr) noexcept;

    [[nodiscard]] bool is_initialized() const noexcept;
    [[nodiscard]] std::filesystem::path config_path() const;

    /// @brief Reloads from disk under the FileLock. A parse error sets `errc::io_error`.
    bool reload(std::error_code *err_code = nullptr) noexcept;

    /// @brief Writes the in-memory document to disk under the FileLock.
    bool overwrite(std::error_code *err_code = nullptr) noexcept;

    /// @brief Copy of the current in-memory document.
    [[nodiscard]] nlohmann::json snapshot() const;

    /// @brief Calls `fn` with shared (read) access to the in-memory document.
    void with_read(const std::function<void(const nlohmann::json &)> &fn) const;

    /// @brief Replaces the in-memory document. Does not touch the file.
    void replace(nlohmann::json data);

    /**
     * @brief Reload, modify and persist as one critical section.
     *
     * @param fn   Edits the freshly loaded document; return false to skip the write.
     * @param mode `NonBlocking` reports contention as `errc::resource_unavailable_try_again`
     *             so callers can apply their own backoff.
     * @return true if `fn` ran (and, when it asked for it, the write succeeded).
     */
    bool locked_update(const std::function<bool(nlohmann::json &)> &fn, LockMode mode,
                       std::error_code *err_code = nullptr) noexcept;

    /// @brief Crash-safe replacement of `target` with `json_snapshot` (2-space indent).
    static void atomic_write_json(const std::filesystem::path &target,
                                  const nlohmann::json &json_snapshot,
                                  std::error_code *err_code = nullptr) noexcept;

    static bool lifecycle_initialized() noexcept;
    /// @brief Module name "mcpmesh::utils::JsonConfig"; depends on FileLock and Logger.
    static ModuleDef GetLifecycleModule();

  private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;

    bool load_from_disk_unsafe(nlohmann::json &out, std::error_code *err_code) noexcept;
};

} // namespace mcpmesh::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
