#pragma once

/**
 * @file mesh_config.hpp
 * @brief MeshConfig: mesh configuration singleton lifecycle module.
 *
 * Reads `config/mesh.default.json` and `config/mesh.user.json` (relative to the
 * binary's location), resolves all paths to absolute, and exposes the result as
 * plain value structs (`MeshSettings`). Components take the sections they need by
 * value, so they can also be built from settings constructed in tests.
 *
 * ## Lifecycle
 *
 * Register via `LifecycleGuard`:
 * @code
 *   LifecycleGuard lifecycle(MakeModDefList(
 *       Logger::GetLifecycleModule(),
 *       FileLock::GetLifecycleModule(),
 *       JsonConfig::GetLifecycleModule(),
 *       MeshConfig::GetLifecycleModule()));
 * @endcode
 *
 * ## Config loading, layered (priority low -> high)
 *
 *  1. Built-in C++ defaults (the member initializers below)
 *  2. `config/mesh.default.json`: canonical defaults staged by the build
 *  3. `config/mesh.user.json`: user customisations merged on top of defaults
 *  4. `MCPMESH_CONFIG_FILE` env var: explicit single-file override; bypasses
 *     the default/user layering
 *  5. `MCPMESH_RUNTIME_DIR` / `MCPMESH_PROXY_HOST` / `MCPMESH_PROXY_PORT`
 *
 * The config directory is discovered (in order):
 *  - `<binary_dir>/../config/` (staged layout: bin/ + config/)
 *  - `<binary_dir>/config/`    (flat layout)
 *
 * Object sections merge recursively; arrays (`servers`) replace as a whole.
 * Startup also selects the FileLock backend from `runtime.lock_backend`.
 */

#include "mesh/service_record.hpp"
#include "utils/lock_backend.hpp"
#include "utils/module_def.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcpmesh
{

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

struct ProxySettings
{
    std::string host{"0.0.0.0"};
    int port{1888};
    /// Read timeout of buffered relays.
    std::chrono::seconds timeout{30};
    /// Connection establishment timeout, buffered and streaming.
    std::chrono::seconds connect_timeout{5};
    std::chrono::seconds session_sweep{300};
    /// Per-backend probe timeout of GET /proxy/health.
    std::chrono::seconds health_timeout{3};
};

struct RuntimeSettings
{
    std::filesystem::path dir;
    std::string registry_file{"registry.json"};
    utils::LockBackendKind lock_backend{utils::LockBackendKind::Auto};

    [[nodiscard]] std::filesystem::path registry_path() const { return dir / registry_file; }
    [[nodiscard]] std::filesystem::path logs_dir() const { return dir / "logs"; }
    [[nodiscard]] std::filesystem::path pids_dir() const { return dir / "pids"; }
};

struct SupervisorSettings
{
    std::chrono::seconds monitor_interval{30};
    std::chrono::milliseconds start_grace{3000};
    std::chrono::milliseconds registration_wait{10000};
    std::chrono::milliseconds stop_timeout{5000};
    int port_range_start{8000};
};

struct LoggingSettings
{
    std::string level{"info"};
    /// Empty: log to the console.
    std::filesystem::path file;
};

/// One managed tool server.
struct ServerConfig
{
    std::string name;
    std::string server_type;
    mesh::Transport transport{mesh::Transport::Sse};
    /// Empty, "auto" or JSON null: resolve to the LAN address at start.
    std::string host;
    std::optional<int> port;
    /// Program followed by its arguments.
    std::vector<std::string> command;
    std::map<std::string, std::string> env;
    bool enabled{true};
    bool auto_restart{true};
    std::string description;
};

MCPMESH_UTILS_EXPORT void to_json(nlohmann::json &j, const ServerConfig &cfg);
/// @throws std::invalid_argument on a missing name or unknown transport.
MCPMESH_UTILS_EXPORT void from_json(const nlohmann::json &j, ServerConfig &cfg);

/// The effective configuration of one process.
struct MCPMESH_UTILS_EXPORT MeshSettings
{
    std::filesystem::path root_dir;
    std::filesystem::path config_dir;

    ProxySettings proxy;
    RuntimeSettings runtime;
    SupervisorSettings supervisor;
    LoggingSettings logging;
    std::vector<ServerConfig> servers;

    /// @brief The configured server called `name`, or nullptr.
    [[nodiscard]] const ServerConfig *find_server(std::string_view name) const noexcept;

    /// @brief URL clients use to reach the proxy (`0.0.0.0` is shown as `localhost`).
    [[nodiscard]] std::string proxy_url() const;

    /**
     * @brief Applies a (merged) configuration document on top of the current values.
     *
     * Relative paths are resolved against `config_dir`.
     * @throws std::invalid_argument on malformed entries.
     */
    void apply_json(const nlohmann::json &j);

    /// @brief Applies MCPMESH_RUNTIME_DIR / MCPMESH_PROXY_HOST / MCPMESH_PROXY_PORT.
    void apply_env_overrides();

    /// @brief The effective configuration, as `mesh-ctl config` prints it.
    [[nodiscard]] nlohmann::json to_json() const;

    /**
     * @brief Runs the full layered load.
     *
     * @param override_file  Explicit single file; empty means `MCPMESH_CONFIG_FILE`,
     *                       then the default/user layering.
     * @param config_dir     Directory holding mesh.default.json / mesh.user.json;
     *                       empty means discovery from the binary location.
     * @throws std::invalid_argument when a loaded file contains malformed entries.
     */
    static MeshSettings load(const std::filesystem::path &override_file = {},
                             const std::filesystem::path &config_dir = {});
};

/**
 * @class MeshConfig
 * @brief Singleton lifecycle module that owns the process's MeshSettings.
 *
 * Thread-safe after startup; settings are resolved once and read-only afterwards.
 */
class MCPMESH_UTILS_EXPORT MeshConfig
{
  public:
    /**
     * @brief Optional: call before LifecycleGuard to pin the config file.
     * Must be called before the lifecycle module starts.
     */
    static void set_config_path(const std::filesystem::path &path);

    /**
     * @brief Returns the ModuleDef for use with LifecycleGuard.
     * Dependencies: Logger, JsonConfig.
     */
    static utils::ModuleDef GetLifecycleModule();

    static bool lifecycle_initialized() noexcept;

    /// @pre Must be called after the lifecycle module is started.
    static MeshConfig &get_instance();

    [[nodiscard]] const MeshSettings &settings() const noexcept;

    MeshConfig(const MeshConfig &) = delete;
    MeshConfig &operator=(const MeshConfig &) = delete;
    MeshConfig(MeshConfig &&) = delete;
    MeshConfig &operator=(MeshConfig &&) = delete;

    /// @internal Called by the lifecycle startup function (mesh_config.cpp).
    void load_(const std::filesystem::path &override_path);

  private:
    MeshConfig();
    ~MeshConfig();

    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

} // namespace mcpmesh
