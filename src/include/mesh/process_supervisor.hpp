#pragma once
/**
 * @file process_supervisor.hpp
 * @brief Starts, stops, monitors and cleans up tool-server processes.
 *
 * Each configured server runs as its own process group. Runtime layout:
 *
 *   <runtime_dir>/logs/<name>.log   stdout + stderr of the server (appended)
 *   <runtime_dir>/pids/<name>.pid   pid of a successfully started server
 *
 * Start sequence (`start_server`):
 *  1. already healthy -> no-op success; present but unhealthy -> force stop + cleanup
 *  2. host: configured, else the LAN address (fallback 127.0.0.1)
 *  3. port: configured, else smart allocation; an occupied port scans from port+1
 *  4. spawn `command... --transport T [--host H --port P]` with MCPMESH_SERVER_NAME,
 *     MCPMESH_PROXY_URL and the configured env
 *  5. wait the start grace, require the process to be alive, then wait for the
 *     server's own registration (network transports). If it does not arrive the
 *     supervisor registers the record itself.
 *  6. write the pid file
 *
 * Any failure rolls back the pid file and the registry records of that name. No
 * exception escapes start/stop.
 *
 * The monitor (`start_monitor`) restarts enabled auto-restart servers whose
 * process is missing or a zombie, every `monitor_interval`. Its wait is a
 * `condition_variable_any` bound to a `std::stop_token`, so `stop_monitor()`
 * returns promptly.
 */
#include "mesh/mesh_config.hpp"
#include "mesh/port_allocator.hpp"
#include "mesh/service_registry.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace mcpmesh::mesh
{

struct StartResult
{
    bool ok = false;
    uint64_t pid = 0;
    int port = 0;
    std::filesystem::path log_path;
    std::string message;
};

struct ServiceStatus
{
    std::string name;
    Transport transport = Transport::Sse;
    bool enabled = false;
    bool running = false;
    uint64_t pid = 0;
    std::optional<int> port;
    std::filesystem::path log;
};

struct HealthReport
{
    std::string name;
    bool running = false;
    bool tcp_ok = false;
    bool http_ok = false;
    /// -1 when no HTTP response was received.
    int http_status = -1;
    std::string detail;

    [[nodiscard]] bool healthy() const noexcept { return running && tcp_ok && http_ok; }
};

/// A registry record that disagrees with the configuration.
struct RegistryDrift
{
    std::string key;
    std::string name;
    std::string reason;
};

struct CleanupReport
{
    std::vector<std::string> stale_pid_files;
    std::vector<std::string> pruned_records;
    int reaped_children = 0;
    std::vector<uint64_t> killed_processes;
};

MCPMESH_UTILS_EXPORT void to_json(nlohmann::json &j, const StartResult &r);
MCPMESH_UTILS_EXPORT void to_json(nlohmann::json &j, const ServiceStatus &s);
MCPMESH_UTILS_EXPORT void to_json(nlohmann::json &j, const HealthReport &h);

class MCPMESH_UTILS_EXPORT ProcessSupervisor
{
  public:
    /// @param registry Must outlive the supervisor.
    ProcessSupervisor(MeshSettings settings, ServiceRegistry &registry);
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor &) = delete;
    ProcessSupervisor &operator=(const ProcessSupervisor &) = delete;

    [[nodiscard]] const MeshSettings &settings() const noexcept;

    StartResult start_server(const ServerConfig &config);
    /// @brief Starts the configured server `name`; unknown names fail.
    StartResult start_server(const std::string &name);

    /**
     * @brief Stops `name`: pid file, else a command-line / environment scan.
     *
     * Terminates the whole process tree (SIGTERM, grace, SIGKILL; `force` skips
     * the grace) and always removes the pid file and the name's local registry
     * records. A proxy listening at the configured address is asked to drop the name.
     * @return true if no process of the service is left running.
     */
    bool stop_server(const std::string &name, bool force = false);

    StartResult restart_server(const std::string &name);

    /// @brief Starts every enabled server. Disabled ones are skipped.
    std::vector<StartResult> start_all();

    /// @brief Stops the monitor, then every enabled server. Returns the number stopped cleanly.
    int stop_all(bool force = false);

    void start_monitor();
    void stop_monitor();
    [[nodiscard]] bool monitor_running() const noexcept;

    /// @brief One monitor pass: restarts dead auto-restart servers. Returns the names restarted.
    std::vector<std::string> monitor_once();

    CleanupReport cleanup_dead_processes_and_ports();

    [[nodiscard]] std::vector<ServiceStatus> status() const;
    [[nodiscard]] std::vector<HealthReport> health_check() const;

    [[nodiscard]] std::vector<RegistryDrift> validate_registry() const;
    /// @brief Removes the drifting records; returns what was removed.
    std::vector<RegistryDrift> repair_registry();

    /// @brief Running pid of `name`, from the pid file or a process scan.
    [[nodiscard]] std::optional<uint64_t> find_pid(const std::string &name) const;

    [[nodiscard]] std::filesystem::path pid_file(const std::string &name) const;
    [[nodiscard]] std::filesystem::path log_file(const std::string &name) const;

  private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpmesh::mesh

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
