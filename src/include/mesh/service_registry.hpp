#pragma once
/**
 * @file service_registry.hpp
 * @brief Persisted, cross-process map of service key -> ServiceRecord.
 *
 * The registry file (`<runtime_dir>/registry.json`) is the single source of truth
 * about running tool servers. Every mutation is one critical section under the
 * file's advisory lock (`registry.json.lock`):
 *
 *     lock (non-blocking) -> reload from disk -> edit -> atomic write -> unlock
 *
 * so concurrent writers in other processes are merged rather than clobbered. Lock
 * contention is retried `max_retries` times with a linearly growing delay
 * (`retry_delay * (attempt + 1)`); exhaustion is a logged hard failure.
 *
 * Load-failure policy: a missing file is an empty registry. A file that does not
 * parse makes every mutation fail (nothing is overwritten), while read accessors
 * log the error and report an empty registry.
 *
 * One `ServiceRegistry` is constructed per process and passed by reference.
 * It requires the Logger, FileLock and JsonConfig lifecycle modules.
 */
#include "mesh/mesh_config.hpp"
#include "mesh/service_record.hpp"
#include "utils/json_config.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace mcpmesh::mesh
{

struct RegistryOptions
{
    std::filesystem::path file;
    int max_retries = 5;
    /// Base of the linear contention backoff.
    std::chrono::milliseconds retry_delay{500};
    /// TCP connect probe of local network records.
    std::chrono::milliseconds local_probe_timeout{1000};
    /// HTTP probe of remote records.
    std::chrono::seconds remote_probe_timeout{5};
};

/**
 * @brief Liveness probe for records on other machines.
 *
 * Returns false for a record that is definitely down. An exception thrown by the
 * probe is not a verdict: the record is then kept as alive.
 */
using RemoteProbe = std::function<bool(const ServiceRecord &)>;

class MCPMESH_UTILS_EXPORT ServiceRegistry
{
  public:
    using RecordMap = std::map<std::string, ServiceRecord>;

    /**
     * @param opts Registry options; `opts.file` must be set.
     * @throws std::invalid_argument if `opts.file` is empty.
     * @throws std::runtime_error if the registry directory cannot be created.
     */
    explicit ServiceRegistry(RegistryOptions opts);
    ~ServiceRegistry();

    ServiceRegistry(const ServiceRegistry &) = delete;
    ServiceRegistry &operator=(const ServiceRegistry &) = delete;

    [[nodiscard]] const std::filesystem::path &file() const noexcept { return m_opts.file; }
    [[nodiscard]] const RegistryOptions &options() const noexcept { return m_opts; }

    /**
     * @brief Upserts `record` under its key.
     * @throws std::invalid_argument if the record fails `ServiceRecord::validate()`.
     * @return false on lock exhaustion, an unreadable registry, or a write error.
     */
    bool register_server(const ServiceRecord &record);

    /// @brief Removes `key`. Returns false if the key is absent (the file is untouched).
    bool unregister_server(const std::string &key);

    /// @brief Fresh view of the file. Malformed entries are skipped with a warning.
    [[nodiscard]] RecordMap list_servers() const;

    /// @brief Registered records of one transport.
    [[nodiscard]] std::vector<ServiceRecord> servers_by_transport(Transport transport) const;

    /**
     * @brief Local records: PID exists and, for http/sse, the port accepts a connection.
     *        Remote records: HTTP probe of the transport endpoint; a faulting probe
     *        counts as alive. Remote stdio records are assumed alive.
     */
    [[nodiscard]] bool is_alive(const ServiceRecord &record) const;

    /// @brief Removes every record failing `is_alive()`; returns the removed keys.
    std::vector<std::string> clear_dead();

    /**
     * @brief Removes every record whose name is `name`.
     * @param local_only Leave records on other machines in place.
     * @return Removed keys (possibly empty); nullopt if the registry could not be updated.
     */
    std::optional<std::vector<std::string>> remove_by_name(std::string_view name,
                                                           bool local_only = false);

    /// @brief Removes the given keys (absent keys are ignored).
    std::optional<std::vector<std::string>> remove_keys(const std::vector<std::string> &keys);

    /// @brief Removes every local record; remote ones are never touched.
    std::optional<std::vector<std::string>> remove_local_records();

    /// @brief Upserts many records in one locked reload-merge-persist.
    bool batch_update(const std::vector<ServiceRecord> &records);

    /**
     * @brief Client configuration for `cursor` or `claude_desktop`.
     *
     * Calls `clear_dead()` first. Network records yield `url` entries; configured
     * stdio servers from `configured` yield `command`/`args` entries.
     * @throws std::invalid_argument on an unknown client type.
     */
    nlohmann::json generate_client_config(std::string_view client_type,
                                          const std::vector<ServerConfig> &configured = {});

    /// @brief `{total, by_transport, servers: {key: {..., alive, local}}}` after a dead sweep.
    nlohmann::json status();

    /// @brief Replaces the HTTP probe used for remote records.
    void set_remote_probe(RemoteProbe probe);

  private:
    /// Runs `fn` inside the locked reload-edit-persist section with contention retries.
    bool mutate(std::string_view what, const std::function<bool(nlohmann::json &)> &fn);

    bool default_remote_probe(const ServiceRecord &record) const;

    RegistryOptions m_opts;
    mutable utils::JsonConfig m_store;
    mutable std::mutex m_probe_mu;
    RemoteProbe m_remote_probe;
};

} // namespace mcpmesh::mesh

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
