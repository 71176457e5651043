#pragma once
/**
 * @file proxy_service.hpp
 * @brief The mesh's HTTP front door: routes client traffic by backend name.
 *
 * The proxy keeps an in-memory mirror `name -> backend` rebuilt from the
 * registry (`load_from_registry`, also `POST /proxy/reload`). The mirror, not
 * the registry file, serves the request path.
 *
 * Routes:
 *   GET  /                         service info
 *   GET  /proxy/status|mapping|health, POST /proxy/reload
 *   POST /proxy/register, DELETE /proxy/unregister/{name}
 *   *    /mcp/{name}[/rest]        -> backend /mcp/rest  (or /mcp/)
 *   GET  /sse/{name}[/rest]        -> backend /sse/rest  (always streamed)
 *   other verbs on /sse/...        -> 405, Allow: GET, OPTIONS
 *   *    /messages[/rest]          -> by server_name, X-MCP-Server-Name,
 *                                     Server-Name, then session_id
 *   OPTIONS *                      -> 204 with CORS
 *   *    /{path}                   -> the sole backend, if exactly one
 *
 * Registration and unregistration change the mirror and the registry together
 * under one mutex; a failed registry write rolls the mirror back.
 */
#include "mesh/http_forwarder.hpp"
#include "mesh/mesh_config.hpp"
#include "mesh/service_registry.hpp"
#include "mesh/session_table.hpp"

#include <nlohmann/json.hpp>

#include <map>
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

/// One entry of the proxy mirror.
struct Backend
{
    std::string host;
    int port = 0;
    Transport transport = Transport::Sse;
    std::string status{"running"};
    std::string registered_at;
};

MCPMESH_UTILS_EXPORT void to_json(nlohmann::json &j, const Backend &b);

/// Outcome of a registration API call, mirrored by the HTTP endpoint.
struct ApiReply
{
    /// HTTP status: 200 on success, 400 bad request, 500 persistence failure.
    int status = 200;
    nlohmann::json body;
};

class MCPMESH_UTILS_EXPORT ProxyService
{
  public:
    /// @param registry Must outlive the proxy.
    ProxyService(ProxySettings settings, ServiceRegistry &registry);
    ~ProxyService();

    ProxyService(const ProxyService &) = delete;
    ProxyService &operator=(const ProxyService &) = delete;

    /**
     * @brief Rebuilds the mirror from live network records of the registry.
     * @details When a name has several network records the newest `started_at`
     *          wins. Returns the number of backends loaded.
     */
    std::size_t load_from_registry();

    /**
     * @brief Binds the listening socket and serves on a background thread.
     * @details A configured port of 0 binds an ephemeral port (see `port()`).
     *          Also starts the periodic sweep of dead registry records and orphan sessions.
     * @return false if the socket could not be bound.
     */
    bool start();

    /// @brief Stops serving and the sweep; joins both threads. Idempotent.
    void stop();

    /// @brief Blocks until the server thread exits.
    void wait();

    [[nodiscard]] bool is_running() const noexcept;
    /// @brief Bound port, valid after a successful `start()`.
    [[nodiscard]] int port() const noexcept;

    /**
     * @brief Adds or replaces `name` in the mirror and the registry.
     *
     * The transport must be http or sse; stdio servers are not proxied.
     */
    ApiReply register_backend(const std::string &name, const std::string &host, int port,
                              Transport transport, std::optional<uint64_t> pid,
                              const std::string &request_id);

    /**
     * @brief Removes `name` from the mirror, its sessions and all its registry records.
     * @return nullopt if the name is not in the mirror. A failed registry write
     *         restores the mirror entry and replies 500.
     */
    std::optional<ApiReply> unregister_backend(const std::string &name);

    [[nodiscard]] std::map<std::string, Backend> mapping() const;
    [[nodiscard]] std::optional<Backend> find_backend(const std::string &name) const;

    [[nodiscard]] nlohmann::json status_json() const;
    /// @brief Probes every backend (`GET /sse/` or `/mcp`) and reports per-backend health.
    [[nodiscard]] nlohmann::json health_json() const;
    [[nodiscard]] nlohmann::json info_json() const;

    /// @brief Drops sessions whose backend has left the mirror; returns how many.
    std::size_t sweep_orphan_sessions();
    /// @brief `ServiceRegistry::clear_dead()` on the backing registry; returns how many went.
    std::size_t sweep_dead_records();

    [[nodiscard]] SessionTable &sessions() noexcept;
    [[nodiscard]] const ProxySettings &settings() const noexcept;

    /// @brief `<epoch_seconds>-<1000..9999>`.
    [[nodiscard]] static std::string make_request_id();

  private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpmesh::mesh

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
