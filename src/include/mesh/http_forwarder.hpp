#pragma once
/**
 * @file http_forwarder.hpp
 * @brief Relays one proxied HTTP request to a backend, buffered or streamed.
 *
 * Every call opens a fresh `httplib::Client`; no connection is shared between
 * requests. Hop-by-hop headers are stripped in both directions and permissive
 * CORS headers are added to every relayed response.
 *
 * Failure classification decides whether the backend's sessions are torn down:
 *
 *   connect refused        -> 503 "Target server unavailable", teardown
 *   connect / read timeout -> 504 "Target server timeout",     teardown
 *   other client error     -> 500, teardown only if the error names a network condition
 *   any delivered response -> passed through unchanged, never a teardown
 *
 * Streaming relays run the upstream request on a worker thread feeding a chunk
 * queue; the downstream chunked provider drains it. A failed downstream write
 * stops the upstream client, which aborts the backend read promptly.
 */
#include "mesh_platform.hpp"

#include <httplib.h>

#include <chrono>
#include <functional>
#include <string>
#include <string_view>

namespace mcpmesh::mesh
{

struct ForwardOptions
{
    std::chrono::milliseconds connect_timeout{5000};
    /// Buffered relays only; streaming relays have no read timeout.
    std::chrono::milliseconds read_timeout{30000};
};

struct ForwardTarget
{
    std::string server_name;
    std::string host;
    int port = 0;
    /// Backend path including the query string, e.g. `/mcp/bar?x=1`.
    std::string path;
    std::string request_id;
};

enum class UpstreamFailure
{
    None,
    Refused,
    Timeout,
    Cancelled,
    Other
};

class MCPMESH_UTILS_EXPORT HttpForwarder
{
  public:
    /// Called for each newly sighted session id in a streamed response.
    using SessionCallback = std::function<void(const std::string &session_id)>;
    /// Called when the backend must be treated as unavailable.
    using BackendDownCallback = std::function<void(const std::string &reason)>;

    explicit HttpForwarder(ForwardOptions opts) noexcept : m_opts(opts) {}

    void forward_buffered(const httplib::Request &req, httplib::Response &res,
                          const ForwardTarget &target, const BackendDownCallback &on_down) const;

    void forward_streaming(const httplib::Request &req, httplib::Response &res,
                           const ForwardTarget &target, SessionCallback on_session,
                           BackendDownCallback on_down) const;

    /**
     * @brief Streaming vs. buffered relay for a request.
     *
     * GET with `Accept` containing `text/event-stream` streams. POST/PUT/PATCH
     * with a JSON body streams only when the first listed `Accept` type is
     * `text/event-stream`. Nothing else streams.
     */
    [[nodiscard]] static bool wants_streaming(const httplib::Request &req);

    /// @brief Request headers without hop-by-hop and server-injected entries.
    [[nodiscard]] static httplib::Headers forwardable_headers(const httplib::Headers &headers);

    /// @brief Adds the CORS header set to `res`.
    static void apply_cors(httplib::Response &res);

    [[nodiscard]] static UpstreamFailure classify(httplib::Error error) noexcept;

    /// @brief Whether an unclassified client error text names a network condition.
    [[nodiscard]] static bool names_network_condition(std::string_view text);

    /// @brief `path` plus the request's query parameters, re-encoded.
    [[nodiscard]] static std::string with_query(const std::string &path,
                                                const httplib::Request &req);

  private:
    ForwardOptions m_opts;
};

} // namespace mcpmesh::mesh
