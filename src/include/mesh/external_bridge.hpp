#pragma once
/**
 * @file external_bridge.hpp
 * @brief Republishes a stdio MCP process as a network backend of the mesh.
 *
 * The bridge owns a `StdioRpcClient` for the wrapped command and serves the
 * discovered tools on its own HTTP surface:
 *
 *   POST /mcp, /mcp/                 JSON-RPC (initialize, tools/list, tools/call,
 *                                    ping, resources/list, notifications/* -> 202)
 *   GET  /sse, /sse/                 SSE stream; first event is `endpoint` with
 *                                    `/messages/?session_id=<id>`
 *   POST /messages[/]?session_id=    JSON-RPC for that stream -> 202 Accepted;
 *                                    the reply arrives as `event: message`
 *   GET  /health
 *
 * Once serving, the bridge registers with the proxy under `derive_service_name()`
 * and unregisters again in `stop()` (also run by the destructor).
 *
 * Tool calls distinguish a dead transport from a failing tool: only the former
 * triggers the one-shot restart-and-retry, and only when `auto_restart` is set.
 */
#include "mesh_platform.hpp"
#include "mesh/service_record.hpp"
#include "mesh/stdio_rpc_client.hpp"
#include "mesh/tool_schema.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace mcpmesh::mesh
{

/// Contents of a bridge JSON file.
struct BridgeConfig
{
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::string description;
    std::chrono::milliseconds timeout{30000};
    bool auto_restart = true;
    std::string host{"localhost"};
    /// 0: bind any free port.
    int port = 0;
    Transport transport = Transport::Sse;
    /// Empty: try the default proxy locations.
    std::string proxy_url;

    /// @throws std::invalid_argument when `name` or `command` is missing or malformed.
    static BridgeConfig from_json(const nlohmann::json &j);
    [[nodiscard]] nlohmann::json to_json() const;

    /// @brief Reads a bridge file through JsonConfig.
    /// @throws std::runtime_error if the file cannot be read, std::invalid_argument if malformed.
    static BridgeConfig load(const std::filesystem::path &path);
};

/**
 * @brief URL-safe registration name: `external-` + `name` lowercased, spaces
 *        replaced by `-`, anything outside `[a-z0-9-_]` dropped.
 */
MCPMESH_UTILS_EXPORT std::string derive_service_name(std::string_view name);

class MCPMESH_UTILS_EXPORT ExternalBridge
{
  public:
    explicit ExternalBridge(BridgeConfig cfg);
    ~ExternalBridge();

    ExternalBridge(const ExternalBridge &) = delete;
    ExternalBridge &operator=(const ExternalBridge &) = delete;

    /// @brief Starts the wrapped process and discovers its tools.
    bool start_client();

    /**
     * @brief Binds the HTTP surface and serves on a background thread.
     * @return false if the socket could not be bound.
     */
    bool serve();

    /// @brief Unregisters, stops serving and cleans up the wrapped process. Idempotent.
    void stop();

    /// @brief Blocks until the server thread exits.
    void wait();

    /**
     * @brief Registers with the first proxy candidate that accepts.
     * @return The proxy URL that accepted, or nullopt.
     */
    std::optional<std::string> register_with_proxy();

    /// @brief Best-effort DELETE against the proxy that accepted the registration.
    bool unregister_from_proxy();

    /// @brief Runs one tool; failures come back as `isError` results, never as exceptions.
    nlohmann::json call_tool(const std::string &tool, const nlohmann::json &arguments);

    /**
     * @brief Processes one JSON-RPC frame.
     * @return The response, or nullopt for notifications.
     */
    std::optional<nlohmann::json> handle_rpc(const nlohmann::json &frame);

    [[nodiscard]] std::vector<ToolSchema> tools() const;
    [[nodiscard]] const std::string &service_name() const noexcept;
    [[nodiscard]] const BridgeConfig &config() const noexcept;
    /// @brief Bound port, valid after a successful `serve()`.
    [[nodiscard]] int port() const noexcept;
    /// @brief Wrapped process and its I/O threads alive.
    [[nodiscard]] bool is_alive() const;
    [[nodiscard]] uint64_t pid() const;

  private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpmesh::mesh

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
