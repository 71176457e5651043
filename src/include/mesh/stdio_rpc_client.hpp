#pragma once
/**
 * @file stdio_rpc_client.hpp
 * @brief Line-delimited JSON-RPC client for a wrapped stdio MCP process.
 *
 * The child runs in its own process group with piped stdin/stdout/stderr.
 * Three threads serve it:
 *
 *   writer  takes frames from the outbound queue (1 s poll) and writes `json\n`;
 *           an empty frame is the exit sentinel
 *   reader  reads stdout lines, skips blanks and unparsable lines, and resolves
 *           responses by `id` against the pending table; EOF marks the client down
 *   stderr  drains the child's stderr into the logger
 *
 * `start()` performs the MCP handshake: `initialize`, the
 * `notifications/initialized` notification, `tools/list`, then an optional
 * `resources/list`.
 */
#include "mesh_platform.hpp"
#include "mesh/tool_schema.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace mcpmesh::mesh
{

struct StdioRpcOptions
{
    std::string name;
    /// Program followed by its arguments.
    std::vector<std::string> command;
    std::vector<std::pair<std::string, std::string>> env;
    /// Bound on each request's wait for a response.
    std::chrono::milliseconds timeout{30000};
    std::string client_name{"mcpmesh-bridge"};
};

class MCPMESH_UTILS_EXPORT StdioRpcClient
{
  public:
    static constexpr const char *kProtocolVersion = "2024-11-05";

    explicit StdioRpcClient(StdioRpcOptions opts);
    ~StdioRpcClient();

    StdioRpcClient(const StdioRpcClient &) = delete;
    StdioRpcClient &operator=(const StdioRpcClient &) = delete;

    /// @brief Spawns the process, starts the I/O threads and runs the handshake.
    bool start();

    /// @brief Stops both I/O threads (2 s join bound) and terminates the process tree.
    void cleanup();

    /// @brief cleanup(), a 1 s pause, then start().
    bool restart();

    /// @brief Process running AND both I/O threads alive.
    [[nodiscard]] bool is_alive() const;

    /**
     * @brief Sends a request and waits up to `timeout` (default: the configured one).
     * @return The full response frame, or nullopt when none arrived (transport failure).
     */
    std::optional<nlohmann::json> send_request(const std::string &method,
                                               const nlohmann::json &params,
                                               std::optional<std::chrono::milliseconds> timeout =
                                                   std::nullopt);

    /// @brief Queues a notification (no id, no response).
    void send_notification(const std::string &method, const nlohmann::json &params);

    [[nodiscard]] std::vector<ToolSchema> tools() const;
    [[nodiscard]] nlohmann::json resources() const;
    [[nodiscard]] nlohmann::json server_info() const;
    [[nodiscard]] uint64_t pid() const noexcept;
    [[nodiscard]] const StdioRpcOptions &options() const noexcept;

  private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpmesh::mesh

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
