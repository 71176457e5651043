#pragma once
/**
 * @file service_record.hpp
 * @brief Transport enumeration and the persisted registry record.
 *
 * A `ServiceRecord` is one entry of `registry.json`. Its key is
 * `name-transport` for stdio and `name-transport-port` for http/sse, so one
 * logical service may hold several simultaneous records, one per transport
 * and port.
 */
#include "mesh_platform.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace mcpmesh::mesh
{

enum class Transport
{
    Stdio,
    Http,
    Sse
};

/// @brief "stdio", "http" or "sse".
MCPMESH_UTILS_EXPORT const char *to_string(Transport transport) noexcept;

/// @brief Case-insensitive parse of a transport name. Unknown names yield nullopt.
MCPMESH_UTILS_EXPORT std::optional<Transport> parse_transport(std::string_view text) noexcept;

/// @brief http and sse listen on a TCP port; stdio does not.
inline bool is_network_transport(Transport transport) noexcept
{
    return transport != Transport::Stdio;
}

/// @brief The endpoint path a backend serves for its transport ("/mcp", "/sse", or "" for stdio).
MCPMESH_UTILS_EXPORT const char *transport_endpoint_path(Transport transport) noexcept;

struct MCPMESH_UTILS_EXPORT ServiceRecord
{
    std::string name;
    /// Configured tool type; used by smart port reuse. Defaults to `name` when empty.
    std::string server_type;
    Transport transport = Transport::Sse;
    std::string host = "localhost";
    /// Required for http/sse, absent for stdio.
    std::optional<int> port;
    std::optional<uint64_t> pid;
    /// Local time, "%Y-%m-%d %H:%M:%S". Lexicographic order is chronological order.
    std::string started_at;
    /// Diagnostic: what created the record (executable, proxy API, ...).
    std::string source_path;

    /// @brief `name-transport[-port]`.
    [[nodiscard]] std::string key() const;

    /**
     * @brief Checks the record invariants.
     * @throws std::invalid_argument if the name is empty, or a network record has no
     *         port in 1..65535.
     */
    void validate() const;

    /// @brief Fills `started_at` with the current local time and `server_type` with `name` if empty.
    void fill_defaults();

    static std::string make_key(std::string_view name, Transport transport,
                                std::optional<int> port);
};

MCPMESH_UTILS_EXPORT void to_json(nlohmann::json &j, const ServiceRecord &rec);
/// @throws nlohmann::json::exception on missing or mistyped fields,
///         std::invalid_argument on an unknown transport.
MCPMESH_UTILS_EXPORT void from_json(const nlohmann::json &j, ServiceRecord &rec);

} // namespace mcpmesh::mesh

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
