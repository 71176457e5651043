#pragma once
/**
 * @file session_table.hpp
 * @brief Proxy session affinity: session id -> owning backend name.
 *
 * Entries are created the first time a streamed response chunk carries a
 * recognizable session id, and are removed when the owning backend is
 * unregistered, when the backend fails at the transport level, or by the
 * periodic orphan sweep. The table is in-memory only.
 */
#include "mesh_platform.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
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

struct SessionInfo
{
    std::string server_name;
    std::string created_at;
    std::string request_id;
};

class MCPMESH_UTILS_EXPORT SessionTable
{
  public:
    /**
     * @brief Records `session_id` for `server_name` unless it is already known.
     * @return true if a new entry was created.
     */
    bool record(const std::string &session_id, const std::string &server_name,
                const std::string &request_id);

    [[nodiscard]] std::optional<std::string> server_for(const std::string &session_id) const;

    /// @brief Drops every session of `server_name`; returns how many were dropped.
    std::size_t drop_server(const std::string &server_name);

    /// @brief Drops sessions whose backend no longer satisfies `is_known`.
    std::size_t drop_orphans(const std::function<bool(const std::string &)> &is_known);

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t count_for(const std::string &server_name) const;
    [[nodiscard]] std::map<std::string, SessionInfo> snapshot() const;

    /// @brief `{total, by_server: {name: count}}`.
    [[nodiscard]] nlohmann::json stats() const;

    /**
     * @brief Session ids found in `text`, in order of appearance.
     *
     * Recognized forms (case-insensitive): `"session_id": "X"`,
     * `session_id=X` and `sessionId: 'X'` / `"sessionId": "X"`.
     */
    static std::vector<std::string> extract_session_ids(std::string_view text);

  private:
    mutable std::mutex m_mu;
    std::map<std::string, SessionInfo> m_sessions;
};

} // namespace mcpmesh::mesh

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
