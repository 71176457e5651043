#include "mesh_service.hpp"
#include "mesh/session_table.hpp"

#include <algorithm>
#include <regex>

namespace mcpmesh::mesh
{

namespace
{
const std::vector<std::regex> &session_patterns()
{
    static const std::vector<std::regex> patterns = {
        std::regex(R"re("session_id"\s*:\s*"([^"]+)")re", std::regex::icase),
        std::regex(R"(session_id=([A-Za-z0-9\-_]+))", std::regex::icase),
        std::regex(R"(sessionId["']\s*:\s*["']([^"']+)["'])", std::regex::icase),
    };
    return patterns;
}
} // namespace

bool SessionTable::record(const std::string &session_id, const std::string &server_name,
                          const std::string &request_id)
{
    if (session_id.empty() || server_name.empty())
        return false;
    std::lock_guard lk(m_mu);
    auto [it, inserted] = m_sessions.try_emplace(
        session_id, SessionInfo{server_name, format_tools::local_timestamp(), request_id});
    if (inserted)
    {
        LOGGER_INFO("Proxy: session {} -> {} [{}]", session_id, server_name, request_id);
    }
    return inserted;
}

std::optional<std::string> SessionTable::server_for(const std::string &session_id) const
{
    std::lock_guard lk(m_mu);
    auto it = m_sessions.find(session_id);
    if (it == m_sessions.end())
        return std::nullopt;
    return it->second.server_name;
}

std::size_t SessionTable::drop_server(const std::string &server_name)
{
    std::lock_guard lk(m_mu);
    const auto dropped =
        std::erase_if(m_sessions, [&](const auto &kv) { return kv.second.server_name == server_name; });
    if (dropped > 0)
        LOGGER_INFO("Proxy: dropped {} session(s) of {}", dropped, server_name);
    return dropped;
}

std::size_t SessionTable::drop_orphans(const std::function<bool(const std::string &)> &is_known)
{
    std::lock_guard lk(m_mu);
    return std::erase_if(m_sessions,
                         [&](const auto &kv) { return !is_known(kv.second.server_name); });
}

std::size_t SessionTable::size() const
{
    std::lock_guard lk(m_mu);
    return m_sessions.size();
}

std::size_t SessionTable::count_for(const std::string &server_name) const
{
    std::lock_guard lk(m_mu);
    std::size_t n = 0;
    for (const auto &[id, info] : m_sessions)
    {
        if (info.server_name == server_name)
            ++n;
    }
    return n;
}

std::map<std::string, SessionInfo> SessionTable::snapshot() const
{
    std::lock_guard lk(m_mu);
    return m_sessions;
}

nlohmann::json SessionTable::stats() const
{
    std::lock_guard lk(m_mu);
    nlohmann::json by_server = nlohmann::json::object();
    for (const auto &[id, info] : m_sessions)
    {
        by_server[info.server_name] = by_server.value(info.server_name, 0) + 1;
    }
    return {{"total", m_sessions.size()}, {"by_server", std::move(by_server)}};
}

std::vector<std::string> SessionTable::extract_session_ids(std::string_view text)
{
    std::vector<std::string> ids;
    if (text.empty())
        return ids;
    const std::string haystack(text);
    for (const auto &re : session_patterns())
    {
        for (auto it = std::sregex_iterator(haystack.begin(), haystack.end(), re);
             it != std::sregex_iterator(); ++it)
        {
            std::string id = (*it)[1].str();
            if (std::find(ids.begin(), ids.end(), id) == ids.end())
                ids.push_back(std::move(id));
        }
    }
    return ids;
}

} // namespace mcpmesh::mesh
