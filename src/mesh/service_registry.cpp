#include "mesh_service.hpp"
#include "mesh/service_registry.hpp"

#include <httplib.h>

#include <algorithm>
#include <stdexcept>

namespace mcpmesh::mesh
{

namespace fs = std::filesystem;
using nlohmann::json;

namespace
{
constexpr const char *kHealthUserAgent = "mcpmesh-healthcheck/1.0";

/// Connect probes cannot target the wildcard address on every platform.
std::string probe_host(const std::string &host)
{
    if (host.empty() || host == "0.0.0.0")
        return "127.0.0.1";
    if (host == "::" || host == "[::]")
        return "::1";
    return host;
}

/// Parses every entry of the registry document, skipping malformed ones.
ServiceRegistry::RecordMap parse_records(const json &doc, const fs::path &file)
{
    ServiceRegistry::RecordMap out;
    if (!doc.is_object())
    {
        LOGGER_ERROR("ServiceRegistry: '{}' does not hold a JSON object", file.string());
        return out;
    }
    for (auto it = doc.begin(); it != doc.end(); ++it)
    {
        try
        {
            out.emplace(it.key(), it.value().get<ServiceRecord>());
        }
        catch (const std::exception &ex)
        {
            LOGGER_WARN("ServiceRegistry: skipping malformed entry '{}': {}", it.key(), ex.what());
        }
    }
    return out;
}

/// True if the on-disk entry still describes `rec` (nobody re-registered it meanwhile).
bool entry_matches(const json &entry, const ServiceRecord &rec)
{
    try
    {
        const auto current = entry.get<ServiceRecord>();
        return current.pid == rec.pid && current.started_at == rec.started_at &&
               current.host == rec.host && current.port == rec.port;
    }
    catch (const std::exception &)
    {
        // An entry that no longer parses is not ours to judge.
        return false;
    }
}
} // namespace

ServiceRegistry::ServiceRegistry(RegistryOptions opts) : m_opts(std::move(opts))
{
    if (m_opts.file.empty())
    {
        throw std::invalid_argument("ServiceRegistry: registry file path must be set");
    }
    if (m_opts.max_retries < 1)
    {
        throw std::invalid_argument("ServiceRegistry: max_retries must be at least 1");
    }
    m_opts.file = fs::absolute(m_opts.file).lexically_normal();

    std::error_code ec;
    fs::create_directories(m_opts.file.parent_path(), ec);
    if (ec)
    {
        throw std::runtime_error(fmt::format("ServiceRegistry: cannot create '{}': {}",
                                             m_opts.file.parent_path().string(), ec.message()));
    }

    // A corrupt file is reported here and again by every write attempt.
    std::error_code load_ec;
    if (!m_store.init(m_opts.file, /*createIfMissing=*/false, &load_ec))
    {
        LOGGER_ERROR("ServiceRegistry: initial load of '{}' failed: {}", m_opts.file.string(),
                     load_ec.message());
    }
    LOGGER_DEBUG("ServiceRegistry: using '{}'", m_opts.file.string());
}

ServiceRegistry::~ServiceRegistry() = default;

void ServiceRegistry::set_remote_probe(RemoteProbe probe)
{
    std::lock_guard lk(m_probe_mu);
    m_remote_probe = std::move(probe);
}

// ----------------------------------------------------------------------------
// Locked read-modify-write
// ----------------------------------------------------------------------------

bool ServiceRegistry::mutate(std::string_view what,
                             const std::function<bool(json &)> &fn)
{
    bool failed_hard = false;
    const bool done = utils::retry_with_backoff(
        m_opts.max_retries, utils::LinearBackoff(m_opts.retry_delay),
        [&](int attempt)
        {
            std::error_code ec;
            if (m_store.locked_update(fn, utils::LockMode::NonBlocking, &ec))
            {
                return true;
            }
            if (ec != std::errc::resource_unavailable_try_again)
            {
                LOGGER_ERROR("ServiceRegistry: {} failed on '{}': {}", what, m_opts.file.string(),
                             ec.message());
                failed_hard = true;
                return true; // stop retrying
            }
            LOGGER_WARN("ServiceRegistry: registry busy during {} (attempt {}/{})", what,
                        attempt + 1, m_opts.max_retries);
            return false;
        });
    if (failed_hard)
    {
        return false;
    }
    if (!done)
    {
        LOGGER_ERROR("ServiceRegistry: {} failed after {} attempts (lock contention)", what,
                     m_opts.max_retries);
    }
    return done;
}

bool ServiceRegistry::register_server(const ServiceRecord &record)
{
    record.validate();
    ServiceRecord rec = record;
    rec.fill_defaults();
    const std::string key = rec.key();

    const bool ok = mutate(fmt::format("register '{}'", key), [&](json &doc) {
        if (!doc.is_object())
            doc = json::object();
        doc[key] = rec;
        return true;
    });
    if (ok)
    {
        LOGGER_INFO("ServiceRegistry: registered {} ({}:{})", key, rec.host,
                    rec.port ? std::to_string(*rec.port) : std::string{"-"});
    }
    return ok;
}

bool ServiceRegistry::unregister_server(const std::string &key)
{
    bool found = false;
    const bool ok = mutate(fmt::format("unregister '{}'", key), [&](json &doc) {
        if (!doc.is_object() || !doc.contains(key))
            return false;
        doc.erase(key);
        found = true;
        return true;
    });
    if (!ok)
        return false;
    if (!found)
    {
        LOGGER_WARN("ServiceRegistry: '{}' not found in registry", key);
        return false;
    }
    LOGGER_INFO("ServiceRegistry: removed {}", key);
    return true;
}

bool ServiceRegistry::batch_update(const std::vector<ServiceRecord> &records)
{
    if (records.empty())
        return true;
    std::vector<ServiceRecord> prepared;
    prepared.reserve(records.size());
    for (const auto &r : records)
    {
        r.validate();
        prepared.push_back(r);
        prepared.back().fill_defaults();
    }
    return mutate(fmt::format("batch update of {} records", prepared.size()), [&](json &doc) {
        if (!doc.is_object())
            doc = json::object();
        for (const auto &rec : prepared)
            doc[rec.key()] = rec;
        return true;
    });
}

std::optional<std::vector<std::string>> ServiceRegistry::remove_by_name(std::string_view name,
                                                                        bool local_only)
{
    std::vector<std::string> removed;
    const bool ok = mutate(fmt::format("remove '{}'", name), [&](json &doc) {
        removed.clear();
        if (!doc.is_object())
            return false;
        for (auto it = doc.begin(); it != doc.end(); ++it)
        {
            const auto &v = it.value();
            if (!v.is_object() || v.value("name", std::string{}) != name)
                continue;
            if (local_only && !platform::is_local_host(v.value("host", std::string{"localhost"})))
                continue;
            removed.push_back(it.key());
        }
        for (const auto &k : removed)
            doc.erase(k);
        return !removed.empty();
    });
    if (!ok)
        return std::nullopt;
    for (const auto &k : removed)
        LOGGER_INFO("ServiceRegistry: removed {}", k);
    return removed;
}

std::optional<std::vector<std::string>>
ServiceRegistry::remove_keys(const std::vector<std::string> &keys)
{
    std::vector<std::string> removed;
    if (keys.empty())
        return removed;
    const bool ok = mutate(fmt::format("removal of {} keys", keys.size()), [&](json &doc) {
        removed.clear();
        if (!doc.is_object())
            return false;
        for (const auto &k : keys)
        {
            if (doc.contains(k))
            {
                doc.erase(k);
                removed.push_back(k);
            }
        }
        return !removed.empty();
    });
    if (!ok)
        return std::nullopt;
    for (const auto &k : removed)
        LOGGER_INFO("ServiceRegistry: removed {}", k);
    return removed;
}

std::optional<std::vector<std::string>> ServiceRegistry::remove_local_records()
{
    std::vector<std::string> removed;
    const bool ok = mutate("local cleanup", [&](json &doc) {
        removed.clear();
        if (!doc.is_object())
            return false;
        for (auto it = doc.begin(); it != doc.end(); ++it)
        {
            const auto &v = it.value();
            if (v.is_object() && platform::is_local_host(v.value("host", std::string{"localhost"})))
                removed.push_back(it.key());
        }
        for (const auto &k : removed)
            doc.erase(k);
        return !removed.empty();
    });
    if (!ok)
        return std::nullopt;
    LOGGER_INFO("ServiceRegistry: removed {} local records", removed.size());
    return removed;
}

// ----------------------------------------------------------------------------
// Reads
// ----------------------------------------------------------------------------

ServiceRegistry::RecordMap ServiceRegistry::list_servers() const
{
    std::error_code ec;
    if (!m_store.reload(&ec))
    {
        LOGGER_ERROR("ServiceRegistry: cannot read '{}': {}", m_opts.file.string(), ec.message());
        return {};
    }
    return parse_records(m_store.snapshot(), m_opts.file);
}

std::vector<ServiceRecord> ServiceRegistry::servers_by_transport(Transport transport) const
{
    std::vector<ServiceRecord> out;
    for (auto &[key, rec] : list_servers())
    {
        if (rec.transport == transport)
            out.push_back(rec);
    }
    return out;
}

// ----------------------------------------------------------------------------
// Liveness
// ----------------------------------------------------------------------------

bool ServiceRegistry::default_remote_probe(const ServiceRecord &record) const
{
    if (!record.port)
        return false;

    httplib::Client cli(record.host, *record.port);
    cli.set_connection_timeout(m_opts.remote_probe_timeout);
    cli.set_read_timeout(m_opts.remote_probe_timeout);
    cli.set_follow_location(false);

    // Only the status line matters; an SSE endpoint would otherwise stream forever.
    int status = -1;
    httplib::Headers headers{{"User-Agent", kHealthUserAgent}};
    auto res = cli.Get(
        transport_endpoint_path(record.transport), headers,
        [&status](const httplib::Response &r) {
            status = r.status;
            return false;
        },
        [](const char *, size_t) { return true; });
    if (status < 0)
    {
        LOGGER_DEBUG("ServiceRegistry: remote {} unreachable ({}:{}): {}", record.name, record.host,
                     *record.port, httplib::to_string(res.error()));
        return false;
    }
    const bool alive = status >= 200 && status < 400;
    LOGGER_DEBUG("ServiceRegistry: remote {} answered {} ({})", record.name, status,
                 alive ? "alive" : "dead");
    return alive;
}

bool ServiceRegistry::is_alive(const ServiceRecord &record) const
{
    if (platform::is_local_host(record.host))
    {
        if (record.pid && !platform::is_process_healthy(*record.pid))
        {
            LOGGER_DEBUG("ServiceRegistry: local {} has no process (pid {})", record.name,
                         *record.pid);
            return false;
        }
        if (is_network_transport(record.transport))
        {
            if (!record.port)
                return false;
            const bool open =
                platform::tcp_connect_probe(probe_host(record.host), *record.port,
                                            m_opts.local_probe_timeout);
            if (!open)
            {
                LOGGER_DEBUG("ServiceRegistry: local {} port {} not accepting", record.name,
                             *record.port);
            }
            return open;
        }
        return true;
    }

    if (!is_network_transport(record.transport))
    {
        LOGGER_DEBUG("ServiceRegistry: remote stdio {} cannot be checked; assuming alive",
                     record.name);
        return true;
    }

    RemoteProbe probe;
    {
        std::lock_guard lk(m_probe_mu);
        probe = m_remote_probe;
    }
    try
    {
        return probe ? probe(record) : default_remote_probe(record);
    }
    catch (const std::exception &ex)
    {
        // A probe fault is not evidence of death: keep the record.
        LOGGER_WARN("ServiceRegistry: probe of remote {} ({}:{}) faulted: {}; keeping it",
                    record.name, record.host, record.port.value_or(0), ex.what());
        return true;
    }
}

std::vector<std::string> ServiceRegistry::clear_dead()
{
    // Probes run outside the file lock; removal re-checks that the entry is unchanged.
    std::vector<std::pair<std::string, ServiceRecord>> dead;
    for (auto &[key, rec] : list_servers())
    {
        if (!is_alive(rec))
            dead.emplace_back(key, rec);
    }
    if (dead.empty())
        return {};

    std::vector<std::string> removed;
    const bool ok = mutate("dead-record sweep", [&](json &doc) {
        removed.clear();
        if (!doc.is_object())
            return false;
        for (const auto &[key, rec] : dead)
        {
            if (doc.contains(key) && entry_matches(doc.at(key), rec))
            {
                doc.erase(key);
                removed.push_back(key);
            }
        }
        return !removed.empty();
    });
    if (!ok)
        return {};
    for (const auto &k : removed)
        LOGGER_INFO("ServiceRegistry: cleared dead record {}", k);
    return removed;
}

// ----------------------------------------------------------------------------
// Reports
// ----------------------------------------------------------------------------

json ServiceRegistry::generate_client_config(std::string_view client_type,
                                             const std::vector<ServerConfig> &configured)
{
    const bool cursor = client_type == "cursor";
    if (!cursor && client_type != "claude_desktop")
    {
        throw std::invalid_argument(
            fmt::format("unknown client type '{}' (expected cursor or claude_desktop)", client_type));
    }

    clear_dead();

    json servers = json::object();
    for (const auto &cfg : configured)
    {
        if (cfg.transport != Transport::Stdio || !cfg.enabled || cfg.command.empty())
            continue;
        json entry{{"command", cfg.command.front()},
                   {"args", std::vector<std::string>(cfg.command.begin() + 1, cfg.command.end())},
                   {"env", cfg.env},
                   {"description", cfg.description}};
        servers[fmt::format("{}-stdio", cfg.name)] = std::move(entry);
    }

    for (const auto &[key, rec] : list_servers())
    {
        if (!is_network_transport(rec.transport) || !rec.port)
            continue;
        const std::string url = fmt::format("http://{}:{}{}", rec.host, *rec.port,
                                            transport_endpoint_path(rec.transport));
        std::string description;
        for (const auto &cfg : configured)
        {
            if (cfg.name == rec.name || cfg.server_type == rec.server_type)
            {
                description = cfg.description;
                break;
            }
        }
        json entry;
        if (cursor)
        {
            entry = {{"url", url}, {"description", description}};
        }
        else
        {
            entry = {{"transport", {{"type", to_string(rec.transport)}, {"url", url}}},
                     {"description", description}};
        }
        servers[fmt::format("{}-{}", rec.name, to_string(rec.transport))] = std::move(entry);
    }

    return json{{"client_type", std::string(client_type)},
                {"generated_at", format_tools::local_timestamp()},
                {"servers_count", servers.size()},
                {"mcpServers", std::move(servers)}};
}

json ServiceRegistry::status()
{
    clear_dead();
    const auto records = list_servers();

    json by_transport{{"stdio", 0}, {"http", 0}, {"sse", 0}};
    json servers = json::object();
    for (const auto &[key, rec] : records)
    {
        auto &count = by_transport[to_string(rec.transport)];
        count = count.get<int>() + 1;
        servers[key] = {
            {"name", rec.name},
            {"transport", to_string(rec.transport)},
            {"host", rec.host},
            {"port", rec.port ? json(*rec.port) : json(nullptr)},
            {"started_at", rec.started_at},
            {"alive", is_alive(rec)},
            {"local", platform::is_local_host(rec.host)},
        };
    }
    return json{{"total", records.size()},
                {"by_transport", std::move(by_transport)},
                {"servers", std::move(servers)}};
}

} // namespace mcpmesh::mesh
