#include "mesh_service.hpp"
#include "mesh/proxy_service.hpp"

#include <fmt/ranges.h>
#include <httplib.h>

#include <algorithm>
#include <array>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <random>
#include <shared_mutex>
#include <stop_token>
#include <thread>

namespace mcpmesh::mesh
{

using namespace std::chrono_literals;

namespace
{
constexpr std::array kReservedPrefixes = {"proxy/", "mcp/", "sse/", "messages/"};
constexpr int kServerThreads = 64;

void send_json(httplib::Response &res, int status, const nlohmann::json &body)
{
    res.status = status;
    res.set_content(body.dump(2), "application/json");
    HttpForwarder::apply_cors(res);
}

std::string connect_host(const std::string &host)
{
    return host == "0.0.0.0" ? std::string("127.0.0.1") : host;
}

std::string match_or_empty(const httplib::Request &req, std::size_t i)
{
    return req.matches.size() > i ? req.matches[i].str() : std::string();
}
} // namespace

void to_json(nlohmann::json &j, const Backend &b)
{
    j = nlohmann::json{{"host", b.host},
                       {"port", b.port},
                       {"transport", to_string(b.transport)},
                       {"status", b.status},
                       {"registered_at", b.registered_at}};
}

// ============================================================================
// Impl
// ============================================================================

struct ProxyService::Impl
{
    ProxySettings settings;
    ServiceRegistry &registry;
    HttpForwarder forwarder;
    SessionTable sessions;

    mutable std::shared_mutex mirror_mu;
    std::map<std::string, Backend> mirror;
    /// Serializes mirror + registry mutations (register, unregister, reload).
    std::mutex register_mu;

    httplib::Server server;
    std::jthread server_thread;
    std::jthread sweep_thread;
    std::mutex sweep_mu;
    std::condition_variable_any sweep_cv;
    std::atomic<int> bound_port{0};
    std::atomic<bool> running{false};

    Impl(ProxySettings s, ServiceRegistry &reg)
        : settings(std::move(s)), registry(reg),
          forwarder(ForwardOptions{std::chrono::duration_cast<std::chrono::milliseconds>(
                                       settings.connect_timeout),
                                   std::chrono::duration_cast<std::chrono::milliseconds>(
                                       settings.timeout)})
    {
    }

    std::vector<std::string> backend_names() const
    {
        std::shared_lock lk(mirror_mu);
        std::vector<std::string> names;
        names.reserve(mirror.size());
        for (const auto &[name, b] : mirror)
            names.push_back(name);
        return names;
    }

    std::optional<std::pair<std::string, Backend>> sole_backend() const
    {
        std::shared_lock lk(mirror_mu);
        if (mirror.size() != 1)
            return std::nullopt;
        return *mirror.begin();
    }

    void forward(const httplib::Request &req, httplib::Response &res, const std::string &name,
                 const Backend &backend, const std::string &path, bool streaming,
                 const std::string &request_id)
    {
        ForwardTarget target{name, connect_host(backend.host), backend.port,
                             HttpForwarder::with_query(path, req), request_id};
        auto on_down = [this, name](const std::string &reason) {
            LOGGER_WARN("Proxy: backend {} unavailable ({}); dropping its sessions", name, reason);
            sessions.drop_server(name);
        };
        if (streaming)
        {
            forwarder.forward_streaming(
                req, res, target,
                [this, name, request_id](const std::string &sid) {
                    sessions.record(sid, name, request_id);
                },
                on_down);
        }
        else
        {
            forwarder.forward_buffered(req, res, target, on_down);
        }
    }

    void not_registered(httplib::Response &res, const std::string &name)
    {
        const auto names = backend_names();
        LOGGER_ERROR("Proxy: server '{}' not registered; available: {}", name,
                     fmt::join(names, ", "));
        send_json(res, 404,
                  {{"error", fmt::format("Server '{}' not registered", name)},
                   {"available_servers", names}});
    }

    /// /mcp/{name}/... and GET /sse/{name}/...
    void handle_named(const httplib::Request &req, httplib::Response &res, const char *prefix,
                      bool always_stream)
    {
        const std::string name = match_or_empty(req, 1);
        const std::string rest = match_or_empty(req, 2);
        const std::string request_id = ProxyService::make_request_id();
        LOGGER_INFO("[{}] {} /{}/{} from {}:{}", request_id, req.method, prefix, name,
                    req.remote_addr, req.remote_port);

        std::optional<Backend> backend;
        {
            std::shared_lock lk(mirror_mu);
            auto it = mirror.find(name);
            if (it != mirror.end())
                backend = it->second;
        }
        if (!backend)
        {
            not_registered(res, name);
            return;
        }
        const std::string path = fmt::format("/{}{}", prefix, rest.empty() ? "/" : rest);
        forward(req, res, name, *backend, path,
                always_stream || HttpForwarder::wants_streaming(req), request_id);
    }

    void handle_sse_wrong_method(const httplib::Request &req, httplib::Response &res)
    {
        send_json(res, 405,
                  {{"error", "Method Not Allowed for SSE endpoint"},
                   {"message",
                    fmt::format("SSE endpoints only support GET requests, received {}", req.method)},
                   {"correct_usage", fmt::format("GET {}", req.path)},
                   {"tip", "Server-Sent Events require GET method for establishing connections"}});
        res.set_header("Allow", "GET, OPTIONS");
    }

    void handle_messages(const httplib::Request &req, httplib::Response &res)
    {
        const std::string rest = match_or_empty(req, 1);
        const std::string request_id = ProxyService::make_request_id();

        std::string name = req.get_param_value("server_name");
        if (name.empty())
            name = req.get_header_value("X-MCP-Server-Name");
        if (name.empty())
            name = req.get_header_value("Server-Name");

        const std::string session_id = req.get_param_value("session_id");
        if (name.empty() && !session_id.empty())
        {
            if (auto owner = sessions.server_for(session_id))
            {
                LOGGER_INFO("[{}] session {} routes to {}", request_id, session_id, *owner);
                name = *owner;
            }
            else
            {
                LOGGER_WARN("[{}] no backend known for session {}", request_id, session_id);
            }
        }

        std::optional<Backend> backend;
        if (name.empty())
        {
            if (auto sole = sole_backend())
            {
                name = sole->first;
                backend = sole->second;
            }
            else
            {
                std::string help =
                    "Add ?server_name=xxx to the query or an X-MCP-Server-Name header";
                if (!session_id.empty())
                    help += fmt::format(" (no backend found for session_id '{}')", session_id);
                send_json(res, 400,
                          {{"error", "Target server needs to be specified"},
                           {"available_servers", backend_names()},
                           {"help", help},
                           {"session_info",
                            {{"session_id", session_id.empty() ? nlohmann::json(nullptr)
                                                               : nlohmann::json(session_id)},
                             {"session_found", false},
                             {"total_sessions", sessions.size()}}}});
                return;
            }
        }
        else
        {
            std::shared_lock lk(mirror_mu);
            auto it = mirror.find(name);
            if (it != mirror.end())
                backend = it->second;
        }
        if (!backend)
        {
            not_registered(res, name);
            return;
        }
        const std::string path = fmt::format("/messages{}", rest.empty() ? "/" : rest);
        LOGGER_INFO("[{}] messages {} -> {} ({}:{})", request_id, req.method, name, backend->host,
                    backend->port);
        forward(req, res, name, *backend, path, /*streaming=*/false, request_id);
    }

    void handle_fallback(const httplib::Request &req, httplib::Response &res)
    {
        const std::string path = match_or_empty(req, 1);
        const bool reserved =
            path.empty() || std::any_of(kReservedPrefixes.begin(), kReservedPrefixes.end(),
                                        [&](const char *p) { return path.rfind(p, 0) == 0; });
        if (reserved)
        {
            send_json(res, 404, {{"error", "Not Found"}});
            return;
        }

        if (auto sole = sole_backend())
        {
            forward(req, res, sole->first, sole->second, "/" + path,
                    HttpForwarder::wants_streaming(req), ProxyService::make_request_id());
            return;
        }
        const auto names = backend_names();
        if (names.empty())
        {
            send_json(res, 503, {{"error", "No available MCP servers"}});
            return;
        }
        send_json(res, 200,
                  {{"message", "Target server must be specified in multi-server environment"},
                   {"available_servers", names},
                   {"endpoints",
                    {{"mcp", fmt::format("/mcp/{{server_name}}/{}", path)},
                     {"sse", fmt::format("/sse/{{server_name}}/{}", path)},
                     {"messages", fmt::format("/messages/{}?server_name={{server_name}}", path)}}}});
    }

    void handle_register(ProxyService &self, const httplib::Request &req, httplib::Response &res)
    {
        const std::string request_id = ProxyService::make_request_id();
        LOGGER_INFO("[{}] registration request from {}:{}", request_id, req.remote_addr,
                    req.remote_port);

        const auto body = nlohmann::json::parse(req.body, nullptr, /*allow_exceptions=*/false);
        if (!body.is_object())
        {
            send_json(res, 400, {{"error", "Request body must be a JSON object"}});
            return;
        }
        const auto name_it = body.find("server_name");
        const std::string name =
            name_it != body.end() && name_it->is_string() ? name_it->get<std::string>() : "";
        const auto port_it = body.find("port");
        if (name.empty() || port_it == body.end() || !port_it->is_number_integer())
        {
            send_json(res, 400, {{"error", "Missing required parameters: server_name, port"}});
            return;
        }
        const auto port = port_it->get<int64_t>();
        if (port < 1 || port > 65535)
        {
            send_json(res, 400, {{"error", fmt::format("Invalid port {}", port_it->dump())}});
            return;
        }

        std::string host = "localhost";
        if (auto it = body.find("host"); it != body.end() && it->is_string() &&
                                          !it->get<std::string>().empty())
        {
            host = it->get<std::string>();
        }
        std::string transport_name = "sse";
        if (auto it = body.find("transport"); it != body.end() && it->is_string())
            transport_name = it->get<std::string>();
        const auto transport = parse_transport(transport_name);
        if (!transport)
        {
            send_json(res, 400, {{"error", fmt::format("Unknown transport '{}'", transport_name)}});
            return;
        }
        std::optional<uint64_t> pid;
        if (auto it = body.find("pid"); it != body.end() && it->is_number_unsigned())
            pid = it->get<uint64_t>();

        const ApiReply reply = self.register_backend(name, host, static_cast<int>(port), *transport,
                                                     pid, request_id);
        send_json(res, reply.status, reply.body);
    }

    void install_routes(ProxyService &self)
    {
        server.new_task_queue = [] { return new httplib::ThreadPool(kServerThreads); };

        server.set_logger([](const httplib::Request &req, const httplib::Response &res) {
            LOGGER_DEBUG("Proxy: {} {} -> {}", req.method, req.path, res.status);
        });

        server.set_exception_handler(
            [](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep) {
                std::string what = "unknown error";
                try
                {
                    std::rethrow_exception(ep);
                }
                catch (const std::exception &ex)
                {
                    what = ex.what();
                }
                catch (...)
                {
                    what = "non-standard exception";
                }
                LOGGER_ERROR("Proxy: unhandled error on {} {}: {}", req.method, req.path, what);
                send_json(res, 500, {{"error", what}});
            });

        server.Options(R"(.*)", [](const httplib::Request &, httplib::Response &res) {
            res.status = 204;
            HttpForwarder::apply_cors(res);
        });

        server.Get("/", [&self](const httplib::Request &, httplib::Response &res) {
            send_json(res, 200, self.info_json());
        });
        server.Get("/proxy/status", [&self](const httplib::Request &, httplib::Response &res) {
            send_json(res, 200, self.status_json());
        });
        server.Get("/proxy/mapping", [&self](const httplib::Request &, httplib::Response &res) {
            send_json(res, 200, self.mapping());
        });
        server.Get("/proxy/health", [&self](const httplib::Request &, httplib::Response &res) {
            send_json(res, 200, self.health_json());
        });
        server.Post("/proxy/reload", [&self](const httplib::Request &, httplib::Response &res) {
            const std::size_t before = self.mapping().size();
            const std::size_t after = self.load_from_registry();
            std::vector<std::string> names;
            for (const auto &[name, b] : self.mapping())
                names.push_back(name);
            send_json(res, 200,
                      {{"status", "success"},
                       {"message",
                        fmt::format("Reload completed, server count: {} -> {}", before, after)},
                       {"servers", names}});
        });
        server.Post("/proxy/register", [this, &self](const httplib::Request &req,
                                                     httplib::Response &res) {
            handle_register(self, req, res);
        });
        server.Delete(R"(/proxy/unregister/([^/]+))",
                      [&self](const httplib::Request &req, httplib::Response &res) {
                          const std::string name = match_or_empty(req, 1);
                          auto reply = self.unregister_backend(name);
                          if (!reply)
                          {
                              send_json(res, 404,
                                        {{"error", fmt::format("Server {} not registered in proxy",
                                                               name)}});
                              return;
                          }
                          send_json(res, reply->status, reply->body);
                      });

        auto mcp = [this](const httplib::Request &req, httplib::Response &res) {
            handle_named(req, res, "mcp", false);
        };
        auto sse = [this](const httplib::Request &req, httplib::Response &res) {
            if (req.method == "HEAD")
            {
                handle_sse_wrong_method(req, res);
                return;
            }
            handle_named(req, res, "sse", true);
        };
        auto sse_wrong = [this](const httplib::Request &req, httplib::Response &res) {
            handle_sse_wrong_method(req, res);
        };
        auto messages = [this](const httplib::Request &req, httplib::Response &res) {
            handle_messages(req, res);
        };
        auto fallback = [this](const httplib::Request &req, httplib::Response &res) {
            handle_fallback(req, res);
        };

        constexpr const char *kMcp = R"(/mcp/([^/]+)(/.*)?)";
        constexpr const char *kSse = R"(/sse/([^/]+)(/.*)?)";
        constexpr const char *kMessages = R"(/messages(/.*)?)";
        constexpr const char *kFallback = R"(/(.*))";

        server.Get(kMcp, mcp).Post(kMcp, mcp).Put(kMcp, mcp).Patch(kMcp, mcp).Delete(kMcp, mcp);
        server.Get(kSse, sse)
            .Post(kSse, sse_wrong)
            .Put(kSse, sse_wrong)
            .Patch(kSse, sse_wrong)
            .Delete(kSse, sse_wrong);
        server.Get(kMessages, messages)
            .Post(kMessages, messages)
            .Put(kMessages, messages)
            .Patch(kMessages, messages)
            .Delete(kMessages, messages);
        server.Get(kFallback, fallback)
            .Post(kFallback, fallback)
            .Put(kFallback, fallback)
            .Patch(kFallback, fallback)
            .Delete(kFallback, fallback);
    }

    void sweep_loop(std::stop_token st, ProxyService *owner)
    {
        LOGGER_INFO("Proxy: session sweep every {}s", settings.session_sweep.count());
        while (!st.stop_requested())
        {
            {
                std::unique_lock lk(sweep_mu);
                sweep_cv.wait_for(lk, st, settings.session_sweep, [] { return false; });
            }
            if (st.stop_requested())
                break;
            try
            {
                owner->sweep_dead_records();
                owner->sweep_orphan_sessions();
            }
            catch (const std::exception &ex)
            {
                LOGGER_ERROR("Proxy: periodic sweep failed: {}", ex.what());
            }
        }
    }
};

// ============================================================================
// Public interface
// ============================================================================

ProxyService::ProxyService(ProxySettings settings, ServiceRegistry &registry)
    : pImpl(std::make_unique<Impl>(std::move(settings), registry))
{
    pImpl->install_routes(*this);
}

ProxyService::~ProxyService()
{
    stop();
}

const ProxySettings &ProxyService::settings() const noexcept
{
    return pImpl->settings;
}

SessionTable &ProxyService::sessions() noexcept
{
    return pImpl->sessions;
}

bool ProxyService::is_running() const noexcept
{
    return pImpl->running.load();
}

int ProxyService::port() const noexcept
{
    return pImpl->bound_port.load();
}

std::string ProxyService::make_request_id()
{
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(1000, 9999);
    const auto epoch = std::chrono::duration_cast<std::chrono::seconds>(
                           std::chrono::system_clock::now().time_since_epoch())
                           .count();
    return fmt::format("{}-{}", epoch, dist(rng));
}

std::size_t ProxyService::load_from_registry()
{
    struct Candidate
    {
        Backend backend;
        std::string started_at;
    };
    std::map<std::string, Candidate> fresh;

    const auto records = pImpl->registry.list_servers();
    LOGGER_INFO("Proxy: loading backends from {} registry record(s)", records.size());
    for (const auto &[key, rec] : records)
    {
        if (!is_network_transport(rec.transport) || !rec.port)
        {
            LOGGER_DEBUG("Proxy: skipping non-network record {}", key);
            continue;
        }
        if (!pImpl->registry.is_alive(rec))
        {
            LOGGER_DEBUG("Proxy: skipping dead record {} ({}:{})", key, rec.host, *rec.port);
            continue;
        }
        auto it = fresh.find(rec.name);
        if (it != fresh.end() && it->second.started_at >= rec.started_at)
            continue;
        fresh[rec.name] =
            Candidate{Backend{rec.host, *rec.port, rec.transport, "running", rec.started_at},
                      rec.started_at};
    }

    std::lock_guard reg_lk(pImpl->register_mu);
    std::unique_lock lk(pImpl->mirror_mu);
    pImpl->mirror.clear();
    for (auto &[name, c] : fresh)
    {
        LOGGER_INFO("Proxy: backend {} -> {}:{} ({})", name, c.backend.host, c.backend.port,
                    to_string(c.backend.transport));
        pImpl->mirror.emplace(name, std::move(c.backend));
    }
    if (pImpl->mirror.empty())
        LOGGER_INFO("Proxy: no live network backends in the registry");
    return pImpl->mirror.size();
}

bool ProxyService::start()
{
    if (pImpl->running.load())
        return true;

    auto &impl = *pImpl;
    int bound = -1;
    if (impl.settings.port == 0)
    {
        bound = impl.server.bind_to_any_port(impl.settings.host);
    }
    else if (impl.server.bind_to_port(impl.settings.host, impl.settings.port))
    {
        bound = impl.settings.port;
    }
    if (bound <= 0)
    {
        LOGGER_ERROR("Proxy: cannot bind {}:{}", impl.settings.host, impl.settings.port);
        return false;
    }
    impl.bound_port = bound;
    impl.running = true;

    impl.server_thread = std::jthread([&impl] {
        if (!impl.server.listen_after_bind())
            LOGGER_ERROR("Proxy: server loop exited with an error");
        impl.running = false;
    });
    impl.sweep_thread =
        std::jthread([&impl, this](std::stop_token st) { impl.sweep_loop(st, this); });

    // stop() is a no-op until the listen loop is up.
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!impl.server.is_running() && impl.running.load() &&
           std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::sleep_for(1ms);
    }

    LOGGER_INFO("Proxy: listening on http://{}:{}", impl.settings.host, bound);
    return true;
}

void ProxyService::stop()
{
    if (!pImpl)
        return;
    auto &impl = *pImpl;
    if (impl.server.is_running() || impl.server_thread.joinable())
    {
        impl.server.stop();
        if (impl.server_thread.joinable())
            impl.server_thread.join();
        LOGGER_INFO("Proxy: stopped");
    }
    impl.sweep_thread.request_stop();
    if (impl.sweep_thread.joinable())
        impl.sweep_thread.join();
    impl.running = false;
}

void ProxyService::wait()
{
    if (pImpl->server_thread.joinable())
        pImpl->server_thread.join();
}

ApiReply ProxyService::register_backend(const std::string &name, const std::string &host,
                                        int port, Transport transport,
                                        std::optional<uint64_t> pid, const std::string &request_id)
{
    if (!is_network_transport(transport))
    {
        return {400, {{"error", "Only http and sse servers can be proxied"}, {"request_id", request_id}}};
    }

    ServiceRecord rec;
    rec.name = name;
    rec.server_type = name;
    rec.transport = transport;
    rec.host = host;
    rec.port = port;
    rec.pid = pid;
    rec.source_path = "proxy-register";
    rec.fill_defaults();
    try
    {
        rec.validate();
    }
    catch (const std::invalid_argument &ex)
    {
        return {400, {{"error", ex.what()}, {"request_id", request_id}}};
    }

    std::lock_guard reg_lk(pImpl->register_mu);
    std::optional<Backend> previous;
    {
        std::unique_lock lk(pImpl->mirror_mu);
        if (auto it = pImpl->mirror.find(name); it != pImpl->mirror.end())
            previous = it->second;
        pImpl->mirror[name] = Backend{host, port, transport, "running", rec.started_at};
    }

    if (!pImpl->registry.register_server(rec))
    {
        std::unique_lock lk(pImpl->mirror_mu);
        if (previous)
            pImpl->mirror[name] = *previous;
        else
            pImpl->mirror.erase(name);
        LOGGER_ERROR("[{}] registry write for {} failed; mirror rolled back", request_id, name);
        return {500,
                {{"error", fmt::format("Failed to persist registration of {}", name)},
                 {"request_id", request_id}}};
    }

    LOGGER_INFO("[{}] registered {} -> {}:{} ({})", request_id, name, host, port,
                to_string(transport));
    return {200,
            {{"status", "success"},
             {"message", fmt::format("Server {} registered at {}:{}", name, host, port)},
             {"request_id", request_id},
             {"server_info",
              {{"name", name},
               {"host", host},
               {"port", port},
               {"transport", to_string(transport)},
               {"pid", pid ? nlohmann::json(*pid) : nlohmann::json(nullptr)}}}}};
}

std::optional<ApiReply> ProxyService::unregister_backend(const std::string &name)
{
    std::lock_guard reg_lk(pImpl->register_mu);
    Backend removed;
    {
        std::unique_lock lk(pImpl->mirror_mu);
        auto it = pImpl->mirror.find(name);
        if (it == pImpl->mirror.end())
            return std::nullopt;
        removed = it->second;
        pImpl->mirror.erase(it);
    }

    const auto keys = pImpl->registry.remove_by_name(name);
    if (!keys)
    {
        std::unique_lock lk(pImpl->mirror_mu);
        pImpl->mirror.emplace(name, removed);
        LOGGER_ERROR("Proxy: registry update for {} failed; mirror entry restored", name);
        return ApiReply{500, {{"error", fmt::format("Failed to unregister {} from the registry", name)}}};
    }

    const std::size_t dropped = pImpl->sessions.drop_server(name);
    LOGGER_INFO("Proxy: unregistered {} ({} registry record(s), {} session(s))", name,
                keys->size(), dropped);
    return ApiReply{200,
                    {{"status", "success"},
                     {"message", fmt::format("Server {} unregistered", name)},
                     {"removed_from_memory", true},
                     {"removed_from_registry", !keys->empty()},
                     {"sessions_removed", dropped}}};
}

std::map<std::string, Backend> ProxyService::mapping() const
{
    std::shared_lock lk(pImpl->mirror_mu);
    return pImpl->mirror;
}

std::optional<Backend> ProxyService::find_backend(const std::string &name) const
{
    std::shared_lock lk(pImpl->mirror_mu);
    auto it = pImpl->mirror.find(name);
    if (it == pImpl->mirror.end())
        return std::nullopt;
    return it->second;
}

std::size_t ProxyService::sweep_orphan_sessions()
{
    const auto dropped =
        pImpl->sessions.drop_orphans([this](const std::string &name) { return find_backend(name).has_value(); });
    if (dropped > 0)
        LOGGER_INFO("Proxy: swept {} orphan session(s)", dropped);
    return dropped;
}

std::size_t ProxyService::sweep_dead_records()
{
    const auto removed = pImpl->registry.clear_dead();
    if (!removed.empty())
        LOGGER_INFO("Proxy: pruned {} dead registry record(s)", removed.size());
    return removed.size();
}

nlohmann::json ProxyService::status_json() const
{
    nlohmann::json active = nlohmann::json::object();
    for (const auto &[id, info] : pImpl->sessions.snapshot())
    {
        active[id] = {{"server_name", info.server_name},
                      {"created_at", info.created_at},
                      {"request_id", info.request_id}};
    }
    const auto servers = mapping();
    return {{"proxy",
             {{"host", pImpl->settings.host}, {"port", port()}, {"status", is_running() ? "running" : "stopped"}}},
            {"servers", servers},
            {"total_servers", servers.size()},
            {"sessions", {{"total_sessions", active.size()}, {"active_sessions", active}}}};
}

nlohmann::json ProxyService::health_json() const
{
    nlohmann::json servers = nlohmann::json::object();
    for (const auto &[name, b] : mapping())
    {
        const char *path = b.transport == Transport::Sse ? "/sse/" : "/mcp";
        try
        {
            httplib::Client cli(connect_host(b.host), b.port);
            cli.set_connection_timeout(pImpl->settings.health_timeout);
            cli.set_read_timeout(pImpl->settings.health_timeout);
            int status = -1;
            const auto started = std::chrono::steady_clock::now();
            auto res = cli.Get(
                path, httplib::Headers{},
                [&status](const httplib::Response &r) {
                    status = r.status;
                    return false;
                },
                [](const char *, size_t) { return true; });
            const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                        std::chrono::steady_clock::now() - started)
                                        .count();
            if (status < 0)
            {
                servers[name] = {{"status", "unreachable"},
                                 {"error", httplib::to_string(res.error())},
                                 {"last_check", format_tools::local_timestamp()}};
            }
            else
            {
                servers[name] = {{"status", status < 500 ? "healthy" : "unhealthy"},
                                 {"http_status", status},
                                 {"response_time_ms", elapsed_ms},
                                 {"last_check", format_tools::local_timestamp()}};
            }
        }
        catch (const std::exception &ex)
        {
            servers[name] = {{"status", "unreachable"},
                             {"error", ex.what()},
                             {"last_check", format_tools::local_timestamp()}};
        }
    }
    return {{"proxy_status", "healthy"},
            {"timestamp", format_tools::local_timestamp()},
            {"servers", servers},
            {"session_stats", pImpl->sessions.stats()}};
}

nlohmann::json ProxyService::info_json() const
{
    std::vector<std::string> names;
    for (const auto &[name, b] : mapping())
        names.push_back(name);
    return {{"service", "mcpmesh proxy"},
            {"version", platform::get_version_string()},
            {"endpoints",
             {{"mcp", "/mcp/{server_name}/*"},
              {"sse", "/sse/{server_name}/* (GET only)"},
              {"messages", "/messages/*"},
              {"status", "/proxy/status"},
              {"mapping", "/proxy/mapping"},
              {"health", "/proxy/health"}}},
            {"available_servers", names},
            {"usage_tips",
             {{"sse_connection", "Use GET method: GET /sse/{server_name}/"},
              {"messages_request", "Use session_id for auto-routing: POST /messages/?session_id=xxx"},
              {"explicit_routing", "Or specify server: POST /messages/?server_name={server_name}"}}}};
}

} // namespace mcpmesh::mesh
