#include "mesh_service.hpp"
#include "mesh/external_bridge.hpp"

#include <fmt/ranges.h>
#include <httplib.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <random>
#include <shared_mutex>
#include <stdexcept>
#include <thread>

namespace mcpmesh::mesh
{

using namespace std::chrono_literals;

namespace
{
constexpr int kDefaultProxyPort = 1888;
constexpr auto kProxyTimeout = 5s;
constexpr auto kKeepaliveInterval = 15s;
constexpr int kServerThreads = 32;

nlohmann::json tool_error(const std::string &text)
{
    return {{"content", nlohmann::json::array({{{"type", "text"}, {"text", text}}})},
            {"isError", true}};
}

nlohmann::json rpc_error(const nlohmann::json &id, int code, const std::string &message)
{
    return {{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

void send_json(httplib::Response &res, int status, const nlohmann::json &body)
{
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

std::string make_session_id()
{
    thread_local std::mt19937_64 rng{std::random_device{}()};
    return fmt::format("{:016x}{:016x}", rng(), rng());
}

std::string strip_trailing_slash(std::string url)
{
    while (!url.empty() && url.back() == '/')
        url.pop_back();
    return url;
}

/// One open GET /sse stream and the frames waiting for it.
struct SseSession
{
    std::mutex mu;
    std::condition_variable cv;
    std::deque<std::string> frames;
    bool closed = false;

    void push(std::string frame)
    {
        {
            std::lock_guard lk(mu);
            frames.push_back(std::move(frame));
        }
        cv.notify_one();
    }

    void close()
    {
        {
            std::lock_guard lk(mu);
            closed = true;
        }
        cv.notify_all();
    }
};
} // namespace

// ============================================================================
// BridgeConfig
// ============================================================================

BridgeConfig BridgeConfig::from_json(const nlohmann::json &j)
{
    if (!j.is_object())
        throw std::invalid_argument("bridge config must be a JSON object");
    if (!j.contains("name") || !j["name"].is_string() || j["name"].get<std::string>().empty())
        throw std::invalid_argument("bridge config requires a non-empty string 'name'");

    BridgeConfig cfg;
    cfg.name = j["name"].get<std::string>();

    const auto &cmd = j.value("command", nlohmann::json());
    if (cmd.is_string())
    {
        cfg.command = cmd.get<std::string>();
    }
    else if (cmd.is_array() && !cmd.empty())
    {
        // ["prog", "arg", ...] is accepted as shorthand for command + args.
        for (const auto &part : cmd)
        {
            if (!part.is_string())
                throw std::invalid_argument("bridge 'command' entries must be strings");
        }
        cfg.command = cmd.front().get<std::string>();
        for (auto it = std::next(cmd.begin()); it != cmd.end(); ++it)
            cfg.args.push_back(it->get<std::string>());
    }
    if (cfg.command.empty())
        throw std::invalid_argument(fmt::format("bridge '{}' has no 'command'", cfg.name));

    if (auto it = j.find("args"); it != j.end() && !it->is_null())
    {
        if (!it->is_array())
            throw std::invalid_argument("bridge 'args' must be an array");
        for (const auto &a : *it)
            cfg.args.push_back(a.is_string() ? a.get<std::string>() : a.dump());
    }
    if (auto it = j.find("env"); it != j.end() && !it->is_null())
    {
        if (!it->is_object())
            throw std::invalid_argument("bridge 'env' must be an object");
        for (const auto &[k, v] : it->items())
            cfg.env[k] = v.is_string() ? v.get<std::string>() : v.dump();
    }

    cfg.description = j.value("description", std::string());
    if (auto it = j.find("timeout"); it != j.end() && it->is_number())
    {
        const double secs = it->get<double>();
        if (secs <= 0)
            throw std::invalid_argument("bridge 'timeout' must be positive");
        cfg.timeout = std::chrono::milliseconds(static_cast<int64_t>(secs * 1000));
    }
    cfg.auto_restart = j.value("auto_restart", true);
    if (auto it = j.find("host"); it != j.end() && it->is_string())
        cfg.host = it->get<std::string>();
    if (auto it = j.find("port"); it != j.end() && !it->is_null())
    {
        if (!it->is_number_integer() || it->get<int>() < 0 || it->get<int>() > 65535)
            throw std::invalid_argument("bridge 'port' must be an integer in 0..65535");
        cfg.port = it->get<int>();
    }
    if (auto it = j.find("transport"); it != j.end() && it->is_string())
    {
        auto t = parse_transport(it->get<std::string>());
        if (!t || !is_network_transport(*t))
            throw std::invalid_argument(
                fmt::format("bridge transport must be http or sse, got '{}'", it->get<std::string>()));
        cfg.transport = *t;
    }
    cfg.proxy_url = j.value("proxy_url", std::string());
    return cfg;
}

nlohmann::json BridgeConfig::to_json() const
{
    return {{"name", name},
            {"command", command},
            {"args", args},
            {"env", env},
            {"description", description},
            {"timeout", std::chrono::duration<double>(timeout).count()},
            {"auto_restart", auto_restart},
            {"host", host},
            {"port", port},
            {"transport", mesh::to_string(transport)},
            {"proxy_url", proxy_url}};
}

BridgeConfig BridgeConfig::load(const std::filesystem::path &path)
{
    std::error_code ec;
    utils::JsonConfig file(path, /*createIfMissing=*/false, &ec);
    if (ec || !file.is_initialized())
    {
        throw std::runtime_error(fmt::format("cannot read bridge config '{}': {}", path.string(),
                                             ec ? ec.message() : std::string("not initialized")));
    }
    return from_json(file.snapshot());
}

std::string derive_service_name(std::string_view name)
{
    std::string out = "external-";
    for (char c : name)
    {
        const auto uc = static_cast<unsigned char>(c);
        if (c == ' ')
            out.push_back('-');
        else if (std::isalnum(uc) || c == '-' || c == '_')
            out.push_back(static_cast<char>(std::tolower(uc)));
    }
    return out;
}

// ============================================================================
// Impl
// ============================================================================

struct ExternalBridge::Impl
{
    BridgeConfig cfg;
    std::string service_name;

    // Calls hold the client shared; a restart holds it exclusively.
    mutable std::shared_mutex client_mu;
    std::unique_ptr<StdioRpcClient> client;
    uint64_t generation = 0;

    httplib::Server server;
    std::jthread server_thread;
    std::atomic<bool> serving{false};
    int bound_port = 0;

    std::mutex sessions_mu;
    std::map<std::string, std::shared_ptr<SseSession>> sessions;

    std::mutex proxy_mu;
    std::string registered_proxy;

    explicit Impl(BridgeConfig c) : cfg(std::move(c)), service_name(derive_service_name(cfg.name))
    {
        StdioRpcOptions opts;
        opts.name = cfg.name;
        opts.command.push_back(cfg.command);
        opts.command.insert(opts.command.end(), cfg.args.begin(), cfg.args.end());
        opts.env.assign(cfg.env.begin(), cfg.env.end());
        opts.timeout = cfg.timeout;
        client = std::make_unique<StdioRpcClient>(std::move(opts));
    }

    /// Restarts the client unless another caller already did since `seen`.
    void restart_client(uint64_t seen)
    {
        std::unique_lock lk(client_mu);
        if (generation != seen)
            return;
        LOGGER_WARN("Bridge[{}]: wrapped process not answering; restarting", cfg.name);
        if (!client->restart())
            LOGGER_ERROR("Bridge[{}]: restart failed", cfg.name);
        ++generation;
    }

    std::shared_ptr<SseSession> find_session(const std::string &id)
    {
        std::lock_guard lk(sessions_mu);
        auto it = sessions.find(id);
        return it == sessions.end() ? nullptr : it->second;
    }

    void close_sessions()
    {
        std::lock_guard lk(sessions_mu);
        for (auto &[id, s] : sessions)
            s->close();
    }

    std::vector<std::string> proxy_candidates() const
    {
        if (!cfg.proxy_url.empty())
            return {strip_trailing_slash(cfg.proxy_url)};
        std::vector<std::string> out{fmt::format("http://localhost:{}", kDefaultProxyPort),
                                     fmt::format("http://127.0.0.1:{}", kDefaultProxyPort)};
        const std::string lan = platform::get_local_ip();
        if (!lan.empty() && lan != "127.0.0.1")
            out.push_back(fmt::format("http://{}:{}", lan, kDefaultProxyPort));
        return out;
    }

    void setup_routes(ExternalBridge *self);
};

void ExternalBridge::Impl::setup_routes(ExternalBridge *self)
{
    server.new_task_queue = [] { return new httplib::ThreadPool(kServerThreads); };

    server.set_exception_handler(
        [this](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep) {
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
            LOGGER_ERROR("Bridge[{}]: unhandled error on {} {}: {}", cfg.name, req.method,
                         req.path, what);
            send_json(res, 500, {{"error", what}});
        });

    server.Post(R"(/mcp/?)", [self](const httplib::Request &req, httplib::Response &res) {
        nlohmann::json frame = nlohmann::json::parse(req.body, nullptr, /*allow_exceptions=*/false);
        if (frame.is_discarded())
        {
            send_json(res, 400, rpc_error(nullptr, -32700, "Parse error"));
            return;
        }
        if (frame.is_array())
        {
            nlohmann::json replies = nlohmann::json::array();
            for (const auto &f : frame)
            {
                if (auto r = self->handle_rpc(f))
                    replies.push_back(std::move(*r));
            }
            if (replies.empty())
            {
                res.status = 202;
                return;
            }
            send_json(res, 200, replies);
            return;
        }
        if (auto reply = self->handle_rpc(frame))
            send_json(res, 200, *reply);
        else
            res.status = 202;
    });

    server.Get(R"(/sse/?)", [this](const httplib::Request &, httplib::Response &res) {
        const std::string id = make_session_id();
        auto session = std::make_shared<SseSession>();
        session->push(fmt::format("event: endpoint\ndata: /messages/?session_id={}\n\n", id));
        {
            std::lock_guard lk(sessions_mu);
            sessions.emplace(id, session);
        }
        LOGGER_DEBUG("Bridge[{}]: SSE session {} opened", cfg.name, id);

        res.set_header("Cache-Control", "no-cache");
        res.set_header("Connection", "keep-alive");
        res.set_chunked_content_provider(
            "text/event-stream",
            [this, session](size_t, httplib::DataSink &sink) {
                std::unique_lock lk(session->mu);
                const bool ready = session->cv.wait_for(lk, kKeepaliveInterval, [&] {
                    return !session->frames.empty() || session->closed;
                });
                if (session->closed || !serving.load())
                {
                    sink.done();
                    return true;
                }
                if (!ready)
                {
                    lk.unlock();
                    static constexpr char kKeepalive[] = ": keepalive\n\n";
                    return sink.write(kKeepalive, sizeof(kKeepalive) - 1);
                }
                std::deque<std::string> out;
                out.swap(session->frames);
                lk.unlock();
                for (const auto &f : out)
                {
                    if (!sink.write(f.data(), f.size()))
                        return false;
                }
                return true;
            },
            [this, id](bool) {
                std::lock_guard lk(sessions_mu);
                sessions.erase(id);
                LOGGER_DEBUG("Bridge[{}]: SSE session {} closed", cfg.name, id);
            });
    });

    server.Post(R"(/messages/?)", [this, self](const httplib::Request &req, httplib::Response &res) {
        const std::string id = req.get_param_value("session_id");
        if (id.empty())
        {
            send_json(res, 400, {{"error", "Missing session_id"}});
            return;
        }
        auto session = find_session(id);
        if (!session)
        {
            send_json(res, 404, {{"error", "Could not find session"}, {"session_id", id}});
            return;
        }
        nlohmann::json frame = nlohmann::json::parse(req.body, nullptr, false);
        if (frame.is_discarded())
        {
            send_json(res, 400, rpc_error(nullptr, -32700, "Parse error"));
            return;
        }
        if (auto reply = self->handle_rpc(frame))
            session->push(fmt::format("event: message\ndata: {}\n\n", reply->dump()));
        res.status = 202;
        res.set_content("Accepted", "text/plain");
    });

    server.Get("/health", [this, self](const httplib::Request &, httplib::Response &res) {
        const bool alive = self->is_alive();
        nlohmann::json tool_list = nlohmann::json::array();
        for (const auto &t : self->tools())
            tool_list.push_back({{"name", t.name()}, {"description", t.full_description()}});
        send_json(res, alive ? 200 : 503,
                  {{"status", alive ? "healthy" : "unhealthy"},
                   {"name", cfg.name},
                   {"service_name", service_name},
                   {"transport", mesh::to_string(cfg.transport)},
                   {"tools", std::move(tool_list)}});
    });
}

// ============================================================================
// ExternalBridge
// ============================================================================

ExternalBridge::ExternalBridge(BridgeConfig cfg) : pImpl(std::make_unique<Impl>(std::move(cfg)))
{
    pImpl->setup_routes(this);
}

ExternalBridge::~ExternalBridge()
{
    stop();
}

bool ExternalBridge::start_client()
{
    std::unique_lock lk(pImpl->client_mu);
    const bool ok = pImpl->client->start();
    ++pImpl->generation;
    if (ok)
    {
        LOGGER_INFO("Bridge[{}]: wrapped '{}' with {} tool(s)", pImpl->cfg.name, pImpl->cfg.command,
                    pImpl->client->tools().size());
    }
    return ok;
}

bool ExternalBridge::serve()
{
    auto &impl = *pImpl;
    if (impl.serving.load())
        return true;

    int bound = -1;
    if (impl.cfg.port == 0)
        bound = impl.server.bind_to_any_port(impl.cfg.host);
    else if (impl.server.bind_to_port(impl.cfg.host, impl.cfg.port))
        bound = impl.cfg.port;
    if (bound <= 0)
    {
        LOGGER_ERROR("Bridge[{}]: cannot bind {}:{}", impl.cfg.name, impl.cfg.host, impl.cfg.port);
        return false;
    }
    impl.bound_port = bound;
    impl.serving = true;
    impl.server_thread = std::jthread([&impl] {
        if (!impl.server.listen_after_bind())
            LOGGER_ERROR("Bridge[{}]: server loop exited with an error", impl.cfg.name);
        impl.serving = false;
    });

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!impl.server.is_running() && impl.serving.load() &&
           std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::sleep_for(1ms);
    }
    LOGGER_INFO("Bridge[{}]: serving '{}' on http://{}:{}", impl.cfg.name, impl.service_name,
                impl.cfg.host, bound);
    return true;
}

void ExternalBridge::stop()
{
    if (!pImpl)
        return;
    auto &impl = *pImpl;
    unregister_from_proxy();

    impl.serving = false;
    impl.close_sessions();
    if (impl.server.is_running() || impl.server_thread.joinable())
    {
        impl.server.stop();
        if (impl.server_thread.joinable())
            impl.server_thread.join();
    }

    std::unique_lock lk(impl.client_mu);
    impl.client->cleanup();
}

void ExternalBridge::wait()
{
    if (pImpl->server_thread.joinable())
        pImpl->server_thread.join();
}

std::optional<std::string> ExternalBridge::register_with_proxy()
{
    auto &impl = *pImpl;
    std::string host = impl.cfg.host;
    if (host.empty() || host == "0.0.0.0")
        host = platform::get_local_ip();

    const nlohmann::json body{{"server_name", impl.service_name},
                              {"host", host},
                              {"port", impl.bound_port},
                              {"transport", mesh::to_string(impl.cfg.transport)},
                              {"pid", platform::get_pid()}};

    for (const auto &url : impl.proxy_candidates())
    {
        httplib::Client cli(url);
        cli.set_connection_timeout(kProxyTimeout);
        cli.set_read_timeout(kProxyTimeout);
        auto res = cli.Post("/proxy/register", body.dump(), "application/json");
        if (!res)
        {
            LOGGER_DEBUG("Bridge[{}]: proxy {} unreachable ({})", impl.cfg.name, url,
                         httplib::to_string(res.error()));
            continue;
        }
        if (res->status != 200)
        {
            LOGGER_WARN("Bridge[{}]: proxy {} refused registration: {} {}", impl.cfg.name, url,
                        res->status, res->body);
            continue;
        }
        std::lock_guard lk(impl.proxy_mu);
        impl.registered_proxy = url;
        LOGGER_INFO("Bridge[{}]: registered as '{}' with {}", impl.cfg.name, impl.service_name, url);
        return url;
    }
    LOGGER_WARN("Bridge[{}]: no proxy accepted the registration", impl.cfg.name);
    return std::nullopt;
}

bool ExternalBridge::unregister_from_proxy()
{
    auto &impl = *pImpl;
    std::string url;
    {
        std::lock_guard lk(impl.proxy_mu);
        url.swap(impl.registered_proxy);
    }
    if (url.empty())
        return false;

    httplib::Client cli(url);
    cli.set_connection_timeout(kProxyTimeout);
    cli.set_read_timeout(kProxyTimeout);
    auto res = cli.Delete("/proxy/unregister/" + impl.service_name);
    if (!res)
    {
        LOGGER_WARN("Bridge[{}]: unregister from {} failed ({})", impl.cfg.name, url,
                    httplib::to_string(res.error()));
        return false;
    }
    LOGGER_INFO("Bridge[{}]: unregistered from {} ({})", impl.cfg.name, url, res->status);
    return res->status == 200 || res->status == 404;
}

nlohmann::json ExternalBridge::call_tool(const std::string &tool, const nlohmann::json &arguments)
{
    auto &impl = *pImpl;
    const auto catalog = tools();
    auto it = std::find_if(catalog.begin(), catalog.end(),
                           [&](const ToolSchema &t) { return t.name() == tool; });
    if (it == catalog.end())
        return tool_error(fmt::format("Error: unknown tool '{}'", tool));
    if (auto problem = it->validate(arguments))
        return tool_error(*problem);

    const nlohmann::json params{
        {"name", tool}, {"arguments", arguments.is_null() ? nlohmann::json::object() : arguments}};

    for (int attempt = 0; attempt < 2; ++attempt)
    {
        uint64_t seen = 0;
        bool alive = false;
        std::optional<nlohmann::json> resp;
        {
            std::shared_lock lk(impl.client_mu);
            seen = impl.generation;
            resp = impl.client->send_request("tools/call", params);
            if (!resp)
                alive = impl.client->is_alive();
        }
        if (resp)
        {
            if (auto err = resp->find("error"); err != resp->end())
            {
                const std::string msg =
                    err->is_object() ? err->value("message", err->dump()) : err->dump();
                return tool_error("Tool call error: " + msg);
            }
            return resp->value("result", nlohmann::json::object());
        }
        // Only a dead client is restarted and resent to; a live one may still be running the tool.
        if (alive || attempt > 0 || !impl.cfg.auto_restart)
            break;
        impl.restart_client(seen);
    }
    return tool_error("Tool call failed: no response");
}

std::optional<nlohmann::json> ExternalBridge::handle_rpc(const nlohmann::json &frame)
{
    auto &impl = *pImpl;
    const bool has_id = frame.is_object() && frame.contains("id");
    const nlohmann::json id = has_id ? frame["id"] : nlohmann::json(nullptr);
    if (!frame.is_object() || !frame.contains("method") || !frame["method"].is_string())
    {
        if (!has_id)
            return std::nullopt;
        return rpc_error(id, -32600, "Invalid Request");
    }

    const std::string method = frame["method"].get<std::string>();
    const nlohmann::json params = frame.value("params", nlohmann::json::object());
    if (method.rfind("notifications/", 0) == 0 || !has_id)
        return std::nullopt;

    auto ok = [&](nlohmann::json result) {
        return nlohmann::json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
    };

    if (method == "initialize")
    {
        nlohmann::json info{{"name", impl.service_name}, {"version", platform::get_version_string()}};
        return ok({{"protocolVersion",
                    params.is_object() ? params.value("protocolVersion",
                                                      std::string(StdioRpcClient::kProtocolVersion))
                                       : std::string(StdioRpcClient::kProtocolVersion)},
                   {"capabilities",
                    {{"tools", {{"listChanged", false}}}, {"resources", nlohmann::json::object()}}},
                   {"serverInfo", std::move(info)},
                   {"instructions", impl.cfg.description}});
    }
    if (method == "tools/list")
    {
        nlohmann::json list = nlohmann::json::array();
        for (const auto &t : tools())
            list.push_back(t.to_json());
        return ok({{"tools", std::move(list)}});
    }
    if (method == "tools/call")
    {
        if (!params.is_object() || !params.contains("name") || !params["name"].is_string())
            return rpc_error(id, -32602, "Invalid params: 'name' is required");
        return ok(call_tool(params["name"].get<std::string>(),
                            params.value("arguments", nlohmann::json::object())));
    }
    if (method == "ping")
        return ok(nlohmann::json::object());
    if (method == "resources/list")
    {
        std::shared_lock lk(impl.client_mu);
        return ok({{"resources", impl.client->resources()}});
    }
    return rpc_error(id, -32601, fmt::format("Method not found: {}", method));
}

std::vector<ToolSchema> ExternalBridge::tools() const
{
    std::shared_lock lk(pImpl->client_mu);
    return pImpl->client->tools();
}

const std::string &ExternalBridge::service_name() const noexcept
{
    return pImpl->service_name;
}

const BridgeConfig &ExternalBridge::config() const noexcept
{
    return pImpl->cfg;
}

int ExternalBridge::port() const noexcept
{
    return pImpl->bound_port;
}

bool ExternalBridge::is_alive() const
{
    std::shared_lock lk(pImpl->client_mu);
    return pImpl->client->is_alive();
}

uint64_t ExternalBridge::pid() const
{
    std::shared_lock lk(pImpl->client_mu);
    return pImpl->client->pid();
}

} // namespace mcpmesh::mesh
