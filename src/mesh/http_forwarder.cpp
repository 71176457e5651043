#include "mesh_service.hpp"
#include "mesh/http_forwarder.hpp"
#include "mesh/session_table.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>

namespace mcpmesh::mesh
{

using namespace std::chrono_literals;

namespace
{
constexpr std::array kHopByHop = {"host",       "content-length",   "connection",
                                  "keep-alive", "proxy-connection", "transfer-encoding",
                                  "upgrade",    "te"};
// Pseudo headers cpp-httplib adds to every server-side request.
constexpr std::array kServerInjected = {"remote_addr", "remote_port", "local_addr", "local_port"};

constexpr std::size_t kSessionScanTail = 256;
// Streams have no read timeout; this only bounds a silently dead socket.
constexpr auto kStreamReadTimeout = std::chrono::hours(24);

std::string lower(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

template <std::size_t N>
bool is_listed(const std::array<const char *, N> &names, const std::string &header)
{
    const std::string key = lower(header);
    return std::any_of(names.begin(), names.end(), [&](const char *n) { return key == n; });
}

bool skip_response_header(const std::string &header)
{
    const std::string key = lower(header);
    return is_listed(kHopByHop, header) || key.rfind("access-control-", 0) == 0;
}

std::string percent_encode(std::string_view s)
{
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
    {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
        {
            out.push_back(static_cast<char>(c));
        }
        else
        {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::string error_frame(std::string_view message)
{
    return fmt::format("event: error\ndata: {}\n\n",
                       nlohmann::json{{"error", std::string(message)}}.dump());
}

httplib::Request make_upstream_request(const httplib::Request &req, const ForwardTarget &target)
{
    httplib::Request up;
    up.method = req.method;
    up.path = target.path;
    up.headers = HttpForwarder::forwardable_headers(req.headers);
    if (req.method == "POST" || req.method == "PUT" || req.method == "PATCH" ||
        req.method == "DELETE")
    {
        up.body = req.body;
    }
    return up;
}

void send_json(httplib::Response &res, int status, const nlohmann::json &body)
{
    res.status = status;
    res.set_content(body.dump(), "application/json");
    HttpForwarder::apply_cors(res);
}

/// Shared state between the upstream worker and the downstream chunk provider.
struct StreamRelay
{
    std::mutex mu;
    std::condition_variable cv;
    bool headers_ready = false;
    bool finished = false;
    int status = 0;
    httplib::Headers headers;
    std::deque<std::string> chunks;
    UpstreamFailure failure = UpstreamFailure::None;
    std::string failure_text;

    std::atomic<bool> cancelled{false};
    std::unique_ptr<httplib::Client> client;
    std::thread worker;

    ~StreamRelay() { finish(); }

    void cancel()
    {
        if (!cancelled.exchange(true) && client)
            client->stop();
    }

    void finish()
    {
        cancel();
        if (worker.joinable())
            worker.join();
    }

    std::string drain_all()
    {
        std::string out;
        for (auto &c : chunks)
            out += c;
        chunks.clear();
        return out;
    }
};

} // namespace

// ----------------------------------------------------------------------------
// Static helpers
// ----------------------------------------------------------------------------

bool HttpForwarder::wants_streaming(const httplib::Request &req)
{
    const std::string accept = lower(req.get_header_value("Accept"));
    if (accept.find("text/event-stream") == std::string::npos)
        return false;

    if (req.method == "POST" || req.method == "PUT" || req.method == "PATCH")
    {
        const std::string content_type = lower(req.get_header_value("Content-Type"));
        if (content_type.find("application/json") == std::string::npos)
            return false;
        const std::string first = accept.substr(0, accept.find(','));
        return first.find("text/event-stream") != std::string::npos;
    }
    return req.method == "GET";
}

httplib::Headers HttpForwarder::forwardable_headers(const httplib::Headers &headers)
{
    httplib::Headers out;
    for (const auto &[key, value] : headers)
    {
        if (is_listed(kHopByHop, key) || is_listed(kServerInjected, key))
            continue;
        out.emplace(key, value);
    }
    return out;
}

void HttpForwarder::apply_cors(httplib::Response &res)
{
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", "GET, POST, PUT, DELETE, PATCH, OPTIONS, HEAD");
    res.set_header("Access-Control-Allow-Headers", "*");
    res.set_header("Access-Control-Allow-Credentials", "true");
    res.set_header("Access-Control-Expose-Headers", "*");
    res.set_header("Access-Control-Max-Age", "3600");
}

UpstreamFailure HttpForwarder::classify(httplib::Error error) noexcept
{
    switch (error)
    {
    case httplib::Error::Success:
        return UpstreamFailure::None;
    case httplib::Error::Connection:
        return UpstreamFailure::Refused;
    case httplib::Error::ConnectionTimeout:
    case httplib::Error::Read:
        return UpstreamFailure::Timeout;
    case httplib::Error::Canceled:
        return UpstreamFailure::Cancelled;
    default:
        return UpstreamFailure::Other;
    }
}

bool HttpForwarder::names_network_condition(std::string_view text)
{
    static constexpr std::array kKeywords = {"connection", "network",     "timeout",
                                             "refused",    "unreachable", "peer closed",
                                             "broken pipe"};
    const std::string t = lower(text);
    return std::any_of(kKeywords.begin(), kKeywords.end(),
                       [&](const char *k) { return t.find(k) != std::string::npos; });
}

std::string HttpForwarder::with_query(const std::string &path, const httplib::Request &req)
{
    if (req.params.empty())
        return path;
    std::string out = path;
    char sep = '?';
    for (const auto &[key, value] : req.params)
    {
        out += sep;
        out += percent_encode(key);
        out += '=';
        out += percent_encode(value);
        sep = '&';
    }
    return out;
}

// ----------------------------------------------------------------------------
// Buffered relay
// ----------------------------------------------------------------------------

void HttpForwarder::forward_buffered(const httplib::Request &req, httplib::Response &res,
                                     const ForwardTarget &target,
                                     const BackendDownCallback &on_down) const
{
    LOGGER_INFO("[{}] {} -> http://{}:{}{} (buffered)", target.request_id, req.method, target.host,
                target.port, target.path);

    httplib::Client cli(target.host, target.port);
    cli.set_connection_timeout(m_opts.connect_timeout);
    cli.set_read_timeout(m_opts.read_timeout);
    cli.set_write_timeout(m_opts.read_timeout);
    cli.set_follow_location(true);

    const auto result = cli.send(make_upstream_request(req, target));
    if (!result)
    {
        const std::string text = httplib::to_string(result.error());
        switch (classify(result.error()))
        {
        case UpstreamFailure::Refused:
            LOGGER_ERROR("[{}] connection to {} failed: {}", target.request_id, target.server_name,
                         text);
            on_down("Connection failed");
            send_json(res, 503,
                      {{"error", "Target server unavailable"},
                       {"server", target.server_name},
                       {"detail", text}});
            return;
        case UpstreamFailure::Timeout:
            LOGGER_ERROR("[{}] {} timed out: {}", target.request_id, target.server_name, text);
            on_down("Request timeout");
            send_json(res, 504,
                      {{"error", "Target server timeout"},
                       {"server", target.server_name},
                       {"detail", text}});
            return;
        default:
            LOGGER_ERROR("[{}] forwarding to {} failed: {}", target.request_id, target.server_name,
                         text);
            if (names_network_condition(text))
                on_down(fmt::format("Network error: {}", text));
            else
                LOGGER_INFO("[{}] not a network failure; sessions of {} kept", target.request_id,
                            target.server_name);
            send_json(res, 500,
                      {{"error", fmt::format("Request forwarding failed: {}", text)},
                       {"server", target.server_name}});
            return;
        }
    }

    LOGGER_INFO("[{}] response status {}", target.request_id, result->status);
    res.status = result->status;
    for (const auto &[key, value] : result->headers)
    {
        if (!skip_response_header(key))
            res.headers.emplace(key, value);
    }
    res.body = result->body;
    apply_cors(res);
}

// ----------------------------------------------------------------------------
// Streaming relay
// ----------------------------------------------------------------------------

void HttpForwarder::forward_streaming(const httplib::Request &req, httplib::Response &res,
                                      const ForwardTarget &target, SessionCallback on_session,
                                      BackendDownCallback on_down) const
{
    LOGGER_INFO("[{}] {} -> http://{}:{}{} (streaming)", target.request_id, req.method,
                target.host, target.port, target.path);

    auto relay = std::make_shared<StreamRelay>();
    relay->client = std::make_unique<httplib::Client>(target.host, target.port);
    relay->client->set_connection_timeout(m_opts.connect_timeout);
    relay->client->set_read_timeout(kStreamReadTimeout);
    relay->client->set_follow_location(true);

    httplib::Request up = make_upstream_request(req, target);
    StreamRelay *state = relay.get();

    up.response_handler = [state](const httplib::Response &r) {
        std::lock_guard lk(state->mu);
        state->status = r.status;
        state->headers = r.headers;
        state->headers_ready = true;
        state->cv.notify_all();
        return !state->cancelled.load();
    };

    auto tail = std::make_shared<std::string>();
    up.content_receiver = [state, tail, on_session, rid = target.request_id](
                              const char *data, size_t len, uint64_t, uint64_t) {
        if (state->cancelled.load())
            return false;
        std::string chunk(data, len);
        if (on_session)
        {
            const std::string window = *tail + chunk;
            for (const auto &id : SessionTable::extract_session_ids(window))
                on_session(id);
            *tail = window.size() > kSessionScanTail
                        ? window.substr(window.size() - kSessionScanTail)
                        : window;
        }
        std::lock_guard lk(state->mu);
        state->chunks.push_back(std::move(chunk));
        state->cv.notify_all();
        return true;
    };

    relay->worker = std::thread(
        [state, up = std::move(up), on_down = std::move(on_down), target]() mutable {
            const auto result = state->client->send(up);
            std::lock_guard lk(state->mu);
            if (!result)
            {
                const auto kind = classify(result.error());
                state->failure = kind;
                state->failure_text = httplib::to_string(result.error());
                if (kind == UpstreamFailure::Cancelled || state->cancelled.load())
                {
                    LOGGER_INFO("[{}] stream to {} cancelled by the client", target.request_id,
                                target.server_name);
                }
                else
                {
                    LOGGER_ERROR("[{}] stream to {} failed: {}", target.request_id,
                                 target.server_name, state->failure_text);
                    const bool down = kind == UpstreamFailure::Refused ||
                                      kind == UpstreamFailure::Timeout ||
                                      names_network_condition(state->failure_text);
                    if (down)
                        on_down(fmt::format("Stream failed: {}", state->failure_text));
                    state->chunks.push_back(error_frame(state->failure_text));
                }
            }
            else
            {
                LOGGER_INFO("[{}] stream from {} ended", target.request_id, target.server_name);
            }
            state->finished = true;
            state->cv.notify_all();
        });

    std::unique_lock lk(relay->mu);
    relay->cv.wait(lk, [&] { return relay->headers_ready || relay->finished; });

    if (!relay->headers_ready)
    {
        // Upstream never answered: connect refused, connect timeout or similar.
        const int status = relay->failure == UpstreamFailure::Timeout ? 504
                           : relay->failure == UpstreamFailure::Refused ? 503
                                                                        : 502;
        res.status = status;
        res.set_content(relay->drain_all(), "text/event-stream");
        apply_cors(res);
        lk.unlock();
        relay->finish();
        return;
    }

    if (relay->status != 200)
    {
        LOGGER_WARN("[{}] stream from {} answered {}; relaying as is", target.request_id,
                    target.server_name, relay->status);
        relay->cv.wait(lk, [&] { return relay->finished; });
        res.status = relay->status;
        for (const auto &[key, value] : relay->headers)
        {
            if (!skip_response_header(key))
                res.headers.emplace(key, value);
        }
        res.body = relay->drain_all();
        apply_cors(res);
        lk.unlock();
        relay->finish();
        return;
    }

    for (const auto &[key, value] : relay->headers)
    {
        const std::string k = lower(key);
        if (!skip_response_header(key) && k != "content-type" && k != "cache-control")
            res.headers.emplace(key, value);
    }
    lk.unlock();

    res.status = 200;
    res.set_header("Cache-Control", "no-cache");
    res.set_header("Connection", "keep-alive");
    apply_cors(res);
    res.set_chunked_content_provider(
        "text/event-stream",
        [relay](size_t, httplib::DataSink &sink) {
            std::unique_lock lk(relay->mu);
            relay->cv.wait_for(lk, 1s, [&] { return !relay->chunks.empty() || relay->finished; });
            while (!relay->chunks.empty())
            {
                std::string chunk = std::move(relay->chunks.front());
                relay->chunks.pop_front();
                lk.unlock();
                if (!sink.write(chunk.data(), chunk.size()))
                {
                    relay->cancel();
                    return false;
                }
                lk.lock();
            }
            if (relay->finished)
                sink.done();
            return true;
        },
        [relay](bool) { relay->finish(); });
}

} // namespace mcpmesh::mesh
