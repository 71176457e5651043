#include "mesh_service.hpp"
#include "mesh/stdio_rpc_client.hpp"

#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <thread>

namespace mcpmesh::mesh
{

using namespace std::chrono_literals;

namespace
{
constexpr auto kWriterPoll = 1s;
constexpr auto kLoopJoinBound = 2s;
constexpr auto kRestartPause = 1s;
constexpr auto kResourcesTimeout = std::chrono::milliseconds(5000);
constexpr std::size_t kReadChunk = 4096;

/// Calls `on_line` for every complete line read from `fd` until EOF or error.
template <typename F> void read_lines(int fd, F &&on_line)
{
    std::string buffer;
    char chunk[kReadChunk];
    for (;;)
    {
        const long n = platform::read_pipe(fd, chunk, sizeof(chunk));
        if (n <= 0)
            break;
        buffer.append(chunk, static_cast<std::size_t>(n));
        std::size_t pos;
        while ((pos = buffer.find('\n')) != std::string::npos)
        {
            std::string line = buffer.substr(0, pos);
            buffer.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            on_line(line);
        }
    }
    if (!buffer.empty())
        on_line(buffer);
}

std::string id_key(const nlohmann::json &id)
{
    return id.is_string() ? id.get<std::string>() : id.dump();
}
} // namespace

struct StdioRpcClient::Impl
{
    StdioRpcOptions opts;

    platform::SpawnedProcess proc;
    std::thread reader;
    std::thread writer;
    std::thread err_reader;
    std::atomic<bool> running{false};
    std::atomic<bool> reader_alive{false};
    std::atomic<bool> writer_alive{false};

    std::mutex queue_mu;
    std::condition_variable queue_cv;
    /// Outbound frames; an empty frame stops the writer.
    std::deque<std::string> queue;

    std::mutex pending_mu;
    std::condition_variable pending_cv;
    std::map<std::string, std::optional<nlohmann::json>> pending;
    std::atomic<uint64_t> counter{0};

    mutable std::mutex data_mu;
    std::vector<ToolSchema> tools;
    nlohmann::json resources = nlohmann::json::array();
    nlohmann::json server_info = nlohmann::json::object();

    explicit Impl(StdioRpcOptions o) : opts(std::move(o)) {}

    void enqueue(std::string frame)
    {
        {
            std::lock_guard lk(queue_mu);
            queue.push_back(std::move(frame));
        }
        queue_cv.notify_one();
    }

    void mark_loop_exit(std::atomic<bool> &alive, const char *which)
    {
        alive = false;
        if (running.exchange(false))
        {
            LOGGER_ERROR("StdioRpcClient[{}]: {} loop exited; the process may have crashed",
                         opts.name, which);
        }
        std::lock_guard lk(pending_mu);
        pending_cv.notify_all();
    }

    void reader_loop(int fd)
    {
        read_lines(fd, [this](const std::string &line) {
            if (line.find_first_not_of(" \t") == std::string::npos)
                return;
            const auto frame = nlohmann::json::parse(line, nullptr, /*allow_exceptions=*/false);
            if (frame.is_discarded())
            {
                LOGGER_ERROR("StdioRpcClient[{}]: unparsable line: {}", opts.name, line);
                return;
            }
            if (!frame.is_object() || !frame.contains("id") || frame["id"].is_null())
            {
                LOGGER_DEBUG("StdioRpcClient[{}]: notification {}", opts.name,
                             frame.is_object() ? frame.value("method", std::string("?")) : "?");
                return;
            }
            std::lock_guard lk(pending_mu);
            auto it = pending.find(id_key(frame["id"]));
            if (it == pending.end())
            {
                LOGGER_DEBUG("StdioRpcClient[{}]: response to unknown id {}", opts.name,
                             frame["id"].dump());
                return;
            }
            it->second = frame;
            pending_cv.notify_all();
        });
        LOGGER_WARN("StdioRpcClient[{}]: output stream ended", opts.name);
        mark_loop_exit(reader_alive, "reader");
    }

    void writer_loop(int fd)
    {
        while (running.load())
        {
            std::string frame;
            {
                std::unique_lock lk(queue_mu);
                if (!queue_cv.wait_for(lk, kWriterPoll, [this] { return !queue.empty(); }))
                    continue;
                frame = std::move(queue.front());
                queue.pop_front();
            }
            if (frame.empty())
                break;
            frame.push_back('\n');
            if (!platform::write_pipe(fd, frame.data(), frame.size()))
            {
                LOGGER_ERROR("StdioRpcClient[{}]: write to the process failed", opts.name);
                break;
            }
        }
        mark_loop_exit(writer_alive, "writer");
    }

    void stderr_loop(int fd)
    {
        read_lines(fd, [this](const std::string &line) {
            if (!line.empty())
                LOGGER_INFO("[{}:stderr] {}", opts.name, line);
        });
    }

    bool wait_loops_stopped(std::chrono::milliseconds bound)
    {
        std::unique_lock lk(pending_mu);
        return pending_cv.wait_for(lk, bound,
                                   [this] { return !reader_alive.load() && !writer_alive.load(); });
    }

    bool handshake(StdioRpcClient &self)
    {
        const auto init = self.send_request(
            "initialize",
            {{"protocolVersion", kProtocolVersion},
             {"capabilities", {{"roots", {{"listChanged", true}}}, {"sampling", nlohmann::json::object()}}},
             {"clientInfo", {{"name", opts.client_name}, {"version", platform::get_version_string()}}}});
        if (!init || !init->contains("result"))
        {
            LOGGER_ERROR("StdioRpcClient[{}]: initialize failed: {}", opts.name,
                         init ? init->dump() : std::string("no response"));
            return false;
        }

        self.send_notification("notifications/initialized", nlohmann::json::object());

        std::vector<ToolSchema> discovered;
        if (auto resp = self.send_request("tools/list", nlohmann::json::object());
            resp && resp->contains("result"))
        {
            for (const auto &t : (*resp)["result"].value("tools", nlohmann::json::array()))
            {
                try
                {
                    discovered.push_back(ToolSchema::from_json(t));
                }
                catch (const std::invalid_argument &ex)
                {
                    LOGGER_WARN("StdioRpcClient[{}]: skipping tool entry: {}", opts.name, ex.what());
                }
            }
        }
        else
        {
            LOGGER_WARN("StdioRpcClient[{}]: tools/list returned nothing", opts.name);
        }

        nlohmann::json found_resources = nlohmann::json::array();
        if (auto resp = self.send_request("resources/list", nlohmann::json::object(),
                                          std::min(kResourcesTimeout, opts.timeout));
            resp && resp->contains("result"))
        {
            found_resources = (*resp)["result"].value("resources", nlohmann::json::array());
        }
        else
        {
            LOGGER_DEBUG("StdioRpcClient[{}]: no resources", opts.name);
        }

        std::lock_guard lk(data_mu);
        server_info = (*init)["result"].value("serverInfo", nlohmann::json::object());
        tools = std::move(discovered);
        resources = std::move(found_resources);
        LOGGER_INFO("StdioRpcClient[{}]: handshake done, {} tool(s), {} resource(s)", opts.name,
                    tools.size(), resources.size());
        return true;
    }
};

StdioRpcClient::StdioRpcClient(StdioRpcOptions opts)
    : pImpl(std::make_unique<Impl>(std::move(opts)))
{
}

StdioRpcClient::~StdioRpcClient()
{
    cleanup();
}

const StdioRpcOptions &StdioRpcClient::options() const noexcept
{
    return pImpl->opts;
}

uint64_t StdioRpcClient::pid() const noexcept
{
    return pImpl->proc.pid;
}

bool StdioRpcClient::start()
{
    auto &impl = *pImpl;
    if (impl.proc.pid != 0)
        cleanup();
    if (impl.opts.command.empty())
    {
        LOGGER_ERROR("StdioRpcClient[{}]: no command configured", impl.opts.name);
        return false;
    }

    platform::SpawnOptions spawn;
    spawn.argv = impl.opts.command;
    spawn.env = impl.opts.env;
    spawn.pipe_stdio = true;
    spawn.new_process_group = true;

    std::error_code ec;
    impl.proc = platform::spawn_process(spawn, ec);
    if (ec || impl.proc.pid == 0)
    {
        LOGGER_ERROR("StdioRpcClient[{}]: cannot start '{}': {}", impl.opts.name,
                     impl.opts.command.front(), ec.message());
        platform::close_process_pipes(impl.proc);
        impl.proc = {};
        return false;
    }
    LOGGER_INFO("StdioRpcClient[{}]: started pid {}", impl.opts.name, impl.proc.pid);

    {
        std::lock_guard lk(impl.queue_mu);
        impl.queue.clear();
    }
    impl.running = true;
    impl.reader_alive = true;
    impl.writer_alive = true;
    impl.reader = std::thread([&impl, fd = impl.proc.stdout_fd] { impl.reader_loop(fd); });
    impl.writer = std::thread([&impl, fd = impl.proc.stdin_fd] { impl.writer_loop(fd); });
    impl.err_reader = std::thread([&impl, fd = impl.proc.stderr_fd] { impl.stderr_loop(fd); });

    if (!impl.handshake(*this))
    {
        cleanup();
        return false;
    }
    return true;
}

void StdioRpcClient::cleanup()
{
    auto &impl = *pImpl;
    if (impl.proc.pid == 0 && !impl.reader.joinable() && !impl.writer.joinable())
        return;

    impl.running = false;
    impl.enqueue(std::string());
    {
        std::lock_guard lk(impl.pending_mu);
        impl.pending_cv.notify_all();
    }

    if (!impl.wait_loops_stopped(kLoopJoinBound))
        LOGGER_DEBUG("StdioRpcClient[{}]: I/O loops still running; terminating the process",
                     impl.opts.name);

    if (impl.proc.pid != 0)
    {
        platform::terminate_process_tree(impl.proc.pid, kLoopJoinBound);
        platform::try_reap_child(impl.proc.pid);
    }

    for (std::thread *t : {&impl.reader, &impl.writer, &impl.err_reader})
    {
        if (t->joinable())
            t->join();
    }
    platform::close_process_pipes(impl.proc);
    if (impl.proc.pid != 0)
        LOGGER_INFO("StdioRpcClient[{}]: process {} cleaned up", impl.opts.name, impl.proc.pid);
    impl.proc = {};
}

bool StdioRpcClient::restart()
{
    LOGGER_INFO("StdioRpcClient[{}]: restarting", pImpl->opts.name);
    cleanup();
    std::this_thread::sleep_for(kRestartPause);
    return start();
}

bool StdioRpcClient::is_alive() const
{
    const auto &impl = *pImpl;
    return impl.running.load() && impl.proc.pid != 0 && platform::is_process_healthy(impl.proc.pid) &&
           impl.reader_alive.load() && impl.writer_alive.load();
}

std::optional<nlohmann::json> StdioRpcClient::send_request(
    const std::string &method, const nlohmann::json &params,
    std::optional<std::chrono::milliseconds> timeout)
{
    auto &impl = *pImpl;
    if (!impl.running.load())
        return std::nullopt;

    const std::string id = std::to_string(++impl.counter);
    {
        std::lock_guard lk(impl.pending_mu);
        impl.pending.emplace(id, std::nullopt);
    }
    impl.enqueue(
        nlohmann::json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}}.dump());

    std::unique_lock lk(impl.pending_mu);
    const bool answered = impl.pending_cv.wait_for(
        lk, timeout.value_or(impl.opts.timeout),
        [&] { return impl.pending[id].has_value() || !impl.running.load(); });
    std::optional<nlohmann::json> response = std::move(impl.pending[id]);
    impl.pending.erase(id);
    if (!answered || !response)
        LOGGER_WARN("StdioRpcClient[{}]: no response to {} (id {})", impl.opts.name, method, id);
    return response;
}

void StdioRpcClient::send_notification(const std::string &method, const nlohmann::json &params)
{
    pImpl->enqueue(nlohmann::json{{"jsonrpc", "2.0"}, {"method", method}, {"params", params}}.dump());
}

std::vector<ToolSchema> StdioRpcClient::tools() const
{
    std::lock_guard lk(pImpl->data_mu);
    return pImpl->tools;
}

nlohmann::json StdioRpcClient::resources() const
{
    std::lock_guard lk(pImpl->data_mu);
    return pImpl->resources;
}

nlohmann::json StdioRpcClient::server_info() const
{
    std::lock_guard lk(pImpl->data_mu);
    return pImpl->server_info;
}

} // namespace mcpmesh::mesh
