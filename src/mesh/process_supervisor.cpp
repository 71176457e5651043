#include "mesh_service.hpp"
#include "mesh/process_supervisor.hpp"

#include <fmt/ranges.h>
#include <httplib.h>

#include <algorithm>
#include <condition_variable>
#include <fstream>
#include <mutex>
#include <stop_token>
#include <thread>

namespace mcpmesh::mesh
{

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace
{
constexpr auto kRegistrationPoll = 250ms;
constexpr auto kProbeTimeout = 1000ms;
constexpr auto kHttpProbeTimeout = 5s;
constexpr auto kMonitorErrorBackoff = 60s;
constexpr auto kProxyNotifyTimeout = 2s;

std::optional<uint64_t> read_pid_file(const fs::path &path)
{
    std::ifstream in(path);
    if (!in.is_open())
        return std::nullopt;
    uint64_t pid = 0;
    if (!(in >> pid) || pid == 0)
        return std::nullopt;
    return pid;
}

bool write_pid_file(const fs::path &path, uint64_t pid)
{
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open())
        return false;
    out << pid << '\n';
    return static_cast<bool>(out);
}

void remove_file_quietly(const fs::path &path)
{
    std::error_code ec;
    fs::remove(path, ec);
    if (ec)
        LOGGER_WARN("ProcessSupervisor: cannot remove '{}': {}", path.string(), ec.message());
}

std::string join_command(const std::vector<std::string> &command)
{
    return fmt::format("{}", fmt::join(command, " "));
}

std::string probe_host(const std::string &host)
{
    if (host.empty() || host == "0.0.0.0")
        return "127.0.0.1";
    return host;
}

std::string access_url(const std::string &host, int port, Transport transport)
{
    return fmt::format("http://{}:{}{}", host, port, transport_endpoint_path(transport));
}
} // namespace

void to_json(nlohmann::json &j, const StartResult &r)
{
    j = nlohmann::json{{"ok", r.ok},
                       {"pid", r.pid},
                       {"port", r.port},
                       {"log", r.log_path.string()},
                       {"message", r.message}};
}

void to_json(nlohmann::json &j, const ServiceStatus &s)
{
    j = nlohmann::json{{"name", s.name},
                       {"transport", to_string(s.transport)},
                       {"enabled", s.enabled},
                       {"running", s.running},
                       {"pid", s.pid},
                       {"port", s.port ? nlohmann::json(*s.port) : nlohmann::json(nullptr)},
                       {"log", s.log.string()}};
}

void to_json(nlohmann::json &j, const HealthReport &h)
{
    j = nlohmann::json{{"name", h.name},       {"running", h.running},
                       {"tcp_ok", h.tcp_ok},   {"http_ok", h.http_ok},
                       {"http_status", h.http_status}, {"healthy", h.healthy()},
                       {"detail", h.detail}};
}

// ============================================================================
// Impl
// ============================================================================

struct ProcessSupervisor::Impl
{
    MeshSettings settings;
    ServiceRegistry &registry;
    PortAllocator allocator;

    /// Serializes start/stop/cleanup between callers and the monitor thread.
    mutable std::mutex ops_mu;

    std::mutex monitor_mu;
    std::condition_variable_any monitor_cv;
    std::jthread monitor_thread;
    std::atomic<bool> monitor_active{false};

    Impl(MeshSettings s, ServiceRegistry &reg)
        : settings(std::move(s)), registry(reg), allocator(reg)
    {
    }

    fs::path pid_file(const std::string &name) const
    {
        return settings.runtime.pids_dir() / (name + ".pid");
    }
    fs::path log_file(const std::string &name) const
    {
        return settings.runtime.logs_dir() / (name + ".log");
    }

    /// Port of the newest local registry record of (name, transport).
    std::optional<int> registered_port(const std::string &name, Transport transport) const
    {
        std::optional<int> port;
        std::string newest;
        for (const auto &[key, rec] : registry.list_servers())
        {
            if (rec.name != name || rec.transport != transport || !rec.port)
                continue;
            if (!platform::is_local_host(rec.host))
                continue;
            if (!port || rec.started_at > newest)
            {
                port = rec.port;
                newest = rec.started_at;
            }
        }
        return port;
    }

    /// True if the command line or environment of `pid` identifies service `name`.
    bool matches_signature(uint64_t pid, const std::string &name, const ServerConfig *cfg,
                           std::optional<int> port) const
    {
        if (cfg != nullptr && !cfg->command.empty() && port)
        {
            const std::string cmdline = platform::read_process_cmdline(pid);
            if (!cmdline.empty() && cmdline.find(join_command(cfg->command)) != std::string::npos &&
                cmdline.find(fmt::format("--port {}", *port)) != std::string::npos)
            {
                return true;
            }
        }
        const std::string marker = fmt::format("MCPMESH_SERVER_NAME={}", name);
        for (const auto &entry : platform::read_process_environ(pid))
        {
            if (entry == marker)
                return true;
        }
        return false;
    }

    /// Processes that belong to `name` according to their signature, oldest pid first.
    std::vector<uint64_t> scan_for_service(const std::string &name) const
    {
        const ServerConfig *cfg = settings.find_server(name);
        std::optional<int> port = cfg != nullptr && cfg->port ? cfg->port : std::nullopt;
        if (!port && cfg != nullptr)
            port = registered_port(name, cfg->transport);

        const uint64_t self = platform::get_pid();
        std::vector<uint64_t> found;
        for (uint64_t pid : platform::list_process_ids())
        {
            if (pid == self || pid == 0)
                continue;
            if (matches_signature(pid, name, cfg, port))
                found.push_back(pid);
        }
        return found;
    }

    std::optional<uint64_t> find_pid(const std::string &name) const
    {
        if (auto pid = read_pid_file(pid_file(name)))
        {
            if (platform::is_process_alive(*pid))
                return pid;
            LOGGER_DEBUG("ProcessSupervisor: pid file of {} is stale (pid {})", name, *pid);
        }
        const auto scanned = scan_for_service(name);
        if (scanned.empty())
            return std::nullopt;
        // Descendants inherit the marker; the service root is the one whose parent is not a match.
        for (uint64_t candidate : scanned)
        {
            bool is_descendant = false;
            for (uint64_t other : scanned)
            {
                if (other == candidate)
                    continue;
                const auto kids = platform::list_descendant_pids(other);
                if (std::find(kids.begin(), kids.end(), candidate) != kids.end())
                {
                    is_descendant = true;
                    break;
                }
            }
            if (!is_descendant)
                return candidate;
        }
        return scanned.front();
    }

    // ------------------------------------------------------------------------

    StartResult fail(StartResult r, uint64_t pid, const std::string &name, std::string message)
    {
        r.ok = false;
        r.message = std::move(message);
        LOGGER_ERROR("ProcessSupervisor: {} failed to start: {} (see log '{}')", name, r.message,
                     r.log_path.string());
        if (pid != 0 && !platform::try_reap_child(pid))
        {
            platform::terminate_process_tree(pid, 0ms, /*force=*/true);
        }
        remove_file_quietly(pid_file(name));
        if (!registry.remove_by_name(name, /*local_only=*/true))
            LOGGER_WARN("ProcessSupervisor: registry rollback for {} failed", name);
        return r;
    }

    bool wait_for_registration(const ServerConfig &cfg, int port, uint64_t pid)
    {
        const auto deadline = std::chrono::steady_clock::now() + settings.supervisor.registration_wait;
        const std::string key = ServiceRecord::make_key(cfg.name, cfg.transport, port);
        do
        {
            const auto records = registry.list_servers();
            if (records.count(key) != 0)
                return true;
            if (!platform::is_process_healthy(pid))
                return false;
            std::this_thread::sleep_for(kRegistrationPoll);
        } while (std::chrono::steady_clock::now() < deadline);
        return false;
    }

    StartResult start_locked(const ServerConfig &cfg)
    {
        StartResult r;
        r.log_path = log_file(cfg.name);
        uint64_t pid = 0;
        try
        {
            fs::create_directories(settings.runtime.logs_dir());
            fs::create_directories(settings.runtime.pids_dir());

            if (auto existing = find_pid(cfg.name))
            {
                if (platform::is_process_healthy(*existing))
                {
                    r.ok = true;
                    r.pid = *existing;
                    r.port = registered_port(cfg.name, cfg.transport).value_or(cfg.port.value_or(0));
                    r.message = "already running";
                    LOGGER_INFO("ProcessSupervisor: {} is already running (pid {})", cfg.name,
                                *existing);
                    return r;
                }
                LOGGER_WARN("ProcessSupervisor: {} is unresponsive (pid {}); restarting", cfg.name,
                            *existing);
                stop_locked(cfg.name, /*force=*/true);
            }

            remove_file_quietly(pid_file(cfg.name));
            if (!registry.remove_by_name(cfg.name, /*local_only=*/true))
                LOGGER_WARN("ProcessSupervisor: could not clear old records of {}", cfg.name);

            if (cfg.command.empty())
                return fail(r, 0, cfg.name, "no command configured");

            const std::string host = cfg.host.empty() ? platform::get_local_ip() : cfg.host;

            std::vector<std::string> argv = cfg.command;
            argv.insert(argv.end(), {"--transport", to_string(cfg.transport)});
            if (is_network_transport(cfg.transport))
            {
                int port = cfg.port ? *cfg.port
                                    : allocator.get_smart_port(cfg.name, cfg.transport,
                                                               settings.supervisor.port_range_start,
                                                               1000, probe_host(host));
                if (!PortAllocator::is_port_available(port, probe_host(host)))
                {
                    LOGGER_WARN("ProcessSupervisor: port {} is occupied; scanning from {}", port,
                                port + 1);
                    port = PortAllocator::get_available_port(port + 1, 100);
                }
                r.port = port;
                argv.insert(argv.end(), {"--host", host, "--port", std::to_string(port)});
            }

            platform::SpawnOptions opts;
            opts.argv = std::move(argv);
            opts.output_log = r.log_path;
            opts.new_process_group = true;
            opts.env.emplace_back("MCPMESH_SERVER_NAME", cfg.name);
            opts.env.emplace_back("MCPMESH_PROXY_URL", settings.proxy_url());
            for (const auto &[k, v] : cfg.env)
                opts.env.emplace_back(k, v);

            LOGGER_INFO("ProcessSupervisor: starting {} ({}) on {}:{}", cfg.name,
                        to_string(cfg.transport), host, r.port);
            std::error_code ec;
            const auto proc = platform::spawn_process(opts, ec);
            if (ec || proc.pid == 0)
                return fail(r, 0, cfg.name, fmt::format("spawn failed: {}", ec.message()));
            pid = proc.pid;
            r.pid = pid;

            std::this_thread::sleep_for(settings.supervisor.start_grace);

            int exit_code = 0;
            if (platform::try_reap_child(pid, &exit_code))
            {
                return fail(r, 0, cfg.name,
                            fmt::format("process exited during startup (status {})", exit_code));
            }
            if (!platform::is_process_healthy(pid))
                return fail(r, pid, cfg.name, "process is not running after the start grace");

            const bool self_registered =
                is_network_transport(cfg.transport) && wait_for_registration(cfg, r.port, pid);
            if (!platform::is_process_healthy(pid))
                return fail(r, pid, cfg.name, "process died while waiting for registration");
            if (!self_registered)
            {
                ServiceRecord rec;
                rec.name = cfg.name;
                rec.server_type = cfg.server_type;
                rec.transport = cfg.transport;
                rec.host = host;
                if (is_network_transport(cfg.transport))
                    rec.port = r.port;
                rec.pid = pid;
                rec.source_path = cfg.command.front();
                if (is_network_transport(cfg.transport))
                {
                    LOGGER_WARN("ProcessSupervisor: {} did not register itself within {} ms; "
                                "registering on its behalf",
                                cfg.name, settings.supervisor.registration_wait.count());
                }
                if (!registry.register_server(rec))
                    LOGGER_WARN("ProcessSupervisor: could not register {}", cfg.name);
            }

            if (!write_pid_file(pid_file(cfg.name), pid))
                LOGGER_WARN("ProcessSupervisor: cannot write pid file for {}", cfg.name);

            r.ok = true;
            r.message = "started";
            LOGGER_INFO("ProcessSupervisor: {} started (pid {})", cfg.name, pid);
            if (is_network_transport(cfg.transport))
                LOGGER_INFO("ProcessSupervisor:   access URL: {}", access_url(host, r.port, cfg.transport));
            LOGGER_INFO("ProcessSupervisor:   log: {}", r.log_path.string());
            return r;
        }
        catch (const std::exception &ex)
        {
            return fail(r, pid, cfg.name, ex.what());
        }
    }

    bool stop_locked(const std::string &name, bool force)
    {
        bool clean = true;
        try
        {
            std::vector<uint64_t> roots;
            if (auto pid = find_pid(name))
                roots.push_back(*pid);
            for (uint64_t p : scan_for_service(name))
            {
                if (std::find(roots.begin(), roots.end(), p) == roots.end())
                    roots.push_back(p);
            }

            if (roots.empty())
                LOGGER_INFO("ProcessSupervisor: {} is not running", name);

            for (uint64_t pid : roots)
            {
                if (!platform::is_process_alive(pid))
                    continue;
                LOGGER_INFO("ProcessSupervisor: stopping {} (pid {}{})", name, pid,
                            force ? ", forced" : "");
                platform::terminate_process_tree(pid, settings.supervisor.stop_timeout, force);
                platform::try_reap_child(pid);
                if (platform::is_process_healthy(pid))
                {
                    LOGGER_ERROR("ProcessSupervisor: pid {} of {} survived termination", pid, name);
                    clean = false;
                }
            }
        }
        catch (const std::exception &ex)
        {
            LOGGER_ERROR("ProcessSupervisor: error while stopping {}: {}", name, ex.what());
            clean = false;
        }

        remove_file_quietly(pid_file(name));
        if (!registry.remove_by_name(name, /*local_only=*/true))
        {
            LOGGER_WARN("ProcessSupervisor: registry cleanup for {} failed", name);
            clean = false;
        }
        notify_proxy_unregister(name);
        return clean;
    }

    /// Best effort: drops `name` from a running proxy's mirror.
    void notify_proxy_unregister(const std::string &name) const
    {
        const std::string host = probe_host(settings.proxy.host);
        try
        {
            httplib::Client cli(host, settings.proxy.port);
            cli.set_connection_timeout(kProxyNotifyTimeout);
            cli.set_read_timeout(kProxyNotifyTimeout);
            auto res = cli.Delete(fmt::format("/proxy/unregister/{}", name));
            if (!res)
            {
                LOGGER_DEBUG("ProcessSupervisor: proxy at {}:{} not reachable ({})", host,
                             settings.proxy.port, httplib::to_string(res.error()));
            }
            else if (res->status == 200)
            {
                LOGGER_INFO("ProcessSupervisor: proxy dropped {}", name);
            }
        }
        catch (const std::exception &ex)
        {
            LOGGER_DEBUG("ProcessSupervisor: proxy notification for {} failed: {}", name, ex.what());
        }
    }

    void monitor_loop(std::stop_token st, ProcessSupervisor *owner)
    {
        LOGGER_INFO("ProcessSupervisor: monitor started (interval {}s)",
                    settings.supervisor.monitor_interval.count());
        while (!st.stop_requested())
        {
            std::chrono::milliseconds wait = settings.supervisor.monitor_interval;
            try
            {
                owner->monitor_once();
            }
            catch (const std::exception &ex)
            {
                LOGGER_ERROR("ProcessSupervisor: monitor cycle failed: {}", ex.what());
                wait = kMonitorErrorBackoff;
            }
            std::unique_lock lk(monitor_mu);
            monitor_cv.wait_for(lk, st, wait, [] { return false; });
        }
        LOGGER_INFO("ProcessSupervisor: monitor stopped");
    }
};

// ============================================================================
// Public interface
// ============================================================================

ProcessSupervisor::ProcessSupervisor(MeshSettings settings, ServiceRegistry &registry)
    : pImpl(std::make_unique<Impl>(std::move(settings), registry))
{
}

ProcessSupervisor::~ProcessSupervisor()
{
    stop_monitor();
}

const MeshSettings &ProcessSupervisor::settings() const noexcept
{
    return pImpl->settings;
}

fs::path ProcessSupervisor::pid_file(const std::string &name) const
{
    return pImpl->pid_file(name);
}

fs::path ProcessSupervisor::log_file(const std::string &name) const
{
    return pImpl->log_file(name);
}

std::optional<uint64_t> ProcessSupervisor::find_pid(const std::string &name) const
{
    return pImpl->find_pid(name);
}

StartResult ProcessSupervisor::start_server(const ServerConfig &config)
{
    std::lock_guard lk(pImpl->ops_mu);
    return pImpl->start_locked(config);
}

StartResult ProcessSupervisor::start_server(const std::string &name)
{
    const ServerConfig *cfg = pImpl->settings.find_server(name);
    if (cfg == nullptr)
    {
        StartResult r;
        r.message = fmt::format("unknown server '{}'", name);
        LOGGER_ERROR("ProcessSupervisor: {}", r.message);
        return r;
    }
    return start_server(*cfg);
}

bool ProcessSupervisor::stop_server(const std::string &name, bool force)
{
    std::lock_guard lk(pImpl->ops_mu);
    return pImpl->stop_locked(name, force);
}

StartResult ProcessSupervisor::restart_server(const std::string &name)
{
    const ServerConfig *cfg = pImpl->settings.find_server(name);
    if (cfg == nullptr)
    {
        StartResult r;
        r.message = fmt::format("unknown server '{}'", name);
        LOGGER_ERROR("ProcessSupervisor: {}", r.message);
        return r;
    }
    std::lock_guard lk(pImpl->ops_mu);
    pImpl->stop_locked(name, /*force=*/false);
    return pImpl->start_locked(*cfg);
}

std::vector<StartResult> ProcessSupervisor::start_all()
{
    std::vector<StartResult> results;
    for (const auto &cfg : pImpl->settings.servers)
    {
        if (!cfg.enabled)
        {
            LOGGER_INFO("ProcessSupervisor: skipping disabled server {}", cfg.name);
            continue;
        }
        results.push_back(start_server(cfg));
    }
    return results;
}

int ProcessSupervisor::stop_all(bool force)
{
    stop_monitor();
    int stopped = 0;
    std::lock_guard lk(pImpl->ops_mu);
    for (const auto &cfg : pImpl->settings.servers)
    {
        if (!cfg.enabled)
            continue;
        if (pImpl->stop_locked(cfg.name, force))
            ++stopped;
    }
    return stopped;
}

void ProcessSupervisor::start_monitor()
{
    if (pImpl->monitor_active.exchange(true))
        return;
    pImpl->monitor_thread =
        std::jthread([impl = pImpl.get(), this](std::stop_token st) { impl->monitor_loop(st, this); });
}

void ProcessSupervisor::stop_monitor()
{
    if (!pImpl || !pImpl->monitor_active.exchange(false))
        return;
    pImpl->monitor_thread.request_stop();
    if (pImpl->monitor_thread.joinable())
        pImpl->monitor_thread.join();
}

bool ProcessSupervisor::monitor_running() const noexcept
{
    return pImpl->monitor_active.load();
}

std::vector<std::string> ProcessSupervisor::monitor_once()
{
    std::vector<std::string> restarted;
    std::lock_guard lk(pImpl->ops_mu);
    for (const auto &cfg : pImpl->settings.servers)
    {
        if (!cfg.enabled || !cfg.auto_restart)
            continue;
        const auto pid = pImpl->find_pid(cfg.name);
        if (pid && platform::is_process_healthy(*pid))
            continue;

        if (pid)
        {
            LOGGER_WARN("ProcessSupervisor: {} is unresponsive (pid {}); restarting", cfg.name, *pid);
            pImpl->stop_locked(cfg.name, /*force=*/true);
        }
        else
        {
            LOGGER_WARN("ProcessSupervisor: {} has stopped; restarting", cfg.name);
        }
        if (pImpl->start_locked(cfg).ok)
            restarted.push_back(cfg.name);
    }
    return restarted;
}

CleanupReport ProcessSupervisor::cleanup_dead_processes_and_ports()
{
    CleanupReport report;
    std::lock_guard lk(pImpl->ops_mu);
    auto &impl = *pImpl;

    // Our own exited children first, so they do not look like running services below.
    report.reaped_children = platform::reap_exited_children();

    std::error_code ec;
    if (fs::is_directory(impl.settings.runtime.pids_dir(), ec))
    {
        for (const auto &entry : fs::directory_iterator(impl.settings.runtime.pids_dir(), ec))
        {
            if (entry.path().extension() != ".pid")
                continue;
            const auto pid = read_pid_file(entry.path());
            if (!pid || !platform::is_process_healthy(*pid))
            {
                LOGGER_WARN("ProcessSupervisor: removing stale pid file {}",
                            entry.path().filename().string());
                remove_file_quietly(entry.path());
                report.stale_pid_files.push_back(entry.path().filename().string());
            }
        }
    }

    std::vector<std::string> dead_keys;
    for (const auto &[key, rec] : impl.registry.list_servers())
    {
        if (!platform::is_local_host(rec.host))
        {
            LOGGER_DEBUG("ProcessSupervisor: keeping remote record {} ({})", key, rec.host);
            continue;
        }
        const bool process_alive = rec.pid && platform::is_process_healthy(*rec.pid);
        const bool port_reachable =
            rec.port && platform::tcp_connect_probe(probe_host(rec.host), *rec.port, kProbeTimeout);
        if (!process_alive && !port_reachable)
        {
            LOGGER_WARN("ProcessSupervisor: pruning dead local record {}", key);
            dead_keys.push_back(key);
        }
    }
    if (auto removed = impl.registry.remove_keys(dead_keys))
        report.pruned_records = std::move(*removed);

    const uint64_t self = platform::get_pid();
    for (uint64_t pid : platform::list_process_ids())
    {
        if (pid == self || platform::is_process_healthy(pid))
            continue;
        const std::string cmdline = platform::read_process_cmdline(pid);
        for (const auto &cfg : impl.settings.servers)
        {
            if (cfg.command.empty() || cmdline.empty() ||
                cmdline.find(join_command(cfg.command)) == std::string::npos)
            {
                continue;
            }
            LOGGER_WARN("ProcessSupervisor: killing defunct {} process (pid {})", cfg.name, pid);
            platform::terminate_process_tree(pid, 0ms, /*force=*/true);
            report.killed_processes.push_back(pid);
            break;
        }
    }
    return report;
}

std::vector<ServiceStatus> ProcessSupervisor::status() const
{
    std::vector<ServiceStatus> out;
    for (const auto &cfg : pImpl->settings.servers)
    {
        ServiceStatus s;
        s.name = cfg.name;
        s.transport = cfg.transport;
        s.enabled = cfg.enabled;
        s.log = pImpl->log_file(cfg.name);
        if (auto pid = pImpl->find_pid(cfg.name))
        {
            s.pid = *pid;
            s.running = platform::is_process_healthy(*pid);
        }
        if (is_network_transport(cfg.transport))
        {
            s.port = pImpl->registered_port(cfg.name, cfg.transport);
            if (!s.port)
                s.port = cfg.port;
        }
        out.push_back(std::move(s));
    }
    return out;
}

std::vector<HealthReport> ProcessSupervisor::health_check() const
{
    std::vector<HealthReport> out;
    for (const auto &cfg : pImpl->settings.servers)
    {
        if (!cfg.enabled)
            continue;
        HealthReport h;
        h.name = cfg.name;
        const auto pid = pImpl->find_pid(cfg.name);
        h.running = pid && platform::is_process_healthy(*pid);
        if (!h.running)
        {
            h.detail = "process not running";
            out.push_back(std::move(h));
            continue;
        }
        if (!is_network_transport(cfg.transport))
        {
            h.tcp_ok = h.http_ok = true;
            h.detail = "stdio server; process check only";
            out.push_back(std::move(h));
            continue;
        }

        std::optional<int> port = pImpl->registered_port(cfg.name, cfg.transport);
        if (!port)
            port = cfg.port;
        if (!port)
        {
            h.detail = "no port known";
            out.push_back(std::move(h));
            continue;
        }
        const std::string host = probe_host(cfg.host.empty() ? platform::get_local_ip() : cfg.host);
        h.tcp_ok = platform::tcp_connect_probe(host, *port, kProbeTimeout);
        if (h.tcp_ok)
        {
            try
            {
                httplib::Client cli(host, *port);
                cli.set_connection_timeout(kHttpProbeTimeout);
                cli.set_read_timeout(kHttpProbeTimeout);
                int status = -1;
                auto res = cli.Get(
                    transport_endpoint_path(cfg.transport),
                    httplib::Headers{{"User-Agent", "mcpmesh-healthcheck/1.0"}},
                    [&status](const httplib::Response &r) {
                        status = r.status;
                        return false;
                    },
                    [](const char *, size_t) { return true; });
                h.http_status = status;
                // 404 still proves an HTTP server owns the port.
                h.http_ok = (status >= 200 && status < 400) || status == 404;
                if (status < 0)
                    h.detail = httplib::to_string(res.error());
            }
            catch (const std::exception &ex)
            {
                h.detail = ex.what();
            }
        }
        else
        {
            h.detail = fmt::format("port {} not accepting connections", *port);
        }
        out.push_back(std::move(h));
    }
    return out;
}

std::vector<RegistryDrift> ProcessSupervisor::validate_registry() const
{
    std::vector<RegistryDrift> drift;
    for (const auto &[key, rec] : pImpl->registry.list_servers())
    {
        const ServerConfig *cfg = pImpl->settings.find_server(rec.name);
        if (cfg == nullptr)
        {
            drift.push_back({key, rec.name, "not in configuration"});
        }
        else if (!cfg->enabled)
        {
            drift.push_back({key, rec.name, "disabled in configuration"});
        }
        else if (cfg->transport != rec.transport)
        {
            drift.push_back({key, rec.name,
                             fmt::format("transport mismatch: registry={}, config={}",
                                         to_string(rec.transport), to_string(cfg->transport))});
        }
    }
    for (const auto &d : drift)
        LOGGER_WARN("ProcessSupervisor: registry drift {}: {}", d.key, d.reason);
    return drift;
}

std::vector<RegistryDrift> ProcessSupervisor::repair_registry()
{
    auto drift = validate_registry();
    std::vector<std::string> keys;
    keys.reserve(drift.size());
    for (const auto &d : drift)
        keys.push_back(d.key);

    const auto removed = pImpl->registry.remove_keys(keys);
    if (!removed)
    {
        LOGGER_ERROR("ProcessSupervisor: registry repair failed");
        return {};
    }
    std::vector<RegistryDrift> repaired;
    for (const auto &d : drift)
    {
        if (std::find(removed->begin(), removed->end(), d.key) != removed->end())
            repaired.push_back(d);
    }
    return repaired;
}

} // namespace mcpmesh::mesh
