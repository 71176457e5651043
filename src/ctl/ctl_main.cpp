/**
 * @file ctl_main.cpp
 * @brief mesh-ctl: supervisor control surface.
 *
 * Usage:
 *     mesh-ctl <command> [server_name] [--name N] [--proxy-url URL] [--force]
 *              [--verbose] [--dry-run] [--config FILE]
 *
 * Commands act on one named server or, without a name, on every enabled server
 * of the configuration. SIGINT / SIGTERM stops between servers and exits 1.
 * `start` without a name stays in the foreground restarting dead servers
 * until interrupted.
 */
#include "mesh_core.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <httplib.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <map>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

using namespace mcpmesh::utils;
using mcpmesh::mesh::ProcessSupervisor;
using mcpmesh::mesh::ServiceRegistry;

static std::atomic<bool> g_interrupted{false};

static void signal_handler(int /*sig*/) noexcept
{
    if (g_interrupted.load(std::memory_order_relaxed))
        std::_Exit(1);
    g_interrupted.store(true, std::memory_order_relaxed);
}

namespace
{

constexpr int kExitInterrupted = 1;

struct CtlArgs
{
    std::string command;
    std::string name;
    std::string proxy_url;
    std::string config_path;
    bool force{false};
    bool verbose{false};
    bool dry_run{false};
};

void print_usage(const char *prog)
{
    fmt::print("Usage:\n"
               "  {} <command> [server_name] [options]\n\n"
               "Commands:\n"
               "  start        Start one server, or every enabled server and monitor them\n"
               "  stop         Stop one server, or every enabled server\n"
               "  restart      Stop then start\n"
               "  status       List configured servers and registry entries\n"
               "  health       Process, port and endpoint checks\n"
               "  cleanup      Reap dead processes, stale pid files and dead records\n"
               "  validate     Report registry entries that disagree with the configuration\n"
               "  fix          Remove the entries `validate` reports\n"
               "  unregister   Remove a name through the proxy (falls back to the registry)\n"
               "  config       Print the effective configuration\n\n"
               "Options:\n"
               "  --name N         Server name (same as the positional argument)\n"
               "  --proxy-url URL  Proxy to contact (default: from configuration)\n"
               "  --force          Kill without the grace period\n"
               "  --verbose        Debug logging and detailed output\n"
               "  --dry-run        Print the planned actions only\n"
               "  --config FILE    Single configuration file\n"
               "  --help           Show this message\n",
               prog);
}

CtlArgs parse_args(int argc, char *argv[])
{
    CtlArgs args;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg(argv[i]);
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            std::exit(0);
        }
        if (arg == "--name" && i + 1 < argc)
        {
            args.name = argv[++i];
        }
        else if (arg == "--proxy-url" && i + 1 < argc)
        {
            args.proxy_url = argv[++i];
        }
        else if (arg == "--config" && i + 1 < argc)
        {
            args.config_path = argv[++i];
        }
        else if (arg == "--force")
        {
            args.force = true;
        }
        else if (arg == "--verbose" || arg == "-v")
        {
            args.verbose = true;
        }
        else if (arg == "--dry-run")
        {
            args.dry_run = true;
        }
        else if (!arg.empty() && arg.front() != '-' && args.command.empty())
        {
            args.command = std::string(arg);
        }
        else if (!arg.empty() && arg.front() != '-' && args.name.empty())
        {
            args.name = std::string(arg);
        }
        else
        {
            fmt::print(stderr, "Unknown argument: {}\n", arg);
            print_usage(argv[0]);
            std::exit(1);
        }
    }
    if (args.command.empty())
    {
        fmt::print(stderr, "Error: a command is required\n\n");
        print_usage(argv[0]);
        std::exit(1);
    }
    return args;
}

void configure_logging(const mcpmesh::LoggingSettings &logging, bool verbose)
{
    auto &logger = Logger::instance();
    if (!logging.file.empty() && !logger.set_logfile(logging.file.string()))
        LOGGER_WARN("mesh-ctl: cannot open log file '{}'; logging to console",
                    logging.file.string());
    if (verbose)
        logger.set_level(Logger::Level::L_DEBUG);
    else if (auto lvl = Logger::parse_level(logging.level))
        logger.set_level(*lvl);
}

/// The named server, or every enabled one.
std::vector<std::string> target_names(const mcpmesh::MeshSettings &settings, const CtlArgs &args)
{
    if (!args.name.empty())
        return {args.name};
    std::vector<std::string> names;
    for (const auto &s : settings.servers)
    {
        if (s.enabled)
            names.push_back(s.name);
    }
    return names;
}

void print_start(const mcpmesh::mesh::StartResult &r, const std::string &name)
{
    if (r.ok)
        fmt::print("[ok]   {}: pid {} port {} ({})\n", name, r.pid, r.port, r.message);
    else
        fmt::print("[fail] {}: {} (log: {})\n", name, r.message, r.log_path.string());
}

void print_cleanup(const mcpmesh::mesh::CleanupReport &report)
{
    fmt::print("reaped children:  {}\n", report.reaped_children);
    fmt::print("stale pid files:  {}\n", fmt::join(report.stale_pid_files, ", "));
    fmt::print("pruned records:   {}\n", fmt::join(report.pruned_records, ", "));
    fmt::print("killed processes: {}\n", fmt::join(report.killed_processes, ", "));
}

int cmd_restart(ProcessSupervisor &sup, const std::vector<std::string> &names, const CtlArgs &args)
{
    int failures = 0;
    for (const auto &name : names)
    {
        if (g_interrupted.load())
            return kExitInterrupted;
        if (args.dry_run)
        {
            fmt::print("would restart {}\n", name);
            continue;
        }
        const auto r = sup.restart_server(name);
        print_start(r, name);
        if (!r.ok)
            ++failures;
    }
    return failures == 0 ? 0 : 1;
}

/**
 * Pre-start cleanup, then the servers. Starting every enabled server keeps
 * mesh-ctl in the foreground running the monitor until SIGINT / SIGTERM.
 */
int cmd_start(ProcessSupervisor &sup, const std::vector<std::string> &names, const CtlArgs &args)
{
    const bool start_all = args.name.empty();
    if (args.dry_run)
    {
        fmt::print("would clean up dead processes and ports\n");
        for (const auto &name : names)
            fmt::print("would start {}\n", name);
        if (start_all && !names.empty())
            fmt::print("would monitor and restart servers until interrupted\n");
        return 0;
    }

    const auto report = sup.cleanup_dead_processes_and_ports();
    if (args.verbose)
        print_cleanup(report);

    int failures = 0;
    for (const auto &name : names)
    {
        if (g_interrupted.load())
            return kExitInterrupted;
        const auto r = sup.start_server(name);
        print_start(r, name);
        if (!r.ok)
            ++failures;
    }
    if (!start_all || names.empty())
        return failures == 0 ? 0 : 1;

    sup.start_monitor();
    fmt::print("monitoring {} server(s); press Ctrl-C to stop\n", names.size());
    while (!g_interrupted.load())
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    sup.stop_monitor();
    LOGGER_INFO("mesh-ctl: monitor stopped on interrupt");
    return kExitInterrupted;
}

int cmd_stop(ProcessSupervisor &sup, const std::vector<std::string> &names, const CtlArgs &args)
{
    int failures = 0;
    for (const auto &name : names)
    {
        if (g_interrupted.load())
            return kExitInterrupted;
        if (args.dry_run)
        {
            fmt::print("would stop {}{}\n", name, args.force ? " (force)" : "");
            continue;
        }
        const bool ok = sup.stop_server(name, args.force);
        fmt::print("{} {}\n", ok ? "[ok]  " : "[fail]", name);
        if (!ok)
            ++failures;
    }
    return failures == 0 ? 0 : 1;
}

int cmd_status(ProcessSupervisor &sup, ServiceRegistry &registry, const CtlArgs &args)
{
    fmt::print("{:<24} {:<6} {:<8} {:<8} {:<8} {}\n", "NAME", "TRANS", "ENABLED", "STATE", "PID",
               "PORT");
    for (const auto &s : sup.status())
    {
        fmt::print("{:<24} {:<6} {:<8} {:<8} {:<8} {}\n", s.name,
                   mcpmesh::mesh::to_string(s.transport), s.enabled ? "yes" : "no",
                   s.running ? "running" : "stopped", s.running ? std::to_string(s.pid) : "-",
                   s.port ? std::to_string(*s.port) : "-");
    }

    const auto reg = registry.status();
    fmt::print("\nRegistry {}: {} entr{}\n", registry.file().string(), reg.value("total", 0),
               reg.value("total", 0) == 1 ? "y" : "ies");
    if (args.verbose)
        fmt::print("{}\n", reg.dump(2));
    return 0;
}

int cmd_health(ProcessSupervisor &sup, const CtlArgs &args)
{
    int unhealthy = 0;
    for (const auto &h : sup.health_check())
    {
        if (!args.name.empty() && h.name != args.name)
            continue;
        fmt::print("{:<24} {:<9} process={} port={} endpoint={}{}\n", h.name,
                   h.healthy() ? "healthy" : "UNHEALTHY", h.running ? "up" : "down",
                   h.tcp_ok ? "open" : "closed",
                   h.http_status >= 0 ? std::to_string(h.http_status) : std::string("-"),
                   h.detail.empty() ? "" : fmt::format(" ({})", h.detail));
        if (!h.healthy())
            ++unhealthy;
    }
    return unhealthy == 0 ? 0 : 1;
}

int cmd_cleanup(ProcessSupervisor &sup, const CtlArgs &args)
{
    if (args.dry_run)
    {
        fmt::print("would reap exited children, remove stale pid files, prune dead local "
                   "registry records and kill orphaned server processes\n");
        return 0;
    }
    print_cleanup(sup.cleanup_dead_processes_and_ports());
    return 0;
}

int cmd_validate(ProcessSupervisor &sup, bool fix, const CtlArgs &args)
{
    const auto drift = (fix && !args.dry_run) ? sup.repair_registry() : sup.validate_registry();
    if (drift.empty())
    {
        fmt::print("registry matches the configuration\n");
        return 0;
    }
    for (const auto &d : drift)
    {
        fmt::print("{}{}: {}\n", fix ? (args.dry_run ? "would remove " : "removed ") : "", d.key,
                   d.reason);
    }
    return fix ? 0 : 1;
}

int cmd_unregister(ServiceRegistry &registry, const std::string &proxy_url, const CtlArgs &args)
{
    if (args.name.empty())
    {
        fmt::print(stderr, "Error: unregister needs a server name\n");
        return 1;
    }
    if (args.dry_run)
    {
        fmt::print("would unregister {} via {}\n", args.name, proxy_url);
        return 0;
    }

    httplib::Client cli(proxy_url);
    cli.set_connection_timeout(std::chrono::seconds(5));
    cli.set_read_timeout(std::chrono::seconds(10));
    if (auto res = cli.Delete("/proxy/unregister/" + args.name); res && res->status == 200)
    {
        fmt::print("unregistered {} via proxy {}\n", args.name, proxy_url);
        return 0;
    }
    else if (res)
    {
        LOGGER_INFO("mesh-ctl: proxy answered {} for '{}'; using the registry", res->status,
                    args.name);
    }
    else
    {
        LOGGER_WARN("mesh-ctl: proxy {} unreachable ({}); using the registry", proxy_url,
                    httplib::to_string(res.error()));
    }

    const auto removed = registry.remove_by_name(args.name, /*local_only=*/false);
    if (!removed)
    {
        fmt::print(stderr, "failed to update registry {}\n", registry.file().string());
        return 1;
    }
    if (removed->empty())
    {
        fmt::print("{} is not registered\n", args.name);
        return 1;
    }
    fmt::print("removed from registry: {}\n", fmt::join(*removed, ", "));
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    const CtlArgs args = parse_args(argc, argv);
    if (!args.config_path.empty())
        mcpmesh::MeshConfig::set_config_path(args.config_path);

    try
    {
        LifecycleGuard lifecycle(MakeModDefList(Logger::GetLifecycleModule(),
                                                FileLock::GetLifecycleModule(),
                                                JsonConfig::GetLifecycleModule(),
                                                mcpmesh::MeshConfig::GetLifecycleModule()));

        const mcpmesh::MeshSettings &settings = mcpmesh::MeshConfig::get_instance().settings();
        configure_logging(settings.logging, args.verbose);

        if (args.command == "config")
        {
            fmt::print("{}\n", settings.to_json().dump(2));
            return 0;
        }

        ServiceRegistry registry(mcpmesh::mesh::RegistryOptions{settings.runtime.registry_path()});
        ProcessSupervisor sup(settings, registry);
        const auto names = target_names(settings, args);
        const std::string proxy_url =
            args.proxy_url.empty() ? settings.proxy_url() : args.proxy_url;

        int rc = 1;
        if (args.command == "start")
            rc = cmd_start(sup, names, args);
        else if (args.command == "stop")
            rc = cmd_stop(sup, names, args);
        else if (args.command == "restart")
            rc = cmd_restart(sup, names, args);
        else if (args.command == "status")
            rc = cmd_status(sup, registry, args);
        else if (args.command == "health")
            rc = cmd_health(sup, args);
        else if (args.command == "cleanup")
            rc = cmd_cleanup(sup, args);
        else if (args.command == "validate")
            rc = cmd_validate(sup, /*fix=*/false, args);
        else if (args.command == "fix")
            rc = cmd_validate(sup, /*fix=*/true, args);
        else if (args.command == "unregister")
            rc = cmd_unregister(registry, proxy_url, args);
        else
        {
            fmt::print(stderr, "Unknown command: {}\n", args.command);
            print_usage(argv[0]);
            return 1;
        }

        if (g_interrupted.load())
        {
            fmt::print(stderr, "interrupted\n");
            return kExitInterrupted;
        }
        return rc;
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "mesh-ctl: {}\n", e.what());
        return 1;
    }
}
