/**
 * @file bridge_main.cpp
 * @brief mesh-bridge: publishes a stdio MCP server as a mesh backend.
 *
 * Usage:
 *     mesh-bridge --config <bridge.json> [--port <n>] [--proxy-url <url>] [--verbose]
 *
 * Starts the wrapped command, serves its tools over HTTP/SSE, registers with
 * the proxy and runs until SIGINT / SIGTERM. The bridge lifecycle module owns
 * the bridge, so its shutdown unregisters from the proxy even when main does
 * not get to clean up.
 */
#include "mesh_core.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <thread>

using namespace mcpmesh::utils;
using mcpmesh::mesh::BridgeConfig;
using mcpmesh::mesh::ExternalBridge;

static std::atomic<bool> g_shutdown{false};
static std::unique_ptr<ExternalBridge> g_bridge; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

static void signal_handler(int /*sig*/) noexcept
{
    if (g_shutdown.load(std::memory_order_relaxed))
        std::_Exit(1);
    g_shutdown.store(true, std::memory_order_relaxed);
}

namespace
{

struct BridgeArgs
{
    std::string config_path;
    std::string proxy_url;
    int port{-1};
    bool verbose{false};
};

void print_usage(const char *prog)
{
    std::cout << "Usage:\n"
              << "  " << prog << " --config <bridge.json> [--port <n>] [--proxy-url <url>] [--verbose]\n\n"
              << "Options:\n"
              << "  --config <file>    Bridge JSON (name, command, args, env, ...) (required)\n"
              << "  --port <n>         Listen port; 0 picks a free port (overrides 'port')\n"
              << "  --proxy-url <url>  Proxy to register with (overrides 'proxy_url')\n"
              << "  --verbose          Debug logging\n"
              << "  --help             Show this message\n";
}

BridgeArgs parse_args(int argc, char *argv[])
{
    BridgeArgs args;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg(argv[i]);
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            std::exit(0);
        }
        if (arg == "--config" && i + 1 < argc)
        {
            args.config_path = argv[++i];
        }
        else if (arg == "--proxy-url" && i + 1 < argc)
        {
            args.proxy_url = argv[++i];
        }
        else if (arg == "--port" && i + 1 < argc)
        {
            try
            {
                args.port = std::stoi(argv[++i]);
            }
            catch (const std::exception &)
            {
                std::cerr << "Error: --port expects a number\n";
                std::exit(1);
            }
        }
        else if (arg == "--verbose" || arg == "-v")
        {
            args.verbose = true;
        }
        else if (args.config_path.empty() && !arg.empty() && arg.front() != '-')
        {
            args.config_path = std::string(arg);
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            std::exit(1);
        }
    }
    if (args.config_path.empty())
    {
        std::cerr << "Error: --config <path> is required\n\n";
        print_usage(argv[0]);
        std::exit(1);
    }
    return args;
}

void bridge_startup(const char * /*arg*/)
{
    LOGGER_DEBUG("mesh-bridge: lifecycle module started");
}

void bridge_shutdown(const char * /*arg*/)
{
    // Destruction stops serving and unregisters from the proxy.
    g_bridge.reset();
}

ModuleDef bridge_module()
{
    ModuleDef module("mcpmesh::mesh::ExternalBridge");
    module.add_dependency("mcpmesh::utils::Logger");
    module.add_dependency("mcpmesh::utils::JsonConfig");
    module.set_startup(&bridge_startup);
    module.set_shutdown(&bridge_shutdown, std::chrono::milliseconds(10000));
    return module;
}

} // namespace

int main(int argc, char *argv[])
{
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    mcpmesh::platform::ignore_broken_pipe_signal();

    const BridgeArgs args = parse_args(argc, argv);

    LifecycleGuard lifecycle(MakeModDefList(Logger::GetLifecycleModule(),
                                            FileLock::GetLifecycleModule(),
                                            JsonConfig::GetLifecycleModule(), bridge_module()));
    if (args.verbose)
        Logger::instance().set_level(Logger::Level::L_DEBUG);

    BridgeConfig cfg;
    try
    {
        cfg = BridgeConfig::load(args.config_path);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }
    if (args.port >= 0)
        cfg.port = args.port;
    if (!args.proxy_url.empty())
        cfg.proxy_url = args.proxy_url;

    g_bridge = std::make_unique<ExternalBridge>(cfg);
    if (!g_bridge->start_client())
    {
        std::cerr << "mesh-bridge: cannot start '" << cfg.command << "'\n";
        g_bridge.reset();
        return 1;
    }
    if (!g_bridge->serve())
    {
        std::cerr << "mesh-bridge: cannot listen on " << cfg.host << ":" << cfg.port << "\n";
        g_bridge.reset();
        return 1;
    }
    if (!g_bridge->register_with_proxy())
        LOGGER_WARN("mesh-bridge: running unregistered; the proxy will not route to '{}'",
                    g_bridge->service_name());

    LOGGER_INFO("mesh-bridge: '{}' ready on port {}", g_bridge->service_name(), g_bridge->port());
    while (!g_shutdown.load(std::memory_order_relaxed))
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

    LOGGER_INFO("mesh-bridge: shutting down");
    g_bridge.reset();
    return 0;
}
