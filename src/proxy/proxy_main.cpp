/**
 * @file proxy_main.cpp
 * @brief mesh-proxy: the mesh's HTTP front door.
 *
 * Usage:
 *     mesh-proxy [--config <file>] [--host <addr>] [--port <n>] [--verbose]
 *
 * Loads the mesh configuration, rebuilds the backend mirror from the registry
 * and serves until SIGINT / SIGTERM. A second signal exits immediately.
 */
#include "mesh_core.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <thread>

using namespace mcpmesh::utils;

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) noexcept
{
    if (g_shutdown.load(std::memory_order_relaxed))
        std::_Exit(1);
    g_shutdown.store(true, std::memory_order_relaxed);
}

namespace
{

struct ProxyArgs
{
    std::string config_path;
    std::string host;
    int port{-1};
    bool verbose{false};
};

void print_usage(const char *prog)
{
    std::cout << "Usage:\n"
              << "  " << prog << " [--config <file>] [--host <addr>] [--port <n>] [--verbose]\n\n"
              << "Options:\n"
              << "  --config <file>   Single configuration file (default: config/mesh.*.json)\n"
              << "  --host <addr>     Listen address (overrides proxy.host)\n"
              << "  --port <n>        Listen port; 0 picks a free port (overrides proxy.port)\n"
              << "  --verbose         Debug logging\n"
              << "  --help            Show this message\n";
}

ProxyArgs parse_args(int argc, char *argv[])
{
    ProxyArgs args;
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
        else if (arg == "--host" && i + 1 < argc)
        {
            args.host = argv[++i];
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
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            std::exit(1);
        }
    }
    return args;
}

void configure_logging(const mcpmesh::LoggingSettings &logging, bool verbose)
{
    auto &logger = Logger::instance();
    if (!logging.file.empty() && !logger.set_logfile(logging.file.string()))
        LOGGER_WARN("mesh-proxy: cannot open log file '{}'; logging to console",
                    logging.file.string());
    if (verbose)
        logger.set_level(Logger::Level::L_DEBUG);
    else if (auto lvl = Logger::parse_level(logging.level))
        logger.set_level(*lvl);
}

} // namespace

int main(int argc, char *argv[])
{
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    const ProxyArgs args = parse_args(argc, argv);
    if (!args.config_path.empty())
        mcpmesh::MeshConfig::set_config_path(args.config_path);

    LifecycleGuard lifecycle(MakeModDefList(Logger::GetLifecycleModule(),
                                            FileLock::GetLifecycleModule(),
                                            JsonConfig::GetLifecycleModule(),
                                            mcpmesh::MeshConfig::GetLifecycleModule()));

    mcpmesh::MeshSettings settings = mcpmesh::MeshConfig::get_instance().settings();
    configure_logging(settings.logging, args.verbose);
    if (!args.host.empty())
        settings.proxy.host = args.host;
    if (args.port >= 0)
        settings.proxy.port = args.port;

    try
    {
        mcpmesh::mesh::ServiceRegistry registry(
            mcpmesh::mesh::RegistryOptions{settings.runtime.registry_path()});
        mcpmesh::mesh::ProxyService proxy(settings.proxy, registry);

        const auto loaded = proxy.load_from_registry();
        LOGGER_INFO("mesh-proxy {}: {} backend(s) from {}", mcpmesh::platform::get_version_string(),
                    loaded, registry.file().string());

        if (!proxy.start())
        {
            std::cerr << "mesh-proxy: cannot listen on " << settings.proxy.host << ":"
                      << settings.proxy.port << "\n";
            return 1;
        }

        while (!g_shutdown.load(std::memory_order_relaxed) && proxy.is_running())
            std::this_thread::sleep_for(std::chrono::milliseconds(100));

        LOGGER_INFO("mesh-proxy: shutting down");
        proxy.stop();
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("mesh-proxy: fatal: {}", e.what());
        std::cerr << "mesh-proxy: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
