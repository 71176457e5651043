/**
 * @file mesh_config.cpp
 * @brief MeshConfig singleton lifecycle module implementation.
 *
 * Config loading strategy (priority low -> high):
 *  1. Built-in C++ defaults (member initializers of the settings structs)
 *  2. mesh.default.json: the canonical defaults file; always updated by the build
 *  3. mesh.user.json: user customisations; merged on top of defaults
 *  4. MCPMESH_CONFIG_FILE env var: if set, replaces both file sources with a
 *     single explicit file
 *  5. MCPMESH_RUNTIME_DIR / MCPMESH_PROXY_HOST / MCPMESH_PROXY_PORT
 *     process-level overrides applied after file loading
 */
#include "mesh_service.hpp"
#include "mesh/mesh_config.hpp"

#include <charconv>
#include <cstdlib>
#include <mutex>

namespace mcpmesh
{

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Module-level state
// ---------------------------------------------------------------------------

static std::atomic<bool> g_mesh_config_initialized{false};

static std::mutex g_config_path_mu;
static fs::path g_config_path_override; ///< Set by set_config_path() before startup.

namespace
{

fs::path get_binary_dir()
{
    const std::string exe = platform::get_executable_name(/*include_path=*/true);
    if (exe.empty() || exe.starts_with("unknown"))
        return {};
    return fs::path(exe).parent_path();
}

/// Returns the config directory discovered from the binary location.
fs::path discover_config_dir()
{
    const fs::path bin = get_binary_dir();
    if (bin.empty())
        return {};

    std::error_code ec;
    // Staged layout: <root>/bin/ + <root>/config/
    fs::path candidate = bin / ".." / "config";
    if (fs::is_directory(candidate, ec))
        return fs::weakly_canonical(candidate, ec);

    // Flat layout: config/ next to the binary
    candidate = bin / "config";
    if (fs::is_directory(candidate, ec))
        return fs::weakly_canonical(candidate, ec);
    return {};
}

/// Resolves a relative path in the config against the config directory.
fs::path resolve_path(const fs::path &config_dir, const std::string &raw)
{
    if (raw.empty())
        return {};
    std::error_code ec;
    fs::path p(raw);
    if (!p.is_absolute())
        p = config_dir.empty() ? fs::absolute(p, ec) : config_dir / p;
    fs::path canon = fs::weakly_canonical(p, ec);
    return ec ? p.lexically_normal() : canon;
}

/// Recursively merges `overrides` into `base` (object keys override, arrays replace).
void json_merge(nlohmann::json &base, const nlohmann::json &overrides)
{
    if (!overrides.is_object())
        return;
    for (auto it = overrides.begin(); it != overrides.end(); ++it)
    {
        if (it.value().is_object() && base.contains(it.key()) && base.at(it.key()).is_object())
        {
            json_merge(base[it.key()], it.value());
        }
        else
        {
            base[it.key()] = it.value();
        }
    }
}

/// Reads one config layer through JsonConfig. Returns nullopt if missing or unreadable.
std::optional<nlohmann::json> read_layer(const fs::path &path)
{
    std::error_code ec;
    if (!fs::exists(path, ec))
        return std::nullopt;
    utils::JsonConfig layer(path, /*createIfMissing=*/false, &ec);
    if (ec || !layer.is_initialized())
    {
        LOGGER_WARN("MeshConfig: '{}' not readable ({}); layer skipped", path.string(),
                    ec.message());
        return std::nullopt;
    }
    nlohmann::json j = layer.snapshot();
    if (!j.is_object())
    {
        LOGGER_WARN("MeshConfig: '{}' is not a JSON object; layer skipped", path.string());
        return std::nullopt;
    }
    return j;
}

template <typename Rep>
void read_seconds(const nlohmann::json &sec, const char *key, std::chrono::duration<Rep> &out)
{
    if (sec.contains(key) && !sec.at(key).is_null())
        out = std::chrono::duration<Rep>(sec.at(key).get<Rep>());
}

void read_millis(const nlohmann::json &sec, const char *key, std::chrono::milliseconds &out)
{
    if (sec.contains(key) && !sec.at(key).is_null())
        out = std::chrono::milliseconds(sec.at(key).get<int64_t>());
}

std::optional<int> parse_port(std::string_view text)
{
    int value = 0;
    const auto t = format_tools::trim(text);
    auto [ptr, ec] = std::from_chars(t.data(), t.data() + t.size(), value);
    if (ec != std::errc{} || ptr != t.data() + t.size() || value < 1 || value > 65535)
        return std::nullopt;
    return value;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ServerConfig JSON
// ---------------------------------------------------------------------------

void to_json(nlohmann::json &j, const ServerConfig &cfg)
{
    j = nlohmann::json{
        {"name", cfg.name},
        {"server_type", cfg.server_type},
        {"transport", mesh::to_string(cfg.transport)},
        {"host", cfg.host.empty() ? nlohmann::json(nullptr) : nlohmann::json(cfg.host)},
        {"port", cfg.port ? nlohmann::json(*cfg.port) : nlohmann::json(nullptr)},
        {"command", cfg.command},
        {"env", cfg.env},
        {"enabled", cfg.enabled},
        {"auto_restart", cfg.auto_restart},
        {"description", cfg.description},
    };
}

void from_json(const nlohmann::json &j, ServerConfig &cfg)
{
    if (!j.is_object() || !j.contains("name") || !j.at("name").is_string() ||
        j.at("name").get<std::string>().empty())
    {
        throw std::invalid_argument("server entry requires a non-empty 'name'");
    }
    cfg.name = j.at("name").get<std::string>();
    cfg.server_type = j.value("server_type", cfg.name);
    if (cfg.server_type.empty())
        cfg.server_type = cfg.name;

    const std::string transport = j.value("transport", std::string{"sse"});
    const auto parsed = mesh::parse_transport(transport);
    if (!parsed)
    {
        throw std::invalid_argument(
            fmt::format("server '{}': unknown transport '{}'", cfg.name, transport));
    }
    cfg.transport = *parsed;

    cfg.host.clear();
    if (j.contains("host") && j.at("host").is_string())
    {
        cfg.host = j.at("host").get<std::string>();
        if (format_tools::iequals(cfg.host, "auto"))
            cfg.host.clear();
    }

    cfg.port.reset();
    if (j.contains("port") && !j.at("port").is_null())
        cfg.port = j.at("port").get<int>();

    cfg.command.clear();
    if (j.contains("command"))
    {
        const auto &c = j.at("command");
        if (c.is_string())
            cfg.command.push_back(c.get<std::string>());
        else
            cfg.command = c.get<std::vector<std::string>>();
    }

    cfg.env.clear();
    if (j.contains("env") && j.at("env").is_object())
    {
        for (auto it = j.at("env").begin(); it != j.at("env").end(); ++it)
        {
            cfg.env[it.key()] =
                it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
        }
    }

    cfg.enabled = j.value("enabled", true);
    cfg.auto_restart = j.value("auto_restart", true);
    cfg.description = j.value("description", std::string{});
}

// ---------------------------------------------------------------------------
// MeshSettings
// ---------------------------------------------------------------------------

const ServerConfig *MeshSettings::find_server(std::string_view name) const noexcept
{
    for (const auto &s : servers)
    {
        if (s.name == name)
            return &s;
    }
    return nullptr;
}

std::string MeshSettings::proxy_url() const
{
    const std::string host = (proxy.host.empty() || proxy.host == "0.0.0.0") ? "localhost" : proxy.host;
    return fmt::format("http://{}:{}", host, proxy.port);
}

void MeshSettings::apply_json(const nlohmann::json &j)
{
    try
    {
        if (j.contains("proxy"))
        {
            const auto &p = j.at("proxy");
            if (p.contains("host"))
                proxy.host = p.at("host").get<std::string>();
            if (p.contains("port"))
                proxy.port = p.at("port").get<int>();
            read_seconds(p, "timeout_s", proxy.timeout);
            read_seconds(p, "connect_timeout_s", proxy.connect_timeout);
            read_seconds(p, "session_sweep_s", proxy.session_sweep);
            read_seconds(p, "health_timeout_s", proxy.health_timeout);
        }
        if (j.contains("runtime"))
        {
            const auto &r = j.at("runtime");
            if (r.contains("dir") && r.at("dir").is_string())
                runtime.dir = resolve_path(config_dir, r.at("dir").get<std::string>());
            if (r.contains("registry_file"))
                runtime.registry_file = r.at("registry_file").get<std::string>();
            if (r.contains("lock_backend"))
            {
                const auto text = r.at("lock_backend").get<std::string>();
                const auto kind = utils::parse_lock_backend_kind(text);
                if (!kind)
                {
                    throw std::invalid_argument(
                        fmt::format("runtime.lock_backend: unknown backend '{}'", text));
                }
                runtime.lock_backend = *kind;
            }
        }
        if (j.contains("supervisor"))
        {
            const auto &s = j.at("supervisor");
            read_seconds(s, "monitor_interval_s", supervisor.monitor_interval);
            read_millis(s, "start_grace_ms", supervisor.start_grace);
            read_millis(s, "registration_wait_ms", supervisor.registration_wait);
            read_millis(s, "stop_timeout_ms", supervisor.stop_timeout);
            if (s.contains("port_range_start"))
                supervisor.port_range_start = s.at("port_range_start").get<int>();
        }
        if (j.contains("logging"))
        {
            const auto &l = j.at("logging");
            if (l.contains("level"))
                logging.level = l.at("level").get<std::string>();
            if (l.contains("file") && l.at("file").is_string())
                logging.file = resolve_path(config_dir, l.at("file").get<std::string>());
        }
        if (j.contains("servers"))
        {
            servers = j.at("servers").get<std::vector<ServerConfig>>();
        }
    }
    catch (const nlohmann::json::exception &ex)
    {
        throw std::invalid_argument(fmt::format("malformed mesh configuration: {}", ex.what()));
    }

    for (size_t i = 0; i < servers.size(); ++i)
    {
        for (size_t k = i + 1; k < servers.size(); ++k)
        {
            if (servers[i].name == servers[k].name)
            {
                throw std::invalid_argument(
                    fmt::format("duplicate server name '{}'", servers[i].name));
            }
        }
    }
}

void MeshSettings::apply_env_overrides()
{
    if (const char *env = std::getenv("MCPMESH_RUNTIME_DIR"); env && *env)
        runtime.dir = resolve_path({}, env);
    if (const char *env = std::getenv("MCPMESH_PROXY_HOST"); env && *env)
        proxy.host = env;
    if (const char *env = std::getenv("MCPMESH_PROXY_PORT"); env && *env)
    {
        if (auto port = parse_port(env))
            proxy.port = *port;
        else
            LOGGER_WARN("MeshConfig: ignoring invalid MCPMESH_PROXY_PORT '{}'", env);
    }
}

nlohmann::json MeshSettings::to_json() const
{
    nlohmann::json j;
    j["root_dir"] = root_dir.string();
    j["config_dir"] = config_dir.string();
    j["proxy"] = {
        {"host", proxy.host},
        {"port", proxy.port},
        {"timeout_s", proxy.timeout.count()},
        {"connect_timeout_s", proxy.connect_timeout.count()},
        {"session_sweep_s", proxy.session_sweep.count()},
        {"health_timeout_s", proxy.health_timeout.count()},
    };
    j["runtime"] = {
        {"dir", runtime.dir.string()},
        {"registry_file", runtime.registry_file},
        {"lock_backend", utils::to_string(runtime.lock_backend)},
    };
    j["supervisor"] = {
        {"monitor_interval_s", supervisor.monitor_interval.count()},
        {"start_grace_ms", supervisor.start_grace.count()},
        {"registration_wait_ms", supervisor.registration_wait.count()},
        {"stop_timeout_ms", supervisor.stop_timeout.count()},
        {"port_range_start", supervisor.port_range_start},
    };
    j["logging"] = {
        {"level", logging.level},
        {"file", logging.file.empty() ? nlohmann::json(nullptr) : nlohmann::json(logging.file.string())},
    };
    j["servers"] = servers;
    return j;
}

MeshSettings MeshSettings::load(const fs::path &override_file, const fs::path &config_dir)
{
    MeshSettings s;

    fs::path explicit_file = override_file;
    if (explicit_file.empty())
    {
        if (const char *env = std::getenv("MCPMESH_CONFIG_FILE"); env && *env)
            explicit_file = env;
    }

    if (!explicit_file.empty())
    {
        // Single-file override: no default/user layering.
        explicit_file = fs::absolute(explicit_file);
        s.config_dir = explicit_file.parent_path();
        s.root_dir = fs::weakly_canonical(s.config_dir / "..");
        if (auto j = read_layer(explicit_file))
        {
            LOGGER_INFO("MeshConfig: loading override file '{}'", explicit_file.string());
            s.apply_json(*j);
        }
        else
        {
            LOGGER_WARN("MeshConfig: override file '{}' not readable; using defaults",
                        explicit_file.string());
        }
    }
    else
    {
        fs::path cfg_dir = config_dir.empty() ? discover_config_dir() : fs::absolute(config_dir);
        if (!cfg_dir.empty())
        {
            s.config_dir = cfg_dir;
            s.root_dir = fs::weakly_canonical(cfg_dir / "..");

            nlohmann::json merged = nlohmann::json::object();
            if (auto jdef = read_layer(cfg_dir / "mesh.default.json"))
            {
                LOGGER_INFO("MeshConfig: loading defaults from '{}'",
                            (cfg_dir / "mesh.default.json").string());
                json_merge(merged, *jdef);
            }
            else
            {
                LOGGER_INFO("MeshConfig: mesh.default.json not found; using built-in defaults");
            }
            if (auto juser = read_layer(cfg_dir / "mesh.user.json"))
            {
                LOGGER_INFO("MeshConfig: merging user overrides from '{}'",
                            (cfg_dir / "mesh.user.json").string());
                json_merge(merged, *juser);
            }
            s.apply_json(merged);
        }
        else
        {
            const fs::path bin = get_binary_dir();
            s.root_dir = bin.empty() ? fs::current_path() : fs::weakly_canonical(bin / "..");
            s.config_dir = s.root_dir / "config";
            LOGGER_INFO("MeshConfig: no config directory found; using built-in defaults");
        }
    }

    if (s.runtime.dir.empty())
        s.runtime.dir = s.root_dir / "runtime";

    s.apply_env_overrides();
    return s;
}

// ---------------------------------------------------------------------------
// MeshConfig::Impl
// ---------------------------------------------------------------------------

struct MeshConfig::Impl
{
    MeshSettings settings;

    void load(const fs::path &override_path)
    {
        settings = MeshSettings::load(override_path, {});
        utils::FileLock::set_lock_backend(settings.runtime.lock_backend);

        LOGGER_INFO("MeshConfig: root_dir     = {}", settings.root_dir.string());
        LOGGER_INFO("MeshConfig: config_dir   = {}", settings.config_dir.string());
        LOGGER_INFO("MeshConfig: runtime_dir  = {}", settings.runtime.dir.string());
        LOGGER_INFO("MeshConfig: proxy        = {}:{}", settings.proxy.host, settings.proxy.port);
        LOGGER_INFO("MeshConfig: lock_backend = {}", utils::FileLock::lock_backend_name());
        LOGGER_INFO("MeshConfig: servers      = {}", settings.servers.size());
    }
};

// ---------------------------------------------------------------------------
// MeshConfig public interface
// ---------------------------------------------------------------------------

MeshConfig::MeshConfig() : pImpl(std::make_unique<Impl>()) {}
MeshConfig::~MeshConfig() = default;

// static
void MeshConfig::set_config_path(const fs::path &path)
{
    std::lock_guard lock(g_config_path_mu);
    g_config_path_override = path;
}

// static
MeshConfig &MeshConfig::get_instance()
{
    static MeshConfig instance;
    return instance;
}

// static
bool MeshConfig::lifecycle_initialized() noexcept
{
    return g_mesh_config_initialized.load(std::memory_order_acquire);
}

void MeshConfig::load_(const fs::path &override_path)
{
    // Re-loadable: each lifecycle run starts from built-in defaults.
    pImpl = std::make_unique<Impl>();
    pImpl->load(override_path);
}

const MeshSettings &MeshConfig::settings() const noexcept
{
    if (!lifecycle_initialized())
    {
        MESH_PANIC("MeshConfig::settings() called before the MeshConfig module was started");
    }
    return pImpl->settings;
}

// ---------------------------------------------------------------------------
// Lifecycle startup / shutdown
// ---------------------------------------------------------------------------

namespace
{
void do_mesh_config_startup(const char * /*arg*/)
{
    fs::path override_path;
    {
        std::lock_guard lock(g_config_path_mu);
        override_path = g_config_path_override;
    }
    MeshConfig::get_instance().load_(override_path);
    g_mesh_config_initialized.store(true, std::memory_order_release);
}

void do_mesh_config_shutdown(const char * /*arg*/)
{
    g_mesh_config_initialized.store(false, std::memory_order_release);
}
} // namespace

// static
utils::ModuleDef MeshConfig::GetLifecycleModule()
{
    utils::ModuleDef module("mcpmesh::MeshConfig");
    module.add_dependency("mcpmesh::utils::Logger");
    module.add_dependency("mcpmesh::utils::JsonConfig");
    module.set_startup(&do_mesh_config_startup);
    module.set_shutdown(&do_mesh_config_shutdown, std::chrono::milliseconds(500));
    return module;
}

} // namespace mcpmesh
