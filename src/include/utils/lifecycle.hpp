#pragma once

/*******************************************************************************
 * @file lifecycle.hpp
 * @brief Application startup and shutdown with dependency-ordered modules.
 *
 * Every long-lived service of the mesh (Logger, FileLock, JsonConfig, MeshConfig)
 * publishes a `ModuleDef` through a static `GetLifecycleModule()`. `main()` hands
 * the modules it needs to a `LifecycleGuard`, which registers them and starts them
 * in dependency order (Kahn topological sort). A missing dependency or a cycle is
 * a fatal programming error. On destruction the guard shuts them down in reverse
 * order; each shutdown callback has its own timeout, after which it is detached
 * and reported so a hung module cannot block process exit.
 *
 * ```cpp
 * int main(int argc, char *argv[])
 * {
 *     mcpmesh::utils::LifecycleGuard app_lifecycle(mcpmesh::utils::MakeModDefList(
 *         mcpmesh::utils::Logger::GetLifecycleModule(),
 *         mcpmesh::utils::FileLock::GetLifecycleModule(),
 *         mcpmesh::MeshConfig::GetLifecycleModule()));
 *     LOGGER_INFO("mesh-proxy starting");
 *     ...
 * }
 * ```
 *
 * After finalization the manager returns to its initial state, so a later guard
 * (e.g. the next test suite in the same binary) can initialize the app again.
 ******************************************************************************/
#include "mesh_platform.hpp"
#include "utils/debug_info.hpp"
#include "utils/format_tools.hpp"
#include "utils/module_def.hpp"

#include <atomic>
#include <memory>
#include <source_location>
#include <type_traits>
#include <utility>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace mcpmesh::utils
{

class LifecycleManagerImpl;

/// @brief Builds a vector<ModuleDef> by moving the supplied definitions.
template <typename... Mods> inline std::vector<ModuleDef> MakeModDefList(Mods &&...mods)
{
    static_assert((std::is_same_v<std::decay_t<Mods>, ModuleDef> && ...),
                  "MakeModDefList: all arguments must be ModuleDef (rvalues or prvalues)");

    std::vector<ModuleDef> modules;
    modules.reserve(sizeof...(mods));
    (modules.emplace_back(std::forward<Mods>(mods)), ...);
    return modules;
}

/**
 * @class LifecycleManager
 * @brief Process-wide registry of lifecycle modules.
 */
class MCPMESH_UTILS_EXPORT LifecycleManager
{
  public:
    static LifecycleManager &instance();

    /**
     * @brief Adds a module. Must be called before initialize().
     * @details Registering after initialization, or registering a name twice, is fatal.
     */
    void register_module(ModuleDef &&module_def);

    /**
     * @brief Starts every registered module in dependency order.
     * @details If a startup callback throws, modules already started are shut down
     *          in reverse order and the exception is rethrown to the caller.
     */
    void initialize(std::source_location loc);

    /// @brief Shuts modules down in reverse start order and resets the manager.
    void finalize(std::source_location loc);

    [[nodiscard]] bool is_initialized() const noexcept;
    [[nodiscard]] bool is_finalized() const noexcept;

    /// @brief True if `name` was started and has not been shut down yet.
    [[nodiscard]] bool is_module_started(std::string_view name) const;

    ~LifecycleManager();
    LifecycleManager(const LifecycleManager &) = delete;
    LifecycleManager &operator=(const LifecycleManager &) = delete;

  private:
    LifecycleManager();
    std::unique_ptr<LifecycleManagerImpl> pImpl;
};

inline void RegisterModule(ModuleDef &&module_def)
{
    LifecycleManager::instance().register_module(std::move(module_def));
}

inline bool IsAppInitialized()
{
    return LifecycleManager::instance().is_initialized();
}

inline bool IsAppFinalized()
{
    return LifecycleManager::instance().is_finalized();
}

inline void InitializeApp(std::source_location loc = std::source_location::current())
{
    LifecycleManager::instance().initialize(loc);
}

inline void FinalizeApp(std::source_location loc = std::source_location::current())
{
    LifecycleManager::instance().finalize(loc);
}

/**
 * @class LifecycleGuard
 * @brief RAII owner of application initialization.
 *
 * The first live guard registers its modules and initializes the app; its
 * destructor finalizes it. A guard created while another owns the app is a no-op
 * and its modules are ignored.
 */
class LifecycleGuard
{
  public:
    LifecycleGuard(std::source_location loc = std::source_location::current()) : m_loc(loc)
    {
        init_owner_if_first({});
    }

    explicit LifecycleGuard(ModuleDef &&module,
                            std::source_location loc = std::source_location::current())
        : m_loc(loc)
    {
        std::vector<ModuleDef> modules;
        modules.emplace_back(std::move(module));
        init_owner_if_first(std::move(modules));
    }

    explicit LifecycleGuard(std::vector<ModuleDef> &&modules,
                            std::source_location loc = std::source_location::current())
        : m_loc(loc)
    {
        init_owner_if_first(std::move(modules));
    }

    LifecycleGuard(const LifecycleGuard &) = delete;
    LifecycleGuard &operator=(const LifecycleGuard &) = delete;
    LifecycleGuard(LifecycleGuard &&) = delete;
    LifecycleGuard &operator=(LifecycleGuard &&) = delete;

    ~LifecycleGuard() noexcept
    {
        if (m_is_owner)
        {
            MESH_DEBUG("[MESH_Lifecycle] owner guard from {} ({}:{}) finalizing.",
                       m_loc.function_name(), format_tools::filename_only(m_loc.file_name()),
                       m_loc.line());
            FinalizeApp(m_loc);
            owner_flag().store(false, std::memory_order_release);
        }
    }

    [[nodiscard]] bool is_owner() const noexcept { return m_is_owner; }

  private:
    static std::atomic_bool &owner_flag()
    {
        static std::atomic_bool flag{false};
        return flag;
    }

    void init_owner_if_first(std::vector<ModuleDef> &&modules)
    {
        bool expected = false;
        if (!owner_flag().compare_exchange_strong(expected, true, std::memory_order_acq_rel))
        {
            MESH_DEBUG("[MESH_Lifecycle] [{}:{}] LifecycleGuard in {} ({}:{}) is a no-op: an "
                       "owner already exists; its modules were ignored.",
                       platform::get_executable_name(), platform::get_pid(), m_loc.function_name(),
                       format_tools::filename_only(m_loc.file_name()), m_loc.line());
            return;
        }
        m_is_owner = true;
        try
        {
            for (auto &m : modules)
            {
                RegisterModule(std::move(m));
            }
            InitializeApp(m_loc);
        }
        catch (...)
        {
            // Leave the manager reusable before the failure reaches main().
            m_is_owner = false;
            owner_flag().store(false, std::memory_order_release);
            throw;
        }
    }

    std::source_location m_loc;
    bool m_is_owner{false};
};

} // namespace mcpmesh::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
