/*******************************************************************************
 * @file lifecycle.cpp
 * @brief Implementation of the dependency-aware application lifecycle manager.
 *
 * @see include/utils/lifecycle.hpp
 *
 * `initialize()` builds a graph from the registered modules and starts them in
 * topological order (Kahn's algorithm; ties broken by registration order so the
 * start sequence is deterministic). `finalize()` walks the start order backwards.
 *
 * Shutdown callbacks run on a helper thread with a real deadline (thread + shared
 * completion state + poll + detach). `std::async` is not used because its future
 * blocks in the destructor even after `wait_for` reports a timeout.
 ******************************************************************************/
#include "mesh_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/module_def.hpp"

#include <chrono>
#include <fmt/ranges.h>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace
{
void validate_module_name(std::string_view name, const char *param_name)
{
    if (name.empty())
    {
        throw std::invalid_argument(std::string("Lifecycle: ") + param_name + " must not be empty.");
    }
    if (name.size() > mcpmesh::utils::ModuleDef::MAX_MODULE_NAME_LEN)
    {
        throw std::length_error(std::string("Lifecycle: ") + param_name + " exceeds maximum of " +
                                std::to_string(mcpmesh::utils::ModuleDef::MAX_MODULE_NAME_LEN) +
                                " characters.");
    }
}

void validate_callback_arg(std::string_view arg)
{
    if (arg.size() > mcpmesh::utils::ModuleDef::MAX_CALLBACK_PARAM_STRLEN)
    {
        throw std::length_error("Lifecycle: callback argument exceeds maximum of " +
                                std::to_string(mcpmesh::utils::ModuleDef::MAX_CALLBACK_PARAM_STRLEN) +
                                " characters.");
    }
}

struct ShutdownOutcome
{
    bool timed_out = false;
    std::string exception_msg;
};

/// State shared with a shutdown thread that may outlive the call (detached on timeout).
struct ShutdownState
{
    std::atomic<bool> completed{false};
    std::string exception_msg;
};

ShutdownOutcome timed_shutdown(mcpmesh::utils::LifecycleCallback func, std::string arg,
                               bool has_arg, std::chrono::milliseconds timeout)
{
    auto run = [func, arg, has_arg](std::string &error_out)
    {
        try
        {
            func(has_arg ? arg.c_str() : nullptr);
        }
        catch (const std::exception &e)
        {
            error_out = e.what();
        }
        catch (...)
        {
            error_out = "non-standard exception";
        }
    };

    if (timeout.count() <= 0)
    {
        ShutdownOutcome outcome;
        run(outcome.exception_msg);
        return outcome;
    }

    auto state = std::make_shared<ShutdownState>();
    std::thread worker(
        [state, run]()
        {
            run(state->exception_msg);
            state->completed.store(true, std::memory_order_release);
        });

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!state->completed.load(std::memory_order_acquire))
    {
        if (std::chrono::steady_clock::now() >= deadline)
        {
            worker.detach();
            return {true, {}};
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    worker.join();
    return {false, state->exception_msg};
}

} // namespace

namespace mcpmesh::utils
{

// ============================================================================
// ModuleDef
// ============================================================================

class ModuleDefImpl
{
  public:
    std::string name;
    std::vector<std::string> dependencies;
    LifecycleCallback startup = nullptr;
    std::string startup_arg;
    bool has_startup_arg = false;
    LifecycleCallback shutdown = nullptr;
    std::string shutdown_arg;
    bool has_shutdown_arg = false;
    std::chrono::milliseconds shutdown_timeout{0};
};

ModuleDef::ModuleDef(std::string_view name) : pImpl(std::make_unique<ModuleDefImpl>())
{
    validate_module_name(name, "module name");
    pImpl->name = std::string(name);
}

ModuleDef::~ModuleDef() = default;
ModuleDef::ModuleDef(ModuleDef &&other) noexcept = default;
ModuleDef &ModuleDef::operator=(ModuleDef &&other) noexcept = default;

void ModuleDef::add_dependency(std::string_view dependency_name)
{
    if (dependency_name.empty())
    {
        return;
    }
    validate_module_name(dependency_name, "dependency name");
    pImpl->dependencies.emplace_back(dependency_name);
}

void ModuleDef::set_startup(LifecycleCallback startup_func)
{
    pImpl->startup = startup_func;
    pImpl->has_startup_arg = false;
}

void ModuleDef::set_startup(LifecycleCallback startup_func, std::string_view arg)
{
    validate_callback_arg(arg);
    pImpl->startup = startup_func;
    pImpl->startup_arg = std::string(arg);
    pImpl->has_startup_arg = true;
}

void ModuleDef::set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout)
{
    pImpl->shutdown = shutdown_func;
    pImpl->shutdown_timeout = timeout;
    pImpl->has_shutdown_arg = false;
}

void ModuleDef::set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout,
                             std::string_view arg)
{
    validate_callback_arg(arg);
    pImpl->shutdown = shutdown_func;
    pImpl->shutdown_timeout = timeout;
    pImpl->shutdown_arg = std::string(arg);
    pImpl->has_shutdown_arg = true;
}

// ============================================================================
// LifecycleManager
// ============================================================================

class LifecycleManagerImpl
{
  public:
    mutable std::mutex mtx;
    std::vector<ModuleDefImpl> registered;
    std::vector<ModuleDefImpl> started; // in start order
    std::atomic<bool> initialized{false};
    std::atomic<bool> finalized{false};

    /// Kahn topological sort over `registered`. Fatal on unknown dependency or cycle.
    std::vector<size_t> start_order(std::source_location loc) const
    {
        std::map<std::string, size_t> index;
        for (size_t i = 0; i < registered.size(); ++i)
        {
            index.emplace(registered[i].name, i);
        }

        std::vector<size_t> in_degree(registered.size(), 0);
        std::vector<std::vector<size_t>> dependents(registered.size());
        for (size_t i = 0; i < registered.size(); ++i)
        {
            for (const auto &dep : registered[i].dependencies)
            {
                auto it = index.find(dep);
                if (it == index.end())
                {
                    debug::panic(loc, "[MESH_Lifecycle] module '{}' depends on unregistered module '{}'.",
                                 registered[i].name, dep);
                }
                dependents[it->second].push_back(i);
                ++in_degree[i];
            }
        }

        std::vector<size_t> order;
        order.reserve(registered.size());
        std::vector<bool> emitted(registered.size(), false);
        while (order.size() < registered.size())
        {
            bool progressed = false;
            for (size_t i = 0; i < registered.size(); ++i)
            {
                if (!emitted[i] && in_degree[i] == 0)
                {
                    emitted[i] = true;
                    order.push_back(i);
                    for (size_t d : dependents[i])
                    {
                        --in_degree[d];
                    }
                    progressed = true;
                    break;
                }
            }
            if (!progressed)
            {
                std::vector<std::string> stuck;
                for (size_t i = 0; i < registered.size(); ++i)
                {
                    if (!emitted[i])
                    {
                        stuck.push_back(registered[i].name);
                    }
                }
                debug::panic(loc, "[MESH_Lifecycle] dependency cycle among modules: [{}]",
                             fmt::join(stuck, ", "));
            }
        }
        return order;
    }

    /// Shuts down `started` in reverse order. Caller holds `mtx`.
    void shutdown_started()
    {
        for (auto it = started.rbegin(); it != started.rend(); ++it)
        {
            if (it->shutdown == nullptr)
            {
                continue;
            }
            MESH_DEBUG("[MESH_Lifecycle] shutting down '{}'", it->name);
            const auto outcome =
                timed_shutdown(it->shutdown, it->shutdown_arg, it->has_shutdown_arg, it->shutdown_timeout);
            if (outcome.timed_out)
            {
                fmt::print(stderr,
                           "[MESH_Lifecycle] WARNING: shutdown of module '{}' exceeded {} ms; "
                           "its thread was detached.\n",
                           it->name, it->shutdown_timeout.count());
            }
            else if (!outcome.exception_msg.empty())
            {
                fmt::print(stderr, "[MESH_Lifecycle] ERROR: shutdown of module '{}' threw: {}\n",
                           it->name, outcome.exception_msg);
            }
        }
        started.clear();
    }
};

LifecycleManager &LifecycleManager::instance()
{
    static LifecycleManager manager;
    return manager;
}

LifecycleManager::LifecycleManager() : pImpl(std::make_unique<LifecycleManagerImpl>()) {}
LifecycleManager::~LifecycleManager() = default;

void LifecycleManager::register_module(ModuleDef &&module_def)
{
    std::lock_guard<std::mutex> lock(pImpl->mtx);
    if (pImpl->initialized.load(std::memory_order_acquire))
    {
        MESH_PANIC("[MESH_Lifecycle] module '{}' registered after initialization.",
                   module_def.pImpl->name);
    }
    for (const auto &m : pImpl->registered)
    {
        if (m.name == module_def.pImpl->name)
        {
            MESH_PANIC("[MESH_Lifecycle] module '{}' registered twice.", m.name);
        }
    }
    pImpl->registered.push_back(std::move(*module_def.pImpl));
}

void LifecycleManager::initialize(std::source_location loc)
{
    std::lock_guard<std::mutex> lock(pImpl->mtx);
    if (pImpl->initialized.load(std::memory_order_acquire))
    {
        return;
    }

    const auto order = pImpl->start_order(loc);
    for (size_t idx : order)
    {
        auto &mod = pImpl->registered[idx];
        MESH_DEBUG("[MESH_Lifecycle] starting '{}'", mod.name);
        try
        {
            if (mod.startup != nullptr)
            {
                mod.startup(mod.has_startup_arg ? mod.startup_arg.c_str() : nullptr);
            }
        }
        catch (const std::exception &e)
        {
            fmt::print(stderr, "[MESH_Lifecycle] ERROR: startup of module '{}' failed: {}\n", mod.name,
                       e.what());
            pImpl->shutdown_started();
            pImpl->registered.clear();
            throw;
        }
        pImpl->started.push_back(mod);
    }
    pImpl->registered.clear();
    pImpl->finalized.store(false, std::memory_order_release);
    pImpl->initialized.store(true, std::memory_order_release);
}

void LifecycleManager::finalize(std::source_location loc)
{
    (void)loc;
    std::lock_guard<std::mutex> lock(pImpl->mtx);
    if (!pImpl->initialized.load(std::memory_order_acquire))
    {
        return;
    }
    pImpl->shutdown_started();
    pImpl->initialized.store(false, std::memory_order_release);
    pImpl->finalized.store(true, std::memory_order_release);
}

bool LifecycleManager::is_initialized() const noexcept
{
    return pImpl->initialized.load(std::memory_order_acquire);
}

bool LifecycleManager::is_finalized() const noexcept
{
    return pImpl->finalized.load(std::memory_order_acquire);
}

bool LifecycleManager::is_module_started(std::string_view name) const
{
    std::lock_guard<std::mutex> lock(pImpl->mtx);
    for (const auto &m : pImpl->started)
    {
        if (m.name == name)
        {
            return true;
        }
    }
    return false;
}

} // namespace mcpmesh::utils
