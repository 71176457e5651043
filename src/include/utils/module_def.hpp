#pragma once
/**
 * @file module_def.hpp
 * @brief ABI-safe module definition for LifecycleManager registration.
 */
#include "mcpmesh_utils_export.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string_view>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace mcpmesh::utils
{

class ModuleDefImpl;
class LifecycleManager;

/**
 * @brief Startup/shutdown callback of a lifecycle module.
 *
 * A plain function pointer so module definitions can cross shared-library
 * boundaries. `arg` is `nullptr` when no argument was supplied.
 */
using LifecycleCallback = void (*)(const char *arg);

/**
 * @class ModuleDef
 * @brief Builder for one lifecycle module: a name, its dependencies and callbacks.
 *
 * Movable but not copyable. Ownership moves into the LifecycleManager on
 * registration. Names longer than `MAX_MODULE_NAME_LEN` are rejected with
 * `std::length_error`.
 */
class MCPMESH_UTILS_EXPORT ModuleDef
{
  public:
    static constexpr size_t MAX_MODULE_NAME_LEN = 256;
    static constexpr size_t MAX_CALLBACK_PARAM_STRLEN = 1024;

    /**
     * @param name Unique module name (e.g. `"Logger"`, `"MeshConfig"`).
     * @throws std::invalid_argument if `name` is empty.
     * @throws std::length_error     if `name.size() > MAX_MODULE_NAME_LEN`.
     */
    explicit ModuleDef(std::string_view name);
    ~ModuleDef();

    ModuleDef(ModuleDef &&other) noexcept;
    ModuleDef &operator=(ModuleDef &&other) noexcept;
    ModuleDef(const ModuleDef &) = delete;
    ModuleDef &operator=(const ModuleDef &) = delete;

    /**
     * @brief Declares that `dependency_name` must start before this module and stop after it.
     * @details An empty name is ignored.
     */
    void add_dependency(std::string_view dependency_name);

    void set_startup(LifecycleCallback startup_func);
    void set_startup(LifecycleCallback startup_func, std::string_view arg);

    /**
     * @brief Sets the shutdown callback.
     * @param timeout Upper bound for the callback. Zero runs it inline with no bound;
     *                otherwise a callback that overruns is detached and reported.
     */
    void set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout);
    void set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout,
                      std::string_view arg);

  private:
    friend class LifecycleManager;
    std::unique_ptr<ModuleDefImpl> pImpl;
};

} // namespace mcpmesh::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
