#pragma once
/*******************************************************************************
 * @file logger.hpp
 * @brief Asynchronous, lifecycle-managed logger for the mesh executables.
 *
 * Callers format on their own thread and hand a `fmt::memory_buffer` to a
 * bounded command queue; a single worker thread drains the queue into the
 * current sink. Sink switches, flushes and callback changes travel through the
 * same queue, so they are ordered with respect to log messages.
 *
 * Queue limits:
 * - soft limit (`set_max_queue_size`, default 10000): further log messages are dropped;
 * - hard limit (twice the soft limit): control commands are rejected as well.
 * Dropped messages are counted and reported by the worker as a warning plus a
 * summary line once the queue drains.
 *
 * The logger must be started through the LifecycleManager
 * (`Logger::GetLifecycleModule()`). Calling it before that is fatal
 * (`MESH_PANIC`); calls after shutdown are silently dropped. A later
 * initialization (for example the next test suite) starts a fresh worker.
 *
 * ```cpp
 * LOGGER_INFO("proxy listening on {}:{}", host, port);
 * LOGGER_WARN("registry lock busy, attempt {}/{}", attempt + 1, max_attempts);
 * ```
 ******************************************************************************/
#include "mesh_base.hpp"
#include "utils/module_def.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#ifndef MCPMESH_LOG_FMT_BUFFER_RESERVE
#define MCPMESH_LOG_FMT_BUFFER_RESERVE (1024u)
#endif

// 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=System
#ifndef MCPMESH_LOG_COMPILE_LEVEL
#define MCPMESH_LOG_COMPILE_LEVEL 0
#endif

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace mcpmesh::utils
{

class MCPMESH_UTILS_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    static Logger &instance();

    /// @brief ModuleDef for the LifecycleManager. Module name: "mcpmesh::utils::Logger".
    static ModuleDef GetLifecycleModule();

    /// @brief True between lifecycle startup and shutdown of the logger module.
    static bool lifecycle_initialized() noexcept;

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;
    ~Logger();

    // --- Sinks ---
    // Both calls block until the worker has installed the new sink.

    /// @brief Log to stderr.
    bool set_console();

    /**
     * @brief Log to a file, appending. Parent directories are created.
     * @param use_flock Serialize each line with `flock` so several processes can share the file.
     * @return false if the file could not be opened; the previous sink stays active.
     */
    bool set_logfile(const std::string &utf8_path, bool use_flock = true);

    /// @brief Blocks until everything queued before the call has been written.
    void flush();

    /// @brief Stops the worker after draining the queue. Normally called by the lifecycle.
    void shutdown();

    void set_level(Level lvl);
    [[nodiscard]] Level level() const;

    /// @brief Parses `trace|debug|info|warn|warning|error|system` (case-insensitive).
    [[nodiscard]] static std::optional<Level> parse_level(std::string_view name) noexcept;

    void set_max_queue_size(size_t max_size);
    [[nodiscard]] size_t get_max_queue_size() const;
    [[nodiscard]] size_t get_total_dropped_since_sink_switch() const;

    /**
     * @brief Callback invoked (on a dispatcher thread) when a sink fails to open or write.
     */
    void set_write_error_callback(std::function<void(const std::string &)> cb);

    /// @brief Enables the "Switching log sink to" / "Log sink switched from" lines.
    void set_log_sink_messages_enabled(bool enabled);

    // --- Formatting front end (header templates) ---
    template <Level lvl, typename... Args>
    void log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

    template <typename... Args>
    void log_fmt_runtime(Level lvl, fmt::string_view fmt_str, Args &&...args) noexcept;

    [[nodiscard]] bool should_log(Level lvl) const noexcept;
    bool enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept;
    bool enqueue_log(Level lvl, std::string &&body) noexcept;

    /// @brief Writes directly to the sink from the calling thread, bypassing the queue.
    bool write_sync(Level lvl, fmt::memory_buffer &&body) noexcept;

    struct Impl;

  private:
    Logger();
    friend void do_logger_startup(const char *);
    std::unique_ptr<Impl> pImpl;
};

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= MCPMESH_LOG_COMPILE_LEVEL)
    {
        if (!should_log(lvl))
            return;

        try
        {
            fmt::memory_buffer mb;
            mb.reserve(MCPMESH_LOG_FMT_BUFFER_RESERVE);
            fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
            enqueue_log(lvl, std::move(mb));
        }
        catch (const std::exception &ex)
        {
            enqueue_log(lvl, std::string("[FORMAT ERROR] ") + ex.what());
        }
    }
}

template <typename... Args>
void Logger::log_fmt_runtime(Level lvl, fmt::string_view fmt_str, Args &&...args) noexcept
{
    if (static_cast<int>(lvl) < MCPMESH_LOG_COMPILE_LEVEL || !should_log(lvl))
        return;

    try
    {
        fmt::memory_buffer mb;
        mb.reserve(MCPMESH_LOG_FMT_BUFFER_RESERVE);
        fmt::format_to(std::back_inserter(mb), fmt::runtime(fmt_str), std::forward<Args>(args)...);
        enqueue_log(lvl, std::move(mb));
    }
    catch (const std::exception &ex)
    {
        enqueue_log(lvl, std::string("[FORMAT ERROR] ") + ex.what());
    }
}

} // namespace mcpmesh::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

#define MCPMESH_LOG_AT_(lvl, fmt, ...)                                                             \
    ::mcpmesh::utils::Logger::instance().log_fmt<::mcpmesh::utils::Logger::Level::lvl>(           \
        FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)

#define LOGGER_TRACE(fmt, ...) MCPMESH_LOG_AT_(L_TRACE, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...) MCPMESH_LOG_AT_(L_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...) MCPMESH_LOG_AT_(L_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...) MCPMESH_LOG_AT_(L_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...) MCPMESH_LOG_AT_(L_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...) MCPMESH_LOG_AT_(L_SYSTEM, fmt __VA_OPT__(, ) __VA_ARGS__)

#define LOGGER_INFO_RT(fmt, ...)                                                                   \
    ::mcpmesh::utils::Logger::instance().log_fmt_runtime(                                          \
        ::mcpmesh::utils::Logger::Level::L_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR_RT(fmt, ...)                                                                  \
    ::mcpmesh::utils::Logger::instance().log_fmt_runtime(                                          \
        ::mcpmesh::utils::Logger::Level::L_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)
