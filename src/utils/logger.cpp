/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the asynchronous logger.
 *
 * One worker thread owns the sink. Producers enqueue `Command`s (log messages
 * and control commands) under `queue_mutex_`; the worker swaps the whole queue
 * out and processes the batch without holding the queue lock. Only the last
 * sink switch of a batch is applied; earlier ones resolve their promise with
 * `false`.
 ******************************************************************************/
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

#include "mesh_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"

#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"

using namespace mcpmesh::format_tools;

namespace mcpmesh::utils
{

enum class LoggerState
{
    Uninitialized,
    Initialized,
    ShuttingDown,
    Shutdown
};

static std::atomic<LoggerState> g_logger_state{LoggerState::Uninitialized};

// PANICs before initialization; false once shutdown has begun.
static bool logger_is_loggable(const char *function_name)
{
    const auto state = g_logger_state.load(std::memory_order_acquire);
    if (state == LoggerState::Uninitialized)
    {
        MESH_PANIC("Logger method '{}' was called before the Logger module was "
                   "initialized via LifecycleManager. Aborting.",
                   function_name);
    }
    return state == LoggerState::Initialized;
}

/**
 * @class CallbackDispatcher
 * @brief Runs user error callbacks off the worker thread.
 */
class CallbackDispatcher
{
  public:
    CallbackDispatcher() : shutdown_requested_(false)
    {
        worker_ = std::thread([this] { this->run(); });
    }

    ~CallbackDispatcher() { shutdown(); }

    void post(std::function<void()> fn)
    {
        if (shutdown_requested_.load(std::memory_order_relaxed))
            return;
        {
            std::lock_guard<std::mutex> lg(mutex_);
            queue_.push_back(std::move(fn));
        }
        cv_.notify_one();
    }

    void shutdown()
    {
        if (shutdown_requested_.exchange(true))
        {
            return;
        }
        cv_.notify_one();
        if (worker_.joinable())
        {
            worker_.join();
        }
    }

  private:
    void run()
    {
        for (;;)
        {
            std::function<void()> fn;
            {
                std::unique_lock<std::mutex> ul(mutex_);
                cv_.wait(ul, [this] { return shutdown_requested_.load() || !queue_.empty(); });
                if (shutdown_requested_.load() && queue_.empty())
                {
                    return;
                }
                fn = std::move(queue_.front());
                queue_.pop_front();
            }
            try
            {
                fn();
            }
            catch (const std::exception &e)
            {
                fmt::print(stderr, "[MESH] Logger error callback threw: {}\n", e.what());
            }
        }
    }

    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    std::atomic<bool> shutdown_requested_;
};

struct SetSinkCommand
{
    std::unique_ptr<Sink> new_sink;
    std::shared_ptr<std::promise<bool>> promise;
};
struct SinkCreationErrorCommand
{
    std::string error_message;
    std::shared_ptr<std::promise<bool>> promise;
};
struct FlushCommand
{
    std::shared_ptr<std::promise<bool>> promise;
};
struct SetErrorCallbackCommand
{
    std::function<void(const std::string &)> callback;
    std::shared_ptr<std::promise<bool>> promise;
};
struct SetLogSinkMessagesCommand
{
    bool enabled;
    std::shared_ptr<std::promise<bool>> promise;
};

using Command = std::variant<LogMessage, SetSinkCommand, SinkCreationErrorCommand, FlushCommand,
                             SetErrorCallbackCommand, SetLogSinkMessagesCommand>;

template <typename T> void promise_set_safe(const std::shared_ptr<std::promise<T>> &p, T value)
{
    if (!p)
        return;
    try
    {
        p->set_value(std::move(value));
    }
    catch (const std::future_error &e)
    {
        MESH_DEBUG("Logger promise already satisfied: {}", e.what());
    }
}

static LogMessage make_system_message(Logger::Level lvl, fmt::memory_buffer &&body)
{
    return LogMessage{.timestamp = std::chrono::system_clock::now(),
                      .process_id = platform::get_pid(),
                      .thread_id = platform::get_native_thread_id(),
                      .level = static_cast<int>(lvl),
                      .body = std::move(body)};
}

struct Logger::Impl
{
    Impl();
    ~Impl();
    void start_worker();
    void worker_loop();
    bool enqueue_command(Command &&cmd);
    void reject_command(Command &cmd);
    void apply_sink_switch(SetSinkCommand &cmd);
    void shutdown();

    std::function<void(const std::string &)> error_callback_;
    std::thread worker_thread_;
    std::unique_ptr<Sink> sink_;
    size_t m_max_queue_size{10000};
    std::chrono::system_clock::time_point m_dropping_since;
    std::vector<Command> queue_;
    std::condition_variable cv_;
    std::mutex queue_mutex_;
    std::mutex m_sink_mutex;
    CallbackDispatcher callback_dispatcher_;
    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> shutdown_completed_{false};
    std::atomic<bool> m_log_sink_messages_enabled_{true};
    std::atomic<bool> m_was_dropping{false};
    std::atomic<size_t> m_messages_dropped{0};
    std::atomic<size_t> m_total_dropped_since_sink_switch{0};
};

Logger::Impl::Impl() : sink_(std::make_unique<ConsoleSink>()) {}

Logger::Impl::~Impl()
{
    if (worker_thread_.joinable())
    {
        MESH_DEBUG("Logger Impl destroyed with a running worker; shutting it down.");
        shutdown();
    }
}

void Logger::Impl::start_worker()
{
    if (!worker_thread_.joinable())
    {
        worker_thread_ = std::thread(&Logger::Impl::worker_loop, this);
    }
}

void Logger::Impl::reject_command(Command &cmd)
{
    std::visit(
        [](auto &&arg)
        {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (!std::is_same_v<T, LogMessage>)
            {
                promise_set_safe(arg.promise, false);
            }
        },
        cmd);
}

bool Logger::Impl::enqueue_command(Command &&cmd)
{
    if (shutdown_requested_.load(std::memory_order_relaxed))
    {
        reject_command(cmd);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.load(std::memory_order_acquire))
        {
            reject_command(cmd);
            return false;
        }

        const size_t current = queue_.size();
        const bool is_log = std::holds_alternative<LogMessage>(cmd);
        if (current >= m_max_queue_size * 2 || (is_log && current >= m_max_queue_size))
        {
            m_messages_dropped.fetch_add(1, std::memory_order_relaxed);
            m_total_dropped_since_sink_switch.fetch_add(1, std::memory_order_relaxed);
            if (!m_was_dropping.exchange(true, std::memory_order_relaxed))
            {
                m_dropping_since = std::chrono::system_clock::now();
            }
            reject_command(cmd);
            return false;
        }

        queue_.emplace_back(std::move(cmd));
    }
    cv_.notify_one();
    return true;
}

// Caller holds m_sink_mutex.
void Logger::Impl::apply_sink_switch(SetSinkCommand &cmd)
{
    if (m_log_sink_messages_enabled_.load(std::memory_order_relaxed))
    {
        const std::string old_desc = sink_ ? sink_->description() : "null";
        const std::string new_desc = cmd.new_sink ? cmd.new_sink->description() : "null";
        if (sink_)
        {
            sink_->write(make_system_message(Logger::Level::L_SYSTEM,
                                             make_buffer("Switching log sink to: {}", new_desc)),
                         Sink::ASYNC_WRITE);
            sink_->flush();
        }
        sink_ = std::move(cmd.new_sink);
        if (sink_)
        {
            sink_->write(make_system_message(Logger::Level::L_SYSTEM,
                                             make_buffer("Log sink switched from: {}", old_desc)),
                         Sink::ASYNC_WRITE);
        }
    }
    else
    {
        sink_ = std::move(cmd.new_sink);
    }
    m_total_dropped_since_sink_switch.store(0, std::memory_order_relaxed);
    promise_set_safe(cmd.promise, true);
}

void Logger::Impl::worker_loop()
{
    std::vector<Command> local_queue;

    while (true)
    {
        bool was_dropping = false;
        size_t dropped_count = 0;
        double dropping_duration_s = 0.0;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_.load(); });
            local_queue.swap(queue_);

            if (m_was_dropping.exchange(false, std::memory_order_relaxed))
            {
                was_dropping = true;
                dropped_count = m_messages_dropped.exchange(0, std::memory_order_relaxed);
                dropping_duration_s = std::chrono::duration<double>(
                                          std::chrono::system_clock::now() - m_dropping_since)
                                          .count();
            }

            if (shutdown_requested_.load())
            {
                g_logger_state.store(LoggerState::ShuttingDown, std::memory_order_release);
            }
        }

        if (was_dropping && dropped_count > 0)
        {
            std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
            if (sink_)
            {
                sink_->write(make_system_message(
                                 Logger::Level::L_WARNING,
                                 make_buffer("Overflow detected when processing the queue. "
                                             "Messages may have been dropped in the following batch.")),
                             Sink::ASYNC_WRITE);
            }
        }

        ptrdiff_t last_set_sink_idx = -1;
        for (ptrdiff_t i = static_cast<ptrdiff_t>(local_queue.size()) - 1; i >= 0; --i)
        {
            if (std::holds_alternative<SetSinkCommand>(local_queue[static_cast<size_t>(i)]))
            {
                last_set_sink_idx = i;
                break;
            }
        }

        for (size_t i = 0; i < local_queue.size(); ++i)
        {
            try
            {
                if (auto *msg = std::get_if<LogMessage>(&local_queue[i]))
                {
                    std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
                    if (sink_ && msg->level >= static_cast<int>(level_.load(std::memory_order_relaxed)))
                    {
                        sink_->write(*msg, Sink::ASYNC_WRITE);
                    }
                    continue;
                }

                std::visit(
                    [&, this, i](auto &&arg)
                    {
                        using T = std::decay_t<decltype(arg)>;

                        if constexpr (std::is_same_v<T, SetSinkCommand>)
                        {
                            std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
                            if (static_cast<ptrdiff_t>(i) == last_set_sink_idx)
                            {
                                apply_sink_switch(arg);
                            }
                            else
                            {
                                promise_set_safe(arg.promise, false);
                            }
                        }
                        else if constexpr (std::is_same_v<T, SinkCreationErrorCommand>)
                        {
                            {
                                std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
                                if (sink_)
                                {
                                    sink_->write(make_system_message(Logger::Level::L_ERROR,
                                                                     make_buffer("{}", arg.error_message)),
                                                 Sink::ASYNC_WRITE);
                                }
                            }
                            if (error_callback_)
                            {
                                auto cb = error_callback_;
                                callback_dispatcher_.post([cb, msg = arg.error_message]() { cb(msg); });
                            }
                            promise_set_safe(arg.promise, false);
                        }
                        else if constexpr (std::is_same_v<T, FlushCommand>)
                        {
                            std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
                            if (sink_)
                            {
                                sink_->flush();
                            }
                            promise_set_safe(arg.promise, true);
                        }
                        else if constexpr (std::is_same_v<T, SetErrorCallbackCommand>)
                        {
                            error_callback_ = std::move(arg.callback);
                            promise_set_safe(arg.promise, true);
                        }
                        else if constexpr (std::is_same_v<T, SetLogSinkMessagesCommand>)
                        {
                            m_log_sink_messages_enabled_.store(arg.enabled, std::memory_order_relaxed);
                            promise_set_safe(arg.promise, true);
                        }
                    },
                    local_queue[i]);
            }
            catch (const std::exception &e)
            {
                if (error_callback_)
                {
                    auto cb = error_callback_;
                    auto msg = fmt::format("Logger worker error: {}", e.what());
                    callback_dispatcher_.post([cb, msg]() { cb(msg); });
                }
                else
                {
                    fmt::print(stderr, "[MESH] Logger worker error: {}\n", e.what());
                }
                reject_command(local_queue[i]);
            }
        }

        if (was_dropping && dropped_count > 0)
        {
            std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
            if (sink_)
            {
                sink_->write(make_system_message(
                                 Logger::Level::L_WARNING,
                                 make_buffer("Summary: the Logger dropped {} messages over {:.2f}s "
                                             "due to a full queue.",
                                             dropped_count, dropping_duration_s)),
                             Sink::ASYNC_WRITE);
            }
        }

        local_queue.clear();

        if (shutdown_requested_.load())
        {
            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                if (!queue_.empty())
                {
                    continue;
                }
            }

            std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
            if (sink_)
            {
                sink_->write(make_system_message(Logger::Level::L_SYSTEM,
                                                 make_buffer("Logger is shutting down.")),
                             Sink::ASYNC_WRITE);
                sink_->flush();
            }
            g_logger_state.store(LoggerState::Shutdown, std::memory_order_release);
            break;
        }
    }
}

void Logger::Impl::shutdown()
{
    if (shutdown_completed_.load() || shutdown_requested_.exchange(true))
    {
        return;
    }
    {
        // Pairs with the predicate check in worker_loop so the wakeup is not lost.
        std::lock_guard<std::mutex> lock(queue_mutex_);
    }
    cv_.notify_one();
    if (worker_thread_.joinable())
    {
        worker_thread_.join();
    }
    callback_dispatcher_.shutdown();
    shutdown_completed_.store(true);
}

// ============================================================================
// Public API
// ============================================================================

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}
Logger::~Logger() = default;

Logger &Logger::instance()
{
    static Logger instance;
    return instance;
}

bool Logger::lifecycle_initialized() noexcept
{
    return g_logger_state.load(std::memory_order_acquire) == LoggerState::Initialized;
}

std::optional<Logger::Level> Logger::parse_level(std::string_view name) noexcept
{
    const std::string lowered = to_lower(trim(name));
    if (lowered == "trace")
        return Level::L_TRACE;
    if (lowered == "debug")
        return Level::L_DEBUG;
    if (lowered == "info")
        return Level::L_INFO;
    if (lowered == "warn" || lowered == "warning")
        return Level::L_WARNING;
    if (lowered == "error")
        return Level::L_ERROR;
    if (lowered == "system")
        return Level::L_SYSTEM;
    return std::nullopt;
}

bool Logger::set_console()
{
    if (!logger_is_loggable("Logger::set_console"))
        return false;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetSinkCommand{std::make_unique<ConsoleSink>(), promise});
    return future.get();
}

bool Logger::set_logfile(const std::string &utf8_path, bool use_flock)
{
    if (!logger_is_loggable("Logger::set_logfile"))
        return false;
    try
    {
        auto promise = std::make_shared<std::promise<bool>>();
        auto future = promise->get_future();
        pImpl->enqueue_command(SetSinkCommand{std::make_unique<FileSink>(utf8_path, use_flock), promise});
        return future.get();
    }
    catch (const std::exception &e)
    {
        auto promise_err = std::make_shared<std::promise<bool>>();
        auto future_err = promise_err->get_future();
        pImpl->enqueue_command(SinkCreationErrorCommand{
            fmt::format("Failed to create FileSink: {}", e.what()), promise_err});
        (void)future_err.get();
    }
    return false;
}

void Logger::shutdown()
{
    if (g_logger_state.load(std::memory_order_acquire) == LoggerState::Uninitialized)
    {
        return;
    }
    pImpl->shutdown();
}

void Logger::flush()
{
    if (!logger_is_loggable("Logger::flush"))
        return;
    if (pImpl->shutdown_requested_.load())
        return;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(FlushCommand{promise});
    (void)future.get();
}

void Logger::set_level(Level lvl)
{
    if (!logger_is_loggable("Logger::set_level"))
        return;
    pImpl->level_.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    if (!logger_is_loggable("Logger::level"))
        return Level::L_INFO;
    return pImpl->level_.load(std::memory_order_relaxed);
}

void Logger::set_max_queue_size(size_t max_size)
{
    if (!logger_is_loggable("Logger::set_max_queue_size"))
        return;
    std::lock_guard<std::mutex> lock(pImpl->queue_mutex_);
    pImpl->m_max_queue_size = (max_size > 0) ? max_size : 1;
}

size_t Logger::get_max_queue_size() const
{
    if (!logger_is_loggable("Logger::get_max_queue_size"))
        return 0;
    std::lock_guard<std::mutex> lock(pImpl->queue_mutex_);
    return pImpl->m_max_queue_size;
}

size_t Logger::get_total_dropped_since_sink_switch() const
{
    if (!logger_is_loggable("Logger::get_total_dropped_since_sink_switch"))
        return 0;
    return pImpl->m_total_dropped_since_sink_switch.load(std::memory_order_relaxed);
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    if (!logger_is_loggable("Logger::set_write_error_callback"))
        return;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetErrorCallbackCommand{std::move(cb), promise});
    (void)future.get();
}

void Logger::set_log_sink_messages_enabled(bool enabled)
{
    if (!logger_is_loggable("Logger::set_log_sink_messages_enabled"))
        return;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetLogSinkMessagesCommand{enabled, promise});
    (void)future.get();
}

bool Logger::should_log(Level lvl) const noexcept
{
    if (!logger_is_loggable("Logger::should_log"))
        return false;
    return static_cast<int>(lvl) >= static_cast<int>(pImpl->level_.load(std::memory_order_relaxed));
}

bool Logger::enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept
{
    if (g_logger_state.load(std::memory_order_acquire) != LoggerState::Initialized)
        return false;
    return pImpl->enqueue_command(make_system_message(lvl, std::move(body)));
}

bool Logger::enqueue_log(Level lvl, std::string &&body_str) noexcept
{
    if (g_logger_state.load(std::memory_order_acquire) != LoggerState::Initialized)
        return false;
    return pImpl->enqueue_command(make_system_message(lvl, make_buffer("{}", body_str)));
}

bool Logger::write_sync(Level lvl, fmt::memory_buffer &&body) noexcept
{
    if (g_logger_state.load(std::memory_order_acquire) != LoggerState::Initialized)
        return false;
    std::lock_guard<std::mutex> sink_lock(pImpl->m_sink_mutex);
    if (!pImpl->sink_ ||
        static_cast<int>(lvl) < static_cast<int>(pImpl->level_.load(std::memory_order_relaxed)))
    {
        return false;
    }
    try
    {
        pImpl->sink_->write(make_system_message(lvl, std::move(body)), Sink::SYNC_WRITE);
        return true;
    }
    catch (const std::exception &e)
    {
        // Logging the failure through the logger could recurse.
        fmt::print(stderr, "[MESH] write_sync failed: {}\n", e.what());
        return false;
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

void do_logger_startup(const char *arg)
{
    (void)arg;
    const auto state = g_logger_state.load(std::memory_order_acquire);
    if (state == LoggerState::Initialized)
    {
        return;
    }
    auto &logger = Logger::instance();
    if (state == LoggerState::Shutdown)
    {
        // A previous lifecycle finished; its worker has exited, so start from a clean Impl.
        logger.pImpl = std::make_unique<Logger::Impl>();
    }
    logger.pImpl->start_worker();
    g_logger_state.store(LoggerState::Initialized, std::memory_order_release);
}

static void do_logger_shutdown(const char *arg)
{
    (void)arg;
    LoggerState expected = LoggerState::Initialized;
    if (!g_logger_state.compare_exchange_strong(expected, LoggerState::ShuttingDown,
                                                std::memory_order_acq_rel))
    {
        return;
    }
    Logger::instance().shutdown();
    if (g_logger_state.load(std::memory_order_acquire) != LoggerState::Shutdown)
    {
        MESH_DEBUG("Logger worker exited without reaching Shutdown; forcing the state.");
    }
    g_logger_state.store(LoggerState::Shutdown, std::memory_order_release);
}

ModuleDef Logger::GetLifecycleModule()
{
    ModuleDef module("mcpmesh::utils::Logger");
    module.set_startup(&do_logger_startup);
    module.set_shutdown(&do_logger_shutdown, std::chrono::milliseconds(5000));
    return module;
}

} // namespace mcpmesh::utils
