// file_lock.cpp
#include "mesh_base.hpp"
#include "utils/backoff_strategy.hpp"
#include "utils/file_lock.hpp"
#include "utils/lifecycle.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <thread>
#include <unordered_map>

static std::atomic<bool> g_filelock_initialized{false};

namespace
{
constexpr std::chrono::milliseconds kFileLockShutdownTimeoutMs{2000};
constexpr std::chrono::milliseconds LOCK_POLLING_INTERVAL{20};

std::string make_lock_key(const std::filesystem::path &lockpath)
{
#if defined(MCPMESH_PLATFORM_WIN64)
    std::wstring longw = mcpmesh::format_tools::win32_to_long_path(lockpath);
    if (longw.empty())
    {
        return lockpath.generic_string();
    }
    for (auto &ch : longw)
        ch = towlower(ch);
    return mcpmesh::format_tools::ws2s(longw);
#else
    std::error_code ec;
    auto abs = std::filesystem::absolute(lockpath, ec);
    if (ec)
    {
        return lockpath.generic_string();
    }
    return abs.lexically_normal().generic_string();
#endif
}
} // namespace

namespace mcpmesh::utils
{

static std::mutex g_backend_mtx;
static std::shared_ptr<LockBackend> g_backend;

static std::shared_ptr<LockBackend> current_backend()
{
    std::lock_guard<std::mutex> lk(g_backend_mtx);
    if (!g_backend)
    {
        g_backend = make_lock_backend(LockBackendKind::Auto);
    }
    return g_backend;
}

static std::mutex g_proc_registry_mtx;
struct ProcLockState
{
    int owners = 0;
    int waiters = 0;
    std::condition_variable cv;
};
static std::unordered_map<std::string, std::shared_ptr<ProcLockState>> g_proc_locks;

struct FileLockImpl
{
    std::filesystem::path path;
    std::filesystem::path canonical_lock_file_path;
    bool valid = false;
    std::error_code ec;
    std::string lock_key;
    std::shared_ptr<ProcLockState> proc_state;
    std::shared_ptr<LockBackend> backend;
    LockHandle handle;
};

static void release_process_local_lock(FileLockImpl *pImpl)
{
    if (!pImpl->proc_state)
    {
        return;
    }
    std::lock_guard<std::mutex> lock_guard(g_proc_registry_mtx);
    if (--pImpl->proc_state->owners == 0)
    {
        pImpl->proc_state->cv.notify_all();
        if (pImpl->proc_state->waiters == 0)
        {
            g_proc_locks.erase(pImpl->lock_key);
        }
    }
    pImpl->proc_state.reset();
}

void FileLock::FileLockImplDeleter::operator()(FileLockImpl *ptr)
{
    if (ptr == nullptr)
    {
        return;
    }
    if (ptr->valid && ptr->backend)
    {
        ptr->backend->unlock_and_close(ptr->handle);
    }
    release_process_local_lock(ptr);
    delete ptr;
}

std::filesystem::path FileLock::get_expected_lock_fullname_for(const std::filesystem::path &path,
                                                               ResourceType type) noexcept
{
    try
    {
        constexpr int kFirstPrintable = 32;
        for (const auto &path_char : path.native())
        {
            if (path_char >= 0 && path_char < kFirstPrintable)
            {
                return {};
            }
        }
        if (path.empty())
        {
            return {};
        }

        std::error_code err_code;
        std::filesystem::path target = std::filesystem::weakly_canonical(path, err_code);
        if (err_code)
        {
            target = std::filesystem::absolute(path).lexically_normal();
        }

        if (type == ResourceType::Directory)
        {
            if (!target.has_filename() && target.has_parent_path() && target != target.root_path())
            {
                target = target.parent_path(); // "dir/" -> "dir"
            }
            auto fname = target.filename();
            auto parent = target.parent_path();
            if (fname.empty() || fname == "." || fname == "..")
            {
                fname = "mcpmesh_root";
            }
            fname += ".dir.lock";
            return parent / fname;
        }
        auto lock_path = target;
        lock_path += ".lock";
        return lock_path;
    }
    catch (const std::exception &)
    {
        return {};
    }
}

// ----------------------------------------------------------------------------
// Acquisition
// ----------------------------------------------------------------------------

static bool acquire_process_local_lock(FileLockImpl *pImpl, LockMode mode,
                                       std::optional<std::chrono::milliseconds> timeout)
{
    pImpl->lock_key = make_lock_key(pImpl->canonical_lock_file_path);

    std::unique_lock<std::mutex> regl(g_proc_registry_mtx);
    auto &state_ref = g_proc_locks[pImpl->lock_key];
    if (!state_ref)
    {
        state_ref = std::make_shared<ProcLockState>();
    }
    auto state = state_ref;

    if (state->owners > 0)
    {
        if (mode == LockMode::NonBlocking && !timeout)
        {
            pImpl->ec = std::make_error_code(std::errc::resource_unavailable_try_again);
            return false;
        }

        ++state->waiters;
        bool acquired = true;
        if (timeout)
        {
            acquired = state->cv.wait_for(regl, *timeout, [&] { return state->owners == 0; });
        }
        else
        {
            state->cv.wait(regl, [&] { return state->owners == 0; });
        }
        --state->waiters;

        if (!acquired)
        {
            if (state->owners == 0 && state->waiters == 0)
            {
                g_proc_locks.erase(pImpl->lock_key);
            }
            pImpl->ec = std::make_error_code(std::errc::timed_out);
            return false;
        }
    }
    ++state->owners;
    pImpl->proc_state = std::move(state);
    return true;
}

static bool run_os_lock_loop(FileLockImpl *pImpl, LockMode mode,
                             std::optional<std::chrono::milliseconds> timeout)
{
    auto &backend = *pImpl->backend;
    if (!backend.open(pImpl->canonical_lock_file_path, pImpl->handle, pImpl->ec))
    {
        return false;
    }
    auto close_guard = basics::make_scope_guard([&] { backend.unlock_and_close(pImpl->handle); });

    if (mode == LockMode::Blocking && !timeout)
    {
        if (!backend.lock(pImpl->handle, pImpl->ec))
        {
            return false;
        }
        close_guard.dismiss();
        return true;
    }

    const auto start_time = std::chrono::steady_clock::now();
    const mcpmesh::utils::ExponentialBackoff backoff(LOCK_POLLING_INTERVAL);
    for (int attempt = 0;; ++attempt)
    {
        switch (backend.try_lock(pImpl->handle, pImpl->ec))
        {
        case LockAttempt::Acquired:
            close_guard.dismiss();
            return true;
        case LockAttempt::Failed:
            return false;
        case LockAttempt::Busy:
            break;
        }

        if (!timeout)
        {
            pImpl->ec = std::make_error_code(std::errc::resource_unavailable_try_again);
            return false;
        }
        if (std::chrono::steady_clock::now() - start_time >= *timeout)
        {
            pImpl->ec = std::make_error_code(std::errc::timed_out);
            return false;
        }
        backoff(attempt);
    }
}

static void open_and_lock(FileLockImpl *pImpl, ResourceType type, LockMode mode,
                          std::optional<std::chrono::milliseconds> timeout)
{
    pImpl->valid = false;
    pImpl->ec.clear();

    pImpl->canonical_lock_file_path = FileLock::get_expected_lock_fullname_for(pImpl->path, type);
    if (pImpl->canonical_lock_file_path.empty())
    {
        pImpl->ec = std::make_error_code(std::errc::invalid_argument);
        return;
    }

    try
    {
        if (!acquire_process_local_lock(pImpl, mode, timeout))
        {
            return;
        }
    }
    catch (const std::exception &)
    {
        pImpl->ec = std::make_error_code(std::errc::not_enough_memory);
        return;
    }

    const auto parent_dir = pImpl->canonical_lock_file_path.parent_path();
    if (!parent_dir.empty())
    {
        std::error_code create_ec;
        std::filesystem::create_directories(parent_dir, create_ec);
        if (create_ec)
        {
            pImpl->ec = create_ec;
            release_process_local_lock(pImpl);
            return;
        }
    }

    pImpl->backend = current_backend();
    if (!run_os_lock_loop(pImpl, mode, timeout))
    {
        MESH_DEBUG("FileLock: OS lock on '{}' failed: {}", pImpl->canonical_lock_file_path.string(),
                   pImpl->ec.message());
        release_process_local_lock(pImpl);
        return;
    }
    pImpl->valid = true;
}

// ----------------------------------------------------------------------------
// Public API
// ----------------------------------------------------------------------------

FileLock::FileLock() noexcept : pImpl(nullptr) {}

FileLock::FileLock(const std::filesystem::path &path, ResourceType type, LockMode mode) noexcept
    : pImpl(new (std::nothrow) FileLockImpl)
{
    if (!lifecycle_initialized())
    {
        MESH_PANIC("FileLock created before its module was initialized via LifecycleManager.");
    }
    if (pImpl != nullptr)
    {
        pImpl->path = path;
        open_and_lock(pImpl.get(), type, mode, std::nullopt);
    }
}

FileLock::FileLock(const std::filesystem::path &path, ResourceType type,
                   std::chrono::milliseconds timeout) noexcept
    : pImpl(new (std::nothrow) FileLockImpl)
{
    if (!lifecycle_initialized())
    {
        MESH_PANIC("FileLock created before its module was initialized via LifecycleManager.");
    }
    if (pImpl != nullptr)
    {
        pImpl->path = path;
        open_and_lock(pImpl.get(), type, LockMode::Blocking, timeout);
    }
}

FileLock::~FileLock() = default;
FileLock::FileLock(FileLock &&) noexcept = default;
FileLock &FileLock::operator=(FileLock &&) noexcept = default;

bool FileLock::valid() const noexcept
{
    return pImpl && pImpl->valid;
}

std::error_code FileLock::error_code() const noexcept
{
    return pImpl ? pImpl->ec : std::make_error_code(std::errc::not_enough_memory);
}

std::optional<std::filesystem::path> FileLock::get_locked_resource_path() const noexcept
{
    if (!valid())
    {
        return std::nullopt;
    }
    std::error_code ec;
    auto abs = std::filesystem::absolute(pImpl->path, ec);
    if (ec)
    {
        return pImpl->path;
    }
    return abs.lexically_normal();
}

std::optional<std::filesystem::path> FileLock::get_canonical_lock_file_path() const noexcept
{
    if (!valid())
    {
        return std::nullopt;
    }
    return pImpl->canonical_lock_file_path;
}

std::optional<FileLock> FileLock::try_lock(const std::filesystem::path &path, ResourceType type,
                                           LockMode mode) noexcept
{
    if (!lifecycle_initialized())
    {
        return std::nullopt;
    }
    FileLock lock;
    lock.pImpl.reset(new (std::nothrow) FileLockImpl);
    if (lock.pImpl == nullptr)
    {
        return std::nullopt;
    }
    lock.pImpl->path = path;
    open_and_lock(lock.pImpl.get(), type, mode, std::nullopt);
    if (lock.valid())
    {
        return {std::move(lock)};
    }
    return std::nullopt;
}

std::optional<FileLock> FileLock::try_lock(const std::filesystem::path &path, ResourceType type,
                                           std::chrono::milliseconds timeout) noexcept
{
    if (!lifecycle_initialized())
    {
        return std::nullopt;
    }
    FileLock lock;
    lock.pImpl.reset(new (std::nothrow) FileLockImpl);
    if (lock.pImpl == nullptr)
    {
        return std::nullopt;
    }
    lock.pImpl->path = path;
    open_and_lock(lock.pImpl.get(), type, LockMode::Blocking, timeout);
    if (lock.valid())
    {
        return {std::move(lock)};
    }
    return std::nullopt;
}

void FileLock::set_lock_backend(LockBackendKind kind)
{
    auto backend = make_lock_backend(kind);
    std::lock_guard<std::mutex> lk(g_backend_mtx);
    g_backend = std::move(backend);
}

std::string FileLock::lock_backend_name()
{
    return current_backend()->name();
}

// ----------------------------------------------------------------------------
// Lifecycle
// ----------------------------------------------------------------------------

bool FileLock::lifecycle_initialized() noexcept
{
    return g_filelock_initialized.load(std::memory_order_acquire);
}

namespace
{
void do_filelock_startup(const char *arg)
{
    (void)arg;
    g_filelock_initialized.store(true, std::memory_order_release);
}
void do_filelock_shutdown(const char *arg)
{
    (void)arg;
    g_filelock_initialized.store(false, std::memory_order_release);
    std::lock_guard<std::mutex> lk(g_backend_mtx);
    g_backend.reset();
}
} // namespace

ModuleDef FileLock::GetLifecycleModule()
{
    ModuleDef module("mcpmesh::utils::FileLock");
    module.set_startup(&do_filelock_startup);
    module.set_shutdown(&do_filelock_shutdown, kFileLockShutdownTimeoutMs);
    return module;
}

} // namespace mcpmesh::utils
