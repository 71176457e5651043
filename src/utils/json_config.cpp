/*******************************************************************************
 * @file json_config.cpp
 * @brief JsonConfig: shared_mutex-guarded JSON document with atomic persistence.
 *
 * Lock order is always: in-memory `dataMutex` first, then the FileLock. The
 * FileLock is not re-entrant, so every public operation takes it at most once.
 ******************************************************************************/
#include "mesh_base.hpp"

#include "utils/json_config.hpp"
#include "utils/logger.hpp"

#include <cstring>
#include <fstream>
#include <mutex>
#include <shared_mutex>
#include <thread>

#if defined(MCPMESH_IS_POSIX)
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

static std::atomic<bool> g_jsonconfig_initialized{false};

namespace mcpmesh::utils
{

namespace
{
constexpr int kRenameRetries = 5;
constexpr int kRenameDelayMs = 20;
constexpr int kJsonIndent = 2;

void set_ec(std::error_code *err_code, std::error_code value)
{
    if (err_code != nullptr)
    {
        *err_code = value;
    }
}

void set_errno_ec(std::error_code *err_code, int errnum)
{
    set_ec(err_code, std::error_code(errnum, std::generic_category()));
}

bool is_symlink_noexcept(const fs::path &p)
{
    std::error_code ec;
    return fs::is_symlink(fs::symlink_status(p, ec));
}

#if defined(MCPMESH_IS_POSIX)

bool write_all(int fd, const std::string &data)
{
    size_t written = 0;
    while (written < data.size())
    {
        const ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

void atomic_write_json_posix(const fs::path &target, const nlohmann::json &json_snapshot,
                             std::error_code *err_code)
{
    const fs::path parent = target.parent_path().empty() ? fs::path(".") : target.parent_path();

    std::error_code dir_ec;
    fs::create_directories(parent, dir_ec);
    if (dir_ec)
    {
        set_ec(err_code, dir_ec);
        LOGGER_ERROR("atomic_write_json: cannot create directory '{}': {}", parent.string(),
                     dir_ec.message());
        return;
    }

    if (is_symlink_noexcept(target))
    {
        set_ec(err_code, std::make_error_code(std::errc::operation_not_permitted));
        LOGGER_ERROR("atomic_write_json: refusing to write through symlink '{}'", target.string());
        return;
    }

    std::string tmpl = (parent / (target.filename().string() + ".tmp.XXXXXX")).string();
    std::vector<char> tmpl_buf(tmpl.begin(), tmpl.end());
    tmpl_buf.push_back('\0');
    const int fd = ::mkstemp(tmpl_buf.data());
    if (fd < 0)
    {
        const int errnum = errno;
        set_errno_ec(err_code, errnum);
        LOGGER_ERROR("atomic_write_json: mkstemp failed in '{}': {}", parent.string(),
                     std::strerror(errnum));
        return;
    }
    const std::string tmp_path(tmpl_buf.data());

    auto fail = [&](const char *what, int errnum)
    {
        ::unlink(tmp_path.c_str());
        set_errno_ec(err_code, errnum);
        LOGGER_ERROR("atomic_write_json: {} failed for '{}': {}", what, tmp_path,
                     std::strerror(errnum));
    };

    const std::string payload = json_snapshot.dump(kJsonIndent) + "\n";
    if (!write_all(fd, payload))
    {
        const int errnum = errno;
        ::close(fd);
        fail("write", errnum);
        return;
    }
    if (::fsync(fd) != 0)
    {
        const int errnum = errno;
        ::close(fd);
        fail("fsync(file)", errnum);
        return;
    }
    struct stat stat_buf{};
    if (::stat(target.c_str(), &stat_buf) == 0)
    {
        if (::fchmod(fd, stat_buf.st_mode & 07777) != 0)
        {
            const int errnum = errno;
            ::close(fd);
            fail("fchmod", errnum);
            return;
        }
    }
    else
    {
        // mkstemp creates 0600; new files get the usual 0644.
        ::fchmod(fd, 0644);
    }
    if (::close(fd) != 0)
    {
        fail("close", errno);
        return;
    }

    int last_errnum = 0;
    bool renamed = false;
    for (int i = 0; i < kRenameRetries; ++i)
    {
        if (std::rename(tmp_path.c_str(), target.c_str()) == 0)
        {
            renamed = true;
            break;
        }
        last_errnum = errno;
        if (last_errnum != EBUSY && last_errnum != ETXTBSY && last_errnum != EINTR)
        {
            break;
        }
        LOGGER_WARN("atomic_write_json: rename hit transient error '{}' for '{}', retrying",
                    std::strerror(last_errnum), target.string());
        std::this_thread::sleep_for(std::chrono::milliseconds(kRenameDelayMs));
    }
    if (!renamed)
    {
        fail("rename", last_errnum);
        return;
    }

    const int dfd = ::open(parent.c_str(), O_DIRECTORY | O_RDONLY | O_CLOEXEC);
    if (dfd < 0)
    {
        const int errnum = errno;
        set_errno_ec(err_code, errnum);
        LOGGER_ERROR("atomic_write_json: open(dir) failed for '{}': {}", parent.string(),
                     std::strerror(errnum));
        return;
    }
    if (::fsync(dfd) != 0)
    {
        const int errnum = errno;
        set_errno_ec(err_code, errnum);
        LOGGER_ERROR("atomic_write_json: fsync(dir) failed for '{}': {}", parent.string(),
                     std::strerror(errnum));
    }
    ::close(dfd);
}

#elif defined(MCPMESH_PLATFORM_WIN64)

void atomic_write_json_win(const fs::path &target, const nlohmann::json &json_snapshot,
                           std::error_code *err_code)
{
    const fs::path parent = target.parent_path().empty() ? fs::path(".") : target.parent_path();
    std::error_code dir_ec;
    fs::create_directories(parent, dir_ec);
    if (dir_ec)
    {
        set_ec(err_code, dir_ec);
        return;
    }
    if (is_symlink_noexcept(target))
    {
        set_ec(err_code, std::make_error_code(std::errc::operation_not_permitted));
        LOGGER_ERROR("atomic_write_json: refusing to write through symlink '{}'", target.string());
        return;
    }

    const fs::path tmp = parent / fmt::format("{}.tmp.{}.{}", target.filename().string(),
                                              platform::get_pid(), platform::get_native_thread_id());
    const std::wstring wtmp = format_tools::win32_to_long_path(tmp);
    const std::wstring wtarget = format_tools::win32_to_long_path(target);

    HANDLE h = CreateFileW(wtmp.c_str(), GENERIC_WRITE, 0, nullptr, CREATE_ALWAYS,
                           FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h == INVALID_HANDLE_VALUE)
    {
        set_ec(err_code, std::error_code(static_cast<int>(GetLastError()), std::system_category()));
        return;
    }
    const std::string payload = json_snapshot.dump(kJsonIndent) + "\n";
    DWORD written = 0;
    const bool ok = WriteFile(h, payload.data(), static_cast<DWORD>(payload.size()), &written,
                              nullptr) &&
                    written == payload.size() && FlushFileBuffers(h);
    const DWORD write_err = ok ? 0 : GetLastError();
    CloseHandle(h);
    if (!ok)
    {
        DeleteFileW(wtmp.c_str());
        set_ec(err_code, std::error_code(static_cast<int>(write_err), std::system_category()));
        return;
    }

    DWORD last_err = 0;
    for (int i = 0; i < kRenameRetries; ++i)
    {
        if (MoveFileExW(wtmp.c_str(), wtarget.c_str(),
                        MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH))
        {
            return;
        }
        last_err = GetLastError();
        std::this_thread::sleep_for(std::chrono::milliseconds(kRenameDelayMs));
    }
    DeleteFileW(wtmp.c_str());
    set_ec(err_code, std::error_code(static_cast<int>(last_err), std::system_category()));
    LOGGER_ERROR("atomic_write_json: MoveFileExW failed for '{}'", target.string());
}

#endif
} // namespace

struct JsonConfig::Impl
{
    fs::path configPath;
    nlohmann::json data = nlohmann::json::object();
    mutable std::shared_mutex dataMutex;
};

JsonConfig::JsonConfig() noexcept
{
    if (!lifecycle_initialized())
    {
        MESH_PANIC("JsonConfig created before its module was initialized via LifecycleManager.");
    }
}

JsonConfig::JsonConfig(const fs::path &configFile, bool createIfMissing,
                       std::error_code *err_code) noexcept
    : JsonConfig()
{
    init(configFile, createIfMissing, err_code);
}

JsonConfig::~JsonConfig() = default;
JsonConfig::JsonConfig(JsonConfig &&) noexcept = default;
JsonConfig &JsonConfig::operator=(JsonConfig &&) noexcept = default;

bool JsonConfig::init(const fs::path &configFile, bool createIfMissing,
                      std::error_code *err_code) noexcept
{
    try
    {
        if (is_symlink_noexcept(configFile))
        {
            set_ec(err_code, std::make_error_code(std::errc::operation_not_permitted));
            LOGGER_ERROR("JsonConfig::init: '{}' is a symlink; refusing to use it.",
                         configFile.string());
            return false;
        }

        auto impl = std::make_unique<Impl>();
        impl->configPath = fs::absolute(configFile).lexically_normal();
        pImpl = std::move(impl);

        if (createIfMissing)
        {
            std::error_code exists_ec;
            if (!fs::exists(pImpl->configPath, exists_ec))
            {
                FileLock file_lock(pImpl->configPath, ResourceType::File, LockMode::Blocking);
                if (!file_lock.valid())
                {
                    set_ec(err_code, file_lock.error_code());
                    return false;
                }
                if (!fs::exists(pImpl->configPath, exists_ec))
                {
                    std::error_code write_ec;
                    atomic_write_json(pImpl->configPath, nlohmann::json::object(), &write_ec);
                    if (write_ec)
                    {
                        set_ec(err_code, write_ec);
                        return false;
                    }
                }
            }
        }
        return reload(err_code);
    }
    catch (const std::exception &ex)
    {
        set_ec(err_code, std::make_error_code(std::errc::io_error));
        LOGGER_ERROR("JsonConfig::init: exception during init: {}", ex.what());
        return false;
    }
}

bool JsonConfig::is_initialized() const noexcept
{
    return pImpl != nullptr;
}

fs::path JsonConfig::config_path() const
{
    return pImpl ? pImpl->configPath : fs::path{};
}

// Caller holds the FileLock.
bool JsonConfig::load_from_disk_unsafe(nlohmann::json &out, std::error_code *err_code) noexcept
{
    try
    {
        std::ifstream input_stream(pImpl->configPath);
        if (!input_stream.is_open())
        {
            out = nlohmann::json::object();
            set_ec(err_code, {});
            return true;
        }
        const std::string content((std::istreambuf_iterator<char>(input_stream)),
                                  std::istreambuf_iterator<char>());
        if (format_tools::trim(content).empty())
        {
            out = nlohmann::json::object();
            set_ec(err_code, {});
            return true;
        }
        nlohmann::json parsed = nlohmann::json::parse(content);
        if (parsed.is_null())
        {
            parsed = nlohmann::json::object();
        }
        out = std::move(parsed);
        set_ec(err_code, {});
        return true;
    }
    catch (const std::exception &ex)
    {
        set_ec(err_code, std::make_error_code(std::errc::io_error));
        LOGGER_ERROR("JsonConfig: failed to load '{}': {}", pImpl->configPath.string(), ex.what());
        return false;
    }
}

bool JsonConfig::reload(std::error_code *err_code) noexcept
{
    if (!pImpl)
    {
        set_ec(err_code, std::make_error_code(std::errc::not_connected));
        return false;
    }
    std::unique_lock<std::shared_mutex> data_lock(pImpl->dataMutex);
    FileLock file_lock(pImpl->configPath, ResourceType::File, LockMode::Blocking);
    if (!file_lock.valid())
    {
        set_ec(err_code, file_lock.error_code());
        return false;
    }
    nlohmann::json fresh;
    if (!load_from_disk_unsafe(fresh, err_code))
    {
        return false;
    }
    pImpl->data = std::move(fresh);
    return true;
}

bool JsonConfig::overwrite(std::error_code *err_code) noexcept
{
    if (!pImpl)
    {
        set_ec(err_code, std::make_error_code(std::errc::not_connected));
        return false;
    }
    try
    {
        nlohmann::json snap = snapshot();
        FileLock file_lock(pImpl->configPath, ResourceType::File, LockMode::Blocking);
        if (!file_lock.valid())
        {
            set_ec(err_code, file_lock.error_code());
            return false;
        }
        std::error_code write_ec;
        atomic_write_json(pImpl->configPath, snap, &write_ec);
        set_ec(err_code, write_ec);
        return !write_ec;
    }
    catch (const std::exception &ex)
    {
        set_ec(err_code, std::make_error_code(std::errc::io_error));
        LOGGER_ERROR("JsonConfig::overwrite: exception: {}", ex.what());
        return false;
    }
}

nlohmann::json JsonConfig::snapshot() const
{
    if (!pImpl)
    {
        return nlohmann::json::object();
    }
    std::shared_lock<std::shared_mutex> lk(pImpl->dataMutex);
    return pImpl->data;
}

void JsonConfig::with_read(const std::function<void(const nlohmann::json &)> &fn) const
{
    if (!pImpl)
    {
        fn(nlohmann::json::object());
        return;
    }
    std::shared_lock<std::shared_mutex> lk(pImpl->dataMutex);
    fn(pImpl->data);
}

void JsonConfig::replace(nlohmann::json data)
{
    if (!pImpl)
    {
        return;
    }
    std::unique_lock<std::shared_mutex> lk(pImpl->dataMutex);
    pImpl->data = std::move(data);
}

bool JsonConfig::locked_update(const std::function<bool(nlohmann::json &)> &fn, LockMode mode,
                               std::error_code *err_code) noexcept
{
    if (!pImpl)
    {
        set_ec(err_code, std::make_error_code(std::errc::not_connected));
        return false;
    }
    try
    {
        std::unique_lock<std::shared_mutex> data_lock(pImpl->dataMutex);
        FileLock file_lock(pImpl->configPath, ResourceType::File, mode);
        if (!file_lock.valid())
        {
            set_ec(err_code, file_lock.error_code());
            return false;
        }

        nlohmann::json working;
        if (!load_from_disk_unsafe(working, err_code))
        {
            return false;
        }
        pImpl->data = working;

        if (!fn(working))
        {
            set_ec(err_code, {});
            return true;
        }

        std::error_code write_ec;
        atomic_write_json(pImpl->configPath, working, &write_ec);
        if (write_ec)
        {
            set_ec(err_code, write_ec);
            return false;
        }
        pImpl->data = std::move(working);
        set_ec(err_code, {});
        return true;
    }
    catch (const std::exception &ex)
    {
        set_ec(err_code, std::make_error_code(std::errc::io_error));
        LOGGER_ERROR("JsonConfig::locked_update: exception: {}", ex.what());
        return false;
    }
}

void JsonConfig::atomic_write_json(const fs::path &target, const nlohmann::json &json_snapshot,
                                   std::error_code *err_code) noexcept
{
    set_ec(err_code, {});
    try
    {
#if defined(MCPMESH_PLATFORM_WIN64)
        atomic_write_json_win(target, json_snapshot, err_code);
#elif defined(MCPMESH_IS_POSIX)
        atomic_write_json_posix(target, json_snapshot, err_code);
#else
        (void)target;
        (void)json_snapshot;
        set_ec(err_code, std::make_error_code(std::errc::not_supported));
#endif
    }
    catch (const std::exception &ex)
    {
        set_ec(err_code, std::make_error_code(std::errc::io_error));
        LOGGER_ERROR("atomic_write_json: exception: {}", ex.what());
    }
}

// Lifecycle Integration
bool JsonConfig::lifecycle_initialized() noexcept
{
    return g_jsonconfig_initialized.load(std::memory_order_acquire);
}

namespace
{
void do_jsonconfig_startup(const char *arg)
{
    (void)arg;
    g_jsonconfig_initialized.store(true, std::memory_order_release);
}
void do_jsonconfig_shutdown(const char *arg)
{
    (void)arg;
    g_jsonconfig_initialized.store(false, std::memory_order_release);
}
constexpr std::chrono::milliseconds kJsonConfigShutdownTimeoutMs{1000};
} // namespace

ModuleDef JsonConfig::GetLifecycleModule()
{
    ModuleDef module("mcpmesh::utils::JsonConfig");
    module.add_dependency("mcpmesh::utils::FileLock");
    module.add_dependency("mcpmesh::utils::Logger");
    module.set_startup(&do_jsonconfig_startup);
    module.set_shutdown(&do_jsonconfig_shutdown, kJsonConfigShutdownTimeoutMs);
    return module;
}

} // namespace mcpmesh::utils
