/**
 * @file platform.cpp
 * @brief Implements platform-specific utility functions.
 *
 * This file provides the concrete implementations for functions declared in
 * `mesh_platform.hpp`. It contains OS-dependent code for retrieving process and
 * thread IDs, getting the current executable's path, package version information,
 * inspecting and terminating other processes, spawning children, and classifying
 * network hosts. It uses preprocessor directives to select the correct
 * implementation for Windows, Linux, and macOS.
 */
#include "mesh_base.hpp"
#include "mcpmesh_version.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <thread>

#if defined(MCPMESH_PLATFORM_WIN64)
#include <tlhelp32.h>
#else
#include <arpa/inet.h>
#include <cerrno>
#include <fcntl.h>
#include <ifaddrs.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

#if defined(MCPMESH_PLATFORM_LINUX)
#include <climits>
#endif

#if defined(MCPMESH_PLATFORM_FREEBSD)
#include <sys/sysctl.h>
#endif

#if defined(MCPMESH_PLATFORM_APPLE)
#include <libproc.h>     // proc_pidpath
#include <limits.h>      // PATH_MAX
#include <mach-o/dyld.h> // _NSGetExecutablePath
#endif

#include "fmt/core.h"
#include "fmt/format.h"

#if defined(MCPMESH_IS_POSIX)
extern char **environ;
#endif

namespace mcpmesh::platform
{

uint64_t get_pid()
{
#if defined(MCPMESH_PLATFORM_WIN64)
    return static_cast<uint64_t>(GetCurrentProcessId());
#else
    return static_cast<uint64_t>(getpid());
#endif
}

/**
 * @brief Gets a platform-native thread ID.
 * @details Uses the most efficient OS-specific API available (`GetCurrentThreadId`,
 *          `pthread_threadid_np`, `syscall(SYS_gettid)`).
 */
uint64_t get_native_thread_id() noexcept
{
#if defined(MCPMESH_PLATFORM_WIN64)
    return static_cast<uint64_t>(::GetCurrentThreadId());
#elif defined(__APPLE__)
    uint64_t tid;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(__linux__)
    return static_cast<uint64_t>(syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

/**
 * @brief Discovers the name and optionally the full path of the current executable.
 * @details Used to locate the config directory relative to the binary and to name
 *          log files. Uses `GetModuleFileNameW` (Windows), `readlink` on
 *          `/proc/self/exe` (Linux), `_NSGetExecutablePath` (macOS) and `sysctl`
 *          (FreeBSD).
 */
std::string get_executable_name(bool include_path) noexcept
{
    try
    {
        std::string full_path;
#if defined(MCPMESH_PLATFORM_WIN64)
        std::vector<wchar_t> buf;
        buf.resize(MAX_PATH);
        DWORD len = 0;
        for (;;)
        {
            len = GetModuleFileNameW(nullptr, buf.data(), static_cast<DWORD>(buf.size()));
            if (len == 0)
            {
                return "unknown_win";
            }
            if (len < buf.size() - 1)
            {
                break;
            }
            buf.resize(buf.size() * 2);
        }
        full_path = mcpmesh::format_tools::ws2s(std::wstring(buf.data(), len));

#elif defined(MCPMESH_PLATFORM_LINUX)
        std::vector<char> buf;
        buf.resize(PATH_MAX);
        ssize_t count = readlink("/proc/self/exe", buf.data(), buf.size());
        if (count == -1)
        {
            return "unknown_linux";
        }
        full_path.assign(buf.data(), static_cast<size_t>(count));

#elif defined(MCPMESH_PLATFORM_APPLE)
        uint32_t size = 0;
        if (_NSGetExecutablePath(nullptr, &size) == -1 && size > 0)
        {
            std::vector<char> buf(size);
            if (_NSGetExecutablePath(buf.data(), &size) == 0)
            {
                char resolved[PATH_MAX];
                full_path = realpath(buf.data(), resolved) != nullptr
                                ? std::string(resolved)
                                : std::string(buf.data(), size);
            }
        }
        if (full_path.empty())
        {
            char procbuf[PROC_PIDPATHINFO_MAXSIZE];
            if (proc_pidpath(getpid(), procbuf, sizeof(procbuf)) > 0)
            {
                full_path = procbuf;
            }
        }
        if (full_path.empty())
        {
            return "unknown_macos";
        }
#elif defined(MCPMESH_PLATFORM_FREEBSD)
        int mib[4] = {CTL_KERN, KERN_PROC, KERN_PROC_PATHNAME, -1};
        size_t buffer_size;
        if (sysctl(mib, 4, nullptr, &buffer_size, nullptr, 0) == -1)
        {
            return "unknown_freebsd_sysctl_size_fail";
        }
        std::vector<char> buf(buffer_size);
        if (sysctl(mib, 4, buf.data(), &buffer_size, nullptr, 0) == -1)
        {
            return "unknown_freebsd_sysctl_read_fail";
        }
        full_path.assign(buf.data(), buffer_size - 1);
#else
        (void)include_path;
        return "unknown";
#endif

        if (include_path)
        {
            return full_path;
        }
        return std::filesystem::path(full_path).filename().string();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "Warning: get_executable_name failed: {}.\n", e.what());
    }
    return "unknown";
}

// --- Version information (from mcpmesh_version.h, generated at configure time) ---

int get_version_major() noexcept
{
    return MCPMESH_VERSION_MAJOR;
}

int get_version_minor() noexcept
{
    return MCPMESH_VERSION_MINOR;
}

int get_version_rolling() noexcept
{
    return MCPMESH_VERSION_ROLLING;
}

const char *get_version_string() noexcept
{
    return MCPMESH_VERSION_STRING;
}

uint64_t monotonic_time_ns() noexcept
{
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                     std::chrono::steady_clock::now().time_since_epoch())
                                     .count());
}

uint64_t elapsed_time_ns(uint64_t start_ns) noexcept
{
    uint64_t now = monotonic_time_ns();
    if (now < start_ns)
    {
        return 0;
    }
    return now - start_ns;
}

// ============================================================================
// Other processes
// ============================================================================

namespace
{

#if defined(MCPMESH_PLATFORM_LINUX)
/// Reads a whole /proc pseudo-file. Returns an empty string on any failure.
std::string read_proc_file(uint64_t pid, const char *leaf)
{
    std::ifstream in(fmt::format("/proc/{}/{}", pid, leaf), std::ios::binary);
    if (!in)
    {
        return {};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

/**
 * Parses /proc/<pid>/stat. The command name is parenthesised and may itself contain
 * spaces or parentheses, so the fields are located after the *last* ')'.
 */
bool read_proc_stat(uint64_t pid, char &state, uint64_t &ppid)
{
    const std::string stat = read_proc_file(pid, "stat");
    const auto close_paren = stat.rfind(')');
    if (close_paren == std::string::npos || close_paren + 2 >= stat.size())
    {
        return false;
    }
    std::istringstream rest(stat.substr(close_paren + 2));
    long long parent = 0;
    if (!(rest >> state >> parent))
    {
        return false;
    }
    ppid = parent > 0 ? static_cast<uint64_t>(parent) : 0;
    return true;
}

std::vector<std::string> split_nul(const std::string &raw)
{
    std::vector<std::string> out;
    std::string current;
    for (char c : raw)
    {
        if (c == '\0')
        {
            if (!current.empty())
            {
                out.push_back(std::move(current));
            }
            current.clear();
        }
        else
        {
            current.push_back(c);
        }
    }
    if (!current.empty())
    {
        out.push_back(std::move(current));
    }
    return out;
}
#endif

/// True when the pid no longer counts as a running process (gone or zombie).
bool is_gone(uint64_t pid) noexcept
{
    try_reap_child(pid);
    return !is_process_alive(pid) || is_process_zombie(pid);
}

} // namespace

/**
 * @brief Checks if a process with the given PID is currently alive.
 * @note POSIX: kill(pid, 0). ESRCH means dead; EPERM means alive but owned by
 *       another user.
 */
bool is_process_alive(uint64_t pid) noexcept
{
    if (pid == 0)
    {
        return false;
    }

#if defined(MCPMESH_PLATFORM_WIN64)
    HANDLE process = OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, static_cast<DWORD>(pid));
    if (process == NULL)
    {
        return GetLastError() != ERROR_INVALID_PARAMETER;
    }
    DWORD exitCode = 0;
    BOOL result = GetExitCodeProcess(process, &exitCode);
    CloseHandle(process);
    if (!result)
    {
        return false;
    }
    return exitCode == STILL_ACTIVE;
#else
    if (kill(static_cast<pid_t>(pid), 0) == 0)
    {
        return true;
    }
    return errno != ESRCH;
#endif
}

bool is_process_zombie(uint64_t pid) noexcept
{
#if defined(MCPMESH_PLATFORM_LINUX)
    try
    {
        char state = 0;
        uint64_t ppid = 0;
        if (!read_proc_stat(pid, state, ppid))
        {
            return false;
        }
        return state == 'Z' || state == 'X';
    }
    catch (const std::exception &)
    {
        return false;
    }
#else
    (void)pid;
    return false;
#endif
}

bool is_process_healthy(uint64_t pid) noexcept
{
    return is_process_alive(pid) && !is_process_zombie(pid);
}

bool try_reap_child(uint64_t pid, int *exit_code) noexcept
{
#if defined(MCPMESH_IS_POSIX)
    if (pid == 0)
    {
        return false;
    }
    int status = 0;
    pid_t r = waitpid(static_cast<pid_t>(pid), &status, WNOHANG);
    if (r != static_cast<pid_t>(pid))
    {
        return false;
    }
    if (exit_code != nullptr)
    {
        if (WIFEXITED(status))
        {
            *exit_code = WEXITSTATUS(status);
        }
        else if (WIFSIGNALED(status))
        {
            *exit_code = 128 + WTERMSIG(status);
        }
    }
    return true;
#else
    (void)pid;
    (void)exit_code;
    return false;
#endif
}

int reap_exited_children() noexcept
{
#if defined(MCPMESH_IS_POSIX)
    int reaped = 0;
    int status = 0;
    while (waitpid(-1, &status, WNOHANG) > 0)
    {
        ++reaped;
    }
    return reaped;
#else
    return 0;
#endif
}

std::vector<uint64_t> list_process_ids()
{
    std::vector<uint64_t> pids;
#if defined(MCPMESH_PLATFORM_LINUX)
    std::error_code ec;
    for (const auto &entry : std::filesystem::directory_iterator("/proc", ec))
    {
        const std::string leaf = entry.path().filename().string();
        if (!leaf.empty() && std::all_of(leaf.begin(), leaf.end(),
                                         [](unsigned char c) { return std::isdigit(c) != 0; }))
        {
            pids.push_back(std::stoull(leaf));
        }
    }
#elif defined(MCPMESH_PLATFORM_WIN64)
    HANDLE snap = CreateToolhelp32Snapshot(TH32CS_SNAPPROCESS, 0);
    if (snap != INVALID_HANDLE_VALUE)
    {
        PROCESSENTRY32 pe{};
        pe.dwSize = sizeof(pe);
        for (BOOL ok = Process32First(snap, &pe); ok; ok = Process32Next(snap, &pe))
        {
            pids.push_back(pe.th32ProcessID);
        }
        CloseHandle(snap);
    }
#endif
    return pids;
}

std::vector<uint64_t> list_descendant_pids(uint64_t pid)
{
    std::multimap<uint64_t, uint64_t> children_of;
#if defined(MCPMESH_PLATFORM_LINUX)
    for (uint64_t p : list_process_ids())
    {
        char state = 0;
        uint64_t ppid = 0;
        if (read_proc_stat(p, state, ppid))
        {
            children_of.emplace(ppid, p);
        }
    }
#elif defined(MCPMESH_PLATFORM_WIN64)
    HANDLE snap = CreateToolhelp32Snapshot(TH32CS_SNAPPROCESS, 0);
    if (snap != INVALID_HANDLE_VALUE)
    {
        PROCESSENTRY32 pe{};
        pe.dwSize = sizeof(pe);
        for (BOOL ok = Process32First(snap, &pe); ok; ok = Process32Next(snap, &pe))
        {
            children_of.emplace(pe.th32ParentProcessID, pe.th32ProcessID);
        }
        CloseHandle(snap);
    }
#endif

    std::vector<uint64_t> out;
    std::set<uint64_t> seen{pid};
    std::vector<uint64_t> frontier{pid};
    while (!frontier.empty())
    {
        std::vector<uint64_t> next;
        for (uint64_t parent : frontier)
        {
            auto [first, last] = children_of.equal_range(parent);
            for (auto it = first; it != last; ++it)
            {
                if (seen.insert(it->second).second)
                {
                    out.push_back(it->second);
                    next.push_back(it->second);
                }
            }
        }
        frontier = std::move(next);
    }
    return out;
}

std::string read_process_cmdline(uint64_t pid)
{
#if defined(MCPMESH_PLATFORM_LINUX)
    std::string joined;
    for (const auto &arg : split_nul(read_proc_file(pid, "cmdline")))
    {
        if (!joined.empty())
        {
            joined.push_back(' ');
        }
        joined += arg;
    }
    return joined;
#else
    (void)pid;
    return {};
#endif
}

std::vector<std::string> read_process_environ(uint64_t pid)
{
#if defined(MCPMESH_PLATFORM_LINUX)
    return split_nul(read_proc_file(pid, "environ"));
#else
    (void)pid;
    return {};
#endif
}

int terminate_process_tree(uint64_t pid, std::chrono::milliseconds grace, bool force)
{
    if (pid == 0)
    {
        return 0;
    }

    // Deepest descendants first, the root last.
    std::vector<uint64_t> targets = list_descendant_pids(pid);
    std::reverse(targets.begin(), targets.end());
    targets.push_back(pid);
    targets.erase(std::remove_if(targets.begin(), targets.end(),
                                 [](uint64_t p) { return is_gone(p); }),
                  targets.end());
    if (targets.empty())
    {
        return 0;
    }

    auto all_gone = [&targets]()
    { return std::all_of(targets.begin(), targets.end(), [](uint64_t p) { return is_gone(p); }); };

    auto wait_until_gone = [&all_gone](std::chrono::milliseconds limit)
    {
        const auto deadline = std::chrono::steady_clock::now() + limit;
        while (!all_gone() && std::chrono::steady_clock::now() < deadline)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    };

#if defined(MCPMESH_IS_POSIX)
    const pid_t root = static_cast<pid_t>(pid);
    const bool leads_group = getpgid(root) == root;

    if (!force)
    {
        for (uint64_t p : targets)
        {
            kill(static_cast<pid_t>(p), SIGTERM);
        }
        if (leads_group)
        {
            killpg(root, SIGTERM);
        }
        wait_until_gone(grace);
    }
    if (!all_gone())
    {
        for (uint64_t p : targets)
        {
            if (!is_gone(p))
            {
                kill(static_cast<pid_t>(p), SIGKILL);
            }
        }
        if (leads_group)
        {
            killpg(root, SIGKILL);
        }
        wait_until_gone(std::chrono::milliseconds(2000));
    }
#elif defined(MCPMESH_PLATFORM_WIN64)
    (void)grace;
    (void)force;
    for (uint64_t p : targets)
    {
        HANDLE h = OpenProcess(PROCESS_TERMINATE, FALSE, static_cast<DWORD>(p));
        if (h != NULL)
        {
            TerminateProcess(h, 1);
            CloseHandle(h);
        }
    }
    wait_until_gone(std::chrono::milliseconds(2000));
#else
    (void)grace;
    (void)force;
#endif

    return static_cast<int>(
        std::count_if(targets.begin(), targets.end(), [](uint64_t p) { return is_gone(p); }));
}

// ============================================================================
// Spawning
// ============================================================================

void close_process_pipes(SpawnedProcess &proc) noexcept
{
#if defined(MCPMESH_IS_POSIX)
    for (int *fd : {&proc.stdin_fd, &proc.stdout_fd, &proc.stderr_fd})
    {
        if (*fd >= 0)
        {
            ::close(*fd);
            *fd = -1;
        }
    }
#else
    (void)proc;
#endif
}

#if defined(MCPMESH_IS_POSIX)

namespace
{
void close_if_open(int &fd) noexcept
{
    if (fd >= 0)
    {
        ::close(fd);
        fd = -1;
    }
}

bool make_cloexec_pipe(int fds[2]) noexcept
{
    if (::pipe(fds) != 0)
    {
        return false;
    }
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
}
} // namespace

SpawnedProcess spawn_process(const SpawnOptions &opts, std::error_code &ec)
{
    ec.clear();
    SpawnedProcess result;
    if (opts.argv.empty())
    {
        ec = std::make_error_code(std::errc::invalid_argument);
        return result;
    }

    // Everything the child needs is prepared before fork(); the child only calls
    // async-signal-safe functions.
    std::vector<char *> argv;
    argv.reserve(opts.argv.size() + 1);
    for (const auto &a : opts.argv)
    {
        argv.push_back(const_cast<char *>(a.c_str()));
    }
    argv.push_back(nullptr);

    std::map<std::string, std::string> env_map;
    for (char **e = environ; e != nullptr && *e != nullptr; ++e)
    {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq != std::string::npos)
        {
            env_map[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
    }
    for (const auto &[k, v] : opts.env)
    {
        env_map[k] = v;
    }
    std::vector<std::string> env_strings;
    env_strings.reserve(env_map.size());
    for (const auto &[k, v] : env_map)
    {
        env_strings.push_back(k + "=" + v);
    }
    std::vector<char *> envp;
    envp.reserve(env_strings.size() + 1);
    for (auto &s : env_strings)
    {
        envp.push_back(s.data());
    }
    envp.push_back(nullptr);

    int log_fd = -1;
    int null_fd = -1;
    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};

    auto cleanup_all = [&]()
    {
        close_if_open(log_fd);
        close_if_open(null_fd);
        for (int *fds : {in_pipe, out_pipe, err_pipe, exec_pipe})
        {
            close_if_open(fds[0]);
            close_if_open(fds[1]);
        }
    };

    if (!opts.output_log.empty())
    {
        log_fd = ::open(opts.output_log.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
        if (log_fd < 0)
        {
            ec = std::error_code(errno, std::system_category());
            return result;
        }
    }
    if (!opts.pipe_stdio)
    {
        null_fd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    }
    if ((opts.pipe_stdio &&
         (!make_cloexec_pipe(in_pipe) || !make_cloexec_pipe(out_pipe) || !make_cloexec_pipe(err_pipe))) ||
        !make_cloexec_pipe(exec_pipe))
    {
        ec = std::error_code(errno, std::system_category());
        cleanup_all();
        return result;
    }

    const std::string workdir = opts.working_dir.string();
    pid_t pid = ::fork();
    if (pid < 0)
    {
        ec = std::error_code(errno, std::system_category());
        cleanup_all();
        return result;
    }

    if (pid == 0)
    {
        if (opts.new_process_group)
        {
            ::setsid();
        }
        if (opts.pipe_stdio)
        {
            ::dup2(in_pipe[0], STDIN_FILENO);
            ::dup2(out_pipe[1], STDOUT_FILENO);
            ::dup2(err_pipe[1], STDERR_FILENO);
        }
        else
        {
            if (null_fd >= 0)
            {
                ::dup2(null_fd, STDIN_FILENO);
            }
            if (log_fd >= 0)
            {
                ::dup2(log_fd, STDOUT_FILENO);
                ::dup2(log_fd, STDERR_FILENO);
            }
        }
        if (!workdir.empty() && ::chdir(workdir.c_str()) != 0)
        {
            int err = errno;
            (void)!::write(exec_pipe[1], &err, sizeof(err));
            ::_exit(127);
        }
        environ = envp.data();
        ::execvp(argv[0], argv.data());
        int err = errno;
        (void)!::write(exec_pipe[1], &err, sizeof(err));
        ::_exit(127);
    }

    // Parent.
    close_if_open(exec_pipe[1]);
    close_if_open(in_pipe[0]);
    close_if_open(out_pipe[1]);
    close_if_open(err_pipe[1]);
    close_if_open(log_fd);
    close_if_open(null_fd);

    int child_errno = 0;
    ssize_t n;
    do
    {
        n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_if_open(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno)))
    {
        int status = 0;
        ::waitpid(pid, &status, 0);
        ec = std::error_code(child_errno, std::system_category());
        cleanup_all();
        return result;
    }

    result.pid = static_cast<uint64_t>(pid);
    result.stdin_fd = in_pipe[1];
    result.stdout_fd = out_pipe[0];
    result.stderr_fd = err_pipe[0];
    return result;
}

#else

SpawnedProcess spawn_process(const SpawnOptions &opts, std::error_code &ec)
{
    (void)opts;
    ec = std::make_error_code(std::errc::not_supported);
    return {};
}

#endif

long read_pipe(int fd, char *buf, std::size_t len) noexcept
{
#if defined(MCPMESH_IS_POSIX)
    for (;;)
    {
        const ssize_t n = ::read(fd, buf, len);
        if (n < 0 && errno == EINTR)
            continue;
        return static_cast<long>(n);
    }
#else
    (void)fd;
    (void)buf;
    (void)len;
    return -1;
#endif
}

bool write_pipe(int fd, const char *data, std::size_t len) noexcept
{
#if defined(MCPMESH_IS_POSIX)
    while (len > 0)
    {
        const ssize_t n = ::write(fd, data, len);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            return false;
        }
        data += n;
        len -= static_cast<std::size_t>(n);
    }
    return true;
#else
    (void)fd;
    (void)data;
    (void)len;
    return false;
#endif
}

void ignore_broken_pipe_signal() noexcept
{
#if defined(MCPMESH_IS_POSIX)
    ::signal(SIGPIPE, SIG_IGN);
#endif
}

// ============================================================================
// Network identity
// ============================================================================

std::string get_hostname()
{
#if defined(MCPMESH_PLATFORM_WIN64)
    char buf[MAX_COMPUTERNAME_LENGTH + 1] = {};
    DWORD size = sizeof(buf);
    if (GetComputerNameA(buf, &size))
    {
        return std::string(buf, size);
    }
#else
    char buf[256] = {};
    if (::gethostname(buf, sizeof(buf) - 1) == 0 && buf[0] != '\0')
    {
        return std::string(buf);
    }
#endif
    return "localhost";
}

std::vector<std::string> local_ipv4_addresses()
{
    std::vector<std::string> out;
#if defined(MCPMESH_IS_POSIX)
    struct ifaddrs *ifa_list = nullptr;
    if (::getifaddrs(&ifa_list) != 0)
    {
        return out;
    }
    for (auto *ifa = ifa_list; ifa != nullptr; ifa = ifa->ifa_next)
    {
        if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET)
        {
            continue;
        }
        char buf[INET_ADDRSTRLEN] = {};
        const auto *sin = reinterpret_cast<const struct sockaddr_in *>(ifa->ifa_addr);
        if (::inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf)) != nullptr)
        {
            out.emplace_back(buf);
        }
    }
    ::freeifaddrs(ifa_list);
#endif
    return out;
}

std::string get_local_ip()
{
#if defined(MCPMESH_IS_POSIX)
    int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd >= 0)
    {
        struct sockaddr_in remote{};
        remote.sin_family = AF_INET;
        remote.sin_port = htons(80);
        ::inet_pton(AF_INET, "8.8.8.8", &remote.sin_addr);
        if (::connect(fd, reinterpret_cast<struct sockaddr *>(&remote), sizeof(remote)) == 0)
        {
            struct sockaddr_in local{};
            socklen_t len = sizeof(local);
            char buf[INET_ADDRSTRLEN] = {};
            if (::getsockname(fd, reinterpret_cast<struct sockaddr *>(&local), &len) == 0 &&
                ::inet_ntop(AF_INET, &local.sin_addr, buf, sizeof(buf)) != nullptr &&
                std::string(buf) != "0.0.0.0")
            {
                ::close(fd);
                return std::string(buf);
            }
        }
        ::close(fd);
    }
#endif
    for (const auto &addr : local_ipv4_addresses())
    {
        if (addr.rfind("127.", 0) != 0)
        {
            return addr;
        }
    }
    return "127.0.0.1";
}

bool is_local_host(const std::string &host_in)
{
    std::string host = host_in;
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']')
    {
        host = host.substr(1, host.size() - 2);
    }
    std::transform(host.begin(), host.end(), host.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (host.empty() || host == "localhost" || host == "0.0.0.0" || host == "::1" ||
        host == "::" || host.rfind("127.", 0) == 0)
    {
        return true;
    }

    std::string hostname = get_hostname();
    std::transform(hostname.begin(), hostname.end(), hostname.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (host == hostname)
    {
        return true;
    }

    const auto local = local_ipv4_addresses();
    if (std::find(local.begin(), local.end(), host) != local.end())
    {
        return true;
    }

#if defined(MCPMESH_IS_POSIX)
    // Names (not numeric addresses) are resolved once and compared by address.
    struct in_addr numeric{};
    if (::inet_pton(AF_INET, host.c_str(), &numeric) == 1 || host.find(':') != std::string::npos)
    {
        return false;
    }
    struct addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo *res = nullptr;
    if (::getaddrinfo(host.c_str(), nullptr, &hints, &res) != 0)
    {
        return false;
    }
    bool is_local = false;
    for (auto *ai = res; ai != nullptr && !is_local; ai = ai->ai_next)
    {
        char buf[INET_ADDRSTRLEN] = {};
        const auto *sin = reinterpret_cast<const struct sockaddr_in *>(ai->ai_addr);
        if (::inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf)) != nullptr)
        {
            const std::string addr(buf);
            is_local = addr.rfind("127.", 0) == 0 ||
                       std::find(local.begin(), local.end(), addr) != local.end();
        }
    }
    ::freeaddrinfo(res);
    return is_local;
#else
    return false;
#endif
}

bool can_resolve_host(const std::string &host) noexcept
{
    if (host.empty())
    {
        return false;
    }
#if defined(MCPMESH_IS_POSIX)
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo *res = nullptr;
    if (::getaddrinfo(host.c_str(), nullptr, &hints, &res) != 0)
    {
        return false;
    }
    ::freeaddrinfo(res);
    return true;
#else
    return host == "localhost" || host == "127.0.0.1";
#endif
}

bool tcp_connect_probe(const std::string &host, int port, std::chrono::milliseconds timeout) noexcept
{
    if (port <= 0 || port > 65535)
    {
        return false;
    }
#if defined(MCPMESH_IS_POSIX)
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo *res = nullptr;
    const std::string port_str = std::to_string(port);
    if (::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res) != 0)
    {
        return false;
    }

    bool connected = false;
    for (auto *ai = res; ai != nullptr && !connected; ai = ai->ai_next)
    {
        int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0)
        {
            continue;
        }
        ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL, 0) | O_NONBLOCK);
        int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (rc == 0)
        {
            connected = true;
        }
        else if (errno == EINPROGRESS)
        {
            struct pollfd pfd{fd, POLLOUT, 0};
            if (::poll(&pfd, 1, static_cast<int>(timeout.count())) == 1)
            {
                int so_error = 0;
                socklen_t len = sizeof(so_error);
                connected = ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) == 0 && so_error == 0;
            }
        }
        ::close(fd);
    }
    ::freeaddrinfo(res);
    return connected;
#else
    (void)host;
    (void)timeout;
    return false;
#endif
}

bool tcp_bind_probe(const std::string &host, int port) noexcept
{
    if (port <= 0 || port > 65535)
    {
        return false;
    }
#if defined(MCPMESH_IS_POSIX)
    struct addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;
    struct addrinfo *res = nullptr;
    const std::string port_str = std::to_string(port);
    if (::getaddrinfo(host.empty() ? nullptr : host.c_str(), port_str.c_str(), &hints, &res) != 0)
    {
        return false;
    }
    bool bound = false;
    int fd = ::socket(res->ai_family, res->ai_socktype | SOCK_CLOEXEC, res->ai_protocol);
    if (fd >= 0)
    {
        int one = 1;
        ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
        bound = ::bind(fd, res->ai_addr, res->ai_addrlen) == 0;
        ::close(fd);
    }
    ::freeaddrinfo(res);
    return bound;
#else
    (void)host;
    return false;
#endif
}

} // namespace mcpmesh::platform
