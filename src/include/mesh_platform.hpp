#pragma once
/**
 * @file mesh_platform.hpp
 * @brief Layer 0: Platform detection, Windows headers, and platform utility declarations.
 *
 * This is the foundational umbrella for all platform-specific support. Every file that
 * needs platform macros (MCPMESH_PLATFORM_WIN64, MCPMESH_IS_POSIX, etc.) or Windows
 * headers should include this. It is self-contained and can be included at any point.
 *
 * Besides the identity helpers (pid, thread id, executable name, version) this layer
 * owns everything the mesh needs from the operating system about *other* processes and
 * about the local network identity: liveness and zombie checks, process tree
 * enumeration and termination, command-line inspection, child spawning with pipe or
 * log-file redirection, and local address classification.
 *
 * Prefer build-system macros (PLATFORM_WIN64, etc.); fall back to compiler predefined macros.
 */
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#if defined(PLATFORM_WIN64)

#define MCPMESH_PLATFORM_WIN64 1
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#elif defined(PLATFORM_APPLE)

#define MCPMESH_PLATFORM_APPLE 1

#elif defined(PLATFORM_FREEBSD)

#define MCPMESH_PLATFORM_FREEBSD 1

#elif defined(PLATFORM_LINUX)

#define MCPMESH_PLATFORM_LINUX 1

#elif defined(PLATFORM_UNKNOWN)

#define MCPMESH_PLATFORM_UNKNOWN 1

#else
// Fallback detection
#if defined(_WIN64)
#define MCPMESH_PLATFORM_WIN64 1
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#elif defined(__APPLE__) && defined(__MACH__)
#define MCPMESH_PLATFORM_APPLE 1

#elif defined(__FreeBSD__)
#define MCPMESH_PLATFORM_FREEBSD 1

#elif defined(__linux__)
#define MCPMESH_PLATFORM_LINUX 1

#else
#define MCPMESH_PLATFORM_UNKNOWN 1
#endif
#endif

// Convenience booleans for source code usage:
#if defined(MCPMESH_PLATFORM_WIN64)
#define MCPMESH_IS_WINDOWS 1
#undef MCPMESH_IS_POSIX
#elif defined(MCPMESH_PLATFORM_APPLE) || defined(MCPMESH_PLATFORM_FREEBSD) ||                      \
    defined(MCPMESH_PLATFORM_LINUX)
#undef MCPMESH_IS_WINDOWS
#define MCPMESH_IS_POSIX 1
#else
#undef MCPMESH_IS_WINDOWS
#undef MCPMESH_IS_POSIX
#endif

// --- Require C++20 or later --------------------------------------------------
// For GCC/Clang use __cplusplus; for MSVC use _MSVC_LANG (MSVC sets __cplusplus only when
// /Zc:__cplusplus is enabled).
#if defined(_MSC_VER)
#if !defined(_MSVC_LANG) || (_MSVC_LANG < 202002L)
#error "This project requires C++20 or later. Please compile with /std:c++20 or newer (MSVC)."
#endif
#else
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif
#endif

#include "mcpmesh_utils_export.h"

namespace mcpmesh::platform
{

// ============================================================================
// Identity
// ============================================================================

/**
 * @brief Gets the native thread ID for the calling thread.
 * @return A 64-bit unsigned integer representing the thread ID.
 */
MCPMESH_UTILS_EXPORT uint64_t get_native_thread_id() noexcept;
/**
 * @brief Gets the process ID (PID) for the current process.
 * @return A 64-bit unsigned integer representing the process ID.
 */
MCPMESH_UTILS_EXPORT uint64_t get_pid();
/**
 * @brief Gets the name of the current executable.
 * @param include_path If `true`, returns the full absolute path to the executable.
 *                     If `false` (default), returns only the filename.
 * @return A string containing the name of the executable. Returns "unknown" on failure.
 */
MCPMESH_UTILS_EXPORT std::string get_executable_name(bool include_path = false) noexcept;

/** @brief Major version of the mcpmesh package (e.g., 0 from 0.3.7). */
MCPMESH_UTILS_EXPORT int get_version_major() noexcept;
/** @brief Minor version of the mcpmesh package. */
MCPMESH_UTILS_EXPORT int get_version_minor() noexcept;
/** @brief Rolling version number (e.g., git commit count). */
MCPMESH_UTILS_EXPORT int get_version_rolling() noexcept;
/** @brief Full version string (major.minor.rolling). */
MCPMESH_UTILS_EXPORT const char *get_version_string() noexcept;

/**
 * @brief Gets a monotonic timestamp in nanoseconds.
 * @note The absolute value is meaningless; use for computing time deltas only.
 */
MCPMESH_UTILS_EXPORT uint64_t monotonic_time_ns() noexcept;

/**
 * @brief Computes elapsed time in nanoseconds since a start timestamp.
 * @param start_ns A previous timestamp from monotonic_time_ns().
 * @return Nanoseconds elapsed since start_ns, or 0 on clock skew.
 */
MCPMESH_UTILS_EXPORT uint64_t elapsed_time_ns(uint64_t start_ns) noexcept;

// ============================================================================
// Other processes
// ============================================================================

/**
 * @brief Checks if a process with the given PID is currently alive.
 * @details Uses platform-specific APIs:
 *          - Windows: OpenProcess() + GetExitCodeProcess()
 *          - POSIX: kill(pid, 0) with errno check
 * @param pid The process ID to check.
 * @return True if the process exists, false otherwise.
 * @note PID 0 always returns false (invalid/system PID).
 * @note On POSIX, EPERM (permission denied) is treated as "alive". A zombie still
 *       counts as alive here; combine with is_process_zombie() for health checks.
 */
MCPMESH_UTILS_EXPORT bool is_process_alive(uint64_t pid) noexcept;

/**
 * @brief Returns true if the process has exited but has not been reaped yet.
 * @note Linux reads `/proc/<pid>/stat`. Other platforms always return false.
 */
MCPMESH_UTILS_EXPORT bool is_process_zombie(uint64_t pid) noexcept;

/// @brief True when the process exists and is not a zombie.
MCPMESH_UTILS_EXPORT bool is_process_healthy(uint64_t pid) noexcept;

/**
 * @brief Reaps `pid` if it is an exited child of the calling process.
 * @param pid Child process id.
 * @param exit_code Receives the exit status (or 128+signal) when reaped.
 * @return True if the child was reaped by this call.
 */
MCPMESH_UTILS_EXPORT bool try_reap_child(uint64_t pid, int *exit_code = nullptr) noexcept;

/// @brief Reaps every exited child of the calling process; returns the number reaped.
MCPMESH_UTILS_EXPORT int reap_exited_children() noexcept;

/// @brief Lists all process ids visible to the caller (empty where unsupported).
MCPMESH_UTILS_EXPORT std::vector<uint64_t> list_process_ids();

/**
 * @brief Lists every descendant of `pid` (children, grandchildren, ...), parents first.
 */
MCPMESH_UTILS_EXPORT std::vector<uint64_t> list_descendant_pids(uint64_t pid);

/**
 * @brief Returns the command line of `pid` with arguments joined by single spaces.
 * @return Empty string when the process is gone or not readable.
 */
MCPMESH_UTILS_EXPORT std::string read_process_cmdline(uint64_t pid);

/**
 * @brief Returns the environment of `pid` as `KEY=VALUE` entries.
 * @return Empty when the process is gone, not readable, or on unsupported platforms.
 */
MCPMESH_UTILS_EXPORT std::vector<std::string> read_process_environ(uint64_t pid);

/**
 * @brief Terminates `pid` and all of its descendants.
 *
 * Children are signalled before the parent. Graceful termination (SIGTERM) is
 * followed by a wait of up to `grace`; survivors are then force-killed (SIGKILL).
 * When `force` is true the graceful phase is skipped. If `pid` leads its own
 * process group, the whole group is signalled as well.
 *
 * @return The number of processes that were running when the call started and are
 *         gone when it returns.
 */
MCPMESH_UTILS_EXPORT int terminate_process_tree(uint64_t pid, std::chrono::milliseconds grace,
                                                bool force = false);

// ============================================================================
// Spawning
// ============================================================================

/// Options for spawn_process().
struct SpawnOptions
{
    /// Program followed by its arguments. argv[0] is looked up in PATH.
    std::vector<std::string> argv;
    /// Environment overrides applied on top of the parent's environment.
    std::vector<std::pair<std::string, std::string>> env;
    /// When non-empty, stdout and stderr are appended to this file.
    std::filesystem::path output_log;
    /// When true, stdin/stdout/stderr are connected to pipes returned in SpawnedProcess.
    bool pipe_stdio = false;
    /// Start the child as leader of a new session / process group.
    bool new_process_group = true;
    /// Working directory for the child; empty keeps the parent's.
    std::filesystem::path working_dir;
};

/// Handles of a spawned child. Pipe descriptors are -1 when not requested.
struct SpawnedProcess
{
    uint64_t pid = 0;
    int stdin_fd = -1;
    int stdout_fd = -1;
    int stderr_fd = -1;
};

/**
 * @brief Spawns a child process.
 *
 * An exec failure in the child is reported back to the parent through a
 * close-on-exec pipe, so a missing program yields an error here rather than a child
 * that exits with status 127.
 *
 * @param opts Spawn options.
 * @param ec Set on failure (not_supported on platforms without an implementation).
 * @return The spawned process; `pid == 0` on failure.
 */
MCPMESH_UTILS_EXPORT SpawnedProcess spawn_process(const SpawnOptions &opts, std::error_code &ec);

/// Closes any pipe descriptor still open in `proc` and resets it to -1.
MCPMESH_UTILS_EXPORT void close_process_pipes(SpawnedProcess &proc) noexcept;

/// Blocking read from a pipe descriptor; retries on EINTR. Returns bytes read, 0 at EOF, -1 on error.
MCPMESH_UTILS_EXPORT long read_pipe(int fd, char *buf, std::size_t len) noexcept;

/// Writes all of `data` to a pipe descriptor. False on error (e.g. EPIPE).
MCPMESH_UTILS_EXPORT bool write_pipe(int fd, const char *data, std::size_t len) noexcept;

/**
 * @brief Ignores SIGPIPE process-wide so a dead pipe reader surfaces as EPIPE.
 * @details No-op where the signal does not exist.
 */
MCPMESH_UTILS_EXPORT void ignore_broken_pipe_signal() noexcept;

// ============================================================================
// Network identity
// ============================================================================

/// @brief The machine's hostname, or "localhost" if it cannot be read.
MCPMESH_UTILS_EXPORT std::string get_hostname();

/**
 * @brief Best-effort primary LAN IPv4 address of this machine.
 * @details Determined by the source address the kernel picks for an outbound UDP
 *          socket (no packet is sent); falls back to the first non-loopback interface.
 * @return The address, or "127.0.0.1" when none can be determined.
 */
MCPMESH_UTILS_EXPORT std::string get_local_ip();

/// @brief All IPv4 addresses assigned to local interfaces, loopback included.
MCPMESH_UTILS_EXPORT std::vector<std::string> local_ipv4_addresses();

/**
 * @brief True when `host` designates the current machine.
 * @details localhost, 127.0.0.0/8, 0.0.0.0, ::1, the hostname, and any local
 *          interface address are local. Anything else is remote.
 */
MCPMESH_UTILS_EXPORT bool is_local_host(const std::string &host);

/// @brief True if `host` resolves to at least one address.
MCPMESH_UTILS_EXPORT bool can_resolve_host(const std::string &host) noexcept;

/**
 * @brief Attempts a TCP connection to host:port within `timeout`.
 * @return True if the connection was established.
 */
MCPMESH_UTILS_EXPORT bool tcp_connect_probe(const std::string &host, int port,
                                            std::chrono::milliseconds timeout) noexcept;

/**
 * @brief Tries to bind a TCP listening socket to host:port with SO_REUSEADDR.
 * @return True if the bind succeeded (the socket is closed again immediately).
 */
MCPMESH_UTILS_EXPORT bool tcp_bind_probe(const std::string &host, int port) noexcept;

} // namespace mcpmesh::platform
