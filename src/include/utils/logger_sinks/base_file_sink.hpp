#pragma once

#include "mesh_platform.hpp"

#include <filesystem>
#include <string>

namespace mcpmesh::utils
{

/**
 * @class BaseFileSink
 * @brief Append-only file handle shared by the file-based log sinks.
 *
 * Not a Sink itself. Owns one descriptor opened in append mode; with `use_flock`
 * every write is bracketed by an exclusive `flock` so several mesh processes can
 * share one log file without interleaving lines.
 */
class BaseFileSink
{
  public:
    BaseFileSink();
    virtual ~BaseFileSink();

    BaseFileSink(const BaseFileSink &) = delete;
    BaseFileSink &operator=(const BaseFileSink &) = delete;
    BaseFileSink(BaseFileSink &&) = delete;
    BaseFileSink &operator=(BaseFileSink &&) = delete;

  protected:
    /**
     * @brief Opens `path` for appending, creating parent directories as needed.
     * @throws std::system_error when the file cannot be opened.
     */
    void open(const std::filesystem::path &path, bool use_flock);
    void close();

    /// @throws std::system_error on a short or failed write.
    void fwrite(const std::string &content);
    void fflush();

    [[nodiscard]] bool is_open() const;
    [[nodiscard]] const std::filesystem::path &path() const { return m_path; }

    std::filesystem::path m_path;
    bool m_use_flock = false;

#ifdef MCPMESH_PLATFORM_WIN64
    void *m_file_handle = nullptr;
#else
    int m_fd = -1;
#endif
};

} // namespace mcpmesh::utils
