#pragma once

#include "mesh_base.hpp"

namespace mcpmesh::utils
{

class Logger;

/// One log event as it travels through the logger queue.
struct LogMessage
{
    std::chrono::system_clock::time_point timestamp;
    uint64_t process_id;
    uint64_t thread_id;
    int level; // int, so sinks do not depend on logger.hpp
    fmt::memory_buffer body;
};

/// Destination of formatted log lines. Sinks are driven by the logger worker thread only.
class MCPMESH_UTILS_EXPORT Sink
{
  public:
    enum WRITE_MODE
    {
        ASYNC_WRITE,
        SYNC_WRITE
    };

    virtual ~Sink() = default;
    virtual void write(const LogMessage &msg, Sink::WRITE_MODE mode) = 0;
    virtual void flush() = 0;
    virtual std::string description() const = 0;

    static const char *level_to_string_internal(int lvl);

    /// `[MESH] [LEVEL ] [time] [PID:p TID:t] body\n`; synchronous writes are tagged `[MESH_SYNC]`.
    static std::string format_logmsg(const LogMessage &msg, Sink::WRITE_MODE mode);
};

} // namespace mcpmesh::utils
