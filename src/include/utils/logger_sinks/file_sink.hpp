#pragma once

#include "utils/logger_sinks/base_file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"

#include <string>

namespace mcpmesh::utils
{

class FileSink : public Sink, private BaseFileSink
{
  public:
    /// @throws std::runtime_error if the file cannot be opened.
    FileSink(const std::string &path, bool use_flock);
    ~FileSink() override;

    void write(const LogMessage &msg, Sink::WRITE_MODE mode) override;
    void flush() override;
    std::string description() const override;
};

} // namespace mcpmesh::utils
