#include "lvl_logger/sinks/console_sink.hpp"

namespace lvl_logger
{

ConsoleSink::ConsoleSink(std::FILE* stream) : stream_(stream) {}

void ConsoleSink::Write(std::string_view line)
{
  std::fwrite(line.data(), 1, line.size(), stream_);
  std::fflush(stream_);
}

void ConsoleSink::Flush() { std::fflush(stream_); }

}  // namespace lvl_logger
