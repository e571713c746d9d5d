#pragma once
#include <cstdio>

#include "sink_interface.hpp"

namespace lvl_logger
{

// Writes every line to stdout and flushes it immediately.
class ConsoleSink : public ILogSink
{
 public:
  explicit ConsoleSink(std::FILE* stream = stdout);

  void Write(std::string_view line) override;
  void Flush() override;

 private:
  std::FILE* stream_;
};

}  // namespace lvl_logger
