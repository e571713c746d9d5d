#pragma once
#include <string_view>

namespace lvl_logger
{

class ILogSink
{
 public:
  virtual ~ILogSink() = default;

  // Writes one complete line, newline included.
  virtual void Write(std::string_view line) = 0;

  virtual void Flush() = 0;
};

}  // namespace lvl_logger
