#pragma once
#include <string>

#include "format_options.hpp"

namespace lvl_logger
{

// Describes a file-backed logger. Read once by NewLogger and not kept afterwards.
struct LoggerConfig
{
  // Relative to the working directory; empty means the working directory itself.
  std::string directory;
  // Required.
  std::string filename;
  // Also copy every line to stdout.
  bool echo_stdout = false;
  FormatOptions include = FormatOptions::None;
  PrefixMode prefix_mode = PrefixMode::Frozen;
};

}  // namespace lvl_logger
