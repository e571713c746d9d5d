#include "lvl_logger/formatters/prefix_builder.hpp"

#include "lvl_logger/platform.hpp"
#include "lvl_logger/timestamp.hpp"

namespace lvl_logger
{

std::string BuildPrefix(FormatOptions options, SeverityLevel level,
                        const SourceLocation& caller, uint64_t wall_ns)
{
  std::string prefix;

  if (HasOption(options, FormatOptions::DateTime))
  {
    char tmp[LVL_LOG_TIMESTAMP_LEN];
    size_t n = format_timestamp(wall_ns, tmp, sizeof(tmp));
    prefix.append(tmp, n);
    prefix += ' ';
  }

  if (HasOption(options, FormatOptions::Loglevel))
  {
    prefix += to_string(level);
    prefix += ' ';
  }

  if (HasOption(options, FormatOptions::ShortFileName | FormatOptions::LongFileName) &&
      caller.Resolved())
  {
    const char* file = caller.file_path;
    if (HasOption(options, FormatOptions::ShortFileName))
    {
      file = caller.file_name ? caller.file_name
                              : SourceLocation::ExtractFilename(caller.file_path);
    }
    prefix += file;
    prefix += ':';
    prefix += std::to_string(caller.line);
    prefix += ' ';
  }

  return prefix;
}

std::string BuildPrefix(FormatOptions options, SeverityLevel level,
                        const SourceLocation& caller)
{
  return BuildPrefix(options, level, caller, wall_clock_now_ns());
}

}  // namespace lvl_logger
