#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "errors.hpp"
#include "format_options.hpp"
#include "level_writer.hpp"
#include "log_level.hpp"
#include "logger_config.hpp"
#include "sinks/multi_sink.hpp"
#include "source_location.hpp"

namespace lvl_logger
{

// Five independent severity writers sharing one fan-out sink.
class Logger
{
 public:
  Logger(std::shared_ptr<MultiSink> sink, FormatOptions options, PrefixMode mode,
         const SourceLocation& origin);

  // Each accessor binds the writer to the caller's file and line.
  LocatedWriter Debug(const SourceLocation& loc = SourceLocation::Current()) const
  {
    return At(SeverityLevel::Debug, loc);
  }
  LocatedWriter Info(const SourceLocation& loc = SourceLocation::Current()) const
  {
    return At(SeverityLevel::Info, loc);
  }
  LocatedWriter Warn(const SourceLocation& loc = SourceLocation::Current()) const
  {
    return At(SeverityLevel::Warn, loc);
  }
  LocatedWriter Error(const SourceLocation& loc = SourceLocation::Current()) const
  {
    return At(SeverityLevel::Error, loc);
  }
  LocatedWriter Trace(const SourceLocation& loc = SourceLocation::Current()) const
  {
    return At(SeverityLevel::Trace, loc);
  }

  LocatedWriter At(SeverityLevel level,
                   const SourceLocation& loc = SourceLocation::Current()) const
  {
    return LocatedWriter(writers_[to_index(level)], loc);
  }

  void Flush() const;

  const std::shared_ptr<MultiSink>& Sink() const { return sink_; }

 private:
  std::shared_ptr<MultiSink> sink_;
  std::vector<LevelWriter> writers_;
};

// Without a config: console only, kDefaultFormat, PerLine prefixes. Never throws.
// With a config: a file under the current working directory, optionally echoed to
// stdout. Throws ConfigError or FilesystemError; nothing is returned on failure.
// origin is the call site recorded in Frozen prefixes; it defaults to the caller.
Logger NewLogger(const std::optional<LoggerConfig>& config = std::nullopt,
                 const SourceLocation& origin = SourceLocation::Current());

// Same as NewLogger with an explicit working directory instead of getcwd(3).
Logger NewLoggerAt(const std::string& working_dir, const std::optional<LoggerConfig>& config,
                   const SourceLocation& origin = SourceLocation::Current());

}  // namespace lvl_logger

#define LVL_NEW_LOGGER(config) ::lvl_logger::NewLogger(config, LVL_LOG_CURRENT_LOCATION())
#define LVL_NEW_LOGGER_AT(working_dir, config) \
  ::lvl_logger::NewLoggerAt(working_dir, config, LVL_LOG_CURRENT_LOCATION())
