#include "lvl_logger/logger.hpp"

#include <utility>

#include "lvl_logger/path_util.hpp"
#include "lvl_logger/platform.hpp"
#include "lvl_logger/sinks/console_sink.hpp"
#include "lvl_logger/sinks/file_sink.hpp"

namespace lvl_logger
{

Logger::Logger(std::shared_ptr<MultiSink> sink, FormatOptions options, PrefixMode mode,
               const SourceLocation& origin)
    : sink_(std::move(sink))
{
  writers_.reserve(kLevelCount);
  for (SeverityLevel level : kAllLevels)
  {
    writers_.emplace_back(sink_, level, options, mode, origin);
  }
}

void Logger::Flush() const { sink_->Flush(); }

Logger NewLogger(const std::optional<LoggerConfig>& config, const SourceLocation& origin)
{
  if (!config)
  {
    return NewLoggerAt(std::string(), config, origin);
  }
  return NewLoggerAt(CurrentWorkingDirectory(), config, origin);
}

Logger NewLoggerAt(const std::string& working_dir, const std::optional<LoggerConfig>& config,
                   const SourceLocation& origin)
{
  auto sink = std::make_shared<MultiSink>();

  if (!config)
  {
    sink->AddSink(std::make_unique<ConsoleSink>());
    return Logger(std::move(sink), kDefaultFormat, PrefixMode::PerLine, origin);
  }

  if (config->filename.empty())
  {
    throw ConfigError("logger config: filename is required");
  }

  std::string path = JoinPath({working_dir, config->directory, config->filename});
  MakeDirectories(DirName(path), LVL_LOG_DIR_MODE);
  std::unique_ptr<FileSink> file = FileSink::Open(path, LVL_LOG_FILE_MODE);

  if (config->echo_stdout)
  {
    sink->AddSink(std::make_unique<ConsoleSink>());
  }
  sink->AddSink(std::move(file));

  return Logger(std::move(sink), config->include, config->prefix_mode, origin);
}

}  // namespace lvl_logger
