#include "lvl_logger/level_writer.hpp"

#include <utility>

#include "lvl_logger/formatters/prefix_builder.hpp"

namespace lvl_logger
{

LevelWriter::LevelWriter(std::shared_ptr<MultiSink> sink, SeverityLevel level,
                         FormatOptions options, PrefixMode mode, const SourceLocation& origin)
    : sink_(std::move(sink)), level_(level), options_(options), mode_(mode)
{
  if (mode_ == PrefixMode::Frozen)
  {
    prefix_ = BuildPrefix(options_, level_, origin);
  }
}

void LevelWriter::Output(std::string_view msg, const SourceLocation& loc) const
{
  Output(loc, msg);
}

void LevelWriter::Output(const SourceLocation& loc, std::string_view msg) const
{
  std::string line =
      (mode_ == PrefixMode::Frozen) ? prefix_ : BuildPrefix(options_, level_, loc);
  line.reserve(line.size() + msg.size() + 1);
  line.append(msg.data(), msg.size());
  if (msg.empty() || msg.back() != '\n')
  {
    line += '\n';
  }
  sink_->Write(line);
}

}  // namespace lvl_logger
