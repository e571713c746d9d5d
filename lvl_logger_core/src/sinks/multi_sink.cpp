#include "lvl_logger/sinks/multi_sink.hpp"

namespace lvl_logger
{

void MultiSink::AddSink(std::unique_ptr<ILogSink> sink)
{
  if (!sink) return;
  std::lock_guard<std::mutex> lock(mutex_);
  sinks_.push_back(std::move(sink));
}

void MultiSink::Write(std::string_view line)
{
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& sink : sinks_)
  {
    sink->Write(line);
  }
}

void MultiSink::Flush()
{
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& sink : sinks_)
  {
    sink->Flush();
  }
}

size_t MultiSink::SinkCount() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return sinks_.size();
}

}  // namespace lvl_logger
