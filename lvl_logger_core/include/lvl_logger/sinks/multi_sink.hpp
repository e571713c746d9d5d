#pragma once
#include <memory>
#include <mutex>
#include <vector>

#include "sink_interface.hpp"

namespace lvl_logger
{

// Duplicates each line to every attached sink, in attach order.
// One lock is held for a whole fan-out so lines never interleave and all sinks see
// the same sequence.
class MultiSink : public ILogSink
{
 public:
  MultiSink() = default;

  void AddSink(std::unique_ptr<ILogSink> sink);

  void Write(std::string_view line) override;
  void Flush() override;

  size_t SinkCount() const;

 private:
  mutable std::mutex mutex_;
  std::vector<std::unique_ptr<ILogSink>> sinks_;
};

}  // namespace lvl_logger
