#pragma once
#include <functional>

#include "sink_interface.hpp"

namespace lvl_logger
{

class CallbackSink : public ILogSink
{
 public:
  using Callback = std::function<void(std::string_view)>;

  explicit CallbackSink(Callback cb);

  void Write(std::string_view line) override;
  void Flush() override;

 private:
  Callback callback_;
};

}  // namespace lvl_logger
