#include "lvl_logger/sinks/callback_sink.hpp"

namespace lvl_logger
{

CallbackSink::CallbackSink(Callback cb) : callback_(std::move(cb)) {}

void CallbackSink::Write(std::string_view line)
{
  if (callback_)
  {
    callback_(line);
  }
}

void CallbackSink::Flush() {}

}  // namespace lvl_logger
