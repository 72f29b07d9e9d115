#include "ilog/sinks/callback_sink.hpp"

namespace ilog
{

CallbackSink::CallbackSink(Callback cb) : callback_(std::move(cb)) {}

void CallbackSink::Emit(const LogRecord& record)
{
  if (!ShouldLog(record.level))
  {
    return;
  }
  if (callback_)
  {
    callback_(record, DoFlatten(record));
  }
}

void CallbackSink::Flush() {}

}  // namespace ilog
