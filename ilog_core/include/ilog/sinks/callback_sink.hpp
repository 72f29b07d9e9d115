#pragma once
#include <functional>
#include <string>

#include "sink_interface.hpp"

namespace ilog
{

class CallbackSink : public ISink
{
 public:
  // line is the flattened record (the bare message when no flattener is set)
  using Callback = std::function<void(const LogRecord& record, const std::string& line)>;

  explicit CallbackSink(Callback cb);

  void Emit(const LogRecord& record) override;
  void Flush() override;

 private:
  Callback callback_;
};

}  // namespace ilog
