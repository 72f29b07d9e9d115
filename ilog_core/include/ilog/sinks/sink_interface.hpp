#pragma once
#include <memory>
#include <string>

#include "../flatteners/flattener_interface.hpp"
#include "../log_level.hpp"
#include "../log_record.hpp"

namespace ilog
{

class ISink
{
 public:
  virtual ~ISink() = default;

  // Deliver one finished record; record.message already carries every
  // decoration. Must not let I/O errors escape.
  virtual void Emit(const LogRecord& record) = 0;

  // Make previously emitted output durable
  virtual void Flush() = 0;

  // Configure before the sink is shared with a Logger; not synchronized.
  void SetFlattener(std::shared_ptr<const IFlattener> flattener)
  {
    flattener_ = std::move(flattener);
  }

  // Per-sink minimum level, independent of the configuration level
  void SetLevel(LogLevel level) { min_level_ = level; }

  LogLevel Level() const { return min_level_; }

  bool ShouldLog(LogLevel record_level) const
  {
    return min_level_ != LogLevel::None && record_level >= min_level_;
  }

 protected:
  std::shared_ptr<const IFlattener> flattener_;
  LogLevel min_level_ = LogLevel::All;

  // Without a flattener the bare message is the line
  std::string DoFlatten(const LogRecord& record) const
  {
    if (flattener_)
    {
      return flattener_->Flatten(record.wall_clock_ns, record.level, record.tag, record.message);
    }
    return record.message;
  }
};

}  // namespace ilog
