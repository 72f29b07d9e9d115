#pragma once
#include <memory>
#include <vector>

#include "log_record.hpp"
#include "sinks/sink_interface.hpp"

namespace ilog
{

// Broadcasts a record to every sink in order. A sink that throws is reported
// and skipped; the rest still receive the record.
class SinkSet
{
 public:
  SinkSet() = default;
  explicit SinkSet(std::vector<std::shared_ptr<ISink>> sinks);

  void Add(std::shared_ptr<ISink> sink);

  void Emit(const LogRecord& record) const;
  void Flush() const;

  size_t Size() const { return sinks_.size(); }
  bool Empty() const { return sinks_.empty(); }
  const std::vector<std::shared_ptr<ISink>>& Sinks() const { return sinks_; }

 private:
  std::vector<std::shared_ptr<ISink>> sinks_;
};

}  // namespace ilog
