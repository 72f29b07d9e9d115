#pragma once
#include <cstdint>
#include <string>
#include <string_view>

#include "../log_level.hpp"

namespace ilog
{

// Turns one record into one output line. Implementations are pure string
// assembly: same inputs, same bytes, no I/O.
class IFlattener
{
 public:
  virtual ~IFlattener() = default;
  virtual std::string Flatten(uint64_t wall_clock_ns, LogLevel level, std::string_view tag,
                              std::string_view message) const = 0;
};

}  // namespace ilog
