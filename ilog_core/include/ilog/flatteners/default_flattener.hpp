#pragma once
#include "flattener_interface.hpp"

namespace ilog
{

// "<epoch millis>|<L>|<tag>|<message>"
class DefaultFlattener : public IFlattener
{
 public:
  std::string Flatten(uint64_t wall_clock_ns, LogLevel level, std::string_view tag,
                      std::string_view message) const override;
};

}  // namespace ilog
