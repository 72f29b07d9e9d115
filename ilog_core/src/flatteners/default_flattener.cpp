#include "ilog/flatteners/default_flattener.hpp"

#include <fmt/format.h>

namespace ilog
{

std::string DefaultFlattener::Flatten(uint64_t wall_clock_ns, LogLevel level,
                                      std::string_view tag, std::string_view message) const
{
  return fmt::format("{}|{}|{}|{}", wall_clock_ns / 1'000'000ULL, ToShortChar(level), tag,
                     message);
}

}  // namespace ilog
