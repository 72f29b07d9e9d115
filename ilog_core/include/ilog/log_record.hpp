#pragma once
#include <cstdint>
#include <exception>
#include <string>

#include "log_level.hpp"

namespace ilog
{

// One log event. Values are never mutated once handed to the pipeline;
// interceptors derive new records through the With* helpers.
struct LogRecord
{
  uint64_t wall_clock_ns = 0;
  LogLevel level = LogLevel::Info;
  std::string tag;
  std::string message;
  std::exception_ptr error;

  // Empty unless enabled in the configuration
  std::string thread_info;
  std::string stack_trace;

  LogRecord WithTag(std::string new_tag) const
  {
    LogRecord copy = *this;
    copy.tag = std::move(new_tag);
    return copy;
  }

  LogRecord WithMessage(std::string new_message) const
  {
    LogRecord copy = *this;
    copy.message = std::move(new_message);
    return copy;
  }

  LogRecord WithLevel(LogLevel new_level) const
  {
    LogRecord copy = *this;
    copy.level = new_level;
    return copy;
  }
};

}  // namespace ilog
