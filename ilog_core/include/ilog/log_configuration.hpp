#pragma once
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "interceptor.hpp"
#include "log_level.hpp"
#include "platform.hpp"

namespace ilog
{

using ThreadFormatter = std::function<std::string()>;
// Frames of the calling thread, innermost first
using StackTraceProvider = std::function<std::vector<std::string>()>;
using StackTraceFormatter = std::function<std::string(const std::vector<std::string>& frames)>;
using ThrowableFormatter = std::function<std::string(const std::exception_ptr& error)>;
using BorderFormatter = std::function<std::string(const std::vector<std::string>& segments)>;

// Immutable once built; shared between loggers as shared_ptr<const>.
struct LogConfiguration
{
  class Builder;

  LogLevel level = LogLevel::All;
  std::string tag = ILOG_DEFAULT_TAG;

  bool with_thread_info = false;
  ThreadFormatter thread_formatter;

  bool with_stack_trace = false;
  // Frames up to and including the last one containing this text are skipped
  std::string stack_trace_origin;
  // 0 keeps every remaining frame
  size_t stack_trace_depth = ILOG_DEFAULT_STACK_TRACE_DEPTH;
  StackTraceProvider stack_trace_provider;
  StackTraceFormatter stack_trace_formatter;

  bool with_border = false;
  BorderFormatter border_formatter;

  ThrowableFormatter throwable_formatter;

  InterceptorChain interceptors;

  // All and None are thresholds, never the level of a record
  bool IsLoggable(LogLevel record_level) const
  {
    return record_level != LogLevel::All && record_level != LogLevel::None &&
           level != LogLevel::None && record_level >= level;
  }
};

class LogConfiguration::Builder
{
 public:
  Builder() = default;

  Builder& Level(LogLevel level);
  Builder& Tag(std::string tag);

  Builder& EnableThreadInfo();
  Builder& DisableThreadInfo();
  Builder& ThreadFormatterFn(ThreadFormatter formatter);

  Builder& EnableStackTrace(size_t depth);
  Builder& EnableStackTrace(std::string origin, size_t depth);
  Builder& DisableStackTrace();
  Builder& StackTraceProviderFn(StackTraceProvider provider);
  Builder& StackTraceFormatterFn(StackTraceFormatter formatter);

  Builder& EnableBorder();
  Builder& DisableBorder();
  Builder& BorderFormatterFn(BorderFormatter formatter);

  Builder& ThrowableFormatterFn(ThrowableFormatter formatter);

  Builder& AddInterceptor(Interceptor interceptor);

  // Unset formatters fall back to the defaults in default_formatters.hpp
  std::shared_ptr<const LogConfiguration> Build() const;

 private:
  LogConfiguration config_;
  std::vector<Interceptor> interceptors_;
};

}  // namespace ilog
