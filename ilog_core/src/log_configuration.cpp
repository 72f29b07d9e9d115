#include "ilog/log_configuration.hpp"

#include "ilog/formatters/default_formatters.hpp"
#include "ilog/thread_info.hpp"

namespace ilog
{

using Builder = LogConfiguration::Builder;

Builder& Builder::Level(LogLevel level)
{
  config_.level = level;
  return *this;
}

Builder& Builder::Tag(std::string tag)
{
  config_.tag = std::move(tag);
  return *this;
}

Builder& Builder::EnableThreadInfo()
{
  config_.with_thread_info = true;
  return *this;
}

Builder& Builder::DisableThreadInfo()
{
  config_.with_thread_info = false;
  return *this;
}

Builder& Builder::ThreadFormatterFn(ThreadFormatter formatter)
{
  config_.thread_formatter = std::move(formatter);
  return *this;
}

Builder& Builder::EnableStackTrace(size_t depth) { return EnableStackTrace(std::string(), depth); }

Builder& Builder::EnableStackTrace(std::string origin, size_t depth)
{
  config_.with_stack_trace = true;
  config_.stack_trace_origin = std::move(origin);
  config_.stack_trace_depth = depth;
  return *this;
}

Builder& Builder::DisableStackTrace()
{
  config_.with_stack_trace = false;
  return *this;
}

Builder& Builder::StackTraceProviderFn(StackTraceProvider provider)
{
  config_.stack_trace_provider = std::move(provider);
  return *this;
}

Builder& Builder::StackTraceFormatterFn(StackTraceFormatter formatter)
{
  config_.stack_trace_formatter = std::move(formatter);
  return *this;
}

Builder& Builder::EnableBorder()
{
  config_.with_border = true;
  return *this;
}

Builder& Builder::DisableBorder()
{
  config_.with_border = false;
  return *this;
}

Builder& Builder::BorderFormatterFn(BorderFormatter formatter)
{
  config_.border_formatter = std::move(formatter);
  return *this;
}

Builder& Builder::ThrowableFormatterFn(ThrowableFormatter formatter)
{
  config_.throwable_formatter = std::move(formatter);
  return *this;
}

Builder& Builder::AddInterceptor(Interceptor interceptor)
{
  interceptors_.push_back(std::move(interceptor));
  return *this;
}

std::shared_ptr<const LogConfiguration> Builder::Build() const
{
  auto config = std::make_shared<LogConfiguration>(config_);
  config->interceptors = InterceptorChain(interceptors_);

  if (!config->thread_formatter)
  {
    config->thread_formatter = &ThreadInfo::Describe;
  }
  if (!config->stack_trace_formatter)
  {
    config->stack_trace_formatter = &FormatStackTrace;
  }
  if (!config->border_formatter)
  {
    config->border_formatter = &FormatBorder;
  }
  if (!config->throwable_formatter)
  {
    config->throwable_formatter = &FormatThrowable;
  }
  return config;
}

}  // namespace ilog
