#include "ilog/logger.hpp"

#include <cstddef>
#include <exception>
#include <initializer_list>
#include <stdexcept>
#include <vector>

#include "ilog/diagnostics.hpp"
#include "ilog/platform.hpp"
#include "ilog/timestamp.hpp"

namespace ilog
{

Logger::Logger(std::shared_ptr<const LogConfiguration> config, SinkSet sinks)
    : config_(std::move(config)), sinks_(std::move(sinks))
{
  if (!config_)
  {
    throw std::invalid_argument("Logger requires a LogConfiguration");
  }
}

std::string Logger::CollectStackTrace() const
{
  if (!config_->stack_trace_provider)
  {
    return {};
  }

  std::vector<std::string> frames = config_->stack_trace_provider();

  // Drop the logging machinery above the origin frame
  if (!config_->stack_trace_origin.empty())
  {
    size_t skip = 0;
    for (size_t i = 0; i < frames.size(); ++i)
    {
      if (frames[i].find(config_->stack_trace_origin) != std::string::npos)
      {
        skip = i + 1;
      }
    }
    frames.erase(frames.begin(), frames.begin() + static_cast<std::ptrdiff_t>(skip));
  }

  if (config_->stack_trace_depth > 0 && frames.size() > config_->stack_trace_depth)
  {
    frames.resize(config_->stack_trace_depth);
  }
  if (frames.empty())
  {
    return {};
  }
  return config_->stack_trace_formatter(frames);
}

LogRecord Logger::MakeRecord(LogLevel level, std::string message,
                             std::exception_ptr error) const
{
  LogRecord record;
  record.wall_clock_ns = wall_clock_now_ns();
  record.level = level;
  record.tag = config_->tag;
  record.message = std::move(message);
  record.error = std::move(error);
  if (config_->with_thread_info && config_->thread_formatter)
  {
    record.thread_info = config_->thread_formatter();
  }
  if (config_->with_stack_trace)
  {
    record.stack_trace = CollectStackTrace();
  }
  return record;
}

std::string Logger::AssembleMessage(const LogRecord& record) const
{
  std::string body = record.message;
  if (record.error && config_->throwable_formatter)
  {
    if (!body.empty())
    {
      body += ILOG_LINE_SEPARATOR;
    }
    body += config_->throwable_formatter(record.error);
  }

  if (config_->with_border && config_->border_formatter)
  {
    return config_->border_formatter({record.thread_info, record.stack_trace, body});
  }

  std::string out;
  for (const std::string* part : {&record.thread_info, &record.stack_trace})
  {
    if (!part->empty())
    {
      out += *part;
      out += ILOG_LINE_SEPARATOR;
    }
  }
  out += body;
  return out;
}

void Logger::Log(LogLevel level, std::string message)
{
  Log(level, std::move(message), nullptr);
}

void Logger::Log(LogLevel level, std::string message, std::exception_ptr error)
{
  if (!IsLoggable(level))
  {
    return;
  }

  // Formatters and providers are user code; a throw drops only this record
  LogRecord record;
  try
  {
    record = MakeRecord(level, std::move(message), std::move(error));

    if (!config_->interceptors.Empty())
    {
      std::optional<LogRecord> processed = config_->interceptors.Process(record);
      if (!processed)
      {
        return;
      }
      record = std::move(*processed);
    }

    record.message = AssembleMessage(record);
  }
  catch (const std::exception& e)
  {
    diagnostics::Report("Logger",
                        fmt::format("decorating a record failed, dropped: {}", e.what()));
    return;
  }
  catch (...)
  {
    diagnostics::Report("Logger", "decorating a record failed, dropped: non-standard exception");
    return;
  }

  sinks_.Emit(record);
}

}  // namespace ilog
