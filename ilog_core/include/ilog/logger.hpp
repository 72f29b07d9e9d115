#pragma once
#include <exception>
#include <memory>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "log_configuration.hpp"
#include "log_level.hpp"
#include "log_record.hpp"
#include "sink_set.hpp"

namespace ilog
{

// Runs the pipeline synchronously on the calling thread:
// level gate -> record -> interceptors -> decoration -> sinks.
class Logger
{
 public:
  // Throws std::invalid_argument when config is null
  Logger(std::shared_ptr<const LogConfiguration> config, SinkSet sinks);

  const LogConfiguration& Config() const { return *config_; }
  const SinkSet& Sinks() const { return sinks_; }

  bool IsLoggable(LogLevel level) const { return config_->IsLoggable(level); }

  void Log(LogLevel level, std::string message);
  void Log(LogLevel level, std::string message, std::exception_ptr error);

  // Positional {} arguments, formatted only when the level passes the gate
  template <typename... Args>
  void Logf(LogLevel level, fmt::format_string<Args...> fmt_str, Args&&... args)
  {
    if (!IsLoggable(level))
    {
      return;
    }
    Log(level, fmt::format(fmt_str, std::forward<Args>(args)...));
  }

  void Verbose(std::string message) { Log(LogLevel::Verbose, std::move(message)); }
  void Debug(std::string message) { Log(LogLevel::Debug, std::move(message)); }
  void Info(std::string message) { Log(LogLevel::Info, std::move(message)); }
  void Warn(std::string message) { Log(LogLevel::Warn, std::move(message)); }
  void Error(std::string message) { Log(LogLevel::Error, std::move(message)); }
  void Assert(std::string message) { Log(LogLevel::Assert, std::move(message)); }

  void Error(std::string message, std::exception_ptr error)
  {
    Log(LogLevel::Error, std::move(message), std::move(error));
  }
  void Warn(std::string message, std::exception_ptr error)
  {
    Log(LogLevel::Warn, std::move(message), std::move(error));
  }

  void Flush() { sinks_.Flush(); }

 private:
  std::shared_ptr<const LogConfiguration> config_;
  SinkSet sinks_;

  LogRecord MakeRecord(LogLevel level, std::string message, std::exception_ptr error) const;
  std::string CollectStackTrace() const;
  std::string AssembleMessage(const LogRecord& record) const;
};

}  // namespace ilog
