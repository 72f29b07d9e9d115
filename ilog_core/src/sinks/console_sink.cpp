#include "ilog/sinks/console_sink.hpp"

#include <unistd.h>

#include <cstdio>
#include <mutex>

#include "ilog/flatteners/pattern_flattener.hpp"

namespace ilog
{

namespace
{

// stdout/stderr are process-wide; every ConsoleSink shares one lock
std::mutex& ConsoleMutex()
{
  static std::mutex m;
  return m;
}

const char* ColorForLevel(LogLevel level)
{
  switch (level)
  {
    case LogLevel::Verbose:
      return "\033[37m";
    case LogLevel::Debug:
      return "\033[36m";
    case LogLevel::Info:
      return "\033[32m";
    case LogLevel::Warn:
      return "\033[33m";
    case LogLevel::Error:
      return "\033[31m";
    case LogLevel::Assert:
      return "\033[1;31m";
    default:
      return "";
  }
}

}  // namespace

ConsoleSink::ConsoleSink(std::optional<bool> force_color)
{
  if (force_color.has_value())
  {
    use_color_ = force_color.value();
  }
  else
  {
    use_color_ = ::isatty(STDOUT_FILENO) != 0 || ::isatty(STDERR_FILENO) != 0;
  }
  flattener_ = std::make_shared<ClassicFlattener>();
}

void ConsoleSink::Emit(const LogRecord& record)
{
  if (!ShouldLog(record.level))
  {
    return;
  }

  std::string line = DoFlatten(record);
  if (use_color_)
  {
    line.insert(0, ColorForLevel(record.level));
    line += "\033[0m";
  }
  line += '\n';

  FILE* target = (record.level >= LogLevel::Warn) ? stderr : stdout;
  std::lock_guard<std::mutex> lock(ConsoleMutex());
  std::fwrite(line.data(), 1, line.size(), target);
  std::fflush(target);
}

void ConsoleSink::Flush()
{
  std::lock_guard<std::mutex> lock(ConsoleMutex());
  std::fflush(stdout);
  std::fflush(stderr);
}

}  // namespace ilog
