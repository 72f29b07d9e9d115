#include "ilog/sinks/syslog_sink.hpp"

#if defined(ILOG_PLATFORM_POSIX)

#include <cstring>
#include <mutex>

#include "ilog/flatteners/pattern_flattener.hpp"

namespace ilog
{

namespace
{

// glibc keeps the pointer handed to openlog(), so the ident lives in static
// storage rather than in any one sink.
constexpr size_t kMaxIdentLen = 64;

char* GlobalIdent()
{
  static char buf[kMaxIdentLen] = {};
  return buf;
}

std::mutex& SyslogMutex()
{
  static std::mutex m;
  return m;
}

int& OpenCount()
{
  static int count = 0;
  return count;
}

}  // namespace

SyslogSink::SyslogSink(const std::string& ident, int facility)
{
  flattener_ = std::make_shared<PatternFlattener>("{t}: {m}");

  std::lock_guard<std::mutex> lock(SyslogMutex());
  std::strncpy(GlobalIdent(), ident.c_str(), kMaxIdentLen - 1);
  GlobalIdent()[kMaxIdentLen - 1] = '\0';
  ::openlog(GlobalIdent(), LOG_PID | LOG_NDELAY, facility);
  ++OpenCount();
}

SyslogSink::~SyslogSink()
{
  std::lock_guard<std::mutex> lock(SyslogMutex());
  if (--OpenCount() == 0)
  {
    ::closelog();
  }
}

void SyslogSink::Emit(const LogRecord& record)
{
  if (!ShouldLog(record.level))
  {
    return;
  }

  std::string line = DoFlatten(record);
  std::lock_guard<std::mutex> lock(SyslogMutex());
  ::syslog(ToPriority(record.level), "%s", line.c_str());
}

void SyslogSink::Flush() {}

int SyslogSink::ToPriority(LogLevel level)
{
  switch (level)
  {
    case LogLevel::Verbose:
    case LogLevel::Debug:
      return LOG_DEBUG;
    case LogLevel::Info:
      return LOG_INFO;
    case LogLevel::Warn:
      return LOG_WARNING;
    case LogLevel::Error:
      return LOG_ERR;
    case LogLevel::Assert:
      return LOG_CRIT;
    default:
      return LOG_INFO;
  }
}

}  // namespace ilog

#endif
