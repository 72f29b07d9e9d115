#pragma once
#include <string>

#include "../platform.hpp"
#include "sink_interface.hpp"

#if defined(ILOG_PLATFORM_POSIX)

#include <syslog.h>

namespace ilog
{

// Platform log sink for POSIX hosts. Lines default to "<tag>: <message>",
// syslogd stamps its own time.
//
// openlog() is process-global: the ident of the most recently constructed
// SyslogSink wins.
class SyslogSink : public ISink
{
 public:
  explicit SyslogSink(const std::string& ident, int facility = LOG_USER);
  ~SyslogSink() override;

  SyslogSink(const SyslogSink&) = delete;
  SyslogSink& operator=(const SyslogSink&) = delete;

  void Emit(const LogRecord& record) override;
  void Flush() override;

  static int ToPriority(LogLevel level);
};

}  // namespace ilog

#endif
