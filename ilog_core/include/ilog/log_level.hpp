#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

namespace ilog
{

// Total order; All and None are gating sentinels, never attached to a record.
enum class LogLevel : uint8_t
{
  All = 0,
  Verbose = 2,
  Debug = 3,
  Info = 4,
  Warn = 5,
  Error = 6,
  Assert = 7,
  None = 255
};

constexpr std::string_view ToString(LogLevel level)
{
  switch (level)
  {
    case LogLevel::Verbose:
      return "VERBOSE";
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warn:
      return "WARN";
    case LogLevel::Error:
      return "ERROR";
    case LogLevel::Assert:
      return "ASSERT";
    case LogLevel::All:
      return "ALL";
    case LogLevel::None:
      return "NONE";
  }
  return "UNKNOWN";
}

constexpr char ToShortChar(LogLevel level)
{
  switch (level)
  {
    case LogLevel::Verbose:
      return 'V';
    case LogLevel::Debug:
      return 'D';
    case LogLevel::Info:
      return 'I';
    case LogLevel::Warn:
      return 'W';
    case LogLevel::Error:
      return 'E';
    case LogLevel::Assert:
      return 'A';
    default:
      return '?';
  }
}

// Accepts the names produced by ToString, case-insensitive.
std::optional<LogLevel> LevelFromString(std::string_view name);

// Compile-time floor for the ILOG_* macros (inject with -DILOG_ACTIVE_LEVEL=4)
#ifndef ILOG_ACTIVE_LEVEL
#define ILOG_ACTIVE_LEVEL 0
#endif

}  // namespace ilog
