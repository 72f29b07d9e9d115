#include "ilog/log_level.hpp"

#include <array>
#include <cctype>

namespace ilog
{

namespace
{

bool EqualsIgnoreCase(std::string_view a, std::string_view b)
{
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i)
  {
    if (std::toupper(static_cast<unsigned char>(a[i])) !=
        std::toupper(static_cast<unsigned char>(b[i])))
    {
      return false;
    }
  }
  return true;
}

constexpr std::array<LogLevel, 8> kAllLevels = {
    LogLevel::All,  LogLevel::Verbose, LogLevel::Debug,  LogLevel::Info,
    LogLevel::Warn, LogLevel::Error,   LogLevel::Assert, LogLevel::None};

}  // namespace

std::optional<LogLevel> LevelFromString(std::string_view name)
{
  for (LogLevel level : kAllLevels)
  {
    if (EqualsIgnoreCase(name, ToString(level)))
    {
      return level;
    }
  }
  return std::nullopt;
}

}  // namespace ilog
