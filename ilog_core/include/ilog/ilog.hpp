#pragma once
#include <atomic>
#include <memory>
#include <vector>

#include "log_configuration.hpp"
#include "log_level.hpp"
#include "logger.hpp"
#include "sinks/sink_interface.hpp"

namespace ilog
{

// Process-wide convenience wrapper around one Logger.
class ILog
{
 public:
  // Throws std::invalid_argument for a null config. Calling Init again
  // reports a warning and replaces the previous logger. No sinks means a
  // single ConsoleSink.
  static void Init(std::shared_ptr<const LogConfiguration> config,
                   std::vector<std::shared_ptr<ISink>> sinks = {});
  static void Init(LogLevel level, std::vector<std::shared_ptr<ISink>> sinks = {});

  static bool IsInitialized();

  // Throws std::logic_error before Init
  static std::shared_ptr<Logger> Get();

  // Flushes and drops the current logger
  static void Shutdown();

  ILog() = delete;
};

}  // namespace ilog

// ===== Logging macros =====

#define ILOG_CALL(lvl, ...)                                                   \
  do                                                                          \
  {                                                                           \
    constexpr auto _ilog_lvl = ::ilog::LogLevel::lvl;                         \
    if (static_cast<int>(_ilog_lvl) >= ILOG_ACTIVE_LEVEL)                     \
    {                                                                         \
      auto _ilog_logger = ::ilog::ILog::Get();                                \
      if (_ilog_logger->IsLoggable(_ilog_lvl))                                \
      {                                                                       \
        _ilog_logger->Logf(_ilog_lvl, __VA_ARGS__);                           \
      }                                                                       \
    }                                                                         \
  } while (0)

#define ILOG_V(...) ILOG_CALL(Verbose, __VA_ARGS__)
#define ILOG_D(...) ILOG_CALL(Debug, __VA_ARGS__)
#define ILOG_I(...) ILOG_CALL(Info, __VA_ARGS__)
#define ILOG_W(...) ILOG_CALL(Warn, __VA_ARGS__)
#define ILOG_E(...) ILOG_CALL(Error, __VA_ARGS__)
#define ILOG_A(...) ILOG_CALL(Assert, __VA_ARGS__)

#define ILOG_I_IF(cond, ...) \
  do                         \
  {                          \
    if (cond)                \
    {                        \
      ILOG_I(__VA_ARGS__);   \
    }                        \
  } while (0)
#define ILOG_W_IF(cond, ...) \
  do                         \
  {                          \
    if (cond)                \
    {                        \
      ILOG_W(__VA_ARGS__);   \
    }                        \
  } while (0)
#define ILOG_E_IF(cond, ...) \
  do                         \
  {                          \
    if (cond)                \
    {                        \
      ILOG_E(__VA_ARGS__);   \
    }                        \
  } while (0)

#define ILOG_ONCE(lvl, ...)                                           \
  do                                                                  \
  {                                                                   \
    static std::atomic<bool> _ilog_logged{false};                     \
    if (!_ilog_logged.exchange(true, std::memory_order_relaxed))      \
    {                                                                 \
      ILOG_CALL(lvl, __VA_ARGS__);                                    \
    }                                                                 \
  } while (0)
