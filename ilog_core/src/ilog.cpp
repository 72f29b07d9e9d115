#include "ilog/ilog.hpp"

#include <mutex>
#include <stdexcept>

#include "ilog/diagnostics.hpp"
#include "ilog/sinks/console_sink.hpp"

namespace ilog
{

namespace
{

std::mutex& GlobalMutex()
{
  static std::mutex m;
  return m;
}

std::shared_ptr<Logger>& GlobalLogger()
{
  static std::shared_ptr<Logger> logger;
  return logger;
}

}  // namespace

void ILog::Init(std::shared_ptr<const LogConfiguration> config,
                std::vector<std::shared_ptr<ISink>> sinks)
{
  if (!config)
  {
    throw std::invalid_argument("ILog::Init requires a LogConfiguration");
  }
  if (sinks.empty())
  {
    sinks.push_back(std::make_shared<ConsoleSink>());
  }

  auto logger = std::make_shared<Logger>(std::move(config), SinkSet(std::move(sinks)));

  std::lock_guard<std::mutex> lock(GlobalMutex());
  if (GlobalLogger())
  {
    diagnostics::Report("ILog", "ILog is already initialized, do not initialize again");
  }
  GlobalLogger() = std::move(logger);
}

void ILog::Init(LogLevel level, std::vector<std::shared_ptr<ISink>> sinks)
{
  Init(LogConfiguration::Builder().Level(level).Build(), std::move(sinks));
}

bool ILog::IsInitialized()
{
  std::lock_guard<std::mutex> lock(GlobalMutex());
  return GlobalLogger() != nullptr;
}

std::shared_ptr<Logger> ILog::Get()
{
  std::lock_guard<std::mutex> lock(GlobalMutex());
  if (!GlobalLogger())
  {
    throw std::logic_error("ILog is not initialized, call ILog::Init first");
  }
  return GlobalLogger();
}

void ILog::Shutdown()
{
  std::shared_ptr<Logger> logger;
  {
    std::lock_guard<std::mutex> lock(GlobalMutex());
    logger = std::move(GlobalLogger());
    GlobalLogger().reset();
  }
  if (logger)
  {
    logger->Flush();
  }
}

}  // namespace ilog
