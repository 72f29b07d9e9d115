#include "ilog_ros2/ros2_sink.hpp"

namespace ilog
{
namespace ros2
{

Ros2Sink::Ros2Sink(rclcpp::Logger logger) : ros_logger_(std::move(logger)) {}

void Ros2Sink::Emit(const LogRecord& record)
{
  if (!ShouldLog(record.level))
  {
    return;
  }

  std::string line = DoFlatten(record);
  rcutils_log(nullptr, MapLevel(record.level), ros_logger_.get_name(), "%s", line.c_str());
}

void Ros2Sink::Flush() {}

int Ros2Sink::MapLevel(LogLevel level)
{
  switch (level)
  {
    case LogLevel::Verbose:
    case LogLevel::Debug:
      return RCUTILS_LOG_SEVERITY_DEBUG;
    case LogLevel::Info:
      return RCUTILS_LOG_SEVERITY_INFO;
    case LogLevel::Warn:
      return RCUTILS_LOG_SEVERITY_WARN;
    case LogLevel::Error:
      return RCUTILS_LOG_SEVERITY_ERROR;
    case LogLevel::Assert:
      return RCUTILS_LOG_SEVERITY_FATAL;
    default:
      return RCUTILS_LOG_SEVERITY_INFO;
  }
}

}  // namespace ros2
}  // namespace ilog
