#pragma once
#include <rcutils/logging.h>

#include <ilog/sinks/sink_interface.hpp>
#include <rclcpp/rclcpp.hpp>

namespace ilog
{
namespace ros2
{

// Platform log sink: forwards records to the node's rcutils logger, which
// stamps its own time and severity.
class Ros2Sink : public ilog::ISink
{
 public:
  explicit Ros2Sink(rclcpp::Logger logger);

  void Emit(const LogRecord& record) override;
  void Flush() override;

  static int MapLevel(LogLevel level);

 private:
  rclcpp::Logger ros_logger_;
};

}  // namespace ros2
}  // namespace ilog
