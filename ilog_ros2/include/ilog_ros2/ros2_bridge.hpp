#pragma once
#include <cstddef>
#include <ilog/log_level.hpp>
#include <rclcpp/rclcpp.hpp>
#include <string>

namespace ilog
{
namespace ros2
{

struct BridgeConfig
{
  LogLevel level = LogLevel::All;
  bool enable_ros2_sink = true;
  bool enable_console = false;
  bool enable_file = false;
  std::string file_folder = "/tmp/robot_logs/";
  size_t max_file_size = 50 * 1024 * 1024;
  size_t max_backup_index = 5;
};

// Initializes the global ILog with the node name as tag
void Init(rclcpp::Node::SharedPtr node, const BridgeConfig& config = {});
void Shutdown();

}  // namespace ros2
}  // namespace ilog
