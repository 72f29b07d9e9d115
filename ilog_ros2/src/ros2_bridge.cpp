#include "ilog_ros2/ros2_bridge.hpp"

#include <ilog/ilog.hpp>
#include <ilog/sinks/console_sink.hpp>
#include <ilog/sinks/file_sink.hpp>
#include <memory>
#include <string>
#include <vector>

#include "ilog_ros2/ros2_sink.hpp"

namespace ilog
{
namespace ros2
{

void Init(rclcpp::Node::SharedPtr node, const BridgeConfig& config)
{
  std::vector<std::shared_ptr<ISink>> sinks;

  if (config.enable_ros2_sink)
  {
    sinks.push_back(std::make_shared<Ros2Sink>(node->get_logger()));
  }

  if (config.enable_console)
  {
    sinks.push_back(std::make_shared<ConsoleSink>());
  }

  if (config.enable_file)
  {
    FileSinkOptions options;
    options.folder = config.file_folder;
    options.file_name_policy = FileNamePolicy::Changeless(std::string(node->get_name()) + ".log");
    options.backup_policy = BackupPolicy::FileSize(config.max_file_size, config.max_backup_index);
    sinks.push_back(std::make_shared<FileSink>(std::move(options)));
  }

  auto log_config =
      LogConfiguration::Builder().Level(config.level).Tag(node->get_name()).Build();
  ILog::Init(std::move(log_config), std::move(sinks));
}

void Shutdown() { ILog::Shutdown(); }

}  // namespace ros2
}  // namespace ilog
