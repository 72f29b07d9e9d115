#include <ilog/ilog.hpp>
#include <ilog_ros2/ros2_bridge.hpp>
#include <rclcpp/rclcpp.hpp>
#include <std_msgs/msg/string.hpp>

class ExampleNode : public rclcpp::Node
{
 public:
  ExampleNode() : Node("example_logger_node") {}

  void Setup()
  {
    ilog::ros2::BridgeConfig config;
    config.level = ilog::LogLevel::Verbose;
    config.enable_ros2_sink = true;
    config.enable_console = true;
    config.enable_file = true;
    config.file_folder = "/tmp/robot_logs/";
    ilog::ros2::Init(shared_from_this(), config);

    sub_ = create_subscription<std_msgs::msg::String>(
        "/chatter", 10, std::bind(&ExampleNode::OnChatter, this, std::placeholders::_1));

    timer_ = create_wall_timer(std::chrono::seconds(2), std::bind(&ExampleNode::OnTimer, this));

    ILOG_I("node initialized, waiting for messages on /chatter");
  }

  ~ExampleNode() override { ilog::ros2::Shutdown(); }

 private:
  void OnChatter(const std::shared_ptr<const std_msgs::msg::String>& msg)
  {
    ILOG_D("received: {}", msg->data);
    ILOG_W_IF(msg->data.empty(), "empty message received");
  }

  void OnTimer()
  {
    static int count = 0;
    ++count;
    ILOG_V("heartbeat count: {}", count);
  }

  rclcpp::Subscription<std_msgs::msg::String>::SharedPtr sub_;
  rclcpp::TimerBase::SharedPtr timer_;
};

int main(int argc, char** argv)
{
  rclcpp::init(argc, argv);

  auto node = std::make_shared<ExampleNode>();
  node->Setup();

  rclcpp::spin(node);

  rclcpp::shutdown();
  return 0;
}
