#include <exception>
#include <memory>

#include "turtle_node.hpp"

int main(int argc, char** argv)
{
  rclcpp::init(argc, argv);

  std::shared_ptr<TurtleNode> node;
  try {
    node = std::make_shared<TurtleNode>();
  } catch (const std::exception& e) {
    RCLCPP_FATAL(rclcpp::get_logger("run_turtle"), "Failed to start: %s", e.what());
    rclcpp::shutdown();
    return 1;
  }

  std::weak_ptr<TurtleNode> weak = node;
  rclcpp::on_shutdown([weak]() {
    if (auto n = weak.lock()) n->shutdown();
  });

  rclcpp::executors::MultiThreadedExecutor exec;
  exec.add_node(node);
  exec.spin();
  rclcpp::shutdown();
  return 0;
}
