#ifndef TICK_SCHEDULER_HPP_
#define TICK_SCHEDULER_HPP_

#include <cstdint>
#include <mutex>
#include <optional>

#include "rclcpp/rclcpp.hpp"
#include "geometry_msgs/msg/transform_stamped.hpp"
#include "geometry_msgs/msg/twist.hpp"
#include "nav_msgs/msg/odometry.hpp"
#include "sensor_msgs/msg/joint_state.hpp"

#include "frame_tree.hpp"
#include "goal_tracker.hpp"
#include "motion_model.hpp"
#include "turtle_types.hpp"

namespace turtle_brick {

// Planar twist for the turtle: linear (xdot, ydot, 0), angular (0, 0, omega)
[[nodiscard]] geometry_msgs::msg::Twist turtleTwist(double xdot, double ydot, double omega);

// Everything one tick publishes, built from the same post-update state
struct TickSnapshot {
  sensor_msgs::msg::JointState joints;
  nav_msgs::msg::Odometry odometry;
  geometry_msgs::msg::Twist cmd_vel;
  geometry_msgs::msg::TransformStamped odom_base;
};

class TickScheduler {
public:
  enum class State { Idle, Running, Stopped };

  TickScheduler(const rclcpp::Logger& logger, const TurtleConfig& config,
                GoalTracker& goals, FrameTree& frames);

  // Idle -> Running. False from any other state.
  bool start();

  // Advances the robot once and returns the outputs. Empty unless Running.
  [[nodiscard]] std::optional<TickSnapshot> tick(const rclcpp::Time& stamp);

  // Any state -> Stopped. Waits for an in-flight tick to finish.
  void stop();

  [[nodiscard]] State state() const;
  [[nodiscard]] RobotState robotState() const;
  [[nodiscard]] std::uint64_t tickCount() const;

private:
  rclcpp::Logger logger_;
  MotionModel motion_;
  GoalTracker& goals_;
  FrameTree& frames_;
  bool rotate_base_with_heading_;

  mutable std::mutex tick_mtx_;
  State state_{State::Idle};
  RobotState robot_{};
  std::uint64_t ticks_{0};

  [[nodiscard]] TickSnapshot buildSnapshot(const rclcpp::Time& stamp);
};

const char* toString(TickScheduler::State s) noexcept;

}

#endif
