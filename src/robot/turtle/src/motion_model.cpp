#include "motion_model.hpp"

#include <cmath>

namespace turtle_brick {

namespace {
constexpr double kPi = 3.141592653589793;
}

MotionModel::MotionModel(const rclcpp::Logger& logger, const MotionConfig& config)
  : logger_(logger), config_(config), dt_(config.dt()) {}

double MotionModel::bearing(const Pose2D& from, const GoalPose& goal) noexcept {
  const double dx = goal.x - from.x;
  const double dy = goal.y - from.y;
  if (dx == 0.0 && dy == 0.0) return 0.0;
  // atan2 gives -pi for a goal straight behind with dy == -0.0; report (-pi, pi]
  const double th = std::atan2(dy, dx);
  return th <= -kPi ? kPi : th;
}

Velocity MotionModel::velocityFor(double heading) const noexcept {
  const double speed = linearSpeed();
  return Velocity{speed * std::cos(heading), speed * std::sin(heading), config_.swivel_omega};
}

void MotionModel::aimAt(RobotState& state, const GoalPose& goal) const {
  state.pose.theta = bearing(state.pose, goal);
  state.velocity = velocityFor(state.pose.theta);
}

void MotionModel::step(RobotState& state, const GoalPose& goal, double tilt) const {
  // wheel_axle turns at wheel_omega, once per tick
  state.wheel_pos += config_.wheel_omega * dt_;

  // Euler step with the previous heading's velocity
  state.pose.x += state.velocity.vx * dt_;
  state.pose.y += state.velocity.vy * dt_;

  aimAt(state, goal);
  state.tilt = tilt;

  RCLCPP_DEBUG(logger_, "x=%.4f y=%.4f theta=%.4f wheel=%.4f",
               state.pose.x, state.pose.y, state.pose.theta, state.wheel_pos);
}

}
