#ifndef MOTION_MODEL_HPP_
#define MOTION_MODEL_HPP_

#include "rclcpp/rclcpp.hpp"
#include "turtle_types.hpp"

namespace turtle_brick {

// Constant-speed kinematics toward a single goal point. The heading is the
// straight-line bearing to the goal, recomputed every step, never integrated.
class MotionModel {
public:
  MotionModel(const rclcpp::Logger& logger, const MotionConfig& config);

  // One integration step of length dt. Position moves with the velocity of
  // the previous heading, then heading and velocity are refreshed.
  void step(RobotState& state, const GoalPose& goal, double tilt) const;

  // Point heading and velocity at the goal without moving
  void aimAt(RobotState& state, const GoalPose& goal) const;

  // atan2(dy, dx) in (-pi, pi]; a goal on top of the robot gives 0
  [[nodiscard]] static double bearing(const Pose2D& from, const GoalPose& goal) noexcept;

  [[nodiscard]] Velocity velocityFor(double heading) const noexcept;
  [[nodiscard]] double linearSpeed() const noexcept { return config_.wheel_radius * config_.wheel_omega; }
  [[nodiscard]] double dt() const noexcept { return dt_; }

private:
  rclcpp::Logger logger_;
  MotionConfig config_;
  double dt_;
};

}

#endif
