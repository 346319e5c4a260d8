#include "goal_tracker.hpp"

#include <cmath>

namespace turtle_brick {

GoalTracker::GoalTracker(const rclcpp::Logger& logger, const GoalPose& default_goal)
  : logger_(logger), goal_(default_goal) {}

bool GoalTracker::updateGoal(double x, double y) {
  if (!std::isfinite(x) || !std::isfinite(y)) {
    RCLCPP_WARN(logger_, "Rejecting non-finite goal (%f, %f)", x, y);
    return false;
  }
  std::lock_guard<std::mutex> lock(mtx_);
  goal_ = GoalPose{x, y};
  RCLCPP_INFO(logger_, "New goal: (%.3f, %.3f)", x, y);
  return true;
}

bool GoalTracker::updatePose(const Pose2D& pose) {
  if (!std::isfinite(pose.x) || !std::isfinite(pose.y) || !std::isfinite(pose.theta)) {
    RCLCPP_WARN(logger_, "Rejecting non-finite pose observation");
    return false;
  }
  std::lock_guard<std::mutex> lock(mtx_);
  observed_pose_ = pose;
  return true;
}

bool GoalTracker::updateTilt(double angle) {
  if (!std::isfinite(angle)) {
    RCLCPP_WARN(logger_, "Rejecting non-finite tilt angle");
    return false;
  }
  std::lock_guard<std::mutex> lock(mtx_);
  tilt_ = angle;
  return true;
}

GoalPose GoalTracker::goal() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return goal_;
}

double GoalTracker::tilt() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return tilt_;
}

std::optional<Pose2D> GoalTracker::observedPose() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return observed_pose_;
}

}
