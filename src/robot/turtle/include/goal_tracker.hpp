#ifndef GOAL_TRACKER_HPP_
#define GOAL_TRACKER_HPP_

#include <mutex>
#include <optional>

#include "rclcpp/rclcpp.hpp"
#include "turtle_types.hpp"

namespace turtle_brick {

// Latest externally supplied goal, observed pose and tilt command.
// Writers are subscription callbacks, the reader is the tick; every value is
// written and read whole under one lock. Last write wins.
class GoalTracker {
public:
  GoalTracker(const rclcpp::Logger& logger, const GoalPose& default_goal);

  // Non-finite values are rejected and the previous value kept.
  bool updateGoal(double x, double y);
  bool updatePose(const Pose2D& pose);
  bool updateTilt(double angle);

  [[nodiscard]] GoalPose goal() const;
  [[nodiscard]] double tilt() const;
  [[nodiscard]] std::optional<Pose2D> observedPose() const;

private:
  rclcpp::Logger logger_;
  mutable std::mutex mtx_;

  GoalPose goal_;
  double tilt_{0.0};
  std::optional<Pose2D> observed_pose_{};
};

}

#endif
