#include "tick_scheduler.hpp"

namespace turtle_brick {

geometry_msgs::msg::Twist turtleTwist(double xdot, double ydot, double omega) {
  geometry_msgs::msg::Twist twist;
  twist.linear.x = xdot;
  twist.linear.y = ydot;
  twist.linear.z = 0.0;
  twist.angular.x = 0.0;
  twist.angular.y = 0.0;
  twist.angular.z = omega;
  return twist;
}

const char* toString(TickScheduler::State s) noexcept {
  switch (s) {
    case TickScheduler::State::Idle:    return "Idle";
    case TickScheduler::State::Running: return "Running";
    case TickScheduler::State::Stopped: return "Stopped";
  }
  return "Unknown";
}

TickScheduler::TickScheduler(const rclcpp::Logger& logger, const TurtleConfig& config,
                             GoalTracker& goals, FrameTree& frames)
  : logger_(logger),
    motion_(logger, config.motion),
    goals_(goals),
    frames_(frames),
    rotate_base_with_heading_(config.rotate_base_with_heading) {
  // starts at the odom origin facing +x, already rolling
  robot_.velocity = motion_.velocityFor(robot_.pose.theta);
}

bool TickScheduler::start() {
  std::lock_guard<std::mutex> lock(tick_mtx_);
  if (state_ != State::Idle) {
    RCLCPP_WARN(logger_, "start() ignored, scheduler is %s", toString(state_));
    return false;
  }
  state_ = State::Running;
  RCLCPP_INFO(logger_, "Tick scheduler running at %.1f Hz", 1.0 / motion_.dt());
  return true;
}

void TickScheduler::stop() {
  std::lock_guard<std::mutex> lock(tick_mtx_);
  if (state_ == State::Stopped) return;
  state_ = State::Stopped;
  RCLCPP_INFO(logger_, "Tick scheduler stopped after %lu ticks",
              static_cast<unsigned long>(ticks_));
}

std::optional<TickSnapshot> TickScheduler::tick(const rclcpp::Time& stamp) {
  std::lock_guard<std::mutex> lock(tick_mtx_);
  if (state_ != State::Running) return std::nullopt;

  const GoalPose goal = goals_.goal();
  const double tilt = goals_.tilt();
  motion_.step(robot_, goal, tilt);

  TickSnapshot snap = buildSnapshot(stamp);
  frames_.setOdomToBase(snap.odom_base);
  ++ticks_;
  return snap;
}

TickSnapshot TickScheduler::buildSnapshot(const rclcpp::Time& stamp) {
  TickSnapshot snap;
  const double base_yaw = rotate_base_with_heading_ ? robot_.pose.theta : 0.0;

  snap.joints.header.stamp = stamp;
  snap.joints.name = {"wheel_axle", "swivel", "tip"};
  snap.joints.position = {robot_.wheel_pos, robot_.pose.theta, robot_.tilt};

  snap.odom_base = frames_.currentOdomToBase(robot_.pose, base_yaw, stamp);

  auto& odom = snap.odometry;
  odom.header.stamp = stamp;
  odom.header.frame_id = frames_.odomFrame();
  odom.child_frame_id = frames_.baseFrame();
  odom.pose.pose.position.x = robot_.pose.x;
  odom.pose.pose.position.y = robot_.pose.y;
  odom.pose.pose.position.z = robot_.z;
  odom.pose.pose.orientation = snap.odom_base.transform.rotation;
  odom.twist.twist.linear.x = robot_.velocity.vx;
  odom.twist.twist.linear.y = robot_.velocity.vy;
  odom.twist.twist.angular.z = robot_.velocity.omega;

  snap.cmd_vel = turtleTwist(robot_.velocity.vx, robot_.velocity.vy, robot_.velocity.omega);
  return snap;
}

TickScheduler::State TickScheduler::state() const {
  std::lock_guard<std::mutex> lock(tick_mtx_);
  return state_;
}

RobotState TickScheduler::robotState() const {
  std::lock_guard<std::mutex> lock(tick_mtx_);
  return robot_;
}

std::uint64_t TickScheduler::tickCount() const {
  std::lock_guard<std::mutex> lock(tick_mtx_);
  return ticks_;
}

}
