#ifndef TURTLE_TYPES_HPP_
#define TURTLE_TYPES_HPP_

#include <string>

namespace turtle_brick {

struct Pose2D {
  double x{0.0};
  double y{0.0};
  double theta{0.0};
};

struct Velocity {
  double vx{0.0};
  double vy{0.0};
  double omega{0.0};
};

// Target position in the odom (working) frame
struct GoalPose {
  double x{0.0};
  double y{0.0};
};

// world -> odom translation, fixed once at startup
struct FrameOffset {
  double dx{0.0};
  double dy{0.0};
  double dz{0.0};
};

struct RobotState {
  Pose2D pose{};
  double z{0.0};
  double wheel_pos{0.0};   // accumulated wheel_axle rotation [rad]
  double tilt{0.0};        // tip joint
  Velocity velocity{};
};

struct MotionConfig {
  double frequency_hz{100.0};
  double wheel_radius{0.2 * 1.618};
  double wheel_omega{0.8};
  double swivel_omega{0.0};

  [[nodiscard]] double dt() const noexcept { return 1.0 / frequency_hz; }
};

struct TurtleConfig {
  MotionConfig motion{};
  FrameOffset world_odom{5.55, 5.55, 0.0};
  double world_target_x{9.0};
  double world_target_y{7.0};
  bool rotate_base_with_heading{false};

  std::string world_frame{"world"};
  std::string odom_frame{"odom"};
  std::string base_frame{"base_link"};
};

}

#endif
