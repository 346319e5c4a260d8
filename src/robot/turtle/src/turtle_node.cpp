#include "turtle_node.hpp"

#include <chrono>
#include <cmath>
#include <stdexcept>
#include <string>

TurtleNode::TurtleNode(const rclcpp::NodeOptions& options)
: rclcpp::Node("run_turtle", options),
  config_(loadConfig()),
  frames_(get_logger(), config_.world_frame, config_.odom_frame, config_.base_frame),
  goals_(get_logger(),
         turtle_brick::GoalPose{config_.world_target_x - config_.world_odom.dx,
                                config_.world_target_y - config_.world_odom.dy}),
  scheduler_(get_logger(), config_, goals_, frames_)
{
  // Static broadcasters publish on /tf_static, latched, so once is enough
  static_broadcaster_ = std::make_unique<tf2_ros::StaticTransformBroadcaster>(this);
  broadcaster_ = std::make_unique<tf2_ros::TransformBroadcaster>(this);

  frames_.setStaticOffset(config_.world_odom, now());
  static_broadcaster_->sendTransform(frames_.staticTransform());

  // inputs may land while a tick is running
  tick_group_ = create_callback_group(rclcpp::CallbackGroupType::MutuallyExclusive);
  input_group_ = create_callback_group(rclcpp::CallbackGroupType::MutuallyExclusive);
  rclcpp::SubscriptionOptions input_opts;
  input_opts.callback_group = input_group_;

  pub_joints_ = create_publisher<JointState>("/joint_states", rclcpp::QoS(10));
  pub_odom_ = create_publisher<Odometry>("/odom", rclcpp::QoS(10));
  pub_cmd_ = create_publisher<Twist>("cmd_vel", rclcpp::QoS(10));

  sub_goal_ = create_subscription<PoseStamped>(
      "/goal_pose", rclcpp::QoS(10),
      std::bind(&TurtleNode::onGoal, this, std::placeholders::_1), input_opts);

  sub_pose_ = create_subscription<TurtlePose>(
      "turtle1/pose", rclcpp::QoS(10),
      std::bind(&TurtleNode::onPose, this, std::placeholders::_1), input_opts);

  sub_tilt_ = create_subscription<TiltMsg>(
      "tilt", rclcpp::QoS(10),
      std::bind(&TurtleNode::onTilt, this, std::placeholders::_1), input_opts);

  const auto period = std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::duration<double>(config_.motion.dt()));
  timer_ = create_wall_timer(period, std::bind(&TurtleNode::onTick, this), tick_group_);

  scheduler_.start();
}

turtle_brick::TurtleConfig TurtleNode::loadConfig() {
  turtle_brick::TurtleConfig cfg;

  cfg.motion.frequency_hz = declare_parameter<double>("frequency", cfg.motion.frequency_hz);
  cfg.motion.wheel_radius = declare_parameter<double>("wheel_radius", cfg.motion.wheel_radius);
  cfg.motion.wheel_omega = declare_parameter<double>("wheel_omega", cfg.motion.wheel_omega);
  cfg.motion.swivel_omega = declare_parameter<double>("swivel_omega", cfg.motion.swivel_omega);

  cfg.world_odom.dx = declare_parameter<double>("world_odom_x", cfg.world_odom.dx);
  cfg.world_odom.dy = declare_parameter<double>("world_odom_y", cfg.world_odom.dy);
  cfg.world_odom.dz = declare_parameter<double>("world_odom_z", cfg.world_odom.dz);

  cfg.world_target_x = declare_parameter<double>("world_target_x", cfg.world_target_x);
  cfg.world_target_y = declare_parameter<double>("world_target_y", cfg.world_target_y);

  cfg.rotate_base_with_heading =
      declare_parameter<bool>("rotate_base_with_heading", cfg.rotate_base_with_heading);

  const auto& m = cfg.motion;
  if (!std::isfinite(m.frequency_hz) || m.frequency_hz <= 0.0) {
    throw std::invalid_argument("frequency must be positive, got " + std::to_string(m.frequency_hz));
  }
  if (!std::isfinite(m.wheel_radius) || m.wheel_radius <= 0.0) {
    throw std::invalid_argument("wheel_radius must be positive, got " + std::to_string(m.wheel_radius));
  }
  if (!std::isfinite(m.wheel_omega) || !std::isfinite(m.swivel_omega)) {
    throw std::invalid_argument("wheel_omega and swivel_omega must be finite");
  }
  const auto& o = cfg.world_odom;
  if (!std::isfinite(o.dx) || !std::isfinite(o.dy) || !std::isfinite(o.dz) ||
      !std::isfinite(cfg.world_target_x) || !std::isfinite(cfg.world_target_y)) {
    throw std::invalid_argument("world_odom_* and world_target_* must be finite");
  }

  RCLCPP_INFO(get_logger(), "rate=%.1fHz radius=%.4fm wheel_omega=%.3frad/s target=(%.2f, %.2f)",
              m.frequency_hz, m.wheel_radius, m.wheel_omega,
              cfg.world_target_x, cfg.world_target_y);
  return cfg;
}

void TurtleNode::shutdown() {
  if (timer_) timer_->cancel();
  scheduler_.stop();
}

//goal arrives in odom unless it says world
void TurtleNode::onGoal(const PoseStamped::SharedPtr msg) {
  const auto& p = msg->pose.position;
  if (msg->header.frame_id == frames_.worldFrame()) {
    const auto g = frames_.toWorking(p.x, p.y);
    goals_.updateGoal(g.x, g.y);
  } else {
    goals_.updateGoal(p.x, p.y);
  }
}

// Stored only, the control law steers by bearing alone
void TurtleNode::onPose(const TurtlePose::SharedPtr msg) {
  goals_.updatePose(turtle_brick::Pose2D{msg->x, msg->y, msg->theta});
}

void TurtleNode::onTilt(const TiltMsg::SharedPtr msg) {
  goals_.updateTilt(msg->tilt_angle);
}

void TurtleNode::onTick() {
  auto snap = scheduler_.tick(now());
  if (!snap) return;

  // one bundle per tick, all from the same state
  pub_joints_->publish(snap->joints);
  broadcaster_->sendTransform(snap->odom_base);
  pub_odom_->publish(snap->odometry);
  pub_cmd_->publish(snap->cmd_vel);

  RCLCPP_DEBUG_THROTTLE(get_logger(), *get_clock(), 1000,
                        "pose (%.3f, %.3f) heading %.3f",
                        snap->odometry.pose.pose.position.x,
                        snap->odometry.pose.pose.position.y,
                        snap->joints.position[1]);
}
