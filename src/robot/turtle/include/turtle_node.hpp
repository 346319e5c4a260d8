#ifndef TURTLE_NODE_HPP_
#define TURTLE_NODE_HPP_

#include <memory>

#include "rclcpp/rclcpp.hpp"
#include "geometry_msgs/msg/pose_stamped.hpp"
#include "geometry_msgs/msg/twist.hpp"
#include "nav_msgs/msg/odometry.hpp"
#include "sensor_msgs/msg/joint_state.hpp"
#include "tf2_ros/static_transform_broadcaster.h"
#include "tf2_ros/transform_broadcaster.h"
#include "turtlesim/msg/pose.hpp"
#include "turtle_brick/msg/tilt.hpp"

#include "frame_tree.hpp"
#include "goal_tracker.hpp"
#include "tick_scheduler.hpp"
#include "turtle_types.hpp"

// Drives the turtle toward /goal_pose and publishes:
//   /tf_static  world -> odom (once)
//   /tf         odom -> base_link
//   /joint_states, /odom, cmd_vel
//
// Throws std::invalid_argument on bad parameters.
class TurtleNode : public rclcpp::Node {
public:
  explicit TurtleNode(const rclcpp::NodeOptions& options = rclcpp::NodeOptions());

  // Stop ticking; safe from any thread, waits for an in-flight tick
  void shutdown();

  [[nodiscard]] const turtle_brick::TickScheduler& scheduler() const noexcept { return scheduler_; }
  [[nodiscard]] const turtle_brick::GoalTracker& goals() const noexcept { return goals_; }

private:
  //  Aliases
  using PoseStamped = geometry_msgs::msg::PoseStamped;
  using TurtlePose = turtlesim::msg::Pose;
  using TiltMsg = turtle_brick::msg::Tilt;
  using JointState = sensor_msgs::msg::JointState;
  using Odometry = nav_msgs::msg::Odometry;
  using Twist = geometry_msgs::msg::Twist;

  turtle_brick::TurtleConfig config_;
  turtle_brick::FrameTree frames_;
  turtle_brick::GoalTracker goals_;
  turtle_brick::TickScheduler scheduler_;

  rclcpp::CallbackGroup::SharedPtr tick_group_;
  rclcpp::CallbackGroup::SharedPtr input_group_;

  std::unique_ptr<tf2_ros::StaticTransformBroadcaster> static_broadcaster_;
  std::unique_ptr<tf2_ros::TransformBroadcaster> broadcaster_;

  rclcpp::Subscription<PoseStamped>::SharedPtr sub_goal_;
  rclcpp::Subscription<TurtlePose>::SharedPtr sub_pose_;
  rclcpp::Subscription<TiltMsg>::SharedPtr sub_tilt_;
  rclcpp::Publisher<JointState>::SharedPtr pub_joints_;
  rclcpp::Publisher<Odometry>::SharedPtr pub_odom_;
  rclcpp::Publisher<Twist>::SharedPtr pub_cmd_;
  rclcpp::TimerBase::SharedPtr timer_;

  turtle_brick::TurtleConfig loadConfig();

  void onGoal(const PoseStamped::SharedPtr msg);
  void onPose(const TurtlePose::SharedPtr msg);
  void onTilt(const TiltMsg::SharedPtr msg);
  void onTick();
};

#endif
