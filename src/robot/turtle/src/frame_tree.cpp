#include "frame_tree.hpp"

#include <cmath>
#include <utility>

#include "tf2/LinearMath/Quaternion.h"
#include "tf2/LinearMath/Vector3.h"

namespace turtle_brick {

geometry_msgs::msg::Quaternion angleAxisToQuaternion(
    double angle, const std::array<double, 3>& axis) {
  geometry_msgs::msg::Quaternion out;  // defaults to identity
  const double norm = std::sqrt(axis[0]*axis[0] + axis[1]*axis[1] + axis[2]*axis[2]);
  if (angle == 0.0 || norm == 0.0) return out;

  // setRotation normalizes the axis itself
  tf2::Quaternion q;
  q.setRotation(tf2::Vector3(axis[0], axis[1], axis[2]), angle);
  out.x = q.x();
  out.y = q.y();
  out.z = q.z();
  out.w = q.w();
  return out;
}

FrameTree::FrameTree(const rclcpp::Logger& logger,
                     std::string world_frame, std::string odom_frame, std::string base_frame)
  : logger_(logger),
    world_frame_(std::move(world_frame)),
    odom_frame_(std::move(odom_frame)),
    base_frame_(std::move(base_frame)) {
  odom_base_.header.frame_id = odom_frame_;
  odom_base_.child_frame_id = base_frame_;
}

bool FrameTree::setStaticOffset(const FrameOffset& offset, const rclcpp::Time& stamp) {
  if (has_static_) {
    RCLCPP_WARN(logger_, "Static transform %s->%s already set, ignoring new offset",
                world_frame_.c_str(), odom_frame_.c_str());
    return false;
  }

  offset_ = offset;
  world_odom_.header.stamp = stamp;
  world_odom_.header.frame_id = world_frame_;
  world_odom_.child_frame_id = odom_frame_;
  world_odom_.transform.translation.x = offset.dx;
  world_odom_.transform.translation.y = offset.dy;
  world_odom_.transform.translation.z = offset.dz;
  world_odom_.transform.rotation = angleAxisToQuaternion(0.0, {0.0, 0.0, 1.0});
  has_static_ = true;

  RCLCPP_INFO(logger_, "Static Transform: %s->%s (%.3f, %.3f, %.3f)",
              world_frame_.c_str(), odom_frame_.c_str(), offset.dx, offset.dy, offset.dz);
  return true;
}

geometry_msgs::msg::TransformStamped FrameTree::currentOdomToBase(
    const Pose2D& pose, double angle, const rclcpp::Time& stamp) const {
  geometry_msgs::msg::TransformStamped tf;
  tf.header.stamp = stamp;
  tf.header.frame_id = odom_frame_;
  tf.child_frame_id = base_frame_;
  tf.transform.translation.x = pose.x;
  tf.transform.translation.y = pose.y;
  tf.transform.translation.z = 0.0;
  tf.transform.rotation = angleAxisToQuaternion(angle, {0.0, 0.0, 1.0});
  return tf;
}

GoalPose FrameTree::toWorking(double world_x, double world_y) const noexcept {
  return GoalPose{world_x - offset_.dx, world_y - offset_.dy};
}

Pose2D FrameTree::toWorld(const Pose2D& pose) const noexcept {
  return Pose2D{pose.x + offset_.dx, pose.y + offset_.dy, pose.theta};
}

}
