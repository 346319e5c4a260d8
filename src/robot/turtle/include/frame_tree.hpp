#ifndef FRAME_TREE_HPP_
#define FRAME_TREE_HPP_

#include <array>
#include <string>

#include "rclcpp/rclcpp.hpp"
#include "geometry_msgs/msg/quaternion.hpp"
#include "geometry_msgs/msg/transform_stamped.hpp"
#include "turtle_types.hpp"

namespace turtle_brick {

// Rotation by `angle` about `axis`: q = (cos(a/2), sin(a/2) * axis/|axis|).
// A zero angle or a zero-length axis gives the identity quaternion.
[[nodiscard]] geometry_msgs::msg::Quaternion angleAxisToQuaternion(
    double angle, const std::array<double, 3>& axis);

// Keeps the two transforms that place the robot in the world:
//   world -> odom      static, fixed offset, identity rotation
//   odom  -> base_link dynamic, rebuilt every tick
class FrameTree {
public:
  FrameTree(const rclcpp::Logger& logger,
            std::string world_frame, std::string odom_frame, std::string base_frame);

  // Accepted once. Later calls are refused and the first offset kept.
  bool setStaticOffset(const FrameOffset& offset, const rclcpp::Time& stamp);

  [[nodiscard]] const FrameOffset& staticOffset() const noexcept { return offset_; }
  [[nodiscard]] const geometry_msgs::msg::TransformStamped& staticTransform() const noexcept {
    return world_odom_;
  }

  [[nodiscard]] geometry_msgs::msg::TransformStamped currentOdomToBase(
      const Pose2D& pose, double angle, const rclcpp::Time& stamp) const;

  void setOdomToBase(const geometry_msgs::msg::TransformStamped& tf) { odom_base_ = tf; }
  [[nodiscard]] const geometry_msgs::msg::TransformStamped& odomToBase() const noexcept {
    return odom_base_;
  }

  // world <-> odom (working frame) using the static offset
  [[nodiscard]] GoalPose toWorking(double world_x, double world_y) const noexcept;
  [[nodiscard]] Pose2D toWorld(const Pose2D& pose) const noexcept;

  [[nodiscard]] const std::string& worldFrame() const noexcept { return world_frame_; }
  [[nodiscard]] const std::string& odomFrame() const noexcept { return odom_frame_; }
  [[nodiscard]] const std::string& baseFrame() const noexcept { return base_frame_; }

private:
  rclcpp::Logger logger_;
  std::string world_frame_;
  std::string odom_frame_;
  std::string base_frame_;

  FrameOffset offset_{};
  bool has_static_{false};
  geometry_msgs::msg::TransformStamped world_odom_{};
  geometry_msgs::msg::TransformStamped odom_base_{};
};

}

#endif
