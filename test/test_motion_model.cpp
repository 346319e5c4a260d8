#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "motion_model.hpp"

using turtle_brick::GoalPose;
using turtle_brick::MotionConfig;
using turtle_brick::MotionModel;
using turtle_brick::Pose2D;
using turtle_brick::RobotState;

/**
 * @brief Fixture using the default turtle: r = 0.2 * 1.618, wheel 0.8 rad/s, 100 Hz.
 */
class MotionModelTest : public ::testing::Test {
protected:
  MotionConfig config{};
  MotionModel model{rclcpp::get_logger("motion_model_test"), config};

  // default goal (9, 7) in world, offset (5.55, 5.55)
  GoalPose goal{9.0 - 5.55, 7.0 - 5.55};

  RobotState initialState() const {
    RobotState s;
    s.velocity = model.velocityFor(0.0);
    return s;
  }
};

TEST_F(MotionModelTest, BearingMatchesAtan2) {
  const Pose2D from{0.4, -1.2, 0.0};
  const std::vector<GoalPose> goals = {
    {3.0, 1.0}, {-2.0, 5.0}, {-3.0, -7.0}, {0.4, 10.0}, {-5.0, -1.2}};
  for (const auto& g : goals) {
    EXPECT_NEAR(MotionModel::bearing(from, g), std::atan2(g.y - from.y, g.x - from.x), 1e-12);
  }
}

TEST_F(MotionModelTest, GoalOnTopOfRobotGivesZeroHeading) {
  RobotState s = initialState();
  s.pose = Pose2D{1.5, 2.5, 1.0};
  const GoalPose here{1.5, 2.5};

  EXPECT_EQ(MotionModel::bearing(s.pose, here), 0.0);

  model.aimAt(s, here);
  EXPECT_EQ(s.pose.theta, 0.0);
  EXPECT_TRUE(std::isfinite(s.velocity.vx));
  EXPECT_NEAR(s.velocity.vx, model.linearSpeed(), 1e-12);
  EXPECT_NEAR(s.velocity.vy, 0.0, 1e-12);
}

// atan2(-0.0, -3.0) is -pi; the heading is reported as +pi instead
TEST_F(MotionModelTest, GoalStraightBehindReportsPositivePi) {
  RobotState s = initialState();
  const GoalPose behind{-3.0, -0.0};

  EXPECT_EQ(MotionModel::bearing(s.pose, behind), M_PI);

  model.aimAt(s, behind);
  EXPECT_GT(s.pose.theta, -M_PI);
  EXPECT_LE(s.pose.theta, M_PI);
  EXPECT_NEAR(s.velocity.vx, -model.linearSpeed(), 1e-12);
  EXPECT_NEAR(s.velocity.vy, 0.0, 1e-12);
}

TEST_F(MotionModelTest, FirstStepMovesWithPreviousHeading) {
  RobotState s = initialState();
  const double r = config.wheel_radius;
  const double w = config.wheel_omega;
  const double dt = 0.01;

  model.step(s, goal, 0.0);

  // moved along +x with the initial heading of 0
  EXPECT_NEAR(s.pose.x, r * w * dt, 1e-12);
  EXPECT_NEAR(s.pose.y, 0.0, 1e-12);

  // then turned toward the goal from the new position
  const double theta = std::atan2(1.45 - s.pose.y, 3.45 - s.pose.x);
  EXPECT_NEAR(s.pose.theta, theta, 1e-9);
  EXPECT_NEAR(s.velocity.vx, r * w * std::cos(theta), 1e-12);
  EXPECT_NEAR(s.velocity.vy, r * w * std::sin(theta), 1e-12);
  EXPECT_DOUBLE_EQ(s.velocity.omega, 0.0);

  // second step uses the refreshed heading
  const double x1 = s.pose.x;
  const double y1 = s.pose.y;
  const double vx1 = s.velocity.vx;
  const double vy1 = s.velocity.vy;
  model.step(s, goal, 0.0);
  EXPECT_NEAR(s.pose.x, x1 + vx1 * dt, 1e-12);
  EXPECT_NEAR(s.pose.y, y1 + vy1 * dt, 1e-12);
}

TEST_F(MotionModelTest, WheelAdvancesOncePerStep) {
  RobotState s = initialState();
  for (int i = 0; i < 250; ++i) {
    const double before = s.wheel_pos;
    model.step(s, goal, 0.0);
    EXPECT_GE(s.wheel_pos, before);
  }
  EXPECT_NEAR(s.wheel_pos, 250 * config.wheel_omega * model.dt(), 1e-9);
}

TEST_F(MotionModelTest, TiltIsCopiedVerbatim) {
  RobotState s = initialState();
  model.step(s, goal, -0.187);
  EXPECT_DOUBLE_EQ(s.tilt, -0.187);
  model.step(s, goal, 0.0);
  EXPECT_DOUBLE_EQ(s.tilt, 0.0);
}

TEST_F(MotionModelTest, StationaryGoalIsApproachedAlongStraightLine) {
  RobotState s = initialState();
  model.aimAt(s, goal);

  const double len = std::hypot(goal.x, goal.y);
  const double ux = goal.x / len;
  const double uy = goal.y / len;
  const double step_len = model.linearSpeed() * model.dt();

  double dist = std::hypot(goal.x - s.pose.x, goal.y - s.pose.y);
  int steps = 0;
  while (dist > step_len) {
    model.step(s, goal, 0.0);
    const double next = std::hypot(goal.x - s.pose.x, goal.y - s.pose.y);
    ASSERT_LT(next, dist) << "after " << steps << " steps";
    // perpendicular distance from the start->goal line
    EXPECT_NEAR(s.pose.x * uy - s.pose.y * ux, 0.0, 1e-9);
    dist = next;
    ++steps;
  }
  EXPECT_GT(steps, 0);
  EXPECT_NEAR(std::ceil(len / step_len), steps + 1, 1.0);
}

TEST_F(MotionModelTest, DtFollowsFrequency) {
  MotionConfig fast{};
  fast.frequency_hz = 250.0;
  MotionModel m{rclcpp::get_logger("motion_model_test"), fast};
  EXPECT_DOUBLE_EQ(m.dt(), 0.004);
}
