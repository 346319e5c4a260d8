#include <gtest/gtest.h>

#include <atomic>
#include <limits>
#include <thread>

#include "goal_tracker.hpp"

using turtle_brick::GoalPose;
using turtle_brick::GoalTracker;
using turtle_brick::Pose2D;

class GoalTrackerTest : public ::testing::Test {
protected:
  GoalTracker tracker{rclcpp::get_logger("goal_tracker_test"), GoalPose{3.45, 1.45}};
};

TEST_F(GoalTrackerTest, StartsWithDefaults) {
  EXPECT_DOUBLE_EQ(tracker.goal().x, 3.45);
  EXPECT_DOUBLE_EQ(tracker.goal().y, 1.45);
  EXPECT_DOUBLE_EQ(tracker.tilt(), 0.0);
  EXPECT_FALSE(tracker.observedPose().has_value());
}

TEST_F(GoalTrackerTest, LastWriteWins) {
  EXPECT_TRUE(tracker.updateGoal(1.0, 2.0));
  EXPECT_TRUE(tracker.updateGoal(-4.0, 0.5));
  EXPECT_DOUBLE_EQ(tracker.goal().x, -4.0);
  EXPECT_DOUBLE_EQ(tracker.goal().y, 0.5);

  EXPECT_TRUE(tracker.updateTilt(0.2));
  EXPECT_TRUE(tracker.updateTilt(-0.187));
  EXPECT_DOUBLE_EQ(tracker.tilt(), -0.187);
}

TEST_F(GoalTrackerTest, RejectsNonFiniteInput) {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double inf = std::numeric_limits<double>::infinity();

  EXPECT_FALSE(tracker.updateGoal(nan, 1.0));
  EXPECT_FALSE(tracker.updateGoal(1.0, inf));
  EXPECT_DOUBLE_EQ(tracker.goal().x, 3.45);
  EXPECT_DOUBLE_EQ(tracker.goal().y, 1.45);

  ASSERT_TRUE(tracker.updateTilt(0.1));
  EXPECT_FALSE(tracker.updateTilt(nan));
  EXPECT_DOUBLE_EQ(tracker.tilt(), 0.1);

  ASSERT_TRUE(tracker.updatePose(Pose2D{5.5, 5.5, 0.0}));
  EXPECT_FALSE(tracker.updatePose(Pose2D{5.5, -inf, 0.0}));
  ASSERT_TRUE(tracker.observedPose().has_value());
  EXPECT_DOUBLE_EQ(tracker.observedPose()->y, 5.5);
}

// Writers always store (k, -k); a reader must never see a mixed pair
TEST_F(GoalTrackerTest, ConcurrentUpdatesAreNeverTorn) {
  std::atomic<bool> done{false};
  std::atomic<int> torn{0};

  std::thread writer([&]() {
    for (int k = 1; k <= 5000; ++k) {
      EXPECT_TRUE(tracker.updateGoal(static_cast<double>(k), static_cast<double>(-k)));
    }
    done = true;
  });
  std::thread reader([&]() {
    while (!done) {
      const GoalPose g = tracker.goal();
      if (g.x != 3.45 && g.x != -g.y) ++torn;
    }
  });

  writer.join();
  reader.join();
  EXPECT_EQ(torn.load(), 0);
  EXPECT_DOUBLE_EQ(tracker.goal().x, 5000.0);
}
