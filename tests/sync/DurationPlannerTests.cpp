// Repository: ReelSync
// Component: Duration Reconciliation Planner Tests
// Purpose: Decision regions over (audio, video), boundary at the stretch
//          threshold, end-to-end scenarios and filter expressions.
// Copyright (c) 2025 ReelSync

#include <gtest/gtest.h>

#include <limits>

#include "reelsync/sync/DurationPlanner.hpp"

namespace reelsync::sync::testing {
namespace {

TEST(DurationPlannerTest, ScenarioStretch) {
  DurationPlanner planner;
  SyncDecision d = planner.Plan(7.0, 5.0);
  EXPECT_EQ(d.transform, SyncTransform::kStretch);
  EXPECT_DOUBLE_EQ(d.parameter, 1.4);
  EXPECT_DOUBLE_EQ(d.audio_s, 7.0);
  EXPECT_DOUBLE_EQ(d.video_s, 5.0);
}

TEST(DurationPlannerTest, ScenarioFreezePad) {
  DurationPlanner planner;
  SyncDecision d = planner.Plan(12.0, 5.0);
  EXPECT_EQ(d.transform, SyncTransform::kFreezePad);
  EXPECT_DOUBLE_EQ(d.parameter, 7.0);
}

TEST(DurationPlannerTest, ScenarioAudioShorterLeavesVideoAlone) {
  DurationPlanner planner;
  SyncDecision d = planner.Plan(4.0, 6.0);
  EXPECT_EQ(d.transform, SyncTransform::kNone);
}

TEST(DurationPlannerTest, NonPositiveDiffIsAlwaysNone) {
  DurationPlanner planner;
  for (double video = 0.5; video <= 20.0; video += 0.5) {
    for (double shorter = 0.0; shorter <= video; shorter += 0.25) {
      EXPECT_EQ(planner.Plan(video - shorter, video).transform, SyncTransform::kNone)
          << "audio=" << video - shorter << " video=" << video;
    }
  }
}

TEST(DurationPlannerTest, SmallOverhangStretchesByRatio) {
  DurationPlanner planner;
  for (double video = 1.0; video <= 12.0; video += 1.0) {
    for (double diff = 0.25; diff <= 4.0; diff += 0.25) {
      SyncDecision d = planner.Plan(video + diff, video);
      ASSERT_EQ(d.transform, SyncTransform::kStretch) << "diff=" << diff;
      EXPECT_GT(d.parameter, 1.0);
      EXPECT_DOUBLE_EQ(d.parameter, (video + diff) / video);
    }
  }
}

TEST(DurationPlannerTest, LargeOverhangFreezePadsByDiff) {
  DurationPlanner planner;
  for (double video = 1.0; video <= 12.0; video += 1.0) {
    for (double diff = 4.25; diff <= 30.0; diff += 1.5) {
      SyncDecision d = planner.Plan(video + diff, video);
      ASSERT_EQ(d.transform, SyncTransform::kFreezePad) << "diff=" << diff;
      EXPECT_NEAR(d.parameter, diff, 1e-9);
    }
  }
}

TEST(DurationPlannerTest, ThresholdIsInclusiveForStretch) {
  DurationPlanner planner;
  EXPECT_EQ(planner.Plan(9.0, 5.0).transform, SyncTransform::kStretch);
  EXPECT_EQ(planner.Plan(9.001, 5.0).transform, SyncTransform::kFreezePad);
}

TEST(DurationPlannerTest, ConfigurableThreshold) {
  DurationPlanner planner(DurationPlannerConfig{1.0});
  EXPECT_EQ(planner.Plan(6.5, 5.0).transform, SyncTransform::kFreezePad);
  EXPECT_EQ(planner.Plan(5.5, 5.0).transform, SyncTransform::kStretch);
}

TEST(DurationPlannerTest, DegenerateVideoDurationFreezePads) {
  DurationPlanner planner;
  SyncDecision zero = planner.Plan(2.0, 0.0);
  EXPECT_EQ(zero.transform, SyncTransform::kFreezePad);
  EXPECT_DOUBLE_EQ(zero.parameter, 2.0);

  SyncDecision nan = planner.Plan(2.0, std::numeric_limits<double>::quiet_NaN());
  EXPECT_EQ(nan.transform, SyncTransform::kNone);
}

TEST(FilterExpressionTest, RendersEachTransform) {
  DurationPlanner planner;
  EXPECT_EQ(FilterExpression(planner.Plan(4.0, 6.0)), "null");
  EXPECT_EQ(FilterExpression(planner.Plan(7.0, 5.0)), "setpts=1.4*PTS");
  EXPECT_EQ(FilterExpression(planner.Plan(12.0, 5.0)), "tpad=stop_mode=clone:stop_duration=7");
}

}  // namespace
}  // namespace reelsync::sync::testing
