// Repository: ReelSync
// Component: Duration Reconciliation Planner
// Purpose: Choose the time-alignment transform that makes a silent video
//          clip cover its narration clip.
// Copyright (c) 2025 ReelSync

#ifndef REELSYNC_SYNC_DURATION_PLANNER_HPP_
#define REELSYNC_SYNC_DURATION_PLANNER_HPP_

#include <string>

namespace reelsync::sync {

enum class SyncTransform {
  kNone = 0,    // audio fits; a shorter narration leaves a silent video tail
  kStretch,     // slow the video down uniformly; parameter = audio / video
  kFreezePad,   // hold the final frame; parameter = seconds to add
};

const char* SyncTransformToString(SyncTransform transform);

struct SyncDecision {
  SyncTransform transform = SyncTransform::kNone;
  double parameter = 0.0;
  double audio_s = 0.0;
  double video_s = 0.0;
};

struct DurationPlannerConfig {
  // Largest audio overhang (seconds) still handled by stretching.
  double stretch_threshold_s = 4.0;
};

// DurationPlanner
//
//   diff = audio - video
//   diff <= 0                 → kNone
//   0 < diff <= threshold     → kStretch(audio / video)
//   diff > threshold          → kFreezePad(diff)
//
// A non-positive or non-finite video duration cannot be stretched; with
// diff > 0 it yields kFreezePad(diff).
class DurationPlanner {
 public:
  DurationPlanner() = default;
  explicit DurationPlanner(DurationPlannerConfig config) : config_(config) {}

  SyncDecision Plan(double audio_s, double video_s) const;

  const DurationPlannerConfig& config() const { return config_; }

 private:
  DurationPlannerConfig config_;
};

// ffmpeg video filter for a decision:
//   kNone      → "null"
//   kStretch   → "setpts=<factor>*PTS"
//   kFreezePad → "tpad=stop_mode=clone:stop_duration=<seconds>"
std::string FilterExpression(const SyncDecision& decision);

// One-line description for log output.
std::string DescribeDecision(const SyncDecision& decision);

}  // namespace reelsync::sync

#endif  // REELSYNC_SYNC_DURATION_PLANNER_HPP_
