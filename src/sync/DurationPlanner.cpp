// Repository: ReelSync
// Component: Duration Reconciliation Planner Implementation
// Copyright (c) 2025 ReelSync

#include "reelsync/sync/DurationPlanner.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace reelsync::sync {

const char* SyncTransformToString(SyncTransform transform) {
  switch (transform) {
    case SyncTransform::kNone: return "none";
    case SyncTransform::kStretch: return "stretch";
    case SyncTransform::kFreezePad: return "freeze_pad";
  }
  return "unknown";
}

SyncDecision DurationPlanner::Plan(double audio_s, double video_s) const {
  SyncDecision decision;
  decision.audio_s = audio_s;
  decision.video_s = video_s;

  const double diff = audio_s - video_s;
  if (!(diff > 0.0)) {
    return decision;
  }

  if (!std::isfinite(video_s) || video_s <= 0.0 || diff > config_.stretch_threshold_s) {
    decision.transform = SyncTransform::kFreezePad;
    decision.parameter = diff;
    return decision;
  }

  decision.transform = SyncTransform::kStretch;
  decision.parameter = audio_s / video_s;
  return decision;
}

std::string FilterExpression(const SyncDecision& decision) {
  std::ostringstream out;
  out << std::setprecision(6);
  switch (decision.transform) {
    case SyncTransform::kNone:
      return "null";
    case SyncTransform::kStretch:
      out << "setpts=" << decision.parameter << "*PTS";
      return out.str();
    case SyncTransform::kFreezePad:
      out << "tpad=stop_mode=clone:stop_duration=" << decision.parameter;
      return out.str();
  }
  return "null";
}

std::string DescribeDecision(const SyncDecision& decision) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << "audio " << decision.audio_s
      << "s, video " << decision.video_s << "s -> "
      << SyncTransformToString(decision.transform);
  if (decision.transform == SyncTransform::kStretch) {
    out << " x" << std::setprecision(3) << decision.parameter;
  } else if (decision.transform == SyncTransform::kFreezePad) {
    out << " +" << decision.parameter << "s";
  }
  return out.str();
}

}  // namespace reelsync::sync
