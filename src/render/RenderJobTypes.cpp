// Repository: ReelSync
// Component: Render Job Types Implementation
// Copyright (c) 2025 ReelSync

#include "reelsync/render/RenderJobTypes.hpp"

#include <iomanip>
#include <sstream>

namespace reelsync::render {

const char* ClipJobStatusToString(ClipJobStatus status) {
  switch (status) {
    case ClipJobStatus::kSubmitted: return "SUBMITTED";
    case ClipJobStatus::kQueued: return "QUEUED";
    case ClipJobStatus::kPolling: return "POLLING";
    case ClipJobStatus::kSuccess: return "SUCCESS";
    case ClipJobStatus::kNoOutput: return "NO_OUTPUT";
    case ClipJobStatus::kTimeout: return "TIMEOUT";
    case ClipJobStatus::kQueueFailed: return "QUEUE_FAILED";
    case ClipJobStatus::kBackendMisconfigured: return "BACKEND_MISCONFIGURED";
    case ClipJobStatus::kDownloadFailed: return "DOWNLOAD_FAILED";
    case ClipJobStatus::kSkippedNoPrompt: return "SKIPPED_NO_PROMPT";
  }
  return "UNKNOWN";
}

std::optional<ClipJobStatus> ClipJobStatusFromString(const std::string& name) {
  static constexpr ClipJobStatus kAll[] = {
      ClipJobStatus::kSubmitted,   ClipJobStatus::kQueued,
      ClipJobStatus::kPolling,     ClipJobStatus::kSuccess,
      ClipJobStatus::kNoOutput,    ClipJobStatus::kTimeout,
      ClipJobStatus::kQueueFailed, ClipJobStatus::kBackendMisconfigured,
      ClipJobStatus::kDownloadFailed, ClipJobStatus::kSkippedNoPrompt,
  };
  for (ClipJobStatus status : kAll) {
    if (name == ClipJobStatusToString(status)) return status;
  }
  return std::nullopt;
}

bool IsTerminal(ClipJobStatus status) {
  switch (status) {
    case ClipJobStatus::kSubmitted:
    case ClipJobStatus::kQueued:
    case ClipJobStatus::kPolling:
      return false;
    default:
      return true;
  }
}

std::string FormatClipId(int64_t id) {
  std::ostringstream out;
  out << std::setw(4) << std::setfill('0') << id;
  return out.str();
}

}  // namespace reelsync::render
