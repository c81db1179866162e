// Repository: ReelSync
// Component: Render Job Types
// Purpose: Data structures shared by the render job client, the artifact
//          fetcher and the clip manifest.
// Copyright (c) 2025 ReelSync

#ifndef REELSYNC_RENDER_RENDER_JOB_TYPES_HPP_
#define REELSYNC_RENDER_RENDER_JOB_TYPES_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace reelsync::render {

// Storage type reported when the backend omits one.
inline constexpr const char* kDefaultStorageType = "output";

// (filename, subfolder, storage-type) triple identifying one produced
// artifact on the render backend.
struct OutputLocator {
  std::string filename;
  std::string subfolder;
  std::string type = kDefaultStorageType;

  bool operator==(const OutputLocator& other) const {
    return filename == other.filename && subfolder == other.subfolder &&
           type == other.type;
  }
  bool operator!=(const OutputLocator& other) const { return !(*this == other); }
};

// =============================================================================
// Clip Job Status
// SUBMITTED → QUEUED → POLLING → {SUCCESS, NO_OUTPUT, TIMEOUT,
//                                 QUEUE_FAILED, BACKEND_MISCONFIGURED}
// kDownloadFailed and kSkippedNoPrompt are assigned by the pipeline.
// =============================================================================

enum class ClipJobStatus {
  kSubmitted = 0,
  kQueued,
  kPolling,

  // Terminal: output resolved (and, in the manifest, downloaded)
  kSuccess,

  // Terminal: history finished but no usable artifact for the output stage
  kNoOutput,

  // Terminal: poll cap exhausted without a finished history entry
  kTimeout,

  // Terminal: submission returned no job handle
  kQueueFailed,

  // Terminal, fatal for the run: template lacks a configured stage id
  kBackendMisconfigured,

  // Terminal: artifact transfer failed or wrote zero bytes
  kDownloadFailed,

  // Terminal: item had no prompt, nothing was submitted
  kSkippedNoPrompt,
};

// Stable wire name used in the manifest file and in log lines.
const char* ClipJobStatusToString(ClipJobStatus status);

// Inverse of ClipJobStatusToString. Empty optional for unknown names.
std::optional<ClipJobStatus> ClipJobStatusFromString(const std::string& name);

// True for every state the job can no longer leave.
bool IsTerminal(ClipJobStatus status);

// Largest id that still formats to the 4 digits generated filenames carry.
inline constexpr int64_t kMaxClipId = 9999;

// Zero-padded 4-digit identifier used in every generated filename.
std::string FormatClipId(int64_t id);

}  // namespace reelsync::render

#endif  // REELSYNC_RENDER_RENDER_JOB_TYPES_HPP_
