// Repository: ReelSync
// Component: Media Probe
// Purpose: Container duration lookup through libavformat.
// Copyright (c) 2025 ReelSync

#ifndef REELSYNC_MEDIA_MEDIA_PROBE_HPP_
#define REELSYNC_MEDIA_MEDIA_PROBE_HPP_

#include <filesystem>
#include <optional>

namespace reelsync::media {

// Duration in seconds of an audio or video file. Uses the container
// duration, falling back to the longest stream duration. Empty optional when
// the file cannot be opened or reports no duration.
std::optional<double> ProbeDurationSeconds(const std::filesystem::path& path);

}  // namespace reelsync::media

#endif  // REELSYNC_MEDIA_MEDIA_PROBE_HPP_
