// Repository: ReelSync
// Component: Clip Pairing
// Purpose: Correlate narration and video files through the 4-digit clip
//          identifier embedded in their filenames.
// Copyright (c) 2025 ReelSync

#ifndef REELSYNC_SYNC_CLIP_PAIRING_HPP_
#define REELSYNC_SYNC_CLIP_PAIRING_HPP_

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace reelsync::sync {

enum class ClipFileKind {
  kNarration,  // clip_<id4>_narration.wav
  kVideo,      // narrativegen_clip_<id4>__<counter>.mp4
};

// Filename of the narration clip for an identifier.
std::string NarrationFilename(int64_t id);

// Returns the 4-digit identifier when `filename` (no directory part) matches
// the naming pattern for `kind` exactly.
std::optional<std::string> ExtractClipId(const std::string& filename, ClipFileKind kind);

struct ClipPairing {
  std::string id;  // zero-padded, e.g. "0002"
  std::filesystem::path narration;
  std::filesystem::path video;
};

// Pairs narration and video files sharing an identifier. Result is sorted by
// identifier. Files matching no pattern and identifiers present on one side
// only are dropped with a log line. When two files carry the same identifier
// the first one wins.
std::vector<ClipPairing> PairClips(const std::vector<std::filesystem::path>& narrations,
                                   const std::vector<std::filesystem::path>& videos);

// Regular files in `dir` whose names match the pattern for `kind`, keyed by
// identifier. A missing directory yields an empty map.
std::map<std::string, std::filesystem::path> ScanClipDirectory(
    const std::filesystem::path& dir, ClipFileKind kind);

}  // namespace reelsync::sync

#endif  // REELSYNC_SYNC_CLIP_PAIRING_HPP_
