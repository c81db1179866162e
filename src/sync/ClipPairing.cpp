// Repository: ReelSync
// Component: Clip Pairing Implementation
// Copyright (c) 2025 ReelSync

#include "reelsync/sync/ClipPairing.hpp"

#include <algorithm>
#include <regex>

#include "reelsync/render/RenderJobTypes.hpp"
#include "reelsync/util/Logger.hpp"

namespace reelsync::sync {

namespace {

const std::regex& PatternFor(ClipFileKind kind) {
  static const std::regex kNarration(R"(clip_(\d{4})_narration\.wav)");
  static const std::regex kVideo(R"(narrativegen_clip_(\d{4})__\d+\.mp4)");
  return kind == ClipFileKind::kNarration ? kNarration : kVideo;
}

std::map<std::string, std::filesystem::path> IndexById(
    const std::vector<std::filesystem::path>& files, ClipFileKind kind) {
  std::map<std::string, std::filesystem::path> index;
  for (const auto& file : files) {
    auto id = ExtractClipId(file.filename().string(), kind);
    if (!id) {
      util::Logger::Debug("[ClipPairing] Ignoring unrecognized file " + file.string());
      continue;
    }
    index.emplace(*id, file);
  }
  return index;
}

}  // namespace

std::string NarrationFilename(int64_t id) {
  return "clip_" + render::FormatClipId(id) + "_narration.wav";
}

std::optional<std::string> ExtractClipId(const std::string& filename, ClipFileKind kind) {
  std::smatch match;
  if (!std::regex_match(filename, match, PatternFor(kind))) {
    return std::nullopt;
  }
  return match[1].str();
}

std::vector<ClipPairing> PairClips(const std::vector<std::filesystem::path>& narrations,
                                   const std::vector<std::filesystem::path>& videos) {
  const auto audio_by_id = IndexById(narrations, ClipFileKind::kNarration);
  const auto video_by_id = IndexById(videos, ClipFileKind::kVideo);

  std::vector<ClipPairing> pairings;
  for (const auto& [id, audio] : audio_by_id) {
    auto it = video_by_id.find(id);
    if (it == video_by_id.end()) {
      util::Logger::Info("[ClipPairing] Skipping clip " + id + ": narration without video");
      continue;
    }
    pairings.push_back({id, audio, it->second});
  }
  for (const auto& [id, video] : video_by_id) {
    if (audio_by_id.count(id) == 0) {
      util::Logger::Info("[ClipPairing] Skipping clip " + id + ": video without narration (" +
                         video.filename().string() + ")");
    }
  }
  return pairings;
}

std::map<std::string, std::filesystem::path> ScanClipDirectory(
    const std::filesystem::path& dir, ClipFileKind kind) {
  std::vector<std::filesystem::path> files;
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    return {};
  }
  for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
    if (entry.is_regular_file(ec)) files.push_back(entry.path());
  }
  std::sort(files.begin(), files.end());
  std::map<std::string, std::filesystem::path> index;
  for (const auto& file : files) {
    auto id = ExtractClipId(file.filename().string(), kind);
    if (id) index.emplace(*id, file);
  }
  return index;
}

}  // namespace reelsync::sync
