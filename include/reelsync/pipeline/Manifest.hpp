// Repository: ReelSync
// Component: Clip Manifest
// Purpose: Ordered ClipJob records written after the render stage and read
//          back by narration and final assembly.
// Copyright (c) 2025 ReelSync

#ifndef REELSYNC_PIPELINE_MANIFEST_HPP_
#define REELSYNC_PIPELINE_MANIFEST_HPP_

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

#include "reelsync/render/RenderJobTypes.hpp"

namespace reelsync::pipeline {

inline constexpr const char* kManifestFilename = "_generated_clips_manifest.json";

// One render job per content item.
// local_path is set if and only if status == kSuccess.
struct ClipJob {
  int64_t id = 0;
  int32_t order = 0;  // 0-based position in the content list
  render::ClipJobStatus status = render::ClipJobStatus::kSubmitted;
  std::optional<render::OutputLocator> output_locator;
  std::optional<std::filesystem::path> local_path;
};

// Manifest
//
// Append-only collection, at most one ClipJob per id. Written once per run
// and replaced wholesale; there is no merge with a previous run's file.
//
// File format: JSON array of
//   {"id", "order", "status", "output_locator": {...} | null,
//    "local_path": string | null}
class Manifest {
 public:
  // Returns false (and leaves the manifest unchanged) when the id is
  // already present or the local_path invariant is violated.
  bool Append(ClipJob job);

  const std::vector<ClipJob>& jobs() const { return jobs_; }
  size_t size() const { return jobs_.size(); }
  bool empty() const { return jobs_.empty(); }

  bool Contains(int64_t id) const;
  const ClipJob* Find(int64_t id) const;

  // Copy of the jobs sorted by `order` (stable for equal orders).
  std::vector<ClipJob> SortedByOrder() const;

  // kSuccess entries whose local file exists, sorted by `order`.
  std::vector<ClipJob> UsableClips() const;

  Json::Value ToJson() const;

  // Parses a manifest document. Returns false and fills *error on a
  // malformed document, an unknown status or a duplicate id.
  static bool FromJson(const Json::Value& root, Manifest* out, std::string* error);

  bool Save(const std::filesystem::path& path, std::string* error) const;

  // Throws util::ConfigurationError when the file is missing or malformed.
  static Manifest LoadOrThrow(const std::filesystem::path& path);

 private:
  std::vector<ClipJob> jobs_;
};

}  // namespace reelsync::pipeline

#endif  // REELSYNC_PIPELINE_MANIFEST_HPP_
