// Repository: ReelSync
// Component: Content Items
// Purpose: The input item list (video prompt + commentary per clip).
// Copyright (c) 2025 ReelSync

#ifndef REELSYNC_PIPELINE_CONTENT_ITEMS_HPP_
#define REELSYNC_PIPELINE_CONTENT_ITEMS_HPP_

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

namespace reelsync::pipeline {

// Immutable once loaded.
struct ContentItem {
  int64_t id = 0;          // 1..kMaxClipId; 1-based position when absent
  int32_t order = 0;       // 0-based position in the list
  std::string prompt;      // "image_prompt" (alias "prompt")
  std::string commentary;
  std::optional<int32_t> frames;  // "duration_frames" (alias "frames")
  std::optional<int32_t> width;
  std::optional<int32_t> height;
};

// Parses the content document: a JSON array of objects. Empty prompt or
// commentary strings are accepted (the item is skipped at the relevant
// stage). Throws util::ConfigurationError on a non-array document, a
// non-object entry, a field of the wrong type, an id outside
// 1..render::kMaxClipId, a non-positive dimension, or a duplicate id.
std::vector<ContentItem> ParseContentItems(const Json::Value& root);

// Reads and parses `path`. Throws util::ConfigurationError.
std::vector<ContentItem> LoadContentItems(const std::filesystem::path& path);

}  // namespace reelsync::pipeline

#endif  // REELSYNC_PIPELINE_CONTENT_ITEMS_HPP_
