// Repository: ReelSync
// Component: Content Items Implementation
// Copyright (c) 2025 ReelSync

#include "reelsync/pipeline/ContentItems.hpp"

#include <set>

#include "reelsync/render/RenderJobTypes.hpp"
#include "reelsync/util/Errors.hpp"
#include "reelsync/util/JsonFile.hpp"
#include "reelsync/util/Logger.hpp"

namespace reelsync::pipeline {

namespace {

std::string ReadText(const Json::Value& entry, const char* key, const char* alias,
                     const std::string& where) {
  for (const char* name : {key, alias}) {
    if (name == nullptr || !entry.isMember(name) || entry[name].isNull()) continue;
    if (!entry[name].isString()) {
      throw util::ConfigurationError(where + ": '" + name + "' must be a string");
    }
    return entry[name].asString();
  }
  return "";
}

std::optional<int32_t> ReadPositiveInt(const Json::Value& entry, const char* key,
                                       const char* alias, const std::string& where) {
  for (const char* name : {key, alias}) {
    if (name == nullptr || !entry.isMember(name) || entry[name].isNull()) continue;
    const Json::Value& v = entry[name];
    if (!v.isInt() || v.asInt() <= 0) {
      throw util::ConfigurationError(where + ": '" + name + "' must be a positive integer");
    }
    return v.asInt();
  }
  return std::nullopt;
}

}  // namespace

std::vector<ContentItem> ParseContentItems(const Json::Value& root) {
  if (!root.isArray()) {
    throw util::ConfigurationError("content must be a JSON array of objects");
  }

  std::vector<ContentItem> items;
  std::set<int64_t> seen;
  for (Json::ArrayIndex i = 0; i < root.size(); ++i) {
    const Json::Value& entry = root[i];
    const std::string where = "content item " + std::to_string(i);
    if (!entry.isObject()) {
      throw util::ConfigurationError(where + " is not an object");
    }

    ContentItem item;
    item.order = static_cast<int32_t>(i);
    if (entry.isMember("id") && !entry["id"].isNull()) {
      if (!entry["id"].isInt64() || entry["id"].asInt64() <= 0) {
        throw util::ConfigurationError(where + ": 'id' must be a positive integer");
      }
      item.id = entry["id"].asInt64();
    } else {
      item.id = static_cast<int64_t>(i) + 1;
    }
    if (item.id > render::kMaxClipId) {
      throw util::ConfigurationError(where + ": id " + std::to_string(item.id) +
                                     " exceeds " + std::to_string(render::kMaxClipId));
    }
    if (!seen.insert(item.id).second) {
      throw util::ConfigurationError(where + ": duplicate id " + std::to_string(item.id));
    }

    item.prompt = ReadText(entry, "image_prompt", "prompt", where);
    item.commentary = ReadText(entry, "commentary", nullptr, where);
    item.frames = ReadPositiveInt(entry, "duration_frames", "frames", where);
    item.width = ReadPositiveInt(entry, "width", nullptr, where);
    item.height = ReadPositiveInt(entry, "height", nullptr, where);
    items.push_back(std::move(item));
  }
  return items;
}

std::vector<ContentItem> LoadContentItems(const std::filesystem::path& path) {
  auto items = ParseContentItems(util::ReadJsonFileOrThrow(path, "content file"));
  util::Logger::Info("[ContentItems] Loaded " + std::to_string(items.size()) + " items from " +
                     path.string());
  return items;
}

}  // namespace reelsync::pipeline
