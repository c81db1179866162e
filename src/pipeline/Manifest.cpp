// Repository: ReelSync
// Component: Clip Manifest Implementation
// Copyright (c) 2025 ReelSync

#include "reelsync/pipeline/Manifest.hpp"

#include <algorithm>

#include "reelsync/util/Errors.hpp"
#include "reelsync/util/JsonFile.hpp"
#include "reelsync/util/Logger.hpp"

namespace reelsync::pipeline {

namespace {

Json::Value LocatorToJson(const render::OutputLocator& locator) {
  Json::Value v(Json::objectValue);
  v["filename"] = locator.filename;
  v["subfolder"] = locator.subfolder;
  v["type"] = locator.type;
  return v;
}

bool LocatorFromJson(const Json::Value& v, render::OutputLocator* out) {
  if (!v.isObject() || !v["filename"].isString()) return false;
  out->filename = v["filename"].asString();
  out->subfolder = v["subfolder"].isString() ? v["subfolder"].asString() : "";
  out->type = v["type"].isString() && !v["type"].asString().empty()
                  ? v["type"].asString()
                  : render::kDefaultStorageType;
  return true;
}

bool Fail(std::string* error, const std::string& message) {
  if (error != nullptr) *error = message;
  return false;
}

}  // namespace

bool Manifest::Append(ClipJob job) {
  if (Contains(job.id)) {
    util::Logger::Warn("[Manifest] Rejecting duplicate clip id " + std::to_string(job.id));
    return false;
  }
  const bool success = job.status == render::ClipJobStatus::kSuccess;
  if (success != job.local_path.has_value()) {
    util::Logger::Warn("[Manifest] Rejecting clip " + std::to_string(job.id) + ": status " +
                       render::ClipJobStatusToString(job.status) +
                       (success ? " without" : " with") + " a local path");
    return false;
  }
  jobs_.push_back(std::move(job));
  return true;
}

bool Manifest::Contains(int64_t id) const { return Find(id) != nullptr; }

const ClipJob* Manifest::Find(int64_t id) const {
  auto it = std::find_if(jobs_.begin(), jobs_.end(),
                         [id](const ClipJob& j) { return j.id == id; });
  return it == jobs_.end() ? nullptr : &*it;
}

std::vector<ClipJob> Manifest::SortedByOrder() const {
  std::vector<ClipJob> sorted = jobs_;
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const ClipJob& a, const ClipJob& b) { return a.order < b.order; });
  return sorted;
}

std::vector<ClipJob> Manifest::UsableClips() const {
  std::vector<ClipJob> usable;
  for (auto& job : SortedByOrder()) {
    std::error_code ec;
    if (job.status == render::ClipJobStatus::kSuccess && job.local_path &&
        std::filesystem::exists(*job.local_path, ec)) {
      usable.push_back(std::move(job));
    } else {
      util::Logger::Info("[Manifest] Skipping clip " + render::FormatClipId(job.id) +
                         " (status " + render::ClipJobStatusToString(job.status) +
                         (job.local_path ? ", file missing)" : ", no local file)"));
    }
  }
  return usable;
}

Json::Value Manifest::ToJson() const {
  Json::Value root(Json::arrayValue);
  for (const auto& job : jobs_) {
    Json::Value entry(Json::objectValue);
    entry["id"] = Json::Int64(job.id);
    entry["order"] = job.order;
    entry["status"] = render::ClipJobStatusToString(job.status);
    entry["output_locator"] =
        job.output_locator ? LocatorToJson(*job.output_locator) : Json::Value();
    entry["local_path"] = job.local_path ? Json::Value(job.local_path->string()) : Json::Value();
    root.append(entry);
  }
  return root;
}

bool Manifest::FromJson(const Json::Value& root, Manifest* out, std::string* error) {
  if (!root.isArray()) return Fail(error, "manifest is not a JSON array");

  Manifest manifest;
  for (Json::ArrayIndex i = 0; i < root.size(); ++i) {
    const Json::Value& entry = root[i];
    const std::string where = "manifest entry " + std::to_string(i);
    if (!entry.isObject()) return Fail(error, where + " is not an object");
    if (!entry["id"].isInt64()) return Fail(error, where + ": 'id' must be an integer");
    if (!entry["order"].isInt()) return Fail(error, where + ": 'order' must be a 32-bit integer");
    if (!entry["status"].isString()) return Fail(error, where + ": 'status' must be a string");

    ClipJob job;
    job.id = entry["id"].asInt64();
    job.order = entry["order"].asInt();
    auto status = render::ClipJobStatusFromString(entry["status"].asString());
    if (!status) return Fail(error, where + ": unknown status '" + entry["status"].asString() + "'");
    job.status = *status;

    const Json::Value& locator = entry["output_locator"];
    if (!locator.isNull()) {
      render::OutputLocator parsed;
      if (!LocatorFromJson(locator, &parsed)) {
        return Fail(error, where + ": malformed 'output_locator'");
      }
      job.output_locator = parsed;
    }
    const Json::Value& local_path = entry["local_path"];
    if (local_path.isString()) {
      job.local_path = std::filesystem::path(local_path.asString());
    } else if (!local_path.isNull()) {
      return Fail(error, where + ": 'local_path' must be a string or null");
    }

    if (!manifest.Append(std::move(job))) {
      return Fail(error, where + ": duplicate id or inconsistent local_path");
    }
  }
  *out = std::move(manifest);
  return true;
}

bool Manifest::Save(const std::filesystem::path& path, std::string* error) const {
  if (!util::WriteJsonFile(path, ToJson(), error)) return false;
  util::Logger::Info("[Manifest] Wrote " + std::to_string(jobs_.size()) + " entries to " +
                     path.string());
  return true;
}

Manifest Manifest::LoadOrThrow(const std::filesystem::path& path) {
  Json::Value root = util::ReadJsonFileOrThrow(path, "clip manifest");
  Manifest manifest;
  std::string error;
  if (!FromJson(root, &manifest, &error)) {
    throw util::ConfigurationError("clip manifest " + path.string() + ": " + error);
  }
  return manifest;
}

}  // namespace reelsync::pipeline
