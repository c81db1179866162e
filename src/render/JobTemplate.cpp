// Repository: ReelSync
// Component: Render Job Template Implementation
// Copyright (c) 2025 ReelSync

#include "reelsync/render/JobTemplate.hpp"

#include "reelsync/util/Errors.hpp"
#include "reelsync/util/JsonFile.hpp"
#include "reelsync/util/Logger.hpp"

namespace reelsync::render {

JobTemplate::JobTemplate(Json::Value workflow) : workflow_(std::move(workflow)) {}

JobTemplate JobTemplate::LoadFromFile(const std::filesystem::path& path) {
  Json::Value root = util::ReadJsonFileOrThrow(path, "workflow template");
  if (!root.isObject() || root.empty()) {
    throw util::ConfigurationError("workflow template " + path.string() +
                                   " is not a non-empty JSON object");
  }
  util::Logger::Info("[JobTemplate] Loaded workflow " + path.string() + " (" +
                     std::to_string(root.size()) + " stages)");
  return JobTemplate(std::move(root));
}

bool JobTemplate::HasStage(const std::string& stage_id) const {
  if (!workflow_.isObject() || !workflow_.isMember(stage_id)) return false;
  const Json::Value& stage = workflow_[stage_id];
  return stage.isObject() && (!stage.isMember("inputs") || stage["inputs"].isObject());
}

std::vector<std::string> JobTemplate::MissingStages(const StageIds& ids) const {
  std::vector<std::string> missing;
  for (const std::string* id : {&ids.prompt, &ids.sampler, &ids.latent, &ids.output}) {
    if (!HasStage(*id)) missing.push_back(*id);
  }
  return missing;
}

std::optional<Json::Value> JobTemplate::BuildJobSpec(
    const StageIds& ids, const JobOverrides& overrides) const {
  if (!MissingStages(ids).empty()) return std::nullopt;

  Json::Value spec = workflow_;  // deep copy

  spec[ids.prompt]["inputs"]["text"] = overrides.prompt_text;
  spec[ids.sampler]["inputs"]["seed"] = Json::UInt64(overrides.seed);

  Json::Value& latent = spec[ids.latent]["inputs"];
  latent["length"] = overrides.frames;
  latent["width"] = overrides.width;
  latent["height"] = overrides.height;

  spec[ids.output]["inputs"]["filename_prefix"] = overrides.filename_prefix;
  return spec;
}

}  // namespace reelsync::render
