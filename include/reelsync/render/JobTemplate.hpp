// Repository: ReelSync
// Component: Render Job Template
// Purpose: The loaded render workflow (stage id → stage object) shared by
//          every job of a run, and per-item job specification building.
// Copyright (c) 2025 ReelSync

#ifndef REELSYNC_RENDER_JOB_TEMPLATE_HPP_
#define REELSYNC_RENDER_JOB_TEMPLATE_HPP_

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

namespace reelsync::render {

// Workflow stage ids the job client writes into / reads from.
struct StageIds {
  std::string prompt = "6";    // inputs.text
  std::string sampler = "3";   // inputs.seed
  std::string latent = "40";   // inputs.length / width / height
  std::string output = "52";   // inputs.filename_prefix; history outputs key
};

// Per-item values written into a copy of the template.
struct JobOverrides {
  std::string prompt_text;
  uint32_t seed = 0;
  int32_t frames = 65;
  int32_t width = 832;
  int32_t height = 480;
  std::string filename_prefix;
};

// JobTemplate wraps the backend workflow document. The template is never
// mutated; BuildJobSpec works on a deep copy.
class JobTemplate {
 public:
  JobTemplate() = default;
  explicit JobTemplate(Json::Value workflow);

  // Throws util::ConfigurationError when the file is missing, malformed or
  // not a JSON object.
  static JobTemplate LoadFromFile(const std::filesystem::path& path);

  bool HasStage(const std::string& stage_id) const;

  // Configured stage ids absent from the template (empty when valid).
  std::vector<std::string> MissingStages(const StageIds& ids) const;

  // Deep copy with overrides applied. Empty optional when a configured
  // stage id is missing from the template.
  std::optional<Json::Value> BuildJobSpec(const StageIds& ids,
                                          const JobOverrides& overrides) const;

  const Json::Value& workflow() const { return workflow_; }

 private:
  Json::Value workflow_{Json::objectValue};
};

}  // namespace reelsync::render

#endif  // REELSYNC_RENDER_JOB_TEMPLATE_HPP_
