// Repository: ReelSync
// Component: Render Job Template Tests
// Copyright (c) 2025 ReelSync

#include <gtest/gtest.h>

#include "reelsync/render/JobTemplate.hpp"
#include "reelsync/util/Errors.hpp"
#include "reelsync/util/JsonFile.hpp"
#include "tests/support/TempDir.hpp"

namespace reelsync::testing {
namespace {

const char* kWorkflow = R"({
  "3":  {"class_type": "KSampler", "inputs": {"seed": 1, "steps": 30}},
  "6":  {"class_type": "CLIPTextEncode", "inputs": {"text": "placeholder"}},
  "40": {"class_type": "EmptyLatentVideo", "inputs": {"length": 33, "width": 512, "height": 512}},
  "52": {"class_type": "SaveVideo", "inputs": {"filename_prefix": "ComfyUI"}}
})";

render::JobTemplate MakeTemplate() {
  Json::Value root;
  std::string error;
  EXPECT_TRUE(util::ParseJson(kWorkflow, &root, &error)) << error;
  return render::JobTemplate(root);
}

TEST(JobTemplateTest, BuildJobSpecAppliesOverrides) {
  render::JobTemplate tmpl = MakeTemplate();
  render::JobOverrides overrides;
  overrides.prompt_text = "a lighthouse at dusk";
  overrides.seed = 4294967295u;
  overrides.frames = 81;
  overrides.width = 640;
  overrides.height = 360;
  overrides.filename_prefix = "narrativegen_clip_0007_";

  auto spec = tmpl.BuildJobSpec(render::StageIds{}, overrides);
  ASSERT_TRUE(spec.has_value());
  const Json::Value& s = *spec;
  EXPECT_EQ(s["6"]["inputs"]["text"].asString(), "a lighthouse at dusk");
  EXPECT_EQ(s["3"]["inputs"]["seed"].asUInt64(), 4294967295u);
  EXPECT_EQ(s["3"]["inputs"]["steps"].asInt(), 30);
  EXPECT_EQ(s["40"]["inputs"]["length"].asInt(), 81);
  EXPECT_EQ(s["40"]["inputs"]["width"].asInt(), 640);
  EXPECT_EQ(s["40"]["inputs"]["height"].asInt(), 360);
  EXPECT_EQ(s["52"]["inputs"]["filename_prefix"].asString(), "narrativegen_clip_0007_");
}

TEST(JobTemplateTest, TemplateIsNotMutated) {
  render::JobTemplate tmpl = MakeTemplate();
  render::JobOverrides overrides;
  overrides.prompt_text = "changed";
  ASSERT_TRUE(tmpl.BuildJobSpec(render::StageIds{}, overrides).has_value());
  EXPECT_EQ(tmpl.workflow()["6"]["inputs"]["text"].asString(), "placeholder");
  EXPECT_EQ(tmpl.workflow()["40"]["inputs"]["length"].asInt(), 33);
}

TEST(JobTemplateTest, MissingStageIdsReported) {
  render::JobTemplate tmpl = MakeTemplate();
  render::StageIds ids;
  ids.output = "99";
  ids.latent = "41";
  auto missing = tmpl.MissingStages(ids);
  ASSERT_EQ(missing.size(), 2u);
  EXPECT_EQ(missing[0], "41");
  EXPECT_EQ(missing[1], "99");
  EXPECT_FALSE(tmpl.BuildJobSpec(ids, render::JobOverrides{}).has_value());
}

TEST(JobTemplateTest, StageWithNonObjectInputsIsNotUsable) {
  Json::Value root(Json::objectValue);
  root["6"]["inputs"] = "broken";
  render::JobTemplate tmpl(root);
  EXPECT_FALSE(tmpl.HasStage("6"));
  EXPECT_FALSE(tmpl.HasStage("3"));
}

TEST(JobTemplateTest, LoadFromFileErrors) {
  TempDir dir;
  EXPECT_THROW(render::JobTemplate::LoadFromFile(dir.path() / "missing.json"),
               util::ConfigurationError);
  EXPECT_THROW(render::JobTemplate::LoadFromFile(dir.WriteFile("bad.json", "{ nope")),
               util::ConfigurationError);
  EXPECT_THROW(render::JobTemplate::LoadFromFile(dir.WriteFile("list.json", "[1, 2]")),
               util::ConfigurationError);
  EXPECT_THROW(render::JobTemplate::LoadFromFile(dir.WriteFile("empty.json", "{}")),
               util::ConfigurationError);

  auto tmpl = render::JobTemplate::LoadFromFile(dir.WriteFile("ok.json", kWorkflow));
  EXPECT_TRUE(tmpl.MissingStages(render::StageIds{}).empty());
}

}  // namespace
}  // namespace reelsync::testing
