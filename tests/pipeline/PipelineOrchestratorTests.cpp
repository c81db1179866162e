// Repository: ReelSync
// Component: Pipeline Orchestrator Tests
// Purpose: End-to-end runs against fake collaborators: per-item failure
//          tolerance, content-list ordering, silent fallback, full
//          narration mode, resume and fatal configuration errors.
// Copyright (c) 2025 ReelSync

#include <gtest/gtest.h>

#include "reelsync/pipeline/PipelineOrchestrator.hpp"
#include "reelsync/speech/WavFile.hpp"
#include "reelsync/util/Errors.hpp"
#include "reelsync/util/JsonFile.hpp"
#include "reelsync/util/Logger.hpp"
#include "tests/support/DeterministicSleepStrategy.hpp"
#include "tests/support/FakeMediaTool.hpp"
#include "tests/support/FakeRenderBackend.hpp"
#include "tests/support/FakeSpeechSynthesizer.hpp"
#include "tests/support/TempDir.hpp"

namespace reelsync::testing {
namespace {

using pipeline::PipelineOutcome;
using render::ClipJobStatus;
using sync::SyncTransform;

std::string ClipName(int64_t id) {
  return "narrativegen_clip_" + render::FormatClipId(id) + "__00001.mp4";
}

std::string NarrationName(int64_t id) {
  return "clip_" + render::FormatClipId(id) + "_narration.wav";
}

class PipelineOrchestratorTest : public ::testing::Test {
 protected:
  PipelineOrchestratorTest() {
    Json::Value workflow(Json::objectValue);
    for (const char* id : {"3", "6", "40", "52"}) {
      workflow[id]["inputs"] = Json::Value(Json::objectValue);
    }
    WriteJson("workflow.json", workflow);

    config_.work_dir = dir_.path();
    config_.content_file = dir_.path() / "content.json";
    config_.workflow_file = dir_.path() / "workflow.json";
    config_.poll_interval = std::chrono::milliseconds(1'000);
    config_.max_poll_attempts = 3;
    config_.cooldown_after_render = std::chrono::milliseconds(0);
    config_.cooldown_after_narration = std::chrono::milliseconds(0);
  }

  void WriteJson(const std::string& name, const Json::Value& value) {
    dir_.WriteFile(name, util::ToStyledJson(value));
  }

  // Content list entry; empty prompt / commentary keys are omitted.
  void AddItem(int64_t id, const std::string& prompt, const std::string& commentary) {
    Json::Value item(Json::objectValue);
    item["id"] = Json::Int64(id);
    if (!prompt.empty()) item["image_prompt"] = prompt;
    if (!commentary.empty()) item["commentary"] = commentary;
    content_.append(item);
    WriteJson("content.json", content_);
  }

  // Scripts a job that finishes on the first poll with a downloadable clip.
  void ScriptSuccess(int64_t id, double video_s) {
    const std::string handle = "h" + std::to_string(id);
    FakeRenderBackend::Job job;
    job.history = {render::HistoryResponse::Success(
        FinishedHistory(handle, "52", VideoPayload(ClipName(id))))};
    backend_.QueueJob(handle, job);
    backend_.SetArtifact(ClipName(id), "mp4-bytes");
    media_.SetDuration(ClipName(id), video_s);
  }

  // Scripts a job that never finishes.
  void ScriptTimeout(int64_t id) {
    backend_.QueueJob("h" + std::to_string(id), FakeRenderBackend::Job{});
  }

  pipeline::PipelineResult Run() {
    pipeline::PipelineOrchestrator orchestrator(
        config_, pipeline::PipelineDependencies{backend_, speech_, media_, sleeper_,
                                                [] { return 7u; }});
    return orchestrator.Run();
  }

  std::filesystem::path Path(const std::filesystem::path& relative) const {
    return dir_.path() / relative;
  }

  TempDir dir_;
  Json::Value content_{Json::arrayValue};
  pipeline::PipelineConfig config_;
  FakeRenderBackend backend_;
  FakeSpeechSynthesizer speech_{2.0};
  FakeMediaTool media_;
  DeterministicSleepStrategy sleeper_;
};

TEST_F(PipelineOrchestratorTest, PerClipRunAlignsEveryClip) {
  AddItem(1, "fox", "Foxes are clever.");
  AddItem(2, "whale", "Whales sing.");
  AddItem(3, "owl", "Owls hunt at night.");
  ScriptSuccess(1, 5.0);
  ScriptSuccess(2, 5.0);
  ScriptSuccess(3, 5.0);
  media_.SetDuration(NarrationName(1), 7.0);   // +2s -> stretch
  media_.SetDuration(NarrationName(2), 12.0);  // +7s -> freeze pad
  media_.SetDuration(NarrationName(3), 3.0);   // shorter -> none

  auto result = Run();
  ASSERT_EQ(result.outcome, PipelineOutcome::kCompleted) << result.detail;
  EXPECT_EQ(result.assembled_ids, (std::vector<int64_t>{1, 2, 3}));
  EXPECT_EQ(result.final_path, Path("final_video_output/final_narrative_video.mp4"));

  ASSERT_EQ(media_.mux_calls().size(), 3u);
  EXPECT_EQ(media_.mux_calls()[0].decision.transform, SyncTransform::kStretch);
  EXPECT_DOUBLE_EQ(media_.mux_calls()[0].decision.parameter, 1.4);
  EXPECT_EQ(media_.mux_calls()[1].decision.transform, SyncTransform::kFreezePad);
  EXPECT_DOUBLE_EQ(media_.mux_calls()[1].decision.parameter, 7.0);
  EXPECT_EQ(media_.mux_calls()[2].decision.transform, SyncTransform::kNone);
  EXPECT_EQ(media_.mux_calls()[0].video, Path("video_outputs/mp4_clips") / ClipName(1));
  EXPECT_EQ(media_.mux_calls()[0].audio,
            Path("sound_outputs/individual_narrations") / NarrationName(1));

  ASSERT_EQ(media_.concat_calls().size(), 1u);
  EXPECT_EQ(media_.concat_calls()[0].inputs,
            (std::vector<std::filesystem::path>{
                Path("video_outputs/merged_clips/merged_0001.mp4"),
                Path("video_outputs/merged_clips/merged_0002.mp4"),
                Path("video_outputs/merged_clips/merged_0003.mp4")}));
  EXPECT_TRUE(std::filesystem::exists(config_.ManifestPath()));
}

TEST_F(PipelineOrchestratorTest, NarrationFilesArePaddedAtTheTail) {
  AddItem(1, "fox", "Foxes are clever.");
  ScriptSuccess(1, 5.0);
  media_.SetDuration(NarrationName(1), 2.3);
  Run();

  speech::Waveform wave;
  std::string error;
  ASSERT_TRUE(speech::ReadWav(Path("sound_outputs/individual_narrations") / NarrationName(1),
                              &wave, &error))
      << error;
  EXPECT_NEAR(wave.DurationSeconds(), 2.3, 1e-6);
}

TEST_F(PipelineOrchestratorTest, PerItemFailuresDoNotStopTheRun) {
  AddItem(1, "fox", "Foxes are clever.");
  AddItem(2, "whale", "Whales sing.");
  AddItem(3, "", "No picture for this one.");
  AddItem(4, "owl", "Owls hunt at night.");
  ScriptSuccess(1, 5.0);
  ScriptTimeout(2);
  ScriptSuccess(4, 5.0);
  backend_.SetArtifact(ClipName(4), "");  // zero-byte transfer
  media_.SetDuration(NarrationName(1), 5.0);
  media_.SetDuration(NarrationName(4), 5.0);

  auto result = Run();
  ASSERT_EQ(result.outcome, PipelineOutcome::kCompleted) << result.detail;
  EXPECT_EQ(result.assembled_ids, (std::vector<int64_t>{1}));
  EXPECT_EQ(backend_.submitted().size(), 3u);

  pipeline::Manifest manifest = pipeline::Manifest::LoadOrThrow(config_.ManifestPath());
  ASSERT_EQ(manifest.size(), 4u);
  EXPECT_EQ(manifest.Find(1)->status, ClipJobStatus::kSuccess);
  EXPECT_EQ(manifest.Find(2)->status, ClipJobStatus::kTimeout);
  EXPECT_EQ(manifest.Find(3)->status, ClipJobStatus::kSkippedNoPrompt);
  EXPECT_EQ(manifest.Find(4)->status, ClipJobStatus::kDownloadFailed);
  EXPECT_FALSE(manifest.Find(4)->local_path.has_value());
}

TEST_F(PipelineOrchestratorTest, FinalOrderFollowsContentListNotIds) {
  AddItem(5, "fox", "Foxes are clever.");
  AddItem(2, "whale", "Whales sing.");
  ScriptSuccess(5, 5.0);
  ScriptSuccess(2, 5.0);
  media_.SetDuration(NarrationName(5), 5.0);
  media_.SetDuration(NarrationName(2), 5.0);

  auto result = Run();
  ASSERT_EQ(result.outcome, PipelineOutcome::kCompleted) << result.detail;
  EXPECT_EQ(result.assembled_ids, (std::vector<int64_t>{5, 2}));
  ASSERT_EQ(media_.concat_calls().size(), 1u);
  EXPECT_EQ(media_.concat_calls()[0].inputs[0].filename(), "merged_0005.mp4");
  EXPECT_EQ(media_.concat_calls()[0].inputs[1].filename(), "merged_0002.mp4");
}

TEST_F(PipelineOrchestratorTest, NoValidClipsSkipsConcatenation) {
  AddItem(1, "fox", "Foxes are clever.");
  AddItem(2, "whale", "Whales sing.");
  ScriptTimeout(1);
  backend_.FailNextSubmit("connection refused");
  ScriptTimeout(2);

  auto result = Run();
  EXPECT_EQ(result.outcome, PipelineOutcome::kNoValidClips);
  EXPECT_FALSE(result.Succeeded());
  EXPECT_TRUE(media_.concat_calls().empty());
  EXPECT_TRUE(media_.mux_calls().empty());
}

TEST_F(PipelineOrchestratorTest, SpeechFailureFallsBackToSilentVideo) {
  AddItem(1, "fox", "Foxes are clever.");
  AddItem(2, "whale", "Whales sing.");
  ScriptSuccess(1, 5.0);
  ScriptSuccess(2, 5.0);
  speech_.FailOnCall(2);

  auto result = Run();
  ASSERT_EQ(result.outcome, PipelineOutcome::kCompletedSilent) << result.detail;
  EXPECT_TRUE(result.Succeeded());
  EXPECT_TRUE(media_.mux_calls().empty());
  ASSERT_EQ(media_.concat_calls().size(), 1u);
  EXPECT_EQ(media_.concat_calls()[0].inputs,
            (std::vector<std::filesystem::path>{Path("video_outputs/mp4_clips") / ClipName(1),
                                                Path("video_outputs/mp4_clips") / ClipName(2)}));
}

TEST_F(PipelineOrchestratorTest, FullNarrationModeAlignsConcatenatedVideo) {
  config_.narration_mode = pipeline::NarrationMode::kFull;
  AddItem(1, "fox", "Foxes are clever.");
  AddItem(2, "whale", "");
  AddItem(3, "owl", "Owls hunt at night.");
  ScriptSuccess(1, 5.0);
  ScriptSuccess(2, 5.0);
  ScriptSuccess(3, 5.0);
  media_.SetDuration("full_narration.wav", 18.0);  // +3s over 15s -> stretch

  auto result = Run();
  ASSERT_EQ(result.outcome, PipelineOutcome::kCompleted) << result.detail;
  ASSERT_EQ(speech_.requests().size(), 1u);
  EXPECT_EQ(speech_.requests()[0].text, "Foxes are clever. Owls hunt at night.");

  ASSERT_EQ(media_.concat_calls().size(), 1u);
  EXPECT_EQ(media_.concat_calls()[0].output,
            Path("video_outputs/concatenated_video_no_audio.mp4"));
  ASSERT_EQ(media_.mux_calls().size(), 1u);
  EXPECT_EQ(media_.mux_calls()[0].decision.transform, SyncTransform::kStretch);
  EXPECT_DOUBLE_EQ(media_.mux_calls()[0].decision.parameter, 1.2);
  EXPECT_EQ(media_.mux_calls()[0].output, result.final_path);
}

TEST_F(PipelineOrchestratorTest, MisconfiguredTemplateFailsBeforeAnySubmission) {
  Json::Value workflow(Json::objectValue);
  workflow["3"]["inputs"] = Json::Value(Json::objectValue);
  WriteJson("workflow.json", workflow);
  AddItem(1, "fox", "Foxes are clever.");

  EXPECT_THROW(Run(), util::ConfigurationError);
  EXPECT_TRUE(backend_.submitted().empty());
}

TEST_F(PipelineOrchestratorTest, MissingContentFileIsFatal) {
  EXPECT_THROW(Run(), util::ConfigurationError);
  EXPECT_TRUE(backend_.submitted().empty());
}

TEST_F(PipelineOrchestratorTest, MuxFailureIsReportedAsToolFailure) {
  AddItem(1, "fox", "Foxes are clever.");
  ScriptSuccess(1, 5.0);
  media_.SetDuration(NarrationName(1), 6.0);
  media_.FailMux();

  std::vector<std::string> errors;
  util::Logger::SetErrorSink([&errors](const std::string& line) { errors.push_back(line); });
  auto result = Run();
  util::Logger::SetErrorSink(nullptr);

  EXPECT_EQ(result.outcome, PipelineOutcome::kToolFailure);
  EXPECT_TRUE(media_.concat_calls().empty());
  bool logged_output = false;
  for (const auto& line : errors) {
    if (line.find("Invalid filter") != std::string::npos) logged_output = true;
  }
  EXPECT_TRUE(logged_output);
}

TEST_F(PipelineOrchestratorTest, CooldownsUseTheSleepStrategy) {
  config_.cooldown_after_render = std::chrono::milliseconds(30'000);
  config_.cooldown_after_narration = std::chrono::milliseconds(30'000);
  AddItem(1, "fox", "Foxes are clever.");
  ScriptSuccess(1, 5.0);
  media_.SetDuration(NarrationName(1), 5.0);

  Run();
  EXPECT_EQ(sleeper_.sleeps(), (std::vector<std::chrono::milliseconds>{
                                   std::chrono::milliseconds(1'000),
                                   std::chrono::milliseconds(30'000),
                                   std::chrono::milliseconds(30'000)}));
}

TEST_F(PipelineOrchestratorTest, ResumeFromAssembleUsesFilesOnDisk) {
  const auto clip = dir_.WriteFile("video_outputs/mp4_clips/" + ClipName(1), "mp4-bytes");
  dir_.WriteFile("sound_outputs/individual_narrations/" + NarrationName(1), "wav");
  pipeline::Manifest manifest;
  pipeline::ClipJob job;
  job.id = 1;
  job.status = ClipJobStatus::kSuccess;
  job.local_path = clip;
  manifest.Append(job);
  std::string error;
  ASSERT_TRUE(manifest.Save(config_.ManifestPath(), &error)) << error;

  media_.SetDuration(ClipName(1), 5.0);
  media_.SetDuration(NarrationName(1), 6.0);
  config_.from_stage = pipeline::PipelineStage::kAssemble;

  auto result = Run();
  ASSERT_EQ(result.outcome, PipelineOutcome::kCompleted) << result.detail;
  EXPECT_EQ(result.assembled_ids, (std::vector<int64_t>{1}));
  EXPECT_TRUE(backend_.submitted().empty());
  EXPECT_TRUE(speech_.requests().empty());
}

TEST_F(PipelineOrchestratorTest, ResumeWithoutManifestIsFatal) {
  config_.from_stage = pipeline::PipelineStage::kAssemble;
  EXPECT_THROW(Run(), util::ConfigurationError);
}

}  // namespace
}  // namespace reelsync::testing
