// Repository: ReelSync
// Component: Pipeline Orchestrator
// Purpose: Drive render → narrate → reconcile → concatenate for one content
//          list, tolerating per-item failures.
// Copyright (c) 2025 ReelSync

#ifndef REELSYNC_PIPELINE_PIPELINE_ORCHESTRATOR_HPP_
#define REELSYNC_PIPELINE_PIPELINE_ORCHESTRATOR_HPP_

#include <filesystem>
#include <string>
#include <vector>

#include "reelsync/media/IMediaTool.hpp"
#include "reelsync/pipeline/ContentItems.hpp"
#include "reelsync/pipeline/Manifest.hpp"
#include "reelsync/pipeline/PipelineConfig.hpp"
#include "reelsync/render/IRenderBackend.hpp"
#include "reelsync/render/JobTemplate.hpp"
#include "reelsync/render/RenderJobClient.hpp"
#include "reelsync/speech/ISpeechSynthesizer.hpp"
#include "reelsync/sync/DurationPlanner.hpp"
#include "reelsync/time/ISleepStrategy.hpp"

namespace reelsync::pipeline {

enum class PipelineOutcome {
  kCompleted = 0,     // final video written with narration
  kCompletedSilent,   // final video written without narration
  kNoValidClips,      // nothing eligible for assembly; no concatenation
  kToolFailure,       // media tool failed during mux or concat
};

const char* PipelineOutcomeToString(PipelineOutcome outcome);

struct PipelineResult {
  PipelineOutcome outcome = PipelineOutcome::kNoValidClips;
  std::filesystem::path final_path;  // set for kCompleted / kCompletedSilent
  std::vector<int64_t> assembled_ids;  // clip ids in the final video, in order
  std::string detail;

  bool Succeeded() const {
    return outcome == PipelineOutcome::kCompleted ||
           outcome == PipelineOutcome::kCompletedSilent;
  }
};

// External collaborators. All references must outlive the orchestrator.
struct PipelineDependencies {
  render::IRenderBackend& backend;
  speech::ISpeechSynthesizer& speech;
  media::IMediaTool& media;
  time::ISleepStrategy& sleeper;
  render::SeedSource seed_source = nullptr;
};

// PipelineOrchestrator
//
// Stages:
//   1. Load       content items + job template; stage ids validated
//   2. Render     per item: submit, poll, fetch; manifest written once
//   3. Cooldown   cooldown_after_render
//   4. Narrate    per item (or one full narration), tail padded
//   5. Cooldown   cooldown_after_narration
//   6. Assemble   pair, plan, filter+mux, concatenate in `order`
//
// Per-item failures are recorded in the manifest and never abort the run.
// A synthesis failure drops narration for the whole run (silent output).
// Configuration problems throw util::ConfigurationError before any job is
// submitted.
class PipelineOrchestrator {
 public:
  PipelineOrchestrator(PipelineConfig config, PipelineDependencies deps);

  // Runs from config.from_stage to the end.
  // Throws util::ConfigurationError.
  PipelineResult Run();

  // Stage entry points (Run() composes these).

  // Throws util::ConfigurationError on a misconfigured template.
  Manifest RenderStage(const std::vector<ContentItem>& items,
                       const render::JobTemplate& job_template);

  // Returns true when narration is available for assembly.
  bool NarrateStage(const std::vector<ContentItem>& items);

  PipelineResult AssembleStage(const Manifest& manifest, bool narration_available);

  const PipelineConfig& config() const { return config_; }

 private:
  bool NarratePerClip(const std::vector<ContentItem>& items);
  bool NarrateFull(const std::vector<ContentItem>& items);
  bool SaveNarration(speech::Waveform wave, const std::filesystem::path& path);
  bool NarrationOnDisk() const;

  PipelineResult AssemblePerClip(const std::vector<ClipJob>& clips);
  PipelineResult AssembleFull(const std::vector<ClipJob>& clips);
  PipelineResult AssembleSilent(const std::vector<ClipJob>& clips);
  media::ToolResult ConcatClips(const std::vector<std::filesystem::path>& inputs,
                                const std::filesystem::path& output);

  void Cooldown(std::chrono::milliseconds duration, const std::string& reason);

  PipelineConfig config_;
  PipelineDependencies deps_;
  sync::DurationPlanner planner_;
};

}  // namespace reelsync::pipeline

#endif  // REELSYNC_PIPELINE_PIPELINE_ORCHESTRATOR_HPP_
