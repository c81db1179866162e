// Repository: ReelSync
// Component: Pipeline Orchestrator Implementation
// Copyright (c) 2025 ReelSync

#include "reelsync/pipeline/PipelineOrchestrator.hpp"

#include <map>
#include <sstream>

#include "reelsync/render/ArtifactFetcher.hpp"
#include "reelsync/speech/WavFile.hpp"
#include "reelsync/sync/ClipPairing.hpp"
#include "reelsync/util/Errors.hpp"
#include "reelsync/util/Logger.hpp"

namespace reelsync::pipeline {

namespace {

constexpr const char* kConcatListFilename = "ffmpeg_filelist.txt";

std::string Seconds(std::chrono::milliseconds d) {
  std::ostringstream out;
  out << d.count() / 1000.0 << "s";
  return out.str();
}

void LogToolFailure(const std::string& what, const media::ToolResult& result) {
  util::Logger::Error("[PipelineOrchestrator] " + what + " failed: " + result.error);
  if (!result.output.empty()) {
    util::Logger::Error("[PipelineOrchestrator] tool output:\n" + result.output);
  }
}

PipelineResult Failed(PipelineOutcome outcome, std::string detail) {
  PipelineResult result;
  result.outcome = outcome;
  result.detail = std::move(detail);
  return result;
}

}  // namespace

const char* PipelineOutcomeToString(PipelineOutcome outcome) {
  switch (outcome) {
    case PipelineOutcome::kCompleted: return "COMPLETED";
    case PipelineOutcome::kCompletedSilent: return "COMPLETED_SILENT";
    case PipelineOutcome::kNoValidClips: return "NO_VALID_CLIPS";
    case PipelineOutcome::kToolFailure: return "TOOL_FAILURE";
  }
  return "UNKNOWN";
}

PipelineOrchestrator::PipelineOrchestrator(PipelineConfig config, PipelineDependencies deps)
    : config_(std::move(config)),
      deps_(deps),
      planner_(sync::DurationPlannerConfig{config_.stretch_threshold_s}) {}

void PipelineOrchestrator::Cooldown(std::chrono::milliseconds duration,
                                    const std::string& reason) {
  if (duration.count() <= 0) return;
  util::Logger::Info("[PipelineOrchestrator] Pausing " + Seconds(duration) + " (" + reason + ")");
  deps_.sleeper.SleepFor(duration);
}

// =============================================================================
// Run
// =============================================================================

PipelineResult PipelineOrchestrator::Run() {
  std::string error;
  if (!config_.IsValid(&error)) {
    throw util::ConfigurationError("invalid configuration: " + error);
  }

  const PipelineStage start = config_.from_stage;
  const bool run_render = start == PipelineStage::kRender;
  const bool run_narrate = start != PipelineStage::kAssemble;
  util::Logger::Info(std::string("[PipelineOrchestrator] Starting at stage '") +
                     PipelineStageToString(start) + "', narration mode " +
                     NarrationModeToString(config_.narration_mode));

  // Stage 1: load everything that can fail before the first submission.
  std::vector<ContentItem> items;
  if (run_narrate) {
    items = LoadContentItems(config_.content_file);
    if (config_.voice.Enabled() && !std::filesystem::exists(config_.voice.audio)) {
      throw util::ConfigurationError("reference voice file not found: " +
                                     config_.voice.audio.string());
    }
  }

  Manifest manifest;
  if (run_render) {
    render::JobTemplate job_template = render::JobTemplate::LoadFromFile(config_.workflow_file);
    manifest = RenderStage(items, job_template);
    Cooldown(config_.cooldown_after_render, "render backend hand-off");
  } else {
    manifest = Manifest::LoadOrThrow(config_.ManifestPath());
    util::Logger::Info("[PipelineOrchestrator] Resuming with " +
                       std::to_string(manifest.size()) + " manifest entries from " +
                       config_.ManifestPath().string());
  }

  bool narration_available = false;
  if (run_narrate) {
    narration_available = NarrateStage(items);
    Cooldown(config_.cooldown_after_narration, "speech engine hand-off");
  } else {
    narration_available = NarrationOnDisk();
  }

  PipelineResult result = AssembleStage(manifest, narration_available);
  if (result.Succeeded()) {
    util::Logger::Info(std::string("[PipelineOrchestrator] Finished: ") +
                       PipelineOutcomeToString(result.outcome) + ", " +
                       std::to_string(result.assembled_ids.size()) + " clips -> " +
                       result.final_path.string());
  } else {
    util::Logger::Error(std::string("[PipelineOrchestrator] Run ended: ") +
                        PipelineOutcomeToString(result.outcome) + " (" + result.detail + ")");
  }
  return result;
}

// =============================================================================
// Stage 2: Render
// =============================================================================

Manifest PipelineOrchestrator::RenderStage(const std::vector<ContentItem>& items,
                                           const render::JobTemplate& job_template) {
  const auto missing = job_template.MissingStages(config_.stage_ids);
  if (!missing.empty()) {
    std::string ids;
    for (const auto& id : missing) ids += (ids.empty() ? "'" : ", '") + id + "'";
    throw util::ConfigurationError("workflow template " + config_.workflow_file.string() +
                                   " lacks stage id(s) " + ids);
  }

  render::RenderJobClientConfig client_config;
  client_config.stage_ids = config_.stage_ids;
  client_config.poll_interval = config_.poll_interval;
  client_config.max_poll_attempts = config_.max_poll_attempts;
  client_config.status_log_every = config_.status_log_every;
  render::RenderJobClient client(deps_.backend, job_template, client_config, deps_.sleeper,
                                 deps_.seed_source);
  render::ArtifactFetcher fetcher(deps_.backend);
  const std::filesystem::path clips_dir = config_.Resolve(config_.video_clips_dir);

  Manifest manifest;
  int32_t succeeded = 0;
  for (size_t i = 0; i < items.size(); ++i) {
    const ContentItem& item = items[i];
    const std::string id4 = render::FormatClipId(item.id);

    ClipJob job;
    job.id = item.id;
    job.order = item.order;

    if (item.prompt.empty()) {
      util::Logger::Warn("[PipelineOrchestrator] Skipping clip " + id4 + ": no prompt");
      job.status = render::ClipJobStatus::kSkippedNoPrompt;
      manifest.Append(std::move(job));
      continue;
    }

    util::Logger::Info("[PipelineOrchestrator] Rendering clip " + std::to_string(i + 1) + "/" +
                       std::to_string(items.size()) + " (ID " + id4 + "): '" +
                       item.prompt.substr(0, 50) + "'");

    render::JobOverrides overrides;
    overrides.prompt_text = item.prompt;
    overrides.frames = item.frames.value_or(config_.default_frames);
    overrides.width = item.width.value_or(config_.default_width);
    overrides.height = item.height.value_or(config_.default_height);
    overrides.filename_prefix = "narrativegen_clip_" + id4 + "_";

    render::RenderJobOutcome outcome = client.Run(overrides);
    if (outcome.status == render::ClipJobStatus::kBackendMisconfigured) {
      throw util::ConfigurationError(outcome.detail);
    }
    job.status = outcome.status;
    job.output_locator = outcome.locator;

    if (outcome.status == render::ClipJobStatus::kSuccess) {
      const std::filesystem::path destination =
          clips_dir / render::LocalClipFilename(*outcome.locator);
      render::FetchResult fetched = fetcher.Fetch(*outcome.locator, destination);
      if (fetched.ok) {
        job.local_path = destination;
        ++succeeded;
      } else {
        job.status = render::ClipJobStatus::kDownloadFailed;
      }
    }

    if (job.status != render::ClipJobStatus::kSuccess) {
      util::Logger::Warn(std::string("[PipelineOrchestrator] Clip ") + id4 + " failed: " +
                         render::ClipJobStatusToString(job.status) +
                         (outcome.detail.empty() ? "" : " (" + outcome.detail + ")"));
    }
    manifest.Append(std::move(job));
  }

  std::string error;
  if (!manifest.Save(config_.ManifestPath(), &error)) {
    util::Logger::Error("[PipelineOrchestrator] Could not write manifest: " + error);
  }
  util::Logger::Info("[PipelineOrchestrator] Render stage finished: " +
                     std::to_string(succeeded) + "/" + std::to_string(items.size()) +
                     " clips downloaded");
  return manifest;
}

// =============================================================================
// Stage 4: Narrate
// =============================================================================

bool PipelineOrchestrator::NarrateStage(const std::vector<ContentItem>& items) {
  return config_.narration_mode == NarrationMode::kFull ? NarrateFull(items)
                                                        : NarratePerClip(items);
}

bool PipelineOrchestrator::SaveNarration(speech::Waveform wave,
                                         const std::filesystem::path& path) {
  if (wave.sample_rate != config_.sample_rate) {
    util::Logger::Warn("[PipelineOrchestrator] Speech engine returned " +
                       std::to_string(wave.sample_rate) + " Hz, expected " +
                       std::to_string(config_.sample_rate) + " Hz");
  }
  wave.AppendSilence(config_.tail_padding_s);
  std::string error;
  if (!speech::WriteWavFloat32(path, wave, &error)) {
    util::Logger::Error("[PipelineOrchestrator] Could not save narration: " + error);
    return false;
  }
  std::ostringstream msg;
  msg << "[PipelineOrchestrator] Saved " << path.string() << " (" << wave.DurationSeconds()
      << "s)";
  util::Logger::Info(msg.str());
  return true;
}

bool PipelineOrchestrator::NarratePerClip(const std::vector<ContentItem>& items) {
  const std::filesystem::path dir = config_.Resolve(config_.narration_dir);
  int32_t written = 0;
  for (const ContentItem& item : items) {
    if (item.commentary.empty()) {
      util::Logger::Info("[PipelineOrchestrator] No commentary for clip " +
                         render::FormatClipId(item.id) + ", skipping narration");
      continue;
    }
    speech::SpeechResult result = deps_.speech.Synthesize(
        speech::BuildSpeechRequest(item.commentary, config_.voice, config_.speech_seed));
    if (!result.ok) {
      util::Logger::Error("[PipelineOrchestrator] Speech synthesis failed for clip " +
                          render::FormatClipId(item.id) + ": " + result.error +
                          "; continuing without narration");
      return false;
    }
    if (!SaveNarration(std::move(result.waveform), dir / sync::NarrationFilename(item.id))) {
      return false;
    }
    ++written;
  }
  util::Logger::Info("[PipelineOrchestrator] Narration stage finished: " +
                     std::to_string(written) + " clips");
  return written > 0;
}

bool PipelineOrchestrator::NarrateFull(const std::vector<ContentItem>& items) {
  std::string text;
  for (const ContentItem& item : items) {
    if (item.commentary.empty()) continue;
    if (!text.empty()) text += ' ';
    text += item.commentary;
  }
  if (text.empty()) {
    util::Logger::Info("[PipelineOrchestrator] No commentary found, skipping narration");
    return false;
  }

  util::Logger::Info("[PipelineOrchestrator] Generating full narration (" +
                     std::to_string(text.size()) + " chars)");
  speech::SpeechResult result = deps_.speech.Synthesize(
      speech::BuildSpeechRequest(text, config_.voice, config_.speech_seed));
  if (!result.ok) {
    util::Logger::Error("[PipelineOrchestrator] Speech synthesis failed: " + result.error +
                        "; continuing without narration");
    return false;
  }
  return SaveNarration(std::move(result.waveform),
                       config_.Resolve(config_.narration_dir) / config_.full_narration_filename);
}

bool PipelineOrchestrator::NarrationOnDisk() const {
  const std::filesystem::path dir = config_.Resolve(config_.narration_dir);
  if (config_.narration_mode == NarrationMode::kFull) {
    std::error_code ec;
    return std::filesystem::exists(dir / config_.full_narration_filename, ec);
  }
  return !sync::ScanClipDirectory(dir, sync::ClipFileKind::kNarration).empty();
}

// =============================================================================
// Stage 6: Assemble
// =============================================================================

media::ToolResult PipelineOrchestrator::ConcatClips(
    const std::vector<std::filesystem::path>& inputs, const std::filesystem::path& output) {
  return deps_.media.Concat(inputs, config_.Resolve(config_.logs_dir) / kConcatListFilename,
                            output);
}

PipelineResult PipelineOrchestrator::AssembleStage(const Manifest& manifest,
                                                   bool narration_available) {
  const std::vector<ClipJob> clips = manifest.UsableClips();
  if (clips.empty()) {
    return Failed(PipelineOutcome::kNoValidClips, "no downloaded clips to assemble");
  }
  util::Logger::Info("[PipelineOrchestrator] Assembling " + std::to_string(clips.size()) +
                     " clips");
  if (!narration_available) {
    util::Logger::Warn("[PipelineOrchestrator] Narration unavailable, final video is silent");
    return AssembleSilent(clips);
  }
  return config_.narration_mode == NarrationMode::kFull ? AssembleFull(clips)
                                                        : AssemblePerClip(clips);
}

PipelineResult PipelineOrchestrator::AssembleSilent(const std::vector<ClipJob>& clips) {
  std::vector<std::filesystem::path> inputs;
  PipelineResult result;
  for (const ClipJob& clip : clips) {
    inputs.push_back(*clip.local_path);
    result.assembled_ids.push_back(clip.id);
  }
  result.final_path = config_.Resolve(config_.final_dir) / config_.final_filename;
  media::ToolResult concat = ConcatClips(inputs, result.final_path);
  if (!concat.ok) {
    LogToolFailure("concatenation", concat);
    return Failed(PipelineOutcome::kToolFailure, concat.error);
  }
  result.outcome = PipelineOutcome::kCompletedSilent;
  return result;
}

PipelineResult PipelineOrchestrator::AssemblePerClip(const std::vector<ClipJob>& clips) {
  const auto narrations =
      sync::ScanClipDirectory(config_.Resolve(config_.narration_dir), sync::ClipFileKind::kNarration);
  std::vector<std::filesystem::path> audio_paths;
  for (const auto& entry : narrations) audio_paths.push_back(entry.second);
  std::vector<std::filesystem::path> video_paths;
  for (const ClipJob& clip : clips) video_paths.push_back(*clip.local_path);

  std::map<std::filesystem::path, sync::ClipPairing> by_video;
  for (auto& pairing : sync::PairClips(audio_paths, video_paths)) {
    by_video.emplace(pairing.video, pairing);
  }

  const std::filesystem::path merged_dir = config_.Resolve(config_.merged_clips_dir);
  std::vector<std::filesystem::path> merged;
  PipelineResult result;
  for (const ClipJob& clip : clips) {
    const std::string id4 = render::FormatClipId(clip.id);
    auto it = by_video.find(*clip.local_path);
    if (it == by_video.end()) {
      util::Logger::Info("[PipelineOrchestrator] Skipping clip " + id4 + ": no narration pairing");
      continue;
    }
    const sync::ClipPairing& pairing = it->second;

    auto audio_s = deps_.media.ProbeDuration(pairing.narration);
    auto video_s = deps_.media.ProbeDuration(pairing.video);
    if (!audio_s || !video_s) {
      util::Logger::Warn("[PipelineOrchestrator] Skipping clip " + id4 +
                         ": duration probe failed");
      continue;
    }

    const sync::SyncDecision decision = planner_.Plan(*audio_s, *video_s);
    util::Logger::Info("[PipelineOrchestrator] Clip " + id4 + ": " +
                       sync::DescribeDecision(decision));

    const std::filesystem::path out = merged_dir / ("merged_" + id4 + ".mp4");
    media::ToolResult muxed =
        deps_.media.ApplyAndMux(pairing.video, pairing.narration, decision, out);
    if (!muxed.ok) {
      LogToolFailure("filter+mux of clip " + id4, muxed);
      return Failed(PipelineOutcome::kToolFailure, muxed.error);
    }
    merged.push_back(out);
    result.assembled_ids.push_back(clip.id);
  }

  if (merged.empty()) {
    return Failed(PipelineOutcome::kNoValidClips, "no clip had a usable narration pairing");
  }

  result.final_path = config_.Resolve(config_.final_dir) / config_.final_filename;
  media::ToolResult concat = ConcatClips(merged, result.final_path);
  if (!concat.ok) {
    LogToolFailure("concatenation", concat);
    return Failed(PipelineOutcome::kToolFailure, concat.error);
  }
  result.outcome = PipelineOutcome::kCompleted;
  return result;
}

PipelineResult PipelineOrchestrator::AssembleFull(const std::vector<ClipJob>& clips) {
  std::vector<std::filesystem::path> inputs;
  PipelineResult result;
  for (const ClipJob& clip : clips) {
    inputs.push_back(*clip.local_path);
    result.assembled_ids.push_back(clip.id);
  }

  const std::filesystem::path concatenated =
      config_.Resolve(config_.concatenated_dir) / config_.concatenated_filename;
  media::ToolResult concat = ConcatClips(inputs, concatenated);
  if (!concat.ok) {
    LogToolFailure("concatenation", concat);
    return Failed(PipelineOutcome::kToolFailure, concat.error);
  }

  const std::filesystem::path narration =
      config_.Resolve(config_.narration_dir) / config_.full_narration_filename;
  auto audio_s = deps_.media.ProbeDuration(narration);
  auto video_s = deps_.media.ProbeDuration(concatenated);
  if (!audio_s || !video_s) {
    return Failed(PipelineOutcome::kNoValidClips, "duration probe failed for full narration");
  }

  const sync::SyncDecision decision = planner_.Plan(*audio_s, *video_s);
  util::Logger::Info("[PipelineOrchestrator] Full narration: " + sync::DescribeDecision(decision));

  result.final_path = config_.Resolve(config_.final_dir) / config_.final_filename;
  media::ToolResult muxed =
      deps_.media.ApplyAndMux(concatenated, narration, decision, result.final_path);
  if (!muxed.ok) {
    LogToolFailure("filter+mux of full narration", muxed);
    return Failed(PipelineOutcome::kToolFailure, muxed.error);
  }
  result.outcome = PipelineOutcome::kCompleted;
  return result;
}

}  // namespace reelsync::pipeline
