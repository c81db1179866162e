// Repository: ReelSync
// Component: Pipeline Configuration
// Purpose: Every tunable of a run with its default value, the optional JSON
//          config file, and the directory layout under the work directory.
// Copyright (c) 2025 ReelSync

#ifndef REELSYNC_PIPELINE_PIPELINE_CONFIG_HPP_
#define REELSYNC_PIPELINE_PIPELINE_CONFIG_HPP_

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

#include "reelsync/media/FfmpegMediaTool.hpp"
#include "reelsync/render/HttpRenderBackend.hpp"
#include "reelsync/render/JobTemplate.hpp"
#include "reelsync/speech/ISpeechSynthesizer.hpp"
#include "reelsync/speech/Waveform.hpp"

namespace reelsync::pipeline {

enum class NarrationMode {
  kPerClip = 0,  // one narration per item, paired with its clip
  kFull,         // one narration over the concatenated video
};

const char* NarrationModeToString(NarrationMode mode);
std::optional<NarrationMode> NarrationModeFromString(const std::string& name);

// First stage to run. Later stages read the manifest and narration files a
// previous run left on disk.
enum class PipelineStage {
  kRender = 0,
  kNarrate,
  kAssemble,
};

const char* PipelineStageToString(PipelineStage stage);
std::optional<PipelineStage> PipelineStageFromString(const std::string& name);

struct PipelineConfig {
  // Inputs
  std::filesystem::path content_file = "pregenerated_content.json";
  std::filesystem::path workflow_file = "wan2.1_t2v_workflow.json";

  // Output layout; relative paths resolve against work_dir.
  std::filesystem::path work_dir = ".";
  std::filesystem::path video_clips_dir = "video_outputs/mp4_clips";
  std::filesystem::path merged_clips_dir = "video_outputs/merged_clips";
  std::filesystem::path concatenated_dir = "video_outputs";
  std::filesystem::path narration_dir = "sound_outputs/individual_narrations";
  std::filesystem::path final_dir = "final_video_output";
  std::filesystem::path logs_dir = "logs_and_manifests";
  std::filesystem::path temp_dir = "temp";
  std::string final_filename = "final_narrative_video.mp4";
  std::string concatenated_filename = "concatenated_video_no_audio.mp4";
  std::string full_narration_filename = "full_narration.wav";

  // Render backend
  render::HttpRenderBackendConfig backend;
  render::StageIds stage_ids;
  int32_t default_frames = 65;
  int32_t default_width = 832;
  int32_t default_height = 480;
  std::chrono::milliseconds poll_interval{10'000};
  int32_t max_poll_attempts = 360;
  int32_t status_log_every = 6;

  // GPU hand-off pauses between stages
  std::chrono::milliseconds cooldown_after_render{30'000};
  std::chrono::milliseconds cooldown_after_narration{30'000};

  // Synchronization
  double stretch_threshold_s = 4.0;
  double tail_padding_s = 0.3;

  // Speech
  std::vector<std::string> speech_command;
  int32_t sample_rate = speech::kDefaultSampleRate;  // expected engine rate
  speech::VoiceReference voice;
  std::optional<uint32_t> speech_seed;
  NarrationMode narration_mode = NarrationMode::kPerClip;

  // Media tool
  media::FfmpegMediaToolConfig ffmpeg;

  PipelineStage from_stage = PipelineStage::kRender;

  // `relative` resolved against work_dir (absolute paths are returned as is).
  std::filesystem::path Resolve(const std::filesystem::path& relative) const {
    return work_dir / relative;
  }

  std::filesystem::path ManifestPath() const;

  // Range checks. Returns false and fills *error on the first violation.
  bool IsValid(std::string* error) const;

  // Overlays the keys present in `root` onto `base`. Unknown keys are
  // ignored; a known key of the wrong type throws util::ConfigurationError.
  static PipelineConfig FromJson(const Json::Value& root, PipelineConfig base);
  static PipelineConfig FromJson(const Json::Value& root);

  // Throws util::ConfigurationError when the file is missing or malformed.
  static PipelineConfig LoadFromFile(const std::filesystem::path& path,
                                     PipelineConfig base);
  static PipelineConfig LoadFromFile(const std::filesystem::path& path);
};

// Default `base` spelled as overloads: a default argument of the enclosing
// class type cannot use its member initializers inside the class body.
inline PipelineConfig PipelineConfig::FromJson(const Json::Value& root) {
  return FromJson(root, PipelineConfig{});
}

inline PipelineConfig PipelineConfig::LoadFromFile(const std::filesystem::path& path) {
  return LoadFromFile(path, PipelineConfig{});
}

}  // namespace reelsync::pipeline

#endif  // REELSYNC_PIPELINE_PIPELINE_CONFIG_HPP_
