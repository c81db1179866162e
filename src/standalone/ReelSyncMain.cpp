// Repository: ReelSync
// Component: ReelSync Command Line Entry Point
// Purpose: Build the production collaborators from configuration and run
//          the narrated-video pipeline once.
// Copyright (c) 2025 ReelSync
//
// Exit codes:
//   0  final video written (with or without narration)
//   1  stage failure or no valid clips
//   2  configuration error or bad arguments

#include <chrono>
#include <iostream>
#include <string>

#include "reelsync/media/FfmpegMediaTool.hpp"
#include "reelsync/media/ProcessRunner.hpp"
#include "reelsync/pipeline/PipelineConfig.hpp"
#include "reelsync/pipeline/PipelineOrchestrator.hpp"
#include "reelsync/render/HttpRenderBackend.hpp"
#include "reelsync/speech/CommandSpeechSynthesizer.hpp"
#include "reelsync/time/ISleepStrategy.hpp"
#include "reelsync/util/Errors.hpp"
#include "reelsync/util/Logger.hpp"

namespace {

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  std::string config_path;
  std::string content_path;
  std::string workflow_path;
  std::string server_url;
  std::string work_dir;
  std::string from_stage;
  std::string narration_mode;
  bool no_cooldown = false;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Render one clip per content item, narrate it, align durations and\n"
            << "assemble the final narrated video.\n"
            << "\n"
            << "INPUTS:\n"
            << "  --config PATH          JSON config file (all keys optional)\n"
            << "  --content PATH         Content item list (default: pregenerated_content.json)\n"
            << "  --workflow PATH        Render workflow template (default: wan2.1_t2v_workflow.json)\n"
            << "  --server URL           Render backend (default: http://127.0.0.1:8188)\n"
            << "  --work-dir DIR         Base directory for all outputs (default: .)\n"
            << "\n"
            << "RUN CONTROL:\n"
            << "  --from-stage STAGE     render | narrate | assemble (default: render)\n"
            << "  --narration-mode MODE  per_clip | full (default: per_clip)\n"
            << "  --no-cooldown          Skip the pauses between stages\n"
            << "  --help                 Show this help message\n"
            << "\n"
            << "Set REELSYNC_DEBUG=1 to log raw backend payloads and tool command lines.\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--config" && i + 1 < argc) {
      args.config_path = argv[++i];
    } else if (arg == "--content" && i + 1 < argc) {
      args.content_path = argv[++i];
    } else if (arg == "--workflow" && i + 1 < argc) {
      args.workflow_path = argv[++i];
    } else if (arg == "--server" && i + 1 < argc) {
      args.server_url = argv[++i];
    } else if (arg == "--work-dir" && i + 1 < argc) {
      args.work_dir = argv[++i];
    } else if (arg == "--from-stage" && i + 1 < argc) {
      args.from_stage = argv[++i];
    } else if (arg == "--narration-mode" && i + 1 < argc) {
      args.narration_mode = argv[++i];
    } else if (arg == "--no-cooldown") {
      args.no_cooldown = true;
    } else {
      args.error = "Unknown or incomplete argument: " + arg;
      return args;
    }
  }

  if (!args.from_stage.empty() &&
      !reelsync::pipeline::PipelineStageFromString(args.from_stage)) {
    args.error = "--from-stage must be render, narrate or assemble";
    return args;
  }
  if (!args.narration_mode.empty() &&
      !reelsync::pipeline::NarrationModeFromString(args.narration_mode)) {
    args.error = "--narration-mode must be per_clip or full";
    return args;
  }

  args.valid = true;
  return args;
}

// Config file first, then command line flags on top.
reelsync::pipeline::PipelineConfig BuildConfig(const CliArgs& args) {
  using reelsync::pipeline::PipelineConfig;
  PipelineConfig config;
  if (!args.config_path.empty()) {
    config = PipelineConfig::LoadFromFile(args.config_path);
  }
  if (!args.content_path.empty()) config.content_file = args.content_path;
  if (!args.workflow_path.empty()) config.workflow_file = args.workflow_path;
  if (!args.server_url.empty()) config.backend.server_url = args.server_url;
  if (!args.work_dir.empty()) config.work_dir = args.work_dir;
  if (!args.from_stage.empty()) {
    config.from_stage = *reelsync::pipeline::PipelineStageFromString(args.from_stage);
  }
  if (!args.narration_mode.empty()) {
    config.narration_mode = *reelsync::pipeline::NarrationModeFromString(args.narration_mode);
  }
  if (args.no_cooldown) {
    config.cooldown_after_render = std::chrono::milliseconds(0);
    config.cooldown_after_narration = std::chrono::milliseconds(0);
  }
  return config;
}

int Run(const CliArgs& args) {
  namespace rs = reelsync;

  rs::pipeline::PipelineConfig config = BuildConfig(args);
  if (config.speech_command.empty() && config.from_stage != rs::pipeline::PipelineStage::kAssemble) {
    rs::util::Logger::Warn("[ReelSync] No speech_command configured; narration will be skipped");
  }

  rs::render::HttpRenderBackend backend(config.backend);
  rs::media::PosixProcessRunner runner;

  rs::speech::CommandSpeechSynthesizerConfig speech_config;
  speech_config.argv_template = config.speech_command;
  speech_config.scratch_dir = config.Resolve(config.temp_dir);
  rs::speech::CommandSpeechSynthesizer speech(speech_config, runner);

  rs::media::FfmpegMediaTool media(config.ffmpeg, runner);
  rs::time::RealtimeSleepStrategy sleeper;

  rs::pipeline::PipelineOrchestrator orchestrator(
      config, rs::pipeline::PipelineDependencies{backend, speech, media, sleeper});
  rs::pipeline::PipelineResult result = orchestrator.Run();
  return result.Succeeded() ? 0 : 1;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);
  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 2;
  }

  try {
    return Run(args);
  } catch (const reelsync::util::ConfigurationError& e) {
    reelsync::util::Logger::Error(std::string("[ReelSync] Configuration error: ") + e.what());
    return 2;
  }
}
