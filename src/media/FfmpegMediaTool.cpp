// Repository: ReelSync
// Component: FFmpeg Media Tool Implementation
// Copyright (c) 2025 ReelSync

#include "reelsync/media/FfmpegMediaTool.hpp"

#include <fstream>

#include "reelsync/media/MediaProbe.hpp"
#include "reelsync/util/Logger.hpp"

namespace reelsync::media {

namespace {

std::string EscapeSingleQuotes(const std::string& value) {
  std::string out;
  out.reserve(value.size() + 8U);
  for (char c : value) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  return out;
}

bool EnsureParent(const std::filesystem::path& path, std::string* error) {
  if (!path.has_parent_path()) return true;
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  if (ec) {
    *error = "cannot create " + path.parent_path().string() + ": " + ec.message();
    return false;
  }
  return true;
}

}  // namespace

std::vector<std::string> BuildMuxCommand(const FfmpegMediaToolConfig& config,
                                         const std::filesystem::path& video,
                                         const std::filesystem::path& audio,
                                         const std::string& video_filter,
                                         const std::filesystem::path& output) {
  return {config.ffmpeg_path,
          "-y",
          "-i", video.string(),
          "-i", audio.string(),
          "-filter_complex", "[0:v]" + video_filter + "[v]",
          "-map", "[v]",
          "-map", "1:a",
          "-c:v", config.video_codec,
          "-c:a", config.audio_codec,
          "-shortest",
          output.string()};
}

std::vector<std::string> BuildConcatCommand(const FfmpegMediaToolConfig& config,
                                            const std::filesystem::path& list_file,
                                            const std::filesystem::path& output) {
  return {config.ffmpeg_path, "-y", "-f", "concat", "-safe", "0",
          "-i", list_file.string(), "-c", "copy", output.string()};
}

std::string FormatConcatList(const std::vector<std::filesystem::path>& inputs) {
  std::string list;
  for (const auto& input : inputs) {
    std::error_code ec;
    std::filesystem::path abs = std::filesystem::absolute(input, ec);
    if (ec) abs = input;
    list += "file '" + EscapeSingleQuotes(abs.string()) + "'\n";
  }
  return list;
}

FfmpegMediaTool::FfmpegMediaTool(FfmpegMediaToolConfig config, IProcessRunner& runner)
    : config_(std::move(config)), runner_(runner) {}

std::optional<double> FfmpegMediaTool::ProbeDuration(const std::filesystem::path& path) {
  return ProbeDurationSeconds(path);
}

ToolResult FfmpegMediaTool::RunTool(const std::vector<std::string>& argv,
                                    const std::string& what) {
  util::Logger::Info("[FfmpegMediaTool] " + what + ": " + FormatCommandLine(argv));
  ProcessResult run = runner_.Run(argv);
  if (!run.launched) {
    return ToolResult::Failure(-1, run.output, what + " did not start: " + run.error);
  }
  if (run.exit_code != 0) {
    return ToolResult::Failure(run.exit_code, run.output,
                               what + " exited with code " + std::to_string(run.exit_code));
  }
  return ToolResult::Success(std::move(run.output));
}

ToolResult FfmpegMediaTool::ApplyAndMux(const std::filesystem::path& video,
                                        const std::filesystem::path& audio,
                                        const sync::SyncDecision& decision,
                                        const std::filesystem::path& output) {
  std::string error;
  if (!EnsureParent(output, &error)) return ToolResult::Failure(-1, "", error);
  return RunTool(BuildMuxCommand(config_, video, audio, sync::FilterExpression(decision), output),
                 "filter+mux " + output.filename().string());
}

ToolResult FfmpegMediaTool::Concat(const std::vector<std::filesystem::path>& inputs,
                                   const std::filesystem::path& list_file,
                                   const std::filesystem::path& output) {
  if (inputs.empty()) return ToolResult::Failure(-1, "", "nothing to concatenate");

  std::string error;
  if (!EnsureParent(list_file, &error) || !EnsureParent(output, &error)) {
    return ToolResult::Failure(-1, "", error);
  }
  {
    std::ofstream list(list_file, std::ios::trunc);
    if (!list.is_open()) {
      return ToolResult::Failure(-1, "", "cannot write concat list " + list_file.string());
    }
    list << FormatConcatList(inputs);
    if (!list.good()) {
      return ToolResult::Failure(-1, "", "write failed: " + list_file.string());
    }
  }
  return RunTool(BuildConcatCommand(config_, list_file, output),
                 "concat " + std::to_string(inputs.size()) + " clips");
}

}  // namespace reelsync::media
