// Repository: ReelSync
// Component: FFmpeg Media Tool
// Purpose: IMediaTool over the ffmpeg executable (filters, mux, concat) and
//          libavformat (duration probe).
// Copyright (c) 2025 ReelSync

#ifndef REELSYNC_MEDIA_FFMPEG_MEDIA_TOOL_HPP_
#define REELSYNC_MEDIA_FFMPEG_MEDIA_TOOL_HPP_

#include <string>

#include "reelsync/media/IMediaTool.hpp"
#include "reelsync/media/ProcessRunner.hpp"

namespace reelsync::media {

struct FfmpegMediaToolConfig {
  std::string ffmpeg_path = "ffmpeg";
  std::string video_codec = "libx264";
  std::string audio_codec = "aac";
};

// ffmpeg -y -i <video> -i <audio> -filter_complex "[0:v]<vf>[v]"
//        -map [v] -map 1:a -c:v <vcodec> -c:a <acodec> -shortest <output>
std::vector<std::string> BuildMuxCommand(const FfmpegMediaToolConfig& config,
                                         const std::filesystem::path& video,
                                         const std::filesystem::path& audio,
                                         const std::string& video_filter,
                                         const std::filesystem::path& output);

// ffmpeg -y -f concat -safe 0 -i <list> -c copy <output>
std::vector<std::string> BuildConcatCommand(const FfmpegMediaToolConfig& config,
                                            const std::filesystem::path& list_file,
                                            const std::filesystem::path& output);

// One "file '<absolute path>'" line per input; single quotes in paths are
// written as '\''.
std::string FormatConcatList(const std::vector<std::filesystem::path>& inputs);

class FfmpegMediaTool : public IMediaTool {
 public:
  FfmpegMediaTool(FfmpegMediaToolConfig config, IProcessRunner& runner);

  std::optional<double> ProbeDuration(const std::filesystem::path& path) override;

  ToolResult ApplyAndMux(const std::filesystem::path& video,
                         const std::filesystem::path& audio,
                         const sync::SyncDecision& decision,
                         const std::filesystem::path& output) override;

  ToolResult Concat(const std::vector<std::filesystem::path>& inputs,
                    const std::filesystem::path& list_file,
                    const std::filesystem::path& output) override;

 private:
  ToolResult RunTool(const std::vector<std::string>& argv, const std::string& what);

  FfmpegMediaToolConfig config_;
  IProcessRunner& runner_;
};

}  // namespace reelsync::media

#endif  // REELSYNC_MEDIA_FFMPEG_MEDIA_TOOL_HPP_
