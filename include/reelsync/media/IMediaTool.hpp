// Repository: ReelSync
// Component: Media Tool Interface
// Purpose: Duration probe, filter + mux, and concatenation used by final
//          assembly.
// Copyright (c) 2025 ReelSync

#ifndef REELSYNC_MEDIA_IMEDIA_TOOL_HPP_
#define REELSYNC_MEDIA_IMEDIA_TOOL_HPP_

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "reelsync/sync/DurationPlanner.hpp"

namespace reelsync::media {

struct ToolResult {
  bool ok = false;
  int exit_code = -1;
  std::string output;  // captured tool output
  std::string error;

  static ToolResult Success(std::string output = "") {
    return {true, 0, std::move(output), ""};
  }
  static ToolResult Failure(int exit_code, std::string output, std::string error) {
    return {false, exit_code, std::move(output), std::move(error)};
  }
};

class IMediaTool {
 public:
  virtual ~IMediaTool() = default;

  virtual std::optional<double> ProbeDuration(const std::filesystem::path& path) = 0;

  // Applies the decision's video filter to `video`, muxes `audio` as the
  // sole audio track and truncates to the shorter stream.
  virtual ToolResult ApplyAndMux(const std::filesystem::path& video,
                                 const std::filesystem::path& audio,
                                 const sync::SyncDecision& decision,
                                 const std::filesystem::path& output) = 0;

  // Stream-copy concatenation of `inputs`, in order. `list_file` receives
  // the generated concat list.
  virtual ToolResult Concat(const std::vector<std::filesystem::path>& inputs,
                            const std::filesystem::path& list_file,
                            const std::filesystem::path& output) = 0;
};

}  // namespace reelsync::media

#endif  // REELSYNC_MEDIA_IMEDIA_TOOL_HPP_
