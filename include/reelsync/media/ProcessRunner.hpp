// Repository: ReelSync
// Component: Process Runner
// Purpose: Run an external tool with an explicit argv and capture its
//          combined stdout + stderr.
// Copyright (c) 2025 ReelSync

#ifndef REELSYNC_MEDIA_PROCESS_RUNNER_HPP_
#define REELSYNC_MEDIA_PROCESS_RUNNER_HPP_

#include <string>
#include <vector>

namespace reelsync::media {

struct ProcessResult {
  bool launched = false;   // false when fork/exec itself failed
  int exit_code = -1;      // 128 + signal for signalled children
  std::string output;      // stdout and stderr, interleaved
  std::string error;       // launch failure description

  bool Ok() const { return launched && exit_code == 0; }
};

// Renders argv for log lines, quoting arguments that contain spaces.
std::string FormatCommandLine(const std::vector<std::string>& argv);

class IProcessRunner {
 public:
  virtual ~IProcessRunner() = default;

  // argv[0] is resolved through PATH. No shell is involved.
  virtual ProcessResult Run(const std::vector<std::string>& argv) = 0;
};

// fork / execvp / waitpid with a pipe on the child's stdout and stderr.
class PosixProcessRunner : public IProcessRunner {
 public:
  ProcessResult Run(const std::vector<std::string>& argv) override;
};

}  // namespace reelsync::media

#endif  // REELSYNC_MEDIA_PROCESS_RUNNER_HPP_
