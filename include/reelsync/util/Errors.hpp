// Repository: ReelSync
// Component: Error Types
// Purpose: Fatal error classes raised before or between pipeline stages.
// Copyright (c) 2025 ReelSync

#ifndef REELSYNC_UTIL_ERRORS_HPP_
#define REELSYNC_UTIL_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace reelsync::util {

// Missing required input file, malformed JSON, unknown workflow stage id or
// an invalid config value. Aborts the run before any job is submitted.
class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& what)
      : std::runtime_error(what) {}
};

}  // namespace reelsync::util

#endif  // REELSYNC_UTIL_ERRORS_HPP_
