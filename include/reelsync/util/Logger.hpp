// Repository: ReelSync
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission, one full line per call.
// Copyright (c) 2025 ReelSync

#ifndef REELSYNC_UTIL_LOGGER_HPP_
#define REELSYNC_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace reelsync::util {

// Logger provides line-atomic log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes.
//
// Info  → stdout (normal pipeline progress)
// Debug → stdout only when REELSYNC_DEBUG env is set (raw backend payloads)
// Warn  → stderr (per-item failures, degraded but recoverable)
// Error → stderr (stage failures, configuration errors)
//
// Test-only: SetErrorSink / SetInfoSink install a callback invoked for every
// Error() / Info() line (in addition to the stream). Call with nullptr to clear.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static void SetErrorSink(std::function<void(const std::string&)> sink);
  static void SetInfoSink(std::function<void(const std::string&)> sink);

 private:
  static std::mutex mutex_;
  static std::function<void(const std::string&)> error_sink_;
  static std::function<void(const std::string&)> info_sink_;
};

}  // namespace reelsync::util

#endif  // REELSYNC_UTIL_LOGGER_HPP_
