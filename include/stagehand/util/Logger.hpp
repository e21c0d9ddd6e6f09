// Repository: Stagehand
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission for the tick thread and control plane.
// Copyright (c) 2025 Stagehand

#ifndef STAGEHAND_UTIL_LOGGER_HPP_
#define STAGEHAND_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace stagehand::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes. The tick thread, loader completion threads and gRPC handlers
// may all log concurrently.
//
// Info  -> stdout (normal operational logs)
// Debug -> stdout only when STAGEHAND_DEBUG env is set or SetDebugEnabled(true)
// Warn  -> stderr (missing collaborators, degraded but recoverable)
// Error -> stderr (configuration errors, failed loads)
//
// Test-only: the Set*Sink hooks install a callback invoked for every line of
// that severity (in addition to the stream). Pass nullptr to clear.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static void SetDebugEnabled(bool enabled);
  static bool IsDebugEnabled();

  static void SetInfoSink(std::function<void(const std::string&)> sink);
  static void SetWarnSink(std::function<void(const std::string&)> sink);
  static void SetErrorSink(std::function<void(const std::string&)> sink);

 private:
  static std::mutex mutex_;
  static bool debug_enabled_;
  static std::function<void(const std::string&)> info_sink_;
  static std::function<void(const std::string&)> warn_sink_;
  static std::function<void(const std::string&)> error_sink_;
};

}  // namespace stagehand::util

#endif  // STAGEHAND_UTIL_LOGGER_HPP_
