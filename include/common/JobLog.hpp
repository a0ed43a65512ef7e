#pragma once

#include <string>
#include <utility>
#include <vector>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "common/Types.hpp"

namespace netprov::common {

/// Per-attempt diagnostic trail. Every entry goes to spdlog and, depending on
/// its tier, into the trail handed back to the caller with the result.
/// Debug and Info entries are kept only in verbose mode.
/// Registered secrets are replaced by "<hidden>" before anything is emitted.
/// Class abbreviation: jl
class JobLog {
 public:
  explicit JobLog(std::string sDevice, bool bVerbose = false);
  ~JobLog();

  JobLog(const JobLog&) = delete;
  JobLog& operator=(const JobLog&) = delete;

  /// Register a value that must never appear in emitted text.
  void addSecret(const std::string& sSecret);

  template <typename... Args>
  void debug(spdlog::format_string_t<Args...> fmtMsg, Args&&... args) {
    record(LogTier::Debug, fmt::format(fmtMsg, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void info(spdlog::format_string_t<Args...> fmtMsg, Args&&... args) {
    record(LogTier::Info, fmt::format(fmtMsg, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void success(spdlog::format_string_t<Args...> fmtMsg, Args&&... args) {
    record(LogTier::Success, fmt::format(fmtMsg, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void warn(spdlog::format_string_t<Args...> fmtMsg, Args&&... args) {
    record(LogTier::Warning, fmt::format(fmtMsg, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void error(spdlog::format_string_t<Args...> fmtMsg, Args&&... args) {
    record(LogTier::Error, fmt::format(fmtMsg, std::forward<Args>(args)...));
  }

  void record(LogTier tier, std::string sMessage);

  bool verbose() const { return _bVerbose; }
  const std::string& device() const { return _sDevice; }
  const std::vector<LogEntry>& entries() const { return _vEntries; }

  /// Move the collected trail out (used when building the result).
  std::vector<LogEntry> takeEntries();

  /// sText with every registered secret replaced by "<hidden>".
  std::string redact(std::string sText) const;

 private:
  std::string _sDevice;
  bool _bVerbose;
  std::vector<std::string> _vSecrets;
  std::vector<LogEntry> _vEntries;
};

}  // namespace netprov::common
