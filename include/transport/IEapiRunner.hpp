#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace netprov::transport {

/// Executes eAPI command batches. EapiClient is the network implementation.
class IEapiRunner {
 public:
  virtual ~IEapiRunner() = default;

  /// Run commands in one runCmds call. sFormat is "json" or "text".
  /// Returns the "result" array, one element per command.
  /// Every failure is raised as EapiError.
  virtual nlohmann::json runCmds(const std::vector<std::string>& vCmds,
                                 const std::string& sFormat = "json") = 0;
};

}  // namespace netprov::transport
