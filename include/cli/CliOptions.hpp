#pragma once

#include <optional>
#include <string>
#include <vector>

namespace netprov::cli {

/// Parsed command line of the netprov executable.
/// Class abbreviation: co
struct CliOptions {
  std::vector<std::string> vDevices;
  bool bLive = false;      // dry run unless set
  bool bReplace = false;
  bool bCommit = true;
  bool bVerbose = false;
  bool bHelp = false;
};

/// Parse argv. Throws common::ValidationError("invalid_arguments") on
/// unknown options or when no device is named (unless --help).
CliOptions parseCliOptions(int argc, const char* const argv[]);

/// Usage text for --help and argument errors.
std::string usage();

}  // namespace netprov::cli
