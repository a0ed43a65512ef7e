#include "cli/CliOptions.hpp"

#include "common/Errors.hpp"

#include <boost/program_options.hpp>

#include <sstream>

namespace po = boost::program_options;

namespace netprov::cli {

namespace {

po::options_description visibleOptions() {
  po::options_description odVisible("Options");
  odVisible.add_options()
      ("help,h", "show this help")
      ("live", "apply changes (default is a dry run that only shows the diff)")
      ("replace", "replace the entire running configuration instead of merging")
      ("no-commit", "stage and diff but discard instead of committing")
      ("verbose,v", "include debug and info lines in the per-device trail");
  return odVisible;
}

}  // namespace

std::string usage() {
  std::ostringstream oss;
  oss << "Usage: netprov [--live] [--replace] [--no-commit] [--verbose] DEVICE...\n\n"
      << visibleOptions();
  return oss.str();
}

CliOptions parseCliOptions(int argc, const char* const argv[]) {
  po::options_description odAll;
  odAll.add(visibleOptions());
  odAll.add_options()("device", po::value<std::vector<std::string>>(), "device names");

  po::positional_options_description podPositional;
  podPositional.add("device", -1);

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(odAll)
                  .positional(podPositional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    throw common::ValidationError("invalid_arguments", ex.what());
  }

  CliOptions co;
  co.bHelp = vm.count("help") > 0;
  co.bLive = vm.count("live") > 0;
  co.bReplace = vm.count("replace") > 0;
  co.bCommit = vm.count("no-commit") == 0;
  co.bVerbose = vm.count("verbose") > 0;
  if (vm.count("device")) {
    co.vDevices = vm["device"].as<std::vector<std::string>>();
  }

  if (!co.bHelp && co.vDevices.empty()) {
    throw common::ValidationError("invalid_arguments", "at least one DEVICE is required");
  }
  return co;
}

}  // namespace netprov::cli
