#include "cli/CliOptions.hpp"

#include "common/Errors.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using netprov::cli::CliOptions;
using netprov::cli::parseCliOptions;
using netprov::cli::usage;
using netprov::common::ValidationError;

namespace {

CliOptions parse(std::vector<const char*> vArgs) {
  vArgs.insert(vArgs.begin(), "netprov");
  return parseCliOptions(static_cast<int>(vArgs.size()), vArgs.data());
}

}  // namespace

TEST(CliOptionsTest, DefaultsToDryRunMergeWithCommit) {
  auto co = parse({"leaf1"});
  ASSERT_EQ(co.vDevices.size(), 1u);
  EXPECT_EQ(co.vDevices[0], "leaf1");
  EXPECT_FALSE(co.bLive);
  EXPECT_FALSE(co.bReplace);
  EXPECT_TRUE(co.bCommit);
  EXPECT_FALSE(co.bVerbose);
  EXPECT_FALSE(co.bHelp);
}

TEST(CliOptionsTest, FlagsAndSeveralDevices) {
  auto co = parse({"--live", "leaf1", "--replace", "leaf2", "--no-commit", "-v", "spine1"});
  EXPECT_TRUE(co.bLive);
  EXPECT_TRUE(co.bReplace);
  EXPECT_FALSE(co.bCommit);
  EXPECT_TRUE(co.bVerbose);
  EXPECT_EQ(co.vDevices, (std::vector<std::string>{"leaf1", "leaf2", "spine1"}));
}

TEST(CliOptionsTest, MissingDeviceIsRejected) {
  try {
    parse({"--live"});
    FAIL() << "expected ValidationError";
  } catch (const ValidationError& ex) {
    EXPECT_EQ(ex._sErrorCode, "invalid_arguments");
  }
}

TEST(CliOptionsTest, UnknownOptionIsRejected) {
  EXPECT_THROW(parse({"--force", "leaf1"}), ValidationError);
}

TEST(CliOptionsTest, HelpNeedsNoDevice) {
  auto co = parse({"--help"});
  EXPECT_TRUE(co.bHelp);
  EXPECT_TRUE(co.vDevices.empty());
}

TEST(CliOptionsTest, UsageListsFlags) {
  const std::string sUsage = usage();
  EXPECT_NE(sUsage.find("--live"), std::string::npos);
  EXPECT_NE(sUsage.find("--no-commit"), std::string::npos);
  EXPECT_EQ(sUsage.find("--device"), std::string::npos);
}
