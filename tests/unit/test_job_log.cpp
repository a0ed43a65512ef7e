#include "common/JobLog.hpp"

#include <gtest/gtest.h>

#include <string>

using netprov::common::JobLog;
using netprov::common::LogTier;

TEST(JobLogTest, QuietModeKeepsOnlySuccessWarningError) {
  JobLog jl("leaf1");
  jl.debug("debug {}", 1);
  jl.info("info {}", 2);
  jl.success("done");
  jl.warn("careful");
  jl.error("broken: {}", "x");

  const auto& vEntries = jl.entries();
  ASSERT_EQ(vEntries.size(), 3u);
  EXPECT_EQ(vEntries[0].tier, LogTier::Success);
  EXPECT_EQ(vEntries[1].tier, LogTier::Warning);
  EXPECT_EQ(vEntries[2].tier, LogTier::Error);
  EXPECT_EQ(vEntries[2].sMessage, "broken: x");
}

TEST(JobLogTest, VerboseModeKeepsEverything) {
  JobLog jl("leaf1", true);
  jl.debug("d");
  jl.info("i");
  EXPECT_EQ(jl.entries().size(), 2u);
  EXPECT_TRUE(jl.verbose());
  EXPECT_EQ(jl.device(), "leaf1");
}

TEST(JobLogTest, RegisteredSecretsAreHidden) {
  JobLog jl("leaf1", true);
  jl.addSecret("hunter2");
  jl.addSecret("");
  jl.info("password hunter2 and again hunter2");
  ASSERT_EQ(jl.entries().size(), 1u);
  EXPECT_EQ(jl.entries()[0].sMessage, "password <hidden> and again <hidden>");
}

TEST(JobLogTest, TakeEntriesEmptiesTrail) {
  JobLog jl("leaf1");
  jl.warn("w");
  auto vTaken = jl.takeEntries();
  EXPECT_EQ(vTaken.size(), 1u);
  EXPECT_TRUE(jl.entries().empty());
}
