#include "common/Errors.hpp"

#include <gtest/gtest.h>

#include <cstring>

using namespace netprov::common;

TEST(ErrorsTest, AppErrorCarriesKindAndCode) {
  AppError err(FailureKind::Unexpected, "unexpected_error", "Something went wrong");
  EXPECT_EQ(err._kind, FailureKind::Unexpected);
  EXPECT_EQ(err._sErrorCode, "unexpected_error");
  EXPECT_STREQ(err.what(), "Something went wrong");
}

TEST(ErrorsTest, ValidationErrorIsValidation) {
  ValidationError err("platform_missing", "Device has no platform");
  EXPECT_EQ(err._kind, FailureKind::Validation);
  EXPECT_EQ(err._sErrorCode, "platform_missing");
}

TEST(ErrorsTest, NotFoundErrorIsNotFound) {
  NotFoundError err("device_not_found", "Device does not exist");
  EXPECT_EQ(err._kind, FailureKind::NotFound);
}

TEST(ErrorsTest, ConfigUnavailableErrorIsConfigUnavailable) {
  ConfigUnavailableError err("intended_config_missing", "No intended config");
  EXPECT_EQ(err._kind, FailureKind::ConfigUnavailable);
}

TEST(ErrorsTest, SecretAndTemplateErrorsAreCredentialUnavailable) {
  SecretError errSecret("secret_value_not_found", "variable not set");
  UnresolvedVariableError errVar("unresolved_variable", "{{ missing }}");
  EXPECT_EQ(errSecret._kind, FailureKind::CredentialUnavailable);
  EXPECT_EQ(errVar._kind, FailureKind::CredentialUnavailable);
}

TEST(ErrorsTest, SessionErrorsMapToTheirOperation) {
  EXPECT_EQ(ConnectionError("device_unreachable", "x")._kind, FailureKind::ConnectionFailure);
  EXPECT_EQ(StageError("load_failed", "x")._kind, FailureKind::StageFailure);
  EXPECT_EQ(CommitError("commit_rejected", "x")._kind, FailureKind::CommitFailure);
  EXPECT_EQ(DiscardError("discard_failed", "x")._kind, FailureKind::DiscardFailure);
  EXPECT_EQ(CloseError("close_failed", "x")._kind, FailureKind::CloseFailure);
  EXPECT_EQ(DeploymentLockedError("deployment_in_progress", "x")._kind, FailureKind::Locked);
  EXPECT_EQ(CancelledError("deployment_cancelled", "x")._kind, FailureKind::Cancelled);
}

TEST(ErrorsTest, CommitErrorRolledBackDefaultsToFalse) {
  CommitError errPlain("commit_rejected", "rejected");
  CommitError errRestored("commit_rejected", "rejected", true);
  EXPECT_FALSE(errPlain.rolledBack());
  EXPECT_TRUE(errRestored.rolledBack());
}

TEST(ErrorsTest, DerivedCatchableAsBase) {
  try {
    throw StageError("load_failed", "invalid input");
  } catch (const AppError& ex) {
    EXPECT_EQ(ex._kind, FailureKind::StageFailure);
    EXPECT_STREQ(ex.what(), "invalid input");
  }
}

TEST(ErrorsTest, KindNamesAreStable) {
  EXPECT_STREQ(toString(FailureKind::ConfigUnavailable), "config_unavailable");
  EXPECT_STREQ(toString(FailureKind::Locked), "locked");
  EXPECT_STREQ(toString(DeploymentStatus::DryRunDiscarded), "dry_run_discarded");
  EXPECT_STREQ(toString(DeploymentStatus::NoOpNoDiff), "noop_no_diff");
}
