#include "common/Types.hpp"

#include <openssl/crypto.h>

namespace netprov::common {

std::string Credentials::redacted() const {
  return sUsername + "/<hidden>";
}

void Credentials::scrub() {
  if (!sPassword.empty()) {
    OPENSSL_cleanse(sPassword.data(), sPassword.size());
  }
  sPassword.clear();
}

const char* toString(DeploymentStatus status) {
  switch (status) {
    case DeploymentStatus::NoChangeRequested: return "no_change_requested";
    case DeploymentStatus::Committed: return "committed";
    case DeploymentStatus::Discarded: return "discarded";
    case DeploymentStatus::DryRunDiscarded: return "dry_run_discarded";
    case DeploymentStatus::NoOpNoDiff: return "noop_no_diff";
    case DeploymentStatus::RolledBack: return "rolled_back";
    case DeploymentStatus::Failed: return "failed";
  }
  return "unknown";
}

const char* toString(FailureKind kind) {
  switch (kind) {
    case FailureKind::None: return "none";
    case FailureKind::Validation: return "validation";
    case FailureKind::NotFound: return "not_found";
    case FailureKind::ConfigUnavailable: return "config_unavailable";
    case FailureKind::CredentialUnavailable: return "credential_unavailable";
    case FailureKind::ConnectionFailure: return "connection_failure";
    case FailureKind::StageFailure: return "stage_failure";
    case FailureKind::CommitFailure: return "commit_failure";
    case FailureKind::DiscardFailure: return "discard_failure";
    case FailureKind::CloseFailure: return "close_failure";
    case FailureKind::Locked: return "locked";
    case FailureKind::Cancelled: return "cancelled";
    case FailureKind::Unexpected: return "unexpected";
  }
  return "unknown";
}

const char* toString(StageMode mode) {
  return mode == StageMode::Replace ? "replace" : "merge";
}

const char* toString(LogTier tier) {
  switch (tier) {
    case LogTier::Debug: return "debug";
    case LogTier::Info: return "info";
    case LogTier::Success: return "success";
    case LogTier::Warning: return "warning";
    case LogTier::Error: return "error";
  }
  return "unknown";
}

}  // namespace netprov::common
