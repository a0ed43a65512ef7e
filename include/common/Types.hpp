#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace netprov::common {

/// Scalar value of a driver-specific transport option.
using OptionValue = std::variant<std::string, int64_t, double, bool>;

/// Opaque driver options (alternate port, verify-TLS flag, ...).
using OptionMap = std::map<std::string, OptionValue>;

/// Device to configure. Immutable for the duration of one attempt.
/// Class abbreviation: dt
struct DeviceTarget {
  std::string sName;
  std::string sHost;
  std::string sDriver;
  std::optional<std::string> oSecretsGroup;
  OptionMap mOptions;
};

/// Where a resolved credential pair came from.
enum class CredentialSource { FromSecretStore, Default };

/// Username/password pair for one deployment attempt.
/// Class abbreviation: cr
struct Credentials {
  std::string sUsername;
  std::string sPassword;
  bool bUsernameFromStore = false;
  bool bPasswordFromStore = false;
  CredentialSource source = CredentialSource::Default;

  /// "user/<hidden>", safe for any log line.
  std::string redacted() const;

  /// Zero the password bytes (OPENSSL_cleanse) and clear it.
  void scrub();
};

/// Candidate staging mode.
enum class StageMode { Merge, Replace };

/// Terminal status of one deployment attempt.
enum class DeploymentStatus {
  NoChangeRequested,
  Committed,
  Discarded,
  DryRunDiscarded,
  NoOpNoDiff,
  RolledBack,
  Failed,
};

/// Failure taxonomy. Transport adapters map every native error into one of these.
enum class FailureKind {
  None,
  Validation,
  NotFound,
  ConfigUnavailable,
  CredentialUnavailable,
  ConnectionFailure,
  StageFailure,
  CommitFailure,
  DiscardFailure,
  CloseFailure,
  Locked,
  Cancelled,
  Unexpected,
};

/// Structured error attached to a Failed result.
/// Class abbreviation: de
struct DeploymentError {
  FailureKind kind = FailureKind::Unexpected;
  std::string sCode;
  std::string sMessage;
};

/// Post-commit fact snapshot (hostname, model, os_version, ...).
using DeviceFacts = std::map<std::string, std::string>;

/// Request constructed by the caller for a single attempt.
/// Class abbreviation: req
struct DeploymentRequest {
  DeviceTarget target;
  std::string sCandidateConfig;
  bool bDryRun = true;
  bool bReplace = false;
  bool bCommitOnSuccess = true;
};

/// Diagnostic trail tiers.
enum class LogTier { Debug, Info, Success, Warning, Error };

/// One line of the per-attempt diagnostic trail.
struct LogEntry {
  LogTier tier = LogTier::Info;
  std::string sMessage;
};

/// Produced exactly once per deploy() invocation.
/// Class abbreviation: dr
struct DeploymentResult {
  DeploymentStatus status = DeploymentStatus::Failed;
  std::optional<std::string> oDiffText;
  std::optional<DeploymentError> oError;
  std::optional<DeviceFacts> oFacts;
  std::vector<LogEntry> vTrail;
};

/// Raw inventory row, before validation into a DeviceTarget.
/// Class abbreviation: id
struct InventoryDevice {
  std::string sName;
  std::optional<std::string> oPlatform;
  std::optional<std::string> oDriver;
  std::optional<std::string> oPrimaryIp4;
  std::optional<std::string> oDriverOptionsJson;
  std::optional<std::string> oSecretsGroup;
};

/// Intended configuration as held by the configuration-intent store.
/// Class abbreviation: ic
struct IntendedConfig {
  std::string sConfig;
  std::optional<std::string> oLastSuccess;
};

const char* toString(DeploymentStatus status);
const char* toString(FailureKind kind);
const char* toString(StageMode mode);
const char* toString(LogTier tier);

}  // namespace netprov::common
