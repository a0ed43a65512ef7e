#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include "common/Types.hpp"

namespace netprov::common {

/// Base error for all application-level exceptions.
/// Carries the failure kind and a machine-readable error code slug.
struct AppError : public std::runtime_error {
  FailureKind _kind;
  std::string _sErrorCode;

  explicit AppError(FailureKind kind, std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)),
        _kind(kind),
        _sErrorCode(std::move(sCode)) {}
};

/// Invalid input or inventory data (missing platform, driver, address).
struct ValidationError : AppError {
  explicit ValidationError(std::string sCode, std::string sMsg)
      : AppError(FailureKind::Validation, std::move(sCode), std::move(sMsg)) {}
};

/// Requested entity does not exist.
struct NotFoundError : AppError {
  explicit NotFoundError(std::string sCode, std::string sMsg)
      : AppError(FailureKind::NotFound, std::move(sCode), std::move(sMsg)) {}
};

/// Intended configuration missing or empty. Raised before any connection.
struct ConfigUnavailableError : AppError {
  explicit ConfigUnavailableError(std::string sCode, std::string sMsg)
      : AppError(FailureKind::ConfigUnavailable, std::move(sCode), std::move(sMsg)) {}
};

/// Secret could not be fetched. Recovered locally by the credential resolver.
struct SecretError : AppError {
  explicit SecretError(std::string sCode, std::string sMsg)
      : AppError(FailureKind::CredentialUnavailable, std::move(sCode), std::move(sMsg)) {}
};

/// Template placeholder with no value in the expansion context.
struct UnresolvedVariableError : AppError {
  explicit UnresolvedVariableError(std::string sCode, std::string sMsg)
      : AppError(FailureKind::CredentialUnavailable, std::move(sCode), std::move(sMsg)) {}
};

/// open() failed or timed out. No session exists.
struct ConnectionError : AppError {
  explicit ConnectionError(std::string sCode, std::string sMsg)
      : AppError(FailureKind::ConnectionFailure, std::move(sCode), std::move(sMsg)) {}
};

/// Loading the candidate failed.
struct StageError : AppError {
  explicit StageError(std::string sCode, std::string sMsg)
      : AppError(FailureKind::StageFailure, std::move(sCode), std::move(sMsg)) {}
};

/// Commit (or replace) failed. bRolledBack is set only when the driver
/// confirms that it restored the previous running configuration.
struct CommitError : AppError {
  bool _bRolledBack;

  explicit CommitError(std::string sCode, std::string sMsg, bool bRolledBack = false)
      : AppError(FailureKind::CommitFailure, std::move(sCode), std::move(sMsg)),
        _bRolledBack(bRolledBack) {}

  bool rolledBack() const { return _bRolledBack; }
};

/// Abandoning the candidate failed (logged only, never escalated).
struct DiscardError : AppError {
  explicit DiscardError(std::string sCode, std::string sMsg)
      : AppError(FailureKind::DiscardFailure, std::move(sCode), std::move(sMsg)) {}
};

/// Closing the session failed (logged only, never escalated).
struct CloseError : AppError {
  explicit CloseError(std::string sCode, std::string sMsg)
      : AppError(FailureKind::CloseFailure, std::move(sCode), std::move(sMsg)) {}
};

/// Device is already being deployed by another attempt in this process.
struct DeploymentLockedError : AppError {
  explicit DeploymentLockedError(std::string sCode, std::string sMsg)
      : AppError(FailureKind::Locked, std::move(sCode), std::move(sMsg)) {}
};

/// Caller requested cancellation. Thrown after the session has been closed.
struct CancelledError : AppError {
  explicit CancelledError(std::string sCode, std::string sMsg)
      : AppError(FailureKind::Cancelled, std::move(sCode), std::move(sMsg)) {}
};

}  // namespace netprov::common
