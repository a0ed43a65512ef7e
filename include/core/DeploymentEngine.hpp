#pragma once

#include <chrono>
#include <optional>
#include <stop_token>

#include "common/JobLog.hpp"
#include "common/Types.hpp"
#include "core/CredentialResolver.hpp"
#include "transport/TransportFactory.hpp"

namespace netprov::core {

/// What to do with a non-empty diff.
enum class CommitDecision { DryRunDiscard, Discard, Commit };

/// Per-call timeouts handed to every transport.
/// Class abbreviation: et
struct EngineTimeouts {
  std::chrono::seconds durConnect{30};
  std::chrono::seconds durOperation{60};
};

/// Runs one deployment attempt per call:
///   Idle → Connecting → Staged → Diffed → {Committing | Discarding} → Closed
/// with Failed reachable from every non-terminal state. The session is
/// closed exactly once on every path that opened it.
///
/// Holds no per-attempt state; concurrent deploy() calls for different
/// devices are safe. Callers serialize attempts against the same device.
/// Class abbreviation: dep
class DeploymentEngine {
 public:
  DeploymentEngine(const transport::TransportFactory& tfFactory,
                   const CredentialResolver& crResolver, EngineTimeouts etTimeouts = {});
  ~DeploymentEngine();

  common::DeploymentResult deploy(const common::DeploymentRequest& req,
                                  std::stop_token stToken = {}) const;

  /// Same, logging into a caller-owned trail. If stToken is triggered the
  /// pending candidate is discarded, the session closed, and
  /// common::CancelledError thrown.
  common::DeploymentResult deploy(const common::DeploymentRequest& req, common::JobLog& jlLog,
                                  std::stop_token stToken = {}) const;

  /// Ordered decision table; dry run always wins over commit.
  static CommitDecision decide(bool bDryRun, bool bCommitOnSuccess);

 private:
  std::optional<common::DeviceFacts> verify(transport::ITransportSession& tsSession,
                                            common::JobLog& jlLog) const;

  const transport::TransportFactory& _tfFactory;
  const CredentialResolver& _crResolver;
  EngineTimeouts _etTimeouts;
};

}  // namespace netprov::core
