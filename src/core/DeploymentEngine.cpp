#include "core/DeploymentEngine.hpp"

#include "common/Errors.hpp"
#include "core/SessionGuard.hpp"

#include <array>
#include <optional>
#include <utility>

namespace netprov::core {

namespace {

/// One row of the commit decision table. An unset column matches anything.
struct DecisionRow {
  std::optional<bool> oDryRun;
  std::optional<bool> oCommitOnSuccess;
  CommitDecision decision;
};

// First matching row wins.
constexpr std::array<DecisionRow, 3> kDecisionTable{{
    {true, std::nullopt, CommitDecision::DryRunDiscard},
    {std::nullopt, false, CommitDecision::Discard},
    {std::nullopt, std::nullopt, CommitDecision::Commit},
}};

void throwIfCancelled(const std::stop_token& stToken) {
  if (stToken.stop_requested()) {
    throw common::CancelledError("deployment_cancelled", "Deployment cancelled by caller");
  }
}

void setFailure(common::DeploymentResult& dr, common::FailureKind kind, std::string sCode,
                const std::string& sStage, const std::string& sWhat) {
  dr.status = common::DeploymentStatus::Failed;
  dr.oError = common::DeploymentError{kind, std::move(sCode), sStage + " failed: " + sWhat};
}

void setFailure(common::DeploymentResult& dr, const common::AppError& ex,
                const std::string& sStage) {
  setFailure(dr, ex._kind, ex._sErrorCode, sStage, ex.what());
}

/// Hand the trail over and strip registered secrets from everything else the
/// caller may print.
common::DeploymentResult finish(common::DeploymentResult dr, common::JobLog& jlLog) {
  if (dr.oDiffText) dr.oDiffText = jlLog.redact(std::move(*dr.oDiffText));
  if (dr.oError) dr.oError->sMessage = jlLog.redact(std::move(dr.oError->sMessage));
  dr.vTrail = jlLog.takeEntries();
  return dr;
}

bool isBlank(const std::string& sText) {
  return sText.find_first_not_of(" \t\r\n") == std::string::npos;
}

}  // namespace

DeploymentEngine::DeploymentEngine(const transport::TransportFactory& tfFactory,
                                   const CredentialResolver& crResolver,
                                   EngineTimeouts etTimeouts)
    : _tfFactory(tfFactory), _crResolver(crResolver), _etTimeouts(etTimeouts) {}

DeploymentEngine::~DeploymentEngine() = default;

CommitDecision DeploymentEngine::decide(bool bDryRun, bool bCommitOnSuccess) {
  for (const auto& row : kDecisionTable) {
    if (row.oDryRun && *row.oDryRun != bDryRun) continue;
    if (row.oCommitOnSuccess && *row.oCommitOnSuccess != bCommitOnSuccess) continue;
    return row.decision;
  }
  return CommitDecision::Commit;
}

common::DeploymentResult DeploymentEngine::deploy(const common::DeploymentRequest& req,
                                                  std::stop_token stToken) const {
  common::JobLog jlLog(req.target.sName);
  return deploy(req, jlLog, std::move(stToken));
}

common::DeploymentResult DeploymentEngine::deploy(const common::DeploymentRequest& req,
                                                  common::JobLog& jlLog,
                                                  std::stop_token stToken) const {
  common::DeploymentResult dr;
  const auto& dtTarget = req.target;

  if (isBlank(req.sCandidateConfig)) {
    jlLog.warn("Candidate configuration is empty; nothing to deploy");
    dr.status = common::DeploymentStatus::NoChangeRequested;
    return finish(std::move(dr), jlLog);
  }

  throwIfCancelled(stToken);

  // ── Idle ───────────────────────────────────────────────────────────────
  std::unique_ptr<transport::ITransport> upTransport;
  try {
    upTransport = _tfFactory.create(dtTarget.sDriver);
  } catch (const common::AppError& ex) {
    jlLog.error("{}", ex.what());
    setFailure(dr, ex, "Driver lookup");
    return finish(std::move(dr), jlLog);
  }

  jlLog.info("Device address: {}", dtTarget.sHost);
  jlLog.info("Driver: {}", dtTarget.sDriver);
  jlLog.info("Mode: {}", req.bDryRun ? "DRY RUN" : "LIVE DEPLOYMENT");
  jlLog.info("Method: {}", req.bReplace ? "REPLACE" : "MERGE");

  auto crCreds = _crResolver.resolve(dtTarget, jlLog);
  transport::TransportOptions toOptions{_etTimeouts.durConnect, _etTimeouts.durOperation,
                                        dtTarget.mOptions};

  // ── Connecting ─────────────────────────────────────────────────────────
  std::unique_ptr<transport::ITransportSession> upSession;
  jlLog.info("Opening connection to {}...", dtTarget.sHost);
  try {
    upSession = upTransport->open(dtTarget, crCreds, toOptions);
  } catch (const common::ConnectionError& ex) {
    jlLog.error("Connection error: {}", ex.what());
    jlLog.error("Please verify: device is reachable, credentials are correct, management "
                "interface is configured, SSH/API is enabled on device");
    setFailure(dr, ex, "Connect");
  } catch (const common::AppError& ex) {
    jlLog.error("Could not open session: {}", ex.what());
    setFailure(dr, ex, "Connect");
  } catch (const std::exception& ex) {
    jlLog.error("Unexpected error while connecting: {}", ex.what());
    setFailure(dr, common::FailureKind::Unexpected, "unexpected_error", "Connect", ex.what());
  }
  crCreds.scrub();

  if (!upSession) {
    if (!dr.oError) {
      setFailure(dr, common::FailureKind::ConnectionFailure, "no_session", "Connect",
                 "transport returned no session");
    }
    return finish(std::move(dr), jlLog);
  }
  jlLog.success("Connected to {}", dtTarget.sName);

  SessionGuard sg(std::move(upSession), jlLog);
  bool bCommitted = false;

  try {
    // ── Staged ───────────────────────────────────────────────────────────
    throwIfCancelled(stToken);
    const auto mode = req.bReplace ? common::StageMode::Replace : common::StageMode::Merge;
    if (mode == common::StageMode::Replace) {
      jlLog.warn("REPLACE mode: entire configuration will be replaced");
    } else {
      jlLog.info("MERGE mode: configuration will be merged with existing");
    }
    sg->stage(req.sCandidateConfig, mode);
    jlLog.success("Configuration loaded successfully");

    // ── Diffed ───────────────────────────────────────────────────────────
    throwIfCancelled(stToken);
    jlLog.info("Generating configuration diff...");
    std::string sDiff = sg->diff();

    if (isBlank(sDiff)) {
      jlLog.info("No configuration changes detected");
      sg.discard();
      dr.status = common::DeploymentStatus::NoOpNoDiff;
    } else {
      jlLog.info("Configuration changes:\n{}", sDiff);
      dr.oDiffText = std::move(sDiff);

      switch (decide(req.bDryRun, req.bCommitOnSuccess)) {
        case CommitDecision::DryRunDiscard:
          jlLog.warn("DRY RUN mode: discarding configuration changes");
          sg.discard();
          jlLog.info("To apply these changes, run again with dry run disabled");
          dr.status = common::DeploymentStatus::DryRunDiscarded;
          break;

        case CommitDecision::Discard:
          jlLog.warn("Commit disabled: changes loaded but not committed");
          sg.discard();
          dr.status = common::DeploymentStatus::Discarded;
          break;

        case CommitDecision::Commit:
          // ── Committing ─────────────────────────────────────────────────
          throwIfCancelled(stToken);
          jlLog.info("Committing configuration changes...");
          sg->commit();
          bCommitted = true;
          jlLog.success("Configuration committed successfully");
          dr.oFacts = verify(*sg, jlLog);
          dr.status = common::DeploymentStatus::Committed;
          break;
      }
    }
  } catch (const common::StageError& ex) {
    jlLog.error("Failed to load configuration: {}", ex.what());
    setFailure(dr, ex, "Stage");
  } catch (const common::CommitError& ex) {
    jlLog.error("Configuration deployment error: {}", ex.what());
    setFailure(dr, ex, "Commit");
    if (ex.rolledBack()) {
      jlLog.warn("Driver confirmed the previous configuration was restored");
      dr.status = common::DeploymentStatus::RolledBack;
    }
  } catch (const common::CancelledError& ex) {
    jlLog.warn("{}", ex.what());
    if (!bCommitted) sg.discard();
    sg.close();
    throw;
  } catch (const std::exception& ex) {
    jlLog.error("Unexpected error during deployment: {}", ex.what());
    setFailure(dr, common::FailureKind::Unexpected, "unexpected_error", "Deployment",
               ex.what());
    if (!bCommitted) {
      jlLog.info("Attempting to discard configuration changes...");
      sg.discard();
    }
  } catch (...) {
    jlLog.error("Unexpected non-standard error during deployment");
    setFailure(dr, common::FailureKind::Unexpected, "unexpected_error", "Deployment",
               "unknown error");
    if (!bCommitted) sg.discard();
  }

  // ── Closed ─────────────────────────────────────────────────────────────
  sg.close();
  return finish(std::move(dr), jlLog);
}

std::optional<common::DeviceFacts> DeploymentEngine::verify(
    transport::ITransportSession& tsSession, common::JobLog& jlLog) const {
  jlLog.info("Verifying configuration...");
  try {
    auto dfFacts = tsSession.facts();
    auto it = dfFacts.find("hostname");
    jlLog.success("Device {} is running with new configuration",
                  it != dfFacts.end() ? it->second : std::string("(unknown)"));
    return dfFacts;
  } catch (const std::exception& ex) {
    jlLog.warn("Post-commit verification failed: {}", ex.what());
  }
  return std::nullopt;
}

}  // namespace netprov::core
