#include "transport/EosTransport.hpp"

#include "common/Errors.hpp"
#include "transport/ConfigText.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <utility>

namespace netprov::transport {

namespace {

std::atomic<uint64_t> gSessionCounter{0};

std::string codeFor(const EapiError& ex, const std::string& sOperation) {
  switch (ex._category) {
    case EapiError::Category::Timeout: return sOperation + "_timeout";
    case EapiError::Category::Auth: return "authentication_failed";
    case EapiError::Category::Network: return "device_unreachable";
    case EapiError::Category::Command: return sOperation + "_rejected";
    case EapiError::Category::Protocol: return "protocol_error";
  }
  return sOperation + "_failed";
}

std::string jsonString(const nlohmann::json& jObj, const char* pKey) {
  if (!jObj.is_object() || !jObj.contains(pKey)) return {};
  const auto& jValue = jObj[pKey];
  return jValue.is_string() ? jValue.get<std::string>() : jValue.dump();
}

}  // namespace

// ── EosTransport ───────────────────────────────────────────────────────────

EosTransport::EosTransport()
    : _fnRunnerFactory([](EapiEndpoint ep) -> std::unique_ptr<IEapiRunner> {
        return std::make_unique<EapiClient>(std::move(ep));
      }) {}

EosTransport::EosTransport(RunnerFactory fnRunnerFactory)
    : _fnRunnerFactory(std::move(fnRunnerFactory)) {}

EosTransport::~EosTransport() = default;

std::string EosTransport::name() const { return "eos"; }

std::string EosTransport::sessionNameFor(const std::string& sDevice) {
  std::string sName = "netprov_";
  for (char c : sDevice) {
    sName += (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_') ? c : '_';
  }
  const auto iMillis = std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::system_clock::now().time_since_epoch())
                           .count();
  return sName + "_" + std::to_string(iMillis) + "_" + std::to_string(gSessionCounter++);
}

std::unique_ptr<ITransportSession> EosTransport::open(const common::DeviceTarget& dtTarget,
                                                      const common::Credentials& crCreds,
                                                      const TransportOptions& toOptions) {
  EapiEndpoint ep;
  ep.sHost = dtTarget.sHost;
  const std::string sScheme = toOptions.getString("transport", "https");
  if (sScheme != "https" && sScheme != "http") {
    throw common::ConnectionError("invalid_transport",
                                  "Unsupported eAPI transport '" + sScheme + "'");
  }
  ep.bTls = sScheme == "https";
  const int64_t iPort = toOptions.getInt("port", ep.bTls ? 443 : 80);
  if (iPort < 1 || iPort > 65535) {
    throw common::ConnectionError("invalid_port", "Port out of range: " + std::to_string(iPort));
  }
  ep.uPort = static_cast<uint16_t>(iPort);
  ep.bVerifyTls = toOptions.getBool("verify_tls", false);
  ep.sUsername = crCreds.sUsername;
  ep.sPassword = crCreds.sPassword;
  ep.durConnectTimeout = toOptions.durConnectTimeout;
  ep.durRequestTimeout = toOptions.durOperationTimeout;

  auto upRunner = _fnRunnerFactory(std::move(ep));
  try {
    upRunner->runCmds({"show hostname"});
  } catch (const EapiError& ex) {
    throw common::ConnectionError(codeFor(ex, "connect"), ex.what());
  }

  return std::make_unique<EosSession>(std::move(upRunner), sessionNameFor(dtTarget.sName));
}

// ── EosSession ─────────────────────────────────────────────────────────────

EosSession::EosSession(std::unique_ptr<IEapiRunner> upRunner, std::string sSessionName)
    : _upRunner(std::move(upRunner)), _sSessionName(std::move(sSessionName)) {}

EosSession::~EosSession() = default;

void EosSession::stage(const std::string& sConfig, common::StageMode mode) {
  if (_bClosed) {
    throw common::StageError("session_closed", "Session " + _sSessionName + " is closed");
  }

  std::vector<std::string> vCmds{"configure session " + _sSessionName};
  if (mode == common::StageMode::Replace) {
    vCmds.push_back("rollback clean-config");
  }
  for (auto& sLine : normalizeConfig(sConfig)) {
    vCmds.push_back(std::move(sLine));
  }
  vCmds.push_back("end");

  // The session exists on the device from the first command on.
  _bStaged = true;
  try {
    _upRunner->runCmds(vCmds);
  } catch (const EapiError& ex) {
    throw common::StageError(codeFor(ex, mode == common::StageMode::Replace
                                             ? "load_replace"
                                             : "load_merge"),
                             ex.what());
  }
}

std::string EosSession::diff() {
  if (!_bStaged) return {};
  nlohmann::json jResult;
  try {
    jResult = _upRunner->runCmds({"show session-config named " + _sSessionName + " diffs"},
                                 "text");
  } catch (const EapiError& ex) {
    throw common::AppError(common::FailureKind::Unexpected, codeFor(ex, "diff"), ex.what());
  }

  std::string sDiff =
      (jResult.is_array() && !jResult.empty()) ? jsonString(jResult[0], "output") : std::string{};
  while (!sDiff.empty() && (sDiff.back() == '\n' || sDiff.back() == ' ')) {
    sDiff.pop_back();
  }
  return sDiff;
}

void EosSession::commit() {
  if (!_bStaged) {
    throw common::CommitError("nothing_staged", "No candidate configuration staged");
  }
  try {
    _upRunner->runCmds({"configure session " + _sSessionName, "commit"});
  } catch (const EapiError& ex) {
    throw common::CommitError(codeFor(ex, "commit"), ex.what());
  }
  _bStaged = false;

  try {
    _upRunner->runCmds({"copy running-config startup-config"});
  } catch (const EapiError& ex) {
    throw common::CommitError(codeFor(ex, "save"),
                              std::string("Committed to running-config but saving to "
                                          "startup-config failed: ") + ex.what());
  }
}

void EosSession::discard() {
  if (!_bStaged) return;
  try {
    _upRunner->runCmds({"configure session " + _sSessionName + " abort"});
  } catch (const EapiError& ex) {
    throw common::DiscardError(codeFor(ex, "discard"), ex.what());
  }
  _bStaged = false;
}

common::DeviceFacts EosSession::facts() {
  nlohmann::json jResult;
  try {
    jResult = _upRunner->runCmds({"show version", "show hostname"});
  } catch (const EapiError& ex) {
    throw common::AppError(common::FailureKind::Unexpected, codeFor(ex, "facts"), ex.what());
  }

  if (!jResult.is_array() || jResult.size() < 2) {
    throw common::AppError(common::FailureKind::Unexpected, "protocol_error",
                           "Unexpected reply to show version/show hostname");
  }
  const auto& jVersion = jResult[0];
  const auto& jHostname = jResult.at(1);
  return common::DeviceFacts{
      {"vendor", "Arista"},
      {"hostname", jsonString(jHostname, "hostname")},
      {"fqdn", jsonString(jHostname, "fqdn")},
      {"model", jsonString(jVersion, "modelName")},
      {"serial_number", jsonString(jVersion, "serialNumber")},
      {"os_version", jsonString(jVersion, "version")},
      {"uptime", jsonString(jVersion, "uptime")},
  };
}

void EosSession::close() {
  if (_bClosed) return;
  _bClosed = true;
  if (!_bStaged) return;

  _bStaged = false;
  try {
    _upRunner->runCmds({"configure session " + _sSessionName + " abort"});
  } catch (const EapiError& ex) {
    throw common::CloseError(codeFor(ex, "close"),
                             "Could not abort pending session " + _sSessionName + ": " +
                                 ex.what());
  }
}

}  // namespace netprov::transport
