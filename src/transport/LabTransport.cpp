#include "transport/LabTransport.hpp"

#include "common/Errors.hpp"
#include "transport/ConfigText.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <sstream>
#include <system_error>

namespace netprov::transport {

namespace {

std::string rtrim(std::string sLine) {
  while (!sLine.empty() &&
         (sLine.back() == ' ' || sLine.back() == '\t' || sLine.back() == '\r' ||
          sLine.back() == '\n')) {
    sLine.pop_back();
  }
  return sLine;
}

bool isIndented(const std::string& sLine) {
  return !sLine.empty() && (sLine.front() == ' ' || sLine.front() == '\t');
}

struct Stanza {
  std::string sHeader;
  std::vector<std::string> vChildren;
};

std::vector<Stanza> toStanzas(const std::vector<std::string>& vLines) {
  std::vector<Stanza> vStanzas;
  for (const auto& sLine : vLines) {
    if (isIndented(sLine) && !vStanzas.empty()) {
      vStanzas.back().vChildren.push_back(sLine);
    } else {
      vStanzas.push_back(Stanza{sLine, {}});
    }
  }
  return vStanzas;
}

std::string readFile(const std::filesystem::path& path) {
  std::ifstream ifs(path);
  if (!ifs.is_open()) {
    throw std::runtime_error("cannot open " + path.string());
  }
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

}  // namespace

// ── LabTransport ───────────────────────────────────────────────────────────

LabTransport::LabTransport(std::filesystem::path pathRoot) : _pathRoot(std::move(pathRoot)) {}
LabTransport::~LabTransport() = default;

std::string LabTransport::name() const { return "lab"; }

std::vector<std::string> LabTransport::merge(const std::vector<std::string>& vRunning,
                                             const std::vector<std::string>& vCandidate) {
  auto vMerged = toStanzas(vRunning);
  for (auto& stCand : toStanzas(vCandidate)) {
    auto it = std::find_if(vMerged.begin(), vMerged.end(),
                           [&stCand](const Stanza& st) { return st.sHeader == stCand.sHeader; });
    if (it == vMerged.end()) {
      vMerged.push_back(std::move(stCand));
      continue;
    }
    for (auto& sChild : stCand.vChildren) {
      if (std::find(it->vChildren.begin(), it->vChildren.end(), sChild) == it->vChildren.end()) {
        it->vChildren.push_back(std::move(sChild));
      }
    }
  }

  std::vector<std::string> vLines;
  for (auto& st : vMerged) {
    vLines.push_back(std::move(st.sHeader));
    for (auto& sChild : st.vChildren) vLines.push_back(std::move(sChild));
  }
  return vLines;
}

std::unique_ptr<ITransportSession> LabTransport::open(const common::DeviceTarget& dtTarget,
                                                      const common::Credentials& crCreds,
                                                      const TransportOptions& toOptions) {
  std::error_code ec;
  const std::filesystem::path pathRoot = toOptions.getString("lab_root", _pathRoot.string());
  if (!std::filesystem::is_directory(pathRoot, ec)) {
    throw common::ConnectionError("device_unreachable",
                                  "Lab root " + pathRoot.string() + " does not exist");
  }
  if (dtTarget.sHost.empty()) {
    throw common::ConnectionError("device_unreachable",
                                  "No management address for " + dtTarget.sName);
  }

  const auto pathAuth = pathRoot / (dtTarget.sName + ".auth");
  if (std::filesystem::exists(pathAuth, ec)) {
    std::string sExpected;
    try {
      sExpected = rtrim(readFile(pathAuth));
    } catch (const std::exception& ex) {
      throw common::ConnectionError("device_unreachable", ex.what());
    }
    if (sExpected != crCreds.sUsername + ":" + crCreds.sPassword) {
      throw common::ConnectionError("authentication_failed",
                                    "Authentication failed for user " + crCreds.sUsername);
    }
  }

  const auto pathLock = pathRoot / (dtTarget.sName + ".lock");
  const int iFd = ::open(pathLock.c_str(), O_CREAT | O_EXCL | O_WRONLY, 0600);
  if (iFd < 0) {
    if (errno == EEXIST) {
      throw common::ConnectionError("device_locked",
                                    "Configuration of " + dtTarget.sName +
                                        " is locked by another session");
    }
    throw common::ConnectionError("device_unreachable",
                                  "Cannot lock " + pathLock.string() + ": " +
                                      std::system_category().message(errno));
  }
  ::close(iFd);

  return std::make_unique<LabSession>(dtTarget.sName, pathRoot / (dtTarget.sName + ".cfg"),
                                      pathLock, pathRoot / (dtTarget.sName + ".fail_commit"));
}

// ── LabSession ─────────────────────────────────────────────────────────────

LabSession::LabSession(std::string sDevice, std::filesystem::path pathConfig,
                       std::filesystem::path pathLock, std::filesystem::path pathFailCommit)
    : _sDevice(std::move(sDevice)),
      _pathConfig(std::move(pathConfig)),
      _pathLock(std::move(pathLock)),
      _pathFailCommit(std::move(pathFailCommit)) {}

LabSession::~LabSession() {
  if (!_bClosed) {
    std::error_code ec;
    std::filesystem::remove(_pathLock, ec);
  }
}

std::vector<std::string> LabSession::readRunning() const {
  std::error_code ec;
  if (!std::filesystem::exists(_pathConfig, ec)) {
    return {};
  }
  return normalizeConfig(readFile(_pathConfig));
}

void LabSession::writeRunning(const std::vector<std::string>& vLines) const {
  auto pathTmp = _pathConfig;
  pathTmp += ".tmp";
  {
    std::ofstream ofs(pathTmp, std::ios::trunc);
    if (!ofs.is_open()) {
      throw std::runtime_error("cannot write " + pathTmp.string());
    }
    for (const auto& sLine : vLines) ofs << sLine << '\n';
    ofs.flush();
    if (!ofs) {
      throw std::runtime_error("short write to " + pathTmp.string());
    }
  }
  std::filesystem::rename(pathTmp, _pathConfig);
}

void LabSession::stage(const std::string& sConfig, common::StageMode mode) {
  if (_bClosed) {
    throw common::StageError("session_closed", "Session to " + _sDevice + " is closed");
  }
  auto vCandidate = normalizeConfig(sConfig);
  if (mode == common::StageMode::Replace) {
    _oCandidate = std::move(vCandidate);
    return;
  }
  try {
    _oCandidate = LabTransport::merge(readRunning(), vCandidate);
  } catch (const std::exception& ex) {
    throw common::StageError("load_merge_failed", ex.what());
  }
}

std::string LabSession::diff() {
  if (!_oCandidate) return {};
  return _deEngine.diffText(readRunning(), *_oCandidate);
}

void LabSession::commit() {
  if (_bClosed) {
    throw common::CommitError("session_closed", "Session to " + _sDevice + " is closed");
  }
  if (!_oCandidate) {
    throw common::CommitError("nothing_staged", "No candidate configuration staged");
  }

  std::error_code ec;
  auto vStored = *_oCandidate;
  if (std::filesystem::exists(_pathFailCommit, ec)) {
    vStored.push_back("% commit interrupted");
  }

  std::vector<std::string> vPrevious;
  try {
    vPrevious = readRunning();
    writeRunning(vStored);
  } catch (const std::exception& ex) {
    // Running file untouched: rename is the only step that replaces it.
    throw common::CommitError("commit_failed", ex.what());
  }

  if (readRunning() != *_oCandidate) {
    try {
      writeRunning(vPrevious);
    } catch (const std::exception& ex) {
      throw common::CommitError("commit_verification_failed",
                                std::string("Committed config did not verify and restore "
                                            "failed: ") + ex.what());
    }
    throw common::CommitError("commit_verification_failed",
                              "Committed config did not verify; previous config restored",
                              true);
  }
  _oCandidate.reset();
}

void LabSession::discard() {
  if (_bClosed) {
    throw common::DiscardError("session_closed", "Session to " + _sDevice + " is closed");
  }
  _oCandidate.reset();
}

common::DeviceFacts LabSession::facts() {
  const auto vRunning = readRunning();
  common::DeviceFacts dfFacts{
      {"hostname", _sDevice},
      {"vendor", "netprov-lab"},
      {"model", "lab"},
      {"os_version", "1.0"},
      {"config_lines", std::to_string(vRunning.size())},
  };
  for (const auto& sLine : vRunning) {
    if (sLine.rfind("hostname ", 0) == 0) {
      dfFacts["hostname"] = sLine.substr(9);
    }
  }
  return dfFacts;
}

void LabSession::close() {
  if (_bClosed) return;
  _bClosed = true;
  _oCandidate.reset();

  std::error_code ec;
  std::filesystem::remove(_pathLock, ec);
  if (ec) {
    throw common::CloseError("unlock_failed",
                             "Cannot release lock " + _pathLock.string() + ": " + ec.message());
  }
}

}  // namespace netprov::transport
