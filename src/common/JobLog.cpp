#include "common/JobLog.hpp"

#include "common/Logger.hpp"

#include <openssl/crypto.h>

namespace netprov::common {

JobLog::JobLog(std::string sDevice, bool bVerbose)
    : _sDevice(std::move(sDevice)), _bVerbose(bVerbose) {}

JobLog::~JobLog() {
  for (auto& sSecret : _vSecrets) {
    OPENSSL_cleanse(sSecret.data(), sSecret.size());
  }
}

void JobLog::addSecret(const std::string& sSecret) {
  if (sSecret.empty()) return;
  _vSecrets.push_back(sSecret);
}

void JobLog::record(LogTier tier, std::string sMessage) {
  sMessage = redact(std::move(sMessage));

  auto spLog = Logger::get();
  switch (tier) {
    case LogTier::Debug:
      spLog->debug("[{}] {}", _sDevice, sMessage);
      break;
    case LogTier::Info:
      spLog->info("[{}] {}", _sDevice, sMessage);
      break;
    case LogTier::Success:
      spLog->info("[{}] SUCCESS: {}", _sDevice, sMessage);
      break;
    case LogTier::Warning:
      spLog->warn("[{}] {}", _sDevice, sMessage);
      break;
    case LogTier::Error:
      spLog->error("[{}] {}", _sDevice, sMessage);
      break;
  }

  if ((tier == LogTier::Debug || tier == LogTier::Info) && !_bVerbose) {
    return;
  }
  _vEntries.push_back(LogEntry{tier, std::move(sMessage)});
}

std::vector<LogEntry> JobLog::takeEntries() {
  return std::exchange(_vEntries, {});
}

std::string JobLog::redact(std::string sText) const {
  for (const auto& sSecret : _vSecrets) {
    size_t nPos = 0;
    while ((nPos = sText.find(sSecret, nPos)) != std::string::npos) {
      sText.replace(nPos, sSecret.size(), "<hidden>");
      nPos += 8;
    }
  }
  return sText;
}

}  // namespace netprov::common
