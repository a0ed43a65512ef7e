#include "common/Config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace netprov::common {

namespace {

void requireAtLeast(const char* pVarName, int iValue, int iMin) {
  if (iValue < iMin) {
    throw std::runtime_error(std::string(pVarName) + " must be >= " + std::to_string(iMin) +
                             " (got " + std::to_string(iValue) + ")");
  }
}

}  // namespace

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

int Config::getEnvInt(const char* pVarName, int iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }
  size_t nUsed = 0;
  int iValue = 0;
  try {
    iValue = std::stoi(sValue, &nUsed);
  } catch (const std::exception&) {
    nUsed = 0;
  }
  if (nUsed != sValue.size()) {
    throw std::runtime_error(
        std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
  return iValue;
}

std::string Config::loadOptionalSecret(const char* pVarName, const std::string& sDefault) {
  std::string sValue = getEnv(pVarName);
  if (!sValue.empty()) {
    return sValue;
  }

  const std::string sFileVar = std::string(pVarName) + "_FILE";
  const std::string sFilePath = getEnv(sFileVar.c_str());
  if (sFilePath.empty()) {
    return sDefault;
  }

  std::ifstream ifs(sFilePath);
  if (!ifs.is_open()) {
    throw std::runtime_error(
        std::string("Cannot open secret file specified by ") + sFileVar + ": " + sFilePath);
  }

  std::ostringstream oss;
  oss << ifs.rdbuf();
  sValue = oss.str();

  while (!sValue.empty() &&
         (sValue.back() == '\n' || sValue.back() == '\r' || sValue.back() == ' ')) {
    sValue.pop_back();
  }

  if (sValue.empty()) {
    throw std::runtime_error(
        std::string("Secret file is empty: ") + sFilePath + " (from " + sFileVar + ")");
  }

  return sValue;
}

Config Config::load() {
  Config cfg;

  // ── Required vars ──────────────────────────────────────────────────────
  cfg.sDbUrl = getEnv("NETPROV_DB_URL");
  if (cfg.sDbUrl.empty()) {
    throw std::runtime_error("Required environment variable NETPROV_DB_URL is not set");
  }

  // ── Optional vars with defaults ────────────────────────────────────────
  cfg.iDbPoolSize = getEnvInt("NETPROV_DB_POOL_SIZE", 4);
  cfg.iDbCheckoutTimeoutSeconds = getEnvInt("NETPROV_DB_CHECKOUT_TIMEOUT_SECONDS", 30);

  const std::string sUser = getEnv("NETPROV_DEFAULT_USERNAME");
  if (!sUser.empty()) {
    cfg.sDefaultUsername = sUser;
  }
  cfg.sDefaultPassword = loadOptionalSecret("NETPROV_DEFAULT_PASSWORD", cfg.sDefaultPassword);

  cfg.iConnectTimeoutSeconds = getEnvInt("NETPROV_CONNECT_TIMEOUT_SECONDS", 30);
  cfg.iOperationTimeoutSeconds = getEnvInt("NETPROV_OPERATION_TIMEOUT_SECONDS", 60);

  const std::string sLabRoot = getEnv("NETPROV_LAB_ROOT");
  if (!sLabRoot.empty()) {
    cfg.sLabRoot = sLabRoot;
  }

  cfg.iThreadPoolSize = getEnvInt("NETPROV_THREAD_POOL_SIZE", 0);

  const std::string sLogLevel = getEnv("NETPROV_LOG_LEVEL");
  if (!sLogLevel.empty()) {
    cfg.sLogLevel = sLogLevel;
  }

  // ── Validation ─────────────────────────────────────────────────────────
  requireAtLeast("NETPROV_DB_POOL_SIZE", cfg.iDbPoolSize, 1);
  requireAtLeast("NETPROV_DB_CHECKOUT_TIMEOUT_SECONDS", cfg.iDbCheckoutTimeoutSeconds, 1);
  requireAtLeast("NETPROV_CONNECT_TIMEOUT_SECONDS", cfg.iConnectTimeoutSeconds, 1);
  requireAtLeast("NETPROV_OPERATION_TIMEOUT_SECONDS", cfg.iOperationTimeoutSeconds, 1);
  requireAtLeast("NETPROV_THREAD_POOL_SIZE", cfg.iThreadPoolSize, 0);

  static const char* const kLevels[] = {"trace", "debug", "info", "warn",
                                        "error", "critical", "off"};
  bool bKnownLevel = false;
  for (const char* pLevel : kLevels) {
    if (cfg.sLogLevel == pLevel) bKnownLevel = true;
  }
  if (!bKnownLevel) {
    throw std::runtime_error("NETPROV_LOG_LEVEL has unknown level: " + cfg.sLogLevel);
  }

  return cfg;
}

}  // namespace netprov::common
