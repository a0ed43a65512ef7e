#pragma once

#include <string>

namespace netprov::common {

/// Environment variable loader. All NETPROV_* settings in one typed struct,
/// validated at load time.
/// Class abbreviation: cfg
struct Config {
  // ── Required ──────────────────────────────────────────────────────────
  std::string sDbUrl;

  // ── Database ──────────────────────────────────────────────────────────
  int iDbPoolSize = 4;
  int iDbCheckoutTimeoutSeconds = 30;

  // ── Fallback credentials ──────────────────────────────────────────────
  std::string sDefaultUsername = "admin";
  std::string sDefaultPassword = "admin";  // zeroed after handoff to CredentialResolver

  // ── Transport ─────────────────────────────────────────────────────────
  int iConnectTimeoutSeconds = 30;
  int iOperationTimeoutSeconds = 60;
  std::string sLabRoot = "/var/lib/netprov/lab";

  // ── Thread pool ───────────────────────────────────────────────────────
  int iThreadPoolSize = 0;  // 0 = std::thread::hardware_concurrency()

  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";

  /// Load and validate all config from environment variables.
  /// NETPROV_DEFAULT_PASSWORD supports a _FILE fallback.
  /// Throws on missing required vars or invalid constraints.
  static Config load();

 private:
  /// Read an optional secret: the variable itself, else the file named by
  /// varName + "_FILE" (trailing whitespace trimmed), else sDefault.
  static std::string loadOptionalSecret(const char* pVarName, const std::string& sDefault);

  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var as int with a default value.
  static int getEnvInt(const char* pVarName, int iDefault);
};

}  // namespace netprov::common
