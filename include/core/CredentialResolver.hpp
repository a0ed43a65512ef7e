#pragma once

#include <optional>
#include <string>

#include "common/JobLog.hpp"
#include "common/Types.hpp"
#include "secrets/ISecretStore.hpp"

namespace netprov::core {

/// Fallback pair used for any field the secret store cannot supply.
/// Class abbreviation: dc
struct DefaultCredentials {
  std::string sUsername = "admin";
  std::string sPassword = "admin";
};

/// Produces a username/password pair for a device. Never fails: each field
/// is fetched from the device's secrets group independently and falls back
/// to the configured default when unavailable.
/// Holds no mutable state; safe to call concurrently for different targets.
/// Class abbreviation: cres
class CredentialResolver {
 public:
  /// pStore may be null (no secret store configured).
  CredentialResolver(secrets::ISecretStore* pStore, DefaultCredentials dcDefaults,
                     secrets::SecretAccessType accessType = secrets::SecretAccessType::Generic);
  ~CredentialResolver();

  CredentialResolver(const CredentialResolver&) = delete;
  CredentialResolver& operator=(const CredentialResolver&) = delete;

  common::Credentials resolve(const common::DeviceTarget& dtTarget) const;
  common::Credentials resolve(const common::DeviceTarget& dtTarget, common::JobLog& jlLog) const;

 private:
  std::optional<std::string> fetch(const std::string& sGroup, secrets::SecretType secretType,
                                   const common::DeviceTarget& dtTarget,
                                   common::JobLog& jlLog) const;

  secrets::ISecretStore* _pStore;
  DefaultCredentials _dcDefaults;
  secrets::SecretAccessType _accessType;
};

}  // namespace netprov::core
