#include "core/CredentialResolver.hpp"

#include "common/Errors.hpp"

#include <openssl/crypto.h>

namespace netprov::core {

CredentialResolver::CredentialResolver(secrets::ISecretStore* pStore,
                                       DefaultCredentials dcDefaults,
                                       secrets::SecretAccessType accessType)
    : _pStore(pStore), _dcDefaults(std::move(dcDefaults)), _accessType(accessType) {}

CredentialResolver::~CredentialResolver() {
  OPENSSL_cleanse(_dcDefaults.sPassword.data(), _dcDefaults.sPassword.size());
}

common::Credentials CredentialResolver::resolve(const common::DeviceTarget& dtTarget) const {
  common::JobLog jlLog(dtTarget.sName);
  return resolve(dtTarget, jlLog);
}

common::Credentials CredentialResolver::resolve(const common::DeviceTarget& dtTarget,
                                                common::JobLog& jlLog) const {
  common::Credentials crCreds;
  crCreds.sUsername = _dcDefaults.sUsername;
  crCreds.sPassword = _dcDefaults.sPassword;

  if (!dtTarget.oSecretsGroup || dtTarget.oSecretsGroup->empty()) {
    jlLog.info("No secrets group configured for this device; using default credentials ({})",
               crCreds.redacted());
    jlLog.info("Tip: assign a secrets group to the device for production use");
    return crCreds;
  }

  const std::string& sGroup = *dtTarget.oSecretsGroup;
  jlLog.info("Secrets group configured: {}", sGroup);

  if (_pStore == nullptr) {
    jlLog.warn("Secrets group '{}' is referenced but no secret store is configured; "
               "using default credentials ({})",
               sGroup, crCreds.redacted());
    return crCreds;
  }

  if (auto oUser = fetch(sGroup, secrets::SecretType::Username, dtTarget, jlLog)) {
    crCreds.sUsername = std::move(*oUser);
    crCreds.bUsernameFromStore = true;
    jlLog.success("Retrieved username from secrets group: {}", crCreds.sUsername);
  }

  if (auto oPassword = fetch(sGroup, secrets::SecretType::Password, dtTarget, jlLog)) {
    jlLog.addSecret(*oPassword);
    crCreds.sPassword = std::move(*oPassword);
    crCreds.bPasswordFromStore = true;
    jlLog.success("Retrieved password from secrets group");
  }

  if (crCreds.bUsernameFromStore || crCreds.bPasswordFromStore) {
    crCreds.source = common::CredentialSource::FromSecretStore;
    jlLog.success("Using credentials from secrets group {}: {}", sGroup, crCreds.redacted());
  } else {
    jlLog.warn("Secrets group '{}' is configured but secrets could not be retrieved "
               "(secret store misconfigured?); using default credentials ({})",
               sGroup, crCreds.redacted());
  }
  return crCreds;
}

std::optional<std::string> CredentialResolver::fetch(const std::string& sGroup,
                                                     secrets::SecretType secretType,
                                                     const common::DeviceTarget& dtTarget,
                                                     common::JobLog& jlLog) const {
  const char* pType = secrets::toString(secretType);
  try {
    std::string sValue = _pStore->getSecret(sGroup, _accessType, secretType, dtTarget);
    if (sValue.empty()) {
      jlLog.info("{} secret returned empty, using default", pType);
      return std::nullopt;
    }
    return sValue;
  } catch (const common::AppError& ex) {
    jlLog.debug("Could not retrieve {}: {}: {}", pType, ex._sErrorCode, ex.what());
  } catch (const std::exception& ex) {
    jlLog.debug("Could not retrieve {}: {}", pType, ex.what());
  }
  jlLog.info("Could not retrieve {} from secrets, using default", pType);
  return std::nullopt;
}

}  // namespace netprov::core
