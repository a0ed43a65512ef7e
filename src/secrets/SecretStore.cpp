#include "secrets/SecretStore.hpp"

#include "common/Errors.hpp"
#include "secrets/EnvironmentSecretProvider.hpp"
#include "secrets/TextFileSecretProvider.hpp"

namespace netprov::secrets {

SecretStore::SecretStore(ISecretsGroupSource& sgsGroups) : _sgsGroups(sgsGroups) {}
SecretStore::~SecretStore() = default;

void SecretStore::registerProvider(std::unique_ptr<ISecretProvider> upProvider) {
  auto sName = upProvider->name();
  _mProviders[sName] = std::move(upProvider);
}

std::unique_ptr<SecretStore> SecretStore::withBuiltins(ISecretsGroupSource& sgsGroups) {
  auto upStore = std::make_unique<SecretStore>(sgsGroups);
  upStore->registerProvider(std::make_unique<EnvironmentSecretProvider>());
  upStore->registerProvider(std::make_unique<TextFileSecretProvider>());
  return upStore;
}

std::string SecretStore::getSecret(const std::string& sGroup, SecretAccessType accessType,
                                   SecretType secretType,
                                   const common::DeviceTarget& dtContext) {
  auto oGroup = _sgsGroups.findGroup(sGroup);
  if (!oGroup) {
    throw common::SecretError("secrets_group_not_found",
                              "Secrets group '" + sGroup + "' does not exist");
  }

  const SecretDefinition* pDef = oGroup->find(accessType, secretType);
  if (pDef == nullptr) {
    throw common::SecretError("secret_association_missing",
                              std::string("Secrets group '") + sGroup + "' has no " +
                                  toString(accessType) + "/" + toString(secretType) +
                                  " secret");
  }

  auto it = _mProviders.find(pDef->sProvider);
  if (it == _mProviders.end()) {
    throw common::SecretError("secret_provider_unknown",
                              "Secret '" + pDef->sName + "' uses unknown provider '" +
                                  pDef->sProvider + "'");
  }

  std::map<std::string, std::string> mExpanded;
  for (const auto& [sKey, sTmpl] : pDef->mParameters) {
    mExpanded.emplace(sKey, _teEngine.expand(sTmpl, dtContext));
  }

  std::string sValue = it->second->getValue(pDef->sName, mExpanded);
  if (sValue.empty()) {
    throw common::SecretError("secret_empty", "Secret '" + pDef->sName + "' is empty");
  }
  return sValue;
}

}  // namespace netprov::secrets
