#pragma once

#include <map>
#include <memory>
#include <string>

#include "secrets/ISecretProvider.hpp"
#include "secrets/ISecretStore.hpp"
#include "secrets/ISecretsGroupSource.hpp"
#include "secrets/TemplateEngine.hpp"

namespace netprov::secrets {

/// Resolves group → association → provider → value.
/// Every failure surfaces as common::SecretError with a distinct code.
/// Safe for concurrent use once all providers are registered.
/// Class abbreviation: ss
class SecretStore : public ISecretStore {
 public:
  explicit SecretStore(ISecretsGroupSource& sgsGroups);
  ~SecretStore() override;

  SecretStore(const SecretStore&) = delete;
  SecretStore& operator=(const SecretStore&) = delete;

  /// Register a provider under its name(). Replaces an existing one.
  void registerProvider(std::unique_ptr<ISecretProvider> upProvider);

  /// Store with the environment-variable and text-file providers registered.
  static std::unique_ptr<SecretStore> withBuiltins(ISecretsGroupSource& sgsGroups);

  std::string getSecret(const std::string& sGroup, SecretAccessType accessType,
                        SecretType secretType,
                        const common::DeviceTarget& dtContext) override;

 private:
  ISecretsGroupSource& _sgsGroups;
  std::map<std::string, std::unique_ptr<ISecretProvider>> _mProviders;
  TemplateEngine _teEngine;
};

}  // namespace netprov::secrets
