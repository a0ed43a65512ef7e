#pragma once

#include <string>

#include "common/Types.hpp"
#include "secrets/SecretsGroup.hpp"

namespace netprov::secrets {

/// Pure abstract interface for the external secret store.
/// Implementations throw common::SecretError when a value is unavailable.
class ISecretStore {
 public:
  virtual ~ISecretStore() = default;

  /// Fetch one secret of a group. The target is the template context.
  virtual std::string getSecret(const std::string& sGroup, SecretAccessType accessType,
                                SecretType secretType,
                                const common::DeviceTarget& dtContext) = 0;
};

}  // namespace netprov::secrets
