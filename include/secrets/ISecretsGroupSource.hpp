#pragma once

#include <optional>
#include <string>

#include "secrets/SecretsGroup.hpp"

namespace netprov::secrets {

/// Looks up secrets group definitions by name.
class ISecretsGroupSource {
 public:
  virtual ~ISecretsGroupSource() = default;

  virtual std::optional<SecretsGroup> findGroup(const std::string& sName) = 0;
};

}  // namespace netprov::secrets
