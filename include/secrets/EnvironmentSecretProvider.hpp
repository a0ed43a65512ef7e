#pragma once

#include <map>
#include <string>

#include "secrets/ISecretProvider.hpp"

namespace netprov::secrets {

/// Reads a secret from the environment variable named by parameter "variable".
class EnvironmentSecretProvider : public ISecretProvider {
 public:
  EnvironmentSecretProvider();
  ~EnvironmentSecretProvider() override;

  std::string name() const override;
  std::string getValue(const std::string& sSecretName,
                       const std::map<std::string, std::string>& mParameters) override;
};

}  // namespace netprov::secrets
