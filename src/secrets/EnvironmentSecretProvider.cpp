#include "secrets/EnvironmentSecretProvider.hpp"

#include "common/Errors.hpp"

#include <cstdlib>

namespace netprov::secrets {

EnvironmentSecretProvider::EnvironmentSecretProvider() = default;
EnvironmentSecretProvider::~EnvironmentSecretProvider() = default;

std::string EnvironmentSecretProvider::name() const { return "environment-variable"; }

std::string EnvironmentSecretProvider::getValue(
    const std::string& sSecretName, const std::map<std::string, std::string>& mParameters) {
  auto it = mParameters.find("variable");
  if (it == mParameters.end() || it->second.empty()) {
    throw common::SecretError("secret_parameters_invalid",
                              "Secret '" + sSecretName + "' has no 'variable' parameter");
  }

  const char* pValue = std::getenv(it->second.c_str());
  if (pValue == nullptr) {
    throw common::SecretError("secret_value_not_found",
                              "Environment variable " + it->second + " for secret '" +
                                  sSecretName + "' is not set");
  }
  return std::string(pValue);
}

}  // namespace netprov::secrets
