#include "secrets/TextFileSecretProvider.hpp"

#include "common/Errors.hpp"

#include <fstream>
#include <sstream>

namespace netprov::secrets {

TextFileSecretProvider::TextFileSecretProvider() = default;
TextFileSecretProvider::~TextFileSecretProvider() = default;

std::string TextFileSecretProvider::name() const { return "text-file"; }

std::string TextFileSecretProvider::getValue(
    const std::string& sSecretName, const std::map<std::string, std::string>& mParameters) {
  auto it = mParameters.find("path");
  if (it == mParameters.end() || it->second.empty()) {
    throw common::SecretError("secret_parameters_invalid",
                              "Secret '" + sSecretName + "' has no 'path' parameter");
  }

  std::ifstream ifs(it->second);
  if (!ifs.is_open()) {
    throw common::SecretError("secret_value_not_found",
                              "Cannot open file " + it->second + " for secret '" +
                                  sSecretName + "'");
  }

  std::ostringstream oss;
  oss << ifs.rdbuf();
  std::string sValue = oss.str();

  while (!sValue.empty() && (sValue.back() == '\n' || sValue.back() == '\r' ||
                             sValue.back() == ' ' || sValue.back() == '\t')) {
    sValue.pop_back();
  }
  return sValue;
}

}  // namespace netprov::secrets
