#pragma once

#include <map>
#include <string>

#include "secrets/ISecretProvider.hpp"

namespace netprov::secrets {

/// Reads a secret from the file named by parameter "path".
/// Trailing whitespace and newlines are trimmed.
class TextFileSecretProvider : public ISecretProvider {
 public:
  TextFileSecretProvider();
  ~TextFileSecretProvider() override;

  std::string name() const override;
  std::string getValue(const std::string& sSecretName,
                       const std::map<std::string, std::string>& mParameters) override;
};

}  // namespace netprov::secrets
