#pragma once

#include <map>
#include <string>

namespace netprov::secrets {

/// A secret back-end (environment variable, text file, ...).
/// Parameters arrive already expanded against the device context.
class ISecretProvider {
 public:
  virtual ~ISecretProvider() = default;

  virtual std::string name() const = 0;

  /// Throws common::SecretError when the value cannot be produced.
  virtual std::string getValue(const std::string& sSecretName,
                               const std::map<std::string, std::string>& mParameters) = 0;
};

}  // namespace netprov::secrets
