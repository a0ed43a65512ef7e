#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>

namespace netprov::secrets {

/// Protocol a secret is meant for (source-of-truth access-type choices).
enum class SecretAccessType { Generic, Console, Gnmi, Http, Netconf, Rest, Rpc, Snmp, Ssh };

/// What the secret holds (source-of-truth secret-type choices).
enum class SecretType { Username, Password, Token, Key, Secret };

const char* toString(SecretAccessType accessType);
const char* toString(SecretType secretType);

/// Parse "Generic", "SSH", ... Case-insensitive. nullopt when unknown.
std::optional<SecretAccessType> parseAccessType(const std::string& sValue);
std::optional<SecretType> parseSecretType(const std::string& sValue);

/// One secret definition: which provider fetches it and with what parameters.
/// Parameter values may contain {{ obj.* }} placeholders.
/// Class abbreviation: sd
struct SecretDefinition {
  std::string sName;
  std::string sProvider;
  std::map<std::string, std::string> mParameters;
};

/// Named bundle of secret references, keyed by (access type, secret type).
/// Class abbreviation: sg
struct SecretsGroup {
  std::string sName;
  std::map<std::pair<SecretAccessType, SecretType>, SecretDefinition> mAssociations;

  const SecretDefinition* find(SecretAccessType accessType, SecretType secretType) const;
};

}  // namespace netprov::secrets
