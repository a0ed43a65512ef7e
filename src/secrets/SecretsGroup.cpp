#include "secrets/SecretsGroup.hpp"

#include <algorithm>
#include <cctype>

namespace netprov::secrets {

namespace {

std::string lower(std::string sValue) {
  std::transform(sValue.begin(), sValue.end(), sValue.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return sValue;
}

}  // namespace

const char* toString(SecretAccessType accessType) {
  switch (accessType) {
    case SecretAccessType::Generic: return "Generic";
    case SecretAccessType::Console: return "Console";
    case SecretAccessType::Gnmi: return "gNMI";
    case SecretAccessType::Http: return "HTTP(S)";
    case SecretAccessType::Netconf: return "NETCONF";
    case SecretAccessType::Rest: return "REST";
    case SecretAccessType::Rpc: return "RPC";
    case SecretAccessType::Snmp: return "SNMP";
    case SecretAccessType::Ssh: return "SSH";
  }
  return "Generic";
}

const char* toString(SecretType secretType) {
  switch (secretType) {
    case SecretType::Username: return "username";
    case SecretType::Password: return "password";
    case SecretType::Token: return "token";
    case SecretType::Key: return "key";
    case SecretType::Secret: return "secret";
  }
  return "secret";
}

std::optional<SecretAccessType> parseAccessType(const std::string& sValue) {
  const std::string sLower = lower(sValue);
  if (sLower == "generic") return SecretAccessType::Generic;
  if (sLower == "console") return SecretAccessType::Console;
  if (sLower == "gnmi") return SecretAccessType::Gnmi;
  if (sLower == "http" || sLower == "http(s)" || sLower == "https") return SecretAccessType::Http;
  if (sLower == "netconf") return SecretAccessType::Netconf;
  if (sLower == "rest") return SecretAccessType::Rest;
  if (sLower == "rpc") return SecretAccessType::Rpc;
  if (sLower == "snmp") return SecretAccessType::Snmp;
  if (sLower == "ssh") return SecretAccessType::Ssh;
  return std::nullopt;
}

std::optional<SecretType> parseSecretType(const std::string& sValue) {
  const std::string sLower = lower(sValue);
  if (sLower == "username") return SecretType::Username;
  if (sLower == "password") return SecretType::Password;
  if (sLower == "token") return SecretType::Token;
  if (sLower == "key") return SecretType::Key;
  if (sLower == "secret") return SecretType::Secret;
  return std::nullopt;
}

const SecretDefinition* SecretsGroup::find(SecretAccessType accessType,
                                           SecretType secretType) const {
  auto it = mAssociations.find({accessType, secretType});
  return it == mAssociations.end() ? nullptr : &it->second;
}

}  // namespace netprov::secrets
