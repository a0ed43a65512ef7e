#include "secrets/TemplateEngine.hpp"

#include "common/Errors.hpp"

#include <optional>

namespace netprov::secrets {

namespace {

std::string trim(const std::string& sValue) {
  const auto nFirst = sValue.find_first_not_of(" \t");
  if (nFirst == std::string::npos) return {};
  const auto nLast = sValue.find_last_not_of(" \t");
  return sValue.substr(nFirst, nLast - nFirst + 1);
}

std::optional<std::string> lookup(const std::string& sKey, const common::DeviceTarget& dt) {
  if (sKey == "obj.name" || sKey == "obj") return dt.sName;
  if (sKey == "obj.host") return dt.sHost;
  if (sKey == "obj.driver") return dt.sDriver;
  if (sKey == "obj.secrets_group") return dt.oSecretsGroup.value_or("");
  return std::nullopt;
}

/// Walks every {{ ... }} token; fnToken receives the trimmed key.
template <typename Fn>
std::string scan(const std::string& sTmpl, Fn&& fnToken) {
  std::string sOut;
  size_t nPos = 0;
  while (true) {
    const size_t nOpen = sTmpl.find("{{", nPos);
    if (nOpen == std::string::npos) {
      sOut.append(sTmpl, nPos, std::string::npos);
      break;
    }
    const size_t nClose = sTmpl.find("}}", nOpen + 2);
    if (nClose == std::string::npos) {
      throw common::UnresolvedVariableError(
          "unterminated_placeholder",
          "Unterminated '{{' at offset " + std::to_string(nOpen));
    }
    sOut.append(sTmpl, nPos, nOpen - nPos);
    sOut += fnToken(trim(sTmpl.substr(nOpen + 2, nClose - nOpen - 2)));
    nPos = nClose + 2;
  }
  return sOut;
}

}  // namespace

TemplateEngine::TemplateEngine() = default;
TemplateEngine::~TemplateEngine() = default;

std::string TemplateEngine::expand(const std::string& sTmpl,
                                   const common::DeviceTarget& dtContext) const {
  return scan(sTmpl, [&dtContext](const std::string& sKey) {
    auto oValue = lookup(sKey, dtContext);
    if (!oValue) {
      throw common::UnresolvedVariableError("unresolved_variable",
                                            "Variable '" + sKey + "' not defined");
    }
    return *oValue;
  });
}

}  // namespace netprov::secrets
