#pragma once

#include <string>

#include "common/Types.hpp"

namespace netprov::secrets {

/// Tokenizes and expands {{ obj.<field> }} placeholders in secret parameters.
/// Known fields: name, host, driver, secrets_group.
/// Class abbreviation: te
class TemplateEngine {
 public:
  TemplateEngine();
  ~TemplateEngine();

  /// Throws common::UnresolvedVariableError for unknown or unterminated placeholders.
  std::string expand(const std::string& sTmpl, const common::DeviceTarget& dtContext) const;
};

}  // namespace netprov::secrets
