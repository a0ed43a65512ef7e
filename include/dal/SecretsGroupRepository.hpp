#pragma once

#include <optional>
#include <string>

#include "secrets/ISecretsGroupSource.hpp"

namespace netprov::dal {

class ConnectionPool;

/// Secrets groups with their associations and secret definitions.
/// Class abbreviation: sgr
class SecretsGroupRepository : public secrets::ISecretsGroupSource {
 public:
  explicit SecretsGroupRepository(ConnectionPool& cpPool);
  ~SecretsGroupRepository() override;

  /// Associations with an unrecognised access or secret type are skipped
  /// with a warning.
  std::optional<secrets::SecretsGroup> findGroup(const std::string& sName) override;

 private:
  ConnectionPool& _cpPool;
};

}  // namespace netprov::dal
