#pragma once

#include <optional>
#include <string>

#include "common/Types.hpp"
#include "core/IConfigSource.hpp"

namespace netprov::dal {

class ConnectionPool;

/// Intended configuration per device from the golden_config table.
/// Class abbreviation: icr
class IntendedConfigRepository : public core::IConfigSource {
 public:
  explicit IntendedConfigRepository(ConnectionPool& cpPool);
  ~IntendedConfigRepository() override;

  /// nullopt when the device has no golden_config row. A row with a NULL
  /// intended_config yields an empty sConfig.
  std::optional<common::IntendedConfig> getIntendedConfig(const std::string& sDevice) override;

 private:
  ConnectionPool& _cpPool;
};

}  // namespace netprov::dal
