#pragma once

#include <optional>
#include <string>

#include "common/Types.hpp"

namespace netprov::core {

/// Configuration-intent store: supplies the candidate text per device.
class IConfigSource {
 public:
  virtual ~IConfigSource() = default;

  /// Returns nullopt when the device has no intended-config record.
  virtual std::optional<common::IntendedConfig> getIntendedConfig(const std::string& sDevice) = 0;
};

}  // namespace netprov::core
