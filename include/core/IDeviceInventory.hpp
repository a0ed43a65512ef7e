#pragma once

#include <optional>
#include <string>

#include "common/Types.hpp"

namespace netprov::core {

/// Read-only view of the device inventory. Never mutated by the core.
class IDeviceInventory {
 public:
  virtual ~IDeviceInventory() = default;

  /// Returns nullopt when no device has that name.
  virtual std::optional<common::InventoryDevice> findDevice(const std::string& sName) = 0;
};

}  // namespace netprov::core
