#pragma once

#include <optional>
#include <string>

#include "common/Types.hpp"
#include "core/IDeviceInventory.hpp"

namespace netprov::dal {

class ConnectionPool;

/// Device inventory backed by devices + platforms + secrets_groups.
/// Class abbreviation: dvr
class DeviceRepository : public core::IDeviceInventory {
 public:
  explicit DeviceRepository(ConnectionPool& cpPool);
  ~DeviceRepository() override;

  std::optional<common::InventoryDevice> findDevice(const std::string& sName) override;

 private:
  ConnectionPool& _cpPool;
};

}  // namespace netprov::dal
