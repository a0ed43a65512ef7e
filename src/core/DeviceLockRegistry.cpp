#include "core/DeviceLockRegistry.hpp"

#include "common/Errors.hpp"

#include <utility>

namespace netprov::core {

DeviceLockRegistry::Lease::Lease(DeviceLockRegistry* pRegistry, std::string sDevice)
    : _pRegistry(pRegistry), _sDevice(std::move(sDevice)) {}

DeviceLockRegistry::Lease::Lease(Lease&& other) noexcept
    : _pRegistry(std::exchange(other._pRegistry, nullptr)),
      _sDevice(std::move(other._sDevice)) {}

DeviceLockRegistry::Lease& DeviceLockRegistry::Lease::operator=(Lease&& other) noexcept {
  if (this != &other) {
    release();
    _pRegistry = std::exchange(other._pRegistry, nullptr);
    _sDevice = std::move(other._sDevice);
  }
  return *this;
}

DeviceLockRegistry::Lease::~Lease() {
  release();
}

void DeviceLockRegistry::Lease::release() {
  if (_pRegistry) {
    _pRegistry->unlock(_sDevice);
    _pRegistry = nullptr;
  }
}

DeviceLockRegistry::DeviceLockRegistry() = default;
DeviceLockRegistry::~DeviceLockRegistry() = default;

DeviceLockRegistry::Lease DeviceLockRegistry::acquire(const std::string& sDevice) {
  std::lock_guard<std::mutex> lock(_mtx);
  if (!_usHeld.insert(sDevice).second) {
    throw common::DeploymentLockedError(
        "deployment_in_progress",
        "Device '" + sDevice + "' is already being deployed by another attempt");
  }
  return Lease(this, sDevice);
}

bool DeviceLockRegistry::isHeld(const std::string& sDevice) const {
  std::lock_guard<std::mutex> lock(_mtx);
  return _usHeld.count(sDevice) > 0;
}

void DeviceLockRegistry::unlock(const std::string& sDevice) {
  std::lock_guard<std::mutex> lock(_mtx);
  _usHeld.erase(sDevice);
}

}  // namespace netprov::core
