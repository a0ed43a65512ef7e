#pragma once

#include <mutex>
#include <string>
#include <unordered_set>

namespace netprov::core {

/// In-process per-device exclusion. At most one Lease exists per device name.
/// Class abbreviation: dlr
class DeviceLockRegistry {
 public:
  /// Releases its device on destruction. Movable, not copyable.
  class Lease {
   public:
    Lease(Lease&& other) noexcept;
    Lease& operator=(Lease&& other) noexcept;
    ~Lease();

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    const std::string& device() const { return _sDevice; }
    void release();

   private:
    friend class DeviceLockRegistry;
    Lease(DeviceLockRegistry* pRegistry, std::string sDevice);

    DeviceLockRegistry* _pRegistry;
    std::string _sDevice;
  };

  DeviceLockRegistry();
  ~DeviceLockRegistry();

  DeviceLockRegistry(const DeviceLockRegistry&) = delete;
  DeviceLockRegistry& operator=(const DeviceLockRegistry&) = delete;

  /// Throws common::DeploymentLockedError if the device is already leased.
  Lease acquire(const std::string& sDevice);

  bool isHeld(const std::string& sDevice) const;

 private:
  void unlock(const std::string& sDevice);

  mutable std::mutex _mtx;
  std::unordered_set<std::string> _usHeld;
};

}  // namespace netprov::core
