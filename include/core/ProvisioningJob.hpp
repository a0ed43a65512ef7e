#pragma once

#include <stop_token>
#include <string>

#include "common/JobLog.hpp"
#include "common/Types.hpp"
#include "core/DeploymentEngine.hpp"
#include "core/DeviceLockRegistry.hpp"
#include "core/IConfigSource.hpp"
#include "core/IDeviceInventory.hpp"

namespace netprov::core {

/// Parameters of one provisioning run.
/// Class abbreviation: jp
struct JobParams {
  std::string sDevice;
  bool bDryRun = true;
  bool bReplace = false;
  bool bCommit = true;
  bool bVerbose = false;
};

/// Provisions one device from its intended configuration: look up, validate,
/// fetch intended config, deploy. Validation and config failures are
/// reported as Failed results before any connection is attempted.
///
/// Stateless apart from its collaborators; run() may be called concurrently
/// for different devices. When a lock registry is supplied, concurrent runs
/// against the same device yield a Locked failure.
/// Class abbreviation: pj
class ProvisioningJob {
 public:
  ProvisioningJob(IDeviceInventory& diInventory, IConfigSource& csSource,
                  const DeploymentEngine& depEngine, DeviceLockRegistry* pLocks = nullptr);
  ~ProvisioningJob();

  /// Never throws for device-level failures; every outcome is a result.
  common::DeploymentResult run(const JobParams& jp, std::stop_token stToken = {}) const;

  /// Inventory row → DeviceTarget. Throws common::ValidationError.
  static common::DeviceTarget validate(const common::InventoryDevice& idDevice);

 private:
  common::DeploymentResult provision(const JobParams& jp, common::JobLog& jlLog,
                                     std::stop_token stToken) const;
  std::string loadIntendedConfig(const std::string& sDevice, common::JobLog& jlLog) const;

  IDeviceInventory& _diInventory;
  IConfigSource& _csSource;
  const DeploymentEngine& _depEngine;
  DeviceLockRegistry* _pLocks;
};

}  // namespace netprov::core
