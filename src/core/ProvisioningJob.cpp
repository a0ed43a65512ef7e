#include "core/ProvisioningJob.hpp"

#include "common/Errors.hpp"
#include "transport/TransportOptions.hpp"

#include <optional>
#include <sstream>

namespace netprov::core {

namespace {

constexpr size_t kPreviewLines = 10;
const std::string kRule(80, '=');
const std::string kThinRule(80, '-');

common::DeploymentResult failedResult(const common::AppError& ex) {
  common::DeploymentResult dr;
  dr.status = common::DeploymentStatus::Failed;
  dr.oError = common::DeploymentError{ex._kind, ex._sErrorCode, ex.what()};
  return dr;
}

std::string preview(const std::string& sConfig) {
  std::istringstream iss(sConfig);
  std::ostringstream oss;
  std::string sLine;
  for (size_t i = 0; i < kPreviewLines && std::getline(iss, sLine); ++i) {
    oss << sLine << '\n';
  }
  oss << "...";
  return oss.str();
}

bool isBlank(const std::optional<std::string>& oValue) {
  return !oValue || oValue->find_first_not_of(" \t\r\n") == std::string::npos;
}

}  // namespace

ProvisioningJob::ProvisioningJob(IDeviceInventory& diInventory, IConfigSource& csSource,
                                 const DeploymentEngine& depEngine, DeviceLockRegistry* pLocks)
    : _diInventory(diInventory), _csSource(csSource), _depEngine(depEngine), _pLocks(pLocks) {}

ProvisioningJob::~ProvisioningJob() = default;

common::DeviceTarget ProvisioningJob::validate(const common::InventoryDevice& idDevice) {
  if (isBlank(idDevice.oPlatform)) {
    throw common::ValidationError("platform_missing",
                                  "Device " + idDevice.sName + " has no platform configured");
  }
  if (isBlank(idDevice.oDriver)) {
    throw common::ValidationError("driver_missing",
                                  "Device " + idDevice.sName + " platform '" +
                                      *idDevice.oPlatform + "' has no driver configured");
  }
  if (isBlank(idDevice.oPrimaryIp4)) {
    throw common::ValidationError("primary_ip_missing",
                                  "Device " + idDevice.sName + " has no primary IPv4 address");
  }

  common::DeviceTarget dtTarget;
  dtTarget.sName = idDevice.sName;
  // Inventory stores interface addresses in CIDR form; strip the prefix length.
  const std::string& sAddress = *idDevice.oPrimaryIp4;
  dtTarget.sHost = sAddress.substr(0, sAddress.find('/'));
  dtTarget.sDriver = *idDevice.oDriver;
  if (idDevice.oSecretsGroup && !idDevice.oSecretsGroup->empty()) {
    dtTarget.oSecretsGroup = idDevice.oSecretsGroup;
  }
  if (idDevice.oDriverOptionsJson) {
    dtTarget.mOptions = transport::parseOptionMap(*idDevice.oDriverOptionsJson);
  }
  return dtTarget;
}

common::DeploymentResult ProvisioningJob::run(const JobParams& jp,
                                              std::stop_token stToken) const {
  common::JobLog jlLog(jp.sDevice, jp.bVerbose);
  jlLog.info("{}", kRule);
  jlLog.info("Starting provisioning for device: {}", jp.sDevice);
  jlLog.info("{}", kRule);

  common::DeploymentResult dr;
  try {
    std::optional<DeviceLockRegistry::Lease> oLease;
    if (_pLocks) oLease.emplace(_pLocks->acquire(jp.sDevice));
    dr = provision(jp, jlLog, std::move(stToken));
  } catch (const common::AppError& ex) {
    jlLog.error("{}", ex.what());
    dr = failedResult(ex);
  } catch (const std::exception& ex) {
    jlLog.error("Unexpected error during provisioning: {}", ex.what());
    dr.status = common::DeploymentStatus::Failed;
    dr.oError = common::DeploymentError{common::FailureKind::Unexpected, "unexpected_error",
                                        ex.what()};
  }

  if (dr.status == common::DeploymentStatus::Failed) {
    jlLog.error("Provisioning failed for {}: {}", jp.sDevice,
                dr.oError ? dr.oError->sMessage : std::string("unknown error"));
  } else {
    jlLog.info("{}", kRule);
    jlLog.success("Provisioning completed for {} ({})", jp.sDevice,
                  common::toString(dr.status));
    jlLog.info("{}", kRule);
  }

  auto vTail = jlLog.takeEntries();
  dr.vTrail.insert(dr.vTrail.end(), std::make_move_iterator(vTail.begin()),
                   std::make_move_iterator(vTail.end()));
  return dr;
}

common::DeploymentResult ProvisioningJob::provision(const JobParams& jp, common::JobLog& jlLog,
                                                    std::stop_token stToken) const {
  jlLog.info("Validating device configuration...");
  auto oDevice = _diInventory.findDevice(jp.sDevice);
  if (!oDevice) {
    throw common::NotFoundError("device_not_found",
                                "Device '" + jp.sDevice + "' not found in inventory");
  }
  common::DeviceTarget dtTarget = validate(*oDevice);
  jlLog.success("Device validation passed");

  common::DeploymentRequest req;
  req.target = std::move(dtTarget);
  req.sCandidateConfig = loadIntendedConfig(jp.sDevice, jlLog);
  req.bDryRun = jp.bDryRun;
  req.bReplace = jp.bReplace;
  req.bCommitOnSuccess = jp.bCommit;

  jlLog.info("{}", kThinRule);
  jlLog.info("Connecting to device and deploying configuration...");
  return _depEngine.deploy(req, jlLog, std::move(stToken));
}

std::string ProvisioningJob::loadIntendedConfig(const std::string& sDevice,
                                                common::JobLog& jlLog) const {
  jlLog.info("{}", kThinRule);
  jlLog.info("Loading intended configuration...");

  std::optional<common::IntendedConfig> oIntended;
  try {
    oIntended = _csSource.getIntendedConfig(sDevice);
  } catch (const std::exception& ex) {
    throw common::ConfigUnavailableError(
        "config_source_error",
        "Intended configuration for " + sDevice + " could not be read: " + ex.what());
  }

  if (!oIntended) {
    throw common::ConfigUnavailableError(
        "intended_config_missing",
        "No intended configuration record found for " + sDevice +
            "; generate intended configurations first");
  }
  if (isBlank(oIntended->sConfig)) {
    throw common::ConfigUnavailableError(
        "intended_config_empty",
        "Intended configuration record for " + sDevice + " exists but is empty");
  }

  jlLog.success("Found existing intended config (last updated: {})",
                oIntended->oLastSuccess.value_or("unknown"));
  jlLog.info("Config preview:\n{}", preview(oIntended->sConfig));
  return std::move(oIntended->sConfig);
}

}  // namespace netprov::core
