#include "core/ProvisioningBatch.hpp"

#include "common/Logger.hpp"

#include <algorithm>
#include <future>
#include <unordered_set>

namespace netprov::core {

ProvisioningBatch::ProvisioningBatch(const ProvisioningJob& pjJob, ThreadPool& tpPool)
    : _pjJob(pjJob), _tpPool(tpPool) {}

ProvisioningBatch::~ProvisioningBatch() = default;

std::vector<BatchItem> ProvisioningBatch::run(const std::vector<std::string>& vDevices,
                                              const JobParams& jpTemplate,
                                              std::stop_token stToken) const {
  auto spLog = common::Logger::get();

  std::vector<std::string> vUnique;
  std::unordered_set<std::string> usSeen;
  for (const auto& sDevice : vDevices) {
    if (usSeen.insert(sDevice).second) {
      vUnique.push_back(sDevice);
    } else if (spLog) {
      spLog->warn("Device '{}' listed more than once; provisioning it once", sDevice);
    }
  }

  std::vector<std::future<common::DeploymentResult>> vFutures;
  vFutures.reserve(vUnique.size());
  for (const auto& sDevice : vUnique) {
    JobParams jp = jpTemplate;
    jp.sDevice = sDevice;
    vFutures.push_back(_tpPool.submit(
        [this, jp, stToken]() { return _pjJob.run(jp, stToken); }));
  }

  std::vector<BatchItem> vItems;
  vItems.reserve(vUnique.size());
  for (size_t i = 0; i < vUnique.size(); ++i) {
    BatchItem bi{vUnique[i], {}};
    try {
      bi.result = vFutures[i].get();
    } catch (const std::exception& ex) {
      bi.result.status = common::DeploymentStatus::Failed;
      bi.result.oError = common::DeploymentError{common::FailureKind::Unexpected,
                                                 "unexpected_error", ex.what()};
      if (spLog) spLog->error("[{}] job aborted: {}", vUnique[i], ex.what());
    }
    vItems.push_back(std::move(bi));
  }
  return vItems;
}

bool ProvisioningBatch::anyFailed(const std::vector<BatchItem>& vItems) {
  return std::any_of(vItems.begin(), vItems.end(), [](const BatchItem& bi) {
    return bi.result.status == common::DeploymentStatus::Failed;
  });
}

}  // namespace netprov::core
