#pragma once

#include <stop_token>
#include <string>
#include <vector>

#include "common/Types.hpp"
#include "core/ProvisioningJob.hpp"
#include "core/ThreadPool.hpp"

namespace netprov::core {

/// Outcome of one device within a batch.
/// Class abbreviation: bi
struct BatchItem {
  std::string sDevice;
  common::DeploymentResult result;
};

/// Runs one ProvisioningJob per device on a thread pool. Each device gets its
/// own engine attempt and session. Results come back in request order.
/// Class abbreviation: pb
class ProvisioningBatch {
 public:
  ProvisioningBatch(const ProvisioningJob& pjJob, ThreadPool& tpPool);
  ~ProvisioningBatch();

  /// jpTemplate supplies the flags; its sDevice is replaced per device.
  /// Duplicate names are collapsed to their first occurrence.
  std::vector<BatchItem> run(const std::vector<std::string>& vDevices, const JobParams& jpTemplate,
                             std::stop_token stToken = {}) const;

  static bool anyFailed(const std::vector<BatchItem>& vItems);

 private:
  const ProvisioningJob& _pjJob;
  ThreadPool& _tpPool;
};

}  // namespace netprov::core
