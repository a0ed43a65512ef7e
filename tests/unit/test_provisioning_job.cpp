#include "core/ProvisioningJob.hpp"

#include "common/Errors.hpp"
#include "core/CredentialResolver.hpp"
#include "unit/FakeCollaborators.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <stop_token>
#include <string>
#include <variant>

using netprov::common::DeploymentStatus;
using netprov::common::FailureKind;
using netprov::common::InventoryDevice;
using netprov::common::LogTier;
using netprov::common::ValidationError;
using netprov::core::CredentialResolver;
using netprov::core::DefaultCredentials;
using netprov::core::DeploymentEngine;
using netprov::core::DeviceLockRegistry;
using netprov::core::JobParams;
using netprov::core::ProvisioningJob;
using netprov::fakes::FakeScript;
using netprov::fakes::FakeState;
using netprov::fakes::FakeTransport;
using netprov::fakes::InMemoryConfigSource;
using netprov::fakes::InMemoryInventory;
using netprov::fakes::makeInventoryDevice;

class ProvisioningJobTest : public ::testing::Test {
 protected:
  ProvisioningJobTest()
      : _crResolver(nullptr, DefaultCredentials{}),
        _depEngine(_tfFactory, _crResolver),
        _pjJob(_imiInventory, _imcsConfigs, _depEngine, &_dlrLocks) {}

  void SetUp() override {
    _spState = std::make_shared<FakeState>();
    _tfFactory.registerDriver("fake", [this]() {
      return std::make_unique<FakeTransport>(_spState, _fsScript);
    });
    _imiInventory.mDevices["leaf1"] = makeInventoryDevice("leaf1");
    _imcsConfigs.mConfigs["leaf1"] = {"hostname leaf1\nvlan 10\n", "2026-10-01 12:00:00+00"};
  }

  JobParams params(bool bDryRun = true, bool bCommit = true) {
    JobParams jp;
    jp.sDevice = "leaf1";
    jp.bDryRun = bDryRun;
    jp.bCommit = bCommit;
    return jp;
  }

  std::shared_ptr<FakeState> _spState;
  FakeScript _fsScript;
  netprov::transport::TransportFactory _tfFactory;
  CredentialResolver _crResolver;
  DeploymentEngine _depEngine;
  InMemoryInventory _imiInventory;
  InMemoryConfigSource _imcsConfigs;
  DeviceLockRegistry _dlrLocks;
  ProvisioningJob _pjJob;
};

// ── validate ───────────────────────────────────────────────────────────────

TEST(ProvisioningJobValidateTest, StripsPrefixLengthFromPrimaryIp) {
  auto id = makeInventoryDevice("leaf1", "eos");
  id.oSecretsGroup = "fabric";
  id.oDriverOptionsJson = R"({"port": 8443, "verify_tls": false})";

  auto dt = ProvisioningJob::validate(id);
  EXPECT_EQ(dt.sName, "leaf1");
  EXPECT_EQ(dt.sHost, "192.0.2.10");
  EXPECT_EQ(dt.sDriver, "eos");
  ASSERT_TRUE(dt.oSecretsGroup.has_value());
  EXPECT_EQ(*dt.oSecretsGroup, "fabric");
  EXPECT_EQ(std::get<int64_t>(dt.mOptions.at("port")), 8443);
  EXPECT_FALSE(std::get<bool>(dt.mOptions.at("verify_tls")));
}

TEST(ProvisioningJobValidateTest, EachMissingFieldHasItsOwnCode) {
  auto expectCode = [](InventoryDevice id, const std::string& sCode) {
    try {
      ProvisioningJob::validate(id);
      ADD_FAILURE() << "expected ValidationError " << sCode;
    } catch (const ValidationError& ex) {
      EXPECT_EQ(ex._sErrorCode, sCode);
    }
  };

  auto id = makeInventoryDevice("leaf1");
  id.oPlatform.reset();
  expectCode(id, "platform_missing");

  id = makeInventoryDevice("leaf1");
  id.oDriver = "";
  expectCode(id, "driver_missing");

  id = makeInventoryDevice("leaf1");
  id.oPrimaryIp4.reset();
  expectCode(id, "primary_ip_missing");

  id = makeInventoryDevice("leaf1");
  id.oDriverOptionsJson = "{not json";
  expectCode(id, "invalid_driver_options");
}

// ── run ────────────────────────────────────────────────────────────────────

TEST_F(ProvisioningJobTest, DryRunDeploysIntendedConfig) {
  auto dr = _pjJob.run(params());
  EXPECT_EQ(dr.status, DeploymentStatus::DryRunDiscarded);
  EXPECT_EQ(_spState->sStaged, "hostname leaf1\nvlan 10\n");
  EXPECT_EQ(_spState->count("commit"), 0);
  EXPECT_FALSE(_dlrLocks.isHeld("leaf1"));

  bool bSummary = false;
  for (const auto& le : dr.vTrail) {
    if (le.tier == LogTier::Success &&
        le.sMessage.find("Provisioning completed for leaf1") != std::string::npos) {
      bSummary = true;
    }
  }
  EXPECT_TRUE(bSummary);
}

TEST_F(ProvisioningJobTest, LiveCommit) {
  auto dr = _pjJob.run(params(false, true));
  EXPECT_EQ(dr.status, DeploymentStatus::Committed);
  EXPECT_EQ(_spState->count("commit"), 1);
}

TEST_F(ProvisioningJobTest, UnknownDeviceIsNotFound) {
  auto jp = params();
  jp.sDevice = "ghost";
  auto dr = _pjJob.run(jp);
  EXPECT_EQ(dr.status, DeploymentStatus::Failed);
  ASSERT_TRUE(dr.oError.has_value());
  EXPECT_EQ(dr.oError->kind, FailureKind::NotFound);
  EXPECT_TRUE(_spState->vCalls.empty());
}

TEST_F(ProvisioningJobTest, InvalidDeviceFailsBeforeConnecting) {
  _imiInventory.mDevices["leaf1"].oPrimaryIp4.reset();
  auto dr = _pjJob.run(params(false, true));
  EXPECT_EQ(dr.status, DeploymentStatus::Failed);
  ASSERT_TRUE(dr.oError.has_value());
  EXPECT_EQ(dr.oError->kind, FailureKind::Validation);
  EXPECT_TRUE(_spState->vCalls.empty());
}

TEST_F(ProvisioningJobTest, MissingIntendedConfigFailsBeforeConnecting) {
  _imcsConfigs.mConfigs.clear();
  auto dr = _pjJob.run(params(false, true));
  EXPECT_EQ(dr.status, DeploymentStatus::Failed);
  ASSERT_TRUE(dr.oError.has_value());
  EXPECT_EQ(dr.oError->kind, FailureKind::ConfigUnavailable);
  EXPECT_EQ(dr.oError->sCode, "intended_config_missing");
  EXPECT_TRUE(_spState->vCalls.empty());
}

TEST_F(ProvisioningJobTest, EmptyIntendedConfigFailsBeforeConnecting) {
  _imcsConfigs.mConfigs["leaf1"].sConfig = "\n";
  auto dr = _pjJob.run(params(false, true));
  ASSERT_TRUE(dr.oError.has_value());
  EXPECT_EQ(dr.oError->kind, FailureKind::ConfigUnavailable);
  EXPECT_EQ(dr.oError->sCode, "intended_config_empty");
  EXPECT_TRUE(_spState->vCalls.empty());
}

TEST_F(ProvisioningJobTest, ConfigSourceErrorIsConfigUnavailable) {
  _imcsConfigs.bFails = true;
  auto dr = _pjJob.run(params());
  ASSERT_TRUE(dr.oError.has_value());
  EXPECT_EQ(dr.oError->kind, FailureKind::ConfigUnavailable);
  EXPECT_EQ(dr.oError->sCode, "config_source_error");
}

TEST_F(ProvisioningJobTest, InventoryErrorIsUnexpected) {
  _imiInventory.bFails = true;
  auto dr = _pjJob.run(params());
  EXPECT_EQ(dr.status, DeploymentStatus::Failed);
  ASSERT_TRUE(dr.oError.has_value());
  EXPECT_EQ(dr.oError->kind, FailureKind::Unexpected);
}

TEST_F(ProvisioningJobTest, HeldLockYieldsLockedFailure) {
  auto lease = _dlrLocks.acquire("leaf1");
  auto dr = _pjJob.run(params());
  EXPECT_EQ(dr.status, DeploymentStatus::Failed);
  ASSERT_TRUE(dr.oError.has_value());
  EXPECT_EQ(dr.oError->kind, FailureKind::Locked);
  EXPECT_TRUE(_spState->vCalls.empty());
}

TEST_F(ProvisioningJobTest, CancellationBecomesCancelledFailure) {
  std::stop_source ssStop;
  ssStop.request_stop();
  auto dr = _pjJob.run(params(false, true), ssStop.get_token());
  EXPECT_EQ(dr.status, DeploymentStatus::Failed);
  ASSERT_TRUE(dr.oError.has_value());
  EXPECT_EQ(dr.oError->kind, FailureKind::Cancelled);
  EXPECT_FALSE(_dlrLocks.isHeld("leaf1"));
}

TEST_F(ProvisioningJobTest, VerboseTrailIncludesConfigPreview) {
  auto jp = params();
  jp.bVerbose = true;
  auto dr = _pjJob.run(jp);

  bool bPreview = false;
  for (const auto& le : dr.vTrail) {
    if (le.sMessage.find("Config preview:") != std::string::npos) bPreview = true;
  }
  EXPECT_TRUE(bPreview);
}
