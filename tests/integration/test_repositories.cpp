// Requires db/schema.sql applied to the database named by NETPROV_DB_URL.

#include "dal/DeviceRepository.hpp"
#include "dal/IntendedConfigRepository.hpp"
#include "dal/SecretsGroupRepository.hpp"

#include "common/Logger.hpp"
#include "dal/ConnectionPool.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <memory>
#include <string>

using netprov::dal::ConnectionPool;
using netprov::dal::DeviceRepository;
using netprov::dal::IntendedConfigRepository;
using netprov::dal::SecretsGroupRepository;
using netprov::secrets::SecretAccessType;
using netprov::secrets::SecretType;

namespace {

std::string getDbUrl() {
  const char* pUrl = std::getenv("NETPROV_DB_URL");
  return pUrl ? std::string(pUrl) : std::string{};
}

}  // namespace

class RepositoryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    _sDbUrl = getDbUrl();
    if (_sDbUrl.empty()) {
      GTEST_SKIP() << "NETPROV_DB_URL not set, skipping integration test";
    }
    netprov::common::Logger::init("warn");
    _cpPool = std::make_unique<ConnectionPool>(_sDbUrl, 2);

    auto cg = _cpPool->checkout();
    pqxx::work txn(*cg);
    txn.exec("DELETE FROM golden_config");
    txn.exec("DELETE FROM devices");
    txn.exec("DELETE FROM secrets_group_associations");
    txn.exec("DELETE FROM secrets_groups");
    txn.exec("DELETE FROM secrets");
    txn.exec("DELETE FROM platforms");

    txn.exec(
        "INSERT INTO platforms (name, driver, driver_options) "
        "VALUES ('Arista EOS', 'eos', '{\"port\": 8443}'::jsonb), ('Bare', NULL, NULL)");
    txn.exec("INSERT INTO secrets_groups (name) VALUES ('fabric')");
    txn.exec(
        "INSERT INTO secrets (name, provider, parameters) VALUES "
        "('fabric-user', 'environment-variable', "
        " '{\"variable\": \"NET_{{ obj.name }}_USER\"}'::jsonb), "
        "('fabric-pass', 'text-file', '{\"path\": \"/run/secrets/fabric\", \"strip\": true}'::jsonb)");
    txn.exec(
        "INSERT INTO secrets_group_associations (group_id, secret_id, access_type, secret_type) "
        "SELECT g.id, s.id, 'Generic', 'username' FROM secrets_groups g, secrets s "
        "WHERE g.name = 'fabric' AND s.name = 'fabric-user'");
    txn.exec(
        "INSERT INTO secrets_group_associations (group_id, secret_id, access_type, secret_type) "
        "SELECT g.id, s.id, 'Generic', 'password' FROM secrets_groups g, secrets s "
        "WHERE g.name = 'fabric' AND s.name = 'fabric-pass'");
    txn.exec(
        "INSERT INTO secrets_group_associations (group_id, secret_id, access_type, secret_type) "
        "SELECT g.id, s.id, 'Telnet', 'password' FROM secrets_groups g, secrets s "
        "WHERE g.name = 'fabric' AND s.name = 'fabric-pass'");
    txn.exec(
        "INSERT INTO devices (name, platform_id, primary_ip4, secrets_group_id) "
        "SELECT 'leaf1', p.id, '192.0.2.10/24', g.id FROM platforms p, secrets_groups g "
        "WHERE p.name = 'Arista EOS' AND g.name = 'fabric'");
    txn.exec(
        "INSERT INTO devices (name, platform_id, primary_ip4) "
        "SELECT 'bare1', p.id, NULL FROM platforms p WHERE p.name = 'Bare'");
    txn.exec("INSERT INTO devices (name) VALUES ('orphan1')");
    txn.exec(
        "INSERT INTO golden_config (device_id, intended_config, intended_last_success_date) "
        "SELECT id, 'hostname leaf1\nvlan 10\n', '2026-10-01 12:00:00+00' "
        "FROM devices WHERE name = 'leaf1'");
    txn.exec(
        "INSERT INTO golden_config (device_id, intended_config) "
        "SELECT id, NULL FROM devices WHERE name = 'bare1'");
    txn.commit();
  }

  std::string _sDbUrl;
  std::unique_ptr<ConnectionPool> _cpPool;
};

// ── DeviceRepository ───────────────────────────────────────────────────────

TEST_F(RepositoryTest, FindDeviceJoinsPlatformAndSecretsGroup) {
  DeviceRepository dvr(*_cpPool);
  auto oDevice = dvr.findDevice("leaf1");
  ASSERT_TRUE(oDevice.has_value());
  EXPECT_EQ(oDevice->sName, "leaf1");
  EXPECT_EQ(oDevice->oPlatform.value_or(""), "Arista EOS");
  EXPECT_EQ(oDevice->oDriver.value_or(""), "eos");
  EXPECT_EQ(oDevice->oPrimaryIp4.value_or(""), "192.0.2.10/24");
  EXPECT_EQ(oDevice->oSecretsGroup.value_or(""), "fabric");
  ASSERT_TRUE(oDevice->oDriverOptionsJson.has_value());
  EXPECT_NE(oDevice->oDriverOptionsJson->find("8443"), std::string::npos);
}

TEST_F(RepositoryTest, FindDeviceKeepsMissingFieldsUnset) {
  DeviceRepository dvr(*_cpPool);

  auto oBare = dvr.findDevice("bare1");
  ASSERT_TRUE(oBare.has_value());
  EXPECT_TRUE(oBare->oPlatform.has_value());
  EXPECT_FALSE(oBare->oDriver.has_value());
  EXPECT_FALSE(oBare->oPrimaryIp4.has_value());

  auto oOrphan = dvr.findDevice("orphan1");
  ASSERT_TRUE(oOrphan.has_value());
  EXPECT_FALSE(oOrphan->oPlatform.has_value());
  EXPECT_FALSE(oOrphan->oSecretsGroup.has_value());
}

TEST_F(RepositoryTest, FindDeviceReturnsNulloptForUnknown) {
  DeviceRepository dvr(*_cpPool);
  EXPECT_FALSE(dvr.findDevice("ghost").has_value());
}

// ── IntendedConfigRepository ───────────────────────────────────────────────

TEST_F(RepositoryTest, IntendedConfigWithLastSuccess) {
  IntendedConfigRepository icr(*_cpPool);
  auto oConfig = icr.getIntendedConfig("leaf1");
  ASSERT_TRUE(oConfig.has_value());
  EXPECT_EQ(oConfig->sConfig, "hostname leaf1\nvlan 10\n");
  ASSERT_TRUE(oConfig->oLastSuccess.has_value());
  EXPECT_NE(oConfig->oLastSuccess->find("2026-10-01"), std::string::npos);
}

TEST_F(RepositoryTest, NullIntendedConfigReadsAsEmpty) {
  IntendedConfigRepository icr(*_cpPool);
  auto oConfig = icr.getIntendedConfig("bare1");
  ASSERT_TRUE(oConfig.has_value());
  EXPECT_TRUE(oConfig->sConfig.empty());
}

TEST_F(RepositoryTest, MissingIntendedConfigRecord) {
  IntendedConfigRepository icr(*_cpPool);
  EXPECT_FALSE(icr.getIntendedConfig("orphan1").has_value());
  EXPECT_FALSE(icr.getIntendedConfig("ghost").has_value());
}

// ── SecretsGroupRepository ─────────────────────────────────────────────────

TEST_F(RepositoryTest, FindGroupLoadsKnownAssociations) {
  SecretsGroupRepository sgr(*_cpPool);
  auto oGroup = sgr.findGroup("fabric");
  ASSERT_TRUE(oGroup.has_value());
  EXPECT_EQ(oGroup->sName, "fabric");
  // The 'Telnet' association has an unknown access type and is skipped.
  EXPECT_EQ(oGroup->mAssociations.size(), 2u);

  const auto* pUser = oGroup->find(SecretAccessType::Generic, SecretType::Username);
  ASSERT_NE(pUser, nullptr);
  EXPECT_EQ(pUser->sProvider, "environment-variable");
  EXPECT_EQ(pUser->mParameters.at("variable"), "NET_{{ obj.name }}_USER");

  const auto* pPass = oGroup->find(SecretAccessType::Generic, SecretType::Password);
  ASSERT_NE(pPass, nullptr);
  EXPECT_EQ(pPass->sProvider, "text-file");
  EXPECT_EQ(pPass->mParameters.at("path"), "/run/secrets/fabric");
  EXPECT_EQ(pPass->mParameters.at("strip"), "true");
}

TEST_F(RepositoryTest, FindGroupReturnsNulloptForUnknown) {
  SecretsGroupRepository sgr(*_cpPool);
  EXPECT_FALSE(sgr.findGroup("nope").has_value());
}
