#include "dal/SecretsGroupRepository.hpp"

#include "common/Logger.hpp"
#include "dal/ConnectionPool.hpp"

#include <nlohmann/json.hpp>
#include <pqxx/pqxx>

namespace netprov::dal {

namespace {

/// Secret parameters are a flat JSON object; non-string scalars are kept in
/// their JSON text form.
std::map<std::string, std::string> parseParameters(const std::string& sJson) {
  std::map<std::string, std::string> mParams;
  auto j = nlohmann::json::parse(sJson);
  if (!j.is_object()) return mParams;
  for (auto it = j.begin(); it != j.end(); ++it) {
    mParams[it.key()] = it.value().is_string() ? it.value().get<std::string>()
                                               : it.value().dump();
  }
  return mParams;
}

}  // namespace

SecretsGroupRepository::SecretsGroupRepository(ConnectionPool& cpPool) : _cpPool(cpPool) {}
SecretsGroupRepository::~SecretsGroupRepository() = default;

std::optional<secrets::SecretsGroup> SecretsGroupRepository::findGroup(
    const std::string& sName) {
  auto cg = _cpPool.checkout();
  pqxx::read_transaction txn(*cg);

  auto groupResult =
      txn.exec("SELECT id FROM secrets_groups WHERE name = $1", pqxx::params{sName});
  if (groupResult.empty()) {
    txn.commit();
    return std::nullopt;
  }
  const auto iGroupId = groupResult[0][0].as<int64_t>();

  auto result = txn.exec(
      "SELECT a.access_type, a.secret_type, s.name, s.provider, s.parameters::text "
      "FROM secrets_group_associations a JOIN secrets s ON s.id = a.secret_id "
      "WHERE a.group_id = $1 ORDER BY a.id",
      pqxx::params{iGroupId});
  txn.commit();

  secrets::SecretsGroup sg;
  sg.sName = sName;
  for (const auto& row : result) {
    const auto sAccess = row[0].as<std::string>();
    const auto sType = row[1].as<std::string>();
    auto oAccess = secrets::parseAccessType(sAccess);
    auto oType = secrets::parseSecretType(sType);
    if (!oAccess || !oType) {
      common::Logger::get()->warn("Secrets group '{}': skipping association {}/{}", sName,
                                  sAccess, sType);
      continue;
    }

    secrets::SecretDefinition sd;
    sd.sName = row[2].as<std::string>();
    sd.sProvider = row[3].as<std::string>();
    try {
      sd.mParameters = parseParameters(row[4].as<std::string>());
    } catch (const nlohmann::json::exception& ex) {
      common::Logger::get()->warn("Secret '{}' has unreadable parameters: {}", sd.sName,
                                  ex.what());
      continue;
    }
    sg.mAssociations[{*oAccess, *oType}] = std::move(sd);
  }
  return sg;
}

}  // namespace netprov::dal
