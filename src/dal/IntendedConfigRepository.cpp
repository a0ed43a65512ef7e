#include "dal/IntendedConfigRepository.hpp"

#include "dal/ConnectionPool.hpp"

#include <pqxx/pqxx>

namespace netprov::dal {

IntendedConfigRepository::IntendedConfigRepository(ConnectionPool& cpPool) : _cpPool(cpPool) {}
IntendedConfigRepository::~IntendedConfigRepository() = default;

std::optional<common::IntendedConfig> IntendedConfigRepository::getIntendedConfig(
    const std::string& sDevice) {
  auto cg = _cpPool.checkout();
  pqxx::read_transaction txn(*cg);
  // Fall back to last_modified when the intended job never recorded a success.
  auto result = txn.exec(
      "SELECT COALESCE(gc.intended_config, ''), "
      "       COALESCE(gc.intended_last_success_date, gc.last_modified)::text "
      "FROM golden_config gc JOIN devices d ON d.id = gc.device_id "
      "WHERE d.name = $1",
      pqxx::params{sDevice});
  txn.commit();

  if (result.empty()) return std::nullopt;

  auto row = result[0];
  common::IntendedConfig ic;
  ic.sConfig = row[0].as<std::string>();
  if (!row[1].is_null()) ic.oLastSuccess = row[1].as<std::string>();
  return ic;
}

}  // namespace netprov::dal
