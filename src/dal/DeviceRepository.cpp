#include "dal/DeviceRepository.hpp"

#include "dal/ConnectionPool.hpp"

#include <pqxx/pqxx>

namespace netprov::dal {

namespace {

std::optional<std::string> optionalText(const pqxx::field& fld) {
  if (fld.is_null()) return std::nullopt;
  return fld.as<std::string>();
}

}  // namespace

DeviceRepository::DeviceRepository(ConnectionPool& cpPool) : _cpPool(cpPool) {}
DeviceRepository::~DeviceRepository() = default;

std::optional<common::InventoryDevice> DeviceRepository::findDevice(const std::string& sName) {
  auto cg = _cpPool.checkout();
  pqxx::read_transaction txn(*cg);
  auto result = txn.exec(
      "SELECT d.name, p.name, p.driver, d.primary_ip4, p.driver_options::text, sg.name "
      "FROM devices d "
      "LEFT JOIN platforms p ON p.id = d.platform_id "
      "LEFT JOIN secrets_groups sg ON sg.id = d.secrets_group_id "
      "WHERE d.name = $1",
      pqxx::params{sName});
  txn.commit();

  if (result.empty()) return std::nullopt;

  auto row = result[0];
  return common::InventoryDevice{
      row[0].as<std::string>(),
      optionalText(row[1]),
      optionalText(row[2]),
      optionalText(row[3]),
      optionalText(row[4]),
      optionalText(row[5]),
  };
}

}  // namespace netprov::dal
