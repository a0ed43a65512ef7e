#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "transport/ITransport.hpp"

namespace netprov::transport {

/// Creates concrete ITransport instances by driver name.
/// Class abbreviation: tf
class TransportFactory {
 public:
  using Creator = std::function<std::unique_ptr<ITransport>()>;

  TransportFactory();
  ~TransportFactory();

  TransportFactory(TransportFactory&&) noexcept = default;
  TransportFactory& operator=(TransportFactory&&) noexcept = default;

  void registerDriver(const std::string& sDriver, Creator fnCreate);

  /// Throws common::ValidationError for an unregistered driver.
  std::unique_ptr<ITransport> create(const std::string& sDriver) const;

  bool supports(const std::string& sDriver) const;
  std::vector<std::string> drivers() const;

  /// Factory with the "lab" (rooted at sLabRoot) and "eos" drivers registered.
  static TransportFactory withBuiltins(const std::string& sLabRoot);

 private:
  std::map<std::string, Creator> _mCreators;
};

}  // namespace netprov::transport
