#include "transport/TransportFactory.hpp"

#include "common/Errors.hpp"
#include "transport/EosTransport.hpp"
#include "transport/LabTransport.hpp"

namespace netprov::transport {

TransportFactory::TransportFactory() = default;
TransportFactory::~TransportFactory() = default;

void TransportFactory::registerDriver(const std::string& sDriver, Creator fnCreate) {
  _mCreators[sDriver] = std::move(fnCreate);
}

std::unique_ptr<ITransport> TransportFactory::create(const std::string& sDriver) const {
  auto it = _mCreators.find(sDriver);
  if (it == _mCreators.end()) {
    throw common::ValidationError("unsupported_driver",
                                  "No transport registered for driver '" + sDriver + "'");
  }
  return it->second();
}

bool TransportFactory::supports(const std::string& sDriver) const {
  return _mCreators.count(sDriver) > 0;
}

std::vector<std::string> TransportFactory::drivers() const {
  std::vector<std::string> vDrivers;
  vDrivers.reserve(_mCreators.size());
  for (const auto& [sName, fn] : _mCreators) {
    vDrivers.push_back(sName);
  }
  return vDrivers;
}

TransportFactory TransportFactory::withBuiltins(const std::string& sLabRoot) {
  TransportFactory tf;
  tf.registerDriver("lab", [sLabRoot]() { return std::make_unique<LabTransport>(sLabRoot); });
  tf.registerDriver("eos", []() { return std::make_unique<EosTransport>(); });
  return tf;
}

}  // namespace netprov::transport
