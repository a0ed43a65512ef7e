#pragma once

#include <functional>
#include <memory>
#include <string>

#include "transport/EapiClient.hpp"
#include "transport/IEapiRunner.hpp"
#include "transport/ITransport.hpp"

namespace netprov::transport {

/// Arista EOS over eAPI. The candidate is staged in a named configure
/// session, so nothing touches the running config until commit().
///
/// Options: "transport" ("https" | "http"), "port", "verify_tls".
class EosTransport : public ITransport {
 public:
  using RunnerFactory = std::function<std::unique_ptr<IEapiRunner>(EapiEndpoint)>;

  /// Connects with EapiClient.
  EosTransport();
  explicit EosTransport(RunnerFactory fnRunnerFactory);
  ~EosTransport() override;

  std::string name() const override;
  std::unique_ptr<ITransportSession> open(const common::DeviceTarget& dtTarget,
                                          const common::Credentials& crCreds,
                                          const TransportOptions& toOptions) override;

  /// Session names accept [A-Za-z0-9_-] only.
  static std::string sessionNameFor(const std::string& sDevice);

 private:
  RunnerFactory _fnRunnerFactory;
};

/// One configure session on an EOS device.
/// Class abbreviation: es
class EosSession : public ITransportSession {
 public:
  EosSession(std::unique_ptr<IEapiRunner> upRunner, std::string sSessionName);
  ~EosSession() override;

  EosSession(const EosSession&) = delete;
  EosSession& operator=(const EosSession&) = delete;

  void stage(const std::string& sConfig, common::StageMode mode) override;
  std::string diff() override;
  void commit() override;
  void discard() override;
  common::DeviceFacts facts() override;
  void close() override;

 private:
  std::unique_ptr<IEapiRunner> _upRunner;
  std::string _sSessionName;
  bool _bStaged = false;
  bool _bClosed = false;
};

}  // namespace netprov::transport
