#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "transport/IEapiRunner.hpp"

namespace netprov::transport {

/// Connection parameters for an Arista eAPI endpoint.
/// Class abbreviation: ep
struct EapiEndpoint {
  std::string sHost;
  uint16_t uPort = 443;
  bool bTls = true;
  bool bVerifyTls = false;
  std::string sUsername;
  std::string sPassword;
  std::chrono::seconds durConnectTimeout{30};
  std::chrono::seconds durRequestTimeout{60};
};

/// Error raised by EapiClient. The category lets each caller map it onto the
/// failure kind of the operation in progress.
struct EapiError : public std::runtime_error {
  enum class Category { Network, Timeout, Auth, Command, Protocol };

  Category _category;

  explicit EapiError(Category category, const std::string& sMsg)
      : std::runtime_error(sMsg), _category(category) {}
};

/// Minimal JSON-RPC client for /command-api (Boost.Beast, one HTTP
/// connection per call). Every network step is bounded by the endpoint's
/// timeouts.
/// Class abbreviation: ec
class EapiClient : public IEapiRunner {
 public:
  explicit EapiClient(EapiEndpoint epEndpoint);
  ~EapiClient() override;

  EapiClient(const EapiClient&) = delete;
  EapiClient& operator=(const EapiClient&) = delete;

  nlohmann::json runCmds(const std::vector<std::string>& vCmds,
                         const std::string& sFormat = "json") override;

  /// Unwrap a JSON-RPC response body into its "result" array. A device-side
  /// error becomes Category::Command, anything unreadable Category::Protocol.
  static nlohmann::json parseResponse(const std::string& sBody);

 private:
  std::string post(const std::string& sBody);

  EapiEndpoint _epEndpoint;
  std::string _sAuthHeader;
  uint64_t _uNextId = 1;
};

}  // namespace netprov::transport
