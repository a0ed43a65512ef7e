#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "common/Types.hpp"

namespace netprov::transport {

/// Timeouts applied to every blocking call plus the target's opaque options.
/// Class abbreviation: to
struct TransportOptions {
  std::chrono::seconds durConnectTimeout{30};
  std::chrono::seconds durOperationTimeout{60};
  common::OptionMap mExtra;

  std::string getString(const std::string& sKey, const std::string& sDefault) const;
  int64_t getInt(const std::string& sKey, int64_t iDefault) const;
  bool getBool(const std::string& sKey, bool bDefault) const;
};

/// Parse a JSON object of scalars ({"port": 8443, "verify_tls": false}) into
/// an OptionMap. Empty text yields an empty map. Nested values are rejected
/// with common::ValidationError.
common::OptionMap parseOptionMap(const std::string& sJson);

}  // namespace netprov::transport
