#include "transport/TransportOptions.hpp"

#include "common/Errors.hpp"

#include <nlohmann/json.hpp>

#include <variant>

namespace netprov::transport {

std::string TransportOptions::getString(const std::string& sKey,
                                        const std::string& sDefault) const {
  auto it = mExtra.find(sKey);
  if (it == mExtra.end()) return sDefault;
  if (const auto* pStr = std::get_if<std::string>(&it->second)) return *pStr;
  if (const auto* pInt = std::get_if<int64_t>(&it->second)) return std::to_string(*pInt);
  if (const auto* pBool = std::get_if<bool>(&it->second)) return *pBool ? "true" : "false";
  return std::to_string(std::get<double>(it->second));
}

int64_t TransportOptions::getInt(const std::string& sKey, int64_t iDefault) const {
  auto it = mExtra.find(sKey);
  if (it == mExtra.end()) return iDefault;
  if (const auto* pInt = std::get_if<int64_t>(&it->second)) return *pInt;
  if (const auto* pDbl = std::get_if<double>(&it->second)) {
    // [-2^63, 2^63) converts exactly; NaN fails both comparisons.
    if (!(*pDbl >= -9223372036854775808.0 && *pDbl < 9223372036854775808.0)) {
      throw common::ValidationError("invalid_option",
                                    "Option '" + sKey + "' is out of integer range");
    }
    return static_cast<int64_t>(*pDbl);
  }
  if (const auto* pStr = std::get_if<std::string>(&it->second)) {
    try {
      return std::stoll(*pStr);
    } catch (const std::exception&) {
      throw common::ValidationError("invalid_option",
                                    "Option '" + sKey + "' is not an integer: " + *pStr);
    }
  }
  throw common::ValidationError("invalid_option", "Option '" + sKey + "' is not an integer");
}

bool TransportOptions::getBool(const std::string& sKey, bool bDefault) const {
  auto it = mExtra.find(sKey);
  if (it == mExtra.end()) return bDefault;
  if (const auto* pBool = std::get_if<bool>(&it->second)) return *pBool;
  if (const auto* pStr = std::get_if<std::string>(&it->second)) {
    return *pStr == "true" || *pStr == "1" || *pStr == "yes";
  }
  if (const auto* pInt = std::get_if<int64_t>(&it->second)) return *pInt != 0;
  throw common::ValidationError("invalid_option", "Option '" + sKey + "' is not a boolean");
}

common::OptionMap parseOptionMap(const std::string& sJson) {
  common::OptionMap mOptions;
  if (sJson.find_first_not_of(" \t\r\n") == std::string::npos) {
    return mOptions;
  }

  nlohmann::json jOptions;
  try {
    jOptions = nlohmann::json::parse(sJson);
  } catch (const nlohmann::json::parse_error& ex) {
    throw common::ValidationError("invalid_driver_options",
                                  std::string("Driver options are not valid JSON: ") + ex.what());
  }

  if (jOptions.is_null()) return mOptions;
  if (!jOptions.is_object()) {
    throw common::ValidationError("invalid_driver_options",
                                  "Driver options must be a JSON object");
  }

  for (const auto& [sKey, jValue] : jOptions.items()) {
    if (jValue.is_boolean()) {
      mOptions.emplace(sKey, jValue.get<bool>());
    } else if (jValue.is_number_integer()) {
      mOptions.emplace(sKey, jValue.get<int64_t>());
    } else if (jValue.is_number_float()) {
      mOptions.emplace(sKey, jValue.get<double>());
    } else if (jValue.is_string()) {
      mOptions.emplace(sKey, jValue.get<std::string>());
    } else {
      throw common::ValidationError("invalid_driver_options",
                                    "Driver option '" + sKey + "' must be a scalar");
    }
  }
  return mOptions;
}

}  // namespace netprov::transport
