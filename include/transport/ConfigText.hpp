#pragma once

#include <string>
#include <vector>

namespace netprov::transport {

/// Config text as a device sees it: comment lines ("!"), "end" and blank
/// lines dropped, trailing whitespace removed, indentation kept.
std::vector<std::string> normalizeConfig(const std::string& sConfig);

}  // namespace netprov::transport
