#include "transport/ConfigText.hpp"

#include <sstream>

namespace netprov::transport {

std::vector<std::string> normalizeConfig(const std::string& sConfig) {
  std::vector<std::string> vLines;
  std::istringstream iss(sConfig);
  std::string sLine;
  while (std::getline(iss, sLine)) {
    while (!sLine.empty() &&
           (sLine.back() == ' ' || sLine.back() == '\t' || sLine.back() == '\r')) {
      sLine.pop_back();
    }
    const auto nFirst = sLine.find_first_not_of(" \t");
    if (nFirst == std::string::npos) continue;
    if (sLine[nFirst] == '!') continue;
    if (sLine.compare(nFirst, std::string::npos, "end") == 0) continue;
    vLines.push_back(std::move(sLine));
  }
  return vLines;
}

}  // namespace netprov::transport
