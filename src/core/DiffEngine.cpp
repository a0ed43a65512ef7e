#include "core/DiffEngine.hpp"

#include <algorithm>
#include <cstdint>

namespace netprov::core {

namespace {

// 4M cells of uint32_t: the LCS table never exceeds ~16 MB.
constexpr size_t kMaxLcsCells = size_t{4} * 1024 * 1024;

}  // namespace

DiffEngine::DiffEngine() = default;
DiffEngine::~DiffEngine() = default;

std::vector<LineChange> DiffEngine::compare(const std::vector<std::string>& vRunning,
                                            const std::vector<std::string>& vCandidate) const {
  // Common prefix and suffix never show up in the diff; trimming them keeps
  // the LCS table small for the usual "few lines changed" case.
  size_t nPrefix = 0;
  while (nPrefix < vRunning.size() && nPrefix < vCandidate.size() &&
         vRunning[nPrefix] == vCandidate[nPrefix]) {
    ++nPrefix;
  }
  size_t nSuffix = 0;
  while (nSuffix < vRunning.size() - nPrefix && nSuffix < vCandidate.size() - nPrefix &&
         vRunning[vRunning.size() - 1 - nSuffix] == vCandidate[vCandidate.size() - 1 - nSuffix]) {
    ++nSuffix;
  }

  const size_t nOld = vRunning.size() - nPrefix - nSuffix;
  const size_t nNew = vCandidate.size() - nPrefix - nSuffix;
  auto oldAt = [&](size_t i) -> const std::string& { return vRunning[nPrefix + i]; };
  auto newAt = [&](size_t j) -> const std::string& { return vCandidate[nPrefix + j]; };

  std::vector<LineChange> vChanges;
  if (nOld != 0 && nNew > kMaxLcsCells / nOld) {
    // Too large to align line by line: report the differing block as a
    // wholesale remove then add.
    for (size_t i = 0; i < nOld; ++i) vChanges.push_back({LineAction::Remove, oldAt(i)});
    for (size_t j = 0; j < nNew; ++j) vChanges.push_back({LineAction::Add, newAt(j)});
    return vChanges;
  }

  // vLcs[i][j] = LCS length of old[i..] and new[j..]
  std::vector<std::vector<uint32_t>> vLcs(nOld + 1, std::vector<uint32_t>(nNew + 1, 0));
  for (size_t i = nOld; i-- > 0;) {
    for (size_t j = nNew; j-- > 0;) {
      vLcs[i][j] = oldAt(i) == newAt(j) ? vLcs[i + 1][j + 1] + 1
                                        : std::max(vLcs[i + 1][j], vLcs[i][j + 1]);
    }
  }

  size_t i = 0;
  size_t j = 0;
  while (i < nOld && j < nNew) {
    if (oldAt(i) == newAt(j)) {
      ++i;
      ++j;
    } else if (vLcs[i + 1][j] >= vLcs[i][j + 1]) {
      vChanges.push_back({LineAction::Remove, oldAt(i++)});
    } else {
      vChanges.push_back({LineAction::Add, newAt(j++)});
    }
  }
  for (; i < nOld; ++i) vChanges.push_back({LineAction::Remove, oldAt(i)});
  for (; j < nNew; ++j) vChanges.push_back({LineAction::Add, newAt(j)});
  return vChanges;
}

std::string DiffEngine::render(const std::vector<LineChange>& vChanges) const {
  std::string sOut;
  for (const auto& lc : vChanges) {
    if (!sOut.empty()) sOut += '\n';
    sOut += lc.action == LineAction::Add ? '+' : '-';
    sOut += lc.sLine;
  }
  return sOut;
}

std::string DiffEngine::diffText(const std::vector<std::string>& vRunning,
                                 const std::vector<std::string>& vCandidate) const {
  return render(compare(vRunning, vCandidate));
}

}  // namespace netprov::core
