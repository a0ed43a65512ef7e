#pragma once

#include <string>
#include <vector>

namespace netprov::core {

/// Line-level change between running and candidate configuration.
enum class LineAction { Add, Remove };

/// A single changed line.
/// Class abbreviation: lc
struct LineChange {
  LineAction action;
  std::string sLine;
};

/// Computes a line diff (longest common subsequence) between running and
/// candidate configuration. Unchanged lines are not reported. When the
/// differing middle section is too large for the LCS table it is reported
/// as all removed, then all added.
/// Class abbreviation: de
class DiffEngine {
 public:
  DiffEngine();
  ~DiffEngine();

  std::vector<LineChange> compare(const std::vector<std::string>& vRunning,
                                  const std::vector<std::string>& vCandidate) const;

  /// "-removed" / "+added" lines joined by '\n'. Empty when nothing changed.
  std::string render(const std::vector<LineChange>& vChanges) const;

  std::string diffText(const std::vector<std::string>& vRunning,
                       const std::vector<std::string>& vCandidate) const;
};

}  // namespace netprov::core
