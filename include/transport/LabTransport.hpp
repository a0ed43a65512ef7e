#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/DiffEngine.hpp"
#include "transport/ITransport.hpp"

namespace netprov::transport {

/// File-backed device simulator for offline rehearsal.
///
/// Layout under the lab root, per device:
///   <name>.cfg   running configuration (missing = empty device)
///   <name>.auth  optional "username:password" the device accepts
///   <name>.lock  configuration lock, held from open() until close()
///   <name>.fail_commit  when present, commit() stores a corrupted config,
///                       so verification fails and the previous config is restored
class LabTransport : public ITransport {
 public:
  explicit LabTransport(std::filesystem::path pathRoot);
  ~LabTransport() override;

  std::string name() const override;
  std::unique_ptr<ITransportSession> open(const common::DeviceTarget& dtTarget,
                                          const common::Credentials& crCreds,
                                          const TransportOptions& toOptions) override;

  /// Stanza-wise merge: children of a top-level line present in both are
  /// unioned under it; new stanzas are appended.
  static std::vector<std::string> merge(const std::vector<std::string>& vRunning,
                                        const std::vector<std::string>& vCandidate);

 private:
  std::filesystem::path _pathRoot;
};

/// Session on one lab device. Holds the device lock until close().
/// Class abbreviation: ls
class LabSession : public ITransportSession {
 public:
  LabSession(std::string sDevice, std::filesystem::path pathConfig,
             std::filesystem::path pathLock, std::filesystem::path pathFailCommit);
  ~LabSession() override;

  LabSession(const LabSession&) = delete;
  LabSession& operator=(const LabSession&) = delete;

  void stage(const std::string& sConfig, common::StageMode mode) override;
  std::string diff() override;
  void commit() override;
  void discard() override;
  common::DeviceFacts facts() override;
  void close() override;

 private:
  std::vector<std::string> readRunning() const;
  void writeRunning(const std::vector<std::string>& vLines) const;

  std::string _sDevice;
  std::filesystem::path _pathConfig;
  std::filesystem::path _pathLock;
  std::filesystem::path _pathFailCommit;
  std::optional<std::vector<std::string>> _oCandidate;
  core::DiffEngine _deEngine;
  bool _bClosed = false;
};

}  // namespace netprov::transport
