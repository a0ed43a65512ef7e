#pragma once

#include <memory>

#include "common/JobLog.hpp"
#include "transport/ITransport.hpp"

namespace netprov::core {

/// RAII owner of a transport session. close() runs exactly once: explicitly,
/// or from the destructor on any path that skipped it. Discard and close
/// failures are logged as warnings and never escape.
/// Class abbreviation: sg
class SessionGuard {
 public:
  SessionGuard(std::unique_ptr<transport::ITransportSession> upSession, common::JobLog& jlLog);
  ~SessionGuard();

  SessionGuard(const SessionGuard&) = delete;
  SessionGuard& operator=(const SessionGuard&) = delete;

  transport::ITransportSession& operator*();
  transport::ITransportSession* operator->();

  /// Best-effort discard.
  void discard();

  /// Close the session if still open. Later calls are no-ops.
  void close();

 private:
  std::unique_ptr<transport::ITransportSession> _upSession;
  common::JobLog& _jlLog;
  bool _bClosed = false;
};

}  // namespace netprov::core
