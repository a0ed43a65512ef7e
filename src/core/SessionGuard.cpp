#include "core/SessionGuard.hpp"

namespace netprov::core {

SessionGuard::SessionGuard(std::unique_ptr<transport::ITransportSession> upSession,
                           common::JobLog& jlLog)
    : _upSession(std::move(upSession)), _jlLog(jlLog) {}

SessionGuard::~SessionGuard() {
  close();
}

transport::ITransportSession& SessionGuard::operator*() { return *_upSession; }
transport::ITransportSession* SessionGuard::operator->() { return _upSession.get(); }

void SessionGuard::discard() {
  if (_bClosed) return;
  try {
    _upSession->discard();
    _jlLog.info("Configuration changes discarded");
  } catch (const std::exception& ex) {
    _jlLog.warn("Could not discard config: {}", ex.what());
  } catch (...) {
    _jlLog.warn("Could not discard config: non-standard exception from driver");
  }
}

void SessionGuard::close() {
  if (_bClosed) return;
  _bClosed = true;
  try {
    _upSession->close();
    _jlLog.info("Connection closed");
  } catch (const std::exception& ex) {
    _jlLog.warn("Error closing connection: {}", ex.what());
  } catch (...) {
    _jlLog.warn("Error closing connection: non-standard exception from driver");
  }
}

}  // namespace netprov::core
