#include "dal/ConnectionPool.hpp"

#include "common/Logger.hpp"

#include <stdexcept>
#include <utility>

namespace netprov::dal {

// ── ConnectionGuard ────────────────────────────────────────────────────────

ConnectionGuard::ConnectionGuard(ConnectionPool& cpPool,
                                 std::shared_ptr<pqxx::connection> spConn)
    : _pPool(&cpPool), _spConn(std::move(spConn)) {}

ConnectionGuard::~ConnectionGuard() {
  if (_spConn && _pPool) {
    _pPool->returnConnection(std::move(_spConn));
  }
}

ConnectionGuard::ConnectionGuard(ConnectionGuard&& other) noexcept
    : _pPool(std::exchange(other._pPool, nullptr)), _spConn(std::move(other._spConn)) {}

ConnectionGuard& ConnectionGuard::operator=(ConnectionGuard&& other) noexcept {
  if (this != &other) {
    if (_spConn && _pPool) {
      _pPool->returnConnection(std::move(_spConn));
    }
    _pPool = std::exchange(other._pPool, nullptr);
    _spConn = std::move(other._spConn);
  }
  return *this;
}

pqxx::connection& ConnectionGuard::operator*() { return *_spConn; }
pqxx::connection* ConnectionGuard::operator->() { return _spConn.get(); }

// ── ConnectionPool ─────────────────────────────────────────────────────────

ConnectionPool::ConnectionPool(const std::string& sDbUrl, int iPoolSize,
                               std::chrono::seconds durCheckoutTimeout)
    : _sDbUrl(sDbUrl), _iPoolSize(iPoolSize), _durCheckoutTimeout(durCheckoutTimeout) {
  if (_iPoolSize < 1) {
    throw std::invalid_argument("Connection pool size must be at least 1");
  }

  auto spLog = common::Logger::get();
  // Only the part after '@' is logged; credentials live before it.
  const auto nAt = _sDbUrl.find('@');
  spLog->info("Opening source-of-truth connection pool: size={}, host={}", _iPoolSize,
              nAt == std::string::npos ? std::string("(local)") : _sDbUrl.substr(nAt + 1));

  _vAvailable.reserve(static_cast<size_t>(_iPoolSize));
  for (int i = 0; i < _iPoolSize; ++i) {
    auto spConn = std::make_shared<pqxx::connection>(_sDbUrl);
    if (!spConn->is_open()) {
      throw std::runtime_error("Failed to open database connection " + std::to_string(i + 1));
    }
    _vAvailable.push_back(std::move(spConn));
  }

  spLog->info("Connection pool ready: {} connections established", _iPoolSize);
}

ConnectionPool::~ConnectionPool() {
  std::lock_guard<std::mutex> lock(_mtx);
  _vAvailable.clear();
}

ConnectionGuard ConnectionPool::checkout() {
  std::unique_lock<std::mutex> lock(_mtx);

  const bool bAvailable =
      _cv.wait_for(lock, _durCheckoutTimeout, [this] { return !_vAvailable.empty(); });
  if (!bAvailable) {
    throw std::runtime_error("Connection pool exhausted: no connection available after " +
                             std::to_string(_durCheckoutTimeout.count()) + "s");
  }

  auto spConn = std::move(_vAvailable.back());
  _vAvailable.pop_back();
  lock.unlock();

  if (!validate(*spConn)) {
    common::Logger::get()->warn("Stale database connection detected, reconnecting");
    try {
      spConn = std::make_shared<pqxx::connection>(_sDbUrl);
    } catch (const std::exception&) {
      // Keep the slot: hand the dead connection back so the pool does not shrink.
      returnConnection(std::move(spConn));
      throw;
    }
  }

  return ConnectionGuard(*this, std::move(spConn));
}

void ConnectionPool::returnConnection(std::shared_ptr<pqxx::connection> spConn) {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    _vAvailable.push_back(std::move(spConn));
  }
  _cv.notify_one();
}

bool ConnectionPool::validate(pqxx::connection& conn) {
  try {
    pqxx::nontransaction ntx(conn);
    ntx.exec("SELECT 1").one_row();
    return true;
  } catch (const std::exception& ex) {
    common::Logger::get()->debug("Connection validation failed: {}", ex.what());
    return false;
  }
}

}  // namespace netprov::dal
