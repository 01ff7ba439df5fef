#include "dal/ConnectionPool.hpp"

#include "common/Logger.hpp"

#include <stdexcept>

namespace ddns::dal {

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
    : _pPool(other._pPool), _spConn(std::move(other._spConn)) {
  other._pPool = nullptr;
}

ConnectionGuard& ConnectionGuard::operator=(ConnectionGuard&& other) noexcept {
  if (this != &other) {
    if (_spConn && _pPool) {
      _pPool->returnConnection(std::move(_spConn));
    }
    _pPool = other._pPool;
    _spConn = std::move(other._spConn);
    other._pPool = nullptr;
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
    throw std::runtime_error("Connection pool size must be >= 1");
  }

  auto spLog = common::Logger::get();
  // Never log credentials: keep only the part before '@'
  spLog->info("Opening sync state pool: size={}, url={}", _iPoolSize,
              _sDbUrl.substr(0, _sDbUrl.find('@')));

  _vAvailable.reserve(static_cast<size_t>(_iPoolSize));
  for (int i = 0; i < _iPoolSize; ++i) {
    _vAvailable.push_back(connect());
  }

  spLog->info("Sync state pool ready: {} connections", _iPoolSize);
}

ConnectionPool::~ConnectionPool() {
  std::lock_guard<std::mutex> lock(_mtx);
  _vAvailable.clear();
}

std::shared_ptr<pqxx::connection> ConnectionPool::connect() const {
  auto spConn = std::make_shared<pqxx::connection>(_sDbUrl);
  if (!spConn->is_open()) {
    throw std::runtime_error("Failed to open database connection");
  }
  return spConn;
}

ConnectionGuard ConnectionPool::checkout() {
  std::unique_lock<std::mutex> lock(_mtx);

  const auto bAvailable = _cv.wait_for(lock, _durCheckoutTimeout, [this] {
    return !_vAvailable.empty();
  });
  if (!bAvailable) {
    throw std::runtime_error("Connection pool exhausted: no connection within " +
                             std::to_string(_durCheckoutTimeout.count()) + "s");
  }

  auto spConn = std::move(_vAvailable.back());
  _vAvailable.pop_back();
  lock.unlock();

  if (!validate(*spConn)) {
    common::Logger::get()->warn("Stale database connection, reconnecting");
    try {
      spConn = connect();
    } catch (const std::exception&) {
      // Hand the dead slot back so the pool keeps its size
      returnConnection(std::move(spConn));
      throw;
    }
  }

  return ConnectionGuard(*this, std::move(spConn));
}

void ConnectionPool::returnConnection(std::shared_ptr<pqxx::connection> spConn) {
  std::lock_guard<std::mutex> lock(_mtx);
  _vAvailable.push_back(std::move(spConn));
  _cv.notify_one();
}

int ConnectionPool::available() {
  std::lock_guard<std::mutex> lock(_mtx);
  return static_cast<int>(_vAvailable.size());
}

bool ConnectionPool::validate(pqxx::connection& conn) {
  try {
    pqxx::nontransaction ntx(conn);
    ntx.exec("SELECT 1").one_row();
    return true;
  } catch (const pqxx::failure& ex) {
    common::Logger::get()->debug("Connection validation failed: {}", ex.what());
    return false;
  }
}

}  // namespace ddns::dal
