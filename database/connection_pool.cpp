#include "database/connection_pool.hpp"

#include "core/ledger_types.hpp"
#include "observability/logger.hpp"

namespace ledger {
namespace database {

PooledConnection::PooledConnection(ConnectionPool& pool,
                                   std::unique_ptr<PostgresConnection> connection)
    : pool_(pool), connection_(std::move(connection)) {
}

PooledConnection::~PooledConnection() {
  pool_.release(std::move(connection_));
}

ConnectionPool::ConnectionPool(const PostgresConnection::Config& config, size_t size)
    : config_(config), size_(size == 0 ? 1 : size) {
}

bool ConnectionPool::initialize() {
  std::lock_guard<std::mutex> lock(mutex_);

  idle_.clear();
  for (size_t i = 0; i < size_; ++i) {
    auto connection = std::make_unique<PostgresConnection>(config_);
    if (!connection->connect()) {
      LEDGER_LOG_ERROR("Failed to open pooled connection " + std::to_string(i + 1) + " of " +
                       std::to_string(size_));
      idle_.clear();
      return false;
    }
    idle_.push_back(std::move(connection));
  }

  LEDGER_LOG_INFO("Connection pool ready with " + std::to_string(size_) + " connections");
  return true;
}

std::unique_ptr<PooledConnection> ConnectionPool::acquire() {
  std::unique_ptr<PostgresConnection> connection;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    available_cv_.wait(lock, [this] { return !idle_.empty(); });
    connection = std::move(idle_.back());
    idle_.pop_back();
  }

  if (!connection->isConnected()) {
    LEDGER_LOG_WARN("Pooled connection lost, reconnecting");
    if (!connection->connect()) {
      std::string reason = connection->getLastError();
      release(std::move(connection));
      throw core::StorageError("database connection unavailable: " + reason);
    }
  }

  return std::make_unique<PooledConnection>(*this, std::move(connection));
}

size_t ConnectionPool::available() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return idle_.size();
}

void ConnectionPool::release(std::unique_ptr<PostgresConnection> connection) {
  if (!connection) return;

  // A lease must never hand an open transaction to the next caller.
  if (connection->inTransaction() && !connection->rollbackTransaction()) {
    LEDGER_LOG_WARN("Rollback on release failed: " + connection->getLastError());
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    idle_.push_back(std::move(connection));
  }
  available_cv_.notify_one();
}

}  // namespace database
}  // namespace ledger
