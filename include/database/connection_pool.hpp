#ifndef LEDGER_DATABASE_CONNECTION_POOL_HPP_
#define LEDGER_DATABASE_CONNECTION_POOL_HPP_

#include "database/postgres_connection.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

namespace ledger {
namespace database {

class ConnectionPool;

/**
 * Exclusive lease on one pooled connection, returned to the pool on
 * destruction.
 */
class PooledConnection {
 public:
  PooledConnection(ConnectionPool& pool, std::unique_ptr<PostgresConnection> connection);
  ~PooledConnection();

  PooledConnection(const PooledConnection&) = delete;
  PooledConnection& operator=(const PooledConnection&) = delete;

  PostgresConnection& operator*() { return *connection_; }
  PostgresConnection* operator->() { return connection_.get(); }

 private:
  ConnectionPool& pool_;
  std::unique_ptr<PostgresConnection> connection_;
};

/**
 * Fixed-size pool of PostgreSQL connections. One atomic scope holds one
 * connection for its whole lifetime; callers block while every connection is
 * leased.
 */
class ConnectionPool {
 public:
  ConnectionPool(const PostgresConnection::Config& config, size_t size);
  ~ConnectionPool() = default;

  // Non-copyable
  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;

  /**
   * Open every connection. Returns false if any of them fails.
   */
  bool initialize();

  /**
   * Lease a connection, reconnecting it if the server dropped it.
   * Throws core::StorageError when no live connection can be obtained.
   */
  std::unique_ptr<PooledConnection> acquire();

  size_t size() const { return size_; }
  size_t available() const;

 private:
  friend class PooledConnection;

  void release(std::unique_ptr<PostgresConnection> connection);

  PostgresConnection::Config config_;
  size_t size_;
  std::vector<std::unique_ptr<PostgresConnection>> idle_;
  mutable std::mutex mutex_;
  std::condition_variable available_cv_;
};

}  // namespace database
}  // namespace ledger

#endif  // LEDGER_DATABASE_CONNECTION_POOL_HPP_
