#ifndef LEDGER_DATABASE_POSTGRES_CONNECTION_HPP_
#define LEDGER_DATABASE_POSTGRES_CONNECTION_HPP_

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <postgresql/libpq-fe.h>

namespace ledger {
namespace database {

struct PGresultDeleter {
  void operator()(PGresult* result) const {
    if (result) PQclear(result);
  }
};

using PGresultPtr = std::unique_ptr<PGresult, PGresultDeleter>;

/**
 * PostgreSQL database connection wrapper.
 * Handles connection management and basic query execution.
 */
class PostgresConnection {
 public:
  /**
   * Connection configuration
   */
  struct Config {
    // libpq URI or key/value string; when set, the discrete fields are ignored.
    std::string conninfo;
    std::string host = "localhost";
    int port = 5432;
    std::string database = "bank_db";
    std::string username = "postgres";
    std::string password = "";
    int connection_timeout = 30;  // seconds
  };

  explicit PostgresConnection(const Config& config);
  ~PostgresConnection();

  // Non-copyable
  PostgresConnection(const PostgresConnection&) = delete;
  PostgresConnection& operator=(const PostgresConnection&) = delete;

  /**
   * Connect to the database.
   */
  bool connect();

  /**
   * Disconnect from the database.
   */
  void disconnect();

  /**
   * Check if connected.
   */
  bool isConnected() const;

  /**
   * Execute a query that doesn't return results.
   */
  bool executeQuery(const std::string& query);

  /**
   * Execute a parameterized query (text parameters). Returns null on failure;
   * getLastError() then describes the problem.
   */
  PGresultPtr executeParameterizedQuery(const std::string& query,
                                        const std::vector<std::string>& params);

  bool beginTransaction();
  bool commitTransaction();
  bool rollbackTransaction();

  bool inTransaction() const;

  /**
   * Get last error message.
   */
  std::string getLastError() const;

  /**
   * Get connection info for logging (never includes the password).
   */
  std::string getConnectionInfo() const;

 private:
  bool executeLocked(const std::string& query);
  void disconnectLocked();
  std::string buildConnectionString() const;

  Config config_;
  PGconn* connection_;
  mutable std::mutex mutex_;
  bool in_transaction_;
  std::string last_error_;
};

/**
 * RAII wrapper for database transactions: rolls back unless committed.
 */
class TransactionGuard {
 public:
  explicit TransactionGuard(PostgresConnection& conn);
  ~TransactionGuard();

  // Non-copyable
  TransactionGuard(const TransactionGuard&) = delete;
  TransactionGuard& operator=(const TransactionGuard&) = delete;

  /**
   * Commit the transaction. Throws core::StorageError when COMMIT fails.
   */
  void commit();

  /**
   * Rollback the transaction.
   */
  void rollback();

  bool finished() const { return finished_; }

 private:
  PostgresConnection& conn_;
  bool finished_;
};

}  // namespace database
}  // namespace ledger

#endif  // LEDGER_DATABASE_POSTGRES_CONNECTION_HPP_
