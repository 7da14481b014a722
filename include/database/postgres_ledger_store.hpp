#ifndef LEDGER_DATABASE_POSTGRES_LEDGER_STORE_HPP_
#define LEDGER_DATABASE_POSTGRES_LEDGER_STORE_HPP_

#include "core/ledger_store.hpp"
#include "database/connection_pool.hpp"

#include <memory>
#include <string>
#include <vector>

namespace ledger {
namespace database {

/**
 * LedgerStore backed by PostgreSQL.
 *
 * Each session leases one pooled connection and runs inside a single
 * BEGIN/COMMIT block. getForUpdate() uses SELECT ... FOR UPDATE, so row locks
 * are held by the database until the block ends. Monetary values travel as
 * NUMERIC text in both directions.
 */
class PostgresLedgerStore : public core::LedgerStore {
 public:
  explicit PostgresLedgerStore(std::shared_ptr<ConnectionPool> pool);
  ~PostgresLedgerStore() override = default;

  // Non-copyable
  PostgresLedgerStore(const PostgresLedgerStore&) = delete;
  PostgresLedgerStore& operator=(const PostgresLedgerStore&) = delete;

  /**
   * Apply the schema file (idempotent CREATE ... IF NOT EXISTS statements).
   */
  bool initializeSchema(const std::string& schema_path);

  std::unique_ptr<core::LedgerSession> beginSession() override;

  std::optional<core::User> createUser(const std::string& username) override;
  std::optional<core::User> getUser(const std::string& user_id) override;

  std::optional<core::Account> createAccount(const std::string& user_id) override;
  std::optional<core::Account> getAccount(const std::string& account_id) override;
  std::vector<core::Account> getUserAccounts(const std::string& user_id) override;

  std::vector<core::TransactionRecord> getAccountTransactions(
      const std::string& account_id) override;

 private:
  class Session;

  /**
   * Run one statement on a leased connection outside any explicit
   * transaction. Throws core::StorageError on failure.
   */
  PGresultPtr runStandalone(const std::string& query, const std::vector<std::string>& params);

  bool executeSchemaFile(PostgresConnection& conn, const std::string& schema_path);

  std::shared_ptr<ConnectionPool> pool_;
};

}  // namespace database
}  // namespace ledger

#endif  // LEDGER_DATABASE_POSTGRES_LEDGER_STORE_HPP_
