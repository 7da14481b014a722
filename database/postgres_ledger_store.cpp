#include "database/postgres_ledger_store.hpp"

#include "core/identifiers.hpp"
#include "observability/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>
#include <string>

namespace ledger {
namespace database {

using core::Account;
using core::Money;
using core::StorageError;
using core::TransactionRecord;
using core::User;

namespace {

// created_at is rendered as ISO-8601 UTC with microseconds.
constexpr const char* kAccountColumns =
    "id::text, user_id::text, balance::text, "
    "to_char(created_at AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS.US\"Z\"')";

constexpr const char* kTransactionColumns =
    "id::text, from_account::text, to_account::text, amount::text, "
    "to_char(created_at AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS.US\"Z\"')";

Money parseNumeric(const char* text) {
  auto value = Money::parse(text ? text : "");
  if (!value) {
    throw StorageError(std::string("unexpected NUMERIC value from database: ") +
                       (text ? text : "<null>"));
  }
  return *value;
}

Account accountFromRow(PGresult* result, int row) {
  Account account;
  account.id = PQgetvalue(result, row, 0);
  account.user_id = PQgetvalue(result, row, 1);
  account.balance = parseNumeric(PQgetvalue(result, row, 2));
  account.created_at = PQgetvalue(result, row, 3);
  return account;
}

TransactionRecord transactionFromRow(PGresult* result, int row) {
  TransactionRecord record;
  record.id = PQgetvalue(result, row, 0);
  record.from_account = PQgetvalue(result, row, 1);
  record.to_account = PQgetvalue(result, row, 2);
  record.amount = parseNumeric(PQgetvalue(result, row, 3));
  record.created_at = PQgetvalue(result, row, 4);
  return record;
}

PGresultPtr runOrThrow(PostgresConnection& conn, const std::string& query,
                       const std::vector<std::string>& params) {
  auto result = conn.executeParameterizedQuery(query, params);
  if (!result) {
    throw StorageError(conn.getLastError());
  }
  return result;
}

}  // namespace

class PostgresLedgerStore::Session : public core::LedgerSession {
 public:
  explicit Session(std::unique_ptr<PooledConnection> lease)
      : lease_(std::move(lease)), guard_(**lease_) {
  }

  ~Session() override = default;  // guard_ rolls back unless committed

  std::optional<Account> getForUpdate(const std::string& account_id) override {
    ensureActive();
    if (!core::isWellFormedId(account_id)) {
      return std::nullopt;
    }

    auto result = runOrThrow(**lease_,
        std::string("SELECT ") + kAccountColumns +
        " FROM accounts WHERE id = $1::uuid FOR UPDATE",
        {account_id});

    if (PQntuples(result.get()) == 0) {
      return std::nullopt;
    }
    return accountFromRow(result.get(), 0);
  }

  void updateBalance(const std::string& account_id, const Money& new_balance) override {
    ensureActive();

    auto result = runOrThrow(**lease_,
        "UPDATE accounts SET balance = $2::numeric WHERE id = $1::uuid",
        {account_id, new_balance.toString()});

    if (std::strcmp(PQcmdTuples(result.get()), "1") != 0) {
      throw StorageError("balance update matched no row for account " + account_id);
    }
  }

  TransactionRecord appendTransaction(const std::string& from_account,
                                      const std::string& to_account,
                                      const Money& amount) override {
    ensureActive();

    auto result = runOrThrow(**lease_,
        std::string("INSERT INTO transactions (from_account, to_account, amount) "
                    "VALUES ($1::uuid, $2::uuid, $3::numeric) RETURNING ") + kTransactionColumns,
        {from_account, to_account, amount.toString()});

    if (PQntuples(result.get()) != 1) {
      throw StorageError("ledger insert returned no row");
    }
    return transactionFromRow(result.get(), 0);
  }

  void commit() override {
    guard_.commit();
  }

  void rollback() override {
    guard_.rollback();
  }

 private:
  void ensureActive() const {
    if (guard_.finished()) {
      throw StorageError("session already finished");
    }
  }

  std::unique_ptr<PooledConnection> lease_;
  TransactionGuard guard_;
};

PostgresLedgerStore::PostgresLedgerStore(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {
}

bool PostgresLedgerStore::initializeSchema(const std::string& schema_path) {
  try {
    auto lease = pool_->acquire();
    if (!executeSchemaFile(**lease, schema_path)) {
      LEDGER_LOG_ERROR("Failed to execute schema file " + schema_path);
      return false;
    }

    LEDGER_LOG_INFO("Database schema initialized from " + schema_path);
    return true;
  } catch (const std::exception& e) {
    LEDGER_LOG_ERROR("Schema initialization failed: " + std::string(e.what()));
    return false;
  }
}

std::unique_ptr<core::LedgerSession> PostgresLedgerStore::beginSession() {
  return std::make_unique<Session>(pool_->acquire());
}

std::optional<User> PostgresLedgerStore::createUser(const std::string& username) {
  auto result = runStandalone(
      "INSERT INTO users (username) VALUES ($1) "
      "ON CONFLICT (username) DO NOTHING "
      "RETURNING id::text, username",
      {username});

  if (PQntuples(result.get()) == 0) {
    return std::nullopt;
  }
  return User{PQgetvalue(result.get(), 0, 0), PQgetvalue(result.get(), 0, 1)};
}

std::optional<User> PostgresLedgerStore::getUser(const std::string& user_id) {
  if (!core::isWellFormedId(user_id)) {
    return std::nullopt;
  }

  auto result = runStandalone(
      "SELECT id::text, username FROM users WHERE id = $1::uuid", {user_id});

  if (PQntuples(result.get()) == 0) {
    return std::nullopt;
  }
  return User{PQgetvalue(result.get(), 0, 0), PQgetvalue(result.get(), 0, 1)};
}

std::optional<Account> PostgresLedgerStore::createAccount(const std::string& user_id) {
  if (!core::isWellFormedId(user_id)) {
    return std::nullopt;
  }

  // Zero rows inserted when the owner does not exist.
  auto result = runStandalone(
      std::string("INSERT INTO accounts (user_id, balance) "
                  "SELECT id, 0 FROM users WHERE id = $1::uuid "
                  "RETURNING ") + kAccountColumns,
      {user_id});

  if (PQntuples(result.get()) == 0) {
    return std::nullopt;
  }

  Account account = accountFromRow(result.get(), 0);
  LEDGER_LOG_EVENT(observability::LogLevel::INFO, "account created")
      .field("account_id", account.id)
      .field("user_id", account.user_id);
  return account;
}

std::optional<Account> PostgresLedgerStore::getAccount(const std::string& account_id) {
  if (!core::isWellFormedId(account_id)) {
    return std::nullopt;
  }

  auto result = runStandalone(
      std::string("SELECT ") + kAccountColumns + " FROM accounts WHERE id = $1::uuid",
      {account_id});

  if (PQntuples(result.get()) == 0) {
    return std::nullopt;
  }
  return accountFromRow(result.get(), 0);
}

std::vector<Account> PostgresLedgerStore::getUserAccounts(const std::string& user_id) {
  std::vector<Account> accounts;
  if (!core::isWellFormedId(user_id)) {
    return accounts;
  }

  auto result = runStandalone(
      std::string("SELECT ") + kAccountColumns +
      " FROM accounts WHERE user_id = $1::uuid ORDER BY created_at, id",
      {user_id});

  int numRows = PQntuples(result.get());
  for (int i = 0; i < numRows; ++i) {
    accounts.push_back(accountFromRow(result.get(), i));
  }
  return accounts;
}

std::vector<TransactionRecord> PostgresLedgerStore::getAccountTransactions(
    const std::string& account_id) {
  std::vector<TransactionRecord> transactions;
  if (!core::isWellFormedId(account_id)) {
    return transactions;
  }

  auto result = runStandalone(
      std::string("SELECT ") + kTransactionColumns +
      " FROM transactions"
      " WHERE from_account = $1::uuid OR to_account = $1::uuid"
      " ORDER BY created_at DESC, id DESC",
      {account_id});

  int numRows = PQntuples(result.get());
  for (int i = 0; i < numRows; ++i) {
    transactions.push_back(transactionFromRow(result.get(), i));
  }
  return transactions;
}

PGresultPtr PostgresLedgerStore::runStandalone(const std::string& query,
                                               const std::vector<std::string>& params) {
  auto lease = pool_->acquire();
  return runOrThrow(**lease, query, params);
}

bool PostgresLedgerStore::executeSchemaFile(PostgresConnection& conn,
                                            const std::string& schema_path) {
  std::ifstream schema_file(schema_path);
  if (!schema_file.is_open()) {
    LEDGER_LOG_ERROR("Could not open schema file: " + schema_path);
    return false;
  }

  // Drop "--" line comments so that comment-only chunks are never sent.
  std::string schema_sql;
  std::string line;
  while (std::getline(schema_file, line)) {
    size_t comment = line.find("--");
    schema_sql += line.substr(0, comment);
    schema_sql += '\n';
  }

  // Statements are separated by ';' and the schema contains no function bodies.
  size_t start = 0;
  while (start < schema_sql.size()) {
    size_t end = schema_sql.find(';', start);
    if (end == std::string::npos) end = schema_sql.size();

    std::string stmt = schema_sql.substr(start, end - start);
    start = end + 1;

    if (!std::any_of(stmt.begin(), stmt.end(),
                     [](unsigned char c) { return std::isalnum(c) != 0; })) {
      continue;
    }
    if (!conn.executeQuery(stmt)) {
      LEDGER_LOG_ERROR("Failed to execute schema statement: " + stmt.substr(0, 100) + "...");
      return false;
    }
  }

  return true;
}

}  // namespace database
}  // namespace ledger
