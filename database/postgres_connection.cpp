#include "database/postgres_connection.hpp"

#include "core/ledger_types.hpp"
#include "observability/logger.hpp"

#include <sstream>

namespace ledger {
namespace database {

namespace {

// Quote a value for a libpq key/value connection string.
std::string quoteConnValue(const std::string& value) {
  std::string quoted = "'";
  for (char c : value) {
    if (c == '\'' || c == '\\') quoted += '\\';
    quoted += c;
  }
  quoted += "'";
  return quoted;
}

}  // namespace

PostgresConnection::PostgresConnection(const Config& config)
    : config_(config), connection_(nullptr), in_transaction_(false) {
}

PostgresConnection::~PostgresConnection() {
  disconnect();
}

std::string PostgresConnection::buildConnectionString() const {
  if (!config_.conninfo.empty()) {
    return config_.conninfo;
  }

  std::stringstream conn_str;
  conn_str << "host=" << quoteConnValue(config_.host)
           << " port=" << config_.port
           << " dbname=" << quoteConnValue(config_.database)
           << " user=" << quoteConnValue(config_.username)
           << " connect_timeout=" << config_.connection_timeout;
  if (!config_.password.empty()) {
    conn_str << " password=" << quoteConnValue(config_.password);
  }
  return conn_str.str();
}

bool PostgresConnection::connect() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (connection_) {
    disconnectLocked();
  }

  connection_ = PQconnectdb(buildConnectionString().c_str());

  if (PQstatus(connection_) != CONNECTION_OK) {
    last_error_ = PQerrorMessage(connection_);
    LEDGER_LOG_ERROR("Database connection failed: " + last_error_);
    PQfinish(connection_);
    connection_ = nullptr;
    return false;
  }

  // Balances are exact NUMERIC text; keep the session deterministic.
  executeLocked("SET SESSION TIME ZONE 'UTC'");

  LEDGER_LOG_DEBUG("Connected to PostgreSQL database: " + getConnectionInfo());
  return true;
}

void PostgresConnection::disconnect() {
  std::lock_guard<std::mutex> lock(mutex_);
  disconnectLocked();
}

void PostgresConnection::disconnectLocked() {
  if (connection_) {
    if (in_transaction_) {
      executeLocked("ROLLBACK");
      in_transaction_ = false;
    }
    PQfinish(connection_);
    connection_ = nullptr;
  }
}

bool PostgresConnection::isConnected() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connection_ && PQstatus(connection_) == CONNECTION_OK;
}

bool PostgresConnection::executeQuery(const std::string& query) {
  std::lock_guard<std::mutex> lock(mutex_);
  return executeLocked(query);
}

bool PostgresConnection::executeLocked(const std::string& query) {
  if (!connection_) {
    last_error_ = "Not connected";
    return false;
  }

  PGresultPtr result(PQexec(connection_, query.c_str()));

  if (!result) {
    last_error_ = "Query execution failed: connection lost";
    LEDGER_LOG_ERROR(last_error_);
    return false;
  }

  ExecStatusType status = PQresultStatus(result.get());
  bool success = (status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK);

  if (!success) {
    last_error_ = PQresultErrorMessage(result.get());
    LEDGER_LOG_ERROR("Query failed: " + last_error_);
  }

  return success;
}

PGresultPtr PostgresConnection::executeParameterizedQuery(const std::string& query,
                                                          const std::vector<std::string>& params) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!connection_) {
    last_error_ = "Not connected";
    return nullptr;
  }

  std::vector<const char*> values;
  values.reserve(params.size());
  for (const auto& param : params) {
    values.push_back(param.c_str());
  }

  PGresultPtr result(PQexecParams(connection_, query.c_str(), static_cast<int>(values.size()),
                                  nullptr, values.data(), nullptr, nullptr, 0));

  if (!result) {
    last_error_ = "Parameterized query execution failed: connection lost";
    LEDGER_LOG_ERROR(last_error_);
    return nullptr;
  }

  ExecStatusType status = PQresultStatus(result.get());
  if (status != PGRES_TUPLES_OK && status != PGRES_COMMAND_OK) {
    last_error_ = PQresultErrorMessage(result.get());
    const char* sqlstate = PQresultErrorField(result.get(), PG_DIAG_SQLSTATE);
    LEDGER_LOG_EVENT(observability::LogLevel::ERROR, "Parameterized query failed")
        .field("sqlstate", sqlstate ? sqlstate : "")
        .field("error", last_error_);
    return nullptr;
  }

  return result;
}

bool PostgresConnection::beginTransaction() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!executeLocked("BEGIN")) {
    return false;
  }

  in_transaction_ = true;
  return true;
}

bool PostgresConnection::commitTransaction() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!in_transaction_) {
    return false;
  }

  bool success = executeLocked("COMMIT");
  in_transaction_ = false;
  return success;
}

bool PostgresConnection::rollbackTransaction() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!in_transaction_) {
    return false;
  }

  bool success = executeLocked("ROLLBACK");
  in_transaction_ = false;
  return success;
}

bool PostgresConnection::inTransaction() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return in_transaction_;
}

std::string PostgresConnection::getLastError() const {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!connection_ && last_error_.empty()) {
    return "Not connected";
  }

  return last_error_;
}

std::string PostgresConnection::getConnectionInfo() const {
  if (!config_.conninfo.empty()) {
    if (connection_) {
      std::stringstream ss;
      ss << PQuser(connection_) << "@" << PQhost(connection_) << ":" << PQport(connection_)
         << "/" << PQdb(connection_);
      return ss.str();
    }
    return "<DATABASE_URL>";
  }

  std::stringstream ss;
  ss << config_.username << "@" << config_.host << ":" << config_.port << "/" << config_.database;
  return ss.str();
}

// TransactionGuard implementation
TransactionGuard::TransactionGuard(PostgresConnection& conn)
    : conn_(conn), finished_(false) {
  if (!conn_.beginTransaction()) {
    throw core::StorageError("Failed to begin transaction: " + conn_.getLastError());
  }
}

TransactionGuard::~TransactionGuard() {
  rollback();
}

void TransactionGuard::commit() {
  if (finished_) {
    throw core::StorageError("Transaction already finished");
  }
  finished_ = true;
  if (!conn_.commitTransaction()) {
    throw core::StorageError("Commit failed: " + conn_.getLastError());
  }
}

void TransactionGuard::rollback() {
  if (!finished_) {
    finished_ = true;
    if (!conn_.rollbackTransaction()) {
      LEDGER_LOG_WARN("Rollback failed: " + conn_.getLastError());
    }
  }
}

}  // namespace database
}  // namespace ledger
