#ifndef LEDGER_CONFIG_SERVER_CONFIG_HPP_
#define LEDGER_CONFIG_SERVER_CONFIG_HPP_

#include "database/postgres_connection.hpp"
#include "network/http_server.hpp"
#include "observability/logger.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>

#ifndef LEDGER_DEFAULT_SCHEMA_PATH
#define LEDGER_DEFAULT_SCHEMA_PATH "database/schema.sql"
#endif

namespace ledger {
namespace config {

/**
 * Raised for a configuration value that cannot be used (bad number, unknown
 * storage kind...).
 */
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

enum class StorageKind {
  POSTGRES,
  MEMORY
};

/**
 * Runtime settings of the ledger server.
 *
 * Layering, lowest precedence first: built-in defaults, `.env` file,
 * process environment, positional command-line arguments.
 */
struct ServerConfig {
  std::string bind_address = "127.0.0.1";
  int port = 3000;
  size_t max_connections = 64;
  int idle_timeout_seconds = 30;

  StorageKind storage = StorageKind::POSTGRES;

  std::string database_url;
  std::string db_host = "localhost";
  int db_port = 5432;
  std::string db_name = "bank_db";
  std::string db_user = "postgres";
  std::string db_password;
  size_t db_pool_size = 10;
  std::string schema_path = LEDGER_DEFAULT_SCHEMA_PATH;

  observability::LogLevel log_level = observability::LogLevel::INFO;

  /**
   * Defaults overridden by LEDGER_* variables and DATABASE_URL.
   * Throws ConfigError on an unusable value.
   */
  static ServerConfig fromEnvironment();

  /**
   * Apply `[port] [storage] [pool_size]`. Throws ConfigError.
   */
  void applyArguments(int argc, char* argv[]);

  database::PostgresConnection::Config databaseConfig() const;
  network::HttpServer::Options serverOptions() const;

  /**
   * One-line summary for the start-up log (never includes the password).
   */
  std::string describe() const;
};

/**
 * Export KEY=VALUE lines of a dotenv file into the process environment.
 * Variables that are already set keep their value. Blank lines and `#`
 * comments are skipped; values may be wrapped in single or double quotes.
 *
 * @return number of variables exported, or -1 when the file cannot be read
 */
int loadEnvFile(const std::string& path);

const char* storageKindName(StorageKind kind);

}  // namespace config
}  // namespace ledger

#endif  // LEDGER_CONFIG_SERVER_CONFIG_HPP_
