#include "config/server_config.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace ledger {
namespace config {

namespace {

std::string trim(const std::string& value) {
  size_t begin = value.find_first_not_of(" \t\r");
  if (begin == std::string::npos) return "";
  size_t end = value.find_last_not_of(" \t\r");
  return value.substr(begin, end - begin + 1);
}

long long parseInteger(const std::string& name, const std::string& text,
                       long long min, long long max) {
  if (text.empty() ||
      !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
    throw ConfigError(name + " must be a non-negative integer, got '" + text + "'");
  }
  errno = 0;
  long long value = std::strtoll(text.c_str(), nullptr, 10);
  if (errno == ERANGE || value < min || value > max) {
    throw ConfigError(name + " must be between " + std::to_string(min) + " and " +
                      std::to_string(max) + ", got '" + text + "'");
  }
  return value;
}

StorageKind parseStorage(const std::string& text) {
  std::string lowered = text;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "postgres" || lowered == "postgresql") return StorageKind::POSTGRES;
  if (lowered == "memory") return StorageKind::MEMORY;
  throw ConfigError("storage must be 'postgres' or 'memory', got '" + text + "'");
}

const char* env(const char* name) {
  const char* value = std::getenv(name);
  return (value && *value) ? value : nullptr;
}

}  // namespace

const char* storageKindName(StorageKind kind) {
  return kind == StorageKind::MEMORY ? "memory" : "postgres";
}

int loadEnvFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return -1;
  }

  int exported = 0;
  std::string line;
  while (std::getline(file, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (line.compare(0, 7, "export ") == 0) line = trim(line.substr(7));

    size_t equals = line.find('=');
    if (equals == std::string::npos) continue;

    std::string key = trim(line.substr(0, equals));
    std::string value = trim(line.substr(equals + 1));
    if (key.empty()) continue;

    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
      value = value.substr(1, value.size() - 2);
    }

    if (std::getenv(key.c_str()) != nullptr) continue;
    if (setenv(key.c_str(), value.c_str(), 1) == 0) {
      ++exported;
    }
  }
  return exported;
}

ServerConfig ServerConfig::fromEnvironment() {
  ServerConfig config;

  if (const char* value = env("LEDGER_BIND_ADDRESS")) config.bind_address = value;
  if (const char* value = env("LEDGER_PORT")) {
    config.port = static_cast<int>(parseInteger("LEDGER_PORT", value, 0, 65535));
  }
  if (const char* value = env("LEDGER_MAX_CONNECTIONS")) {
    config.max_connections =
        static_cast<size_t>(parseInteger("LEDGER_MAX_CONNECTIONS", value, 1, 100000));
  }
  if (const char* value = env("LEDGER_IDLE_TIMEOUT_SECONDS")) {
    config.idle_timeout_seconds =
        static_cast<int>(parseInteger("LEDGER_IDLE_TIMEOUT_SECONDS", value, 1, 86400));
  }
  if (const char* value = env("LEDGER_STORAGE")) config.storage = parseStorage(value);

  if (const char* value = env("DATABASE_URL")) config.database_url = value;
  if (const char* value = env("LEDGER_DB_HOST")) config.db_host = value;
  if (const char* value = env("LEDGER_DB_PORT")) {
    config.db_port = static_cast<int>(parseInteger("LEDGER_DB_PORT", value, 1, 65535));
  }
  if (const char* value = env("LEDGER_DB_NAME")) config.db_name = value;
  if (const char* value = env("LEDGER_DB_USER")) config.db_user = value;
  if (const char* value = env("LEDGER_DB_PASSWORD")) config.db_password = value;
  if (const char* value = env("LEDGER_DB_POOL_SIZE")) {
    config.db_pool_size =
        static_cast<size_t>(parseInteger("LEDGER_DB_POOL_SIZE", value, 1, 1000));
  }
  if (const char* value = env("LEDGER_SCHEMA_PATH")) config.schema_path = value;

  if (const char* value = env("LEDGER_LOG_LEVEL")) {
    auto level = observability::parseLogLevel(value);
    if (!level) {
      throw ConfigError(std::string("LEDGER_LOG_LEVEL is not a log level: '") + value + "'");
    }
    config.log_level = *level;
  }

  return config;
}

void ServerConfig::applyArguments(int argc, char* argv[]) {
  if (argc >= 2) port = static_cast<int>(parseInteger("port", argv[1], 0, 65535));
  if (argc >= 3) storage = parseStorage(argv[2]);
  if (argc >= 4) {
    db_pool_size = static_cast<size_t>(parseInteger("pool_size", argv[3], 1, 1000));
  }
}

database::PostgresConnection::Config ServerConfig::databaseConfig() const {
  database::PostgresConnection::Config db;
  db.conninfo = database_url;
  db.host = db_host;
  db.port = db_port;
  db.database = db_name;
  db.username = db_user;
  db.password = db_password;
  return db;
}

network::HttpServer::Options ServerConfig::serverOptions() const {
  network::HttpServer::Options options;
  options.bind_address = bind_address;
  options.port = port;
  options.max_connections = max_connections;
  options.idle_timeout_seconds = idle_timeout_seconds;
  return options;
}

std::string ServerConfig::describe() const {
  std::ostringstream out;
  out << "listen=" << bind_address << ":" << port
      << " max_connections=" << max_connections
      << " idle_timeout=" << idle_timeout_seconds << "s"
      << " storage=" << storageKindName(storage);
  if (storage == StorageKind::POSTGRES) {
    if (!database_url.empty()) {
      out << " database=DATABASE_URL";
    } else {
      out << " database=" << db_user << "@" << db_host << ":" << db_port << "/" << db_name;
    }
    out << " pool=" << db_pool_size << " schema=" << schema_path;
  }
  return out.str();
}

}  // namespace config
}  // namespace ledger
