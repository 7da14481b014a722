#include "config/server_config.hpp"
#include "core/in_memory_ledger_store.hpp"
#include "database/connection_pool.hpp"
#include "database/postgres_ledger_store.hpp"
#include "ledger_server.hpp"
#include "observability/logger.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <thread>

namespace {

std::atomic<bool> running{true};

void signalHandler(int) {
  running = false;
}

std::shared_ptr<ledger::core::LedgerStore> createStore(const ledger::config::ServerConfig& config) {
  using ledger::config::StorageKind;

  if (config.storage == StorageKind::MEMORY) {
    LEDGER_LOG_WARN("Using in-memory storage; balances are lost on shutdown");
    return std::make_shared<ledger::core::InMemoryLedgerStore>();
  }

  auto db_config = config.databaseConfig();
  auto pool = std::make_shared<ledger::database::ConnectionPool>(db_config, config.db_pool_size);

  LEDGER_LOG_INFO("Initializing PostgreSQL storage...");
  if (!pool->initialize()) {
    LEDGER_LOG_FATAL("Could not connect to the database");
    return nullptr;
  }

  auto store = std::make_shared<ledger::database::PostgresLedgerStore>(pool);
  if (!store->initializeSchema(config.schema_path)) {
    LEDGER_LOG_FATAL("Could not apply schema " + config.schema_path);
    return nullptr;
  }
  return store;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto& logger = ledger::observability::Logger::getInstance();

  ledger::config::ServerConfig config;
  try {
    if (ledger::config::loadEnvFile(".env") >= 0) {
      LEDGER_LOG_DEBUG("Loaded .env");
    }
    config = ledger::config::ServerConfig::fromEnvironment();
    config.applyArguments(argc, argv);
  } catch (const ledger::config::ConfigError& e) {
    LEDGER_LOG_FATAL(std::string("Invalid configuration: ") + e.what());
    return 1;
  }
  logger.setLogLevel(config.log_level);

  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  try {
    auto store = createStore(config);
    if (!store) {
      return 1;
    }

    ledger::LedgerServer server(config, store);
    if (!server.start()) {
      LEDGER_LOG_FATAL("Failed to start ledger server");
      return 1;
    }

    // Main server loop
    auto last_report = std::chrono::steady_clock::now();
    while (running) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));

      auto now = std::chrono::steady_clock::now();
      if (now - last_report < std::chrono::seconds(60)) continue;
      last_report = now;

      auto stats = server.getStats();
      LEDGER_LOG_EVENT(ledger::observability::LogLevel::INFO, "server statistics")
          .field("active_connections", static_cast<std::int64_t>(stats.active_connections))
          .field("transfers_committed", stats.transfers_committed)
          .field("transfers_rejected", stats.transfers_rejected)
          .field("fundings_committed", stats.fundings_committed);
    }

    LEDGER_LOG_INFO("Shutdown requested");
    server.stop();

  } catch (const std::exception& e) {
    LEDGER_LOG_FATAL(std::string("Server error: ") + e.what());
    return 1;
  }

  LEDGER_LOG_INFO("Server shutdown complete");
  return 0;
}
