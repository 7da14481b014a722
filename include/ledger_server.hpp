#ifndef LEDGER_LEDGER_SERVER_HPP_
#define LEDGER_LEDGER_SERVER_HPP_

#include "config/server_config.hpp"
#include "core/ledger_store.hpp"
#include "core/transfer_engine.hpp"
#include "network/http_protocol.hpp"
#include "network/http_server.hpp"
#include "observability/metrics.hpp"

#include <memory>
#include <string>
#include <vector>

namespace ledger {

/**
 * HTTP front of the ledger: routes requests to the transfer engine and the
 * account directory, and renders results and typed errors as JSON.
 */
class LedgerServer {
 public:
  LedgerServer(const config::ServerConfig& config,
               std::shared_ptr<core::LedgerStore> store,
               observability::MetricsCollector& metrics = observability::getGlobalMetrics());
  ~LedgerServer();

  // Non-copyable
  LedgerServer(const LedgerServer&) = delete;
  LedgerServer& operator=(const LedgerServer&) = delete;

  /**
   * Start the ledger server.
   */
  bool start();

  /**
   * Stop the ledger server.
   */
  void stop();

  struct Stats {
    bool is_running;
    size_t active_connections;
    double transfers_committed;
    double transfers_rejected;
    double fundings_committed;
  };
  Stats getStats() const;

  /**
   * Port actually listened on.
   */
  int getPort() const { return http_server_->getPort(); }

  /**
   * Dispatch one parsed request. Never throws for storage failures; they are
   * rendered as 503.
   */
  network::http::HttpResponse handleRequest(const network::http::HttpRequest& request);

 private:
  using HttpRequest = network::http::HttpRequest;
  using HttpResponse = network::http::HttpResponse;

  HttpResponse route(const HttpRequest& request, const std::vector<std::string>& segments);

  HttpResponse handleRegister(const HttpRequest& request);
  HttpResponse handleGetUser(const std::string& user_id);
  HttpResponse handleGetUserAccounts(const std::string& user_id);
  HttpResponse handleCreateAccount(const HttpRequest& request);
  HttpResponse handleGetAccount(const std::string& account_id);
  HttpResponse handleTransactionHistory(const std::string& account_id);
  HttpResponse handleTransfer(const HttpRequest& request);
  HttpResponse handleAddMoney(const HttpRequest& request);

  config::ServerConfig config_;
  std::shared_ptr<core::LedgerStore> store_;
  observability::MetricsCollector& metrics_;
  std::unique_ptr<core::TransferEngine> engine_;
  std::unique_ptr<network::HttpServer> http_server_;
};

/**
 * HTTP status for a ledger error kind.
 */
int httpStatusFor(core::LedgerError error);

}  // namespace ledger

#endif  // LEDGER_LEDGER_SERVER_HPP_
