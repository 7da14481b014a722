#ifndef LEDGER_NETWORK_HTTP_SERVER_HPP_
#define LEDGER_NETWORK_HTTP_SERVER_HPP_

#include "network/http_protocol.hpp"
#include "observability/metrics.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace ledger {
namespace network {

/**
 * HTTP/1.1 server with one worker thread per connection.
 * Each connection is kept alive between requests until the client closes it,
 * asks for "Connection: close", or stays idle past the configured timeout.
 */
class HttpServer {
 public:
  using RequestHandler = std::function<http::HttpResponse(const http::HttpRequest&)>;

  struct Options {
    std::string bind_address = "127.0.0.1";
    int port = 3000;  // 0 picks an ephemeral port
    size_t max_connections = 64;
    int idle_timeout_seconds = 30;
  };

  HttpServer(const Options& options, RequestHandler handler,
             observability::MetricsCollector& metrics = observability::getGlobalMetrics());
  ~HttpServer();

  // Non-copyable
  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  /**
   * Bind, listen and begin accepting connections.
   */
  bool start();

  /**
   * Stop accepting, shut down open connections and join every worker.
   */
  void stop();

  bool isRunning() const { return running_.load(); }

  /**
   * Port actually bound (differs from Options::port when that was 0).
   */
  int getPort() const { return bound_port_.load(); }

  /**
   * Get number of active connections.
   */
  size_t getConnectionCount() const;

 private:
  struct Client {
    int socket = -1;
    std::string address;
    std::thread worker;
    std::atomic<bool> finished{false};
  };

  void acceptLoop();
  void handleClient(Client* client);
  void reapFinishedClients();
  void rejectClient(int client_socket);
  bool sendAll(int client_socket, const std::string& data);
  void recordResponse(int status);

  Options options_;
  int server_socket_;
  RequestHandler request_handler_;
  observability::MetricsCollector& metrics_;
  std::atomic<bool> running_;
  std::atomic<int> bound_port_;
  std::unique_ptr<std::thread> accept_thread_;
  std::map<std::uint64_t, std::unique_ptr<Client>> clients_;
  std::uint64_t next_client_id_;
  mutable std::mutex connections_mutex_;
};

}  // namespace network
}  // namespace ledger

#endif  // LEDGER_NETWORK_HTTP_SERVER_HPP_
