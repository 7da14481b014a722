#include "network/http_server.hpp"

#include "observability/logger.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <vector>

namespace ledger {
namespace network {

namespace {

const char* kRequestsMetric = "ledger_http_requests_total";
const char* kConnectionsMetric = "ledger_http_active_connections";

}  // namespace

HttpServer::HttpServer(const Options& options, RequestHandler handler,
                       observability::MetricsCollector& metrics)
    : options_(options),
      server_socket_(-1),
      request_handler_(std::move(handler)),
      metrics_(metrics),
      running_(false),
      bound_port_(options.port),
      next_client_id_(0) {
  metrics_.describe(kRequestsMetric, "HTTP responses sent, by status code");
  metrics_.describe(kConnectionsMetric, "Open HTTP connections");
}

HttpServer::~HttpServer() {
  stop();
}

bool HttpServer::start() {
  if (running_) return true;

  server_socket_ = socket(AF_INET, SOCK_STREAM, 0);
  if (server_socket_ < 0) {
    LEDGER_LOG_ERROR("Failed to create socket: " + std::string(std::strerror(errno)));
    return false;
  }

  int opt = 1;
  if (setsockopt(server_socket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
    LEDGER_LOG_ERROR("Failed to set socket options: " + std::string(std::strerror(errno)));
    close(server_socket_);
    server_socket_ = -1;
    return false;
  }

  struct sockaddr_in address;
  std::memset(&address, 0, sizeof(address));
  address.sin_family = AF_INET;
  address.sin_port = htons(static_cast<uint16_t>(options_.port));
  if (inet_pton(AF_INET, options_.bind_address.c_str(), &address.sin_addr) != 1) {
    LEDGER_LOG_ERROR("Invalid bind address: " + options_.bind_address);
    close(server_socket_);
    server_socket_ = -1;
    return false;
  }

  if (bind(server_socket_, reinterpret_cast<struct sockaddr*>(&address), sizeof(address)) < 0) {
    LEDGER_LOG_ERROR("Failed to bind " + options_.bind_address + ":" +
                     std::to_string(options_.port) + ": " + std::strerror(errno));
    close(server_socket_);
    server_socket_ = -1;
    return false;
  }

  if (listen(server_socket_, SOMAXCONN) < 0) {
    LEDGER_LOG_ERROR("Failed to listen on socket: " + std::string(std::strerror(errno)));
    close(server_socket_);
    server_socket_ = -1;
    return false;
  }

  socklen_t address_len = sizeof(address);
  if (getsockname(server_socket_, reinterpret_cast<struct sockaddr*>(&address),
                  &address_len) == 0) {
    bound_port_ = ntohs(address.sin_port);
  }

  running_ = true;
  accept_thread_ = std::make_unique<std::thread>(&HttpServer::acceptLoop, this);

  LEDGER_LOG_EVENT(observability::LogLevel::INFO, "HTTP server listening")
      .field("address", options_.bind_address)
      .field("port", bound_port_.load())
      .field("max_connections", static_cast<std::int64_t>(options_.max_connections));
  return true;
}

void HttpServer::stop() {
  if (!running_.exchange(false)) return;

  // Unblocks accept(); the descriptor is closed once the loop has exited.
  if (server_socket_ >= 0) {
    shutdown(server_socket_, SHUT_RDWR);
  }
  if (accept_thread_ && accept_thread_->joinable()) {
    accept_thread_->join();
  }
  accept_thread_.reset();
  if (server_socket_ >= 0) {
    close(server_socket_);
    server_socket_ = -1;
  }

  std::map<std::uint64_t, std::unique_ptr<Client>> clients;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (auto& [id, client] : clients_) {
      if (!client->finished) {
        shutdown(client->socket, SHUT_RDWR);
      }
    }
    clients.swap(clients_);
  }
  for (auto& [id, client] : clients) {
    if (client->worker.joinable()) {
      client->worker.join();
    }
  }

  LEDGER_LOG_INFO("HTTP server stopped");
}

void HttpServer::acceptLoop() {
  while (running_) {
    struct sockaddr_in client_address;
    socklen_t client_addr_len = sizeof(client_address);

    int client_socket = accept(server_socket_,
                               reinterpret_cast<struct sockaddr*>(&client_address),
                               &client_addr_len);

    if (client_socket < 0) {
      if (running_ && errno != EINTR) {
        LEDGER_LOG_WARN("Failed to accept connection: " + std::string(std::strerror(errno)));
      }
      continue;
    }

    char client_ip[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &client_address.sin_addr, client_ip, INET_ADDRSTRLEN);
    std::string client_addr = std::string(client_ip) + ":" +
                              std::to_string(ntohs(client_address.sin_port));

    reapFinishedClients();

    std::lock_guard<std::mutex> lock(connections_mutex_);
    if (clients_.size() >= options_.max_connections) {
      LEDGER_LOG_WARN("Connection limit reached, rejecting " + client_addr);
      rejectClient(client_socket);
      continue;
    }

    LEDGER_LOG_DEBUG("Accepted connection from " + client_addr);

    auto client = std::make_unique<Client>();
    client->socket = client_socket;
    client->address = client_addr;
    Client* raw = client.get();
    clients_.emplace(next_client_id_++, std::move(client));
    metrics_.incrementGauge(kConnectionsMetric);
    raw->worker = std::thread(&HttpServer::handleClient, this, raw);
  }
}

void HttpServer::reapFinishedClients() {
  std::vector<std::unique_ptr<Client>> finished;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (auto it = clients_.begin(); it != clients_.end();) {
      if (it->second->finished) {
        finished.push_back(std::move(it->second));
        it = clients_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& client : finished) {
    if (client->worker.joinable()) {
      client->worker.join();
    }
  }
}

void HttpServer::rejectClient(int client_socket) {
  auto response = http::HttpResponse::error(503, "server is at its connection limit",
                                            "SERVICE_UNAVAILABLE");
  if (!sendAll(client_socket, http::serializeResponse(response, false))) {
    LEDGER_LOG_DEBUG("Could not deliver rejection: " + std::string(std::strerror(errno)));
  }
  recordResponse(response.status);
  close(client_socket);
}

void HttpServer::handleClient(Client* client) {
  const int client_socket = client->socket;

  struct timeval timeout;
  timeout.tv_sec = options_.idle_timeout_seconds;
  timeout.tv_usec = 0;
  if (setsockopt(client_socket, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) < 0) {
    LEDGER_LOG_WARN("Failed to set idle timeout for " + client->address);
  }

  char buffer[4096];
  std::string request_buffer;
  bool open = true;

  while (open && running_) {
    // Serve every complete request already buffered (pipelining).
    auto parsed = http::RequestParser::parse(request_buffer);

    if (parsed.state == http::RequestParser::State::INVALID) {
      LEDGER_LOG_EVENT(observability::LogLevel::WARN, "rejecting malformed request")
          .field("client", client->address)
          .field("status", parsed.error_status)
          .field("reason", parsed.error_message);
      auto response = http::HttpResponse::error(parsed.error_status, parsed.error_message,
                                                "BAD_REQUEST");
      if (!sendAll(client_socket, http::serializeResponse(response, false))) {
        LEDGER_LOG_DEBUG("Write failed for " + client->address);
      }
      recordResponse(response.status);
      break;
    }

    if (parsed.state == http::RequestParser::State::COMPLETE) {
      request_buffer.erase(0, parsed.consumed);
      const http::HttpRequest& request = parsed.request;

      http::HttpResponse response;
      try {
        response = request_handler_(request);
      } catch (const std::exception& e) {
        LEDGER_LOG_ERROR("Unhandled error serving " + request.method + " " + request.path +
                         ": " + e.what());
        response = http::HttpResponse::error(500, "internal server error", "INTERNAL");
      }

      bool keep_alive = request.keepAlive() && running_;
      if (!sendAll(client_socket, http::serializeResponse(response, keep_alive))) {
        LEDGER_LOG_DEBUG("Write failed for " + client->address);
        break;
      }
      recordResponse(response.status);
      open = keep_alive;
      continue;
    }

    ssize_t bytes_read = recv(client_socket, buffer, sizeof(buffer), 0);
    if (bytes_read < 0 && errno == EINTR) {
      continue;
    }
    if (bytes_read <= 0) {
      if (bytes_read < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
        LEDGER_LOG_DEBUG("Idle timeout for " + client->address);
      } else if (bytes_read < 0) {
        LEDGER_LOG_DEBUG("Error reading from " + client->address + ": " +
                         std::strerror(errno));
      }
      break;
    }
    request_buffer.append(buffer, static_cast<size_t>(bytes_read));
  }

  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    close(client_socket);
    client->finished = true;
  }
  metrics_.decrementGauge(kConnectionsMetric);
  LEDGER_LOG_DEBUG("Closed connection from " + client->address);
}

bool HttpServer::sendAll(int client_socket, const std::string& data) {
  size_t sent = 0;
  while (sent < data.size()) {
    ssize_t written = send(client_socket, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (written < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    sent += static_cast<size_t>(written);
  }
  return true;
}

void HttpServer::recordResponse(int status) {
  metrics_.incrementCounter(kRequestsMetric, {{"status", std::to_string(status)}});
}

size_t HttpServer::getConnectionCount() const {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  size_t active = 0;
  for (const auto& [id, client] : clients_) {
    if (!client->finished) ++active;
  }
  return active;
}

}  // namespace network
}  // namespace ledger
