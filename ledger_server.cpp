#include "ledger_server.hpp"

#include "core/identifiers.hpp"
#include "observability/logger.hpp"

#include <nlohmann/json.hpp>

#include <optional>

namespace ledger {

using json = nlohmann::json;
using network::http::HttpRequest;
using network::http::HttpResponse;

namespace {

json accountJson(const core::Account& account) {
  return json{{"id", account.id},
              {"user_id", account.user_id},
              {"balance", account.balance.toString()}};
}

json userJson(const core::User& user) {
  return json{{"id", user.id}, {"username", user.username}};
}

json transactionJson(const core::TransactionRecord& record) {
  return json{{"id", record.id},
              {"from_account", record.from_account},
              {"to_account", record.to_account},
              {"amount", record.amount.toString()},
              {"created_at", record.created_at}};
}

HttpResponse ledgerError(core::LedgerError error, const std::string& message) {
  return HttpResponse::error(httpStatusFor(error), message, core::errorCodeName(error));
}

HttpResponse badRequest(const std::string& message) {
  return HttpResponse::error(400, message, "BAD_REQUEST");
}

HttpResponse notFound(const std::string& message) {
  return HttpResponse::error(404, message, "NOT_FOUND");
}

/**
 * Request body as a JSON object, or nullopt (and a 400 in `error`).
 */
std::optional<json> parseObject(const HttpRequest& request, HttpResponse& error) {
  json body;
  try {
    body = json::parse(request.body);
  } catch (const json::parse_error& e) {
    error = badRequest(std::string("malformed JSON body: ") + e.what());
    return std::nullopt;
  }
  if (!body.is_object()) {
    error = badRequest("request body must be a JSON object");
    return std::nullopt;
  }
  return body;
}

/**
 * String member `field`, or nullopt (and a 400 in `error`) when it is missing
 * or not a string.
 */
std::optional<std::string> stringField(const json& body, const std::string& field,
                                       HttpResponse& error) {
  auto it = body.find(field);
  if (it == body.end() || !it->is_string()) {
    error = badRequest("field '" + field + "' is required and must be a string");
    return std::nullopt;
  }
  return it->get<std::string>();
}

/**
 * Amounts travel as decimal strings; a JSON number is rejected before it can
 * be rounded through a double.
 */
std::optional<std::string> amountField(const json& body, HttpResponse& error) {
  auto it = body.find("amount");
  if (it != body.end() && it->is_number()) {
    error = ledgerError(core::LedgerError::INVALID_AMOUNT,
                        "amount must be a decimal string such as \"10.50\"");
    return std::nullopt;
  }
  return stringField(body, "amount", error);
}

HttpResponse methodNotAllowed(const std::string& allowed) {
  HttpResponse response = HttpResponse::error(405, "method not allowed", "METHOD_NOT_ALLOWED");
  response.headers["Allow"] = allowed;
  return response;
}

}  // namespace

int httpStatusFor(core::LedgerError error) {
  switch (error) {
    case core::LedgerError::INVALID_AMOUNT: return 400;
    case core::LedgerError::SAME_ACCOUNT: return 400;
    case core::LedgerError::ACCOUNT_NOT_FOUND: return 404;
    case core::LedgerError::INSUFFICIENT_FUNDS: return 422;
    case core::LedgerError::STORAGE_UNAVAILABLE: return 503;
    default: return 500;
  }
}

LedgerServer::LedgerServer(const config::ServerConfig& config,
                           std::shared_ptr<core::LedgerStore> store,
                           observability::MetricsCollector& metrics)
    : config_(config), store_(std::move(store)), metrics_(metrics) {
  engine_ = std::make_unique<core::TransferEngine>(store_, metrics_);

  http_server_ = std::make_unique<network::HttpServer>(
      config_.serverOptions(),
      [this](const HttpRequest& request) { return handleRequest(request); },
      metrics_);
}

LedgerServer::~LedgerServer() {
  stop();
}

bool LedgerServer::start() {
  LEDGER_LOG_INFO("Starting ledger server: " + config_.describe());

  if (!http_server_->start()) {
    LEDGER_LOG_ERROR("Failed to start HTTP server");
    return false;
  }

  LEDGER_LOG_INFO("Ledger server started on port " + std::to_string(http_server_->getPort()));
  return true;
}

void LedgerServer::stop() {
  if (http_server_ && http_server_->isRunning()) {
    LEDGER_LOG_INFO("Stopping ledger server...");
    http_server_->stop();
    LEDGER_LOG_INFO("Ledger server stopped");
  }
}

LedgerServer::Stats LedgerServer::getStats() const {
  Stats stats;
  stats.is_running = http_server_ && http_server_->isRunning();
  stats.active_connections = http_server_ ? http_server_->getConnectionCount() : 0;

  stats.transfers_committed =
      metrics_.counterValue("ledger_transfers_total", {{"outcome", "OK"}});
  stats.transfers_rejected = 0.0;
  for (core::LedgerError error :
       {core::LedgerError::INVALID_AMOUNT, core::LedgerError::SAME_ACCOUNT,
        core::LedgerError::ACCOUNT_NOT_FOUND, core::LedgerError::INSUFFICIENT_FUNDS,
        core::LedgerError::STORAGE_UNAVAILABLE}) {
    stats.transfers_rejected += metrics_.counterValue(
        "ledger_transfers_total", {{"outcome", core::errorCodeName(error)}});
  }
  stats.fundings_committed =
      metrics_.counterValue("ledger_fundings_total", {{"outcome", "OK"}});
  return stats;
}

HttpResponse LedgerServer::handleRequest(const HttpRequest& request) {
  try {
    return route(request, network::http::splitPath(request.path));
  } catch (const core::StorageError& e) {
    LEDGER_LOG_EVENT(observability::LogLevel::ERROR, "request failed: storage unavailable")
        .field("method", request.method)
        .field("path", request.path)
        .field("reason", e.what());
    return ledgerError(core::LedgerError::STORAGE_UNAVAILABLE, "storage unavailable");
  }
}

HttpResponse LedgerServer::route(const HttpRequest& request,
                                 const std::vector<std::string>& segments) {
  const std::string& method = request.method;

  if (segments.size() == 1) {
    const std::string& resource = segments[0];

    if (resource == "health") {
      if (method != "GET") return methodNotAllowed("GET");
      return HttpResponse::json(200, json{{"status", "ok"}});
    }
    if (resource == "metrics") {
      if (method != "GET") return methodNotAllowed("GET");
      return HttpResponse::text(200, metrics_.exportMetrics(),
                                "text/plain; version=0.0.4; charset=utf-8");
    }
    if (resource == "register") {
      if (method != "POST") return methodNotAllowed("POST");
      return handleRegister(request);
    }
    if (resource == "accounts") {
      if (method != "POST") return methodNotAllowed("POST");
      return handleCreateAccount(request);
    }
    if (resource == "transactions") {
      if (method != "POST") return methodNotAllowed("POST");
      return handleTransfer(request);
    }
    if (resource == "addmoney") {
      if (method != "POST") return methodNotAllowed("POST");
      return handleAddMoney(request);
    }
  }

  if (segments.size() == 2) {
    if (segments[0] == "users") {
      if (method != "GET") return methodNotAllowed("GET");
      return handleGetUser(segments[1]);
    }
    if (segments[0] == "accounts") {
      if (method != "GET") return methodNotAllowed("GET");
      return handleGetAccount(segments[1]);
    }
  }

  if (segments.size() == 3) {
    if (segments[0] == "users" && segments[2] == "accounts") {
      if (method != "GET") return methodNotAllowed("GET");
      return handleGetUserAccounts(segments[1]);
    }
    if (segments[0] == "accounts" && segments[2] == "transactions") {
      if (method != "GET") return methodNotAllowed("GET");
      return handleTransactionHistory(segments[1]);
    }
  }

  return notFound("no route for " + request.path);
}

HttpResponse LedgerServer::handleRegister(const HttpRequest& request) {
  HttpResponse error;
  auto body = parseObject(request, error);
  if (!body) return error;

  auto username = stringField(*body, "username", error);
  if (!username) return error;
  if (username->empty()) {
    return badRequest("username must not be empty");
  }

  auto user = store_->createUser(*username);
  if (!user) {
    return HttpResponse::error(409, "username '" + *username + "' is already taken",
                               "USERNAME_TAKEN");
  }

  LEDGER_LOG_EVENT(observability::LogLevel::INFO, "user registered")
      .field("user_id", user->id)
      .field("username", user->username);
  return HttpResponse::json(200, userJson(*user));
}

HttpResponse LedgerServer::handleGetUser(const std::string& user_id) {
  auto user = store_->getUser(core::normalizeId(user_id));
  if (!user) {
    return notFound("user " + user_id + " not found");
  }
  return HttpResponse::json(200, userJson(*user));
}

HttpResponse LedgerServer::handleGetUserAccounts(const std::string& user_id) {
  json accounts = json::array();
  for (const auto& account : store_->getUserAccounts(core::normalizeId(user_id))) {
    accounts.push_back(accountJson(account));
  }
  return HttpResponse::json(200, accounts);
}

HttpResponse LedgerServer::handleCreateAccount(const HttpRequest& request) {
  HttpResponse error;
  auto body = parseObject(request, error);
  if (!body) return error;

  auto user_id = stringField(*body, "user_id", error);
  if (!user_id) return error;

  auto account = store_->createAccount(core::normalizeId(*user_id));
  if (!account) {
    return notFound("user " + *user_id + " not found");
  }
  return HttpResponse::json(200, accountJson(*account));
}

HttpResponse LedgerServer::handleGetAccount(const std::string& account_id) {
  auto account = store_->getAccount(core::normalizeId(account_id));
  if (!account) {
    return ledgerError(core::LedgerError::ACCOUNT_NOT_FOUND,
                       "account " + account_id + " not found");
  }
  return HttpResponse::json(200, accountJson(*account));
}

HttpResponse LedgerServer::handleTransactionHistory(const std::string& account_id) {
  json records = json::array();
  for (const auto& record : store_->getAccountTransactions(core::normalizeId(account_id))) {
    records.push_back(transactionJson(record));
  }
  return HttpResponse::json(200, records);
}

HttpResponse LedgerServer::handleTransfer(const HttpRequest& request) {
  HttpResponse error;
  auto body = parseObject(request, error);
  if (!body) return error;

  auto from_account = stringField(*body, "from_account", error);
  if (!from_account) return error;
  auto to_account = stringField(*body, "to_account", error);
  if (!to_account) return error;
  auto amount = amountField(*body, error);
  if (!amount) return error;

  auto outcome = engine_->transfer(*from_account, *to_account, *amount);
  if (!outcome) {
    return ledgerError(outcome.error(), outcome.message());
  }
  return HttpResponse::json(200, transactionJson(outcome.value()));
}

HttpResponse LedgerServer::handleAddMoney(const HttpRequest& request) {
  HttpResponse error;
  auto body = parseObject(request, error);
  if (!body) return error;

  auto account_id = stringField(*body, "account_id", error);
  if (!account_id) return error;
  auto amount = amountField(*body, error);
  if (!amount) return error;

  auto outcome = engine_->addFunds(*account_id, *amount);
  if (!outcome) {
    return ledgerError(outcome.error(), outcome.message());
  }
  return HttpResponse::json(200, accountJson(outcome.value()));
}

}  // namespace ledger
