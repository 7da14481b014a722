#include "core/transfer_engine.hpp"

#include "core/identifiers.hpp"
#include "observability/logger.hpp"

#include <stdexcept>

namespace ledger {
namespace core {

namespace {

constexpr const char* kTransfersMetric = "ledger_transfers_total";
constexpr const char* kFundingsMetric = "ledger_fundings_total";
constexpr const char* kTransferDurationMetric = "ledger_transfer_duration_seconds";

using observability::LogLevel;

}  // namespace

TransferEngine::TransferEngine(std::shared_ptr<LedgerStore> store,
                               observability::MetricsCollector& metrics)
    : store_(std::move(store)), metrics_(metrics) {
  if (!store_) {
    throw std::invalid_argument("TransferEngine requires a store");
  }
  metrics_.describe(kTransfersMetric, "Transfers attempted, by outcome");
  metrics_.describe(kFundingsMetric, "Funding operations attempted, by outcome");
  metrics_.describe(kTransferDurationMetric, "Wall time of transfer atomic scopes");
}

Outcome<TransactionRecord> TransferEngine::transfer(const std::string& from_id,
                                                    const std::string& to_id,
                                                    const std::string& amount_text) {
  using Result = Outcome<TransactionRecord>;

  std::string from = normalizeId(from_id);
  std::string to = normalizeId(to_id);

  if (from == to) {
    recordOutcome(kTransfersMetric, errorCodeName(LedgerError::SAME_ACCOUNT));
    return Result::failure(LedgerError::SAME_ACCOUNT,
                           "source and destination account are the same");
  }

  auto amount = Money::parse(amount_text);
  if (!amount || !amount->isPositive()) {
    recordOutcome(kTransfersMetric, errorCodeName(LedgerError::INVALID_AMOUNT));
    return Result::failure(LedgerError::INVALID_AMOUNT,
                           "amount must be a positive decimal with at most 2 fractional digits");
  }

  observability::MetricsCollector::Timer timer(metrics_, kTransferDurationMetric);

  try {
    auto session = store_->beginSession();

    auto [source, destination] = lockAccountsInOrder(*session, from, to);
    if (!source || !destination) {
      // Destroying the session releases whichever lock was taken.
      LEDGER_LOG_EVENT(LogLevel::WARN, "transfer rejected: account not found")
          .field("from_account", from)
          .field("to_account", to)
          .field("missing", !source ? from : to);
      recordOutcome(kTransfersMetric, errorCodeName(LedgerError::ACCOUNT_NOT_FOUND));
      return Result::failure(LedgerError::ACCOUNT_NOT_FOUND,
                             "account " + (!source ? from : to) + " not found");
    }

    if (source->balance < *amount) {
      LEDGER_LOG_EVENT(LogLevel::WARN, "transfer rejected: insufficient funds")
          .field("from_account", from)
          .field("balance", source->balance.toString())
          .field("amount", amount->toString());
      recordOutcome(kTransfersMetric, errorCodeName(LedgerError::INSUFFICIENT_FUNDS));
      return Result::failure(LedgerError::INSUFFICIENT_FUNDS,
                             "insufficient funds in account " + from);
    }

    session->updateBalance(from, source->balance - *amount);
    session->updateBalance(to, destination->balance + *amount);
    TransactionRecord record = session->appendTransaction(from, to, *amount);
    session->commit();

    LEDGER_LOG_EVENT(LogLevel::INFO, "transfer committed")
        .field("transaction_id", record.id)
        .field("from_account", from)
        .field("to_account", to)
        .field("amount", record.amount.toString());
    recordOutcome(kTransfersMetric, "OK");
    return Result::success(std::move(record));

  } catch (const StorageError& e) {
    LEDGER_LOG_EVENT(LogLevel::ERROR, "transfer aborted: storage unavailable")
        .field("from_account", from)
        .field("to_account", to)
        .field("reason", e.what());
    recordOutcome(kTransfersMetric, errorCodeName(LedgerError::STORAGE_UNAVAILABLE));
    return Result::failure(LedgerError::STORAGE_UNAVAILABLE,
                           std::string("storage unavailable: ") + e.what());
  } catch (const std::overflow_error& e) {
    // The destination balance would leave the representable range.
    LEDGER_LOG_EVENT(LogLevel::WARN, "transfer rejected: balance overflow")
        .field("to_account", to)
        .field("reason", e.what());
    recordOutcome(kTransfersMetric, errorCodeName(LedgerError::INVALID_AMOUNT));
    return Result::failure(LedgerError::INVALID_AMOUNT,
                           "amount would exceed the representable balance of account " + to);
  }
}

Outcome<Account> TransferEngine::addFunds(const std::string& account_id,
                                          const std::string& amount_text) {
  using Result = Outcome<Account>;

  std::string id = normalizeId(account_id);

  auto amount = Money::parse(amount_text);
  if (!amount || !amount->isPositive()) {
    recordOutcome(kFundingsMetric, errorCodeName(LedgerError::INVALID_AMOUNT));
    return Result::failure(LedgerError::INVALID_AMOUNT,
                           "amount must be a positive decimal with at most 2 fractional digits");
  }

  try {
    auto session = store_->beginSession();

    auto account = session->getForUpdate(id);
    if (!account) {
      LEDGER_LOG_EVENT(LogLevel::WARN, "funding rejected: account not found")
          .field("account_id", id);
      recordOutcome(kFundingsMetric, errorCodeName(LedgerError::ACCOUNT_NOT_FOUND));
      return Result::failure(LedgerError::ACCOUNT_NOT_FOUND, "account " + id + " not found");
    }

    account->balance = account->balance + *amount;
    session->updateBalance(id, account->balance);
    session->commit();

    LEDGER_LOG_EVENT(LogLevel::INFO, "funding committed")
        .field("account_id", id)
        .field("amount", amount->toString())
        .field("balance", account->balance.toString());
    recordOutcome(kFundingsMetric, "OK");
    return Result::success(std::move(*account));

  } catch (const StorageError& e) {
    LEDGER_LOG_EVENT(LogLevel::ERROR, "funding aborted: storage unavailable")
        .field("account_id", id)
        .field("reason", e.what());
    recordOutcome(kFundingsMetric, errorCodeName(LedgerError::STORAGE_UNAVAILABLE));
    return Result::failure(LedgerError::STORAGE_UNAVAILABLE,
                           std::string("storage unavailable: ") + e.what());
  } catch (const std::overflow_error& e) {
    LEDGER_LOG_EVENT(LogLevel::WARN, "funding rejected: balance overflow")
        .field("account_id", id)
        .field("reason", e.what());
    recordOutcome(kFundingsMetric, errorCodeName(LedgerError::INVALID_AMOUNT));
    return Result::failure(LedgerError::INVALID_AMOUNT,
                           "amount would exceed the representable balance of account " + id);
  }
}

void TransferEngine::recordOutcome(const std::string& metric, const std::string& outcome) {
  metrics_.incrementCounter(metric, {{"outcome", outcome}});
}

}  // namespace core
}  // namespace ledger
