#ifndef LEDGER_CORE_TRANSFER_ENGINE_HPP_
#define LEDGER_CORE_TRANSFER_ENGINE_HPP_

#include "core/ledger_store.hpp"
#include "core/ledger_types.hpp"
#include "observability/metrics.hpp"

#include <memory>
#include <string>

namespace ledger {
namespace core {

/**
 * Moves money between accounts and credits single accounts, each operation
 * as one atomic scope on the LedgerStore.
 *
 * The engine never retries. Every failure is returned as a typed Outcome and
 * leaves no partial effect behind: the session rolls back balances and ledger
 * records together.
 */
class TransferEngine {
 public:
  explicit TransferEngine(std::shared_ptr<LedgerStore> store,
                          observability::MetricsCollector& metrics =
                              observability::getGlobalMetrics());

  // Non-copyable
  TransferEngine(const TransferEngine&) = delete;
  TransferEngine& operator=(const TransferEngine&) = delete;

  /**
   * Debit `from_id` and credit `to_id` by `amount_text`, appending one ledger
   * record. Fails with SAME_ACCOUNT, INVALID_AMOUNT, ACCOUNT_NOT_FOUND,
   * INSUFFICIENT_FUNDS or STORAGE_UNAVAILABLE.
   */
  Outcome<TransactionRecord> transfer(const std::string& from_id,
                                      const std::string& to_id,
                                      const std::string& amount_text);

  /**
   * Credit `account_id` by `amount_text`. No ledger record is written.
   * Fails with INVALID_AMOUNT, ACCOUNT_NOT_FOUND or STORAGE_UNAVAILABLE.
   */
  Outcome<Account> addFunds(const std::string& account_id, const std::string& amount_text);

 private:
  void recordOutcome(const std::string& metric, const std::string& outcome);

  std::shared_ptr<LedgerStore> store_;
  observability::MetricsCollector& metrics_;
};

}  // namespace core
}  // namespace ledger

#endif  // LEDGER_CORE_TRANSFER_ENGINE_HPP_
