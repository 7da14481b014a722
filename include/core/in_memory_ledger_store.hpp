#ifndef LEDGER_CORE_IN_MEMORY_LEDGER_STORE_HPP_
#define LEDGER_CORE_IN_MEMORY_LEDGER_STORE_HPP_

#include "core/ledger_store.hpp"

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ledger {
namespace core {

/**
 * Process-local LedgerStore used by the test suite and by `LEDGER_STORAGE=memory`.
 *
 * Each account row carries its own mutex which plays the role of a database
 * row lock: a session acquires it in getForUpdate() and releases it when the
 * session commits or rolls back. Balance changes and ledger records are staged
 * in the session and published under the table lock at commit, so other
 * sessions never observe a partial transfer.
 */
class InMemoryLedgerStore : public LedgerStore {
 public:
  InMemoryLedgerStore() = default;
  ~InMemoryLedgerStore() override = default;

  // Non-copyable
  InMemoryLedgerStore(const InMemoryLedgerStore&) = delete;
  InMemoryLedgerStore& operator=(const InMemoryLedgerStore&) = delete;

  std::unique_ptr<LedgerSession> beginSession() override;

  std::optional<User> createUser(const std::string& username) override;
  std::optional<User> getUser(const std::string& user_id) override;

  std::optional<Account> createAccount(const std::string& user_id) override;
  std::optional<Account> getAccount(const std::string& account_id) override;
  std::vector<Account> getUserAccounts(const std::string& user_id) override;

  std::vector<TransactionRecord> getAccountTransactions(const std::string& account_id) override;

 private:
  class Session;

  struct AccountRow {
    Account account;      // committed state, guarded by table_mutex_
    std::mutex row_lock;  // held by the session that locked this row
  };

  AccountRow* findRow(const std::string& account_id);
  Account readCommitted(const AccountRow& row) const;
  void publish(const std::vector<Account>& accounts,
               const std::vector<TransactionRecord>& records);

  mutable std::shared_mutex table_mutex_;
  std::unordered_map<std::string, User> users_;
  std::unordered_map<std::string, std::string> user_ids_by_name_;
  // Rows are never erased, so AccountRow pointers stay valid.
  std::unordered_map<std::string, std::unique_ptr<AccountRow>> accounts_;
  std::vector<TransactionRecord> transactions_;  // commit order
};

}  // namespace core
}  // namespace ledger

#endif  // LEDGER_CORE_IN_MEMORY_LEDGER_STORE_HPP_
