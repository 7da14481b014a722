#ifndef LEDGER_CORE_LEDGER_STORE_HPP_
#define LEDGER_CORE_LEDGER_STORE_HPP_

#include "core/ledger_types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ledger {
namespace core {

/**
 * One atomic scope over the account store and the transaction ledger.
 *
 * Every effect performed through a session becomes durable together on
 * commit(), or is discarded together on rollback(). A session that is
 * destroyed without being committed rolls back. Row locks taken by
 * getForUpdate() are held until the session ends.
 *
 * All methods throw StorageError when the persistence layer fails.
 */
class LedgerSession {
 public:
  virtual ~LedgerSession() = default;

  /**
   * Read an account and take its exclusive row lock. Blocks while another
   * session holds the lock. Returns nullopt when the account does not exist.
   */
  virtual std::optional<Account> getForUpdate(const std::string& account_id) = 0;

  /**
   * Set the balance of an account locked by this session.
   */
  virtual void updateBalance(const std::string& account_id, const Money& new_balance) = 0;

  /**
   * Append a ledger record with a fresh id and the current timestamp.
   */
  virtual TransactionRecord appendTransaction(const std::string& from_account,
                                              const std::string& to_account,
                                              const Money& amount) = 0;

  virtual void commit() = 0;
  virtual void rollback() = 0;
};

/**
 * Persistence collaborator consumed by the transfer engine.
 *
 * Directory operations (users, account creation, lookups) run outside any
 * atomic scope and never take row locks.
 */
class LedgerStore {
 public:
  virtual ~LedgerStore() = default;

  virtual std::unique_ptr<LedgerSession> beginSession() = 0;

  // Returns nullopt when the username is already taken.
  virtual std::optional<User> createUser(const std::string& username) = 0;
  virtual std::optional<User> getUser(const std::string& user_id) = 0;

  // Returns nullopt when the owning user does not exist.
  virtual std::optional<Account> createAccount(const std::string& user_id) = 0;
  virtual std::optional<Account> getAccount(const std::string& account_id) = 0;
  virtual std::vector<Account> getUserAccounts(const std::string& user_id) = 0;

  /**
   * Ledger records with the account as source or destination, newest first.
   */
  virtual std::vector<TransactionRecord> getAccountTransactions(const std::string& account_id) = 0;
};

/**
 * Lock two accounts in ascending identifier order and return them in argument
 * order. Every site that locks more than one account goes through here so
 * that concurrent sessions always acquire row locks in the same order.
 */
std::pair<std::optional<Account>, std::optional<Account>> lockAccountsInOrder(
    LedgerSession& session, const std::string& first_id, const std::string& second_id);

}  // namespace core
}  // namespace ledger

#endif  // LEDGER_CORE_LEDGER_STORE_HPP_
