#include "core/in_memory_ledger_store.hpp"

#include "core/identifiers.hpp"

#include <algorithm>
#include <map>

namespace ledger {
namespace core {

class InMemoryLedgerStore::Session : public LedgerSession {
 public:
  explicit Session(InMemoryLedgerStore& store) : store_(store), finished_(false) {}

  ~Session() override {
    rollback();
  }

  std::optional<Account> getForUpdate(const std::string& account_id) override {
    ensureActive();

    auto staged = staged_accounts_.find(account_id);
    if (staged != staged_accounts_.end()) {
      return staged->second;
    }

    AccountRow* row = store_.findRow(account_id);
    if (!row) {
      return std::nullopt;
    }

    std::unique_lock<std::mutex> lock(row->row_lock);
    Account snapshot = store_.readCommitted(*row);
    held_locks_.emplace(account_id, std::move(lock));
    staged_accounts_.emplace(account_id, snapshot);
    return snapshot;
  }

  void updateBalance(const std::string& account_id, const Money& new_balance) override {
    ensureActive();

    auto staged = staged_accounts_.find(account_id);
    if (staged == staged_accounts_.end()) {
      throw StorageError("account " + account_id + " is not locked by this session");
    }
    // Mirrors the CHECK (balance >= 0) constraint of the relational schema.
    if (!new_balance.isNonNegative()) {
      throw StorageError("balance constraint violated for account " + account_id);
    }
    staged->second.balance = new_balance;
  }

  TransactionRecord appendTransaction(const std::string& from_account,
                                      const std::string& to_account,
                                      const Money& amount) override {
    ensureActive();

    TransactionRecord record;
    record.id = generateId();
    record.from_account = from_account;
    record.to_account = to_account;
    record.amount = amount;
    record.created_at = currentUtcTimestamp();
    staged_records_.push_back(record);
    return record;
  }

  void commit() override {
    ensureActive();

    std::vector<Account> accounts;
    accounts.reserve(staged_accounts_.size());
    for (const auto& [id, account] : staged_accounts_) {
      accounts.push_back(account);
    }
    store_.publish(accounts, staged_records_);
    release();
  }

  void rollback() override {
    if (finished_) return;
    release();
  }

 private:
  void ensureActive() const {
    if (finished_) {
      throw StorageError("session already finished");
    }
  }

  void release() {
    staged_accounts_.clear();
    staged_records_.clear();
    held_locks_.clear();
    finished_ = true;
  }

  InMemoryLedgerStore& store_;
  std::map<std::string, std::unique_lock<std::mutex>> held_locks_;
  std::map<std::string, Account> staged_accounts_;
  std::vector<TransactionRecord> staged_records_;
  bool finished_;
};

std::unique_ptr<LedgerSession> InMemoryLedgerStore::beginSession() {
  return std::make_unique<Session>(*this);
}

std::optional<User> InMemoryLedgerStore::createUser(const std::string& username) {
  std::unique_lock<std::shared_mutex> lock(table_mutex_);

  if (user_ids_by_name_.count(username) > 0) {
    return std::nullopt;
  }

  User user{generateId(), username};
  users_[user.id] = user;
  user_ids_by_name_[username] = user.id;
  return user;
}

std::optional<User> InMemoryLedgerStore::getUser(const std::string& user_id) {
  std::shared_lock<std::shared_mutex> lock(table_mutex_);

  auto it = users_.find(user_id);
  if (it == users_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<Account> InMemoryLedgerStore::createAccount(const std::string& user_id) {
  std::unique_lock<std::shared_mutex> lock(table_mutex_);

  if (users_.find(user_id) == users_.end()) {
    return std::nullopt;
  }

  auto row = std::make_unique<AccountRow>();
  row->account.id = generateId();
  row->account.user_id = user_id;
  row->account.balance = Money::zero();
  row->account.created_at = currentUtcTimestamp();

  Account created = row->account;
  accounts_.emplace(created.id, std::move(row));
  return created;
}

std::optional<Account> InMemoryLedgerStore::getAccount(const std::string& account_id) {
  std::shared_lock<std::shared_mutex> lock(table_mutex_);

  auto it = accounts_.find(account_id);
  if (it == accounts_.end()) {
    return std::nullopt;
  }
  return it->second->account;
}

std::vector<Account> InMemoryLedgerStore::getUserAccounts(const std::string& user_id) {
  std::shared_lock<std::shared_mutex> lock(table_mutex_);

  std::vector<Account> result;
  for (const auto& [id, row] : accounts_) {
    if (row->account.user_id == user_id) {
      result.push_back(row->account);
    }
  }
  std::sort(result.begin(), result.end(), [](const Account& a, const Account& b) {
    return a.created_at < b.created_at;
  });
  return result;
}

std::vector<TransactionRecord> InMemoryLedgerStore::getAccountTransactions(
    const std::string& account_id) {
  std::shared_lock<std::shared_mutex> lock(table_mutex_);

  std::vector<TransactionRecord> result;
  for (auto it = transactions_.rbegin(); it != transactions_.rend(); ++it) {
    if (it->from_account == account_id || it->to_account == account_id) {
      result.push_back(*it);
    }
  }
  return result;
}

InMemoryLedgerStore::AccountRow* InMemoryLedgerStore::findRow(const std::string& account_id) {
  std::shared_lock<std::shared_mutex> lock(table_mutex_);

  auto it = accounts_.find(account_id);
  return it == accounts_.end() ? nullptr : it->second.get();
}

Account InMemoryLedgerStore::readCommitted(const AccountRow& row) const {
  std::shared_lock<std::shared_mutex> lock(table_mutex_);
  return row.account;
}

void InMemoryLedgerStore::publish(const std::vector<Account>& accounts,
                                  const std::vector<TransactionRecord>& records) {
  std::unique_lock<std::shared_mutex> lock(table_mutex_);

  for (const auto& account : accounts) {
    accounts_.at(account.id)->account.balance = account.balance;
  }
  transactions_.insert(transactions_.end(), records.begin(), records.end());
}

}  // namespace core
}  // namespace ledger
