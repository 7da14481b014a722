#include "core/identifiers.hpp"
#include "core/in_memory_ledger_store.hpp"
#include "core/transfer_engine.hpp"
#include "observability/metrics.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cctype>
#include <thread>
#include <vector>

using namespace ledger::core;
using ledger::observability::MetricsCollector;

namespace {

/**
 * Delegates to a real store but fails every atomic scope at commit, the way a
 * dropped database connection would.
 */
class FailingCommitStore : public LedgerStore {
 public:
  explicit FailingCommitStore(std::shared_ptr<LedgerStore> inner) : inner_(std::move(inner)) {}

  std::unique_ptr<LedgerSession> beginSession() override {
    return std::make_unique<Session>(inner_->beginSession());
  }

  std::optional<User> createUser(const std::string& username) override {
    return inner_->createUser(username);
  }
  std::optional<User> getUser(const std::string& user_id) override {
    return inner_->getUser(user_id);
  }
  std::optional<Account> createAccount(const std::string& user_id) override {
    return inner_->createAccount(user_id);
  }
  std::optional<Account> getAccount(const std::string& account_id) override {
    return inner_->getAccount(account_id);
  }
  std::vector<Account> getUserAccounts(const std::string& user_id) override {
    return inner_->getUserAccounts(user_id);
  }
  std::vector<TransactionRecord> getAccountTransactions(const std::string& account_id) override {
    return inner_->getAccountTransactions(account_id);
  }

 private:
  class Session : public LedgerSession {
   public:
    explicit Session(std::unique_ptr<LedgerSession> inner) : inner_(std::move(inner)) {}

    std::optional<Account> getForUpdate(const std::string& account_id) override {
      return inner_->getForUpdate(account_id);
    }
    void updateBalance(const std::string& account_id, const Money& new_balance) override {
      inner_->updateBalance(account_id, new_balance);
    }
    TransactionRecord appendTransaction(const std::string& from_account,
                                        const std::string& to_account,
                                        const Money& amount) override {
      return inner_->appendTransaction(from_account, to_account, amount);
    }
    void commit() override {
      throw StorageError("connection lost during COMMIT");
    }
    void rollback() override {
      inner_->rollback();
    }

   private:
    std::unique_ptr<LedgerSession> inner_;
  };

  std::shared_ptr<LedgerStore> inner_;
};

}  // namespace

// Test fixture for transfer engine tests
class TransferEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    store_ = std::make_shared<InMemoryLedgerStore>();
    engine_ = std::make_unique<TransferEngine>(store_, metrics_);

    auto user = store_->createUser("owner");
    ASSERT_TRUE(user.has_value());
    user_id_ = user->id;
  }

  std::string openAccount(const std::string& opening_balance = "") {
    auto account = store_->createAccount(user_id_);
    EXPECT_TRUE(account.has_value());
    if (!account) return "";
    if (!opening_balance.empty()) {
      EXPECT_TRUE(engine_->addFunds(account->id, opening_balance).ok());
    }
    return account->id;
  }

  std::string balanceOf(const std::string& id) {
    return store_->getAccount(id)->balance.toString();
  }

  MetricsCollector metrics_;
  std::shared_ptr<InMemoryLedgerStore> store_;
  std::unique_ptr<TransferEngine> engine_;
  std::string user_id_;
};

TEST_F(TransferEngineTest, SuccessfulTransferMovesMoneyAndRecordsIt) {
  std::string a = openAccount("1000.00");
  std::string b = openAccount();

  auto outcome = engine_->transfer(a, b, "250.50");
  ASSERT_TRUE(outcome.ok()) << outcome.message();

  EXPECT_EQ(balanceOf(a), "749.50");
  EXPECT_EQ(balanceOf(b), "250.50");

  const TransactionRecord& record = outcome.value();
  EXPECT_TRUE(isWellFormedId(record.id));
  EXPECT_EQ(record.from_account, a);
  EXPECT_EQ(record.to_account, b);
  EXPECT_EQ(record.amount.toString(), "250.50");
  EXPECT_FALSE(record.created_at.empty());

  auto history_a = store_->getAccountTransactions(a);
  auto history_b = store_->getAccountTransactions(b);
  ASSERT_EQ(history_a.size(), 1u);
  ASSERT_EQ(history_b.size(), 1u);
  EXPECT_EQ(history_a[0].id, record.id);
  EXPECT_EQ(history_b[0].id, record.id);
}

TEST_F(TransferEngineTest, TransferIntoFundedAccountAddsToItsBalance) {
  std::string a = openAccount("1000.00");
  std::string b = openAccount("500.00");

  auto outcome = engine_->transfer(a, b, "250.50");
  ASSERT_TRUE(outcome.ok()) << outcome.message();
  EXPECT_EQ(balanceOf(a), "749.50");
  EXPECT_EQ(balanceOf(b), "750.50");
  EXPECT_EQ(store_->getAccountTransactions(b).size(), 1u);
}

TEST_F(TransferEngineTest, InsufficientFundsLeavesEverythingUnchanged) {
  std::string a = openAccount("10.00");
  std::string b = openAccount();

  auto outcome = engine_->transfer(a, b, "10.01");
  ASSERT_FALSE(outcome.ok());
  EXPECT_EQ(outcome.error(), LedgerError::INSUFFICIENT_FUNDS);

  EXPECT_EQ(balanceOf(a), "10.00");
  EXPECT_EQ(balanceOf(b), "0.00");
  EXPECT_TRUE(store_->getAccountTransactions(a).empty());
}

TEST_F(TransferEngineTest, ExactBalanceCanBeTransferred) {
  std::string a = openAccount("10.00");
  std::string b = openAccount();

  ASSERT_TRUE(engine_->transfer(a, b, "10").ok());
  EXPECT_EQ(balanceOf(a), "0.00");
  EXPECT_EQ(balanceOf(b), "10.00");
}

TEST_F(TransferEngineTest, SameAccountIsRejectedBeforeAnyLock) {
  std::string a = openAccount("50.00");

  auto outcome = engine_->transfer(a, a, "1.00");
  ASSERT_FALSE(outcome.ok());
  EXPECT_EQ(outcome.error(), LedgerError::SAME_ACCOUNT);

  // Case differences do not make two ids distinct.
  std::string upper = a;
  for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  EXPECT_EQ(engine_->transfer(a, upper, "1.00").error(), LedgerError::SAME_ACCOUNT);

  EXPECT_EQ(balanceOf(a), "50.00");
  EXPECT_TRUE(store_->getAccountTransactions(a).empty());
}

TEST_F(TransferEngineTest, InvalidAmountsAreRejected) {
  std::string a = openAccount("50.00");
  std::string b = openAccount();

  for (const char* amount : {"0", "0.00", "-5", "abc", "1.234", "", "1e2", " 1"}) {
    auto outcome = engine_->transfer(a, b, amount);
    ASSERT_FALSE(outcome.ok()) << amount;
    EXPECT_EQ(outcome.error(), LedgerError::INVALID_AMOUNT) << amount;
  }

  EXPECT_EQ(balanceOf(a), "50.00");
  EXPECT_EQ(balanceOf(b), "0.00");
}

TEST_F(TransferEngineTest, MissingAccountIsReportedAndNothingChanges) {
  std::string a = openAccount("50.00");
  std::string ghost = generateId();

  auto outgoing = engine_->transfer(a, ghost, "5.00");
  ASSERT_FALSE(outgoing.ok());
  EXPECT_EQ(outgoing.error(), LedgerError::ACCOUNT_NOT_FOUND);

  auto incoming = engine_->transfer(ghost, a, "5.00");
  ASSERT_FALSE(incoming.ok());
  EXPECT_EQ(incoming.error(), LedgerError::ACCOUNT_NOT_FOUND);

  EXPECT_EQ(balanceOf(a), "50.00");
  EXPECT_TRUE(store_->getAccountTransactions(a).empty());

  // Locks taken before the failure were released.
  std::string b = openAccount();
  EXPECT_TRUE(engine_->transfer(a, b, "5.00").ok());
}

TEST_F(TransferEngineTest, TransfersAreZeroSum) {
  std::string a = openAccount("300.00");
  std::string b = openAccount("200.00");
  std::string c = openAccount("100.00");

  ASSERT_TRUE(engine_->transfer(a, b, "120.25").ok());
  ASSERT_TRUE(engine_->transfer(b, c, "300.00").ok());
  ASSERT_FALSE(engine_->transfer(c, a, "1000.00").ok());
  ASSERT_TRUE(engine_->transfer(c, a, "0.01").ok());

  std::int64_t total = 0;
  for (const auto& id : {a, b, c}) {
    total += store_->getAccount(id)->balance.cents();
  }
  EXPECT_EQ(total, 60000);
}

TEST_F(TransferEngineTest, FundingCreditsWithoutALedgerRecord) {
  std::string a = openAccount();

  auto outcome = engine_->addFunds(a, "75.25");
  ASSERT_TRUE(outcome.ok());
  EXPECT_EQ(outcome.value().id, a);
  EXPECT_EQ(outcome.value().balance.toString(), "75.25");
  EXPECT_EQ(balanceOf(a), "75.25");
  EXPECT_TRUE(store_->getAccountTransactions(a).empty());
}

TEST_F(TransferEngineTest, FundingRejectsBadInput) {
  std::string a = openAccount();

  EXPECT_EQ(engine_->addFunds(a, "0").error(), LedgerError::INVALID_AMOUNT);
  EXPECT_EQ(engine_->addFunds(a, "-1").error(), LedgerError::INVALID_AMOUNT);
  EXPECT_EQ(engine_->addFunds(generateId(), "1.00").error(), LedgerError::ACCOUNT_NOT_FOUND);
  EXPECT_EQ(balanceOf(a), "0.00");
}

TEST_F(TransferEngineTest, FundingPastTheRepresentableRangeIsInvalid) {
  std::string a = openAccount("92233720368547758.07");

  auto outcome = engine_->addFunds(a, "0.01");
  ASSERT_FALSE(outcome.ok());
  EXPECT_EQ(outcome.error(), LedgerError::INVALID_AMOUNT);
  EXPECT_EQ(balanceOf(a), "92233720368547758.07");
}

TEST_F(TransferEngineTest, TransferThatWouldOverflowDestinationIsInvalid) {
  std::string a = openAccount("1.00");
  std::string b = openAccount("92233720368547758.07");

  auto outcome = engine_->transfer(a, b, "1.00");
  ASSERT_FALSE(outcome.ok());
  EXPECT_EQ(outcome.error(), LedgerError::INVALID_AMOUNT);
  EXPECT_EQ(balanceOf(a), "1.00");
  EXPECT_EQ(balanceOf(b), "92233720368547758.07");
  EXPECT_TRUE(store_->getAccountTransactions(a).empty());
  EXPECT_TRUE(store_->getAccountTransactions(b).empty());
}

TEST_F(TransferEngineTest, StorageFailureAtCommitLeavesNoTrace) {
  std::string a = openAccount("100.00");
  std::string b = openAccount();

  TransferEngine failing(std::make_shared<FailingCommitStore>(store_), metrics_);

  auto transfer = failing.transfer(a, b, "40.00");
  ASSERT_FALSE(transfer.ok());
  EXPECT_EQ(transfer.error(), LedgerError::STORAGE_UNAVAILABLE);
  EXPECT_TRUE(isRetryable(transfer.error()));

  auto funding = failing.addFunds(b, "5.00");
  ASSERT_FALSE(funding.ok());
  EXPECT_EQ(funding.error(), LedgerError::STORAGE_UNAVAILABLE);

  EXPECT_EQ(balanceOf(a), "100.00");
  EXPECT_EQ(balanceOf(b), "0.00");
  EXPECT_TRUE(store_->getAccountTransactions(a).empty());

  // Same input succeeds once storage recovers.
  EXPECT_TRUE(engine_->transfer(a, b, "40.00").ok());
}

TEST_F(TransferEngineTest, OutcomesAreCountedByKind) {
  std::string a = openAccount("10.00");
  std::string b = openAccount();

  engine_->transfer(a, b, "1.00");
  engine_->transfer(a, b, "100.00");
  engine_->transfer(a, a, "1.00");

  EXPECT_EQ(metrics_.counterValue("ledger_transfers_total", {{"outcome", "OK"}}), 1.0);
  EXPECT_EQ(metrics_.counterValue("ledger_transfers_total",
                                  {{"outcome", "INSUFFICIENT_FUNDS"}}), 1.0);
  EXPECT_EQ(metrics_.counterValue("ledger_transfers_total", {{"outcome", "SAME_ACCOUNT"}}), 1.0);
  EXPECT_EQ(metrics_.counterValue("ledger_fundings_total", {{"outcome", "OK"}}), 1.0);
}

TEST_F(TransferEngineTest, ConcurrentDebitsNeverOverdraw) {
  // Balance covers exactly 25 of the 40 concurrent debits.
  std::string source = openAccount("250.00");
  std::vector<std::string> sinks;
  for (int i = 0; i < 4; ++i) {
    sinks.push_back(openAccount());
  }

  const int kDebits = 40;
  std::atomic<int> succeeded{0};
  std::atomic<int> insufficient{0};
  std::vector<std::thread> threads;

  for (int i = 0; i < kDebits; ++i) {
    threads.emplace_back([&, i] {
      auto outcome = engine_->transfer(source, sinks[i % sinks.size()], "10.00");
      if (outcome.ok()) {
        ++succeeded;
      } else if (outcome.error() == LedgerError::INSUFFICIENT_FUNDS) {
        ++insufficient;
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_EQ(succeeded.load(), 25);
  EXPECT_EQ(insufficient.load(), kDebits - 25);
  EXPECT_EQ(balanceOf(source), "0.00");
  EXPECT_EQ(store_->getAccountTransactions(source).size(), 25u);

  std::int64_t credited = 0;
  for (const auto& sink : sinks) {
    credited += store_->getAccount(sink)->balance.cents();
  }
  EXPECT_EQ(credited, 25000);
}

TEST_F(TransferEngineTest, OpposingTransfersDoNotDeadlock) {
  std::string x = openAccount("1000.00");
  std::string y = openAccount("1000.00");

  const int kRounds = 200;
  std::atomic<int> failures{0};

  std::thread forward([&] {
    for (int i = 0; i < kRounds; ++i) {
      if (!engine_->transfer(x, y, "1.00").ok()) ++failures;
    }
  });
  std::thread backward([&] {
    for (int i = 0; i < kRounds; ++i) {
      if (!engine_->transfer(y, x, "1.00").ok()) ++failures;
    }
  });

  forward.join();
  backward.join();

  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(balanceOf(x), "1000.00");
  EXPECT_EQ(balanceOf(y), "1000.00");
  EXPECT_EQ(store_->getAccountTransactions(x).size(), 2u * kRounds);
}

TEST_F(TransferEngineTest, DisjointPairsProceedInParallel) {
  std::vector<std::pair<std::string, std::string>> pairs;
  for (int i = 0; i < 4; ++i) {
    pairs.emplace_back(openAccount("100.00"), openAccount());
  }

  std::vector<std::thread> threads;
  for (const auto& pair : pairs) {
    threads.emplace_back([&, pair] {
      for (int i = 0; i < 50; ++i) {
        EXPECT_TRUE(engine_->transfer(pair.first, pair.second, "2.00").ok());
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  for (const auto& pair : pairs) {
    EXPECT_EQ(balanceOf(pair.first), "0.00");
    EXPECT_EQ(balanceOf(pair.second), "100.00");
  }
}

TEST(TransferEngineConstructionTest, RequiresAStore) {
  MetricsCollector metrics;
  EXPECT_THROW(TransferEngine(nullptr, metrics), std::invalid_argument);
}
