#include "config/server_config.hpp"
#include "core/identifiers.hpp"
#include "core/transfer_engine.hpp"
#include "database/connection_pool.hpp"
#include "database/postgres_ledger_store.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cstdlib>
#include <thread>
#include <vector>

using namespace ledger::core;
using ledger::database::ConnectionPool;
using ledger::database::PostgresConnection;
using ledger::database::PostgresLedgerStore;

// Runs against a live database only when LEDGER_TEST_DATABASE_URL is set, e.g.
//   LEDGER_TEST_DATABASE_URL=postgresql://postgres@localhost/bank_db_test
class PostgresStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const char* url = std::getenv("LEDGER_TEST_DATABASE_URL");
    if (!url || !*url) {
      GTEST_SKIP() << "LEDGER_TEST_DATABASE_URL not set";
    }

    PostgresConnection::Config config;
    config.conninfo = url;
    pool_ = std::make_shared<ConnectionPool>(config, 4);
    ASSERT_TRUE(pool_->initialize());

    store_ = std::make_shared<PostgresLedgerStore>(pool_);
    ASSERT_TRUE(store_->initializeSchema(LEDGER_DEFAULT_SCHEMA_PATH));

    engine_ = std::make_unique<TransferEngine>(store_, metrics_);

    auto user = store_->createUser("pg_test_" + generateId());
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

  ledger::observability::MetricsCollector metrics_;
  std::shared_ptr<ConnectionPool> pool_;
  std::shared_ptr<PostgresLedgerStore> store_;
  std::unique_ptr<TransferEngine> engine_;
  std::string user_id_;
};

TEST_F(PostgresStoreTest, DirectoryOperations) {
  auto user = store_->getUser(user_id_);
  ASSERT_TRUE(user.has_value());
  EXPECT_FALSE(store_->createUser(user->username).has_value());

  std::string id = openAccount();
  auto account = store_->getAccount(id);
  ASSERT_TRUE(account.has_value());
  EXPECT_EQ(account->user_id, user_id_);
  EXPECT_EQ(account->balance.toString(), "0.00");
  EXPECT_EQ(account->created_at.size(), std::string("2024-01-31T09:15:02.000123Z").size());

  EXPECT_EQ(store_->getUserAccounts(user_id_).size(), 1u);
  EXPECT_FALSE(store_->createAccount(generateId()).has_value());
  EXPECT_FALSE(store_->getAccount("not-a-uuid").has_value());
}

TEST_F(PostgresStoreTest, TransferCommitsBalancesAndRecordTogether) {
  std::string a = openAccount("1000.00");
  std::string b = openAccount();

  auto outcome = engine_->transfer(a, b, "250.50");
  ASSERT_TRUE(outcome.ok()) << outcome.message();
  EXPECT_EQ(balanceOf(a), "749.50");
  EXPECT_EQ(balanceOf(b), "250.50");

  auto history = store_->getAccountTransactions(b);
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0].id, outcome.value().id);
  EXPECT_EQ(history[0].amount.toString(), "250.50");
}

TEST_F(PostgresStoreTest, RejectedTransfersLeaveNoRecord) {
  std::string a = openAccount("10.00");
  std::string b = openAccount();

  EXPECT_EQ(engine_->transfer(a, b, "10.01").error(), LedgerError::INSUFFICIENT_FUNDS);
  EXPECT_EQ(engine_->transfer(a, generateId(), "1.00").error(), LedgerError::ACCOUNT_NOT_FOUND);
  EXPECT_EQ(balanceOf(a), "10.00");
  EXPECT_TRUE(store_->getAccountTransactions(a).empty());
}

TEST_F(PostgresStoreTest, UncommittedSessionRollsBack) {
  std::string a = openAccount("5.00");
  {
    auto session = store_->beginSession();
    ASSERT_TRUE(session->getForUpdate(a).has_value());
    session->updateBalance(a, Money::fromCents(1));
  }
  EXPECT_EQ(balanceOf(a), "5.00");
}

TEST_F(PostgresStoreTest, ConcurrentDebitsNeverOverdraw) {
  std::string source = openAccount("50.00");
  std::string sink = openAccount();

  std::atomic<int> succeeded{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      if (engine_->transfer(source, sink, "10.00").ok()) ++succeeded;
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_EQ(succeeded.load(), 5);
  EXPECT_EQ(balanceOf(source), "0.00");
  EXPECT_EQ(balanceOf(sink), "50.00");
}

TEST_F(PostgresStoreTest, OpposingTransfersDoNotDeadlock) {
  std::string x = openAccount("100.00");
  std::string y = openAccount("100.00");

  std::atomic<int> failures{0};
  std::thread forward([&] {
    for (int i = 0; i < 50; ++i) {
      if (!engine_->transfer(x, y, "1.00").ok()) ++failures;
    }
  });
  std::thread backward([&] {
    for (int i = 0; i < 50; ++i) {
      if (!engine_->transfer(y, x, "1.00").ok()) ++failures;
    }
  });
  forward.join();
  backward.join();

  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(balanceOf(x), "100.00");
  EXPECT_EQ(balanceOf(y), "100.00");
}
