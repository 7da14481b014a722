#include "observability/logger.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <sstream>
#include <string>
#include <vector>

using ledger::observability::Logger;
using ledger::observability::LogLevel;

class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    previous_level_ = Logger::getInstance().getLogLevel();
    Logger::getInstance().setOutputStream(output_);
    Logger::getInstance().setLogLevel(LogLevel::DEBUG);
  }

  void TearDown() override {
    Logger::getInstance().setOutputStream(std::cout);
    Logger::getInstance().setLogLevel(previous_level_);
  }

  std::vector<nlohmann::json> entries() {
    std::vector<nlohmann::json> parsed;
    std::istringstream lines(output_.str());
    std::string line;
    while (std::getline(lines, line)) {
      parsed.push_back(nlohmann::json::parse(line));
    }
    return parsed;
  }

  std::ostringstream output_;
  LogLevel previous_level_ = LogLevel::INFO;
};

TEST_F(LoggerTest, WritesOneJsonObjectPerLine) {
  LEDGER_LOG_INFO("transfer committed");
  LEDGER_LOG_WARN("second line");

  auto logged = entries();
  ASSERT_EQ(logged.size(), 2u);
  EXPECT_EQ(logged[0]["level"].get<std::string>(), "INFO");
  EXPECT_EQ(logged[0]["message"].get<std::string>(), "transfer committed");
  EXPECT_EQ(logged[0]["component"].get<std::string>(), "TestBody");
  EXPECT_TRUE(logged[0].contains("timestamp"));
  EXPECT_TRUE(logged[0].contains("thread"));
  EXPECT_EQ(logged[1]["level"].get<std::string>(), "WARN");
}

TEST_F(LoggerTest, EscapesQuotesAndControlCharacters) {
  LEDGER_LOG_ERROR("bad \"input\"\nwith\ttabs \\ and \x01");

  auto logged = entries();
  ASSERT_EQ(logged.size(), 1u);
  EXPECT_EQ(logged[0]["message"].get<std::string>(), "bad \"input\"\nwith\ttabs \\ and \x01");
}

TEST_F(LoggerTest, StructuredFieldsKeepTheirTypes) {
  LEDGER_LOG_EVENT(LogLevel::INFO, "funding committed")
      .field("account_id", "abc")
      .field("attempt", 3)
      .field("total", static_cast<std::int64_t>(1) << 40)
      .field("ratio", 0.5)
      .field("retryable", false);

  auto logged = entries();
  ASSERT_EQ(logged.size(), 1u);
  EXPECT_EQ(logged[0]["account_id"].get<std::string>(), "abc");
  EXPECT_EQ(logged[0]["attempt"].get<int>(), 3);
  EXPECT_EQ(logged[0]["total"].get<std::int64_t>(), static_cast<std::int64_t>(1) << 40);
  EXPECT_DOUBLE_EQ(logged[0]["ratio"].get<double>(), 0.5);
  EXPECT_FALSE(logged[0]["retryable"].get<bool>());
}

TEST_F(LoggerTest, EntriesBelowTheLevelAreDropped) {
  Logger::getInstance().setLogLevel(LogLevel::WARN);
  LEDGER_LOG_DEBUG("dropped");
  LEDGER_LOG_INFO("dropped");
  LEDGER_LOG_ERROR("kept");

  auto logged = entries();
  ASSERT_EQ(logged.size(), 1u);
  EXPECT_EQ(logged[0]["message"].get<std::string>(), "kept");
}

TEST(LogLevelTest, ParsesNamesCaseInsensitively) {
  using ledger::observability::parseLogLevel;
  EXPECT_EQ(parseLogLevel("debug"), LogLevel::DEBUG);
  EXPECT_EQ(parseLogLevel("Info"), LogLevel::INFO);
  EXPECT_EQ(parseLogLevel("WARNING"), LogLevel::WARN);
  EXPECT_EQ(parseLogLevel("error"), LogLevel::ERROR);
  EXPECT_FALSE(parseLogLevel("verbose").has_value());
}

TEST(JsonQuoteTest, ProducesValidJsonStrings) {
  using ledger::observability::jsonQuote;
  EXPECT_EQ(jsonQuote("plain"), "\"plain\"");
  EXPECT_EQ(jsonQuote("a\"b"), "\"a\\\"b\"");
  EXPECT_EQ(nlohmann::json::parse(jsonQuote("line\nbreak")).get<std::string>(), "line\nbreak");
}
