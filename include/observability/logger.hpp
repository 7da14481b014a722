#ifndef LEDGER_OBSERVABILITY_LOGGER_HPP_
#define LEDGER_OBSERVABILITY_LOGGER_HPP_

#include <atomic>
#include <cstdint>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace ledger {
namespace observability {

/**
 * Log levels for structured logging.
 */
enum class LogLevel {
  DEBUG,
  INFO,
  WARN,
  ERROR,
  FATAL
};

/**
 * Parse "debug", "INFO", "warn"... (case-insensitive). nullopt when unknown.
 */
std::optional<LogLevel> parseLogLevel(const std::string& text);

/**
 * Structured logger writing one JSON object per line.
 * Thread-safe and supports correlation IDs for request tracing.
 */
class Logger {
 public:
  static Logger& getInstance();

  // Non-copyable
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;

  // Set output stream (default: std::cout)
  void setOutputStream(std::ostream& stream);

  void debug(const std::string& message,
             const std::string& component = "",
             const std::string& correlation_id = "");

  void info(const std::string& message,
            const std::string& component = "",
            const std::string& correlation_id = "");

  void warn(const std::string& message,
            const std::string& component = "",
            const std::string& correlation_id = "");

  void error(const std::string& message,
             const std::string& component = "",
             const std::string& correlation_id = "");

  void fatal(const std::string& message,
             const std::string& component = "",
             const std::string& correlation_id = "");

  /**
   * Collects key-value fields and writes a single entry when destroyed:
   *
   *   LEDGER_LOG_EVENT(LogLevel::INFO, "transfer committed")
   *       .field("transaction_id", record.id)
   *       .field("amount", record.amount.toString());
   */
  class LogBuilder {
   public:
    LogBuilder(LogLevel level, const std::string& message,
               const std::string& component = "",
               const std::string& correlation_id = "");

    ~LogBuilder();

    LogBuilder& field(const std::string& key, const std::string& value);
    LogBuilder& field(const std::string& key, const char* value);
    LogBuilder& field(const std::string& key, std::int64_t value);
    LogBuilder& field(const std::string& key, int value);
    LogBuilder& field(const std::string& key, double value);
    LogBuilder& field(const std::string& key, bool value);

   private:
    LogLevel level_;
    std::string message_;
    std::string component_;
    std::string correlation_id_;
    std::map<std::string, std::string> fields_;
  };

 private:
  Logger();
  ~Logger() = default;

  void log(LogLevel level, const std::string& message,
           const std::string& component,
           const std::string& correlation_id,
           const std::map<std::string, std::string>& fields = {});

  std::string levelToString(LogLevel level) const;
  std::string getCurrentTimestamp() const;
  std::string getThreadId() const;

  std::atomic<LogLevel> min_level_;
  std::ostream* output_stream_;
  mutable std::mutex mutex_;
};

/**
 * JSON string literal for `value`, quotes included.
 */
std::string jsonQuote(const std::string& value);

// Convenience macros; the calling function becomes the component.
#define LEDGER_LOG_DEBUG(msg) ledger::observability::Logger::getInstance().debug(msg, __func__)
#define LEDGER_LOG_INFO(msg) ledger::observability::Logger::getInstance().info(msg, __func__)
#define LEDGER_LOG_WARN(msg) ledger::observability::Logger::getInstance().warn(msg, __func__)
#define LEDGER_LOG_ERROR(msg) ledger::observability::Logger::getInstance().error(msg, __func__)
#define LEDGER_LOG_FATAL(msg) ledger::observability::Logger::getInstance().fatal(msg, __func__)

// Structured logging helper
#define LEDGER_LOG_EVENT(level, msg) \
  ledger::observability::Logger::LogBuilder(level, msg, __func__)

}  // namespace observability
}  // namespace ledger

#endif  // LEDGER_OBSERVABILITY_LOGGER_HPP_
