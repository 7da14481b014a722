#include "observability/logger.hpp"

#include "core/identifiers.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <thread>

namespace ledger {
namespace observability {

std::optional<LogLevel> parseLogLevel(const std::string& text) {
  std::string upper = text;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  if (upper == "DEBUG") return LogLevel::DEBUG;
  if (upper == "INFO") return LogLevel::INFO;
  if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
  if (upper == "ERROR") return LogLevel::ERROR;
  if (upper == "FATAL") return LogLevel::FATAL;
  return std::nullopt;
}

std::string jsonQuote(const std::string& value) {
  std::stringstream ss;
  ss << '"';
  for (unsigned char c : value) {
    switch (c) {
      case '"': ss << "\\\""; break;
      case '\\': ss << "\\\\"; break;
      case '\n': ss << "\\n"; break;
      case '\r': ss << "\\r"; break;
      case '\t': ss << "\\t"; break;
      default:
        if (c < 0x20) {
          ss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
             << static_cast<int>(c) << std::dec;
        } else {
          ss << c;
        }
    }
  }
  ss << '"';
  return ss.str();
}

Logger& Logger::getInstance() {
  static Logger instance;
  return instance;
}

Logger::Logger() : min_level_(LogLevel::INFO), output_stream_(&std::cout) {}

void Logger::setLogLevel(LogLevel level) {
  min_level_ = level;
}

LogLevel Logger::getLogLevel() const {
  return min_level_;
}

void Logger::setOutputStream(std::ostream& stream) {
  std::lock_guard<std::mutex> lock(mutex_);
  output_stream_ = &stream;
}

void Logger::debug(const std::string& message, const std::string& component,
                   const std::string& correlation_id) {
  log(LogLevel::DEBUG, message, component, correlation_id);
}

void Logger::info(const std::string& message, const std::string& component,
                  const std::string& correlation_id) {
  log(LogLevel::INFO, message, component, correlation_id);
}

void Logger::warn(const std::string& message, const std::string& component,
                  const std::string& correlation_id) {
  log(LogLevel::WARN, message, component, correlation_id);
}

void Logger::error(const std::string& message, const std::string& component,
                   const std::string& correlation_id) {
  log(LogLevel::ERROR, message, component, correlation_id);
}

void Logger::fatal(const std::string& message, const std::string& component,
                   const std::string& correlation_id) {
  log(LogLevel::FATAL, message, component, correlation_id);
}

Logger::LogBuilder::LogBuilder(LogLevel level, const std::string& message,
                               const std::string& component,
                               const std::string& correlation_id)
    : level_(level), message_(message), component_(component),
      correlation_id_(correlation_id) {}

Logger::LogBuilder::~LogBuilder() {
  Logger::getInstance().log(level_, message_, component_, correlation_id_, fields_);
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, const std::string& value) {
  fields_[key] = jsonQuote(value);
  return *this;
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, const char* value) {
  return field(key, std::string(value ? value : ""));
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, std::int64_t value) {
  fields_[key] = std::to_string(value);
  return *this;
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, int value) {
  fields_[key] = std::to_string(value);
  return *this;
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, double value) {
  std::stringstream ss;
  ss << std::fixed << std::setprecision(6) << value;
  fields_[key] = ss.str();
  return *this;
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, bool value) {
  fields_[key] = value ? "true" : "false";
  return *this;
}

void Logger::log(LogLevel level, const std::string& message,
                 const std::string& component, const std::string& correlation_id,
                 const std::map<std::string, std::string>& fields) {
  if (level < min_level_.load()) return;

  std::stringstream ss;
  ss << "{";
  ss << "\"timestamp\":\"" << getCurrentTimestamp() << "\",";
  ss << "\"level\":\"" << levelToString(level) << "\",";
  ss << "\"thread\":\"" << getThreadId() << "\",";
  ss << "\"message\":" << jsonQuote(message);

  if (!component.empty()) {
    ss << ",\"component\":" << jsonQuote(component);
  }

  if (!correlation_id.empty()) {
    ss << ",\"correlation_id\":" << jsonQuote(correlation_id);
  }

  for (const auto& [key, value] : fields) {
    ss << "," << jsonQuote(key) << ":" << value;
  }

  ss << "}\n";

  std::lock_guard<std::mutex> lock(mutex_);
  *output_stream_ << ss.str();
  output_stream_->flush();
}

std::string Logger::levelToString(LogLevel level) const {
  switch (level) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO: return "INFO";
    case LogLevel::WARN: return "WARN";
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::FATAL: return "FATAL";
    default: return "UNKNOWN";
  }
}

std::string Logger::getCurrentTimestamp() const {
  return core::currentUtcTimestamp();
}

std::string Logger::getThreadId() const {
  std::stringstream ss;
  ss << std::this_thread::get_id();
  return ss.str();
}

}  // namespace observability
}  // namespace ledger
