#ifndef LEDGER_CORE_LEDGER_TYPES_HPP_
#define LEDGER_CORE_LEDGER_TYPES_HPP_

#include "core/money.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace ledger {
namespace core {

struct User {
  std::string id;
  std::string username;
};

/**
 * Balance-holding record owned by exactly one user.
 */
struct Account {
  std::string id;
  std::string user_id;
  Money balance;
  std::string created_at;
};

/**
 * Immutable fact of one completed transfer.
 */
struct TransactionRecord {
  std::string id;
  std::string from_account;
  std::string to_account;
  Money amount;
  std::string created_at;
};

/**
 * Typed failures surfaced by the transfer engine and the funding operation.
 */
enum class LedgerError {
  INVALID_AMOUNT,
  SAME_ACCOUNT,
  ACCOUNT_NOT_FOUND,
  INSUFFICIENT_FUNDS,
  STORAGE_UNAVAILABLE
};

/**
 * Stable wire name of an error kind, e.g. "INSUFFICIENT_FUNDS".
 */
const char* errorCodeName(LedgerError error);

/**
 * Only STORAGE_UNAVAILABLE may be retried with the same input.
 */
inline bool isRetryable(LedgerError error) {
  return error == LedgerError::STORAGE_UNAVAILABLE;
}

/**
 * Result of a ledger operation: either a value or a typed error with a message.
 */
template <typename T>
class Outcome {
 public:
  static Outcome success(T value) {
    Outcome outcome;
    outcome.value_ = std::move(value);
    return outcome;
  }

  static Outcome failure(LedgerError error, std::string message) {
    Outcome outcome;
    outcome.error_ = error;
    outcome.message_ = std::move(message);
    return outcome;
  }

  bool ok() const { return value_.has_value(); }
  explicit operator bool() const { return ok(); }

  const T& value() const { return *value_; }
  LedgerError error() const { return error_; }
  const std::string& message() const { return message_; }

 private:
  Outcome() = default;

  std::optional<T> value_;
  LedgerError error_ = LedgerError::STORAGE_UNAVAILABLE;
  std::string message_;
};

/**
 * Raised by store implementations when the persistence layer cannot complete
 * an operation (connection loss, failed statement, deadlock abort).
 */
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace core
}  // namespace ledger

#endif  // LEDGER_CORE_LEDGER_TYPES_HPP_
