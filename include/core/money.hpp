#ifndef LEDGER_CORE_MONEY_HPP_
#define LEDGER_CORE_MONEY_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace ledger {
namespace core {

/**
 * Exact decimal amount with two fractional digits, stored as integer cents.
 *
 * Values never pass through binary floating point: they are parsed from and
 * rendered to decimal text. Arithmetic is exact and throws std::overflow_error
 * when the result leaves the int64 range.
 */
class Money {
 public:
  static constexpr int kScale = 2;
  static constexpr std::int64_t kCentsPerUnit = 100;

  Money() : cents_(0) {}

  static Money fromCents(std::int64_t cents) { return Money(cents); }
  static Money zero() { return Money(0); }

  /**
   * Parse non-negative decimal text such as "250.50", "7" or "0.5".
   * Returns nullopt for signs, exponents, whitespace, more than two fractional
   * digits, or magnitudes that do not fit in int64 cents.
   */
  static std::optional<Money> parse(const std::string& text);

  std::int64_t cents() const { return cents_; }

  Money add(const Money& other) const;
  Money subtract(const Money& other) const;

  bool isPositive() const { return cents_ > 0; }
  bool isNonNegative() const { return cents_ >= 0; }

  /**
   * Decimal text with exactly two fractional digits, e.g. "749.50" or "-0.25".
   */
  std::string toString() const;

  Money operator+(const Money& other) const { return add(other); }
  Money operator-(const Money& other) const { return subtract(other); }

  bool operator==(const Money& other) const { return cents_ == other.cents_; }
  bool operator!=(const Money& other) const { return cents_ != other.cents_; }
  bool operator<(const Money& other) const { return cents_ < other.cents_; }
  bool operator<=(const Money& other) const { return cents_ <= other.cents_; }
  bool operator>(const Money& other) const { return cents_ > other.cents_; }
  bool operator>=(const Money& other) const { return cents_ >= other.cents_; }

 private:
  explicit Money(std::int64_t cents) : cents_(cents) {}

  std::int64_t cents_;
};

}  // namespace core
}  // namespace ledger

#endif  // LEDGER_CORE_MONEY_HPP_
