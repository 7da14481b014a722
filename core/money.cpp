#include "core/money.hpp"

#include <limits>
#include <stdexcept>

namespace ledger {
namespace core {

namespace {

constexpr std::int64_t kMaxCents = std::numeric_limits<std::int64_t>::max();
constexpr std::int64_t kMinCents = std::numeric_limits<std::int64_t>::min();

bool isDigit(char c) {
  return c >= '0' && c <= '9';
}

}  // namespace

std::optional<Money> Money::parse(const std::string& text) {
  if (text.empty() || !isDigit(text.front())) {
    return std::nullopt;
  }

  std::int64_t whole = 0;
  size_t pos = 0;
  while (pos < text.size() && isDigit(text[pos])) {
    int digit = text[pos] - '0';
    if (whole > (kMaxCents / kCentsPerUnit - digit) / 10) {
      return std::nullopt;
    }
    whole = whole * 10 + digit;
    ++pos;
  }

  std::int64_t fraction = 0;
  if (pos < text.size()) {
    if (text[pos] != '.') {
      return std::nullopt;
    }
    ++pos;

    size_t digits = 0;
    while (pos < text.size() && isDigit(text[pos])) {
      if (++digits > static_cast<size_t>(kScale)) {
        return std::nullopt;
      }
      fraction = fraction * 10 + (text[pos] - '0');
      ++pos;
    }
    if (digits == 0 || pos != text.size()) {
      return std::nullopt;
    }
    if (digits == 1) {
      fraction *= 10;
    }
  }

  // whole <= (max / 100) guarantees whole * 100 fits; check the fraction on top.
  std::int64_t scaled = whole * kCentsPerUnit;
  if (scaled > kMaxCents - fraction) {
    return std::nullopt;
  }
  return Money(scaled + fraction);
}

Money Money::add(const Money& other) const {
  if ((other.cents_ > 0 && cents_ > kMaxCents - other.cents_) ||
      (other.cents_ < 0 && cents_ < kMinCents - other.cents_)) {
    throw std::overflow_error("money addition overflow");
  }
  return Money(cents_ + other.cents_);
}

Money Money::subtract(const Money& other) const {
  if ((other.cents_ < 0 && cents_ > kMaxCents + other.cents_) ||
      (other.cents_ > 0 && cents_ < kMinCents + other.cents_)) {
    throw std::overflow_error("money subtraction overflow");
  }
  return Money(cents_ - other.cents_);
}

std::string Money::toString() const {
  // Work in unsigned space so that INT64_MIN has a magnitude.
  bool negative = cents_ < 0;
  std::uint64_t magnitude = negative
      ? static_cast<std::uint64_t>(-(cents_ + 1)) + 1
      : static_cast<std::uint64_t>(cents_);

  std::uint64_t whole = magnitude / kCentsPerUnit;
  std::uint64_t fraction = magnitude % kCentsPerUnit;

  std::string result;
  if (negative) {
    result += '-';
  }
  result += std::to_string(whole);
  result += '.';
  result += static_cast<char>('0' + fraction / 10);
  result += static_cast<char>('0' + fraction % 10);
  return result;
}

}  // namespace core
}  // namespace ledger
