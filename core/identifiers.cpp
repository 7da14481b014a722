#include "core/identifiers.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace ledger {
namespace core {

namespace {

std::mt19937_64& threadRng() {
  thread_local std::mt19937_64 rng(
      (static_cast<std::uint64_t>(std::random_device{}()) << 32) ^
      static_cast<std::uint64_t>(
          std::chrono::high_resolution_clock::now().time_since_epoch().count()));
  return rng;
}

bool isHex(char c) {
  return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

}  // namespace

std::string generateId() {
  static const char* hex = "0123456789abcdef";

  std::uint64_t high = threadRng()();
  std::uint64_t low = threadRng()();

  // Version 4 in the time_hi nibble, RFC 4122 variant in clock_seq.
  high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  std::string id;
  id.reserve(36);
  for (int i = 15; i >= 0; --i) {
    std::uint64_t word = i >= 8 ? high : low;
    int shift = (i % 8) * 8;
    unsigned byte = static_cast<unsigned>((word >> shift) & 0xFF);
    id.push_back(hex[byte >> 4]);
    id.push_back(hex[byte & 0xF]);
    size_t len = id.size();
    if (len == 8 || len == 13 || len == 18 || len == 23) {
      id.push_back('-');
    }
  }
  return id;
}

bool isWellFormedId(const std::string& id) {
  if (id.size() != 36) return false;
  for (size_t i = 0; i < id.size(); ++i) {
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (id[i] != '-') return false;
    } else if (!isHex(id[i])) {
      return false;
    }
  }
  return true;
}

std::string normalizeId(const std::string& id) {
  std::string normalized = id;
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return normalized;
}

std::string formatUtcTimestamp(std::chrono::system_clock::time_point time) {
  auto time_t = std::chrono::system_clock::to_time_t(time);
  auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(
      time.time_since_epoch()) % 1000000;

  std::tm utc{};
  gmtime_r(&time_t, &utc);

  std::stringstream ss;
  ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
     << "." << std::setfill('0') << std::setw(6) << microseconds.count() << "Z";
  return ss.str();
}

std::string currentUtcTimestamp() {
  return formatUtcTimestamp(std::chrono::system_clock::now());
}

}  // namespace core
}  // namespace ledger
