#ifndef LEDGER_CORE_IDENTIFIERS_HPP_
#define LEDGER_CORE_IDENTIFIERS_HPP_

#include <chrono>
#include <string>

namespace ledger {
namespace core {

/**
 * Random version 4 UUID in canonical lowercase form.
 */
std::string generateId();

/**
 * True for canonical 8-4-4-4-12 hex UUID text (either case).
 */
bool isWellFormedId(const std::string& id);

/**
 * Lowercased copy of `id`; identifiers compare case-insensitively.
 */
std::string normalizeId(const std::string& id);

// ISO-8601 UTC with microseconds: 2024-01-31T09:15:02.000123Z
std::string formatUtcTimestamp(std::chrono::system_clock::time_point time);
std::string currentUtcTimestamp();

}  // namespace core
}  // namespace ledger

#endif  // LEDGER_CORE_IDENTIFIERS_HPP_
