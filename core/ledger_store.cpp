#include "core/ledger_store.hpp"

namespace ledger {
namespace core {

std::pair<std::optional<Account>, std::optional<Account>> lockAccountsInOrder(
    LedgerSession& session, const std::string& first_id, const std::string& second_id) {
  if (second_id < first_id) {
    auto second = session.getForUpdate(second_id);
    auto first = session.getForUpdate(first_id);
    return {std::move(first), std::move(second)};
  }

  auto first = session.getForUpdate(first_id);
  auto second = session.getForUpdate(second_id);
  return {std::move(first), std::move(second)};
}

}  // namespace core
}  // namespace ledger
