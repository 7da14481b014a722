#include "core/ledger_types.hpp"

namespace ledger {
namespace core {

const char* errorCodeName(LedgerError error) {
  switch (error) {
    case LedgerError::INVALID_AMOUNT: return "INVALID_AMOUNT";
    case LedgerError::SAME_ACCOUNT: return "SAME_ACCOUNT";
    case LedgerError::ACCOUNT_NOT_FOUND: return "ACCOUNT_NOT_FOUND";
    case LedgerError::INSUFFICIENT_FUNDS: return "INSUFFICIENT_FUNDS";
    case LedgerError::STORAGE_UNAVAILABLE: return "STORAGE_UNAVAILABLE";
    default: return "UNKNOWN";
  }
}

}  // namespace core
}  // namespace ledger
