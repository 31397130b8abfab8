#include "ledger_types.hpp"

namespace ledger {

Clock systemClock() {
  return []() {
    return std::chrono::time_point_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now());
  };
}

bool Transaction::touches(const std::string& account_id) const {
  return (from_account_id && *from_account_id == account_id) ||
         (to_account_id && *to_account_id == account_id);
}

bool TransactionFilter::matches(const Transaction& txn) const {
  if (account_id && !txn.touches(*account_id)) return false;
  if (status && txn.status != *status) return false;
  if (type && txn.type != *type) return false;
  if (transfer_pair_id && txn.transfer_pair_id != transfer_pair_id) return false;
  if (since && txn.created_at < *since) return false;
  if (until && txn.created_at >= *until) return false;
  return true;
}

std::string toString(AccountType type) {
  switch (type) {
    case AccountType::CHECKING: return "checking";
    case AccountType::SAVINGS: return "savings";
  }
  return "unknown";
}

std::string toString(TransactionType type) {
  switch (type) {
    case TransactionType::CREDIT: return "credit";
    case TransactionType::DEBIT: return "debit";
  }
  return "unknown";
}

std::string toString(TransactionStatus status) {
  switch (status) {
    case TransactionStatus::APPROVED: return "approved";
    case TransactionStatus::DECLINED: return "declined";
  }
  return "unknown";
}

std::string toString(Outcome outcome) {
  switch (outcome) {
    case Outcome::APPROVED: return "approved";
    case Outcome::DECLINED: return "declined";
  }
  return "unknown";
}

std::optional<AccountType> parseAccountType(const std::string& name) {
  if (name == "checking") return AccountType::CHECKING;
  if (name == "savings") return AccountType::SAVINGS;
  return std::nullopt;
}

std::optional<TransactionType> parseTransactionType(const std::string& name) {
  if (name == "credit") return TransactionType::CREDIT;
  if (name == "debit") return TransactionType::DEBIT;
  return std::nullopt;
}

std::optional<TransactionStatus> parseTransactionStatus(const std::string& name) {
  if (name == "approved") return TransactionStatus::APPROVED;
  if (name == "declined") return TransactionStatus::DECLINED;
  return std::nullopt;
}

}  // namespace ledger
