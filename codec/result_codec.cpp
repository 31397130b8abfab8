#include "codec/result_codec.hpp"

#include "core/calendar.hpp"

namespace ledger {
namespace codec {

namespace {

nlohmann::json optionalString(const std::optional<std::string>& value) {
  if (!value) return nullptr;
  return *value;
}

}  // namespace

nlohmann::json toJson(const Account& account) {
  nlohmann::json j;
  j["id"] = account.id;
  j["account_holder_id"] = account.account_holder_id;
  j["account_type"] = toString(account.account_type);
  j["account_number"] = account.account_number;
  j["currency"] = account.currency;
  j["is_active"] = account.is_active;
  j["cached_balance"] = account.cached_balance;
  j["created_at"] = core::formatTimestamp(account.created_at);
  return j;
}

nlohmann::json toJson(const Card& card) {
  nlohmann::json j;
  j["id"] = card.id;
  j["account_id"] = card.account_id;
  j["last_four"] = card.last_four;
  j["expiration_month"] = card.expiration_month;
  j["expiration_year"] = card.expiration_year;
  j["is_active"] = card.is_active;
  j["created_at"] = core::formatTimestamp(card.created_at);
  return j;
}

nlohmann::json toJson(const Transaction& txn) {
  nlohmann::json j;
  j["id"] = txn.id;
  j["type"] = toString(txn.type);
  j["amount"] = txn.amount;
  j["from_account_id"] = optionalString(txn.from_account_id);
  j["to_account_id"] = optionalString(txn.to_account_id);
  j["status"] = toString(txn.status);
  j["description"] = txn.description;
  j["transfer_pair_id"] = optionalString(txn.transfer_pair_id);
  j["card_id"] = optionalString(txn.card_id);
  j["created_at"] = core::formatTimestamp(txn.created_at);
  return j;
}

nlohmann::json toJson(const TransactionResult& result) {
  nlohmann::json j;
  j["outcome"] = toString(result.outcome);
  j["transaction"] = toJson(result.transaction);
  j["available_balance"] = result.available_balance;
  return j;
}

nlohmann::json toJson(const TransferResult& result) {
  nlohmann::json j;
  j["outcome"] = toString(result.outcome);
  if (result.transfer_pair_id.empty()) {
    j["transfer_pair_id"] = nullptr;
  } else {
    j["transfer_pair_id"] = result.transfer_pair_id;
  }
  j["debit"] = toJson(result.debit);
  j["credit"] = result.credit ? toJson(*result.credit) : nlohmann::json(nullptr);
  j["available_balance"] = result.available_balance;
  return j;
}

nlohmann::json toJson(const IntegrityReport& report) {
  nlohmann::json j;
  j["account_id"] = report.account_id;
  j["cached_balance"] = report.cached_balance;
  j["computed_balance"] = report.computed_balance;
  j["match"] = report.match;
  j["currency"] = report.currency;
  return j;
}

nlohmann::json toJson(const StatementView& statement) {
  nlohmann::json j;
  j["account_id"] = statement.account_id;
  j["year"] = statement.year;
  j["month"] = statement.month;
  j["opening_balance"] = statement.opening_balance;
  j["closing_balance"] = statement.closing_balance;
  j["total_credits"] = statement.total_credits;
  j["total_debits"] = statement.total_debits;
  j["transactions"] = toJson(statement.transactions);
  return j;
}

nlohmann::json errorToJson(const LedgerError& error) {
  nlohmann::json j;
  j["error"] = toString(error.kind());
  j["message"] = error.what();
  auto systemic = dynamic_cast<const SystemicError*>(&error);
  j["retryable"] = systemic != nullptr && systemic->retryable();
  return j;
}

}  // namespace codec
}  // namespace ledger
