#ifndef LEDGER_CODEC_RESULT_CODEC_HPP_
#define LEDGER_CODEC_RESULT_CODEC_HPP_

#include "errors.hpp"
#include "ledger_types.hpp"

#include <nlohmann/json.hpp>

#include <vector>

namespace ledger {
namespace codec {

// JSON views of ledger values. Amounts stay integer minor units;
// timestamps are ISO-8601 UTC strings. Absent optionals encode as null.

nlohmann::json toJson(const Account& account);
nlohmann::json toJson(const Card& card);
nlohmann::json toJson(const Transaction& txn);
nlohmann::json toJson(const TransactionResult& result);
nlohmann::json toJson(const TransferResult& result);
nlohmann::json toJson(const IntegrityReport& report);
nlohmann::json toJson(const StatementView& statement);

template <typename T>
nlohmann::json toJson(const std::vector<T>& items) {
  nlohmann::json array = nlohmann::json::array();
  for (const auto& item : items) {
    array.push_back(toJson(item));
  }
  return array;
}

/**
 * {"error": "<kind>", "message": "...", "retryable": bool}
 */
nlohmann::json errorToJson(const LedgerError& error);

}  // namespace codec
}  // namespace ledger

#endif  // LEDGER_CODEC_RESULT_CODEC_HPP_
