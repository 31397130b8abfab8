#ifndef LEDGER_CORE_STATEMENT_AGGREGATOR_HPP_
#define LEDGER_CORE_STATEMENT_AGGREGATOR_HPP_

#include "core/balance_evaluator.hpp"
#include "ledger_store.hpp"

#include <optional>
#include <string>

namespace ledger {
namespace core {

constexpr int kMinStatementYear = 2000;
constexpr int kMaxStatementYear = 2100;

/**
 * Builds monthly statements from the transaction log. Read-only.
 */
class StatementAggregator {
 public:
  StatementAggregator(LedgerStore& store, const BalanceEvaluator& evaluator);

  /**
   * Statement for the UTC calendar month (`year`, `month`).
   *
   * Opening balance counts approved entries strictly before the month.
   * The listing holds every entry of the month, declined ones included,
   * oldest first; totals count approved entries only.
   *
   * Throws ValidationError when year or month is missing or out of range,
   * NotFoundError / UnauthorizedError for the account.
   */
  StatementView statement(const std::string& account_holder_id,
                          const std::string& account_id,
                          std::optional<int> year,
                          std::optional<int> month) const;

  /**
   * Aggregates an already fetched period listing on top of `opening`.
   */
  static StatementView aggregate(const std::string& account_id, int year, int month,
                                 Cents opening, std::vector<Transaction> period);

 private:
  LedgerStore& store_;
  const BalanceEvaluator& evaluator_;
};

}  // namespace core
}  // namespace ledger

#endif  // LEDGER_CORE_STATEMENT_AGGREGATOR_HPP_
