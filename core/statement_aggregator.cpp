#include "core/statement_aggregator.hpp"

#include "core/calendar.hpp"
#include "core/identifiers.hpp"
#include "core/validation.hpp"
#include "errors.hpp"
#include "observability/metrics.hpp"

namespace ledger {
namespace core {

StatementAggregator::StatementAggregator(LedgerStore& store, const BalanceEvaluator& evaluator)
    : store_(store), evaluator_(evaluator) {
}

StatementView StatementAggregator::statement(const std::string& account_holder_id,
                                             const std::string& requested_account_id,
                                             std::optional<int> year,
                                             std::optional<int> month) const {
  const std::string account_id = canonicalId(requested_account_id);
  if (!year || !month) {
    throw ValidationError("Both year and month are required");
  }
  if (*month < 1 || *month > 12) {
    throw ValidationError("Month must be between 1 and 12");
  }
  if (*year < kMinStatementYear || *year > kMaxStatementYear) {
    throw ValidationError("Year must be between " + std::to_string(kMinStatementYear) + " and " +
                          std::to_string(kMaxStatementYear));
  }

  observability::MetricsCollector::Timer timer(observability::getGlobalMetrics(),
                                               observability::kStatementSeconds);

  auto uow = store_.begin();
  const Account account = requireAccount(uow->findAccount(account_id), account_id);
  requireOwner(account, account_holder_id);

  const Timestamp period_start = monthStart(*year, *month);

  TransactionFilter period;
  period.account_id = account_id;
  period.since = period_start;
  period.until = nextMonthStart(*year, *month);

  const Cents opening = evaluator_.computeBalance(*uow, account_id, period_start);
  StatementView view = aggregate(account_id, *year, *month, opening, uow->transactions(period));
  uow->rollback();
  return view;
}

StatementView StatementAggregator::aggregate(const std::string& account_id, int year, int month,
                                             Cents opening, std::vector<Transaction> period) {
  StatementView view;
  view.account_id = account_id;
  view.year = year;
  view.month = month;
  view.opening_balance = opening;

  for (const auto& txn : period) {
    if (txn.status != TransactionStatus::APPROVED) continue;
    if (txn.type == TransactionType::CREDIT && txn.to_account_id == account_id) {
      view.total_credits += txn.amount;
    } else if (txn.type == TransactionType::DEBIT && txn.from_account_id == account_id) {
      view.total_debits += txn.amount;
    }
  }

  view.closing_balance = view.opening_balance + view.total_credits - view.total_debits;
  view.transactions = std::move(period);
  return view;
}

}  // namespace core
}  // namespace ledger
