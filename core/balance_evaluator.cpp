#include "core/balance_evaluator.hpp"

#include "core/identifiers.hpp"
#include "errors.hpp"

namespace ledger {
namespace core {

BalanceEvaluator::BalanceEvaluator(LedgerStore& store) : store_(store) {
}

Cents BalanceEvaluator::computeBalance(UnitOfWork& uow, const std::string& account_id,
                                       std::optional<Timestamp> before) const {
  TransactionFilter filter;
  filter.account_id = account_id;
  filter.status = TransactionStatus::APPROVED;
  filter.until = before;
  return foldBalance(account_id, uow.transactions(filter));
}

IntegrityReport BalanceEvaluator::checkIntegrity(const std::string& account_id) const {
  auto uow = store_.begin();
  auto account = uow->findAccount(canonicalId(account_id));
  if (!account) {
    throw NotFoundError("Account " + account_id + " not found");
  }
  IntegrityReport report = checkIntegrity(*uow, *account);
  uow->rollback();
  return report;
}

IntegrityReport BalanceEvaluator::checkIntegrity(UnitOfWork& uow, const Account& account) const {
  IntegrityReport report;
  report.account_id = account.id;
  report.cached_balance = account.cached_balance;
  report.computed_balance = computeBalance(uow, account.id);
  report.match = report.cached_balance == report.computed_balance;
  report.currency = account.currency;
  return report;
}

Cents BalanceEvaluator::foldBalance(const std::string& account_id,
                                    const std::vector<Transaction>& history) {
  Cents balance = 0;
  for (const auto& txn : history) {
    if (txn.status != TransactionStatus::APPROVED) continue;
    if (txn.type == TransactionType::CREDIT && txn.to_account_id == account_id) {
      balance += txn.amount;
    } else if (txn.type == TransactionType::DEBIT && txn.from_account_id == account_id) {
      balance -= txn.amount;
    }
  }
  return balance;
}

}  // namespace core
}  // namespace ledger
