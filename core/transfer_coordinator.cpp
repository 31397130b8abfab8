#include "core/transfer_coordinator.hpp"

#include "core/identifiers.hpp"
#include "core/lock_ordering.hpp"
#include "core/validation.hpp"
#include "errors.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <map>

namespace ledger {
namespace core {

using observability::LogLevel;

TransferCoordinator::TransferCoordinator(LedgerStore& store, const BalanceEvaluator& evaluator)
    : store_(store), evaluator_(evaluator) {
}

TransferResult TransferCoordinator::transfer(const std::string& account_holder_id,
                                             const std::string& requested_from_id,
                                             const std::string& requested_to_id,
                                             Cents amount,
                                             const std::string& description) {
  const std::string from_account_id = canonicalId(requested_from_id);
  const std::string to_account_id = canonicalId(requested_to_id);
  if (from_account_id == to_account_id) {
    throw ValidationError("Cannot transfer to the same account");
  }
  validateAmount(amount);
  validateDescription(description);

  auto& metrics = observability::getGlobalMetrics();
  observability::MetricsCollector::Timer timer(metrics, observability::kTransferSeconds);

  try {
    auto uow = store_.begin();
    TransferResult result =
        execute(*uow, account_holder_id, from_account_id, to_account_id, amount, description);
    uow->commit();

    if (result.outcome == Outcome::APPROVED) {
      metrics.incrementCounter(observability::kTransfersApproved);
      LEDGER_LOG_BUILDER(LogLevel::INFO, "Transfer approved")
          .field("transfer_pair_id", result.transfer_pair_id)
          .field("from_account_id", from_account_id)
          .field("to_account_id", to_account_id)
          .field("amount", amount);
    } else {
      metrics.incrementCounter(observability::kTransfersDeclined);
      LEDGER_LOG_BUILDER(LogLevel::WARN, "Transfer declined: insufficient funds")
          .field("transaction_id", result.debit.id)
          .field("from_account_id", from_account_id)
          .field("requested", amount)
          .field("available", result.available_balance);
    }
    return result;
  } catch (const SystemicError& e) {
    metrics.incrementCounter(observability::kSystemicFailures);
    LEDGER_LOG_BUILDER(LogLevel::ERROR, "Transfer rolled back")
        .field("from_account_id", from_account_id)
        .field("to_account_id", to_account_id)
        .field("retryable", e.retryable())
        .field("error", e.what());
    throw;
  }
}

TransferResult TransferCoordinator::execute(UnitOfWork& uow,
                                            const std::string& account_holder_id,
                                            const std::string& from_account_id,
                                            const std::string& to_account_id,
                                            Cents amount,
                                            const std::string& description) {
  std::map<std::string, std::optional<Account>> locked;
  for (auto& [id, account] : lockInOrder(std::vector<std::string>{from_account_id, to_account_id},
                                         [&uow](const std::string& account_id) {
                                           return uow.lockAccount(account_id);
                                         })) {
    locked[id] = std::move(account);
  }

  const Account source = requireAccount(locked[from_account_id], from_account_id);
  const Account destination = requireAccount(locked[to_account_id], to_account_id);
  requireOwner(source, account_holder_id);
  requireActive(source);
  requireActive(destination);

  TransferResult result;
  result.available_balance = evaluator_.computeBalance(uow, source.id);

  Transaction debit;
  debit.type = TransactionType::DEBIT;
  debit.amount = amount;
  debit.from_account_id = source.id;
  debit.description = description;

  if (amount > result.available_balance) {
    // The credit side never existed, so there is no pair to correlate.
    debit.status = TransactionStatus::DECLINED;
    result.outcome = Outcome::DECLINED;
    result.debit = uow.insertTransaction(debit);
    return result;
  }

  const Cents destination_balance = evaluator_.computeBalance(uow, destination.id);
  validateCreditHeadroom(destination_balance, amount);

  result.outcome = Outcome::APPROVED;
  result.transfer_pair_id = newUuid();

  debit.status = TransactionStatus::APPROVED;
  debit.transfer_pair_id = result.transfer_pair_id;

  Transaction credit;
  credit.type = TransactionType::CREDIT;
  credit.amount = amount;
  credit.to_account_id = destination.id;
  credit.status = TransactionStatus::APPROVED;
  credit.description = description;
  credit.transfer_pair_id = result.transfer_pair_id;

  result.debit = uow.insertTransaction(debit);
  result.credit = uow.insertTransaction(credit);
  uow.updateCachedBalance(source.id, result.available_balance - amount);
  uow.updateCachedBalance(destination.id, destination_balance + amount);
  return result;
}

}  // namespace core
}  // namespace ledger
