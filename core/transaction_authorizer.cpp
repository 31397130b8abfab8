#include "core/transaction_authorizer.hpp"

#include "core/identifiers.hpp"
#include "core/validation.hpp"
#include "errors.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

namespace ledger {
namespace core {

using observability::LogLevel;

TransactionAuthorizer::TransactionAuthorizer(LedgerStore& store, const BalanceEvaluator& evaluator)
    : store_(store), evaluator_(evaluator) {
}

TransactionResult TransactionAuthorizer::authorize(const std::string& account_holder_id,
                                                   const std::string& requested_account_id,
                                                   TransactionType type,
                                                   Cents amount,
                                                   const std::string& description,
                                                   const std::optional<std::string>& requested_card_id) {
  const std::string account_id = canonicalId(requested_account_id);
  std::optional<std::string> card_id;
  if (requested_card_id) {
    card_id = canonicalId(*requested_card_id);
  }

  validateAmount(amount);
  validateDescription(description);
  if (card_id && type == TransactionType::CREDIT) {
    throw ValidationError("Cards cannot be used for deposit (credit) transactions");
  }

  auto& metrics = observability::getGlobalMetrics();
  observability::MetricsCollector::Timer timer(metrics, observability::kAuthorizeSeconds);

  try {
    auto uow = store_.begin();
    TransactionResult result =
        decide(*uow, account_holder_id, account_id, type, amount, description, card_id);
    uow->commit();

    if (result.outcome == Outcome::APPROVED) {
      metrics.incrementCounter(observability::kTransactionsApproved);
      LEDGER_LOG_BUILDER(LogLevel::INFO, "Transaction approved")
          .field("transaction_id", result.transaction.id)
          .field("account_id", account_id)
          .field("type", toString(type))
          .field("amount", amount);
    } else {
      metrics.incrementCounter(observability::kTransactionsDeclined);
      LEDGER_LOG_BUILDER(LogLevel::WARN, "Transaction declined: insufficient funds")
          .field("transaction_id", result.transaction.id)
          .field("account_id", account_id)
          .field("requested", amount)
          .field("available", result.available_balance);
    }
    return result;
  } catch (const SystemicError& e) {
    metrics.incrementCounter(observability::kSystemicFailures);
    LEDGER_LOG_BUILDER(LogLevel::ERROR, "Authorization rolled back")
        .field("account_id", account_id)
        .field("retryable", e.retryable())
        .field("error", e.what());
    throw;
  }
}

TransactionResult TransactionAuthorizer::decide(UnitOfWork& uow,
                                                const std::string& account_holder_id,
                                                const std::string& account_id,
                                                TransactionType type,
                                                Cents amount,
                                                const std::string& description,
                                                const std::optional<std::string>& card_id) {
  const Account account = requireAccount(uow.lockAccount(account_id), account_id);
  requireOwner(account, account_holder_id);
  requireActive(account);

  if (card_id) {
    auto card = uow.findCard(*card_id);
    if (!card) {
      throw NotFoundError("Card " + *card_id + " not found");
    }
    if (card->account_id != account_id) {
      throw ValidationError("Card does not belong to this account");
    }
    if (!card->is_active) {
      throw ValidationError("Card is not active");
    }
  }

  const Cents balance = evaluator_.computeBalance(uow, account_id);

  Transaction txn;
  txn.type = type;
  txn.amount = amount;
  txn.description = description;
  txn.card_id = card_id;
  if (type == TransactionType::DEBIT) {
    txn.from_account_id = account_id;
  } else {
    txn.to_account_id = account_id;
  }

  TransactionResult result;
  result.available_balance = balance;

  if (type == TransactionType::DEBIT && amount > balance) {
    txn.status = TransactionStatus::DECLINED;
    result.outcome = Outcome::DECLINED;
    result.transaction = uow.insertTransaction(txn);
    return result;
  }

  Cents new_balance = balance;
  if (type == TransactionType::CREDIT) {
    validateCreditHeadroom(balance, amount);
    new_balance += amount;
  } else {
    new_balance -= amount;
  }

  txn.status = TransactionStatus::APPROVED;
  result.outcome = Outcome::APPROVED;
  result.transaction = uow.insertTransaction(txn);
  uow.updateCachedBalance(account_id, new_balance);
  return result;
}

}  // namespace core
}  // namespace ledger
