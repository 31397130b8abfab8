#ifndef LEDGER_CORE_TRANSACTION_AUTHORIZER_HPP_
#define LEDGER_CORE_TRANSACTION_AUTHORIZER_HPP_

#include "core/balance_evaluator.hpp"
#include "ledger_store.hpp"

#include <optional>
#include <string>

namespace ledger {
namespace core {

/**
 * Decides single credits and debits against the computed balance.
 *
 * Both outcomes are durable: an approved entry updates the cached balance,
 * a declined debit is recorded with status=declined and committed just the
 * same. Only systemic failures roll the unit of work back.
 */
class TransactionAuthorizer {
 public:
  TransactionAuthorizer(LedgerStore& store, const BalanceEvaluator& evaluator);

  /**
   * Authorizes a credit or debit on `account_id` for its owner.
   *
   * A card may only back a debit, and must belong to the account and be
   * active; violations are validation errors, not declines.
   *
   * Throws ValidationError, NotFoundError, UnauthorizedError or
   * SystemicError. A debit larger than the balance returns a DECLINED
   * result.
   */
  TransactionResult authorize(const std::string& account_holder_id,
                              const std::string& account_id,
                              TransactionType type,
                              Cents amount,
                              const std::string& description = "",
                              const std::optional<std::string>& card_id = std::nullopt);

 private:
  TransactionResult decide(UnitOfWork& uow, const std::string& account_holder_id,
                           const std::string& account_id, TransactionType type,
                           Cents amount, const std::string& description,
                           const std::optional<std::string>& card_id);

  LedgerStore& store_;
  const BalanceEvaluator& evaluator_;
};

}  // namespace core
}  // namespace ledger

#endif  // LEDGER_CORE_TRANSACTION_AUTHORIZER_HPP_
