#ifndef LEDGER_CORE_BALANCE_EVALUATOR_HPP_
#define LEDGER_CORE_BALANCE_EVALUATOR_HPP_

#include "ledger_store.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ledger {
namespace core {

/**
 * Derives balances from the transaction log.
 *
 * A balance is the sum of approved credits into the account minus approved
 * debits out of it. Declined entries contribute nothing.
 */
class BalanceEvaluator {
 public:
  explicit BalanceEvaluator(LedgerStore& store);

  /**
   * Computes the balance inside the caller's unit of work so that the read
   * is consistent with the row locks the caller holds. With `before` set,
   * only entries created strictly before that instant are counted.
   */
  Cents computeBalance(UnitOfWork& uow, const std::string& account_id,
                       std::optional<Timestamp> before = std::nullopt) const;

  /**
   * Compares the cached balance with the computed one. Read-only; a
   * mismatch is reported, not raised. Throws NotFoundError for unknown
   * accounts.
   */
  IntegrityReport checkIntegrity(const std::string& account_id) const;

  /**
   * Same comparison inside an existing unit of work.
   */
  IntegrityReport checkIntegrity(UnitOfWork& uow, const Account& account) const;

  /**
   * Folds `history` into the signed balance of `account_id`.
   */
  static Cents foldBalance(const std::string& account_id,
                           const std::vector<Transaction>& history);

 private:
  LedgerStore& store_;
};

}  // namespace core
}  // namespace ledger

#endif  // LEDGER_CORE_BALANCE_EVALUATOR_HPP_
