#ifndef LEDGER_CORE_TRANSFER_COORDINATOR_HPP_
#define LEDGER_CORE_TRANSFER_COORDINATOR_HPP_

#include "core/balance_evaluator.hpp"
#include "ledger_store.hpp"

#include <string>

namespace ledger {
namespace core {

/**
 * Moves money between two accounts as one unit of work.
 *
 * Both rows are locked in identifier order regardless of direction, so
 * concurrent transfers over the same pair cannot deadlock. An approved
 * transfer writes a debit leg on the source and a credit leg on the
 * destination sharing one transfer pair id; a declined transfer writes a
 * single declined debit on the source and no credit leg.
 */
class TransferCoordinator {
 public:
  TransferCoordinator(LedgerStore& store, const BalanceEvaluator& evaluator);

  /**
   * Transfers `amount` from an account owned by `account_holder_id` to any
   * existing account. Both accounts may belong to the same holder.
   *
   * Throws ValidationError for same-account transfers and bad amounts,
   * NotFoundError when either account is missing, UnauthorizedError when
   * the caller does not own the source, SystemicError on store failure.
   */
  TransferResult transfer(const std::string& account_holder_id,
                          const std::string& from_account_id,
                          const std::string& to_account_id,
                          Cents amount,
                          const std::string& description = "");

 private:
  TransferResult execute(UnitOfWork& uow, const std::string& account_holder_id,
                         const std::string& from_account_id,
                         const std::string& to_account_id,
                         Cents amount, const std::string& description);

  LedgerStore& store_;
  const BalanceEvaluator& evaluator_;
};

}  // namespace core
}  // namespace ledger

#endif  // LEDGER_CORE_TRANSFER_COORDINATOR_HPP_
