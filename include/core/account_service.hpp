#ifndef LEDGER_CORE_ACCOUNT_SERVICE_HPP_
#define LEDGER_CORE_ACCOUNT_SERVICE_HPP_

#include "core/balance_evaluator.hpp"
#include "ledger_store.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ledger {
namespace core {

constexpr size_t kDefaultPageSize = 50;
constexpr size_t kMaxPageSize = 200;

/**
 * Account, card and transaction-history operations scoped to the account
 * holder that owns them. The `*Unscoped` reads skip the ownership check;
 * deciding who may call them is the caller's concern.
 */
class AccountService {
 public:
  AccountService(LedgerStore& store, const BalanceEvaluator& evaluator,
                 Clock clock = systemClock());

  /**
   * Opens an account with a zero balance and a fresh random 10-digit
   * account number.
   */
  Account createAccount(const std::string& account_holder_id,
                        AccountType type = AccountType::CHECKING,
                        const std::string& currency = "USD");

  Account getAccount(const std::string& account_holder_id, const std::string& account_id);

  std::vector<Account> listAccounts(const std::string& account_holder_id);

  /**
   * Looks up an account by its external account number.
   */
  Account findByAccountNumber(const std::string& account_number);

  /**
   * Cached and computed balance of an owned account.
   */
  IntegrityReport getBalance(const std::string& account_holder_id, const std::string& account_id);

  IntegrityReport getBalanceUnscoped(const std::string& account_id);

  // Audit reads across every holder.
  std::vector<Account> listAllAccounts();
  Account getAccountUnscoped(const std::string& account_id);

  /**
   * Issues the account's only card. Throws ConflictError when it already
   * has one.
   */
  Card issueCard(const std::string& account_holder_id, const std::string& account_id);

  Card getCard(const std::string& account_holder_id, const std::string& account_id);

  Card deactivateCard(const std::string& account_holder_id, const std::string& account_id);

  /**
   * Newest-first page of the account's entries. Only status and type of
   * `filter` are honoured beyond paging; the limit defaults to 50.
   */
  std::vector<Transaction> listTransactions(const std::string& account_holder_id,
                                            const std::string& account_id,
                                            TransactionFilter filter = TransactionFilter());

  Transaction getTransaction(const std::string& account_holder_id,
                             const std::string& account_id,
                             const std::string& transaction_id);

  std::vector<Transaction> listAllTransactions(TransactionFilter filter = TransactionFilter());

  /**
   * Newest-first page of any account's entries. Throws NotFoundError when
   * the account does not exist.
   */
  std::vector<Transaction> listTransactionsUnscoped(const std::string& account_id,
                                                    TransactionFilter filter = TransactionFilter());

  Transaction getTransactionUnscoped(const std::string& transaction_id);

 private:
  Account ownedAccount(UnitOfWork& uow, const std::string& account_holder_id,
                       const std::string& account_id);

  static void applyPaging(TransactionFilter& filter);

  LedgerStore& store_;
  const BalanceEvaluator& evaluator_;
  Clock clock_;
};

}  // namespace core
}  // namespace ledger

#endif  // LEDGER_CORE_ACCOUNT_SERVICE_HPP_
