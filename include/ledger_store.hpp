#ifndef LEDGER_LEDGER_STORE_HPP_
#define LEDGER_LEDGER_STORE_HPP_

#include "errors.hpp"
#include "ledger_types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ledger {

/**
 * A bounded sequence of store operations that commits or rolls back as a
 * whole. Destroying an uncommitted unit of work rolls it back and releases
 * every row lock it holds.
 *
 * Ids are passed in canonical lowercase form (see core::canonicalId).
 * Reads observe committed state plus this unit's own pending writes.
 * Every method may block on I/O or lock acquisition, and may throw
 * SystemicError.
 */
class UnitOfWork {
 public:
  virtual ~UnitOfWork() = default;

  /**
   * Reads an account without locking it.
   */
  virtual std::optional<Account> findAccount(const std::string& account_id) = 0;

  /**
   * Acquires the exclusive row lock on an account and returns its current
   * state. Returns nullopt when the account does not exist. Throws
   * LockTimeoutError when the lock cannot be acquired in time.
   * Locking an account this unit already holds is a no-op read.
   */
  virtual std::optional<Account> lockAccount(const std::string& account_id) = 0;

  virtual std::optional<Account> findAccountByNumber(const std::string& account_number) = 0;

  virtual std::vector<Account> accountsForHolder(const std::string& account_holder_id) = 0;

  // Every account of every holder, oldest first.
  virtual std::vector<Account> allAccounts() = 0;

  virtual std::optional<Card> findCard(const std::string& card_id) = 0;

  virtual std::optional<Card> cardForAccount(const std::string& account_id) = 0;

  /**
   * Returns log entries matching `filter`, chronological unless
   * `filter.newest_first` is set. Entries with equal timestamps keep their
   * insertion order.
   */
  virtual std::vector<Transaction> transactions(const TransactionFilter& filter) = 0;

  virtual std::optional<Transaction> findTransaction(const std::string& transaction_id) = 0;

  /**
   * Appends an entry to the log. The store assigns `id` (when empty) and
   * `created_at`; the stored row is returned.
   */
  virtual Transaction insertTransaction(Transaction txn) = 0;

  virtual Account insertAccount(Account account) = 0;

  virtual Card insertCard(Card card) = 0;

  virtual void setCardActive(const std::string& card_id, bool is_active) = 0;

  /**
   * Writes the advisory cached balance. Only legal while this unit holds
   * the account's row lock.
   */
  virtual void updateCachedBalance(const std::string& account_id, Cents balance) = 0;

  /**
   * Makes every write of this unit durable. Once the commit request has
   * been issued its outcome may be unknown, so any failure from here on is
   * reported as CommitUncertainError and is never retried.
   */
  void commit() {
    try {
      commitWork();
    } catch (const CommitUncertainError&) {
      throw;
    } catch (const SystemicError& e) {
      if (!e.retryable()) {
        throw;
      }
      throw CommitUncertainError(std::string("commit outcome unknown: ") + e.what());
    }
  }

  virtual void rollback() = 0;

 protected:
  virtual void commitWork() = 0;
};

/**
 * Durable record of accounts, cards and transactions.
 */
class LedgerStore {
 public:
  virtual ~LedgerStore() = default;

  /**
   * Opens a new unit of work. Throws StoreUnavailableError when the
   * backing store cannot serve one.
   */
  virtual std::unique_ptr<UnitOfWork> begin() = 0;

  /**
   * Short description for logs.
   */
  virtual std::string describe() const = 0;
};

}  // namespace ledger

#endif  // LEDGER_LEDGER_STORE_HPP_
