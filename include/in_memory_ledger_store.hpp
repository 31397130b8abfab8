#ifndef LEDGER_IN_MEMORY_LEDGER_STORE_HPP_
#define LEDGER_IN_MEMORY_LEDGER_STORE_HPP_

#include "ledger_store.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ledger {

class InMemoryUnitOfWork;

/**
 * Process-local ledger store with account-level locking.
 *
 * Every account row owns a timed mutex; operations on different accounts
 * proceed concurrently. Shared containers are guarded by a reader/writer
 * lock that is only held for the duration of a single read or a commit.
 */
class InMemoryLedgerStore : public LedgerStore {
 public:
  struct Config {
    std::chrono::milliseconds lock_timeout{5000};
  };

  InMemoryLedgerStore();
  explicit InMemoryLedgerStore(const Config& config, Clock clock = systemClock());
  ~InMemoryLedgerStore() override = default;

  // Non-copyable
  InMemoryLedgerStore(const InMemoryLedgerStore&) = delete;
  InMemoryLedgerStore& operator=(const InMemoryLedgerStore&) = delete;

  std::unique_ptr<UnitOfWork> begin() override;

  std::string describe() const override;

  /**
   * Number of committed log entries.
   */
  size_t transactionCount() const;

 private:
  friend class InMemoryUnitOfWork;

  Config config_;
  Clock clock_;

  mutable std::shared_mutex data_mutex_;
  std::unordered_map<std::string, Account> accounts_;
  std::unordered_map<std::string, std::string> account_ids_by_number_;
  std::unordered_map<std::string, std::unique_ptr<std::timed_mutex>> row_locks_;
  std::unordered_map<std::string, Card> cards_;
  // Append-only, in commit order.
  std::vector<Transaction> log_;
};

}  // namespace ledger

#endif  // LEDGER_IN_MEMORY_LEDGER_STORE_HPP_
