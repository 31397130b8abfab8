#ifndef LEDGER_LEDGER_ENGINE_HPP_
#define LEDGER_LEDGER_ENGINE_HPP_

#include "config/ledger_config.hpp"
#include "core/account_service.hpp"
#include "core/balance_evaluator.hpp"
#include "core/statement_aggregator.hpp"
#include "core/transaction_authorizer.hpp"
#include "core/transfer_coordinator.hpp"
#include "database/postgres_ledger_store.hpp"
#include "ledger_store.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ledger {

/**
 * Owns a ledger store and the services operating on it. Every operation
 * is re-run on retryable store failures (lock timeouts, lost connections)
 * up to the configured number of attempts.
 */
class LedgerEngine {
 public:
  /**
   * Wraps an existing store. `retry_attempts` counts total runs.
   */
  LedgerEngine(std::unique_ptr<LedgerStore> store, int retry_attempts = 3,
               Clock clock = systemClock());
  ~LedgerEngine() = default;

  // Non-copyable
  LedgerEngine(const LedgerEngine&) = delete;
  LedgerEngine& operator=(const LedgerEngine&) = delete;

  /**
   * Builds the store selected by `config`. Throws ValidationError for an
   * invalid configuration.
   */
  static std::unique_ptr<LedgerEngine> fromConfig(const config::LedgerConfig& config);

  /**
   * Applies the schema script to the PostgreSQL backend. Throws
   * ValidationError on the in-memory backend.
   */
  void initializeSchema(const std::string& path);

  // Accounts
  Account createAccount(const std::string& account_holder_id,
                        AccountType type = AccountType::CHECKING,
                        const std::string& currency = "USD");
  Account getAccount(const std::string& account_holder_id, const std::string& account_id);
  std::vector<Account> listAccounts(const std::string& account_holder_id);
  Account findByAccountNumber(const std::string& account_number);

  // Money movement
  TransactionResult authorize(const std::string& account_holder_id,
                              const std::string& account_id,
                              TransactionType type,
                              Cents amount,
                              const std::string& description = "",
                              const std::optional<std::string>& card_id = std::nullopt);
  TransferResult transfer(const std::string& account_holder_id,
                          const std::string& from_account_id,
                          const std::string& to_account_id,
                          Cents amount,
                          const std::string& description = "");

  // Reads
  IntegrityReport getBalance(const std::string& account_holder_id, const std::string& account_id);
  std::vector<Transaction> listTransactions(const std::string& account_holder_id,
                                            const std::string& account_id,
                                            TransactionFilter filter = TransactionFilter());
  Transaction getTransaction(const std::string& account_holder_id,
                             const std::string& account_id,
                             const std::string& transaction_id);
  StatementView statement(const std::string& account_holder_id,
                          const std::string& account_id,
                          std::optional<int> year,
                          std::optional<int> month);

  // Audit reads without an ownership check; who may call them is decided
  // by the caller.
  std::vector<Account> listAllAccounts();
  Account getAccountUnscoped(const std::string& account_id);
  IntegrityReport getBalanceUnscoped(const std::string& account_id);
  std::vector<Transaction> listAllTransactions(TransactionFilter filter = TransactionFilter());
  std::vector<Transaction> listTransactionsUnscoped(const std::string& account_id,
                                                    TransactionFilter filter = TransactionFilter());
  Transaction getTransactionUnscoped(const std::string& transaction_id);

  // Cards
  Card issueCard(const std::string& account_holder_id, const std::string& account_id);
  Card getCard(const std::string& account_holder_id, const std::string& account_id);
  Card deactivateCard(const std::string& account_holder_id, const std::string& account_id);

  LedgerStore& store() { return *store_; }

 private:
  template <typename Fn>
  auto retrying(Fn&& operation) -> decltype(operation()) {
    return runWithRetry(retry_attempts_, std::forward<Fn>(operation));
  }

  std::unique_ptr<LedgerStore> store_;
  database::PostgresLedgerStore* postgres_store_;  // non-owning, null for memory
  int retry_attempts_;

  core::BalanceEvaluator evaluator_;
  core::TransactionAuthorizer authorizer_;
  core::TransferCoordinator coordinator_;
  core::StatementAggregator aggregator_;
  core::AccountService accounts_;
};

}  // namespace ledger

#endif  // LEDGER_LEDGER_ENGINE_HPP_
