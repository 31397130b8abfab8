#include "ledger_engine.hpp"

#include "errors.hpp"
#include "in_memory_ledger_store.hpp"
#include "observability/logger.hpp"

namespace ledger {

LedgerEngine::LedgerEngine(std::unique_ptr<LedgerStore> store, int retry_attempts, Clock clock)
    : store_(std::move(store)),
      postgres_store_(dynamic_cast<database::PostgresLedgerStore*>(store_.get())),
      retry_attempts_(retry_attempts),
      evaluator_(*store_),
      authorizer_(*store_, evaluator_),
      coordinator_(*store_, evaluator_),
      aggregator_(*store_, evaluator_),
      accounts_(*store_, evaluator_, std::move(clock)) {
  LEDGER_LOG_BUILDER(observability::LogLevel::INFO, "Ledger engine ready")
      .field("store", store_->describe())
      .field("retry_attempts", retry_attempts_);
}

std::unique_ptr<LedgerEngine> LedgerEngine::fromConfig(const config::LedgerConfig& config) {
  config.validate();

  std::unique_ptr<LedgerStore> store;
  if (config.backend == config::Backend::POSTGRES) {
    database::PostgresLedgerStore::Config pg_config;
    pg_config.connection = config.postgres;
    pg_config.lock_timeout = config.lock_timeout;
    pg_config.acquire_timeout = config.lock_timeout;
    store = std::make_unique<database::PostgresLedgerStore>(pg_config);
  } else {
    InMemoryLedgerStore::Config memory_config;
    memory_config.lock_timeout = config.lock_timeout;
    store = std::make_unique<InMemoryLedgerStore>(memory_config);
  }
  return std::make_unique<LedgerEngine>(std::move(store), config.retry_attempts);
}

void LedgerEngine::initializeSchema(const std::string& path) {
  if (!postgres_store_) {
    throw ValidationError("schema initialization requires the postgres backend");
  }
  retrying([&] { postgres_store_->initializeSchema(path); });
}

Account LedgerEngine::createAccount(const std::string& account_holder_id, AccountType type,
                                    const std::string& currency) {
  return retrying([&] { return accounts_.createAccount(account_holder_id, type, currency); });
}

Account LedgerEngine::getAccount(const std::string& account_holder_id,
                                 const std::string& account_id) {
  return retrying([&] { return accounts_.getAccount(account_holder_id, account_id); });
}

std::vector<Account> LedgerEngine::listAccounts(const std::string& account_holder_id) {
  return retrying([&] { return accounts_.listAccounts(account_holder_id); });
}

Account LedgerEngine::findByAccountNumber(const std::string& account_number) {
  return retrying([&] { return accounts_.findByAccountNumber(account_number); });
}

TransactionResult LedgerEngine::authorize(const std::string& account_holder_id,
                                          const std::string& account_id,
                                          TransactionType type, Cents amount,
                                          const std::string& description,
                                          const std::optional<std::string>& card_id) {
  return retrying([&] {
    return authorizer_.authorize(account_holder_id, account_id, type, amount, description,
                                 card_id);
  });
}

TransferResult LedgerEngine::transfer(const std::string& account_holder_id,
                                      const std::string& from_account_id,
                                      const std::string& to_account_id, Cents amount,
                                      const std::string& description) {
  return retrying([&] {
    return coordinator_.transfer(account_holder_id, from_account_id, to_account_id, amount,
                                 description);
  });
}

IntegrityReport LedgerEngine::getBalance(const std::string& account_holder_id,
                                         const std::string& account_id) {
  return retrying([&] { return accounts_.getBalance(account_holder_id, account_id); });
}


std::vector<Transaction> LedgerEngine::listTransactions(const std::string& account_holder_id,
                                                        const std::string& account_id,
                                                        TransactionFilter filter) {
  return retrying(
      [&] { return accounts_.listTransactions(account_holder_id, account_id, filter); });
}

Transaction LedgerEngine::getTransaction(const std::string& account_holder_id,
                                         const std::string& account_id,
                                         const std::string& transaction_id) {
  return retrying(
      [&] { return accounts_.getTransaction(account_holder_id, account_id, transaction_id); });
}

StatementView LedgerEngine::statement(const std::string& account_holder_id,
                                      const std::string& account_id, std::optional<int> year,
                                      std::optional<int> month) {
  return retrying(
      [&] { return aggregator_.statement(account_holder_id, account_id, year, month); });
}

std::vector<Account> LedgerEngine::listAllAccounts() {
  return retrying([&] { return accounts_.listAllAccounts(); });
}

Account LedgerEngine::getAccountUnscoped(const std::string& account_id) {
  return retrying([&] { return accounts_.getAccountUnscoped(account_id); });
}

IntegrityReport LedgerEngine::getBalanceUnscoped(const std::string& account_id) {
  return retrying([&] { return accounts_.getBalanceUnscoped(account_id); });
}

std::vector<Transaction> LedgerEngine::listAllTransactions(TransactionFilter filter) {
  return retrying([&] { return accounts_.listAllTransactions(filter); });
}

std::vector<Transaction> LedgerEngine::listTransactionsUnscoped(const std::string& account_id,
                                                                TransactionFilter filter) {
  return retrying([&] { return accounts_.listTransactionsUnscoped(account_id, filter); });
}

Transaction LedgerEngine::getTransactionUnscoped(const std::string& transaction_id) {
  return retrying([&] { return accounts_.getTransactionUnscoped(transaction_id); });
}

Card LedgerEngine::issueCard(const std::string& account_holder_id,
                             const std::string& account_id) {
  return retrying([&] { return accounts_.issueCard(account_holder_id, account_id); });
}

Card LedgerEngine::getCard(const std::string& account_holder_id, const std::string& account_id) {
  return retrying([&] { return accounts_.getCard(account_holder_id, account_id); });
}

Card LedgerEngine::deactivateCard(const std::string& account_holder_id,
                                  const std::string& account_id) {
  return retrying([&] { return accounts_.deactivateCard(account_holder_id, account_id); });
}

}  // namespace ledger
