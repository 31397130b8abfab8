#include "in_memory_ledger_store.hpp"

#include "core/identifiers.hpp"
#include "errors.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <algorithm>
#include <map>
#include <set>

namespace ledger {

namespace {

// Mirrors the CHECK constraints of the SQL schema.
void checkTransactionShape(const Transaction& txn) {
  if (txn.amount <= 0) {
    throw ConstraintViolationError("transaction amount must be positive");
  }
  if (txn.type == TransactionType::DEBIT && (!txn.from_account_id || txn.to_account_id)) {
    throw ConstraintViolationError("debit entries must reference only the debited account");
  }
  if (txn.type == TransactionType::CREDIT && (!txn.to_account_id || txn.from_account_id)) {
    throw ConstraintViolationError("credit entries must reference only the credited account");
  }
}

}  // namespace

/**
 * Unit of work over an InMemoryLedgerStore. Writes are buffered and
 * applied in one step on commit; row locks are held until commit or
 * rollback.
 */
class InMemoryUnitOfWork : public UnitOfWork {
 public:
  explicit InMemoryUnitOfWork(InMemoryLedgerStore& store) : store_(store), finished_(false) {
    observability::getGlobalMetrics().incrementGauge(observability::kUnitsOfWorkOpen);
  }

  ~InMemoryUnitOfWork() override {
    if (!finished_) {
      rollback();
    }
    observability::getGlobalMetrics().decrementGauge(observability::kUnitsOfWorkOpen);
  }

  std::optional<Account> findAccount(const std::string& account_id) override {
    auto pending = pending_accounts_.find(account_id);
    if (pending != pending_accounts_.end()) {
      return overlay(pending->second);
    }
    std::shared_lock<std::shared_mutex> lock(store_.data_mutex_);
    auto it = store_.accounts_.find(account_id);
    if (it == store_.accounts_.end()) {
      return std::nullopt;
    }
    return overlay(it->second);
  }

  std::optional<Account> lockAccount(const std::string& account_id) override {
    ensureOpen();
    if (locked_ids_.count(account_id) || pending_accounts_.count(account_id)) {
      return findAccount(account_id);
    }

    std::timed_mutex* row_mutex = nullptr;
    {
      std::shared_lock<std::shared_mutex> lock(store_.data_mutex_);
      auto it = store_.row_locks_.find(account_id);
      if (it == store_.row_locks_.end()) {
        return std::nullopt;
      }
      row_mutex = it->second.get();
    }

    std::unique_lock<std::timed_mutex> row_lock(*row_mutex, std::defer_lock);
    if (!row_lock.try_lock_for(store_.config_.lock_timeout)) {
      LEDGER_LOG_WARN("Row lock wait exceeded for account " + account_id);
      throw LockTimeoutError("timed out waiting for lock on account " + account_id);
    }
    held_locks_.push_back(std::move(row_lock));
    locked_ids_.insert(account_id);
    return findAccount(account_id);
  }

  std::optional<Account> findAccountByNumber(const std::string& account_number) override {
    for (const auto& [id, account] : pending_accounts_) {
      if (account.account_number == account_number) return overlay(account);
    }
    std::shared_lock<std::shared_mutex> lock(store_.data_mutex_);
    auto it = store_.account_ids_by_number_.find(account_number);
    if (it == store_.account_ids_by_number_.end()) {
      return std::nullopt;
    }
    return overlay(store_.accounts_.at(it->second));
  }

  std::vector<Account> accountsForHolder(const std::string& account_holder_id) override {
    return accountsWhere([&account_holder_id](const Account& account) {
      return account.account_holder_id == account_holder_id;
    });
  }

  std::vector<Account> allAccounts() override {
    return accountsWhere([](const Account&) { return true; });
  }

  std::optional<Card> findCard(const std::string& card_id) override {
    auto pending = pending_cards_.find(card_id);
    if (pending != pending_cards_.end()) {
      return overlay(pending->second);
    }
    std::shared_lock<std::shared_mutex> lock(store_.data_mutex_);
    auto it = store_.cards_.find(card_id);
    if (it == store_.cards_.end()) {
      return std::nullopt;
    }
    return overlay(it->second);
  }

  std::optional<Card> cardForAccount(const std::string& account_id) override {
    for (const auto& [id, card] : pending_cards_) {
      if (card.account_id == account_id) return overlay(card);
    }
    std::shared_lock<std::shared_mutex> lock(store_.data_mutex_);
    for (const auto& [id, card] : store_.cards_) {
      if (card.account_id == account_id) return overlay(card);
    }
    return std::nullopt;
  }

  std::vector<Transaction> transactions(const TransactionFilter& filter) override {
    std::vector<Transaction> result;
    {
      std::shared_lock<std::shared_mutex> lock(store_.data_mutex_);
      for (const auto& txn : store_.log_) {
        if (filter.matches(txn)) result.push_back(txn);
      }
    }
    for (const auto& txn : pending_transactions_) {
      if (filter.matches(txn)) result.push_back(txn);
    }

    std::stable_sort(result.begin(), result.end(), [](const Transaction& a, const Transaction& b) {
      return a.created_at < b.created_at;
    });
    if (filter.newest_first) {
      std::reverse(result.begin(), result.end());
    }

    if (filter.offset >= result.size()) {
      return {};
    }
    auto first = result.begin() + static_cast<std::ptrdiff_t>(filter.offset);
    auto last = result.end();
    if (filter.limit && *filter.limit < static_cast<size_t>(last - first)) {
      last = first + static_cast<std::ptrdiff_t>(*filter.limit);
    }
    return std::vector<Transaction>(first, last);
  }

  std::optional<Transaction> findTransaction(const std::string& transaction_id) override {
    for (const auto& txn : pending_transactions_) {
      if (txn.id == transaction_id) return txn;
    }
    std::shared_lock<std::shared_mutex> lock(store_.data_mutex_);
    for (const auto& txn : store_.log_) {
      if (txn.id == transaction_id) return txn;
    }
    return std::nullopt;
  }

  Transaction insertTransaction(Transaction txn) override {
    ensureOpen();
    checkTransactionShape(txn);
    const std::string& account_id =
        txn.type == TransactionType::DEBIT ? *txn.from_account_id : *txn.to_account_id;
    if (!findAccount(account_id)) {
      throw ConstraintViolationError("transaction references unknown account " + account_id);
    }
    if (txn.id.empty()) {
      txn.id = core::newUuid();
    }
    txn.created_at = store_.clock_();
    pending_transactions_.push_back(txn);
    return txn;
  }

  Account insertAccount(Account account) override {
    ensureOpen();
    if (account.id.empty()) {
      account.id = core::newUuid();
    }
    if (findAccount(account.id) || findAccountByNumber(account.account_number)) {
      throw ConstraintViolationError("duplicate account id or account number");
    }
    if (account.cached_balance < 0) {
      throw ConstraintViolationError("account balance cannot be negative");
    }
    account.created_at = store_.clock_();
    pending_accounts_[account.id] = account;
    return account;
  }

  Card insertCard(Card card) override {
    ensureOpen();
    if (card.id.empty()) {
      card.id = core::newUuid();
    }
    if (!findAccount(card.account_id)) {
      throw ConstraintViolationError("card references unknown account " + card.account_id);
    }
    if (cardForAccount(card.account_id)) {
      throw ConstraintViolationError("account " + card.account_id + " already has a card");
    }
    card.created_at = store_.clock_();
    pending_cards_[card.id] = card;
    return card;
  }

  void setCardActive(const std::string& card_id, bool is_active) override {
    ensureOpen();
    if (!findCard(card_id)) {
      throw ConstraintViolationError("unknown card " + card_id);
    }
    pending_card_states_[card_id] = is_active;
  }

  void updateCachedBalance(const std::string& account_id, Cents balance) override {
    ensureOpen();
    if (!locked_ids_.count(account_id) && !pending_accounts_.count(account_id)) {
      throw SystemicError("cached balance of " + account_id + " written without its row lock", false);
    }
    if (balance < 0) {
      throw ConstraintViolationError("account balance cannot be negative");
    }
    pending_balances_[account_id] = balance;
  }

  void commitWork() override {
    ensureOpen();
    {
      std::unique_lock<std::shared_mutex> lock(store_.data_mutex_);

      for (const auto& [id, account] : pending_accounts_) {
        if (store_.accounts_.count(id) || store_.account_ids_by_number_.count(account.account_number)) {
          throw ConstraintViolationError("duplicate account id or account number");
        }
      }
      for (const auto& [id, card] : pending_cards_) {
        for (const auto& [existing_id, existing] : store_.cards_) {
          if (existing.account_id == card.account_id) {
            throw ConstraintViolationError("account " + card.account_id + " already has a card");
          }
        }
      }

      for (auto& [id, account] : pending_accounts_) {
        store_.account_ids_by_number_[account.account_number] = id;
        store_.row_locks_[id] = std::make_unique<std::timed_mutex>();
        store_.accounts_[id] = account;
      }
      for (auto& [id, card] : pending_cards_) {
        store_.cards_[id] = card;
      }
      for (const auto& [id, active] : pending_card_states_) {
        store_.cards_.at(id).is_active = active;
      }
      for (const auto& [id, balance] : pending_balances_) {
        store_.accounts_.at(id).cached_balance = balance;
      }
      store_.log_.insert(store_.log_.end(), pending_transactions_.begin(),
                         pending_transactions_.end());
    }
    clearPending();
    finished_ = true;
    held_locks_.clear();
  }

  void rollback() override {
    if (finished_) return;
    clearPending();
    finished_ = true;
    held_locks_.clear();
  }

 private:
  // Committed and pending accounts accepted by `matches`, oldest first.
  template <typename Predicate>
  std::vector<Account> accountsWhere(Predicate matches) const {
    std::vector<Account> result;
    {
      std::shared_lock<std::shared_mutex> lock(store_.data_mutex_);
      for (const auto& [id, account] : store_.accounts_) {
        if (matches(account)) {
          result.push_back(overlay(account));
        }
      }
    }
    for (const auto& [id, account] : pending_accounts_) {
      if (matches(account)) {
        result.push_back(overlay(account));
      }
    }
    std::sort(result.begin(), result.end(), [](const Account& a, const Account& b) {
      if (a.created_at != b.created_at) return a.created_at < b.created_at;
      return a.account_number < b.account_number;
    });
    return result;
  }

  void ensureOpen() const {
    if (finished_) {
      throw SystemicError("unit of work already finished", false);
    }
  }

  void clearPending() {
    pending_accounts_.clear();
    pending_cards_.clear();
    pending_card_states_.clear();
    pending_balances_.clear();
    pending_transactions_.clear();
  }

  Account overlay(Account account) const {
    auto it = pending_balances_.find(account.id);
    if (it != pending_balances_.end()) {
      account.cached_balance = it->second;
    }
    return account;
  }

  Card overlay(Card card) const {
    auto it = pending_card_states_.find(card.id);
    if (it != pending_card_states_.end()) {
      card.is_active = it->second;
    }
    return card;
  }

  InMemoryLedgerStore& store_;
  bool finished_;

  std::vector<std::unique_lock<std::timed_mutex>> held_locks_;
  std::set<std::string> locked_ids_;

  std::map<std::string, Account> pending_accounts_;
  std::map<std::string, Card> pending_cards_;
  std::map<std::string, bool> pending_card_states_;
  std::map<std::string, Cents> pending_balances_;
  std::vector<Transaction> pending_transactions_;
};

InMemoryLedgerStore::InMemoryLedgerStore() : InMemoryLedgerStore(Config{}) {
}

InMemoryLedgerStore::InMemoryLedgerStore(const Config& config, Clock clock)
    : config_(config), clock_(std::move(clock)) {
}

std::unique_ptr<UnitOfWork> InMemoryLedgerStore::begin() {
  return std::make_unique<InMemoryUnitOfWork>(*this);
}

std::string InMemoryLedgerStore::describe() const {
  return "in-memory";
}

size_t InMemoryLedgerStore::transactionCount() const {
  std::shared_lock<std::shared_mutex> lock(data_mutex_);
  return log_.size();
}

}  // namespace ledger
