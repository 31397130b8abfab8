#include "test_support.hpp"

#include "core/calendar.hpp"
#include "errors.hpp"

#include <gtest/gtest.h>

namespace ledger {
namespace testing {

ManualClock::ManualClock(Timestamp start) : state_(std::make_shared<State>()) {
  state_->now = start;
}

Clock ManualClock::clock() const {
  auto state = state_;
  return [state]() {
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->now;
  };
}

void ManualClock::set(Timestamp ts) {
  std::lock_guard<std::mutex> lock(state_->mutex);
  state_->now = ts;
}

void ManualClock::advance(std::chrono::microseconds delta) {
  std::lock_guard<std::mutex> lock(state_->mutex);
  state_->now += delta;
}

Timestamp ManualClock::now() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->now;
}

Timestamp utc(int year, int month, int day, int hour, int minute, int second) {
  return core::monthStart(year, month) + std::chrono::hours(24 * (day - 1)) +
         std::chrono::hours(hour) + std::chrono::minutes(minute) + std::chrono::seconds(second);
}

class FaultInjectingUnitOfWork : public UnitOfWork {
 public:
  FaultInjectingUnitOfWork(FaultInjectingStore& owner, std::unique_ptr<UnitOfWork> inner)
      : owner_(owner), inner_(std::move(inner)) {}

  std::optional<Account> findAccount(const std::string& id) override {
    return inner_->findAccount(id);
  }
  std::optional<Account> lockAccount(const std::string& id) override {
    return inner_->lockAccount(id);
  }
  std::optional<Account> findAccountByNumber(const std::string& number) override {
    return inner_->findAccountByNumber(number);
  }
  std::vector<Account> accountsForHolder(const std::string& holder) override {
    return inner_->accountsForHolder(holder);
  }
  std::vector<Account> allAccounts() override { return inner_->allAccounts(); }
  std::optional<Card> findCard(const std::string& id) override { return inner_->findCard(id); }
  std::optional<Card> cardForAccount(const std::string& id) override {
    return inner_->cardForAccount(id);
  }
  std::vector<Transaction> transactions(const TransactionFilter& filter) override {
    return inner_->transactions(filter);
  }
  std::optional<Transaction> findTransaction(const std::string& id) override {
    return inner_->findTransaction(id);
  }

  Transaction insertTransaction(Transaction txn) override {
    int call = ++owner_.insert_calls_;
    if (owner_.fail_on_.load() != 0 && call == owner_.fail_on_.load()) {
      if (owner_.retryable_.load()) {
        throw StoreUnavailableError("injected connection loss");
      }
      throw ConstraintViolationError("injected write failure");
    }
    return inner_->insertTransaction(std::move(txn));
  }

  Account insertAccount(Account account) override {
    return inner_->insertAccount(std::move(account));
  }
  Card insertCard(Card card) override { return inner_->insertCard(std::move(card)); }
  void setCardActive(const std::string& id, bool active) override {
    inner_->setCardActive(id, active);
  }
  void updateCachedBalance(const std::string& id, Cents balance) override {
    inner_->updateCachedBalance(id, balance);
  }
  void commitWork() override {
    inner_->commit();
    int call = ++owner_.commit_calls_;
    if (owner_.fail_after_commit_.load() != 0 && call == owner_.fail_after_commit_.load()) {
      throw StoreUnavailableError("injected connection loss after commit");
    }
  }
  void rollback() override { inner_->rollback(); }

 private:
  FaultInjectingStore& owner_;
  std::unique_ptr<UnitOfWork> inner_;
};

FaultInjectingStore::FaultInjectingStore(LedgerStore& inner) : inner_(inner) {
}

void FaultInjectingStore::failOnInsert(int n, bool retryable) {
  insert_calls_ = 0;
  retryable_ = retryable;
  fail_on_ = n;
}

void FaultInjectingStore::failAfterCommit(int n) {
  commit_calls_ = 0;
  fail_after_commit_ = n;
}

std::unique_ptr<UnitOfWork> FaultInjectingStore::begin() {
  return std::make_unique<FaultInjectingUnitOfWork>(*this, inner_.begin());
}

std::string FaultInjectingStore::describe() const {
  return "fault-injecting(" + inner_.describe() + ")";
}

}  // namespace testing
}  // namespace ledger

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
