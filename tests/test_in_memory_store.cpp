#include "errors.hpp"
#include "in_memory_ledger_store.hpp"
#include "observability/metrics.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <thread>

using namespace ledger;
using ledger::testing::ManualClock;
using ledger::testing::utc;

class InMemoryStoreTest : public ::testing::Test {
 protected:
  InMemoryStoreTest()
      : clock_(utc(2026, 5, 1)),
        store_(InMemoryLedgerStore::Config{std::chrono::milliseconds(50)}, clock_.clock()) {}

  Account addAccount(const std::string& number) {
    auto uow = store_.begin();
    Account account;
    account.account_holder_id = "alice";
    account.account_number = number;
    account = uow->insertAccount(account);
    uow->commit();
    return account;
  }

  Transaction credit(const std::string& account_id, Cents amount) {
    Transaction txn;
    txn.type = TransactionType::CREDIT;
    txn.amount = amount;
    txn.to_account_id = account_id;
    return txn;
  }

  ManualClock clock_;
  InMemoryLedgerStore store_;
};

TEST_F(InMemoryStoreTest, UncommittedWorkIsDiscarded) {
  Account account = addAccount("1000000001");
  {
    auto uow = store_.begin();
    uow->lockAccount(account.id);
    uow->insertTransaction(credit(account.id, 500));
    uow->updateCachedBalance(account.id, 500);

    // Visible inside the unit of work only.
    EXPECT_EQ(uow->transactions(TransactionFilter()).size(), 1u);
    EXPECT_EQ(uow->findAccount(account.id)->cached_balance, 500);
  }
  EXPECT_EQ(store_.transactionCount(), 0u);

  auto uow = store_.begin();
  EXPECT_EQ(uow->findAccount(account.id)->cached_balance, 0);
}

TEST_F(InMemoryStoreTest, CommitPublishesAllWrites) {
  Account account = addAccount("1000000002");
  auto uow = store_.begin();
  uow->lockAccount(account.id);
  Transaction stored = uow->insertTransaction(credit(account.id, 700));
  uow->updateCachedBalance(account.id, 700);
  uow->commit();

  EXPECT_FALSE(stored.id.empty());
  EXPECT_EQ(stored.created_at, clock_.now());
  EXPECT_EQ(store_.transactionCount(), 1u);

  auto reader = store_.begin();
  EXPECT_EQ(reader->findTransaction(stored.id)->amount, 700);
  EXPECT_EQ(reader->findAccount(account.id)->cached_balance, 700);
}

TEST_F(InMemoryStoreTest, LockWaitIsBounded) {
  Account account = addAccount("1000000003");

  auto holder = store_.begin();
  ASSERT_TRUE(holder->lockAccount(account.id).has_value());

  auto waiter = std::async(std::launch::async, [&] {
    auto uow = store_.begin();
    uow->lockAccount(account.id);
  });
  EXPECT_THROW(waiter.get(), LockTimeoutError);

  holder->rollback();
  auto next = store_.begin();
  EXPECT_TRUE(next->lockAccount(account.id).has_value());
}

TEST_F(InMemoryStoreTest, LockTimeoutIsRetryable) {
  LockTimeoutError error("busy");
  EXPECT_TRUE(error.retryable());
  EXPECT_EQ(error.kind(), ErrorKind::SYSTEMIC);
}

TEST_F(InMemoryStoreTest, RelockingInSameUnitIsANoOp) {
  Account account = addAccount("1000000004");
  auto uow = store_.begin();
  EXPECT_TRUE(uow->lockAccount(account.id).has_value());
  EXPECT_TRUE(uow->lockAccount(account.id).has_value());
  EXPECT_FALSE(uow->lockAccount("missing").has_value());
}

TEST_F(InMemoryStoreTest, CachedBalanceRequiresRowLock) {
  Account account = addAccount("1000000005");
  auto uow = store_.begin();
  EXPECT_THROW(uow->updateCachedBalance(account.id, 10), SystemicError);

  uow->lockAccount(account.id);
  EXPECT_THROW(uow->updateCachedBalance(account.id, -1), ConstraintViolationError);
}

TEST_F(InMemoryStoreTest, MalformedEntriesAreRejected) {
  Account account = addAccount("1000000006");
  auto uow = store_.begin();

  Transaction zero = credit(account.id, 0);
  EXPECT_THROW(uow->insertTransaction(zero), ConstraintViolationError);

  Transaction both_sides = credit(account.id, 10);
  both_sides.from_account_id = account.id;
  EXPECT_THROW(uow->insertTransaction(both_sides), ConstraintViolationError);

  Transaction debit_without_source;
  debit_without_source.type = TransactionType::DEBIT;
  debit_without_source.amount = 10;
  EXPECT_THROW(uow->insertTransaction(debit_without_source), ConstraintViolationError);

  EXPECT_THROW(uow->insertTransaction(credit("missing", 10)), ConstraintViolationError);
}

TEST_F(InMemoryStoreTest, DuplicateAccountNumberIsRejected) {
  addAccount("1000000007");
  EXPECT_THROW(addAccount("1000000007"), ConstraintViolationError);
}

TEST_F(InMemoryStoreTest, OneCardPerAccount) {
  Account account = addAccount("1000000008");
  auto uow = store_.begin();
  Card card;
  card.account_id = account.id;
  card.last_four = "1234";
  uow->insertCard(card);
  EXPECT_THROW(uow->insertCard(card), ConstraintViolationError);
}

TEST_F(InMemoryStoreTest, EqualTimestampsKeepInsertionOrder) {
  Account account = addAccount("1000000009");
  for (Cents amount = 1; amount <= 5; ++amount) {
    auto uow = store_.begin();
    uow->insertTransaction(credit(account.id, amount));
    uow->commit();
  }

  auto uow = store_.begin();
  auto oldest_first = uow->transactions(TransactionFilter());
  ASSERT_EQ(oldest_first.size(), 5u);
  for (size_t i = 0; i < oldest_first.size(); ++i) {
    EXPECT_EQ(oldest_first[i].amount, static_cast<Cents>(i + 1));
  }

  TransactionFilter newest;
  newest.newest_first = true;
  newest.limit = 2;
  auto page = uow->transactions(newest);
  ASSERT_EQ(page.size(), 2u);
  EXPECT_EQ(page[0].amount, 5);
  EXPECT_EQ(page[1].amount, 4);
}

TEST_F(InMemoryStoreTest, TimeWindowIsHalfOpen) {
  Account account = addAccount("1000000010");
  clock_.set(utc(2026, 5, 1));
  {
    auto uow = store_.begin();
    uow->insertTransaction(credit(account.id, 1));
    uow->commit();
  }
  clock_.set(utc(2026, 6, 1));
  {
    auto uow = store_.begin();
    uow->insertTransaction(credit(account.id, 2));
    uow->commit();
  }

  TransactionFilter may;
  may.since = utc(2026, 5, 1);
  may.until = utc(2026, 6, 1);
  auto uow = store_.begin();
  auto entries = uow->transactions(may);
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0].amount, 1);
}

TEST_F(InMemoryStoreTest, FinishedUnitRejectsWrites) {
  Account account = addAccount("1000000011");
  auto uow = store_.begin();
  uow->commit();
  EXPECT_THROW(uow->insertTransaction(credit(account.id, 1)), SystemicError);
  EXPECT_THROW(uow->commit(), SystemicError);
}

TEST_F(InMemoryStoreTest, OpenUnitsOfWorkAreGauged) {
  auto& metrics = observability::getGlobalMetrics();
  const double before = metrics.gaugeValue(observability::kUnitsOfWorkOpen);
  {
    auto first = store_.begin();
    auto second = store_.begin();
    EXPECT_DOUBLE_EQ(metrics.gaugeValue(observability::kUnitsOfWorkOpen), before + 2);
    first->commit();
    EXPECT_DOUBLE_EQ(metrics.gaugeValue(observability::kUnitsOfWorkOpen), before + 2);
  }
  EXPECT_DOUBLE_EQ(metrics.gaugeValue(observability::kUnitsOfWorkOpen), before);
}
