#include "core/account_service.hpp"
#include "core/balance_evaluator.hpp"
#include "core/statement_aggregator.hpp"
#include "core/transaction_authorizer.hpp"
#include "core/transfer_coordinator.hpp"
#include "errors.hpp"
#include "in_memory_ledger_store.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace ledger;
using ledger::testing::ManualClock;
using ledger::testing::utc;

class StatementAggregatorTest : public ::testing::Test {
 protected:
  StatementAggregatorTest()
      : clock_(utc(2026, 1, 15)),
        store_(InMemoryLedgerStore::Config{}, clock_.clock()),
        evaluator_(store_),
        authorizer_(store_, evaluator_),
        coordinator_(store_, evaluator_),
        aggregator_(store_, evaluator_),
        accounts_(store_, evaluator_, clock_.clock()) {}

  void SetUp() override {
    account_ = accounts_.createAccount("alice").id;
    other_ = accounts_.createAccount("bob").id;
  }

  void at(Timestamp ts) { clock_.set(ts); }

  ManualClock clock_;
  InMemoryLedgerStore store_;
  core::BalanceEvaluator evaluator_;
  core::TransactionAuthorizer authorizer_;
  core::TransferCoordinator coordinator_;
  core::StatementAggregator aggregator_;
  core::AccountService accounts_;
  std::string account_;
  std::string other_;
};

TEST_F(StatementAggregatorTest, MonthWithActivity) {
  at(utc(2026, 1, 20));
  authorizer_.authorize("alice", account_, TransactionType::CREDIT, 10000);

  at(utc(2026, 2, 3));
  authorizer_.authorize("alice", account_, TransactionType::CREDIT, 2000);
  at(utc(2026, 2, 10));
  authorizer_.authorize("alice", account_, TransactionType::DEBIT, 500);
  at(utc(2026, 2, 11));
  authorizer_.authorize("alice", account_, TransactionType::DEBIT, 90000);  // declined
  at(utc(2026, 2, 28, 23, 59, 59));
  coordinator_.transfer("alice", account_, other_, 1500);

  at(utc(2026, 3, 1));
  authorizer_.authorize("alice", account_, TransactionType::CREDIT, 777);

  auto view = aggregator_.statement("alice", account_, 2026, 2);
  EXPECT_EQ(view.year, 2026);
  EXPECT_EQ(view.month, 2);
  EXPECT_EQ(view.opening_balance, 10000);
  EXPECT_EQ(view.total_credits, 2000);
  EXPECT_EQ(view.total_debits, 2000);
  EXPECT_EQ(view.closing_balance, 10000);

  // Declined entries are listed but not totalled; order is chronological.
  ASSERT_EQ(view.transactions.size(), 4u);
  EXPECT_EQ(view.transactions[0].amount, 2000);
  EXPECT_EQ(view.transactions[2].status, TransactionStatus::DECLINED);
  EXPECT_EQ(view.transactions[3].transfer_pair_id.has_value(), true);
  for (size_t i = 1; i < view.transactions.size(); ++i) {
    EXPECT_LE(view.transactions[i - 1].created_at, view.transactions[i].created_at);
  }
}

TEST_F(StatementAggregatorTest, ClosingOfOneMonthOpensTheNext) {
  at(utc(2026, 2, 5));
  authorizer_.authorize("alice", account_, TransactionType::CREDIT, 4000);
  at(utc(2026, 3, 5));
  authorizer_.authorize("alice", account_, TransactionType::DEBIT, 1000);

  auto february = aggregator_.statement("alice", account_, 2026, 2);
  auto march = aggregator_.statement("alice", account_, 2026, 3);
  EXPECT_EQ(february.closing_balance, march.opening_balance);
  EXPECT_EQ(march.closing_balance, 3000);
}

TEST_F(StatementAggregatorTest, EntryAtMonthStartBelongsToThatMonth) {
  at(utc(2026, 4, 1));
  authorizer_.authorize("alice", account_, TransactionType::CREDIT, 300);

  auto march = aggregator_.statement("alice", account_, 2026, 3);
  auto april = aggregator_.statement("alice", account_, 2026, 4);
  EXPECT_TRUE(march.transactions.empty());
  EXPECT_EQ(march.closing_balance, 0);
  EXPECT_EQ(april.opening_balance, 0);
  EXPECT_EQ(april.transactions.size(), 1u);
  EXPECT_EQ(april.closing_balance, 300);
}

TEST_F(StatementAggregatorTest, DecemberRollsIntoNextYear) {
  at(utc(2026, 12, 31, 23, 59, 59));
  authorizer_.authorize("alice", account_, TransactionType::CREDIT, 100);
  at(utc(2027, 1, 1));
  authorizer_.authorize("alice", account_, TransactionType::CREDIT, 200);

  auto december = aggregator_.statement("alice", account_, 2026, 12);
  EXPECT_EQ(december.total_credits, 100);
  auto january = aggregator_.statement("alice", account_, 2027, 1);
  EXPECT_EQ(january.opening_balance, 100);
  EXPECT_EQ(january.total_credits, 200);
}

TEST_F(StatementAggregatorTest, EmptyMonthCarriesBalance) {
  at(utc(2026, 1, 20));
  authorizer_.authorize("alice", account_, TransactionType::CREDIT, 5000);

  auto view = aggregator_.statement("alice", account_, 2026, 6);
  EXPECT_EQ(view.opening_balance, 5000);
  EXPECT_EQ(view.closing_balance, 5000);
  EXPECT_TRUE(view.transactions.empty());
}

TEST_F(StatementAggregatorTest, InvalidPeriodIsRejected) {
  EXPECT_THROW(aggregator_.statement("alice", account_, std::nullopt, 2), ValidationError);
  EXPECT_THROW(aggregator_.statement("alice", account_, 2026, std::nullopt), ValidationError);
  EXPECT_THROW(aggregator_.statement("alice", account_, 2026, 0), ValidationError);
  EXPECT_THROW(aggregator_.statement("alice", account_, 2026, 13), ValidationError);
  EXPECT_THROW(aggregator_.statement("alice", account_, 0, 1), ValidationError);
  EXPECT_THROW(aggregator_.statement("alice", account_, 1999, 12), ValidationError);
  EXPECT_THROW(aggregator_.statement("alice", account_, 2101, 1), ValidationError);
  EXPECT_NO_THROW(aggregator_.statement("alice", account_, 2000, 1));
  EXPECT_NO_THROW(aggregator_.statement("alice", account_, 2100, 12));
}

TEST_F(StatementAggregatorTest, AccountChecks) {
  EXPECT_THROW(aggregator_.statement("alice", "missing", 2026, 1), NotFoundError);
  EXPECT_THROW(aggregator_.statement("bob", account_, 2026, 1), UnauthorizedError);
}

TEST_F(StatementAggregatorTest, AggregateCountsOnlyThisAccountsSide) {
  Transaction in;
  in.type = TransactionType::CREDIT;
  in.amount = 800;
  in.to_account_id = "x";

  Transaction out;
  out.type = TransactionType::DEBIT;
  out.amount = 300;
  out.from_account_id = "x";

  Transaction declined = out;
  declined.status = TransactionStatus::DECLINED;

  auto view = core::StatementAggregator::aggregate("x", 2026, 5, 100, {in, out, declined});
  EXPECT_EQ(view.total_credits, 800);
  EXPECT_EQ(view.total_debits, 300);
  EXPECT_EQ(view.closing_balance, 600);
  EXPECT_EQ(view.transactions.size(), 3u);
}
