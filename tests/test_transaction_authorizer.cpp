#include "core/account_service.hpp"
#include "core/balance_evaluator.hpp"
#include "core/transaction_authorizer.hpp"
#include "core/validation.hpp"
#include "errors.hpp"
#include "in_memory_ledger_store.hpp"
#include "observability/metrics.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <string>

using namespace ledger;

// Test fixture for single-account authorization
class TransactionAuthorizerTest : public ::testing::Test {
 protected:
  TransactionAuthorizerTest()
      : evaluator_(store_), authorizer_(store_, evaluator_), accounts_(store_, evaluator_) {}

  void SetUp() override {
    account_ = accounts_.createAccount("alice").id;
  }

  size_t logSize(const std::string& account_id) {
    auto uow = store_.begin();
    TransactionFilter filter;
    filter.account_id = account_id;
    return uow->transactions(filter).size();
  }

  InMemoryLedgerStore store_;
  core::BalanceEvaluator evaluator_;
  core::TransactionAuthorizer authorizer_;
  core::AccountService accounts_;
  std::string account_;
};

TEST_F(TransactionAuthorizerTest, CreditIsApproved) {
  auto result = authorizer_.authorize("alice", account_, TransactionType::CREDIT, 10000, "Payroll");

  EXPECT_EQ(result.outcome, Outcome::APPROVED);
  EXPECT_EQ(result.transaction.status, TransactionStatus::APPROVED);
  EXPECT_EQ(result.transaction.to_account_id, account_);
  EXPECT_FALSE(result.transaction.from_account_id.has_value());
  EXPECT_EQ(result.transaction.description, "Payroll");
  EXPECT_FALSE(result.transaction.id.empty());

  auto report = evaluator_.checkIntegrity(account_);
  EXPECT_EQ(report.computed_balance, 10000);
  EXPECT_TRUE(report.match);
}

TEST_F(TransactionAuthorizerTest, DebitWithinBalanceIsApproved) {
  authorizer_.authorize("alice", account_, TransactionType::CREDIT, 10000);

  auto result = authorizer_.authorize("alice", account_, TransactionType::DEBIT, 10000);
  EXPECT_EQ(result.outcome, Outcome::APPROVED);
  EXPECT_EQ(result.available_balance, 10000);
  EXPECT_EQ(result.transaction.from_account_id, account_);

  EXPECT_EQ(evaluator_.checkIntegrity(account_).computed_balance, 0);
}

TEST_F(TransactionAuthorizerTest, OverdraftIsDeclinedAndRecorded) {
  authorizer_.authorize("alice", account_, TransactionType::CREDIT, 10000);

  auto& metrics = observability::getGlobalMetrics();
  double declined_before = metrics.counterValue(observability::kTransactionsDeclined);

  auto result = authorizer_.authorize("alice", account_, TransactionType::DEBIT, 15000);
  EXPECT_EQ(result.outcome, Outcome::DECLINED);
  EXPECT_EQ(result.transaction.status, TransactionStatus::DECLINED);
  EXPECT_EQ(result.available_balance, 10000);

  auto report = evaluator_.checkIntegrity(account_);
  EXPECT_EQ(report.computed_balance, 10000);
  EXPECT_EQ(report.cached_balance, 10000);
  EXPECT_EQ(logSize(account_), 2u);

  auto uow = store_.begin();
  auto stored = uow->findTransaction(result.transaction.id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status, TransactionStatus::DECLINED);

  EXPECT_EQ(metrics.counterValue(observability::kTransactionsDeclined), declined_before + 1);
}

TEST_F(TransactionAuthorizerTest, DebitOnEmptyAccountIsDeclined) {
  auto result = authorizer_.authorize("alice", account_, TransactionType::DEBIT, 1);
  EXPECT_EQ(result.outcome, Outcome::DECLINED);
  EXPECT_EQ(evaluator_.checkIntegrity(account_).computed_balance, 0);
}

TEST_F(TransactionAuthorizerTest, InvalidAmountsTouchNothing) {
  EXPECT_THROW(authorizer_.authorize("alice", account_, TransactionType::CREDIT, 0),
               ValidationError);
  EXPECT_THROW(authorizer_.authorize("alice", account_, TransactionType::DEBIT, -5),
               ValidationError);
  EXPECT_EQ(logSize(account_), 0u);
}

TEST_F(TransactionAuthorizerTest, LongDescriptionIsRejected) {
  std::string description(core::kMaxDescriptionLength + 1, 'x');
  EXPECT_THROW(
      authorizer_.authorize("alice", account_, TransactionType::CREDIT, 100, description),
      ValidationError);

  std::string longest(core::kMaxDescriptionLength, 'x');
  EXPECT_EQ(authorizer_.authorize("alice", account_, TransactionType::CREDIT, 100, longest).outcome,
            Outcome::APPROVED);
}

TEST_F(TransactionAuthorizerTest, InvalidUtf8DescriptionIsRejected) {
  EXPECT_THROW(
      authorizer_.authorize("alice", account_, TransactionType::CREDIT, 100, "refund \xff"),
      ValidationError);
  EXPECT_EQ(logSize(account_), 0u);

  EXPECT_EQ(authorizer_.authorize("alice", account_, TransactionType::CREDIT, 100,
                                  "Caf\xc3\xa9").outcome,
            Outcome::APPROVED);
}

TEST_F(TransactionAuthorizerTest, SystemicFailureRollsBack) {
  authorizer_.authorize("alice", account_, TransactionType::CREDIT, 4000);

  ledger::testing::FaultInjectingStore faulty(store_);
  core::BalanceEvaluator evaluator(faulty);
  core::TransactionAuthorizer authorizer(faulty, evaluator);
  auto& metrics = observability::getGlobalMetrics();
  const double failures = metrics.counterValue(observability::kSystemicFailures);

  faulty.failOnInsert(1);
  EXPECT_THROW(authorizer.authorize("alice", account_, TransactionType::DEBIT, 1000),
               ConstraintViolationError);
  faulty.failOnInsert(1, /*retryable=*/true);
  EXPECT_THROW(authorizer.authorize("alice", account_, TransactionType::DEBIT, 1000),
               StoreUnavailableError);
  faulty.failOnInsert(0);

  EXPECT_DOUBLE_EQ(metrics.counterValue(observability::kSystemicFailures), failures + 2);
  EXPECT_EQ(logSize(account_), 1u);
  auto report = evaluator_.checkIntegrity(account_);
  EXPECT_EQ(report.computed_balance, 4000);
  EXPECT_EQ(report.cached_balance, 4000);

  // The row lock was released by the rollback.
  EXPECT_EQ(authorizer.authorize("alice", account_, TransactionType::DEBIT, 1000).outcome,
            Outcome::APPROVED);
  EXPECT_EQ(evaluator_.checkIntegrity(account_).computed_balance, 3000);
}

TEST_F(TransactionAuthorizerTest, UnknownAccountIsNotFound) {
  EXPECT_THROW(authorizer_.authorize("alice", "no-such-account", TransactionType::CREDIT, 100),
               NotFoundError);
}

TEST_F(TransactionAuthorizerTest, ForeignAccountIsUnauthorized) {
  EXPECT_THROW(authorizer_.authorize("mallory", account_, TransactionType::CREDIT, 100),
               UnauthorizedError);
  EXPECT_EQ(logSize(account_), 0u);
}

TEST_F(TransactionAuthorizerTest, CreditOverflowIsRejected) {
  authorizer_.authorize("alice", account_, TransactionType::CREDIT,
                        std::numeric_limits<Cents>::max() - 10);
  EXPECT_THROW(authorizer_.authorize("alice", account_, TransactionType::CREDIT, 11),
               ValidationError);
  EXPECT_EQ(authorizer_.authorize("alice", account_, TransactionType::CREDIT, 10).outcome,
            Outcome::APPROVED);
}

TEST_F(TransactionAuthorizerTest, InactiveAccountIsRejected) {
  Account dormant;
  dormant.account_holder_id = "alice";
  dormant.account_number = "5555555555";
  dormant.is_active = false;
  {
    auto uow = store_.begin();
    dormant = uow->insertAccount(dormant);
    uow->commit();
  }
  EXPECT_THROW(authorizer_.authorize("alice", dormant.id, TransactionType::CREDIT, 100),
               ValidationError);
}

// Card rules
TEST_F(TransactionAuthorizerTest, CardDebitIsRecordedWithCard) {
  authorizer_.authorize("alice", account_, TransactionType::CREDIT, 5000);
  Card card = accounts_.issueCard("alice", account_);

  auto result =
      authorizer_.authorize("alice", account_, TransactionType::DEBIT, 1200, "Groceries", card.id);
  EXPECT_EQ(result.outcome, Outcome::APPROVED);
  EXPECT_EQ(result.transaction.card_id, card.id);
}

TEST_F(TransactionAuthorizerTest, CardCannotBackCredit) {
  Card card = accounts_.issueCard("alice", account_);
  EXPECT_THROW(
      authorizer_.authorize("alice", account_, TransactionType::CREDIT, 100, "", card.id),
      ValidationError);
}

TEST_F(TransactionAuthorizerTest, CardMustBelongToAccountAndBeActive) {
  std::string other = accounts_.createAccount("alice").id;
  authorizer_.authorize("alice", account_, TransactionType::CREDIT, 5000);
  Card foreign = accounts_.issueCard("alice", other);

  EXPECT_THROW(
      authorizer_.authorize("alice", account_, TransactionType::DEBIT, 100, "", foreign.id),
      ValidationError);
  EXPECT_THROW(
      authorizer_.authorize("alice", account_, TransactionType::DEBIT, 100, "", std::string("nope")),
      NotFoundError);

  Card card = accounts_.issueCard("alice", account_);
  accounts_.deactivateCard("alice", account_);
  EXPECT_THROW(
      authorizer_.authorize("alice", account_, TransactionType::DEBIT, 100, "", card.id),
      ValidationError);
  EXPECT_EQ(evaluator_.checkIntegrity(account_).computed_balance, 5000);
}
