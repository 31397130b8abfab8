#include "core/calendar.hpp"
#include "core/identifiers.hpp"
#include "core/lock_ordering.hpp"
#include "core/validation.hpp"
#include "database/postgres_connection.hpp"
#include "errors.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <functional>
#include <set>
#include <string>
#include <vector>

using namespace ledger;
using ledger::testing::utc;

// Lock ordering
TEST(LockOrderingTest, SortsAndDeduplicates) {
  std::vector<std::string> ids{"b", "a", "c", "a"};
  EXPECT_EQ(core::lockOrder(ids), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(LockOrderingTest, SameSetGivesSameOrderRegardlessOfInput) {
  EXPECT_EQ(core::lockOrder(std::vector<std::string>{"x", "y"}),
            core::lockOrder(std::vector<std::string>{"y", "x"}));
}

TEST(LockOrderingTest, CustomComparator) {
  auto order = core::lockOrder(std::vector<int>{1, 3, 2, 3}, std::greater<int>());
  EXPECT_EQ(order, (std::vector<int>{3, 2, 1}));
}

TEST(LockOrderingTest, LockInOrderVisitsSortedIds) {
  std::vector<std::string> visited;
  auto acquired = core::lockInOrder(std::vector<std::string>{"to", "from"},
                                    [&visited](const std::string& id) {
                                      visited.push_back(id);
                                      return id.size();
                                    });
  EXPECT_EQ(visited, (std::vector<std::string>{"from", "to"}));
  ASSERT_EQ(acquired.size(), 2u);
  EXPECT_EQ(acquired[0].first, "from");
  EXPECT_EQ(acquired[0].second, 4u);
}

// Retry policy
TEST(RetryTest, RetryableErrorsAreRetried) {
  int calls = 0;
  int result = runWithRetry(3, [&] {
    if (++calls < 3) throw LockTimeoutError("busy");
    return 42;
  });
  EXPECT_EQ(result, 42);
  EXPECT_EQ(calls, 3);
}

TEST(RetryTest, AttemptsAreBounded) {
  int calls = 0;
  EXPECT_THROW(runWithRetry(3, [&] {
                 ++calls;
                 throw StoreUnavailableError("down");
               }),
               StoreUnavailableError);
  EXPECT_EQ(calls, 3);
}

TEST(RetryTest, FatalAndDomainErrorsAreNotRetried) {
  int calls = 0;
  EXPECT_THROW(runWithRetry(5, [&] {
                 ++calls;
                 throw ConstraintViolationError("bad row");
               }),
               ConstraintViolationError);
  EXPECT_EQ(calls, 1);

  calls = 0;
  EXPECT_THROW(runWithRetry(5, [&] {
                 ++calls;
                 throw ValidationError("bad amount");
               }),
               ValidationError);
  EXPECT_EQ(calls, 1);
}

TEST(RetryTest, UncertainCommitIsNotRetried) {
  int calls = 0;
  EXPECT_THROW(runWithRetry(5, [&] {
                 ++calls;
                 throw CommitUncertainError("connection lost during COMMIT");
               }),
               CommitUncertainError);
  EXPECT_EQ(calls, 1);
  EXPECT_FALSE(CommitUncertainError("x").retryable());
}

// Error taxonomy
TEST(ErrorsTest, KindsAndNames) {
  EXPECT_EQ(ValidationError("x").kind(), ErrorKind::VALIDATION);
  EXPECT_EQ(NotFoundError("x").kind(), ErrorKind::NOT_FOUND);
  EXPECT_EQ(UnauthorizedError("x").kind(), ErrorKind::UNAUTHORIZED);
  EXPECT_EQ(ConflictError("x").kind(), ErrorKind::CONFLICT);
  EXPECT_EQ(toString(ErrorKind::UNAUTHORIZED), "unauthorized_access");
  EXPECT_EQ(toString(ErrorKind::SYSTEMIC), "systemic_error");
  EXPECT_FALSE(ConstraintViolationError("x").retryable());
  EXPECT_TRUE(StoreUnavailableError("x").retryable());
}

TEST(ErrorsTest, SqlStateClassification) {
  EXPECT_THROW(database::throwForSqlState("55P03", "lock"), LockTimeoutError);
  EXPECT_THROW(database::throwForSqlState("40P01", "deadlock"), LockTimeoutError);
  EXPECT_THROW(database::throwForSqlState("40001", "serialization"), LockTimeoutError);
  EXPECT_THROW(database::throwForSqlState("08006", "gone"), StoreUnavailableError);
  EXPECT_THROW(database::throwForSqlState("", "no state"), StoreUnavailableError);
  EXPECT_THROW(database::throwForSqlState("23505", "duplicate"), ConstraintViolationError);
  EXPECT_THROW(database::throwForSqlState("23514", "check"), ConstraintViolationError);
  EXPECT_THROW(database::throwForSqlState("22021", "invalid byte sequence"), ValidationError);
  try {
    database::throwForSqlState("42601", "syntax");
    FAIL() << "expected SystemicError";
  } catch (const SystemicError& e) {
    EXPECT_FALSE(e.retryable());
  }
}

// Identifiers
TEST(IdentifiersTest, UuidsAreWellFormedAndDistinct) {
  std::set<std::string> seen;
  for (int i = 0; i < 1000; ++i) {
    std::string id = core::newUuid();
    EXPECT_TRUE(core::isUuid(id)) << id;
    EXPECT_EQ(id[14], '4');
    seen.insert(id);
  }
  EXPECT_EQ(seen.size(), 1000u);
  EXPECT_FALSE(core::isUuid("not-a-uuid"));
  EXPECT_FALSE(core::isUuid("123e4567-e89b-12d3-a456-42661417400g"));
}

TEST(IdentifiersTest, CanonicalIdLowercases) {
  EXPECT_EQ(core::canonicalId("123E4567-E89B-42D3-A456-426614174000"),
            "123e4567-e89b-42d3-a456-426614174000");
  EXPECT_EQ(core::canonicalId("abc-123"), "abc-123");

  // Two spellings of the same pair lock in the same order.
  auto upper = core::lockOrder(std::vector<std::string>{
      core::canonicalId("BBBBBBBB-0000-4000-8000-000000000000"),
      core::canonicalId("aaaaaaaa-0000-4000-8000-000000000000")});
  auto lower = core::lockOrder(std::vector<std::string>{
      "bbbbbbbb-0000-4000-8000-000000000000", "AAAAAAAA-0000-4000-8000-000000000000"});
  EXPECT_EQ(upper.front(), "aaaaaaaa-0000-4000-8000-000000000000");
  EXPECT_NE(lower.front(), upper.front());
}

TEST(ValidationTest, Utf8Checks) {
  EXPECT_TRUE(core::isValidUtf8(""));
  EXPECT_TRUE(core::isValidUtf8("Caf\xc3\xa9 \xe2\x82\xac \xf0\x9f\x92\xb3"));
  EXPECT_FALSE(core::isValidUtf8("bad\xff"));
  EXPECT_FALSE(core::isValidUtf8("\xc3"));          // truncated
  EXPECT_FALSE(core::isValidUtf8("\xc0\xaf"));      // overlong
  EXPECT_FALSE(core::isValidUtf8("\xed\xa0\x80"));  // surrogate

  EXPECT_THROW(core::validateDescription("bad\xff"), ValidationError);
  EXPECT_THROW(core::validateAccountHolderId("bad\xff"), ValidationError);
  EXPECT_THROW(core::validateAccountHolderId(""), ValidationError);
  EXPECT_NO_THROW(core::validateAccountHolderId("alice"));
}

TEST(IdentifiersTest, RandomDigits) {
  std::string digits = core::randomDigits(15);
  ASSERT_EQ(digits.size(), 15u);
  for (char c : digits) EXPECT_TRUE(c >= '0' && c <= '9');
}

// Calendar
TEST(CalendarTest, MonthBoundaries) {
  EXPECT_EQ(core::formatTimestamp(core::monthStart(1970, 1)), "1970-01-01T00:00:00.000000Z");
  EXPECT_EQ(core::formatTimestamp(core::monthStart(2024, 3)), "2024-03-01T00:00:00.000000Z");
  EXPECT_EQ(core::nextMonthStart(2026, 12), core::monthStart(2027, 1));
  EXPECT_EQ(core::nextMonthStart(2024, 2) - core::monthStart(2024, 2),
            std::chrono::hours(24 * 29));
  EXPECT_EQ(core::nextMonthStart(2026, 2) - core::monthStart(2026, 2),
            std::chrono::hours(24 * 28));
}

TEST(CalendarTest, YearMonthOf) {
  auto last_moment = core::monthStart(2026, 4) - std::chrono::microseconds(1);
  EXPECT_EQ(core::yearMonthOf(last_moment).month, 3);
  EXPECT_EQ(core::yearMonthOf(core::monthStart(2026, 4)).month, 4);
  EXPECT_EQ(core::yearMonthOf(utc(2026, 12, 31, 23, 59, 59)).year, 2026);
}

TEST(CalendarTest, FormatKeepsMicroseconds) {
  auto ts = utc(2026, 10, 19, 8, 30, 5) + std::chrono::microseconds(123);
  EXPECT_EQ(core::formatTimestamp(ts), "2026-10-19T08:30:05.000123Z");
}
