#ifndef LEDGER_LEDGER_TYPES_HPP_
#define LEDGER_LEDGER_TYPES_HPP_

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ledger {

// All monetary values are integers in minor currency units (cents).
using Cents = std::int64_t;

using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds>;

/**
 * Source of creation timestamps for stored rows. Tests inject a manual clock.
 */
using Clock = std::function<Timestamp()>;

Clock systemClock();

enum class AccountType {
  CHECKING,
  SAVINGS
};

enum class TransactionType {
  CREDIT,
  DEBIT
};

enum class TransactionStatus {
  APPROVED,
  DECLINED
};

/**
 * A bank account owned by exactly one account holder.
 * `cached_balance` is advisory; the transaction log is the source of truth.
 */
struct Account {
  std::string id;
  std::string account_holder_id;
  AccountType account_type = AccountType::CHECKING;
  std::string account_number;
  std::string currency = "USD";
  bool is_active = true;
  Cents cached_balance = 0;
  Timestamp created_at{};
};

/**
 * A debit card linked to a single account. Only the last four digits of
 * the card number are retained.
 */
struct Card {
  std::string id;
  std::string account_id;
  std::string last_four;
  int expiration_month = 0;
  int expiration_year = 0;
  bool is_active = true;
  Timestamp created_at{};
};

/**
 * One immutable ledger entry. A debit sets `from_account_id`, a credit sets
 * `to_account_id`; transfer legs share a `transfer_pair_id`.
 */
struct Transaction {
  std::string id;
  TransactionType type = TransactionType::CREDIT;
  Cents amount = 0;
  std::optional<std::string> from_account_id;
  std::optional<std::string> to_account_id;
  TransactionStatus status = TransactionStatus::APPROVED;
  std::string description;
  std::optional<std::string> transfer_pair_id;
  std::optional<std::string> card_id;
  Timestamp created_at{};

  // True when this entry debits or credits `account_id`.
  bool touches(const std::string& account_id) const;
};

/**
 * Read filter over the transaction log. Unset fields do not constrain.
 * `since` is inclusive, `until` is exclusive.
 */
struct TransactionFilter {
  std::optional<std::string> account_id;
  std::optional<TransactionStatus> status;
  std::optional<TransactionType> type;
  std::optional<std::string> transfer_pair_id;
  std::optional<Timestamp> since;
  std::optional<Timestamp> until;
  bool newest_first = false;
  std::optional<std::size_t> limit;
  std::size_t offset = 0;

  bool matches(const Transaction& txn) const;
};

// Business outcome of an authorization. A decline is not an error.
enum class Outcome {
  APPROVED,
  DECLINED
};

struct TransactionResult {
  Outcome outcome = Outcome::APPROVED;
  Transaction transaction;
  Cents available_balance = 0;  // computed balance seen when deciding
};

struct TransferResult {
  Outcome outcome = Outcome::APPROVED;
  std::string transfer_pair_id;
  Transaction debit;
  std::optional<Transaction> credit;  // never present on a decline
  Cents available_balance = 0;
};

struct IntegrityReport {
  std::string account_id;
  Cents cached_balance = 0;
  Cents computed_balance = 0;
  bool match = true;
  std::string currency;
};

struct StatementView {
  std::string account_id;
  int year = 0;
  int month = 0;
  Cents opening_balance = 0;
  Cents closing_balance = 0;
  Cents total_credits = 0;
  Cents total_debits = 0;
  std::vector<Transaction> transactions;
};

std::string toString(AccountType type);
std::string toString(TransactionType type);
std::string toString(TransactionStatus status);
std::string toString(Outcome outcome);

// Parsers return nullopt on unknown names.
std::optional<AccountType> parseAccountType(const std::string& name);
std::optional<TransactionType> parseTransactionType(const std::string& name);
std::optional<TransactionStatus> parseTransactionStatus(const std::string& name);

}  // namespace ledger

#endif  // LEDGER_LEDGER_TYPES_HPP_
