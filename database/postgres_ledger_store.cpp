#include "database/postgres_ledger_store.hpp"

#include "core/identifiers.hpp"
#include "errors.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <fstream>
#include <set>
#include <sstream>

namespace ledger {
namespace database {

namespace {

using Params = std::vector<std::optional<std::string>>;

const char* const kAccountColumns =
    "id::text, account_holder_id, account_type, account_number, currency, is_active, "
    "cached_balance, (EXTRACT(EPOCH FROM created_at) * 1000000)::bigint";

const char* const kCardColumns =
    "id::text, account_id::text, last_four, expiration_month, expiration_year, is_active, "
    "(EXTRACT(EPOCH FROM created_at) * 1000000)::bigint";

const char* const kTransactionColumns =
    "id::text, type, amount, from_account_id::text, to_account_id::text, status, description, "
    "transfer_pair_id::text, card_id::text, (EXTRACT(EPOCH FROM created_at) * 1000000)::bigint";

// Binds a microsecond count as a timestamptz without going through text.
std::string timestampSql(int placeholder) {
  return "('epoch'::timestamptz + $" + std::to_string(placeholder) +
         "::bigint * INTERVAL '1 microsecond')";
}

std::string micros(Timestamp ts) {
  return std::to_string(ts.time_since_epoch().count());
}

Timestamp timestampAt(const PgResult& result, int row, int column) {
  return Timestamp(std::chrono::microseconds(result.integer(row, column)));
}

Account accountAt(const PgResult& result, int row) {
  Account account;
  account.id = result.text(row, 0);
  account.account_holder_id = result.text(row, 1);
  auto type = parseAccountType(result.text(row, 2));
  if (!type) {
    throw SystemicError("unknown account type in row " + account.id, false);
  }
  account.account_type = *type;
  account.account_number = result.text(row, 3);
  account.currency = result.text(row, 4);
  account.is_active = result.boolean(row, 5);
  account.cached_balance = result.integer(row, 6);
  account.created_at = timestampAt(result, row, 7);
  return account;
}

Card cardAt(const PgResult& result, int row) {
  Card card;
  card.id = result.text(row, 0);
  card.account_id = result.text(row, 1);
  card.last_four = result.text(row, 2);
  card.expiration_month = static_cast<int>(result.integer(row, 3));
  card.expiration_year = static_cast<int>(result.integer(row, 4));
  card.is_active = result.boolean(row, 5);
  card.created_at = timestampAt(result, row, 6);
  return card;
}

Transaction transactionAt(const PgResult& result, int row) {
  Transaction txn;
  txn.id = result.text(row, 0);
  auto type = parseTransactionType(result.text(row, 1));
  auto status = parseTransactionStatus(result.text(row, 5));
  if (!type || !status) {
    throw SystemicError("unknown type or status in transaction " + txn.id, false);
  }
  txn.type = *type;
  txn.amount = result.integer(row, 2);
  txn.from_account_id = result.optionalText(row, 3);
  txn.to_account_id = result.optionalText(row, 4);
  txn.status = *status;
  txn.description = result.text(row, 6);
  txn.transfer_pair_id = result.optionalText(row, 7);
  txn.card_id = result.optionalText(row, 8);
  txn.created_at = timestampAt(result, row, 9);
  return txn;
}

}  // namespace

/**
 * Unit of work over one PostgreSQL transaction.
 */
class PostgresUnitOfWork : public UnitOfWork {
 public:
  PostgresUnitOfWork(std::unique_ptr<ConnectionLease> lease, const Clock& clock,
                     std::chrono::milliseconds lock_timeout)
      : lease_(std::move(lease)), clock_(clock) {
    guard_ = std::make_unique<TransactionGuard>(conn());
    // SET does not accept bind parameters; the value is an integer we format.
    conn().execute("SET LOCAL lock_timeout = '" + std::to_string(lock_timeout.count()) + "ms'");
    observability::getGlobalMetrics().incrementGauge(observability::kUnitsOfWorkOpen);
  }

  ~PostgresUnitOfWork() override {
    // The guard rolls back before the lease hands the connection back.
    guard_.reset();
    observability::getGlobalMetrics().decrementGauge(observability::kUnitsOfWorkOpen);
  }

  std::optional<Account> findAccount(const std::string& account_id) override {
    if (!core::isUuid(account_id)) return std::nullopt;
    PgResult result = conn().executeParams(
        std::string("SELECT ") + kAccountColumns + " FROM accounts WHERE id = $1::uuid",
        {account_id});
    if (result.rows() == 0) return std::nullopt;
    return accountAt(result, 0);
  }

  std::optional<Account> lockAccount(const std::string& account_id) override {
    ensureOpen();
    if (!core::isUuid(account_id)) return std::nullopt;
    PgResult result = conn().executeParams(
        std::string("SELECT ") + kAccountColumns +
            " FROM accounts WHERE id = $1::uuid FOR UPDATE",
        {account_id});
    if (result.rows() == 0) return std::nullopt;
    // Keyed by the canonical spelling the rows come back in.
    locked_ids_.insert(core::canonicalId(account_id));
    return accountAt(result, 0);
  }

  std::optional<Account> findAccountByNumber(const std::string& account_number) override {
    PgResult result = conn().executeParams(
        std::string("SELECT ") + kAccountColumns + " FROM accounts WHERE account_number = $1",
        {account_number});
    if (result.rows() == 0) return std::nullopt;
    return accountAt(result, 0);
  }

  std::vector<Account> accountsForHolder(const std::string& account_holder_id) override {
    PgResult result = conn().executeParams(
        std::string("SELECT ") + kAccountColumns +
            " FROM accounts WHERE account_holder_id = $1 ORDER BY created_at, account_number",
        {account_holder_id});
    std::vector<Account> accounts;
    for (int row = 0; row < result.rows(); ++row) {
      accounts.push_back(accountAt(result, row));
    }
    return accounts;
  }

  std::vector<Account> allAccounts() override {
    PgResult result = conn().execute(std::string("SELECT ") + kAccountColumns +
                                     " FROM accounts ORDER BY created_at, account_number");
    std::vector<Account> accounts;
    for (int row = 0; row < result.rows(); ++row) {
      accounts.push_back(accountAt(result, row));
    }
    return accounts;
  }

  std::optional<Card> findCard(const std::string& card_id) override {
    if (!core::isUuid(card_id)) return std::nullopt;
    PgResult result = conn().executeParams(
        std::string("SELECT ") + kCardColumns + " FROM cards WHERE id = $1::uuid", {card_id});
    if (result.rows() == 0) return std::nullopt;
    return cardAt(result, 0);
  }

  std::optional<Card> cardForAccount(const std::string& account_id) override {
    if (!core::isUuid(account_id)) return std::nullopt;
    PgResult result = conn().executeParams(
        std::string("SELECT ") + kCardColumns + " FROM cards WHERE account_id = $1::uuid",
        {account_id});
    if (result.rows() == 0) return std::nullopt;
    return cardAt(result, 0);
  }

  std::vector<Transaction> transactions(const TransactionFilter& filter) override {
    if ((filter.account_id && !core::isUuid(*filter.account_id)) ||
        (filter.transfer_pair_id && !core::isUuid(*filter.transfer_pair_id))) {
      return {};
    }

    std::ostringstream sql;
    Params params;
    sql << "SELECT " << kTransactionColumns << " FROM transactions WHERE TRUE";

    if (filter.account_id) {
      params.push_back(*filter.account_id);
      sql << " AND (from_account_id = $" << params.size() << "::uuid OR to_account_id = $"
          << params.size() << "::uuid)";
    }
    if (filter.status) {
      params.push_back(toString(*filter.status));
      sql << " AND status = $" << params.size();
    }
    if (filter.type) {
      params.push_back(toString(*filter.type));
      sql << " AND type = $" << params.size();
    }
    if (filter.transfer_pair_id) {
      params.push_back(*filter.transfer_pair_id);
      sql << " AND transfer_pair_id = $" << params.size() << "::uuid";
    }
    if (filter.since) {
      params.push_back(micros(*filter.since));
      sql << " AND created_at >= " << timestampSql(static_cast<int>(params.size()));
    }
    if (filter.until) {
      params.push_back(micros(*filter.until));
      sql << " AND created_at < " << timestampSql(static_cast<int>(params.size()));
    }

    const char* direction = filter.newest_first ? " DESC" : "";
    sql << " ORDER BY created_at" << direction << ", seq" << direction;
    if (filter.limit) {
      sql << " LIMIT " << *filter.limit;
    }
    if (filter.offset > 0) {
      sql << " OFFSET " << filter.offset;
    }

    PgResult result = conn().executeParams(sql.str(), params);
    std::vector<Transaction> txns;
    txns.reserve(static_cast<size_t>(result.rows()));
    for (int row = 0; row < result.rows(); ++row) {
      txns.push_back(transactionAt(result, row));
    }
    return txns;
  }

  std::optional<Transaction> findTransaction(const std::string& transaction_id) override {
    if (!core::isUuid(transaction_id)) return std::nullopt;
    PgResult result = conn().executeParams(
        std::string("SELECT ") + kTransactionColumns + " FROM transactions WHERE id = $1::uuid",
        {transaction_id});
    if (result.rows() == 0) return std::nullopt;
    return transactionAt(result, 0);
  }

  Transaction insertTransaction(Transaction txn) override {
    ensureOpen();
    if (txn.id.empty()) {
      txn.id = core::newUuid();
    }
    txn.created_at = clock_();
    conn().executeParams(
        "INSERT INTO transactions (id, type, amount, from_account_id, to_account_id, status, "
        "description, transfer_pair_id, card_id, created_at) VALUES "
        "($1::uuid, $2, $3::bigint, $4::uuid, $5::uuid, $6, $7, $8::uuid, $9::uuid, " +
            timestampSql(10) + ")",
        {txn.id, toString(txn.type), std::to_string(txn.amount), txn.from_account_id,
         txn.to_account_id, toString(txn.status), txn.description, txn.transfer_pair_id,
         txn.card_id, micros(txn.created_at)});
    return txn;
  }

  Account insertAccount(Account account) override {
    ensureOpen();
    if (account.id.empty()) {
      account.id = core::newUuid();
    }
    account.created_at = clock_();
    conn().executeParams(
        "INSERT INTO accounts (id, account_holder_id, account_type, account_number, currency, "
        "is_active, cached_balance, created_at) VALUES "
        "($1::uuid, $2, $3, $4, $5, $6::boolean, $7::bigint, " + timestampSql(8) + ")",
        {account.id, account.account_holder_id, toString(account.account_type),
         account.account_number, account.currency, std::string(account.is_active ? "t" : "f"),
         std::to_string(account.cached_balance), micros(account.created_at)});
    // A freshly inserted row is invisible to others until commit.
    locked_ids_.insert(core::canonicalId(account.id));
    return account;
  }

  Card insertCard(Card card) override {
    ensureOpen();
    if (card.id.empty()) {
      card.id = core::newUuid();
    }
    card.created_at = clock_();
    conn().executeParams(
        "INSERT INTO cards (id, account_id, last_four, expiration_month, expiration_year, "
        "is_active, created_at) VALUES "
        "($1::uuid, $2::uuid, $3, $4::smallint, $5::smallint, $6::boolean, " +
            timestampSql(7) + ")",
        {card.id, card.account_id, card.last_four, std::to_string(card.expiration_month),
         std::to_string(card.expiration_year), std::string(card.is_active ? "t" : "f"),
         micros(card.created_at)});
    return card;
  }

  void setCardActive(const std::string& card_id, bool is_active) override {
    ensureOpen();
    PgResult result = conn().executeParams(
        "UPDATE cards SET is_active = $2::boolean WHERE id = $1::uuid",
        {card_id, std::string(is_active ? "t" : "f")});
    if (result.affectedRows() != 1) {
      throw ConstraintViolationError("unknown card " + card_id);
    }
  }

  void updateCachedBalance(const std::string& account_id, Cents balance) override {
    ensureOpen();
    if (!locked_ids_.count(core::canonicalId(account_id))) {
      throw SystemicError("cached balance of " + account_id + " written without its row lock", false);
    }
    conn().executeParams("UPDATE accounts SET cached_balance = $2::bigint WHERE id = $1::uuid",
                         {account_id, std::to_string(balance)});
  }

  void commitWork() override {
    ensureOpen();
    guard_->commit();
  }

  void rollback() override {
    if (guard_) {
      guard_->rollback();
    }
  }

 private:
  PostgresConnection& conn() { return **lease_; }

  void ensureOpen() const {
    if (guard_->finished()) {
      throw SystemicError("unit of work already finished", false);
    }
  }

  std::unique_ptr<ConnectionLease> lease_;
  std::unique_ptr<TransactionGuard> guard_;
  const Clock& clock_;
  std::set<std::string> locked_ids_;
};

PostgresLedgerStore::PostgresLedgerStore(const Config& config, Clock clock)
    : config_(config),
      clock_(std::move(clock)),
      pool_(config.connection, config.acquire_timeout) {
}

std::unique_ptr<UnitOfWork> PostgresLedgerStore::begin() {
  return std::make_unique<PostgresUnitOfWork>(pool_.acquire(), clock_, config_.lock_timeout);
}

std::string PostgresLedgerStore::describe() const {
  const auto& c = config_.connection;
  return "postgres://" + c.username + "@" + c.host + ":" + std::to_string(c.port) + "/" +
         c.database;
}

void PostgresLedgerStore::initializeSchema(const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    throw SystemicError("cannot read schema file " + path, false);
  }
  std::stringstream script;
  script << file.rdbuf();

  auto lease = pool_.acquire();
  (*lease)->execute(script.str());
  LEDGER_LOG_INFO("Schema initialized from " + path);
}

}  // namespace database
}  // namespace ledger
