#ifndef LEDGER_DATABASE_POSTGRES_CONNECTION_HPP_
#define LEDGER_DATABASE_POSTGRES_CONNECTION_HPP_

#include <postgresql/libpq-fe.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ledger {
namespace database {

/**
 * Owning handle for a PGresult.
 */
class PgResult {
 public:
  PgResult() = default;
  explicit PgResult(PGresult* result) : result_(result, &PQclear) {}

  int rows() const { return result_ ? PQntuples(result_.get()) : 0; }
  bool isNull(int row, int column) const;
  std::string text(int row, int column) const;
  std::optional<std::string> optionalText(int row, int column) const;
  std::int64_t integer(int row, int column) const;
  bool boolean(int row, int column) const;

  // Rows touched by an INSERT/UPDATE/DELETE.
  int affectedRows() const;

 private:
  std::unique_ptr<PGresult, decltype(&PQclear)> result_{nullptr, &PQclear};
};

/**
 * Maps a failed statement to the ledger error taxonomy and throws:
 * lock and serialization failures become LockTimeoutError, connection
 * failures StoreUnavailableError, data exceptions ValidationError,
 * integrity failures ConstraintViolationError, anything else a fatal
 * SystemicError.
 */
[[noreturn]] void throwForSqlState(const std::string& sqlstate, const std::string& message);

/**
 * PostgreSQL database connection wrapper.
 * Handles connection management and parameterized query execution.
 * Statement failures are reported as ledger exceptions.
 */
class PostgresConnection {
 public:
  /**
   * Connection configuration
   */
  struct Config {
    std::string host = "localhost";
    int port = 5432;
    std::string database = "ledger";
    std::string username = "ledger_user";
    std::string password = "";
    int connection_timeout = 30;  // seconds
    int max_connections = 10;
  };

  explicit PostgresConnection(const Config& config);
  ~PostgresConnection();

  // Non-copyable
  PostgresConnection(const PostgresConnection&) = delete;
  PostgresConnection& operator=(const PostgresConnection&) = delete;

  /**
   * Connect to the database. Returns false and logs on failure.
   */
  bool connect();

  /**
   * Disconnect from the database.
   */
  void disconnect();

  /**
   * Check if connected.
   */
  bool isConnected() const;

  /**
   * Execute one or more statements without parameters.
   */
  PgResult execute(const std::string& query);

  /**
   * Execute a parameterized query. A nullopt parameter binds SQL NULL.
   */
  PgResult executeParams(const std::string& query,
                         const std::vector<std::optional<std::string>>& params);

  /**
   * Begin a transaction.
   */
  void beginTransaction();

  /**
   * Commit a transaction.
   */
  void commitTransaction();

  /**
   * Rollback a transaction. Never throws; failures are logged.
   */
  void rollbackTransaction() noexcept;

  bool inTransaction() const;

  /**
   * Get connection info for logging.
   */
  std::string getConnectionInfo() const;

 private:
  PgResult checked(PGresult* result);
  void disconnectLocked();

  Config config_;
  PGconn* connection_;
  mutable std::mutex mutex_;
  bool in_transaction_;
};

/**
 * RAII wrapper for database transactions. Rolls back unless committed.
 */
class TransactionGuard {
 public:
  explicit TransactionGuard(PostgresConnection& conn);
  ~TransactionGuard();

  // Non-copyable
  TransactionGuard(const TransactionGuard&) = delete;
  TransactionGuard& operator=(const TransactionGuard&) = delete;

  /**
   * Commit the transaction.
   */
  void commit();

  /**
   * Rollback the transaction.
   */
  void rollback();

  bool finished() const { return finished_; }

 private:
  PostgresConnection& conn_;
  bool finished_;
};

}  // namespace database
}  // namespace ledger

#endif  // LEDGER_DATABASE_POSTGRES_CONNECTION_HPP_
