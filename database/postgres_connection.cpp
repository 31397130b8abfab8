#include "database/postgres_connection.hpp"

#include "errors.hpp"
#include "observability/logger.hpp"

#include <sstream>

namespace ledger {
namespace database {

bool PgResult::isNull(int row, int column) const {
  return PQgetisnull(result_.get(), row, column) != 0;
}

std::string PgResult::text(int row, int column) const {
  return PQgetvalue(result_.get(), row, column);
}

std::optional<std::string> PgResult::optionalText(int row, int column) const {
  if (isNull(row, column)) return std::nullopt;
  return text(row, column);
}

std::int64_t PgResult::integer(int row, int column) const {
  return std::stoll(PQgetvalue(result_.get(), row, column));
}

bool PgResult::boolean(int row, int column) const {
  return text(row, column) == "t";
}

int PgResult::affectedRows() const {
  const char* tuples = PQcmdTuples(result_.get());
  return (tuples && *tuples) ? std::stoi(tuples) : 0;
}

void throwForSqlState(const std::string& sqlstate, const std::string& message) {
  // 55P03 lock_not_available, 40P01 deadlock_detected, 40001 serialization_failure
  if (sqlstate == "55P03" || sqlstate == "40P01" || sqlstate == "40001") {
    throw LockTimeoutError(message);
  }
  if (sqlstate.empty() || sqlstate.compare(0, 2, "08") == 0 || sqlstate == "57P01") {
    throw StoreUnavailableError(message);
  }
  // Class 22 is bad input data, such as text that is not valid in the
  // database encoding.
  if (sqlstate.compare(0, 2, "22") == 0) {
    throw ValidationError(message);
  }
  if (sqlstate.compare(0, 2, "23") == 0) {
    throw ConstraintViolationError(message);
  }
  throw SystemicError(message + " (SQLSTATE " + sqlstate + ")", false);
}

PostgresConnection::PostgresConnection(const Config& config)
    : config_(config), connection_(nullptr), in_transaction_(false) {
}

PostgresConnection::~PostgresConnection() {
  disconnect();
}

bool PostgresConnection::connect() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (connection_) {
    disconnectLocked();
  }

  // Values are quoted so that empty or spaced values survive.
  auto quote = [](const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
      if (c == '\'' || c == '\\') quoted.push_back('\\');
      quoted.push_back(c);
    }
    return quoted + "'";
  };

  std::stringstream conn_str;
  conn_str << "host=" << quote(config_.host)
           << " port=" << config_.port
           << " dbname=" << quote(config_.database)
           << " user=" << quote(config_.username)
           << " password=" << quote(config_.password)
           << " connect_timeout=" << config_.connection_timeout;

  connection_ = PQconnectdb(conn_str.str().c_str());

  if (PQstatus(connection_) != CONNECTION_OK) {
    LEDGER_LOG_ERROR("Database connection failed: " + std::string(PQerrorMessage(connection_)));
    PQfinish(connection_);
    connection_ = nullptr;
    return false;
  }

  LEDGER_LOG_INFO("Connected to PostgreSQL database: " + getConnectionInfo());
  return true;
}

void PostgresConnection::disconnect() {
  std::lock_guard<std::mutex> lock(mutex_);
  disconnectLocked();
}

void PostgresConnection::disconnectLocked() {
  if (connection_) {
    if (in_transaction_) {
      PGresult* result = PQexec(connection_, "ROLLBACK");
      if (result) PQclear(result);
      in_transaction_ = false;
    }
    PQfinish(connection_);
    connection_ = nullptr;
  }
}

bool PostgresConnection::isConnected() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connection_ && PQstatus(connection_) == CONNECTION_OK;
}

PgResult PostgresConnection::checked(PGresult* result) {
  if (!result) {
    throw StoreUnavailableError("Query execution failed: " + std::string(PQerrorMessage(connection_)));
  }

  PgResult owned(result);
  ExecStatusType status = PQresultStatus(result);
  if (status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK) {
    return owned;
  }

  const char* sqlstate = PQresultErrorField(result, PG_DIAG_SQLSTATE);
  std::string message = PQresultErrorMessage(result);
  if (PQstatus(connection_) != CONNECTION_OK) {
    throw StoreUnavailableError("Connection lost: " + message);
  }
  throwForSqlState(sqlstate ? sqlstate : "", message);
}

PgResult PostgresConnection::execute(const std::string& query) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!connection_) {
    throw StoreUnavailableError("Not connected to " + getConnectionInfo());
  }
  return checked(PQexec(connection_, query.c_str()));
}

PgResult PostgresConnection::executeParams(const std::string& query,
                                           const std::vector<std::optional<std::string>>& params) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!connection_) {
    throw StoreUnavailableError("Not connected to " + getConnectionInfo());
  }

  std::vector<const char*> values;
  values.reserve(params.size());
  for (const auto& param : params) {
    values.push_back(param ? param->c_str() : nullptr);
  }

  return checked(PQexecParams(connection_, query.c_str(), static_cast<int>(values.size()),
                              nullptr, values.data(), nullptr, nullptr, 0));
}

void PostgresConnection::beginTransaction() {
  execute("BEGIN");
  std::lock_guard<std::mutex> lock(mutex_);
  in_transaction_ = true;
}

void PostgresConnection::commitTransaction() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!in_transaction_) {
      throw SystemicError("COMMIT outside of a transaction", false);
    }
    // Whatever the outcome, the server has left the transaction block.
    in_transaction_ = false;
  }
  execute("COMMIT");
}

void PostgresConnection::rollbackTransaction() noexcept {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!in_transaction_ || !connection_) {
    in_transaction_ = false;
    return;
  }

  PGresult* result = PQexec(connection_, "ROLLBACK");
  if (!result || PQresultStatus(result) != PGRES_COMMAND_OK) {
    LEDGER_LOG_ERROR("Rollback failed: " + std::string(PQerrorMessage(connection_)));
  }
  if (result) PQclear(result);
  in_transaction_ = false;
}

bool PostgresConnection::inTransaction() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return in_transaction_;
}

std::string PostgresConnection::getConnectionInfo() const {
  std::stringstream ss;
  ss << config_.username << "@" << config_.host << ":" << config_.port << "/" << config_.database;
  return ss.str();
}

// TransactionGuard implementation
TransactionGuard::TransactionGuard(PostgresConnection& conn)
    : conn_(conn), finished_(false) {
  conn_.beginTransaction();
}

TransactionGuard::~TransactionGuard() {
  if (!finished_) {
    conn_.rollbackTransaction();
  }
}

void TransactionGuard::commit() {
  if (finished_) return;
  finished_ = true;
  conn_.commitTransaction();
}

void TransactionGuard::rollback() {
  if (!finished_) {
    conn_.rollbackTransaction();
    finished_ = true;
  }
}

}  // namespace database
}  // namespace ledger
