#ifndef LEDGER_DATABASE_POSTGRES_LEDGER_STORE_HPP_
#define LEDGER_DATABASE_POSTGRES_LEDGER_STORE_HPP_

#include "database/connection_pool.hpp"
#include "ledger_store.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace ledger {
namespace database {

/**
 * Ledger store backed by PostgreSQL.
 *
 * Every unit of work runs inside one database transaction on a leased
 * connection. Row locks are taken with SELECT ... FOR UPDATE and bounded by
 * the session's lock_timeout.
 */
class PostgresLedgerStore : public LedgerStore {
 public:
  struct Config {
    PostgresConnection::Config connection;
    std::chrono::milliseconds lock_timeout{5000};
    std::chrono::milliseconds acquire_timeout{5000};
  };

  explicit PostgresLedgerStore(const Config& config, Clock clock = systemClock());
  ~PostgresLedgerStore() override = default;

  // Non-copyable
  PostgresLedgerStore(const PostgresLedgerStore&) = delete;
  PostgresLedgerStore& operator=(const PostgresLedgerStore&) = delete;

  std::unique_ptr<UnitOfWork> begin() override;

  std::string describe() const override;

  /**
   * Executes the schema script at `path`. Throws SystemicError when the
   * file cannot be read or a statement fails.
   */
  void initializeSchema(const std::string& path);

 private:
  Config config_;
  Clock clock_;
  ConnectionPool pool_;
};

}  // namespace database
}  // namespace ledger

#endif  // LEDGER_DATABASE_POSTGRES_LEDGER_STORE_HPP_
