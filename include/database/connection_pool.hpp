#ifndef LEDGER_DATABASE_CONNECTION_POOL_HPP_
#define LEDGER_DATABASE_CONNECTION_POOL_HPP_

#include "database/postgres_connection.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

namespace ledger {
namespace database {

class ConnectionPool;

/**
 * Exclusive use of one pooled connection. Returns it to the pool on
 * destruction.
 */
class ConnectionLease {
 public:
  ConnectionLease(ConnectionPool& pool, std::unique_ptr<PostgresConnection> conn);
  ~ConnectionLease();

  ConnectionLease(const ConnectionLease&) = delete;
  ConnectionLease& operator=(const ConnectionLease&) = delete;

  PostgresConnection& operator*() const { return *conn_; }
  PostgresConnection* operator->() const { return conn_.get(); }

 private:
  ConnectionPool& pool_;
  std::unique_ptr<PostgresConnection> conn_;
};

/**
 * Bounded pool of PostgreSQL connections. Connections are opened lazily up
 * to `max_connections`; callers beyond that wait for a release.
 */
class ConnectionPool {
 public:
  ConnectionPool(const PostgresConnection::Config& config,
                 std::chrono::milliseconds acquire_timeout);
  ~ConnectionPool() = default;

  // Non-copyable
  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;

  /**
   * Lease a connected connection. Throws StoreUnavailableError when none
   * becomes available within the acquire timeout or the server refuses
   * the connection.
   */
  std::unique_ptr<ConnectionLease> acquire();

 private:
  friend class ConnectionLease;

  void release(std::unique_ptr<PostgresConnection> conn);

  PostgresConnection::Config config_;
  std::chrono::milliseconds acquire_timeout_;

  mutable std::mutex mutex_;
  std::condition_variable available_;
  std::vector<std::unique_ptr<PostgresConnection>> idle_;
  int open_count_;
};

}  // namespace database
}  // namespace ledger

#endif  // LEDGER_DATABASE_CONNECTION_POOL_HPP_
