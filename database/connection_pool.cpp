#include "database/connection_pool.hpp"

#include "errors.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

namespace ledger {
namespace database {

ConnectionLease::ConnectionLease(ConnectionPool& pool, std::unique_ptr<PostgresConnection> conn)
    : pool_(pool), conn_(std::move(conn)) {
  observability::getGlobalMetrics().incrementGauge(observability::kPoolConnectionsLeased);
}

ConnectionLease::~ConnectionLease() {
  if (conn_) {
    pool_.release(std::move(conn_));
  }
  observability::getGlobalMetrics().decrementGauge(observability::kPoolConnectionsLeased);
}

ConnectionPool::ConnectionPool(const PostgresConnection::Config& config,
                               std::chrono::milliseconds acquire_timeout)
    : config_(config), acquire_timeout_(acquire_timeout), open_count_(0) {
}

std::unique_ptr<ConnectionLease> ConnectionPool::acquire() {
  std::unique_lock<std::mutex> lock(mutex_);

  bool ready = available_.wait_for(lock, acquire_timeout_, [this] {
    return !idle_.empty() || open_count_ < config_.max_connections;
  });
  if (!ready) {
    throw StoreUnavailableError("no database connection available within " +
                                std::to_string(acquire_timeout_.count()) + "ms");
  }

  if (!idle_.empty()) {
    std::unique_ptr<PostgresConnection> conn = std::move(idle_.back());
    idle_.pop_back();
    lock.unlock();
    if (!conn->isConnected() && !conn->connect()) {
      lock.lock();
      --open_count_;
      observability::getGlobalMetrics().setGauge(observability::kPoolConnectionsOpen, open_count_);
      available_.notify_one();
      throw StoreUnavailableError("lost connection to " + conn->getConnectionInfo());
    }
    return std::make_unique<ConnectionLease>(*this, std::move(conn));
  }

  // Reserve the slot before connecting outside the lock.
  ++open_count_;
  observability::getGlobalMetrics().setGauge(observability::kPoolConnectionsOpen, open_count_);
  lock.unlock();

  auto conn = std::make_unique<PostgresConnection>(config_);
  if (!conn->connect()) {
    lock.lock();
    --open_count_;
    observability::getGlobalMetrics().setGauge(observability::kPoolConnectionsOpen, open_count_);
    available_.notify_one();
    throw StoreUnavailableError("cannot connect to " + conn->getConnectionInfo());
  }
  return std::make_unique<ConnectionLease>(*this, std::move(conn));
}

void ConnectionPool::release(std::unique_ptr<PostgresConnection> conn) {
  if (conn->inTransaction()) {
    LEDGER_LOG_WARN("Connection returned to pool inside a transaction; rolling back");
    conn->rollbackTransaction();
  }
  std::lock_guard<std::mutex> lock(mutex_);
  idle_.push_back(std::move(conn));
  available_.notify_one();
}

}  // namespace database
}  // namespace ledger
