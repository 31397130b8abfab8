#ifndef LEDGER_CONFIG_LEDGER_CONFIG_HPP_
#define LEDGER_CONFIG_LEDGER_CONFIG_HPP_

#include "database/postgres_connection.hpp"
#include "observability/logger.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

namespace ledger {
namespace config {

enum class Backend {
  MEMORY,
  POSTGRES
};

std::string toString(Backend backend);

/**
 * Runtime configuration. Every field has a default; a JSON file may
 * override any subset, and command-line flags override the file.
 *
 * {
 *   "backend": "postgres",
 *   "postgres": {"host": "db", "port": 5432, "database": "ledger",
 *                "user": "ledger_user", "password": "",
 *                "connect_timeout": 30, "pool_size": 10},
 *   "schema_path": "database/schema.sql",
 *   "lock_timeout_ms": 5000,
 *   "retry_attempts": 3,
 *   "log_level": "info"
 * }
 */
struct LedgerConfig {
  Backend backend = Backend::MEMORY;
  database::PostgresConnection::Config postgres;
  std::string schema_path = "database/schema.sql";
  std::chrono::milliseconds lock_timeout{5000};
  int retry_attempts = 3;
  observability::LogLevel log_level = observability::LogLevel::INFO;

  /**
   * Applies the keys present in `json` on top of the current values.
   * Throws ValidationError on unknown enum names or wrongly typed values.
   */
  void merge(const nlohmann::json& json);

  /**
   * Throws ValidationError if any value is out of range.
   */
  void validate() const;

  nlohmann::json toJson() const;

  /**
   * Defaults overlaid with the JSON file at `path`. Throws ValidationError
   * when the file is missing or malformed.
   */
  static LedgerConfig loadFile(const std::string& path);
};

}  // namespace config
}  // namespace ledger

#endif  // LEDGER_CONFIG_LEDGER_CONFIG_HPP_
