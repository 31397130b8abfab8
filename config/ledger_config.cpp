#include "config/ledger_config.hpp"

#include "errors.hpp"

#include <fstream>

namespace ledger {
namespace config {

namespace {

std::string levelName(observability::LogLevel level) {
  switch (level) {
    case observability::LogLevel::DEBUG: return "debug";
    case observability::LogLevel::INFO: return "info";
    case observability::LogLevel::WARN: return "warn";
    case observability::LogLevel::ERROR: return "error";
    case observability::LogLevel::FATAL: return "fatal";
  }
  return "info";
}

template <typename T>
void assign(const nlohmann::json& json, const char* key, T& target) {
  auto it = json.find(key);
  if (it == json.end()) return;
  try {
    target = it->get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw ValidationError(std::string("config key '") + key + "': " + e.what());
  }
}

}  // namespace

std::string toString(Backend backend) {
  switch (backend) {
    case Backend::MEMORY: return "memory";
    case Backend::POSTGRES: return "postgres";
  }
  return "unknown";
}

void LedgerConfig::merge(const nlohmann::json& json) {
  if (!json.is_object()) {
    throw ValidationError("configuration must be a JSON object");
  }

  std::string backend_name = toString(backend);
  assign(json, "backend", backend_name);
  if (backend_name == "memory") {
    backend = Backend::MEMORY;
  } else if (backend_name == "postgres") {
    backend = Backend::POSTGRES;
  } else {
    throw ValidationError("unknown backend '" + backend_name + "'");
  }

  auto pg = json.find("postgres");
  if (pg != json.end()) {
    if (!pg->is_object()) {
      throw ValidationError("config key 'postgres' must be an object");
    }
    assign(*pg, "host", postgres.host);
    assign(*pg, "port", postgres.port);
    assign(*pg, "database", postgres.database);
    assign(*pg, "user", postgres.username);
    assign(*pg, "password", postgres.password);
    assign(*pg, "connect_timeout", postgres.connection_timeout);
    assign(*pg, "pool_size", postgres.max_connections);
  }

  assign(json, "schema_path", schema_path);

  std::int64_t lock_timeout_ms = lock_timeout.count();
  assign(json, "lock_timeout_ms", lock_timeout_ms);
  lock_timeout = std::chrono::milliseconds(lock_timeout_ms);

  assign(json, "retry_attempts", retry_attempts);

  std::string level = levelName(log_level);
  assign(json, "log_level", level);
  auto parsed = observability::parseLogLevel(level);
  if (!parsed) {
    throw ValidationError("unknown log level '" + level + "'");
  }
  log_level = *parsed;
}

void LedgerConfig::validate() const {
  if (lock_timeout.count() <= 0) {
    throw ValidationError("lock_timeout_ms must be positive");
  }
  if (retry_attempts < 1) {
    throw ValidationError("retry_attempts must be at least 1");
  }
  if (backend == Backend::POSTGRES) {
    if (postgres.host.empty() || postgres.database.empty() || postgres.username.empty()) {
      throw ValidationError("postgres host, database and user are required");
    }
    if (postgres.port <= 0 || postgres.port > 65535) {
      throw ValidationError("postgres port out of range");
    }
    if (postgres.max_connections < 1) {
      throw ValidationError("postgres pool_size must be at least 1");
    }
  }
}

nlohmann::json LedgerConfig::toJson() const {
  // The password is never echoed.
  return {
      {"backend", toString(backend)},
      {"postgres",
       {{"host", postgres.host},
        {"port", postgres.port},
        {"database", postgres.database},
        {"user", postgres.username},
        {"connect_timeout", postgres.connection_timeout},
        {"pool_size", postgres.max_connections}}},
      {"schema_path", schema_path},
      {"lock_timeout_ms", lock_timeout.count()},
      {"retry_attempts", retry_attempts},
      {"log_level", levelName(log_level)},
  };
}

LedgerConfig LedgerConfig::loadFile(const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    throw ValidationError("cannot open config file " + path);
  }

  nlohmann::json json;
  try {
    file >> json;
  } catch (const nlohmann::json::parse_error& e) {
    throw ValidationError("malformed config file " + path + ": " + e.what());
  }

  LedgerConfig config;
  config.merge(json);
  return config;
}

}  // namespace config
}  // namespace ledger
