#include "codec/result_codec.hpp"
#include "config/ledger_config.hpp"
#include "core/calendar.hpp"
#include "errors.hpp"
#include "ledger_engine.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace {

const int kExitOk = 0;
const int kExitError = 1;
const int kExitDeclined = 2;

const char* const kUsage =
    "Usage: ledger_cli [options] <command> [args]\n"
    "\n"
    "Options:\n"
    "  --config FILE            JSON configuration file\n"
    "  --backend memory|postgres\n"
    "  --log-level LEVEL        debug, info, warn, error, fatal\n"
    "  --pg-host HOST  --pg-port PORT  --pg-database NAME\n"
    "  --pg-user USER  --pg-password PASSWORD\n"
    "  --lock-timeout-ms N      row lock wait bound\n"
    "  --retry-attempts N       runs per operation on transient failures\n"
    "\n"
    "Commands:\n"
    "  init-schema [PATH]\n"
    "  create-account HOLDER [checking|savings] [CURRENCY]\n"
    "  accounts HOLDER\n"
    "  credit HOLDER ACCOUNT AMOUNT [DESCRIPTION]\n"
    "  debit HOLDER ACCOUNT AMOUNT [DESCRIPTION] [--card CARD]\n"
    "  transfer HOLDER FROM TO AMOUNT [DESCRIPTION]\n"
    "  balance HOLDER ACCOUNT\n"
    "  transactions HOLDER ACCOUNT [--status S] [--type T] [--limit N] [--offset N]\n"
    "  statement HOLDER ACCOUNT YEAR MONTH\n"
    "  issue-card HOLDER ACCOUNT\n"
    "  demo                     scripted run on a throwaway in-memory ledger\n"
    "\n"
    "Audit commands (no ownership check):\n"
    "  admin-accounts\n"
    "  admin-account ACCOUNT\n"
    "  admin-balance ACCOUNT\n"
    "  admin-transactions [ACCOUNT] [--status S] [--type T] [--limit N] [--offset N]\n"
    "  admin-transaction TRANSACTION\n"
    "\n"
    "Every command except demo needs --backend postgres: the memory backend\n"
    "does not outlive the process.\n"
    "\n"
    "Amounts are integer minor units (cents). Exit status: 0 ok, 2 declined, 1 error.\n";

// Commands that run against a persistent store.
const std::set<std::string> kStoreCommands = {
    "init-schema", "create-account", "accounts", "credit", "debit", "transfer",
    "balance", "transactions", "statement", "issue-card",
    "admin-accounts", "admin-account", "admin-balance", "admin-transactions",
    "admin-transaction"};

/**
 * Command words plus the --name value options that followed them.
 */
struct Invocation {
  std::vector<std::string> args;
  std::map<std::string, std::string> options;

  const std::string& arg(size_t index, const char* name) const {
    if (index >= args.size()) {
      throw ledger::ValidationError(std::string("missing argument ") + name);
    }
    return args[index];
  }

  std::optional<std::string> optionalArg(size_t index) const {
    if (index >= args.size()) return std::nullopt;
    return args[index];
  }

  std::optional<std::string> option(const std::string& name) const {
    auto it = options.find(name);
    if (it == options.end()) return std::nullopt;
    return it->second;
  }
};

std::int64_t parseInteger(const std::string& text, const char* name) {
  size_t consumed = 0;
  std::int64_t value = 0;
  try {
    value = std::stoll(text, &consumed);
  } catch (const std::exception&) {
    consumed = 0;
  }
  if (consumed == 0 || consumed != text.size()) {
    throw ledger::ValidationError(std::string(name) + " must be an integer, got '" + text + "'");
  }
  return value;
}

int parseSmallInteger(const std::string& text, const char* name) {
  std::int64_t value = parseInteger(text, name);
  if (value < -100000 || value > 100000) {
    throw ledger::ValidationError(std::string(name) + " out of range");
  }
  return static_cast<int>(value);
}

Invocation parseArguments(int argc, char* argv[], ledger::config::LedgerConfig& config) {
  Invocation invocation;
  nlohmann::json overrides = nlohmann::json::object();
  std::optional<std::string> config_path;

  for (int i = 1; i < argc; ++i) {
    std::string token = argv[i];
    if (token.rfind("--", 0) != 0) {
      invocation.args.push_back(token);
      continue;
    }
    if (i + 1 >= argc) {
      throw ledger::ValidationError("option " + token + " needs a value");
    }
    std::string value = argv[++i];

    if (token == "--config") {
      config_path = value;
    } else if (token == "--backend") {
      overrides["backend"] = value;
    } else if (token == "--log-level") {
      overrides["log_level"] = value;
    } else if (token == "--pg-host") {
      overrides["postgres"]["host"] = value;
    } else if (token == "--pg-port") {
      overrides["postgres"]["port"] = parseSmallInteger(value, "--pg-port");
    } else if (token == "--pg-database") {
      overrides["postgres"]["database"] = value;
    } else if (token == "--pg-user") {
      overrides["postgres"]["user"] = value;
    } else if (token == "--pg-password") {
      overrides["postgres"]["password"] = value;
    } else if (token == "--lock-timeout-ms") {
      overrides["lock_timeout_ms"] = parseInteger(value, "--lock-timeout-ms");
    } else if (token == "--retry-attempts") {
      overrides["retry_attempts"] = parseSmallInteger(value, "--retry-attempts");
    } else {
      invocation.options[token.substr(2)] = value;
    }
  }

  if (config_path) {
    config = ledger::config::LedgerConfig::loadFile(*config_path);
  }
  config.merge(overrides);
  config.validate();
  return invocation;
}

void print(const nlohmann::json& json) {
  std::cout << json.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

ledger::TransactionFilter parseFilter(const Invocation& in) {
  ledger::TransactionFilter filter;
  if (auto status = in.option("status")) {
    filter.status = ledger::parseTransactionStatus(*status);
    if (!filter.status) throw ledger::ValidationError("unknown status '" + *status + "'");
  }
  if (auto type = in.option("type")) {
    filter.type = ledger::parseTransactionType(*type);
    if (!filter.type) throw ledger::ValidationError("unknown type '" + *type + "'");
  }
  if (auto limit = in.option("limit")) {
    std::int64_t value = parseInteger(*limit, "--limit");
    if (value <= 0) throw ledger::ValidationError("--limit must be positive");
    filter.limit = static_cast<size_t>(value);
  }
  if (auto offset = in.option("offset")) {
    std::int64_t value = parseInteger(*offset, "--offset");
    if (value < 0) throw ledger::ValidationError("--offset cannot be negative");
    filter.offset = static_cast<size_t>(value);
  }
  return filter;
}

int exitCodeFor(ledger::Outcome outcome) {
  return outcome == ledger::Outcome::APPROVED ? kExitOk : kExitDeclined;
}

int runDemo() {
  using ledger::TransactionType;

  ledger::config::LedgerConfig config;
  auto engine = ledger::LedgerEngine::fromConfig(config);
  nlohmann::json report;

  auto alice = engine->createAccount("alice");
  auto bob = engine->createAccount("bob", ledger::AccountType::SAVINGS);
  report["accounts"] = ledger::codec::toJson(std::vector<ledger::Account>{alice, bob});

  report["funding"] = {
      ledger::codec::toJson(engine->authorize("alice", alice.id, TransactionType::CREDIT, 5000,
                                              "Opening deposit")),
      ledger::codec::toJson(engine->authorize("bob", bob.id, TransactionType::CREDIT, 1000,
                                              "Opening deposit")),
  };

  report["transfer"] = ledger::codec::toJson(
      engine->transfer("alice", alice.id, bob.id, 2500, "Rent share"));
  report["overdraft_attempt"] = ledger::codec::toJson(
      engine->authorize("bob", bob.id, TransactionType::DEBIT, 15000, "Large purchase"));

  auto card = engine->issueCard("alice", alice.id);
  report["card"] = ledger::codec::toJson(card);
  report["card_purchase"] = ledger::codec::toJson(engine->authorize(
      "alice", alice.id, TransactionType::DEBIT, 1200, "Groceries", card.id));

  report["balances"] = {
      ledger::codec::toJson(engine->getBalance("alice", alice.id)),
      ledger::codec::toJson(engine->getBalance("bob", bob.id)),
  };

  auto now = ledger::core::yearMonthOf(ledger::systemClock()());
  report["statement"] = ledger::codec::toJson(
      engine->statement("bob", bob.id, now.year, now.month));

  report["metrics"] = ledger::observability::getGlobalMetrics().exportMetrics();

  print(report);
  return kExitOk;
}

int runCommand(const std::string& command, const Invocation& in,
               const ledger::config::LedgerConfig& config) {
  using ledger::TransactionType;

  if (command == "demo") {
    return runDemo();
  }
  if (!kStoreCommands.count(command)) {
    throw ledger::ValidationError("unknown command '" + command + "'\n\n" + kUsage);
  }
  if (config.backend != ledger::config::Backend::POSTGRES) {
    throw ledger::ValidationError("'" + command +
                                  "' needs --backend postgres; the memory backend only lives "
                                  "for one process (try 'demo')");
  }

  auto engine = ledger::LedgerEngine::fromConfig(config);

  if (command == "init-schema") {
    std::string path = in.optionalArg(1).value_or(config.schema_path);
    engine->initializeSchema(path);
    print({{"schema", path}, {"status", "initialized"}});
    return kExitOk;
  }

  if (command == "create-account") {
    auto type = ledger::AccountType::CHECKING;
    if (auto name = in.optionalArg(2)) {
      auto parsed = ledger::parseAccountType(*name);
      if (!parsed) {
        throw ledger::ValidationError("unknown account type '" + *name + "'");
      }
      type = *parsed;
    }
    std::string currency = in.optionalArg(3).value_or("USD");
    print(ledger::codec::toJson(engine->createAccount(in.arg(1, "HOLDER"), type, currency)));
    return kExitOk;
  }

  if (command == "accounts") {
    print(ledger::codec::toJson(engine->listAccounts(in.arg(1, "HOLDER"))));
    return kExitOk;
  }

  if (command == "credit" || command == "debit") {
    auto type = command == "credit" ? TransactionType::CREDIT : TransactionType::DEBIT;
    auto result = engine->authorize(in.arg(1, "HOLDER"), in.arg(2, "ACCOUNT"), type,
                                    parseInteger(in.arg(3, "AMOUNT"), "AMOUNT"),
                                    in.optionalArg(4).value_or(""), in.option("card"));
    print(ledger::codec::toJson(result));
    return exitCodeFor(result.outcome);
  }

  if (command == "transfer") {
    auto result = engine->transfer(in.arg(1, "HOLDER"), in.arg(2, "FROM"), in.arg(3, "TO"),
                                   parseInteger(in.arg(4, "AMOUNT"), "AMOUNT"),
                                   in.optionalArg(5).value_or(""));
    print(ledger::codec::toJson(result));
    return exitCodeFor(result.outcome);
  }

  if (command == "balance") {
    print(ledger::codec::toJson(engine->getBalance(in.arg(1, "HOLDER"), in.arg(2, "ACCOUNT"))));
    return kExitOk;
  }

  if (command == "transactions") {
    print(ledger::codec::toJson(
        engine->listTransactions(in.arg(1, "HOLDER"), in.arg(2, "ACCOUNT"), parseFilter(in))));
    return kExitOk;
  }

  if (command == "statement") {
    std::optional<int> year;
    std::optional<int> month;
    if (auto text = in.optionalArg(3)) year = parseSmallInteger(*text, "YEAR");
    if (auto text = in.optionalArg(4)) month = parseSmallInteger(*text, "MONTH");
    print(ledger::codec::toJson(
        engine->statement(in.arg(1, "HOLDER"), in.arg(2, "ACCOUNT"), year, month)));
    return kExitOk;
  }

  if (command == "issue-card") {
    print(ledger::codec::toJson(engine->issueCard(in.arg(1, "HOLDER"), in.arg(2, "ACCOUNT"))));
    return kExitOk;
  }

  if (command == "admin-accounts") {
    print(ledger::codec::toJson(engine->listAllAccounts()));
    return kExitOk;
  }

  if (command == "admin-account") {
    print(ledger::codec::toJson(engine->getAccountUnscoped(in.arg(1, "ACCOUNT"))));
    return kExitOk;
  }

  if (command == "admin-balance") {
    print(ledger::codec::toJson(engine->getBalanceUnscoped(in.arg(1, "ACCOUNT"))));
    return kExitOk;
  }

  if (command == "admin-transactions") {
    auto filter = parseFilter(in);
    if (auto account = in.optionalArg(1)) {
      print(ledger::codec::toJson(engine->listTransactionsUnscoped(*account, filter)));
    } else {
      print(ledger::codec::toJson(engine->listAllTransactions(filter)));
    }
    return kExitOk;
  }

  // admin-transaction
  print(ledger::codec::toJson(engine->getTransactionUnscoped(in.arg(1, "TRANSACTION"))));
  return kExitOk;
}

}  // namespace

int main(int argc, char* argv[]) {
  ledger::config::LedgerConfig config;

  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]) == "--help" || std::string(argv[i]) == "-h") {
      std::cout << kUsage;
      return kExitOk;
    }
  }

  try {
    Invocation invocation = parseArguments(argc, argv, config);
    ledger::observability::Logger::getInstance().setLogLevel(config.log_level);

    if (invocation.args.empty()) {
      std::cerr << kUsage;
      return kExitError;
    }
    return runCommand(invocation.args[0], invocation, config);

  } catch (const ledger::LedgerError& e) {
    print(ledger::codec::errorToJson(e));
    return kExitError;
  } catch (const std::exception& e) {
    LEDGER_LOG_FATAL(std::string("Unhandled error: ") + e.what());
    print({{"error", "systemic_error"}, {"message", e.what()}, {"retryable", false}});
    return kExitError;
  }
}
