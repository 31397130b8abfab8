#include "core/account_service.hpp"

#include "core/calendar.hpp"
#include "core/identifiers.hpp"
#include "core/validation.hpp"
#include "errors.hpp"
#include "observability/logger.hpp"

#include <cctype>

namespace ledger {
namespace core {

namespace {

constexpr int kAccountNumberDigits = 10;
constexpr int kAccountNumberAttempts = 10;
constexpr int kCardValidityYears = 3;

bool isCurrencyCode(const std::string& code) {
  if (code.size() != 3) return false;
  for (char c : code) {
    if (!std::isupper(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

}  // namespace

AccountService::AccountService(LedgerStore& store, const BalanceEvaluator& evaluator, Clock clock)
    : store_(store), evaluator_(evaluator), clock_(std::move(clock)) {
}

Account AccountService::createAccount(const std::string& account_holder_id,
                                      AccountType type,
                                      const std::string& currency) {
  validateAccountHolderId(account_holder_id);
  if (!isCurrencyCode(currency)) {
    throw ValidationError("currency must be a three-letter ISO 4217 code");
  }

  auto uow = store_.begin();

  std::optional<std::string> number;
  for (int attempt = 0; attempt < kAccountNumberAttempts; ++attempt) {
    std::string candidate = randomDigits(kAccountNumberDigits);
    if (!uow->findAccountByNumber(candidate)) {
      number = candidate;
      break;
    }
  }
  if (!number) {
    throw SystemicError("Failed to generate a unique account number", false);
  }

  Account account;
  account.account_holder_id = account_holder_id;
  account.account_type = type;
  account.account_number = *number;
  account.currency = currency;
  account = uow->insertAccount(account);
  uow->commit();

  LEDGER_LOG_INFO("Account " + account.id + " opened for holder " + account_holder_id);
  return account;
}

Account AccountService::getAccount(const std::string& account_holder_id,
                                   const std::string& account_id) {
  auto uow = store_.begin();
  return ownedAccount(*uow, account_holder_id, account_id);
}

std::vector<Account> AccountService::listAccounts(const std::string& account_holder_id) {
  auto uow = store_.begin();
  return uow->accountsForHolder(account_holder_id);
}

Account AccountService::findByAccountNumber(const std::string& account_number) {
  auto uow = store_.begin();
  auto account = uow->findAccountByNumber(account_number);
  if (!account) {
    throw NotFoundError("Account number " + account_number + " not found");
  }
  return *account;
}

IntegrityReport AccountService::getBalance(const std::string& account_holder_id,
                                           const std::string& account_id) {
  auto uow = store_.begin();
  const Account account = ownedAccount(*uow, account_holder_id, account_id);
  return evaluator_.checkIntegrity(*uow, account);
}

IntegrityReport AccountService::getBalanceUnscoped(const std::string& account_id) {
  return evaluator_.checkIntegrity(account_id);
}

std::vector<Account> AccountService::listAllAccounts() {
  auto uow = store_.begin();
  return uow->allAccounts();
}

Account AccountService::getAccountUnscoped(const std::string& account_id) {
  auto uow = store_.begin();
  return requireAccount(uow->findAccount(canonicalId(account_id)), account_id);
}

Card AccountService::issueCard(const std::string& account_holder_id,
                               const std::string& account_id) {
  auto uow = store_.begin();
  const Account account = ownedAccount(*uow, account_holder_id, account_id);
  requireActive(account);
  if (uow->cardForAccount(account.id)) {
    throw ConflictError("Account " + account_id + " already has a card");
  }

  // Visa-like number; only the last four digits are kept.
  const std::string number = "4" + randomDigits(15);
  const YearMonth issued = yearMonthOf(clock_());

  Card card;
  card.account_id = account.id;
  card.last_four = number.substr(number.size() - 4);
  card.expiration_month = issued.month;
  card.expiration_year = issued.year + kCardValidityYears;
  card = uow->insertCard(card);
  uow->commit();

  LEDGER_LOG_INFO("Card ending " + card.last_four + " issued for account " + account.id);
  return card;
}

Card AccountService::getCard(const std::string& account_holder_id, const std::string& account_id) {
  auto uow = store_.begin();
  const Account account = ownedAccount(*uow, account_holder_id, account_id);
  auto card = uow->cardForAccount(account.id);
  if (!card) {
    throw NotFoundError("No card found for this account");
  }
  return *card;
}

Card AccountService::deactivateCard(const std::string& account_holder_id,
                                    const std::string& account_id) {
  auto uow = store_.begin();
  const Account account = ownedAccount(*uow, account_holder_id, account_id);
  auto card = uow->cardForAccount(account.id);
  if (!card) {
    throw NotFoundError("No card found for this account");
  }
  uow->setCardActive(card->id, false);
  uow->commit();
  card->is_active = false;
  return *card;
}

std::vector<Transaction> AccountService::listTransactions(const std::string& account_holder_id,
                                                          const std::string& account_id,
                                                          TransactionFilter filter) {
  applyPaging(filter);
  filter.transfer_pair_id.reset();
  filter.since.reset();
  filter.until.reset();

  auto uow = store_.begin();
  filter.account_id = ownedAccount(*uow, account_holder_id, account_id).id;
  return uow->transactions(filter);
}

Transaction AccountService::getTransaction(const std::string& account_holder_id,
                                           const std::string& account_id,
                                           const std::string& transaction_id) {
  auto uow = store_.begin();
  const Account account = ownedAccount(*uow, account_holder_id, account_id);
  auto txn = uow->findTransaction(canonicalId(transaction_id));
  if (!txn || !txn->touches(account.id)) {
    throw NotFoundError("Transaction not found");
  }
  return *txn;
}

std::vector<Transaction> AccountService::listAllTransactions(TransactionFilter filter) {
  applyPaging(filter);
  if (filter.account_id) {
    filter.account_id = canonicalId(*filter.account_id);
  }
  auto uow = store_.begin();
  return uow->transactions(filter);
}

std::vector<Transaction> AccountService::listTransactionsUnscoped(const std::string& account_id,
                                                                  TransactionFilter filter) {
  applyPaging(filter);
  filter.transfer_pair_id.reset();
  filter.since.reset();
  filter.until.reset();

  auto uow = store_.begin();
  filter.account_id = requireAccount(uow->findAccount(canonicalId(account_id)), account_id).id;
  return uow->transactions(filter);
}

Transaction AccountService::getTransactionUnscoped(const std::string& transaction_id) {
  auto uow = store_.begin();
  auto txn = uow->findTransaction(canonicalId(transaction_id));
  if (!txn) {
    throw NotFoundError("Transaction not found");
  }
  return *txn;
}

Account AccountService::ownedAccount(UnitOfWork& uow, const std::string& account_holder_id,
                                     const std::string& account_id) {
  Account account = requireAccount(uow.findAccount(canonicalId(account_id)), account_id);
  requireOwner(account, account_holder_id);
  return account;
}

void AccountService::applyPaging(TransactionFilter& filter) {
  if (!filter.limit) {
    filter.limit = kDefaultPageSize;
  }
  if (*filter.limit == 0 || *filter.limit > kMaxPageSize) {
    throw ValidationError("limit must be between 1 and " + std::to_string(kMaxPageSize));
  }
  filter.newest_first = true;
}

}  // namespace core
}  // namespace ledger
