#ifndef LEDGER_CORE_VALIDATION_HPP_
#define LEDGER_CORE_VALIDATION_HPP_

#include "ledger_types.hpp"

#include <optional>
#include <string>

namespace ledger {
namespace core {

constexpr size_t kMaxDescriptionLength = 255;

// Each check throws ValidationError, NotFoundError or UnauthorizedError.

void validateAmount(Cents amount);

/**
 * True when `text` is well-formed UTF-8 (no overlong forms, surrogates or
 * code points above U+10FFFF).
 */
bool isValidUtf8(const std::string& text);

void validateDescription(const std::string& description);

void validateAccountHolderId(const std::string& account_holder_id);

/**
 * Rejects `current + amount` when it would overflow the balance type.
 */
void validateCreditHeadroom(Cents current, Cents amount);

Account requireAccount(std::optional<Account> account, const std::string& account_id);

void requireOwner(const Account& account, const std::string& account_holder_id);

void requireActive(const Account& account);

}  // namespace core
}  // namespace ledger

#endif  // LEDGER_CORE_VALIDATION_HPP_
