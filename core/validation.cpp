#include "core/validation.hpp"

#include "errors.hpp"

#include <cstdint>
#include <limits>

namespace ledger {
namespace core {

void validateAmount(Cents amount) {
  if (amount <= 0) {
    throw ValidationError("amount must be a positive number of minor units");
  }
}

bool isValidUtf8(const std::string& text) {
  size_t i = 0;
  while (i < text.size()) {
    const unsigned char lead = static_cast<unsigned char>(text[i]);
    size_t length = 0;
    std::uint32_t code_point = 0;
    if (lead < 0x80) {
      ++i;
      continue;
    } else if ((lead & 0xE0) == 0xC0) {
      length = 2;
      code_point = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      length = 3;
      code_point = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      length = 4;
      code_point = lead & 0x07;
    } else {
      return false;
    }
    if (i + length > text.size()) return false;

    for (size_t k = 1; k < length; ++k) {
      const unsigned char next = static_cast<unsigned char>(text[i + k]);
      if ((next & 0xC0) != 0x80) return false;
      code_point = (code_point << 6) | (next & 0x3F);
    }

    static const std::uint32_t kMinimum[] = {0, 0, 0x80, 0x800, 0x10000};
    if (code_point < kMinimum[length] || code_point > 0x10FFFF ||
        (code_point >= 0xD800 && code_point <= 0xDFFF)) {
      return false;
    }
    i += length;
  }
  return true;
}

void validateDescription(const std::string& description) {
  if (description.size() > kMaxDescriptionLength) {
    throw ValidationError("description exceeds " + std::to_string(kMaxDescriptionLength) +
                          " characters");
  }
  if (!isValidUtf8(description)) {
    throw ValidationError("description must be valid UTF-8");
  }
}

void validateAccountHolderId(const std::string& account_holder_id) {
  if (account_holder_id.empty()) {
    throw ValidationError("account holder id is required");
  }
  if (!isValidUtf8(account_holder_id)) {
    throw ValidationError("account holder id must be valid UTF-8");
  }
}

void validateCreditHeadroom(Cents current, Cents amount) {
  if (current > std::numeric_limits<Cents>::max() - amount) {
    throw ValidationError("amount would overflow the account balance");
  }
}

Account requireAccount(std::optional<Account> account, const std::string& account_id) {
  if (!account) {
    throw NotFoundError("Account " + account_id + " not found");
  }
  return *account;
}

void requireOwner(const Account& account, const std::string& account_holder_id) {
  if (account.account_holder_id != account_holder_id) {
    throw UnauthorizedError("You do not have access to this account");
  }
}

void requireActive(const Account& account) {
  if (!account.is_active) {
    throw ValidationError("Account " + account.id + " is not active");
  }
}

}  // namespace core
}  // namespace ledger
