#ifndef LEDGER_CORE_IDENTIFIERS_HPP_
#define LEDGER_CORE_IDENTIFIERS_HPP_

#include <string>

namespace ledger {
namespace core {

/**
 * Generates a random (version 4) UUID in canonical lowercase form.
 * Thread-safe.
 */
std::string newUuid();

/**
 * Returns true when `text` is a canonical 8-4-4-4-12 hex UUID.
 */
bool isUuid(const std::string& text);

/**
 * Lowercases `id`, so that every spelling of one UUID names the same row
 * and sorts to the same place in the lock order.
 */
std::string canonicalId(const std::string& id);

/**
 * Returns `count` uniformly random decimal digits. Thread-safe.
 */
std::string randomDigits(int count);

}  // namespace core
}  // namespace ledger

#endif  // LEDGER_CORE_IDENTIFIERS_HPP_
