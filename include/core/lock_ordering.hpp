#ifndef LEDGER_CORE_LOCK_ORDERING_HPP_
#define LEDGER_CORE_LOCK_ORDERING_HPP_

#include <algorithm>
#include <functional>
#include <vector>

namespace ledger {
namespace core {

/**
 * Returns the acquisition sequence for a set of resources: duplicates
 * removed, sorted by `Compare`. Any two callers that lock overlapping
 * resource sets through this sequence acquire the shared ones in the same
 * global order and so cannot form a wait cycle.
 */
template <typename Id, typename Compare = std::less<Id>>
std::vector<Id> lockOrder(std::vector<Id> ids, Compare compare = Compare()) {
  std::sort(ids.begin(), ids.end(), compare);
  ids.erase(std::unique(ids.begin(), ids.end(),
                        [&compare](const Id& a, const Id& b) {
                          return !compare(a, b) && !compare(b, a);
                        }),
            ids.end());
  return ids;
}

/**
 * Invokes `lock` for each resource in lock order and collects the results.
 * Stops at the first exception; locks already taken stay with whoever owns
 * them (the unit of work releases them on rollback).
 */
template <typename Id, typename LockFn>
auto lockInOrder(const std::vector<Id>& ids, LockFn&& lock)
    -> std::vector<std::pair<Id, decltype(lock(ids.front()))>> {
  std::vector<std::pair<Id, decltype(lock(ids.front()))>> acquired;
  for (const Id& id : lockOrder(ids)) {
    acquired.emplace_back(id, lock(id));
  }
  return acquired;
}

}  // namespace core
}  // namespace ledger

#endif  // LEDGER_CORE_LOCK_ORDERING_HPP_
