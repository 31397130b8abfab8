#ifndef LEDGER_CORE_CALENDAR_HPP_
#define LEDGER_CORE_CALENDAR_HPP_

#include "ledger_types.hpp"

#include <string>

namespace ledger {
namespace core {

struct YearMonth {
  int year;
  int month;  // 1-12
};

/**
 * First instant (00:00:00 UTC) of the given month. No range checking.
 */
Timestamp monthStart(int year, int month);

/**
 * First instant of the month following the given one.
 */
Timestamp nextMonthStart(int year, int month);

/**
 * UTC calendar month containing `ts`.
 */
YearMonth yearMonthOf(Timestamp ts);

/**
 * ISO-8601 UTC rendering with microseconds, e.g. 2026-03-01T00:00:00.000000Z.
 */
std::string formatTimestamp(Timestamp ts);

}  // namespace core
}  // namespace ledger

#endif  // LEDGER_CORE_CALENDAR_HPP_
