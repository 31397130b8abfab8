#include "core/calendar.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace ledger {
namespace core {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date.
long long daysFromCivil(long long y, unsigned m, unsigned d) {
  y -= m <= 2;
  const long long era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<long long>(doe) - 719468;
}

std::tm utcCalendar(Timestamp ts) {
  std::time_t seconds = std::chrono::system_clock::to_time_t(
      std::chrono::time_point_cast<std::chrono::seconds>(ts));
  std::tm tm{};
  gmtime_r(&seconds, &tm);
  return tm;
}

}  // namespace

Timestamp monthStart(int year, int month) {
  const long long days = daysFromCivil(year, static_cast<unsigned>(month), 1);
  return Timestamp(std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::hours(24) * days));
}

Timestamp nextMonthStart(int year, int month) {
  if (month == 12) {
    return monthStart(year + 1, 1);
  }
  return monthStart(year, month + 1);
}

YearMonth yearMonthOf(Timestamp ts) {
  std::tm tm = utcCalendar(ts);
  return YearMonth{tm.tm_year + 1900, tm.tm_mon + 1};
}

std::string formatTimestamp(Timestamp ts) {
  auto micros = ts.time_since_epoch().count() % 1000000;
  if (micros < 0) micros += 1000000;
  std::tm tm = utcCalendar(ts - std::chrono::microseconds(micros));

  std::stringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
     << "." << std::setfill('0') << std::setw(6) << micros << "Z";
  return ss.str();
}

}  // namespace core
}  // namespace ledger
