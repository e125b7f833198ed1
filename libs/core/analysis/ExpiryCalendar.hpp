#pragma once
#include <chrono>
#include <string>
#include <string_view>

namespace ExpiryCalendar {

/// Exchange-local (IST, UTC+05:30) calendar date for a UTC instant.
std::chrono::year_month_day exchangeDate(std::chrono::system_clock::time_point now);

/// Nearest listed expiry for an index, formatted DDMONYYYY (e.g. "25JAN2024").
/// BANKNIFTY: last Thursday of the month, next month's once today has reached it.
/// NIFTY and anything else: the next Thursday strictly after today.
std::string nearestExpiry(std::string_view symbol, std::chrono::year_month_day today);

std::string formatExpiry(std::chrono::year_month_day date);

} // namespace ExpiryCalendar
