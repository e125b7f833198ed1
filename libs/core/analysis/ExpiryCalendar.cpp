#include "ExpiryCalendar.hpp"
#include <array>
#include <format>

namespace ExpiryCalendar {

using namespace std::chrono;

namespace {

constexpr std::array<const char*, 12> kMonths{
    "JAN", "FEB", "MAR", "APR", "MAY", "JUN", "JUL", "AUG", "SEP", "OCT", "NOV", "DEC"};

constexpr minutes kIstOffset = hours{5} + minutes{30};

sys_days lastThursday(year_month ym) {
    return sys_days{year_month_weekday_last{ym.year(), ym.month(), weekday_last{Thursday}}};
}

} // namespace

year_month_day exchangeDate(system_clock::time_point now) {
    return year_month_day{floor<days>(now + kIstOffset)};
}

std::string formatExpiry(year_month_day date) {
    return std::format("{:02}{}{}",
                       static_cast<unsigned>(date.day()),
                       kMonths[static_cast<unsigned>(date.month()) - 1],
                       static_cast<int>(date.year()));
}

std::string nearestExpiry(std::string_view symbol, year_month_day today) {
    const sys_days day{today};

    if (symbol == "BANKNIFTY") {
        const year_month ym{today.year(), today.month()};
        sys_days expiry = lastThursday(ym);
        if (expiry <= day) {
            expiry = lastThursday(ym + months{1});
        }
        return formatExpiry(year_month_day{expiry});
    }

    // Weekly: strictly after today, so a Thursday rolls a full week.
    auto ahead = Thursday - weekday{day};
    if (ahead == days{0}) ahead = days{7};
    return formatExpiry(year_month_day{day + ahead});
}

} // namespace ExpiryCalendar
