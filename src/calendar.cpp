#include "calendar.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>
#include <tuple>

Date::Date(int year_, int month_, int day_) : year(year_), month(month_), day(day_)
{
    if (month_ < 1 || month_ > 12)
        throw std::invalid_argument("month must be between 1 and 12");
    if (day_ < 1 || day_ > days_in_month(year_, month_))
        throw std::invalid_argument("day out of range for month");
}

Date Date::parse(const std::string& text)
{
    // yyyy-mm-dd
    if (text.size() != 10 || text[4] != '-' || text[7] != '-')
        throw std::invalid_argument("date must be formatted YYYY-MM-DD: " + text);
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if (i == 4 || i == 7)
            continue;
        if (std::isdigit(static_cast<unsigned char>(text[i])) == 0)
            throw std::invalid_argument("date must be formatted YYYY-MM-DD: " + text);
    }
    return Date(std::stoi(text.substr(0, 4)), std::stoi(text.substr(5, 2)), std::stoi(text.substr(8, 2)));
}

Date Date::from_epoch_seconds(std::int64_t ts)
{
    std::int64_t days = ts / 86400;
    if (ts % 86400 < 0)
        --days;
    return from_days(days);
}

// civil_from_days / days_from_civil (Howard Hinnant's algorithms)
Date Date::from_days(std::int64_t z)
{
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const auto         doe = static_cast<unsigned>(z - era * 146097);
    const unsigned     yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const std::int64_t y   = static_cast<std::int64_t>(yoe) + era * 400;
    const unsigned     doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned     mp  = (5 * doy + 2) / 153;
    const unsigned     d   = doy - (153 * mp + 2) / 5 + 1;
    const unsigned     m   = mp < 10 ? mp + 3 : mp - 9;

    Date out;
    out.year  = static_cast<int>(y + (m <= 2 ? 1 : 0));
    out.month = static_cast<int>(m);
    out.day   = static_cast<int>(d);
    return out;
}

std::int64_t Date::days_since_epoch() const
{
    const std::int64_t y   = static_cast<std::int64_t>(year) - (month <= 2 ? 1 : 0);
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const auto         yoe = static_cast<unsigned>(y - era * 400);
    const auto         mp  = static_cast<unsigned>(month > 2 ? month - 3 : month + 9);
    const unsigned     doy = (153 * mp + 2) / 5 + static_cast<unsigned>(day) - 1;
    const unsigned     doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

Date Date::add_days(std::int64_t n) const
{
    return from_days(days_since_epoch() + n);
}

std::string Date::to_string() const
{
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

bool Date::is_leap_year(int y)
{
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int Date::days_in_month(int y, int m)
{
    static const int kDays[] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
    if (m < 1 || m > 12)
        throw std::invalid_argument("month must be between 1 and 12");
    if (m == 2 && is_leap_year(y))
        return 29;
    return kDays[m - 1];
}

Date Date::first_of_month(int y, int m)
{
    return Date(y, m, 1);
}

Date Date::last_of_month(int y, int m)
{
    return Date(y, m, days_in_month(y, m));
}

bool operator==(const Date& a, const Date& b)
{
    return std::tie(a.year, a.month, a.day) == std::tie(b.year, b.month, b.day);
}

bool operator!=(const Date& a, const Date& b)
{
    return !(a == b);
}

bool operator<(const Date& a, const Date& b)
{
    return std::tie(a.year, a.month, a.day) < std::tie(b.year, b.month, b.day);
}

bool operator<=(const Date& a, const Date& b)
{
    return !(b < a);
}

bool operator>(const Date& a, const Date& b)
{
    return b < a;
}

bool operator>=(const Date& a, const Date& b)
{
    return !(a < b);
}

std::ostream& operator<<(std::ostream& os, const Date& d)
{
    return os << d.to_string();
}
