#pragma once
#include <cstdint>
#include <ostream>
#include <string>

/**
 * Proleptic Gregorian calendar date (no time zone).
 * Activity dates, calculation dates and summary periods are all day-granular.
 */
struct Date
{
    int year  = 1970;
    int month = 1;
    int day   = 1;

    Date() = default;
    // Validating constructor; throws std::invalid_argument for impossible dates.
    Date(int year_, int month_, int day_);

    // "YYYY-MM-DD"; throws std::invalid_argument on malformed text.
    static Date parse(const std::string& text);

    // UTC calendar day of an epoch-seconds timestamp.
    static Date from_epoch_seconds(std::int64_t ts);
    static Date from_days(std::int64_t days_since_epoch);

    std::int64_t days_since_epoch() const;
    Date         add_days(std::int64_t n) const;
    std::string  to_string() const;

    static bool is_leap_year(int year);
    static int  days_in_month(int year, int month);
    static Date first_of_month(int year, int month);
    static Date last_of_month(int year, int month);
};

bool operator==(const Date& a, const Date& b);
bool operator!=(const Date& a, const Date& b);
bool operator<(const Date& a, const Date& b);
bool operator<=(const Date& a, const Date& b);
bool operator>(const Date& a, const Date& b);
bool operator>=(const Date& a, const Date& b);

std::ostream& operator<<(std::ostream& os, const Date& d);
