#include "calendar.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

TEST(Date, ParseAndFormat)
{
    auto d = Date::parse("2024-02-29");
    EXPECT_EQ(d.year, 2024);
    EXPECT_EQ(d.month, 2);
    EXPECT_EQ(d.day, 29);
    EXPECT_EQ(d.to_string(), "2024-02-29");
}

TEST(Date, RejectsImpossibleOrMalformedDates)
{
    EXPECT_THROW(Date::parse("2023-02-29"), std::invalid_argument);
    EXPECT_THROW(Date::parse("2024-13-01"), std::invalid_argument);
    EXPECT_THROW(Date::parse("2024-1-01"), std::invalid_argument);
    EXPECT_THROW(Date::parse("20240101"), std::invalid_argument);
    EXPECT_THROW(Date(2024, 4, 31), std::invalid_argument);
}

TEST(Date, FromEpochSeconds)
{
    EXPECT_EQ(Date::from_epoch_seconds(0), Date(1970, 1, 1));
    EXPECT_EQ(Date::from_epoch_seconds(-1), Date(1969, 12, 31));
    EXPECT_EQ(Date::from_epoch_seconds(1732406400), Date(2024, 11, 24));
    EXPECT_EQ(Date::from_epoch_seconds(1732406400 + 86399), Date(2024, 11, 24));
}

TEST(Date, AddDaysCrossesMonthAndYearBoundaries)
{
    EXPECT_EQ(Date(2024, 12, 31).add_days(1), Date(2025, 1, 1));
    EXPECT_EQ(Date(2024, 3, 1).add_days(-1), Date(2024, 2, 29));
    EXPECT_EQ(Date(2023, 3, 1).add_days(-1), Date(2023, 2, 28));
    EXPECT_EQ(Date(2024, 1, 1).days_since_epoch() - Date(2023, 1, 1).days_since_epoch(), 365);
}

TEST(Date, MonthBounds)
{
    EXPECT_EQ(Date::last_of_month(2023, 2), Date(2023, 2, 28));
    EXPECT_EQ(Date::last_of_month(2000, 2), Date(2000, 2, 29));
    EXPECT_EQ(Date::last_of_month(1900, 2), Date(1900, 2, 28));
    EXPECT_EQ(Date::last_of_month(2024, 11), Date(2024, 11, 30));
    EXPECT_EQ(Date::first_of_month(2024, 11), Date(2024, 11, 1));
    EXPECT_THROW(Date::first_of_month(2024, 0), std::invalid_argument);
}

TEST(Date, Ordering)
{
    EXPECT_LT(Date(2024, 11, 30), Date(2024, 12, 1));
    EXPECT_LE(Date(2024, 12, 1), Date(2024, 12, 1));
    EXPECT_GT(Date(2025, 1, 1), Date(2024, 12, 31));
    EXPECT_NE(Date(2025, 1, 1), Date(2025, 1, 2));
}
