#include <gtest/gtest.h>

#include "engine/core/CalendarDate.hpp"

using engine::core::CalendarDate;

TEST(CalendarDateTest, EpochIsDayZero)
{
    EXPECT_EQ((CalendarDate{1970, 1, 1}).ToDays(), 0);
    EXPECT_EQ((CalendarDate{1969, 12, 31}).ToDays(), -1);
}

TEST(CalendarDateTest, AddDaysCrossesMonthAndLeapDay)
{
    const CalendarDate date{2024, 2, 28};
    EXPECT_EQ(date.AddDays(1), (CalendarDate{2024, 2, 29}));
    EXPECT_EQ(date.AddDays(2), (CalendarDate{2024, 3, 1}));
    EXPECT_EQ((CalendarDate{2023, 12, 31}).AddDays(1), (CalendarDate{2024, 1, 1}));
}

TEST(CalendarDateTest, DaysUntilIsSigned)
{
    const CalendarDate a{2024, 1, 1};
    const CalendarDate b{2024, 3, 1};
    EXPECT_EQ(a.DaysUntil(b), 60);
    EXPECT_EQ(b.DaysUntil(a), -60);
}

TEST(CalendarDateTest, ParseAndFormat)
{
    const auto parsed = CalendarDate::Parse("2024-07-04");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, (CalendarDate{2024, 7, 4}));
    EXPECT_EQ(parsed->ToString(), "2024-07-04");
}

TEST(CalendarDateTest, ParseRejectsInvalidDates)
{
    EXPECT_FALSE(CalendarDate::Parse("2023-02-29").has_value());
    EXPECT_FALSE(CalendarDate::Parse("2024-13-01").has_value());
    EXPECT_FALSE(CalendarDate::Parse("yesterday").has_value());
    EXPECT_FALSE(CalendarDate::Parse("2024-01-01x").has_value());
}

TEST(CalendarDateTest, RoundTripsThroughDays)
{
    for (long long days = -1000; days <= 30000; days += 37)
    {
        EXPECT_EQ(CalendarDate::FromDays(days).ToDays(), days);
    }
}
