#pragma once

#include <optional>
#include <string>

namespace engine::core
{
/// Proleptic Gregorian calendar day, independent of time zone and time of day.
/// Progression logic compares days, never timestamps.
struct CalendarDate
{
    int year = 1970;
    int month = 1;
    int day = 1;

    /// Days since 1970-01-01 (negative before).
    [[nodiscard]] long long ToDays() const;
    [[nodiscard]] static CalendarDate FromDays(long long days);

    [[nodiscard]] CalendarDate AddDays(long long delta) const;
    [[nodiscard]] long long DaysUntil(const CalendarDate& other) const;

    /// "YYYY-MM-DD"
    [[nodiscard]] std::string ToString() const;
    [[nodiscard]] static std::optional<CalendarDate> Parse(const std::string& text);

    [[nodiscard]] bool IsValid() const;

    friend bool operator==(const CalendarDate& a, const CalendarDate& b)
    {
        return a.year == b.year && a.month == b.month && a.day == b.day;
    }
    friend bool operator!=(const CalendarDate& a, const CalendarDate& b) { return !(a == b); }
    friend bool operator<(const CalendarDate& a, const CalendarDate& b) { return a.ToDays() < b.ToDays(); }
};
} // namespace engine::core
