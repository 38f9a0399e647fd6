#include "engine/core/CalendarDate.hpp"

#include <cstdio>

namespace engine::core
{
namespace
{
[[nodiscard]] bool IsLeapYear(int year)
{
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

[[nodiscard]] int DaysInMonth(int year, int month)
{
    constexpr int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && IsLeapYear(year))
    {
        return 29;
    }
    return kDays[month - 1];
}
} // namespace

// Era-based conversion (400-year cycles of 146097 days).
long long CalendarDate::ToDays() const
{
    const long long y = static_cast<long long>(year) - (month <= 2 ? 1 : 0);
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const long long yearOfEra = y - era * 400;
    const long long shiftedMonth = month > 2 ? month - 3 : month + 9;
    const long long dayOfYear = (153 * shiftedMonth + 2) / 5 + day - 1;
    const long long dayOfEra = yearOfEra * 365 + yearOfEra / 4 - yearOfEra / 100 + dayOfYear;
    return era * 146097 + dayOfEra - 719468;
}

CalendarDate CalendarDate::FromDays(long long days)
{
    const long long z = days + 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const long long dayOfEra = z - era * 146097;
    const long long yearOfEra = (dayOfEra - dayOfEra / 1460 + dayOfEra / 36524 - dayOfEra / 146096) / 365;
    const long long dayOfYear = dayOfEra - (365 * yearOfEra + yearOfEra / 4 - yearOfEra / 100);
    const long long shiftedMonth = (5 * dayOfYear + 2) / 153;

    CalendarDate date;
    date.day = static_cast<int>(dayOfYear - (153 * shiftedMonth + 2) / 5 + 1);
    date.month = static_cast<int>(shiftedMonth < 10 ? shiftedMonth + 3 : shiftedMonth - 9);
    date.year = static_cast<int>(yearOfEra + era * 400 + (date.month <= 2 ? 1 : 0));
    return date;
}

CalendarDate CalendarDate::AddDays(long long delta) const
{
    return FromDays(ToDays() + delta);
}

long long CalendarDate::DaysUntil(const CalendarDate& other) const
{
    return other.ToDays() - ToDays();
}

std::string CalendarDate::ToString() const
{
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
    return buffer;
}

std::optional<CalendarDate> CalendarDate::Parse(const std::string& text)
{
    CalendarDate date;
    char trailing = '\0';
    if (std::sscanf(text.c_str(), "%d-%d-%d%c", &date.year, &date.month, &date.day, &trailing) != 3)
    {
        return std::nullopt;
    }
    if (!date.IsValid())
    {
        return std::nullopt;
    }
    return date;
}

bool CalendarDate::IsValid() const
{
    if (month < 1 || month > 12)
    {
        return false;
    }
    return day >= 1 && day <= DaysInMonth(year, month);
}
} // namespace engine::core
