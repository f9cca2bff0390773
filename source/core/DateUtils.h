#ifndef DATEUTILS_H
#define DATEUTILS_H

#include "../../include/crm_errors.hpp"
#include <cstdint>
#include <cctype>
#include <cstdio>
#include <optional>
#include <string>
using namespace std;

// Calendar dates travel as DDMMYYYY integers. A leading zero day is
// simply dropped by the integer (1012025 is 01-01-2025).

struct CalendarDate
{
    int day;
    int month;
    int year;
};

inline bool is_leap_year(int year)
{
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

inline int days_in_month(int month, int year)
{
    static const int DAYS[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12)
        return 0;
    if (month == 2 && is_leap_year(year))
        return 29;
    return DAYS[month - 1];
}

inline optional<CalendarDate> decode_date(int32_t ddmmyyyy)
{
    if (ddmmyyyy <= 0 || ddmmyyyy > 99999999)
    {
        return nullopt;
    }

    CalendarDate date;
    date.day = ddmmyyyy / 1000000;
    date.month = (ddmmyyyy / 10000) % 100;
    date.year = ddmmyyyy % 10000;

    if (date.year < 1 || date.month < 1 || date.month > 12)
    {
        return nullopt;
    }
    if (date.day < 1 || date.day > days_in_month(date.month, date.year))
    {
        return nullopt;
    }
    return date;
}

inline bool is_valid_date(int32_t ddmmyyyy)
{
    return decode_date(ddmmyyyy).has_value();
}

// Days since 1970-01-01 in the proleptic Gregorian calendar.
inline int64_t days_from_civil(int year, int month, int day)
{
    int64_t y = year - (month <= 2 ? 1 : 0);
    int64_t era = (y >= 0 ? y : y - 399) / 400;
    int64_t yoe = y - era * 400;
    int64_t mp = (month + 9) % 12;
    int64_t doy = (153 * mp + 2) / 5 + day - 1;
    int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

// Both endpoints count: the same start and end date is one day.
inline optional<int64_t> elapsed_days_inclusive(int32_t start_date, int32_t end_date)
{
    auto start = decode_date(start_date);
    auto end = decode_date(end_date);
    if (!start || !end)
    {
        return nullopt;
    }

    return days_from_civil(end->year, end->month, end->day) -
           days_from_civil(start->year, start->month, start->day) + 1;
}

// Accepts exactly eight digits forming a real date. Surrounding
// whitespace is ignored.
inline int32_t parse_date_input(const string &text)
{
    size_t first = text.find_first_not_of(" \t\r\n");
    size_t last = text.find_last_not_of(" \t\r\n");
    string trimmed = (first == string::npos) ? "" : text.substr(first, last - first + 1);

    if (trimmed.size() != 8)
    {
        throw ValidationError("Date must be 8 digits in DDMMYYYY form, e.g. 25102025");
    }
    for (char c : trimmed)
    {
        if (!isdigit(static_cast<unsigned char>(c)))
        {
            throw ValidationError("Date must be 8 digits in DDMMYYYY form, e.g. 25102025");
        }
    }

    int32_t value = static_cast<int32_t>(stol(trimmed));
    if (!is_valid_date(value))
    {
        throw ValidationError("Not a calendar date: " + trimmed);
    }
    return value;
}

inline string format_date_display(int32_t ddmmyyyy)
{
    if (ddmmyyyy == 0)
        return "N/A";

    auto date = decode_date(ddmmyyyy);
    if (!date)
        return "Invalid Date";

    char buffer[16];
    snprintf(buffer, sizeof(buffer), "%02d-%02d-%04d", date->day, date->month, date->year);
    return string(buffer);
}

#endif
