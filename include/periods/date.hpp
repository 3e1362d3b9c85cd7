#pragma once

#include <array>
#include <optional>
#include <string>

namespace pvm {
namespace periods {

// Proleptic Gregorian calendar date. Day arithmetic goes through a
// days-since-1970-01-01 serial so it never depends on the local time zone.
struct Date {
    int year = 1970;
    int month = 1;
    int day = 1;

    static std::optional<Date> make(int year, int month, int day);
    static Date from_days(long long days);

    long long to_days() const;
    Date add_days(long long days) const;

    bool operator==(const Date& other) const;
    bool operator!=(const Date& other) const { return !(*this == other); }
    bool operator<(const Date& other) const;
    bool operator<=(const Date& other) const { return !(other < *this); }
    bool operator>(const Date& other) const { return other < *this; }
    bool operator>=(const Date& other) const { return !(*this < other); }
};

// Inclusive on both ends.
struct DateRange {
    Date start;
    Date end;

    bool contains(const Date& date) const { return start <= date && date <= end; }
    bool is_valid() const { return start <= end; }
    long long length_days() const { return end.to_days() - start.to_days() + 1; }
};

enum class DateStyle {
    SHORT,   // 1/5/2024
    MEDIUM,  // Jan 5, 2024
    LONG     // January 5, 2024
};

extern const std::array<const char*, 12> kMonthNames;
extern const std::array<const char*, 12> kMonthNamesShort;

bool is_leap_year(int year);
int days_in_month(int year, int month);
Date last_day_of_month(int year, int month);

std::string to_iso_string(const Date& date);
std::optional<Date> from_iso_string(const std::string& text);

std::string format_date(const Date& date, DateStyle style = DateStyle::MEDIUM);
std::string format_date_range(const DateRange& range);

} // namespace periods
} // namespace pvm
