#include "periods/date.hpp"

#include <cctype>
#include <cstdio>
#include <sstream>

namespace pvm {
namespace periods {

const std::array<const char*, 12> kMonthNames = {
    "January", "February", "March", "April", "May", "June",
    "July", "August", "September", "October", "November", "December"};

const std::array<const char*, 12> kMonthNamesShort = {
    "Jan", "Feb", "Mar", "Apr", "May", "Jun",
    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static const int days[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) return 29;
    return days[month - 1];
}

Date last_day_of_month(int year, int month) {
    return Date{year, month, days_in_month(year, month)};
}

std::optional<Date> Date::make(int year, int month, int day) {
    if (month < 1 || month > 12) return std::nullopt;
    if (day < 1 || day > days_in_month(year, month)) return std::nullopt;
    return Date{year, month, day};
}

// Civil-from-days / days-from-civil over 400-year eras.
long long Date::to_days() const {
    long long y = year - (month <= 2 ? 1 : 0);
    long long era = (y >= 0 ? y : y - 399) / 400;
    long long yoe = y - era * 400;
    long long mp = (month + 9) % 12;
    long long doy = (153 * mp + 2) / 5 + day - 1;
    long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

Date Date::from_days(long long days) {
    days += 719468;
    long long era = (days >= 0 ? days : days - 146096) / 146097;
    long long doe = days - era * 146097;
    long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    long long y = yoe + era * 400;
    long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    long long mp = (5 * doy + 2) / 153;
    int d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    int m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    return Date{static_cast<int>(y + (m <= 2 ? 1 : 0)), m, d};
}

Date Date::add_days(long long days) const {
    return from_days(to_days() + days);
}

bool Date::operator==(const Date& other) const {
    return year == other.year && month == other.month && day == other.day;
}

bool Date::operator<(const Date& other) const {
    if (year != other.year) return year < other.year;
    if (month != other.month) return month < other.month;
    return day < other.day;
}

std::string to_iso_string(const Date& date) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", date.year, date.month, date.day);
    return std::string(buffer);
}

std::optional<Date> from_iso_string(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') return std::nullopt;
    for (size_t i = 0; i < text.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return std::nullopt;
    }
    return Date::make(std::stoi(text.substr(0, 4)),
                      std::stoi(text.substr(5, 2)),
                      std::stoi(text.substr(8, 2)));
}

std::string format_date(const Date& date, DateStyle style) {
    std::ostringstream out;
    switch (style) {
        case DateStyle::SHORT:
            out << date.month << "/" << date.day << "/" << date.year;
            break;
        case DateStyle::MEDIUM:
            out << kMonthNamesShort[date.month - 1] << " " << date.day << ", " << date.year;
            break;
        case DateStyle::LONG:
            out << kMonthNames[date.month - 1] << " " << date.day << ", " << date.year;
            break;
    }
    return out.str();
}

std::string format_date_range(const DateRange& range) {
    return format_date(range.start) + " - " + format_date(range.end);
}

} // namespace periods
} // namespace pvm
