#include "periods/fiscal_calendar.hpp"

#include <stdexcept>

namespace pvm {
namespace periods {

void check_fiscal_year_end_month(int fy_end_month) {
    if (fy_end_month < 1 || fy_end_month > 12) {
        throw std::invalid_argument("Fiscal year end month must be between 1 and 12, got " +
                                    std::to_string(fy_end_month));
    }
}

int fiscal_year_of(const Date& date, int fy_end_month) {
    check_fiscal_year_end_month(fy_end_month);
    return date.month > fy_end_month ? date.year + 1 : date.year;
}

DateRange fiscal_year_range(int fiscal_year, int fy_end_month) {
    check_fiscal_year_end_month(fy_end_month);
    if (fy_end_month == 12) {
        return DateRange{Date{fiscal_year, 1, 1}, Date{fiscal_year, 12, 31}};
    }
    return DateRange{Date{fiscal_year - 1, fy_end_month + 1, 1},
                     last_day_of_month(fiscal_year, fy_end_month)};
}

std::string fiscal_year_label(int fiscal_year) {
    return "FY " + std::to_string(fiscal_year);
}

DateRange ltm_range(const Date& end) {
    int year = end.year - 1;
    int day = end.day;
    if (day > days_in_month(year, end.month)) day = days_in_month(year, end.month);
    Date year_earlier{year, end.month, day};
    return DateRange{year_earlier.add_days(1), end};
}

int prior_fiscal_year(const Date& ltm_end, int fy_end_month) {
    return fiscal_year_of(ltm_end, fy_end_month) - 1;
}

std::vector<FiscalYearWindow> discover_fiscal_years(const Date& min_date,
                                                    const Date& max_date,
                                                    int fy_end_month) {
    std::vector<FiscalYearWindow> years;
    if (max_date < min_date) return years;

    int first = fiscal_year_of(min_date, fy_end_month);
    int last = fiscal_year_of(max_date, fy_end_month);
    for (int fy = first; fy <= last; ++fy) {
        FiscalYearWindow window;
        window.fiscal_year = fy;
        window.range = fiscal_year_range(fy, fy_end_month);
        window.label = fiscal_year_label(fy);
        window.fully_covered = min_date <= window.range.start && max_date >= window.range.end;
        years.push_back(window);
    }
    return years;
}

PeriodTag classify_period(const Date& date, const DateRange& prior, const DateRange& current) {
    if (prior.contains(date)) return PeriodTag::PRIOR;
    if (current.contains(date)) return PeriodTag::CURRENT;
    return PeriodTag::UNCLASSIFIED;
}

PeriodValidation validate_period_config(const DateRange& prior, const DateRange& current) {
    PeriodValidation result;

    if (!prior.is_valid()) {
        result.errors.push_back("Prior Year range ends before it starts (" +
                                format_date_range(prior) + ").");
    }
    if (!current.is_valid()) {
        result.errors.push_back("Current Year/LTM range ends before it starts (" +
                                format_date_range(current) + ").");
    }

    if (prior.end >= current.start && current.end >= prior.start) {
        result.warnings.push_back(
            "Prior Year and Current Year/LTM periods overlap. Rows in the overlap are "
            "assigned to the Prior Year only.");
    }

    long long gap_days = current.start.to_days() - prior.end.to_days();
    if (gap_days > kMaxPeriodGapDays) {
        result.warnings.push_back("There is a " + std::to_string(gap_days) +
                                  " day gap between Prior Year and Current Year/LTM. "
                                  "Some data may be excluded.");
    }

    result.valid = result.errors.empty();
    return result;
}

} // namespace periods
} // namespace pvm
