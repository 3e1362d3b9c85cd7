#pragma once

#include "periods/date.hpp"

#include <string>
#include <vector>

namespace pvm {
namespace periods {

enum class PeriodTag {
    PRIOR,
    CURRENT,
    UNCLASSIFIED
};

struct FiscalYearWindow {
    int fiscal_year = 0;
    DateRange range;
    std::string label;          // "FY 2024"
    bool fully_covered = false; // observed data spans the whole range
};

struct PeriodValidation {
    bool valid = true;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;
};

constexpr int kMaxPeriodGapDays = 365;

// Throws std::invalid_argument unless 1 <= month <= 12.
void check_fiscal_year_end_month(int fy_end_month);

// With a June year end, 2024-06-30 is FY 2024 and 2024-07-01 is FY 2025.
int fiscal_year_of(const Date& date, int fy_end_month);

DateRange fiscal_year_range(int fiscal_year, int fy_end_month);
std::string fiscal_year_label(int fiscal_year);

// Twelve months ending on `end`, starting the day after the same date one
// year earlier. Feb 29 clamps to Feb 28 before stepping forward, so an LTM
// ending 2024-02-29 starts 2023-03-01 and covers the full 366 days. Date
// libraries that roll Feb 29 over to Mar 1 instead would start on Mar 2.
DateRange ltm_range(const Date& end);

int prior_fiscal_year(const Date& ltm_end, int fy_end_month);

// Every fiscal year touched by [min_date, max_date], ascending.
std::vector<FiscalYearWindow> discover_fiscal_years(const Date& min_date,
                                                    const Date& max_date,
                                                    int fy_end_month);

// PY is tested first, so a date inside an overlap is classified PY.
PeriodTag classify_period(const Date& date, const DateRange& prior, const DateRange& current);

// Flags overlapping ranges and gaps above kMaxPeriodGapDays as warnings;
// inverted ranges are errors.
PeriodValidation validate_period_config(const DateRange& prior, const DateRange& current);

} // namespace periods
} // namespace pvm
