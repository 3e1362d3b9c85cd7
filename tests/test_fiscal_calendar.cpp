#include <catch2/catch_test_macros.hpp>
#include "periods/fiscal_calendar.hpp"
#include <stdexcept>

using namespace pvm::periods;

TEST_CASE("Fiscal year assignment", "[FiscalCalendar]") {
    SECTION("calendar year end") {
        REQUIRE(fiscal_year_of(Date{2024, 1, 1}, 12) == 2024);
        REQUIRE(fiscal_year_of(Date{2024, 12, 31}, 12) == 2024);
    }

    SECTION("June year end") {
        REQUIRE(fiscal_year_of(Date{2024, 6, 30}, 6) == 2024);
        REQUIRE(fiscal_year_of(Date{2024, 7, 1}, 6) == 2025);
        REQUIRE(fiscal_year_of(Date{2025, 1, 15}, 6) == 2025);
    }

    SECTION("invalid year end month") {
        REQUIRE_THROWS_AS(fiscal_year_of(Date{2024, 1, 1}, 0), std::invalid_argument);
        REQUIRE_THROWS_AS(fiscal_year_range(2024, 13), std::invalid_argument);
        REQUIRE_THROWS_AS(check_fiscal_year_end_month(-1), std::invalid_argument);
        REQUIRE_NOTHROW(check_fiscal_year_end_month(1));
    }
}

TEST_CASE("Fiscal year ranges", "[FiscalCalendar]") {
    auto calendar = fiscal_year_range(2024, 12);
    REQUIRE(calendar.start == Date{2024, 1, 1});
    REQUIRE(calendar.end == Date{2024, 12, 31});

    auto june = fiscal_year_range(2025, 6);
    REQUIRE(june.start == Date{2024, 7, 1});
    REQUIRE(june.end == Date{2025, 6, 30});

    auto february = fiscal_year_range(2024, 2);
    REQUIRE(february.start == Date{2023, 3, 1});
    REQUIRE(february.end == Date{2024, 2, 29});

    REQUIRE(fiscal_year_label(2024) == "FY 2024");

    // Every date in a fiscal year maps back to it
    for (Date d = june.start; d <= june.end; d = d.add_days(1)) {
        REQUIRE(fiscal_year_of(d, 6) == 2025);
    }
}

TEST_CASE("LTM ranges", "[FiscalCalendar]") {
    auto ltm = ltm_range(Date{2024, 9, 30});
    REQUIRE(ltm.start == Date{2023, 10, 1});
    REQUIRE(ltm.end == Date{2024, 9, 30});

    SECTION("leap day end clamps the year-earlier date") {
        auto leap = ltm_range(Date{2024, 2, 29});
        REQUIRE(leap.start == Date{2023, 3, 1});
        REQUIRE(leap.end == Date{2024, 2, 29});
        REQUIRE(leap.length_days() == 366);
    }

    SECTION("year end") {
        auto dec = ltm_range(Date{2024, 12, 31});
        REQUIRE(dec.start == Date{2024, 1, 1});
    }

    SECTION("prior fiscal year") {
        REQUIRE(prior_fiscal_year(Date{2024, 9, 30}, 12) == 2023);
        REQUIRE(prior_fiscal_year(Date{2024, 9, 30}, 6) == 2024);
    }
}

TEST_CASE("Fiscal year discovery", "[FiscalCalendar]") {
    auto years = discover_fiscal_years(Date{2022, 7, 1}, Date{2025, 3, 15}, 6);
    REQUIRE(years.size() == 3);
    REQUIRE(years[0].fiscal_year == 2023);
    REQUIRE(years[0].fully_covered);
    REQUIRE(years[1].fiscal_year == 2024);
    REQUIRE(years[1].fully_covered);
    REQUIRE(years[2].fiscal_year == 2025);
    REQUIRE_FALSE(years[2].fully_covered);
    REQUIRE(years[2].label == "FY 2025");

    auto partial_start = discover_fiscal_years(Date{2023, 2, 1}, Date{2024, 12, 31}, 12);
    REQUIRE(partial_start.size() == 2);
    REQUIRE_FALSE(partial_start[0].fully_covered);
    REQUIRE(partial_start[1].fully_covered);

    REQUIRE(discover_fiscal_years(Date{2024, 1, 2}, Date{2024, 1, 1}, 12).empty());
}

TEST_CASE("Period classification", "[FiscalCalendar]") {
    DateRange prior{Date{2023, 1, 1}, Date{2023, 12, 31}};
    DateRange current{Date{2024, 1, 1}, Date{2024, 12, 31}};

    REQUIRE(classify_period(Date{2023, 6, 1}, prior, current) == PeriodTag::PRIOR);
    REQUIRE(classify_period(Date{2024, 1, 1}, prior, current) == PeriodTag::CURRENT);
    REQUIRE(classify_period(Date{2022, 12, 31}, prior, current) == PeriodTag::UNCLASSIFIED);
    REQUIRE(classify_period(Date{2025, 1, 1}, prior, current) == PeriodTag::UNCLASSIFIED);

    SECTION("overlap goes to the prior period") {
        DateRange overlapping{Date{2023, 7, 1}, Date{2024, 6, 30}};
        REQUIRE(classify_period(Date{2023, 8, 1}, prior, overlapping) == PeriodTag::PRIOR);
        REQUIRE(classify_period(Date{2024, 2, 1}, prior, overlapping) == PeriodTag::CURRENT);
    }
}

TEST_CASE("Period validation", "[FiscalCalendar]") {
    DateRange prior{Date{2023, 1, 1}, Date{2023, 12, 31}};
    DateRange current{Date{2024, 1, 1}, Date{2024, 12, 31}};

    SECTION("adjacent ranges are clean") {
        auto result = validate_period_config(prior, current);
        REQUIRE(result.valid);
        REQUIRE(result.warnings.empty());
        REQUIRE(result.errors.empty());
    }

    SECTION("overlap is a warning") {
        auto result = validate_period_config(prior, DateRange{Date{2023, 7, 1}, Date{2024, 6, 30}});
        REQUIRE(result.valid);
        REQUIRE(result.warnings.size() == 1);
    }

    SECTION("long gap is a warning") {
        auto result = validate_period_config(prior, DateRange{Date{2025, 1, 1}, Date{2025, 12, 31}});
        REQUIRE(result.valid);
        REQUIRE(result.warnings.size() == 1);
    }

    SECTION("inverted range is an error") {
        auto result = validate_period_config(DateRange{Date{2023, 12, 31}, Date{2023, 1, 1}}, current);
        REQUIRE_FALSE(result.valid);
        REQUIRE(result.errors.size() == 1);
    }
}
