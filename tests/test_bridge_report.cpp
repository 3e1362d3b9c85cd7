#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "bridge/bridge_report.hpp"
#include "data/chunk_source.hpp"
#include "data/csv_parser.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace pvm;
using namespace pvm::bridge;
using pvm::periods::Date;
using pvm::periods::DateRange;
using Catch::Approx;

namespace {

aggregation::PeriodAccumulator period(double sales, double quantity, double cost) {
    aggregation::PeriodAccumulator acc;
    acc.add(sales, quantity, cost);
    return acc;
}

aggregation::AggregationResult sample_aggregation() {
    aggregation::AggregationResult agg;
    agg.dimension_columns = {"region", "product"};

    aggregation::PeriodWindow py;
    py.label = "PY";
    py.range = DateRange{Date{2023, 1, 1}, Date{2023, 12, 31}};
    aggregation::PeriodWindow cy;
    cy.label = "CY";
    cy.range = DateRange{Date{2024, 1, 1}, Date{2024, 12, 31}};
    agg.periods = {py, cy};

    aggregation::DimensionBucket east;
    east.key = std::string("East") + aggregation::kKeySeparator + "Gizmo, Pro";
    east.dimension_values = {"East", "Gizmo, Pro"};
    east.periods = {period(100, 10, 60), period(150, 10, 70)};

    aggregation::DimensionBucket west;
    west.key = std::string("West") + aggregation::kKeySeparator + "Widget";
    west.dimension_values = {"West", "Widget"};
    west.periods = {aggregation::PeriodAccumulator{}, period(40, 4, 10)};

    agg.buckets = {east, west};

    agg.negatives.resize(2);
    agg.negatives[1].add(-25, 1, 5);

    agg.stats.total_rows = 5;
    agg.stats.included_rows = 3;
    agg.stats.excluded_rows = 2;
    agg.stats.negative_rows = 1;
    agg.stats.parse_errors = 1;
    agg.stats.unique_keys = 2;
    agg.stats.period_rows = {1, 2};
    agg.min_date = Date{2023, 2, 1};
    agg.max_date = Date{2024, 11, 30};
    return agg;
}

std::vector<std::vector<std::string>> read_csv(const std::string &path, std::vector<std::string> &headers) {
    data::FileChunkSource chunks(path, 64);
    data::CsvRecordSource source(chunks);
    std::vector<std::vector<std::string>> rows;
    data::ParseHandlers handlers;
    handlers.on_headers = [&headers](const std::vector<std::string> &h) { headers = h; };
    handlers.on_record = [&rows](const data::Record &record, std::uint64_t) { rows.push_back(record.values()); };
    source.parse(handlers);
    return rows;
}

std::filesystem::path fresh_directory(const std::string &name) {
    auto dir = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(dir);
    return dir;
}

} // namespace

TEST_CASE("BridgeReport console output", "[BridgeReport]") {
    auto agg = sample_aggregation();
    BridgeCalculator calculator;
    auto result = calculator.calculate(agg);
    BridgeReport report(result, agg);

    std::ostringstream summary;
    report.print_summary(summary);
    REQUIRE(summary.str().find("Sales PVM Bridge") != std::string::npos);
    REQUIRE(summary.str().find("PY to CY") != std::string::npos);
    REQUIRE(summary.str().find("Rows read: 5") != std::string::npos);

    std::ostringstream detail;
    report.print_detail(result.detail, 1, detail);
    REQUIRE(detail.str().find("East") != std::string::npos);
    REQUIRE(detail.str().find("... 1 more") != std::string::npos);
}

TEST_CASE("BridgeReport writes every output file", "[BridgeReport]") {
    auto agg = sample_aggregation();
    BridgeCalculator calculator({BridgeMode::GM, PriceDefinition::SALES_PER_UNIT});
    auto result = calculator.calculate(agg);
    BridgeReport report(result, agg, nlohmann::json{{"input", "sales.csv"}});

    auto dir = fresh_directory("pvm_bridge_report_test");
    auto written = report.write_all(dir.string(), result.detail);

    REQUIRE(written.size() == 5);
    for (const auto &path : written) {
        REQUIRE(std::filesystem::exists(path));
    }

    SECTION("summary.csv") {
        std::vector<std::string> headers;
        auto rows = read_csv((dir / "summary.csv").string(), headers);
        REQUIRE(headers.front() == "step");
        REQUIRE(headers.back() == "continuing");
        REQUIRE(rows.size() == 1);
        REQUIRE(rows[0][0] == "PY-CY");
        REQUIRE(std::stod(rows[0][5]) == Approx(90.0));
        REQUIRE(std::stod(rows[0][9]) == Approx(-20.0));
        REQUIRE(rows[0][15] == "2");
        REQUIRE(rows[0][16] == "1");
    }

    SECTION("detail.csv keeps dimension values intact") {
        std::vector<std::string> headers;
        auto rows = read_csv((dir / "detail.csv").string(), headers);
        REQUIRE(headers[0] == "region");
        REQUIRE(headers[1] == "product");
        REQUIRE(headers[2] == "step");
        REQUIRE(headers.size() == 21);
        REQUIRE(rows.size() == 2);
        REQUIRE(rows[0][1] == "Gizmo, Pro");
        REQUIRE(rows[0][3] == "continuing");
        REQUIRE(rows[1][3] == "new");
        REQUIRE(std::stod(rows[0][16]) == Approx(50.0));
    }

    SECTION("negatives.csv") {
        std::vector<std::string> headers;
        auto rows = read_csv((dir / "negatives.csv").string(), headers);
        REQUIRE(rows.size() == 2);
        REQUIRE(rows[0][0] == "PY");
        REQUIRE(rows[0][3] == "0");
        REQUIRE(rows[1][1] == "2024-01-01");
        REQUIRE(rows[1][3] == "1");
        REQUIRE(std::stod(rows[1][4]) == Approx(-25.0));
    }

    SECTION("assumptions.json") {
        std::ifstream file(dir / "assumptions.json");
        auto j = nlohmann::json::parse(file);
        REQUIRE(j["configuration"]["input"] == "sales.csv");
        REQUIRE(j["bridge"]["gm_price_definition"] == "sales-per-unit");
        REQUIRE(j["methodology"]["formulas"].size() == 5);
        REQUIRE(j["periods"].size() == 2);
        REQUIRE(j["statistics"]["negative_rows"] == 1);
        REQUIRE(j["data_range"]["min_date"] == "2023-02-01");
        REQUIRE(j["exclusion_rules"].is_array());
    }

    SECTION("bridge.json") {
        std::ifstream file(dir / "bridge.json");
        auto j = nlohmann::json::parse(file);
        REQUIRE(j["mode"] == "two_period");
        REQUIRE(j["summaries"].size() == 1);
        REQUIRE(j["summaries"][0]["counts"]["new"] == 1);
        REQUIRE(j["detail"].size() == 2);
        REQUIRE(j["detail"][0]["dimensions"][1] == "Gizmo, Pro");
        REQUIRE(j["detail"][1]["steps"][0]["classification"] == "new");
        REQUIRE(j["negatives"][1]["count"] == 1);
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("BridgeReport detail with no dimensions", "[BridgeReport]") {
    auto agg = sample_aggregation();
    agg.dimension_columns.clear();
    agg.buckets.resize(1);
    agg.buckets[0].key = aggregation::kTotalKey;
    agg.buckets[0].dimension_values.clear();

    BridgeCalculator calculator;
    auto result = calculator.calculate(agg);
    BridgeReport report(result, agg);

    auto dir = fresh_directory("pvm_bridge_report_total_test");
    auto path = (dir / "detail.csv").string();
    report.export_detail_csv(path, result.detail);

    std::vector<std::string> headers;
    auto rows = read_csv(path, headers);
    REQUIRE(headers[0] == "dimension");
    REQUIRE(rows.size() == 1);
    REQUIRE(rows[0][0] == "Total");

    std::filesystem::remove_all(dir);
}

TEST_CASE("BridgeReport JSON output tolerates bytes that are not UTF-8", "[BridgeReport]") {
    auto agg = sample_aggregation();
    agg.buckets[0].dimension_values[0] = "Caf\xE9";
    agg.buckets[0].key = std::string("Caf\xE9") + aggregation::kKeySeparator + "Gizmo, Pro";

    BridgeCalculator calculator;
    auto result = calculator.calculate(agg);
    BridgeReport report(result, agg);

    auto dir = fresh_directory("pvm_bridge_report_latin1_test");
    std::vector<std::string> written;
    REQUIRE_NOTHROW(written = report.write_all(dir.string(), result.detail));
    REQUIRE(written.size() == 5);

    std::ifstream file(dir / "bridge.json");
    auto j = nlohmann::json::parse(file);
    REQUIRE(j["detail"][0]["dimensions"][0] == "Caf\xEF\xBF\xBD");
    REQUIRE(j["detail"][0]["steps"][0]["impacts"]["price"].get<double>() == Approx(50.0));

    std::vector<std::string> headers;
    auto rows = read_csv((dir / "detail.csv").string(), headers);
    REQUIRE(rows[0][0] == "Caf\xE9");

    std::filesystem::remove_all(dir);
}
