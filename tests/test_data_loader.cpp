#include <catch2/catch_test_macros.hpp>
#include "data/data_loader.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace pvm;
using pvm::periods::Date;

namespace {

std::string write_temp(const std::string &name, const std::string &content) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream file(path);
    file << content;
    return path.string();
}

nlohmann::json base_config() {
    return nlohmann::json::parse(R"({
        "input": {"file": "sales.csv", "chunk_size": 4096},
        "columns": {
            "date": "Order Date",
            "sales": "Revenue",
            "quantity": "Units",
            "cost": "COGS",
            "dimensions": ["Region", "Product"]
        },
        "periods": {
            "type": "two_period",
            "prior": {"start": "2023-01-01", "end": "2023-12-31"},
            "current": {"start": "2024-01-01", "end": "2024-12-31"}
        },
        "bridge": {"mode": "gm", "gm_price_definition": "sales-per-unit"},
        "output": {"directory": "out", "sort_by": "mix-asc", "top": 25}
    })");
}

std::vector<data::Record> records(const std::vector<std::string> &headers,
                                  const std::vector<std::vector<std::string>> &rows) {
    auto header = std::make_shared<const data::RecordHeader>(headers);
    std::vector<data::Record> out;
    for (const auto &row : rows) {
        out.emplace_back(header, row);
    }
    return out;
}

} // namespace

TEST_CASE("AnalysisConfig from JSON", "[DataLoader]") {
    auto config = AnalysisConfig::from_json(base_config());

    REQUIRE(config.input.file == "sales.csv");
    REQUIRE(config.input.chunk_size == 4096);
    REQUIRE(config.input.delimiter == ',');
    REQUIRE(config.columns.date == "Order Date");
    REQUIRE(config.columns.dimensions == std::vector<std::string>{"Region", "Product"});
    REQUIRE(config.periods.type == PeriodType::TWO_PERIOD);
    REQUIRE(config.periods.fiscal_year_end_month == 12);
    REQUIRE(config.periods.prior->start == Date{2023, 1, 1});
    REQUIRE(config.periods.current->end == Date{2024, 12, 31});
    REQUIRE(config.bridge.mode == bridge::BridgeMode::GM);
    REQUIRE(config.bridge.separate_cost());
    REQUIRE(config.output.directory == "out");
    REQUIRE(config.output.sort_by == "mix-asc");
    REQUIRE(config.output.top == 25);
    REQUIRE(config.date_format == "auto");
    REQUIRE_NOTHROW(config.validate());

    SECTION("serialized configuration reads back the same") {
        auto again = AnalysisConfig::from_json(config.to_json());
        REQUIRE(again.to_json() == config.to_json());
    }

    SECTION("defaults") {
        auto minimal = AnalysisConfig::from_json(nlohmann::json::object());
        REQUIRE(minimal.bridge.mode == bridge::BridgeMode::PVM);
        REQUIRE(minimal.output.directory == "results");
        REQUIRE(minimal.output.sort_by == "total-desc");
        REQUIRE(minimal.input.chunk_size == data::kDefaultChunkSize);
    }
}

TEST_CASE("PeriodConfig variants", "[DataLoader]") {
    SECTION("fiscal year") {
        auto p = PeriodConfig::from_json({{"type", "fiscal_year"}, {"fiscal_year_end_month", 6},
                                          {"current_fiscal_year", 2024}});
        REQUIRE(p.type == PeriodType::FISCAL_YEAR);
        REQUIRE(p.fiscal_year_end_month == 6);
        REQUIRE(p.current_fiscal_year == 2024);
    }

    SECTION("ltm") {
        auto p = PeriodConfig::from_json({{"type", "LTM"}, {"ltm_end_date", "2024-09-30"}});
        REQUIRE(p.type == PeriodType::LTM);
        REQUIRE(p.ltm_end_date == Date{2024, 9, 30});
    }

    SECTION("multi-year list is sorted and deduplicated") {
        auto p = PeriodConfig::from_json({{"type", "multi_year"}, {"fiscal_years", {2024, 2022, 2023, 2024}}});
        REQUIRE(p.fiscal_years == std::vector<int>{2022, 2023, 2024});
        REQUIRE_FALSE(p.auto_fiscal_years);
    }

    SECTION("multi-year without a list is automatic") {
        REQUIRE(PeriodConfig::from_json({{"type", "multi_year"}}).auto_fiscal_years);
        REQUIRE(PeriodConfig::from_json({{"type", "multi_year"}, {"fiscal_years", "auto"}}).auto_fiscal_years);
        REQUIRE_THROWS_AS(PeriodConfig::from_json({{"type", "multi_year"}, {"fiscal_years", "all"}}),
                          std::invalid_argument);
    }

    SECTION("bad values") {
        REQUIRE_THROWS_AS(PeriodConfig::from_json({{"type", "quarterly"}}), std::invalid_argument);
        REQUIRE_THROWS_AS(PeriodConfig::from_json({{"type", "ltm"}, {"ltm_end_date", "09/30/2024"}}),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(PeriodConfig::from_json({{"prior", "2023"}}), std::invalid_argument);
    }

    REQUIRE(parse_period_type(to_string(PeriodType::MULTI_YEAR)) == PeriodType::MULTI_YEAR);
}

TEST_CASE("InputConfig delimiters", "[DataLoader]") {
    REQUIRE(InputConfig::from_json({{"delimiter", ";"}}).delimiter == ';');
    REQUIRE(InputConfig::from_json({{"delimiter", "tab"}}).delimiter == '\t');
    REQUIRE(InputConfig::from_json({{"delimiter", "\\t"}}).delimiter == '\t');
    REQUIRE_THROWS_AS(InputConfig::from_json({{"delimiter", ";;"}}), std::invalid_argument);
}

TEST_CASE("AnalysisConfig validation", "[DataLoader]") {
    auto valid = AnalysisConfig::from_json(base_config());

    SECTION("missing mappings") {
        auto config = valid;
        config.columns.sales.clear();
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("gross margin needs cost") {
        auto config = valid;
        config.columns.cost.clear();
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
        config.bridge.mode = bridge::BridgeMode::PVM;
        REQUIRE_NOTHROW(config.validate());
    }

    SECTION("fiscal year end month") {
        auto config = valid;
        config.periods.fiscal_year_end_month = 13;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("two-period ranges") {
        auto config = valid;
        config.periods.current.reset();
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);

        config = valid;
        config.periods.prior = periods::DateRange{Date{2023, 12, 31}, Date{2023, 1, 1}};
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("date format and sort order") {
        auto config = valid;
        config.date_format = "DD.MM.YYYY";
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
        config.date_format = "AUTO";
        REQUIRE_NOTHROW(config.validate());
        config.date_format = "MM/DD/YYYY";
        REQUIRE_NOTHROW(config.validate());

        config.output.sort_by = "profit";
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("multi-year needs two explicit years") {
        auto config = valid;
        config.periods.type = PeriodType::MULTI_YEAR;
        config.periods.fiscal_years = {2024};
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
        config.periods.fiscal_years = {2023, 2024};
        REQUIRE_NOTHROW(config.validate());
    }
}

TEST_CASE("DataLoader configuration files", "[DataLoader]") {
    SECTION("valid file") {
        auto path = write_temp("pvm_loader_config.json", base_config().dump());
        auto config = DataLoader::load_config(path);
        REQUIRE(config.columns.quantity == "Units");
        REQUIRE(AnalysisConfig::load_from_file(path).output.top == 25);
        std::filesystem::remove(path);
    }

    SECTION("missing file") {
        REQUIRE_THROWS_AS(DataLoader::load_json("/nonexistent/pvm_config.json"), std::runtime_error);
    }

    SECTION("malformed JSON") {
        auto path = write_temp("pvm_loader_broken.json", "{\"input\": ");
        REQUIRE_THROWS_AS(DataLoader::load_json(path), std::runtime_error);
        std::filesystem::remove(path);
    }

    SECTION("wrong value types are configuration errors") {
        auto j = base_config();
        j["output"]["top"] = "many";
        auto path = write_temp("pvm_loader_types.json", j.dump());
        REQUIRE_THROWS_AS(DataLoader::load_config(path), std::invalid_argument);
        std::filesystem::remove(path);
    }

    SECTION("invalid configuration") {
        auto j = base_config();
        j["columns"].erase("date");
        auto path = write_temp("pvm_loader_invalid.json", j.dump());
        REQUIRE_THROWS_AS(DataLoader::load_config(path), std::invalid_argument);
        std::filesystem::remove(path);
    }
}

TEST_CASE("DataLoader column detection", "[DataLoader]") {
    std::vector<std::string> headers = {"Region", "Order Date", "Net Sales", "Qty", "Unit Cost", "SKU", "Discount"};
    auto samples = records(headers, {
        {"East", "2024-01-15", "100", "10", "6", "A-1", "0.1"},
        {"West", "2024-01-16", "$200", "5", "12", "B-2", ""},
    });

    auto mapping = DataLoader::detect_column_mappings(headers, samples);
    REQUIRE(mapping.date == "Order Date");
    REQUIRE(mapping.sales == "Net Sales");
    REQUIRE(mapping.quantity == "Qty");
    REQUIRE(mapping.cost == "Unit Cost");
    REQUIRE(mapping.dimensions == std::vector<std::string>{"Region", "SKU"});

    SECTION("exact names win over partial matches") {
        std::vector<std::string> h = {"sales_rep", "Sales", "Date", "Volume"};
        auto m = DataLoader::detect_column_mappings(h, {});
        REQUIRE(m.sales == "Sales");
        REQUIRE(m.date == "Date");
        REQUIRE(m.quantity == "Volume");
        REQUIRE(m.cost.empty());
    }
}

TEST_CASE("DataLoader date samples", "[DataLoader]") {
    std::vector<std::string> headers = {"date", "sales"};
    auto samples = records(headers, {
        {"2024-01-01", "1"}, {"", "1"}, {"2024-01-01", "1"}, {"2024-01-02", "1"}, {" 2024-01-03 ", "1"},
        {"2024-01-04", "1"}, {"2024-01-05", "1"}, {"2024-01-06", "1"},
    });

    auto values = DataLoader::extract_date_samples(samples, "date");
    REQUIRE(values.size() == kMaxDateSamples);
    REQUIRE(values[0] == "2024-01-01");
    REQUIRE(values[1] == "2024-01-02");
    REQUIRE(values[2] == "2024-01-03");

    REQUIRE(DataLoader::extract_date_samples(samples, "missing").empty());
    REQUIRE(DataLoader::extract_date_samples(samples, "date", 2).size() == 2);
}

TEST_CASE("DataLoader file scan", "[DataLoader]") {
    std::string text = "region;date;sales;qty\n";
    for (int i = 0; i < 250; ++i) {
        text += "East;2024-01-01;" + std::to_string(i + 1) + ";1\n";
    }
    auto path = write_temp("pvm_loader_scan.csv", text);

    InputConfig input;
    input.file = path;
    input.delimiter = ';';
    input.chunk_size = 128;

    auto scan = DataLoader::scan_file(input);
    REQUIRE(scan.headers == std::vector<std::string>{"region", "date", "sales", "qty"});
    REQUIRE(scan.records.size() == kDefaultScanRecords);
    REQUIRE(scan.records.front()["sales"] == "1");

    REQUIRE(DataLoader::scan_file(input, 10).records.size() == 10);

    input.file.clear();
    REQUIRE_THROWS_AS(DataLoader::open_file(input), std::invalid_argument);

    input.file = "/nonexistent/pvm_sales.csv";
    REQUIRE_THROWS_AS(DataLoader::scan_file(input), std::runtime_error);

    std::filesystem::remove(path);
}
