/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader class and configuration structures
 */

#include "data/data_loader.hpp"
#include "data/field_parsing.hpp"
#include "periods/date_format.hpp"
#include "periods/fiscal_calendar.hpp"
#include <algorithm>
#include <fstream>
#include <regex>
#include <set>
#include <stdexcept>

namespace pvm
{

    namespace
    {

        periods::Date parse_config_date(const nlohmann::json &j, const std::string &field)
        {
            std::string text = j.get<std::string>();
            auto date = periods::from_iso_string(text);
            if (!date)
            {
                throw std::invalid_argument("Invalid date for '" + field + "': '" + text +
                                            "' (expected YYYY-MM-DD)");
            }
            return *date;
        }

        periods::DateRange parse_config_range(const nlohmann::json &j, const std::string &field)
        {
            if (!j.is_object() || !j.contains("start") || !j.contains("end"))
            {
                throw std::invalid_argument("'" + field + "' must be an object with 'start' and 'end'");
            }
            return periods::DateRange{parse_config_date(j["start"], field + ".start"),
                                      parse_config_date(j["end"], field + ".end")};
        }

        nlohmann::json range_to_json(const periods::DateRange &range)
        {
            return nlohmann::json{
                {"start", periods::to_iso_string(range.start)},
                {"end", periods::to_iso_string(range.end)}};
        }

        // Ordered patterns per role; the first pattern with a match wins
        const std::vector<std::pair<std::string, std::vector<std::string>>> &column_patterns()
        {
            static const std::vector<std::pair<std::string, std::vector<std::string>>> patterns = {
                {"date", {"^date$", "^transaction.?date$", "^invoice.?date$", "^order.?date$",
                          "^sale.?date$", "date"}},
                {"sales", {"^sales$", "^revenue$", "^net.?sales$", "^total.?sales$", "^amount$",
                           "^sales.?amount$", "sales", "revenue"}},
                {"quantity", {"^quantity$", "^qty$", "^volume$", "^units$", "^count$", "quantity",
                              "volume"}},
                {"cost", {"^cost$", "^cogs$", "^cost.?of.?goods$", "^total.?cost$", "^unit.?cost$",
                          "cost"}}};
            return patterns;
        }

    } // namespace

    // =============================================
    // Configuration Structures - from_json Methods
    // =============================================

    InputConfig InputConfig::from_json(const nlohmann::json &j)
    {
        InputConfig config;
        config.file = j.value("file", "");
        config.chunk_size = j.value("chunk_size", data::kDefaultChunkSize);

        std::string delimiter = j.value("delimiter", ",");
        if (delimiter == "\\t" || data::to_lower(delimiter) == "tab")
        {
            delimiter = "\t";
        }
        if (delimiter.size() != 1)
        {
            throw std::invalid_argument("Delimiter must be a single character, got '" + delimiter + "'");
        }
        config.delimiter = delimiter[0];
        return config;
    }

    ColumnMapping ColumnMapping::from_json(const nlohmann::json &j)
    {
        ColumnMapping mapping;
        mapping.date = j.value("date", "");
        mapping.sales = j.value("sales", "");
        mapping.quantity = j.value("quantity", "");
        mapping.cost = j.value("cost", "");
        mapping.dimensions = j.value("dimensions", std::vector<std::string>{});
        return mapping;
    }

    PeriodType parse_period_type(const std::string &text)
    {
        std::string value = data::to_lower(data::trim(text));
        if (value == "two_period")
            return PeriodType::TWO_PERIOD;
        if (value == "fiscal_year")
            return PeriodType::FISCAL_YEAR;
        if (value == "ltm")
            return PeriodType::LTM;
        if (value == "multi_year")
            return PeriodType::MULTI_YEAR;
        throw std::invalid_argument("Unknown period type: '" + text +
                                    "' (expected two_period, fiscal_year, ltm or multi_year)");
    }

    std::string to_string(PeriodType type)
    {
        switch (type)
        {
        case PeriodType::TWO_PERIOD:
            return "two_period";
        case PeriodType::FISCAL_YEAR:
            return "fiscal_year";
        case PeriodType::LTM:
            return "ltm";
        case PeriodType::MULTI_YEAR:
            return "multi_year";
        }
        return "two_period";
    }

    PeriodConfig PeriodConfig::from_json(const nlohmann::json &j)
    {
        PeriodConfig config;
        config.type = parse_period_type(j.value("type", "two_period"));
        config.fiscal_year_end_month = j.value("fiscal_year_end_month", 12);

        if (j.contains("prior"))
        {
            config.prior = parse_config_range(j["prior"], "prior");
        }
        if (j.contains("current"))
        {
            config.current = parse_config_range(j["current"], "current");
        }
        if (j.contains("current_fiscal_year"))
        {
            config.current_fiscal_year = j["current_fiscal_year"].get<int>();
        }
        if (j.contains("ltm_end_date"))
        {
            config.ltm_end_date = parse_config_date(j["ltm_end_date"], "ltm_end_date");
        }

        if (j.contains("fiscal_years"))
        {
            const auto &years = j["fiscal_years"];
            if (years.is_string())
            {
                if (data::to_lower(years.get<std::string>()) != "auto")
                {
                    throw std::invalid_argument("'fiscal_years' must be a list of years or \"auto\"");
                }
                config.auto_fiscal_years = true;
            }
            else
            {
                config.fiscal_years = years.get<std::vector<int>>();
                std::sort(config.fiscal_years.begin(), config.fiscal_years.end());
                config.fiscal_years.erase(std::unique(config.fiscal_years.begin(), config.fiscal_years.end()),
                                          config.fiscal_years.end());
            }
        }
        else if (config.type == PeriodType::MULTI_YEAR)
        {
            config.auto_fiscal_years = true;
        }

        return config;
    }

    OutputConfig OutputConfig::from_json(const nlohmann::json &j)
    {
        OutputConfig config;
        config.directory = j.value("directory", "results");
        config.sort_by = j.value("sort_by", "total-desc");
        config.filter = j.value("filter", "");
        config.top = j.value("top", static_cast<size_t>(0));
        return config;
    }

    AnalysisConfig AnalysisConfig::from_json(const nlohmann::json &j)
    {
        AnalysisConfig config;

        if (j.contains("input"))
        {
            config.input = InputConfig::from_json(j["input"]);
        }

        if (j.contains("columns"))
        {
            config.columns = ColumnMapping::from_json(j["columns"]);
        }

        if (j.contains("periods"))
        {
            config.periods = PeriodConfig::from_json(j["periods"]);
        }

        if (j.contains("bridge"))
        {
            config.bridge = bridge::BridgeOptions::from_json(j["bridge"]);
        }

        if (j.contains("output"))
        {
            config.output = OutputConfig::from_json(j["output"]);
        }

        config.date_format = j.value("date_format", "auto");
        return config;
    }

    nlohmann::json AnalysisConfig::to_json() const
    {
        nlohmann::json j;
        j["input"] = {
            {"file", input.file},
            {"chunk_size", input.chunk_size},
            {"delimiter", std::string(1, input.delimiter)}};
        j["columns"] = {
            {"date", columns.date},
            {"sales", columns.sales},
            {"quantity", columns.quantity},
            {"cost", columns.cost},
            {"dimensions", columns.dimensions}};

        nlohmann::json p;
        p["type"] = to_string(periods.type);
        p["fiscal_year_end_month"] = periods.fiscal_year_end_month;
        if (periods.prior)
            p["prior"] = range_to_json(*periods.prior);
        if (periods.current)
            p["current"] = range_to_json(*periods.current);
        if (periods.current_fiscal_year)
            p["current_fiscal_year"] = *periods.current_fiscal_year;
        if (periods.ltm_end_date)
            p["ltm_end_date"] = periods::to_iso_string(*periods.ltm_end_date);
        if (periods.auto_fiscal_years)
            p["fiscal_years"] = "auto";
        else if (!periods.fiscal_years.empty())
            p["fiscal_years"] = periods.fiscal_years;
        j["periods"] = p;

        j["bridge"] = bridge.to_json();
        j["output"] = {
            {"directory", output.directory},
            {"sort_by", output.sort_by},
            {"filter", output.filter},
            {"top", output.top}};
        j["date_format"] = date_format;
        return j;
    }

    void AnalysisConfig::validate() const
    {
        if (columns.date.empty())
            throw std::invalid_argument("Missing required column mapping: date");
        if (columns.sales.empty())
            throw std::invalid_argument("Missing required column mapping: sales");
        if (columns.quantity.empty())
            throw std::invalid_argument("Missing required column mapping: quantity");

        if (bridge.mode == bridge::BridgeMode::GM && columns.cost.empty())
        {
            throw std::invalid_argument("Gross margin mode requires a cost column mapping");
        }

        if (input.chunk_size == 0)
        {
            throw std::invalid_argument("Chunk size must be positive");
        }

        periods::check_fiscal_year_end_month(periods.fiscal_year_end_month);

        if (data::to_lower(date_format) != "auto" && !periods::find_date_format(date_format))
        {
            throw std::invalid_argument("Unknown date format: '" + date_format + "'");
        }

        switch (periods.type)
        {
        case PeriodType::TWO_PERIOD:
        {
            if (!periods.prior || !periods.current)
            {
                throw std::invalid_argument("two_period analysis requires 'prior' and 'current' ranges");
            }
            auto check = periods::validate_period_config(*periods.prior, *periods.current);
            if (!check.errors.empty())
            {
                throw std::invalid_argument(check.errors.front());
            }
            break;
        }
        case PeriodType::MULTI_YEAR:
            if (!periods.auto_fiscal_years && periods.fiscal_years.size() < 2)
            {
                throw std::invalid_argument("multi_year analysis requires at least two fiscal years");
            }
            break;
        case PeriodType::FISCAL_YEAR:
        case PeriodType::LTM:
            break;
        }

        // Throws on an unknown sort field
        bridge::SortSpec::parse(output.sort_by);
    }

    AnalysisConfig AnalysisConfig::load_from_file(const std::string &config_path)
    {
        return DataLoader::load_config(config_path);
    }

    // ================
    // JSON Loading
    // ================

    nlohmann::json DataLoader::load_json(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + filepath);
        }

        nlohmann::json j;
        try
        {
            file >> j;
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
        }

        return j;
    }

    AnalysisConfig DataLoader::load_config(const std::string &config_path)
    {
        auto j = load_json(config_path);

        AnalysisConfig config;
        try
        {
            config = AnalysisConfig::from_json(j);
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::invalid_argument("Invalid configuration in " + config_path + ": " + e.what());
        }

        config.validate();
        return config;
    }

    // ===========================
    // Input Discovery
    // ===========================

    std::unique_ptr<data::FileChunkSource> DataLoader::open_file(const InputConfig &input)
    {
        if (input.file.empty())
        {
            throw std::invalid_argument("No input file configured");
        }
        return std::make_unique<data::FileChunkSource>(input.file, input.chunk_size);
    }

    FileScan DataLoader::scan_source(data::RecordSource &source, size_t max_records)
    {
        FileScan scan;

        data::ParseHandlers handlers;
        handlers.on_headers = [&scan](const std::vector<std::string> &headers)
        { scan.headers = headers; };
        handlers.on_record = [&scan, max_records](const data::Record &record, std::uint64_t)
        {
            if (scan.records.size() < max_records)
                scan.records.push_back(record);
        };
        handlers.should_cancel = [&scan, max_records]()
        { return scan.records.size() >= max_records; };
        handlers.cancel_check_interval = 1;

        source.parse(handlers);
        return scan;
    }

    FileScan DataLoader::scan_file(const InputConfig &input, size_t max_records)
    {
        auto chunks = open_file(input);
        data::CsvRecordSource source(*chunks, input.delimiter);
        return scan_source(source, max_records);
    }

    ColumnMapping DataLoader::detect_column_mappings(const std::vector<std::string> &headers,
                                                     const std::vector<data::Record> &samples)
    {
        ColumnMapping mapping;
        std::set<std::string> used;

        for (const auto &[role, patterns] : column_patterns())
        {
            std::string found;
            for (const auto &pattern : patterns)
            {
                std::regex re(pattern, std::regex::ECMAScript | std::regex::icase);
                for (const auto &header : headers)
                {
                    if (used.count(header) == 0 && std::regex_search(header, re))
                    {
                        found = header;
                        break;
                    }
                }
                if (!found.empty())
                    break;
            }

            if (found.empty())
                continue;

            used.insert(found);
            if (role == "date")
                mapping.date = found;
            else if (role == "sales")
                mapping.sales = found;
            else if (role == "quantity")
                mapping.quantity = found;
            else
                mapping.cost = found;
        }

        for (const auto &header : headers)
        {
            if (used.count(header) != 0)
                continue;

            bool numeric = std::all_of(samples.begin(), samples.end(), [&header](const data::Record &record)
                                       {
                                           const std::string value = data::trim(record.get(header));
                                           return value.empty() || data::parse_number(value).has_value();
                                       });
            if (!numeric)
                mapping.dimensions.push_back(header);
        }

        return mapping;
    }

    std::vector<std::string> DataLoader::extract_date_samples(const std::vector<data::Record> &samples,
                                                              const std::string &date_column,
                                                              size_t max_samples)
    {
        std::vector<std::string> values;
        for (const auto &record : samples)
        {
            if (values.size() >= max_samples)
                break;

            std::string value = data::trim(record.get(date_column));
            if (value.empty())
                continue;
            if (std::find(values.begin(), values.end(), value) == values.end())
                values.push_back(value);
        }
        return values;
    }

} // namespace pvm
