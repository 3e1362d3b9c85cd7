#include "analysis/analysis_pipeline.hpp"
#include "data/field_parsing.hpp"
#include "periods/date_format.hpp"
#include "periods/fiscal_calendar.hpp"

#include <iostream>

namespace pvm
{

    namespace
    {

        data::ParseHandlers make_handlers(const RunOptions &options)
        {
            data::ParseHandlers handlers;
            handlers.progress_interval = options.progress_interval;
            handlers.cancel_check_interval = options.cancel_check_interval;

            if (options.on_progress)
            {
                auto callback = options.on_progress;
                handlers.on_progress = [callback](std::uint64_t bytes, std::uint64_t total, std::uint64_t rows)
                {
                    ProgressUpdate update;
                    update.bytes_read = bytes;
                    update.total_bytes = total;
                    update.rows = rows;
                    callback(update);
                };
            }

            if (options.cancel_flag)
            {
                const std::atomic<bool> *flag = options.cancel_flag;
                handlers.should_cancel = [flag]()
                { return flag->load(); };
            }

            return handlers;
        }

        aggregation::PeriodWindow fiscal_window(int fiscal_year, int fy_end_month)
        {
            aggregation::PeriodWindow window;
            window.fiscal_year = fiscal_year;
            window.range = periods::fiscal_year_range(fiscal_year, fy_end_month);
            window.label = periods::fiscal_year_label(fiscal_year);
            return window;
        }

        const DateRangeScan &require_range(const std::optional<DateRangeScan> &range, const char *what)
        {
            if (!range || !range->has_dates())
            {
                throw std::invalid_argument(std::string("No parseable dates in the input; cannot determine ") + what);
            }
            return *range;
        }

    } // namespace

    // ===================================================================
    // Streaming passes
    // ===================================================================

    RunOutcome run_aggregation(data::RecordSource &source,
                               const aggregation::AggregationConfig &config,
                               const RunOptions &options)
    {
        // Configuration errors surface here, before the first byte is read
        aggregation::Aggregator aggregator(config);

        RunOutcome outcome;
        data::ParseHandlers handlers = make_handlers(options);
        handlers.on_headers = [&config](const std::vector<std::string> &columns)
        { config.validate_header(columns); };
        handlers.on_record = [&aggregator](const data::Record &record, std::uint64_t)
        { aggregator.process_row(record); };

        data::ParseOutcome parsed;
        try
        {
            parsed = source.parse(handlers);
        }
        catch (const std::runtime_error &e)
        {
            throw RunError(e.what(), aggregator.statistics());
        }

        outcome.headers = parsed.headers;

        if (parsed.cancelled)
        {
            outcome.cancelled = true;
            outcome.stats = aggregator.statistics();
            return outcome;
        }

        if (parsed.headers.empty())
        {
            throw RunError("Input contains no header row", aggregator.statistics());
        }

        outcome.result = aggregator.finalize();
        outcome.stats = outcome.result->stats;
        return outcome;
    }

    DateRangeScan scan_date_range(data::RecordSource &source,
                                  const std::string &date_column,
                                  const std::string &date_format,
                                  const RunOptions &options)
    {
        const periods::DateFormat *format = periods::find_date_format(date_format);
        if (!format)
        {
            throw std::invalid_argument("Unknown date format: " + date_format);
        }

        DateRangeScan scan;
        std::optional<size_t> index;

        data::ParseHandlers handlers = make_handlers(options);
        handlers.on_headers = [&](const std::vector<std::string> &columns)
        {
            data::RecordHeader header(columns);
            index = header.index_of(date_column);
            if (!index)
            {
                throw std::invalid_argument("Column '" + date_column + "' not found in input header");
            }
        };
        handlers.on_record = [&](const data::Record &record, std::uint64_t)
        {
            ++scan.row_count;
            auto date = periods::parse_date(data::trim(record.value_at(*index)), *format);
            if (!date)
                return;

            ++scan.parsed_rows;
            if (!scan.min_date || *date < *scan.min_date)
                scan.min_date = date;
            if (!scan.max_date || *date > *scan.max_date)
                scan.max_date = date;
        };

        source.parse(handlers);
        return scan;
    }

    // ===================================================================
    // Period setup
    // ===================================================================

    std::string resolve_date_format(const AnalysisConfig &config, const FileScan &scan)
    {
        if (data::to_lower(config.date_format) != "auto")
        {
            if (!periods::find_date_format(config.date_format))
            {
                throw std::invalid_argument("Unknown date format: " + config.date_format);
            }
            return config.date_format;
        }

        auto samples = DataLoader::extract_date_samples(scan.records, config.columns.date);
        auto detection = periods::detect_date_format(samples);
        if (!detection.format_id)
        {
            throw std::invalid_argument("Could not detect the date format of column '" + config.columns.date + "'");
        }
        return *detection.format_id;
    }

    bool needs_date_range(const PeriodConfig &periods)
    {
        switch (periods.type)
        {
        case PeriodType::TWO_PERIOD:
            return false;
        case PeriodType::FISCAL_YEAR:
            return !periods.current_fiscal_year.has_value();
        case PeriodType::LTM:
            return !periods.ltm_end_date.has_value();
        case PeriodType::MULTI_YEAR:
            return periods.auto_fiscal_years;
        }
        return false;
    }

    aggregation::AggregationConfig build_aggregation_config(const AnalysisConfig &config,
                                                            const std::string &date_format,
                                                            const std::optional<DateRangeScan> &range)
    {
        const PeriodConfig &p = config.periods;
        const int fy_end = p.fiscal_year_end_month;
        periods::check_fiscal_year_end_month(fy_end);

        aggregation::AggregationConfig agg;

        switch (p.type)
        {
        case PeriodType::TWO_PERIOD:
        {
            if (!p.prior || !p.current)
            {
                throw std::invalid_argument("two_period analysis requires 'prior' and 'current' ranges");
            }
            agg = aggregation::AggregationConfig::two_period(*p.prior, *p.current);
            break;
        }

        case PeriodType::FISCAL_YEAR:
        {
            int current = p.current_fiscal_year
                              ? *p.current_fiscal_year
                              : periods::fiscal_year_of(*require_range(range, "the current fiscal year").max_date, fy_end);

            agg.mode = aggregation::PeriodMode::TWO_PERIOD;
            agg.periods = {fiscal_window(current - 1, fy_end), fiscal_window(current, fy_end)};
            break;
        }

        case PeriodType::LTM:
        {
            periods::Date end = p.ltm_end_date
                                    ? *p.ltm_end_date
                                    : *require_range(range, "the LTM end date").max_date;

            aggregation::PeriodWindow ltm;
            ltm.label = "LTM";
            ltm.range = periods::ltm_range(end);

            agg.mode = aggregation::PeriodMode::TWO_PERIOD;
            agg.periods = {fiscal_window(periods::prior_fiscal_year(end, fy_end), fy_end), ltm};
            break;
        }

        case PeriodType::MULTI_YEAR:
        {
            std::vector<aggregation::PeriodWindow> windows;
            if (p.auto_fiscal_years)
            {
                const auto &scan = require_range(range, "the fiscal years");
                for (const auto &year : periods::discover_fiscal_years(*scan.min_date, *scan.max_date, fy_end))
                {
                    if (!year.fully_covered)
                        continue;
                    auto window = fiscal_window(year.fiscal_year, fy_end);
                    window.fully_covered = true;
                    windows.push_back(window);
                }
            }
            else
            {
                for (int year : p.fiscal_years)
                {
                    auto window = fiscal_window(year, fy_end);
                    if (range && range->has_dates())
                    {
                        window.fully_covered = *range->min_date <= window.range.start &&
                                               *range->max_date >= window.range.end;
                    }
                    windows.push_back(window);
                }
            }

            if (windows.size() < 2)
            {
                throw std::invalid_argument("multi_year analysis needs at least two fiscal years, found " +
                                            std::to_string(windows.size()));
            }
            agg = aggregation::AggregationConfig::multi_year(windows);
            break;
        }
        }

        agg.dimension_columns = config.columns.dimensions;
        agg.date_column = config.columns.date;
        agg.sales_column = config.columns.sales;
        agg.quantity_column = config.columns.quantity;
        agg.cost_column = config.columns.cost;
        agg.date_format = date_format;

        agg.validate();
        return agg;
    }

    std::vector<std::string> period_warnings(const aggregation::AggregationConfig &config)
    {
        std::vector<std::string> warnings;

        if (config.mode == aggregation::PeriodMode::TWO_PERIOD && config.periods.size() == 2)
        {
            auto check = periods::validate_period_config(config.periods[aggregation::kPriorSlot].range,
                                                         config.periods[aggregation::kCurrentSlot].range);
            warnings.insert(warnings.end(), check.warnings.begin(), check.warnings.end());
        }
        else
        {
            for (const auto &window : config.periods)
            {
                if (!window.fully_covered)
                {
                    warnings.push_back(window.label + " is only partially covered by the data (" +
                                       periods::format_date_range(window.range) + ").");
                }
            }
        }

        if (config.dimension_columns.size() > kMaxRecommendedDimensions)
        {
            warnings.push_back(std::to_string(config.dimension_columns.size()) +
                               " dimensions selected; more than " + std::to_string(kMaxRecommendedDimensions) +
                               " can produce a very large number of combinations.");
        }

        return warnings;
    }

    // ===================================================================
    // AnalysisPipeline
    // ===================================================================

    AnalysisPipeline::AnalysisPipeline(AnalysisConfig config, PipelineParams params)
        : config_(std::move(config)), params_(std::move(params))
    {
        config_.validate();
    }

    AnalysisOutput AnalysisPipeline::run(data::RecordSource &source)
    {
        AnalysisOutput output;

        // Step 1: header and date samples
        FileScan scan = DataLoader::scan_source(source);
        if (scan.headers.empty())
        {
            throw RunError("Input contains no header row", aggregation::RunStatistics{});
        }

        output.date_format = resolve_date_format(config_, scan);
        if (params_.verbose)
        {
            std::cout << "Date format: " << output.date_format << "\n";
        }

        // Step 2: date range, only when the periods depend on it
        bool want_range = needs_date_range(config_.periods) ||
                          (config_.periods.type == PeriodType::MULTI_YEAR && !config_.periods.auto_fiscal_years);
        if (want_range)
        {
            try
            {
                output.date_range = scan_date_range(source, config_.columns.date, output.date_format, params_.run);
            }
            catch (const std::runtime_error &e)
            {
                throw RunError(e.what(), aggregation::RunStatistics{});
            }

            if (params_.verbose && output.date_range->has_dates())
            {
                std::cout << "Data range: "
                          << periods::format_date_range({*output.date_range->min_date, *output.date_range->max_date})
                          << " (" << output.date_range->parsed_rows << " dated rows)\n";
            }
        }

        // Step 3: periods
        output.aggregation_config = build_aggregation_config(config_, output.date_format, output.date_range);
        output.warnings = period_warnings(output.aggregation_config);

        if (params_.verbose)
        {
            for (const auto &window : output.aggregation_config.periods)
            {
                std::cout << "Period " << window.label << ": " << periods::format_date_range(window.range) << "\n";
            }
        }

        // Step 4: aggregate
        RunOutcome run = run_aggregation(source, output.aggregation_config, params_.run);
        output.stats = run.stats;
        if (run.cancelled)
        {
            output.cancelled = true;
            return output;
        }

        output.aggregation = std::move(run.result);
        output.totals = aggregation::Aggregator::calculate_totals(*output.aggregation);

        if (params_.verbose)
        {
            std::cout << "Aggregated " << output.stats.included_rows << " of " << output.stats.total_rows
                      << " rows into " << output.stats.unique_keys << " buckets\n";
        }

        // Step 5: bridge
        bridge::BridgeCalculator calculator(config_.bridge);
        output.bridge = calculator.calculate(*output.aggregation);

        return output;
    }

} // namespace pvm
