/**
 * @file main.cpp
 * @brief Main entry point for the PVM Bridge tool
 *
 * Command-line application that loads an analysis configuration, streams
 * a sales file through the aggregation engine, decomposes the change
 * between periods into price, volume and mix, and writes the results.
 */

#include "analysis/analysis_pipeline.hpp"
#include "bridge/bridge_report.hpp"
#include "data/data_loader.hpp"
#include "periods/date_format.hpp"
#include "periods/fiscal_calendar.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>

using namespace pvm;

namespace
{
    std::atomic<bool> g_cancel_requested{false};

    void handle_interrupt(int)
    {
        g_cancel_requested.store(true);
    }
}

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "PVM Bridge v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH         Path to analysis configuration JSON file (required)\n"
              << "  --input PATH          Input file (overrides input.file)\n"
              << "  --output PATH         Output directory (overrides output.directory)\n"
              << "  --scan                Print detected columns, date format and periods, then exit\n"
              << "  --sort FIELD          Detail order: total|price|volume|mix|cost[-asc|-desc]\n"
              << "  --filter TEXT         Keep buckets with a dimension value containing TEXT\n"
              << "  --top N               Print only the first N detail rows\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --config data/config/analysis_config.json --verbose\n"
              << "  " << program_name << " --config data/config/analysis_config.json --scan\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       PVM Bridge v1.0.0                                        \n"
              << "       Price / Volume / Mix and Gross Margin bridges            \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string input_path;
    std::string output_dir;
    std::string sort_by;
    std::string filter;
    size_t top = 0;
    bool scan_only = false;
    bool verbose = false;
    bool show_help = false;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                args.show_help = true;
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--input" && i + 1 < argc)
            {
                args.input_path = argv[++i];
            }
            else if (arg == "--output" && i + 1 < argc)
            {
                args.output_dir = argv[++i];
            }
            else if (arg == "--sort" && i + 1 < argc)
            {
                args.sort_by = argv[++i];
            }
            else if (arg == "--filter" && i + 1 < argc)
            {
                args.filter = argv[++i];
            }
            else if (arg == "--top" && i + 1 < argc)
            {
                try
                {
                    args.top = static_cast<size_t>(std::stoul(argv[++i]));
                }
                catch (const std::exception &)
                {
                    std::cerr << "Warning: Ignoring invalid --top value: " << argv[i] << std::endl;
                }
            }
            else if (arg == "--scan")
            {
                args.scan_only = true;
            }
            else if (arg == "--verbose")
            {
                args.verbose = true;
            }
            else
            {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        return args;
    }

    bool is_valid() const
    {
        return !show_help && !config_path.empty();
    }
};

/**
 * @brief Print what the input looks like without running an analysis
 */
int run_scan(const AnalysisConfig &config)
{
    auto scan = DataLoader::scan_file(config.input);
    std::cout << "Columns (" << scan.headers.size() << "):\n";
    for (const auto &header : scan.headers)
    {
        std::cout << "  - " << header << "\n";
    }

    auto detected = DataLoader::detect_column_mappings(scan.headers, scan.records);
    std::cout << "\nDetected mapping (from " << scan.records.size() << " sample rows):\n";
    std::cout << "  date:     " << detected.date << "\n";
    std::cout << "  sales:    " << detected.sales << "\n";
    std::cout << "  quantity: " << detected.quantity << "\n";
    std::cout << "  cost:     " << detected.cost << "\n";
    std::cout << "  candidate dimensions: ";
    for (const auto &dimension : detected.dimensions)
    {
        std::cout << dimension << " ";
    }
    std::cout << "\n";

    std::string date_column = config.columns.date.empty() ? detected.date : config.columns.date;
    if (date_column.empty())
    {
        std::cerr << "Warning: No date column configured or detected\n";
        return 0;
    }

    auto samples = DataLoader::extract_date_samples(scan.records, date_column);
    auto detection = periods::detect_date_format(samples);
    if (!detection.format_id)
    {
        std::cerr << "Warning: Could not detect the date format of column '" << date_column << "'\n";
        return 0;
    }
    std::cout << "\nDate format: " << *detection.format_id << " (e.g. " << detection.format->example
              << ", confidence " << std::fixed << std::setprecision(0) << detection.confidence * 100 << "%)\n";

    auto chunks = DataLoader::open_file(config.input);
    data::CsvRecordSource source(*chunks, config.input.delimiter);
    auto range = scan_date_range(source, date_column, *detection.format_id);
    if (!range.has_dates())
    {
        std::cerr << "Warning: No parseable dates found\n";
        return 0;
    }

    std::cout << "Date range: " << periods::format_date_range({*range.min_date, *range.max_date})
              << " (" << range.parsed_rows << " of " << range.row_count << " rows dated)\n";

    int fy_end = config.periods.fiscal_year_end_month;
    periods::check_fiscal_year_end_month(fy_end);
    std::cout << "\nFiscal years (year end: " << periods::kMonthNames[fy_end - 1] << "):\n";
    for (const auto &year : periods::discover_fiscal_years(*range.min_date, *range.max_date, fy_end))
    {
        std::cout << "  " << std::left << std::setw(9) << year.label << periods::format_date_range(year.range)
                  << (year.fully_covered ? "" : "  (partial)") << "\n";
    }
    return 0;
}

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        // ====================================================================
        // 1. Load Configuration
        // ====================================================================
        std::cout << "[1/4] Loading configuration..." << std::endl;

        // Validation waits until the overrides are applied; --scan needs no mapping
        auto config = AnalysisConfig::from_json(DataLoader::load_json(args.config_path));
        if (!args.input_path.empty())
            config.input.file = args.input_path;
        if (!args.output_dir.empty())
            config.output.directory = args.output_dir;
        if (!args.sort_by.empty())
            config.output.sort_by = args.sort_by;
        if (!args.filter.empty())
            config.output.filter = args.filter;
        if (args.top > 0)
            config.output.top = args.top;

        if (args.scan_only)
        {
            std::cout << "[2/4] Scanning input..." << std::endl;
            return run_scan(config);
        }

        config.validate();

        if (args.verbose)
        {
            std::cout << "  - Input: " << config.input.file << "\n";
            std::cout << "  - Periods: " << to_string(config.periods.type)
                      << " (fiscal year end month " << config.periods.fiscal_year_end_month << ")\n";
            std::cout << "  - Mode: " << bridge::to_string(config.bridge.mode);
            if (config.bridge.mode == bridge::BridgeMode::GM)
            {
                std::cout << " (" << bridge::to_string(config.bridge.price_definition) << ")";
            }
            std::cout << "\n  - Dimensions: ";
            for (const auto &dimension : config.columns.dimensions)
            {
                std::cout << dimension << " ";
            }
            std::cout << "\n";
        }

        // ====================================================================
        // 2. Aggregate
        // ====================================================================
        std::cout << "[2/4] Aggregating " << config.input.file << "..." << std::endl;

        std::signal(SIGINT, handle_interrupt);

        PipelineParams params;
        params.verbose = args.verbose;
        params.run.cancel_flag = &g_cancel_requested;
        if (args.verbose)
        {
            params.run.progress_interval = 100000;
            params.run.on_progress = [](const ProgressUpdate &update)
            {
                std::cout << "\r  - " << update.rows << " rows (" << std::fixed << std::setprecision(1)
                          << update.fraction() * 100 << "%)" << std::flush;
            };
        }

        auto chunks = DataLoader::open_file(config.input);
        data::CsvRecordSource source(*chunks, config.input.delimiter);

        AnalysisPipeline pipeline(config, params);
        auto output = pipeline.run(source);
        if (args.verbose)
        {
            std::cout << "\n";
        }

        for (const auto &warning : output.warnings)
        {
            std::cerr << "Warning: " << warning << "\n";
        }

        if (output.cancelled)
        {
            std::cerr << "Warning: Analysis cancelled after " << output.stats.total_rows << " rows\n";
            return 1;
        }

        const auto &stats = output.stats;
        std::cout << "  - " << stats.total_rows << " rows, " << stats.included_rows << " included, "
                  << stats.unique_keys << " buckets" << std::endl;
        if (stats.parse_errors > 0)
        {
            std::cerr << "Warning: " << stats.parse_errors << " rows had an unparseable date or number\n";
        }
        if (stats.negative_rows > 0)
        {
            std::cerr << "Warning: " << stats.negative_rows
                      << " rows with non-positive sales or quantity were excluded\n";
        }

        // ====================================================================
        // 3. Bridge
        // ====================================================================
        std::cout << "[3/4] Computing bridge..." << std::endl;

        const auto &result = *output.bridge;
        auto rows = bridge::BridgeCalculator::filter_results(result.detail, config.output.filter);
        rows = bridge::BridgeCalculator::sort_results(rows, bridge::SortSpec::parse(config.output.sort_by));

        bridge::BridgeReport report(result, *output.aggregation, config.to_json());
        report.print_summary();

        std::cout << "\n";
        report.print_detail(rows, config.output.top);

        // ====================================================================
        // 4. Export
        // ====================================================================
        std::cout << "\n[4/4] Writing results to " << config.output.directory << "..." << std::endl;

        for (const auto &path : report.write_all(config.output.directory, rows))
        {
            std::cout << "  - " << path << "\n";
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        std::cout << "Analysis completed successfully in "
                  << duration << " ms\n";
        std::cout << "================================================================\n"
                  << std::endl;

        return 0;
    }
    catch (const RunError &e)
    {
        const auto &partial = e.partial_stats();
        std::cerr << "\nError: " << e.what() << " (after " << partial.total_rows << " rows, "
                  << partial.included_rows << " included)" << std::endl;
        return 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    // Parse command-line arguments
    auto args = CommandLineArgs::parse(argc, argv);

    // Show help if requested or invalid args
    if (args.show_help || !args.is_valid())
    {
        print_banner();
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    // Print banner
    print_banner();

    // Run analysis
    return run(args);
}
