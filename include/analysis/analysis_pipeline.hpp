#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "aggregation/aggregator.hpp"
#include "bridge/bridge_calculator.hpp"
#include "data/csv_parser.hpp"
#include "data/data_loader.hpp"

namespace pvm
{

    /**
     * @struct ProgressUpdate
     * @brief Observational progress of a streaming pass.
     */
    struct ProgressUpdate
    {
        std::uint64_t bytes_read = 0;
        std::uint64_t total_bytes = 0;
        std::uint64_t rows = 0;

        /// Fraction of the input consumed, 0 when the size is unknown.
        double fraction() const
        {
            return total_bytes > 0 ? static_cast<double>(bytes_read) / static_cast<double>(total_bytes) : 0.0;
        }
    };

    /**
     * @struct RunOptions
     * @brief Side channels of an aggregation run.
     *
     * The cancel flag is polled once per chunk and every
     * `cancel_check_interval` rows; it is only ever read.
     */
    struct RunOptions
    {
        std::function<void(const ProgressUpdate &)> on_progress;
        const std::atomic<bool> *cancel_flag = nullptr;
        std::uint64_t progress_interval = 100;
        std::uint64_t cancel_check_interval = 10000;
    };

    /**
     * @struct RunOutcome
     * @brief Result of run_aggregation().
     *
     * A cancelled run carries the statistics gathered so far and no result.
     */
    struct RunOutcome
    {
        bool cancelled = false;
        aggregation::RunStatistics stats;
        std::optional<aggregation::AggregationResult> result;
        std::vector<std::string> headers;
    };

    /**
     * @class RunError
     * @brief Fatal transport or parser failure during a run.
     */
    class RunError : public std::runtime_error
    {
    public:
        RunError(const std::string &message, aggregation::RunStatistics partial)
            : std::runtime_error(message), partial_(std::move(partial)) {}

        /// Row accounting up to the failure.
        const aggregation::RunStatistics &partial_stats() const { return partial_; }

    private:
        aggregation::RunStatistics partial_;
    };

    /**
     * @brief Stream a source through a fresh Aggregator.
     *
     * Column presence is checked against the header row before any data
     * row is processed.
     *
     * @throws std::invalid_argument on a configuration error (before or at
     *         the header row)
     * @throws RunError on an I/O or parser failure, with partial statistics
     */
    RunOutcome run_aggregation(data::RecordSource &source,
                               const aggregation::AggregationConfig &config,
                               const RunOptions &options = {});

    /**
     * @struct DateRangeScan
     * @brief Observed date bounds of a source.
     */
    struct DateRangeScan
    {
        std::optional<periods::Date> min_date;
        std::optional<periods::Date> max_date;
        std::uint64_t row_count = 0;    ///< Data rows read
        std::uint64_t parsed_rows = 0;  ///< Rows with a parseable date

        bool has_dates() const { return min_date.has_value() && max_date.has_value(); }
    };

    /**
     * @brief Full streaming pass collecting the min/max parseable date.
     * @throws std::invalid_argument if the date column is missing or the
     *         format id is unknown
     */
    DateRangeScan scan_date_range(data::RecordSource &source,
                                  const std::string &date_column,
                                  const std::string &date_format,
                                  const RunOptions &options = {});

    /**
     * @brief Resolve "auto" to a catalog id by detecting on sample records.
     * @throws std::invalid_argument if no sample parses in any format
     */
    std::string resolve_date_format(const AnalysisConfig &config, const FileScan &scan);

    /// True when the period setup depends on the data date range.
    bool needs_date_range(const PeriodConfig &periods);

    /**
     * @brief Turn the period definition into concrete period windows.
     *
     * two_period uses the ranges as given (PY, CY). fiscal_year compares
     * FY n-1 with FY n. ltm compares the fiscal year preceding the LTM end
     * date's fiscal year with the LTM window. multi_year uses the listed
     * years, or every fully covered year of the data range for "auto".
     *
     * @throws std::invalid_argument if the data range is needed but absent,
     *         or fewer than two fiscal years are available
     */
    aggregation::AggregationConfig build_aggregation_config(const AnalysisConfig &config,
                                                            const std::string &date_format,
                                                            const std::optional<DateRangeScan> &range);

    /**
     * @brief Data-quality warnings for a concrete period setup.
     *
     * Overlapping or distant two-period ranges, partially covered fiscal
     * years and more than the recommended number of dimensions.
     */
    std::vector<std::string> period_warnings(const aggregation::AggregationConfig &config);

    /**
     * @struct PipelineParams
     * @brief Run-time knobs of AnalysisPipeline.
     */
    struct PipelineParams
    {
        bool verbose = false;
        RunOptions run;
    };

    /**
     * @struct AnalysisOutput
     * @brief Everything produced by one analysis.
     */
    struct AnalysisOutput
    {
        bool cancelled = false;
        std::string date_format;                        ///< Resolved catalog id
        std::optional<DateRangeScan> date_range;        ///< Only when a scan was needed
        aggregation::AggregationConfig aggregation_config;
        std::vector<std::string> warnings;

        aggregation::RunStatistics stats;
        std::optional<aggregation::AggregationResult> aggregation;
        std::vector<aggregation::PeriodAccumulator> totals; ///< Per slot
        std::optional<bridge::BridgeResult> bridge;
    };

    /**
     * @class AnalysisPipeline
     * @brief Scan, aggregate and bridge one input.
     *
     * The source is read up to three times: a short scan for the header
     * and date samples, a date-range pass when the period setup needs it,
     * and the aggregation pass itself.
     */
    class AnalysisPipeline
    {
    public:
        explicit AnalysisPipeline(AnalysisConfig config, PipelineParams params = {});

        /**
         * @throws std::invalid_argument on configuration errors
         * @throws RunError on a fatal failure during the aggregation pass
         */
        AnalysisOutput run(data::RecordSource &source);

        const AnalysisConfig &config() const { return config_; }

    private:
        AnalysisConfig config_;
        PipelineParams params_;
    };

} // namespace pvm
