/**
 * @file aggregation_result.hpp
 * @brief Accumulator types and the frozen output of an aggregation run.
 *
 * The period axis is unified: a two-period run has two slots (PY, CY), a
 * multi-year run has one slot per selected fiscal year in ascending order.
 * Every bucket carries one PeriodAccumulator per slot, so the bridge layer
 * only ever walks adjacent slot pairs.
 */

#ifndef PVM_AGGREGATION_AGGREGATION_RESULT_HPP
#define PVM_AGGREGATION_AGGREGATION_RESULT_HPP

#include "periods/date.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pvm
{
    namespace aggregation
    {

        /**
         * @enum PeriodMode
         * @brief How rows are assigned to period slots.
         */
        enum class PeriodMode
        {
            TWO_PERIOD, ///< Slot 0 = Prior Year, slot 1 = Current Year / LTM
            MULTI_YEAR  ///< One slot per fiscal year, ascending
        };

        constexpr size_t kPriorSlot = 0;
        constexpr size_t kCurrentSlot = 1;

        /**
         * @struct PeriodWindow
         * @brief One period slot: its label and inclusive date range.
         */
        struct PeriodWindow
        {
            std::string label;         ///< "PY", "CY", "LTM", "FY 2024", ...
            periods::DateRange range;  ///< Inclusive range
            int fiscal_year = 0;       ///< Fiscal year number (multi-year mode)
            bool fully_covered = true; ///< Data spans the whole range
        };

        /**
         * @struct PeriodAccumulator
         * @brief Running sums for one (bucket, period) pair.
         */
        struct PeriodAccumulator
        {
            double sales = 0.0;
            double quantity = 0.0;
            double cost = 0.0;
            std::uint64_t count = 0;

            void add(double row_sales, double row_quantity, double row_cost)
            {
                sales += row_sales;
                quantity += row_quantity;
                cost += row_cost;
                ++count;
            }

            void merge(const PeriodAccumulator &other)
            {
                sales += other.sales;
                quantity += other.quantity;
                cost += other.cost;
                count += other.count;
            }
        };

        /**
         * @struct DimensionBucket
         * @brief Accumulators for one combination of dimension values.
         */
        struct DimensionBucket
        {
            std::string key;                            ///< Canonical dimension key
            std::vector<std::string> dimension_values;  ///< One per dimension column, trimmed
            std::vector<PeriodAccumulator> periods;     ///< One per period slot

            const PeriodAccumulator &prior() const { return periods.at(kPriorSlot); }
            const PeriodAccumulator &current() const { return periods.at(kCurrentSlot); }
        };

        /**
         * @struct RunStatistics
         * @brief Row accounting for a run.
         *
         * total_rows == included_rows + excluded_rows and
         * excluded_rows == parse_errors + outside_period_rows + negative_rows
         * hold at every point of a run.
         */
        struct RunStatistics
        {
            std::uint64_t total_rows = 0;
            std::uint64_t included_rows = 0;
            std::uint64_t excluded_rows = 0;
            std::uint64_t parse_errors = 0;
            std::uint64_t outside_period_rows = 0;
            std::uint64_t negative_rows = 0;
            std::uint64_t unique_keys = 0;
            std::vector<std::uint64_t> period_rows; ///< Included rows per slot

            bool is_balanced() const
            {
                return total_rows == included_rows + excluded_rows &&
                       excluded_rows == parse_errors + outside_period_rows + negative_rows;
            }
        };

        /**
         * @struct AggregationResult
         * @brief Immutable output of Aggregator::finalize().
         */
        struct AggregationResult
        {
            PeriodMode mode = PeriodMode::TWO_PERIOD;
            std::vector<std::string> dimension_columns;
            std::vector<PeriodWindow> periods;

            std::vector<DimensionBucket> buckets;        ///< First-seen order
            std::vector<PeriodAccumulator> negatives;    ///< Non-positive rows per slot, never merged
            RunStatistics stats;

            std::optional<periods::Date> min_date;       ///< Earliest parseable date seen
            std::optional<periods::Date> max_date;       ///< Latest parseable date seen

            bool multi_year() const { return mode == PeriodMode::MULTI_YEAR; }
        };

    } // namespace aggregation
} // namespace pvm

#endif // PVM_AGGREGATION_AGGREGATION_RESULT_HPP
