/**
 * @file aggregator.hpp
 * @brief Incremental reduction of a record stream into dimension buckets.
 *
 * Lifecycle: construct (created) -> process_row() N times (accumulating)
 * -> finalize() once (finalized). Calling process_row() after finalize()
 * is a caller error and is not checked.
 *
 * Memory is bounded by the number of distinct dimension combinations
 * actually observed; rows are never retained.
 */

#ifndef PVM_AGGREGATION_AGGREGATOR_HPP
#define PVM_AGGREGATION_AGGREGATOR_HPP

#include "aggregation/aggregation_result.hpp"
#include "data/record.hpp"
#include "periods/date_format.hpp"

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pvm
{
    namespace aggregation
    {

        /// Substituted for blank dimension values.
        extern const char *const kUnknownDimensionValue;

        /// Key of the single bucket used when no dimension is selected.
        extern const char *const kTotalKey;

        /// Separator between dimension values in DimensionBucket::key.
        extern const char *const kKeySeparator;

        /**
         * @brief Public key for a bucket's dimension values
         *
         * Values are joined with kKeySeparator. A backslash or separator
         * inside a value is preceded by a backslash, so distinct value lists
         * never share a key. No values gives kTotalKey.
         */
        std::string make_bucket_key(const std::vector<std::string> &dimension_values);

        /**
         * @struct AggregationConfig
         * @brief Slice of the analysis configuration the aggregator needs.
         */
        struct AggregationConfig
        {
            std::vector<std::string> dimension_columns; ///< Ordered dimension columns (may be empty)
            std::string date_column;                    ///< Required
            std::string sales_column;                   ///< Required
            std::string quantity_column;                ///< Required
            std::string cost_column;                    ///< Empty when cost is not mapped
            std::string date_format = "YYYY-MM-DD";     ///< Catalog id

            PeriodMode mode = PeriodMode::TWO_PERIOD;
            std::vector<PeriodWindow> periods;          ///< 2 for TWO_PERIOD, >= 1 non-overlapping for MULTI_YEAR

            /**
             * @brief Build a two-period configuration
             */
            static AggregationConfig two_period(const periods::DateRange &prior,
                                                const periods::DateRange &current);

            /**
             * @brief Build a multi-year configuration from fiscal year windows
             */
            static AggregationConfig multi_year(const std::vector<PeriodWindow> &years);

            /**
             * @brief Reject configurations that cannot run
             * @throws std::invalid_argument on a missing column mapping, a
             *         wrong number of periods, an inverted or overlapping
             *         multi-year window list
             */
            void validate() const;

            /**
             * @brief Check that every mapped column exists in a header row
             * @throws std::invalid_argument naming the first missing column
             */
            void validate_header(const std::vector<std::string> &columns) const;
        };

        /**
         * @class Aggregator
         * @brief Per-run aggregation context.
         *
         * Buckets live in an arena (a vector in first-seen order); the
         * dimension-value tuple is interned to its arena index through a
         * lookup table keyed by a length-prefixed encoding, which cannot
         * collide whatever the data contains.
         */
        class Aggregator
        {
        public:
            /**
             * @brief Create an empty context
             * @throws std::invalid_argument if the configuration is invalid
             *         or names an unknown date format
             */
            explicit Aggregator(AggregationConfig config);

            /**
             * @brief Fold one record into the aggregation.
             * @return true if the row was added to a bucket; false if it was
             *         excluded (parse error, outside periods, or non-positive
             *         sales/quantity, each counted separately).
             */
            bool process_row(const data::Record &record);

            /**
             * @brief Freeze the aggregation.
             *
             * Moves the buckets out in first-seen order together with the
             * negatives ledger, statistics and observed date bounds. Also
             * valid on a partially processed (cancelled) context.
             */
            AggregationResult finalize();

            const RunStatistics &statistics() const { return stats_; }
            const AggregationConfig &config() const { return config_; }
            size_t bucket_count() const { return buckets_.size(); }

            /**
             * @brief Sum every bucket per period slot.
             * @return One accumulator per slot of the result.
             */
            static std::vector<PeriodAccumulator> calculate_totals(const AggregationResult &result);

        private:
            void bind_header(const std::shared_ptr<const data::RecordHeader> &header);
            std::optional<size_t> classify(const periods::Date &date) const;
            size_t resolve_bucket(const data::Record &record);
            void record_exclusion(std::uint64_t &counter);

            AggregationConfig config_;
            const periods::DateFormat *date_format_;

            // Column positions for the header currently bound
            std::shared_ptr<const data::RecordHeader> bound_header_;
            std::optional<size_t> date_index_;
            std::optional<size_t> sales_index_;
            std::optional<size_t> quantity_index_;
            std::optional<size_t> cost_index_;
            std::vector<std::optional<size_t>> dimension_indices_;

            std::vector<DimensionBucket> buckets_;
            std::unordered_map<std::string, size_t> bucket_index_;
            std::string key_scratch_;
            std::vector<std::string> values_scratch_;

            std::vector<PeriodAccumulator> negatives_;
            RunStatistics stats_;
            std::optional<periods::Date> min_date_;
            std::optional<periods::Date> max_date_;
        };

    } // namespace aggregation
} // namespace pvm

#endif // PVM_AGGREGATION_AGGREGATOR_HPP
