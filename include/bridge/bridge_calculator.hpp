/**
 * @file bridge_calculator.hpp
 * @brief Price / Volume / Mix decomposition of the change between periods.
 *
 * For every dimension bucket and every adjacent pair of period slots:
 *   Price  = (to price - from price) * from volume
 *   Volume = (to volume - from volume) * from price
 *   Mix    = Total change - Price - Volume
 * so the three components reconcile exactly to the total change. Items
 * with no sales or volume in one of the two periods are classified new or
 * discontinued and their whole change is reported as volume.
 *
 * In gross margin mode the value is either margin (sales - cost, with
 * margin per unit as the price) or sales with a separate cost component
 * equal to -(to cost - from cost).
 *
 * Summary totals are the sum of the per-bucket components. They are never
 * re-derived from summed period values, since price and volume effects are
 * not linear in the underlying sums.
 */

#ifndef PVM_BRIDGE_BRIDGE_CALCULATOR_HPP
#define PVM_BRIDGE_BRIDGE_CALCULATOR_HPP

#include "aggregation/aggregation_result.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <utility>
#include <vector>

namespace pvm
{
    namespace bridge
    {

        /**
         * @enum BridgeMode
         * @brief Which metric is bridged.
         */
        enum class BridgeMode
        {
            PVM, ///< Sales
            GM   ///< Gross margin
        };

        /**
         * @enum PriceDefinition
         * @brief Unit price used in gross margin mode.
         */
        enum class PriceDefinition
        {
            MARGIN_PER_UNIT, ///< Value = sales - cost
            SALES_PER_UNIT   ///< Value = sales, cost bridged separately
        };

        enum class ItemClassification
        {
            NEW,
            DISCONTINUED,
            CONTINUING
        };

        enum class SortField
        {
            NONE,
            TOTAL,
            PRICE,
            VOLUME,
            MIX,
            COST
        };

        /// Case-insensitive; throws std::invalid_argument on unknown text.
        BridgeMode parse_bridge_mode(const std::string &text);
        PriceDefinition parse_price_definition(const std::string &text);
        SortField parse_sort_field(const std::string &text);

        std::string to_string(BridgeMode mode);
        std::string to_string(PriceDefinition definition);
        std::string to_string(ItemClassification classification);
        std::string to_string(SortField field);

        /**
         * @struct SortSpec
         * @brief Sort order for the detail list
         *
         * Parsed from "<field>[-asc|-desc]", e.g. "total-desc" or "mix".
         * Descending by absolute value unless "-asc" is given. An empty
         * string or "none" keeps first-seen order.
         */
        struct SortSpec
        {
            SortField field = SortField::NONE;
            bool descending = true;

            static SortSpec parse(const std::string &text);
            std::string to_string() const;
        };

        /**
         * @struct BridgeOptions
         * @brief Configuration slice consumed by the calculator.
         */
        struct BridgeOptions
        {
            BridgeMode mode = BridgeMode::PVM;
            PriceDefinition price_definition = PriceDefinition::MARGIN_PER_UNIT;

            /// True when cost is bridged as its own component.
            bool separate_cost() const
            {
                return mode == BridgeMode::GM && price_definition == PriceDefinition::SALES_PER_UNIT;
            }

            static BridgeOptions from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * @struct PeriodValues
         * @brief One side of a bridge step.
         */
        struct PeriodValues
        {
            std::string label;    ///< Period label ("PY", "FY 2024", ...)
            double value = 0.0;   ///< Bridged metric
            double price = 0.0;   ///< value / volume, 0 when volume is 0
            double volume = 0.0;  ///< Quantity
            double sales = 0.0;
            double cost = 0.0;
            std::uint64_t count = 0;
        };

        /**
         * @struct BridgeImpacts
         * @brief Components of one bridge.
         */
        struct BridgeImpacts
        {
            double total_change = 0.0;
            double price = 0.0;
            double volume = 0.0;
            double mix = 0.0;
            double cost = 0.0; ///< Non-zero only when cost is bridged separately

            /// price + volume + mix - total_change
            double reconciliation_error() const { return price + volume + mix - total_change; }

            double get(SortField field) const;
        };

        /**
         * @struct BridgeStep
         * @brief Bridge of one bucket between two adjacent period slots.
         */
        struct BridgeStep
        {
            std::string key;       ///< "PY-CY" or "2023-2024"
            size_t from_slot = 0;
            size_t to_slot = 1;
            PeriodValues from;
            PeriodValues to;
            BridgeImpacts impacts;
            ItemClassification classification = ItemClassification::CONTINUING;
            bool is_new = false;
            bool is_discontinued = false;
        };

        /**
         * @struct BucketBridge
         * @brief All bridge steps of one dimension bucket.
         */
        struct BucketBridge
        {
            std::string key;
            std::vector<std::string> dimension_values;
            std::vector<BridgeStep> steps; ///< One per adjacent slot pair, ascending

            /// The latest step (the only one in two-period mode).
            const BridgeStep &primary_step() const { return steps.back(); }
        };

        struct ClassificationCounts
        {
            std::uint64_t total = 0;
            std::uint64_t new_items = 0;
            std::uint64_t discontinued = 0;
            std::uint64_t continuing = 0;
        };

        /**
         * @struct StepSummary
         * @brief Totals of one bridge step across all buckets.
         *
         * Percentages are expressed in percent of |total change|;
         * change_pct is relative to |from value|. A zero denominator yields 0.
         */
        struct StepSummary
        {
            std::string key;
            std::string label;   ///< "PY to CY", "FY 2023 to FY 2024"
            size_t from_slot = 0;
            size_t to_slot = 1;
            PeriodValues from;
            PeriodValues to;
            BridgeImpacts impacts;

            double price_pct = 0.0;
            double volume_pct = 0.0;
            double mix_pct = 0.0;
            double cost_pct = 0.0;
            double change_pct = 0.0;

            ClassificationCounts counts;
        };

        /**
         * @struct BridgeResult
         * @brief Complete output of BridgeCalculator::calculate().
         */
        struct BridgeResult
        {
            BridgeOptions options;
            aggregation::PeriodMode mode = aggregation::PeriodMode::TWO_PERIOD;
            std::vector<aggregation::PeriodWindow> periods;
            std::vector<std::string> dimension_columns;

            std::vector<BucketBridge> detail;   ///< First-seen bucket order
            std::vector<StepSummary> summaries; ///< One per step, ascending

            /// Summary of the latest step.
            const StepSummary &summary() const { return summaries.back(); }
        };

        /**
         * @struct Methodology
         * @brief Human-readable description of the formulas in use.
         */
        struct Methodology
        {
            std::string title;
            std::string description;
            std::vector<std::pair<std::string, std::string>> formulas; ///< (name, formula)
            std::vector<std::string> notes;
        };

        /**
         * @class BridgeCalculator
         * @brief Decomposes a finalized aggregation into bridge components.
         *
         * Stateless apart from its options; reads the aggregation result and
         * owns nothing it did not produce.
         *
         * Usage:
         * @code
         *   BridgeCalculator calc(options);
         *   BridgeResult result = calc.calculate(aggregation);
         *   auto rows = BridgeCalculator::sort_results(result.detail, SortSpec::parse("total-desc"));
         * @endcode
         */
        class BridgeCalculator
        {
        public:
            explicit BridgeCalculator(BridgeOptions options = {});

            /**
             * @brief Bridge every bucket across every adjacent slot pair
             * @throws std::invalid_argument if the aggregation has fewer than
             *         two period slots
             */
            BridgeResult calculate(const aggregation::AggregationResult &aggregation) const;

            /**
             * @brief Bridge one bucket between two periods
             */
            BridgeStep bridge_step(const aggregation::PeriodAccumulator &from,
                                   const aggregation::PeriodAccumulator &to) const;

            /**
             * @brief Value, price and volume of one period under the current options
             */
            PeriodValues period_values(const aggregation::PeriodAccumulator &period) const;

            /**
             * @brief Sum one step of every bucket
             * @param step_index Index into BucketBridge::steps
             */
            StepSummary summarize(const std::vector<BucketBridge> &detail, size_t step_index) const;

            const BridgeOptions &options() const { return options_; }

            /**
             * @brief Stable sort by the absolute value of the chosen component
             *        of each bucket's primary step
             */
            static std::vector<BucketBridge> sort_results(const std::vector<BucketBridge> &detail,
                                                          const SortSpec &spec);

            /**
             * @brief Keep buckets with a dimension value containing the term
             *        (case-insensitive). A blank term keeps everything.
             */
            static std::vector<BucketBridge> filter_results(const std::vector<BucketBridge> &detail,
                                                            const std::string &term);

            static Methodology methodology(const BridgeOptions &options);

        private:
            BridgeOptions options_;
        };

    } // namespace bridge
} // namespace pvm

#endif // PVM_BRIDGE_BRIDGE_CALCULATOR_HPP
