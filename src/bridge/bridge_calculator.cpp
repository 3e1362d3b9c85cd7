/**
 * @file bridge_calculator.cpp
 * @brief Implementation of the BridgeCalculator class.
 *
 * Per-bucket decomposition (continuing items):
 *   Price  = (P_to - P_from) * V_from
 *   Volume = (V_to - V_from) * P_from
 *   Mix    = (Value_to - Value_from) - Price - Volume
 *
 * Summaries stack the per-bucket components into an N x 5 matrix and sum
 * it column-wise.
 */

#include "bridge/bridge_calculator.hpp"
#include "data/field_parsing.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace pvm
{
    namespace bridge
    {

        namespace
        {

            double percent_of(double part, double whole)
            {
                return whole != 0.0 ? part / std::abs(whole) * 100.0 : 0.0;
            }

            std::string step_key(const aggregation::AggregationResult &aggregation, size_t from, size_t to)
            {
                const auto &a = aggregation.periods[from];
                const auto &b = aggregation.periods[to];
                if (aggregation.multi_year())
                {
                    return std::to_string(a.fiscal_year) + "-" + std::to_string(b.fiscal_year);
                }
                return a.label + "-" + b.label;
            }

        } // namespace

        // ===================================================================
        // Enum conversions
        // ===================================================================

        BridgeMode parse_bridge_mode(const std::string &text)
        {
            std::string value = data::to_lower(data::trim(text));
            if (value == "pvm")
                return BridgeMode::PVM;
            if (value == "gm")
                return BridgeMode::GM;
            throw std::invalid_argument("Unknown bridge mode: '" + text + "' (expected pvm or gm)");
        }

        PriceDefinition parse_price_definition(const std::string &text)
        {
            std::string value = data::to_lower(data::trim(text));
            if (value == "margin-per-unit")
                return PriceDefinition::MARGIN_PER_UNIT;
            if (value == "sales-per-unit")
                return PriceDefinition::SALES_PER_UNIT;
            throw std::invalid_argument("Unknown gross margin price definition: '" + text +
                                        "' (expected margin-per-unit or sales-per-unit)");
        }

        SortField parse_sort_field(const std::string &text)
        {
            std::string value = data::to_lower(data::trim(text));
            if (value.empty() || value == "none")
                return SortField::NONE;
            if (value == "total")
                return SortField::TOTAL;
            if (value == "price")
                return SortField::PRICE;
            if (value == "volume")
                return SortField::VOLUME;
            if (value == "mix")
                return SortField::MIX;
            if (value == "cost")
                return SortField::COST;
            throw std::invalid_argument("Unknown sort field: '" + text + "'");
        }

        std::string to_string(BridgeMode mode)
        {
            switch (mode)
            {
            case BridgeMode::PVM:
                return "pvm";
            case BridgeMode::GM:
                return "gm";
            }
            return "pvm";
        }

        std::string to_string(PriceDefinition definition)
        {
            switch (definition)
            {
            case PriceDefinition::MARGIN_PER_UNIT:
                return "margin-per-unit";
            case PriceDefinition::SALES_PER_UNIT:
                return "sales-per-unit";
            }
            return "margin-per-unit";
        }

        std::string to_string(ItemClassification classification)
        {
            switch (classification)
            {
            case ItemClassification::NEW:
                return "new";
            case ItemClassification::DISCONTINUED:
                return "discontinued";
            case ItemClassification::CONTINUING:
                return "continuing";
            }
            return "continuing";
        }

        std::string to_string(SortField field)
        {
            switch (field)
            {
            case SortField::NONE:
                return "none";
            case SortField::TOTAL:
                return "total";
            case SortField::PRICE:
                return "price";
            case SortField::VOLUME:
                return "volume";
            case SortField::MIX:
                return "mix";
            case SortField::COST:
                return "cost";
            }
            return "none";
        }

        SortSpec SortSpec::parse(const std::string &text)
        {
            std::string value = data::to_lower(data::trim(text));
            SortSpec spec;

            auto dash = value.rfind('-');
            if (dash != std::string::npos)
            {
                std::string direction = value.substr(dash + 1);
                if (direction == "asc" || direction == "desc")
                {
                    spec.descending = direction == "desc";
                    value.erase(dash);
                }
            }

            spec.field = parse_sort_field(value);
            return spec;
        }

        std::string SortSpec::to_string() const
        {
            if (field == SortField::NONE)
                return "none";
            return bridge::to_string(field) + (descending ? "-desc" : "-asc");
        }

        double BridgeImpacts::get(SortField field) const
        {
            switch (field)
            {
            case SortField::TOTAL:
                return total_change;
            case SortField::PRICE:
                return price;
            case SortField::VOLUME:
                return volume;
            case SortField::MIX:
                return mix;
            case SortField::COST:
                return cost;
            case SortField::NONE:
                break;
            }
            return 0.0;
        }

        // ===================================================================
        // BridgeOptions
        // ===================================================================

        BridgeOptions BridgeOptions::from_json(const nlohmann::json &j)
        {
            BridgeOptions options;
            options.mode = parse_bridge_mode(j.value("mode", "pvm"));
            options.price_definition = parse_price_definition(j.value("gm_price_definition", "margin-per-unit"));
            return options;
        }

        nlohmann::json BridgeOptions::to_json() const
        {
            return nlohmann::json{
                {"mode", bridge::to_string(mode)},
                {"gm_price_definition", bridge::to_string(price_definition)}};
        }

        // ===================================================================
        // BridgeCalculator
        // ===================================================================

        BridgeCalculator::BridgeCalculator(BridgeOptions options)
            : options_(options)
        {
        }

        PeriodValues BridgeCalculator::period_values(const aggregation::PeriodAccumulator &period) const
        {
            PeriodValues values;
            values.sales = period.sales;
            values.cost = period.cost;
            values.volume = period.quantity;
            values.count = period.count;

            switch (options_.mode)
            {
            case BridgeMode::PVM:
                values.value = period.sales;
                break;
            case BridgeMode::GM:
                values.value = options_.price_definition == PriceDefinition::MARGIN_PER_UNIT
                                   ? period.sales - period.cost
                                   : period.sales;
                break;
            }

            values.price = period.quantity > 0.0 ? values.value / period.quantity : 0.0;
            return values;
        }

        BridgeStep BridgeCalculator::bridge_step(const aggregation::PeriodAccumulator &from,
                                                 const aggregation::PeriodAccumulator &to) const
        {
            BridgeStep step;
            step.from = period_values(from);
            step.to = period_values(to);

            step.is_new = from.sales <= 0.0 || from.quantity <= 0.0;
            step.is_discontinued = to.sales <= 0.0 || to.quantity <= 0.0;

            BridgeImpacts &impacts = step.impacts;
            impacts.total_change = step.to.value - step.from.value;

            if (step.is_new || step.is_discontinued)
            {
                // Whole change is volume; new takes precedence when both apply
                step.classification = step.is_new ? ItemClassification::NEW : ItemClassification::DISCONTINUED;
                impacts.price = 0.0;
                impacts.volume = impacts.total_change;
                impacts.mix = 0.0;
            }
            else
            {
                step.classification = ItemClassification::CONTINUING;
                impacts.price = (step.to.price - step.from.price) * step.from.volume;
                impacts.volume = (step.to.volume - step.from.volume) * step.from.price;
                impacts.mix = impacts.total_change - impacts.price - impacts.volume;
            }

            if (options_.separate_cost())
            {
                impacts.cost = -(to.cost - from.cost);
            }

            return step;
        }

        BridgeResult BridgeCalculator::calculate(const aggregation::AggregationResult &aggregation) const
        {
            const size_t slots = aggregation.periods.size();
            if (slots < 2)
            {
                throw std::invalid_argument("A bridge needs at least two periods, got " + std::to_string(slots));
            }

            BridgeResult result;
            result.options = options_;
            result.mode = aggregation.mode;
            result.periods = aggregation.periods;
            result.dimension_columns = aggregation.dimension_columns;
            result.detail.reserve(aggregation.buckets.size());

            for (const auto &bucket : aggregation.buckets)
            {
                if (bucket.periods.size() != slots)
                {
                    throw std::invalid_argument("Bucket '" + bucket.key + "' has " +
                                                std::to_string(bucket.periods.size()) + " periods, expected " +
                                                std::to_string(slots));
                }

                BucketBridge row;
                row.key = bucket.key;
                row.dimension_values = bucket.dimension_values;

                // Chained year over year: only adjacent slots are bridged
                for (size_t slot = 1; slot < slots; ++slot)
                {
                    BridgeStep step = bridge_step(bucket.periods[slot - 1], bucket.periods[slot]);
                    step.key = step_key(aggregation, slot - 1, slot);
                    step.from_slot = slot - 1;
                    step.to_slot = slot;
                    step.from.label = aggregation.periods[slot - 1].label;
                    step.to.label = aggregation.periods[slot].label;
                    row.steps.push_back(std::move(step));
                }

                result.detail.push_back(std::move(row));
            }

            for (size_t step = 0; step + 1 < slots; ++step)
            {
                StepSummary summary = summarize(result.detail, step);
                summary.key = step_key(aggregation, step, step + 1);
                summary.label = aggregation.periods[step].label + " to " + aggregation.periods[step + 1].label;
                summary.from_slot = step;
                summary.to_slot = step + 1;
                summary.from.label = aggregation.periods[step].label;
                summary.to.label = aggregation.periods[step + 1].label;
                result.summaries.push_back(std::move(summary));
            }

            return result;
        }

        StepSummary BridgeCalculator::summarize(const std::vector<BucketBridge> &detail, size_t step_index) const
        {
            const Eigen::Index n = static_cast<Eigen::Index>(detail.size());

            // Columns: total, price, volume, mix, cost
            Eigen::MatrixXd impacts(n, 5);
            // Columns: value, sales, volume, cost
            Eigen::MatrixXd from_values(n, 4);
            Eigen::MatrixXd to_values(n, 4);

            StepSummary summary;
            summary.counts.total = detail.size();

            for (Eigen::Index i = 0; i < n; ++i)
            {
                const BridgeStep &step = detail[static_cast<size_t>(i)].steps.at(step_index);

                impacts.row(i) << step.impacts.total_change, step.impacts.price, step.impacts.volume,
                    step.impacts.mix, step.impacts.cost;
                from_values.row(i) << step.from.value, step.from.sales, step.from.volume, step.from.cost;
                to_values.row(i) << step.to.value, step.to.sales, step.to.volume, step.to.cost;

                summary.from.count += step.from.count;
                summary.to.count += step.to.count;

                switch (step.classification)
                {
                case ItemClassification::NEW:
                    ++summary.counts.new_items;
                    break;
                case ItemClassification::DISCONTINUED:
                    ++summary.counts.discontinued;
                    break;
                case ItemClassification::CONTINUING:
                    ++summary.counts.continuing;
                    break;
                }
            }

            Eigen::RowVectorXd impact_totals = impacts.colwise().sum();
            Eigen::RowVectorXd from_totals = from_values.colwise().sum();
            Eigen::RowVectorXd to_totals = to_values.colwise().sum();

            summary.impacts.total_change = impact_totals(0);
            summary.impacts.price = impact_totals(1);
            summary.impacts.volume = impact_totals(2);
            summary.impacts.mix = impact_totals(3);
            summary.impacts.cost = impact_totals(4);

            auto fill = [](PeriodValues &values, const Eigen::RowVectorXd &totals)
            {
                values.value = totals(0);
                values.sales = totals(1);
                values.volume = totals(2);
                values.cost = totals(3);
                values.price = values.volume > 0.0 ? values.value / values.volume : 0.0;
            };
            fill(summary.from, from_totals);
            fill(summary.to, to_totals);

            const double total = summary.impacts.total_change;
            summary.price_pct = percent_of(summary.impacts.price, total);
            summary.volume_pct = percent_of(summary.impacts.volume, total);
            summary.mix_pct = percent_of(summary.impacts.mix, total);
            summary.cost_pct = percent_of(summary.impacts.cost, total);
            summary.change_pct = percent_of(summary.to.value - summary.from.value, summary.from.value);

            return summary;
        }

        // ===================================================================
        // Sorting and filtering
        // ===================================================================

        std::vector<BucketBridge> BridgeCalculator::sort_results(const std::vector<BucketBridge> &detail,
                                                                 const SortSpec &spec)
        {
            std::vector<BucketBridge> sorted = detail;
            if (spec.field == SortField::NONE)
                return sorted;

            auto magnitude = [&spec](const BucketBridge &row)
            {
                return row.steps.empty() ? 0.0 : std::abs(row.primary_step().impacts.get(spec.field));
            };

            std::stable_sort(sorted.begin(), sorted.end(),
                             [&](const BucketBridge &a, const BucketBridge &b)
                             {
                                 return spec.descending ? magnitude(a) > magnitude(b)
                                                        : magnitude(a) < magnitude(b);
                             });
            return sorted;
        }

        std::vector<BucketBridge> BridgeCalculator::filter_results(const std::vector<BucketBridge> &detail,
                                                                   const std::string &term)
        {
            const std::string needle = data::to_lower(data::trim(term));
            if (needle.empty())
                return detail;

            std::vector<BucketBridge> filtered;
            for (const auto &row : detail)
            {
                bool match = std::any_of(row.dimension_values.begin(), row.dimension_values.end(),
                                         [&needle](const std::string &value)
                                         { return data::to_lower(value).find(needle) != std::string::npos; });
                if (match)
                    filtered.push_back(row);
            }
            return filtered;
        }

        // ===================================================================
        // Methodology
        // ===================================================================

        Methodology BridgeCalculator::methodology(const BridgeOptions &options)
        {
            const std::string new_note = "New items (no prior period data): entire change attributed to Volume";
            const std::string discontinued_note =
                "Discontinued items (no current period data): entire change attributed to Volume";

            Methodology m;
            switch (options.mode)
            {
            case BridgeMode::PVM:
                m.title = "Sales PVM Bridge";
                m.description = "Decomposes revenue change into Price, Volume and Mix components.";
                m.formulas = {
                    {"Average Price", "Sales / Quantity"},
                    {"Price Impact", "(CY Price - PY Price) x PY Volume"},
                    {"Volume Impact", "(CY Volume - PY Volume) x PY Price"},
                    {"Mix Impact", "Total Change - Price Impact - Volume Impact"}};
                m.notes = {
                    new_note,
                    discontinued_note,
                    "Mix Impact captures product mix shifts and the interaction of price and volume changes",
                    "The three components sum exactly to the total revenue change"};
                break;

            case BridgeMode::GM:
                if (options.price_definition == PriceDefinition::MARGIN_PER_UNIT)
                {
                    m.title = "Gross Margin Bridge (Margin per Unit)";
                    m.description = "Decomposes gross margin change using margin per unit as the price.";
                    m.formulas = {
                        {"Margin per Unit (Price)", "(Sales - Cost) / Quantity"},
                        {"Price Impact", "(CY Margin/Unit - PY Margin/Unit) x PY Volume"},
                        {"Volume Impact", "(CY Volume - PY Volume) x PY Margin/Unit"},
                        {"Mix Impact", "Total Change - Price Impact - Volume Impact"}};
                    m.notes = {
                        new_note,
                        discontinued_note,
                        "Mix Impact captures the interaction effect and reconciles exactly"};
                }
                else
                {
                    m.title = "Gross Margin Bridge (Sales per Unit)";
                    m.description = "Decomposes gross margin change with the cost impact shown separately.";
                    m.formulas = {
                        {"Sales per Unit (Price)", "Sales / Quantity"},
                        {"Price Impact", "(CY Price - PY Price) x PY Volume"},
                        {"Volume Impact", "(CY Volume - PY Volume) x PY Price"},
                        {"Mix Impact", "Sales Change - Price Impact - Volume Impact"},
                        {"Cost Impact", "-(CY Cost - PY Cost)"}};
                    m.notes = {
                        new_note,
                        discontinued_note,
                        "Cost Impact is reported separately from the PVM decomposition"};
                }
                break;
            }
            return m;
        }

    } // namespace bridge
} // namespace pvm
