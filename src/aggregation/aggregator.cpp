/**
 * @file aggregator.cpp
 * @brief Implementation of AggregationConfig and Aggregator
 */

#include "aggregation/aggregator.hpp"
#include "data/field_parsing.hpp"
#include "periods/fiscal_calendar.hpp"

#include <cctype>
#include <stdexcept>
#include <string_view>

namespace pvm
{
    namespace aggregation
    {

        const char *const kUnknownDimensionValue = "Unknown";
        const char *const kTotalKey = "__TOTAL__";
        const char *const kKeySeparator = "\x1f";

        std::string make_bucket_key(const std::vector<std::string> &dimension_values)
        {
            if (dimension_values.empty())
                return kTotalKey;

            const char separator = kKeySeparator[0];
            std::string key;
            for (size_t i = 0; i < dimension_values.size(); ++i)
            {
                if (i > 0)
                    key += separator;
                for (char c : dimension_values[i])
                {
                    if (c == '\\' || c == separator)
                        key += '\\';
                    key += c;
                }
            }
            return key;
        }

        namespace
        {

            std::string_view trim_view(std::string_view str)
            {
                size_t begin = 0;
                size_t end = str.size();
                while (begin < end && std::isspace(static_cast<unsigned char>(str[begin])))
                    ++begin;
                while (end > begin && std::isspace(static_cast<unsigned char>(str[end - 1])))
                    --end;
                return str.substr(begin, end - begin);
            }

            void require_column(const std::string &column, const char *role)
            {
                if (column.empty())
                {
                    throw std::invalid_argument(std::string("Missing required column mapping: ") + role);
                }
            }

            std::optional<size_t> lookup(const data::RecordHeader &header, const std::string &column)
            {
                if (column.empty())
                    return std::nullopt;
                return header.index_of(column);
            }

        } // namespace

        // ===================================================================
        // AggregationConfig
        // ===================================================================

        AggregationConfig AggregationConfig::two_period(const periods::DateRange &prior,
                                                        const periods::DateRange &current)
        {
            AggregationConfig config;
            config.mode = PeriodMode::TWO_PERIOD;

            PeriodWindow py;
            py.label = "PY";
            py.range = prior;

            PeriodWindow cy;
            cy.label = "CY";
            cy.range = current;

            config.periods = {py, cy};
            return config;
        }

        AggregationConfig AggregationConfig::multi_year(const std::vector<PeriodWindow> &years)
        {
            AggregationConfig config;
            config.mode = PeriodMode::MULTI_YEAR;
            config.periods = years;
            return config;
        }

        void AggregationConfig::validate() const
        {
            require_column(date_column, "date");
            require_column(sales_column, "sales");
            require_column(quantity_column, "quantity");

            for (const auto &window : periods)
            {
                if (!window.range.is_valid())
                {
                    throw std::invalid_argument("Period '" + window.label + "' ends before it starts (" +
                                                periods::format_date_range(window.range) + ")");
                }
            }

            if (mode == PeriodMode::TWO_PERIOD)
            {
                if (periods.size() != 2)
                {
                    throw std::invalid_argument("Two-period analysis needs exactly 2 periods, got " +
                                                std::to_string(periods.size()));
                }
                return;
            }

            if (periods.empty())
            {
                throw std::invalid_argument("Multi-year analysis needs at least one fiscal year");
            }

            for (size_t i = 1; i < periods.size(); ++i)
            {
                if (periods[i].range.start <= periods[i - 1].range.end)
                {
                    throw std::invalid_argument("Fiscal year windows must be ascending and non-overlapping: '" +
                                                periods[i - 1].label + "' and '" + periods[i].label + "'");
                }
            }
        }

        void AggregationConfig::validate_header(const std::vector<std::string> &columns) const
        {
            data::RecordHeader header(columns);

            auto check = [&header](const std::string &column)
            {
                if (!column.empty() && !header.contains(column))
                {
                    throw std::invalid_argument("Column '" + column + "' not found in input header");
                }
            };

            check(date_column);
            check(sales_column);
            check(quantity_column);
            check(cost_column);
            for (const auto &dimension : dimension_columns)
            {
                check(dimension);
            }
        }

        // ===================================================================
        // Aggregator
        // ===================================================================

        Aggregator::Aggregator(AggregationConfig config)
            : config_(std::move(config)), date_format_(nullptr)
        {
            config_.validate();

            date_format_ = periods::find_date_format(config_.date_format);
            if (!date_format_)
            {
                throw std::invalid_argument("Unknown date format: " + config_.date_format);
            }

            negatives_.resize(config_.periods.size());
            stats_.period_rows.assign(config_.periods.size(), 0);
            values_scratch_.resize(config_.dimension_columns.size());
        }

        void Aggregator::bind_header(const std::shared_ptr<const data::RecordHeader> &header_ptr)
        {
            bound_header_ = header_ptr;
            const data::RecordHeader &header = *header_ptr;
            date_index_ = lookup(header, config_.date_column);
            sales_index_ = lookup(header, config_.sales_column);
            quantity_index_ = lookup(header, config_.quantity_column);
            cost_index_ = lookup(header, config_.cost_column);

            dimension_indices_.clear();
            for (const auto &dimension : config_.dimension_columns)
            {
                dimension_indices_.push_back(lookup(header, dimension));
            }
        }

        void Aggregator::record_exclusion(std::uint64_t &counter)
        {
            ++counter;
            ++stats_.excluded_rows;
        }

        std::optional<size_t> Aggregator::classify(const periods::Date &date) const
        {
            if (config_.mode == PeriodMode::TWO_PERIOD)
            {
                switch (periods::classify_period(date, config_.periods[kPriorSlot].range,
                                                 config_.periods[kCurrentSlot].range))
                {
                case periods::PeriodTag::PRIOR:
                    return kPriorSlot;
                case periods::PeriodTag::CURRENT:
                    return kCurrentSlot;
                case periods::PeriodTag::UNCLASSIFIED:
                    return std::nullopt;
                }
                return std::nullopt;
            }

            for (size_t slot = 0; slot < config_.periods.size(); ++slot)
            {
                if (config_.periods[slot].range.contains(date))
                    return slot;
            }
            return std::nullopt;
        }

        bool Aggregator::process_row(const data::Record &record)
        {
            ++stats_.total_rows;

            if (record.header_ptr() != bound_header_)
            {
                bind_header(record.header_ptr());
            }

            // 1. Date
            std::optional<periods::Date> date;
            if (date_index_)
            {
                date = periods::parse_date(data::trim(record.value_at(*date_index_)), *date_format_);
            }
            if (!date)
            {
                record_exclusion(stats_.parse_errors);
                return false;
            }

            if (!min_date_ || *date < *min_date_)
                min_date_ = date;
            if (!max_date_ || *date > *max_date_)
                max_date_ = date;

            // 2. Period
            std::optional<size_t> slot = classify(*date);
            if (!slot)
            {
                record_exclusion(stats_.outside_period_rows);
                return false;
            }

            // 3. Numbers
            std::optional<double> sales;
            std::optional<double> quantity;
            std::optional<double> cost = 0.0;
            if (sales_index_)
                sales = data::parse_number(record.value_at(*sales_index_));
            if (quantity_index_)
                quantity = data::parse_number(record.value_at(*quantity_index_));
            if (!config_.cost_column.empty())
            {
                cost = cost_index_ ? data::parse_number(record.value_at(*cost_index_)) : std::nullopt;
            }

            if (!sales || !quantity || !cost)
            {
                record_exclusion(stats_.parse_errors);
                return false;
            }

            // 4. Non-positive rows go to the negatives ledger only
            if (*sales <= 0.0 || *quantity <= 0.0)
            {
                negatives_[*slot].add(*sales, *quantity, *cost);
                record_exclusion(stats_.negative_rows);
                return false;
            }

            // 5. Accumulate
            size_t index = resolve_bucket(record);
            buckets_[index].periods[*slot].add(*sales, *quantity, *cost);

            ++stats_.included_rows;
            ++stats_.period_rows[*slot];
            return true;
        }

        size_t Aggregator::resolve_bucket(const data::Record &record)
        {
            // Length-prefixed tuple encoding, rebuilt in place for every row
            key_scratch_.clear();
            for (size_t i = 0; i < dimension_indices_.size(); ++i)
            {
                std::string_view value;
                if (dimension_indices_[i])
                    value = trim_view(record.value_at(*dimension_indices_[i]));
                if (value.empty())
                    value = kUnknownDimensionValue;

                values_scratch_[i].assign(value.data(), value.size());
                key_scratch_ += std::to_string(value.size());
                key_scratch_ += ':';
                key_scratch_.append(value.data(), value.size());
            }

            auto found = bucket_index_.find(key_scratch_);
            if (found != bucket_index_.end())
            {
                return found->second;
            }

            DimensionBucket bucket;
            bucket.dimension_values = values_scratch_;
            bucket.periods.resize(config_.periods.size());
            bucket.key = make_bucket_key(bucket.dimension_values);

            size_t index = buckets_.size();
            buckets_.push_back(std::move(bucket));
            bucket_index_.emplace(key_scratch_, index);
            stats_.unique_keys = buckets_.size();
            return index;
        }

        AggregationResult Aggregator::finalize()
        {
            AggregationResult result;
            result.mode = config_.mode;
            result.dimension_columns = config_.dimension_columns;
            result.periods = config_.periods;

            result.buckets = std::move(buckets_);
            result.negatives = negatives_;
            result.stats = stats_;
            result.min_date = min_date_;
            result.max_date = max_date_;

            buckets_.clear();
            bucket_index_.clear();
            return result;
        }

        std::vector<PeriodAccumulator> Aggregator::calculate_totals(const AggregationResult &result)
        {
            std::vector<PeriodAccumulator> totals(result.periods.size());
            for (const auto &bucket : result.buckets)
            {
                for (size_t slot = 0; slot < totals.size() && slot < bucket.periods.size(); ++slot)
                {
                    totals[slot].merge(bucket.periods[slot]);
                }
            }
            return totals;
        }

    } // namespace aggregation
} // namespace pvm
