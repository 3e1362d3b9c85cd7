/**
 * @file date_format.hpp
 * @brief Date format catalog, detection and parsing.
 *
 * A fixed, ordered catalog of date formats. Detection scores every format
 * against a handful of sample values and picks the best one; the
 * MM/DD/YYYY vs DD/MM/YYYY collision is resolved by looking for a sample
 * whose first or second component can only be a day.
 */

#pragma once

#include "periods/date.hpp"

#include <functional>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace pvm {
namespace periods {

/**
 * @struct DateFormat
 * @brief One entry of the catalog.
 *
 * `parse` is strict: it rejects out-of-range months and days instead of
 * rolling them over, so "13/01/2024" never parses as MM/DD/YYYY.
 */
struct DateFormat {
    std::string id;       ///< Identifier, e.g. "YYYY-MM-DD"
    std::string example;  ///< Example value for display
    std::regex pattern;   ///< Shape of a matching value
    std::function<std::optional<Date>(const std::string&)> parse;

    bool matches(const std::string& text) const;
};

/**
 * @struct FormatDetection
 * @brief Result of detect_date_format().
 */
struct FormatDetection {
    std::optional<std::string> format_id;  ///< Winning format, empty if nothing parsed
    double confidence = 0.0;               ///< Fraction of samples the winner parsed
    const DateFormat* format = nullptr;    ///< Catalog entry of the winner
};

constexpr int kMinPlausibleYear = 1900;
constexpr int kMaxPlausibleYear = 2100;

/// Catalog in detection order.
const std::vector<DateFormat>& date_format_catalog();

/// Catalog entry by id, nullptr if unknown.
const DateFormat* find_date_format(const std::string& id);

/**
 * @brief Pick the catalog format that best explains the samples.
 *
 * Each format scores valid/total where a sample is valid if it matches the
 * pattern and parses to a year in [1900, 2100]. Blank samples are ignored.
 * The first format with the strictly highest score wins. If the winner is
 * one of the two slash-delimited day/month orders and their scores differ
 * by less than 0.1, the first sample with a component above 12 decides.
 */
FormatDetection detect_date_format(const std::vector<std::string>& samples);

/**
 * @brief Parse a value with the named format.
 *
 * Unknown ids fall back to detecting the format of this single value.
 * Returns std::nullopt on any failure.
 */
std::optional<Date> parse_date(const std::string& text, const std::string& format_id);

/// Same as parse_date() with an already resolved catalog entry.
std::optional<Date> parse_date(const std::string& text, const DateFormat& format);

} // namespace periods
} // namespace pvm
