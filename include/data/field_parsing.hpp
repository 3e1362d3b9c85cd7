/**
 * @file field_parsing.hpp
 * @brief String helpers shared by the parser, the aggregator and the loaders.
 */

#ifndef PVM_DATA_FIELD_PARSING_HPP
#define PVM_DATA_FIELD_PARSING_HPP

#include <optional>
#include <string>
#include <string_view>

namespace pvm {
namespace data {

/**
 * @brief Trim ASCII whitespace from both ends
 */
std::string trim(std::string_view str);

/**
 * @brief Lower-case copy (ASCII only)
 */
std::string to_lower(std::string_view str);

/**
 * @brief Parse a financial number
 *
 * Accepts thousands separators, the currency symbols $ € £ ¥, a leading
 * minus sign and accounting-style parentheses for negatives:
 * "(1,200.50)" -> -1200.5, "$ 3,000" -> 3000.
 *
 * @param value Raw cell text
 * @return Parsed value, or std::nullopt if the text is blank or the residual
 *         after stripping symbols is not a complete finite number
 */
std::optional<double> parse_number(std::string_view value);

/**
 * @brief Quote a field for delimited output if it needs it
 *
 * Fields containing the delimiter, a quote, CR or LF, or leading/trailing
 * whitespace are wrapped in quotes with embedded quotes doubled, so the
 * tokenizer reads back exactly the original text.
 */
std::string quote_field(std::string_view value, char delimiter = ',');

} // namespace data
} // namespace pvm

#endif // PVM_DATA_FIELD_PARSING_HPP
