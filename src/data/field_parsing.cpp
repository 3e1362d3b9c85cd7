/**
 * @file field_parsing.cpp
 * @brief Implementation of the shared string helpers
 */

#include "data/field_parsing.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace pvm {
namespace data {

std::string trim(std::string_view str)
{
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos)
        return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return std::string(str.substr(first, last - first + 1));
}

std::string to_lower(std::string_view str)
{
    std::string out(str);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return out;
}

std::optional<double> parse_number(std::string_view value)
{
    std::string str = trim(value);
    if (str.empty())
        return std::nullopt;

    bool negative = false;
    if (str.size() >= 2 && str.front() == '(' && str.back() == ')')
    {
        negative = true;
        str = str.substr(1, str.size() - 2);
    }

    // Strip currency symbols (UTF-8 for the multi-byte ones) and separators
    static const std::string_view symbols[] = {"\xE2\x82\xAC", "\xC2\xA3", "\xC2\xA5", "$", ","};
    std::string residual;
    residual.reserve(str.size());
    for (size_t i = 0; i < str.size();)
    {
        bool stripped = false;
        for (const auto &symbol : symbols)
        {
            if (str.compare(i, symbol.size(), symbol) == 0)
            {
                i += symbol.size();
                stripped = true;
                break;
            }
        }
        if (!stripped)
            residual += str[i++];
    }

    residual = trim(residual);
    if (!residual.empty() && residual.front() == '-')
    {
        negative = !negative;
        residual = trim(std::string_view(residual).substr(1));
    }
    if (residual.empty() || residual.front() == '-' || residual.front() == '+' ||
        !(std::isdigit(static_cast<unsigned char>(residual.front())) || residual.front() == '.'))
    {
        return std::nullopt;
    }

    const char *begin = residual.c_str();
    char *end = nullptr;
    double number = std::strtod(begin, &end);
    if (end != begin + residual.size() || !std::isfinite(number))
        return std::nullopt;

    return negative ? -number : number;
}

std::string quote_field(std::string_view value, char delimiter)
{
    bool needs_quotes = value.find(delimiter) != std::string_view::npos ||
                        value.find_first_of("\"\r\n") != std::string_view::npos ||
                        (!value.empty() && (std::isspace(static_cast<unsigned char>(value.front())) ||
                                            std::isspace(static_cast<unsigned char>(value.back()))));
    if (!needs_quotes)
        return std::string(value);

    std::string out;
    out.reserve(value.size() + 2);
    out += '"';
    for (char c : value)
    {
        if (c == '"')
            out += '"';
        out += c;
    }
    out += '"';
    return out;
}

} // namespace data
} // namespace pvm
