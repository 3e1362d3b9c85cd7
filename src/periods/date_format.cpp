#include "periods/date_format.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace pvm {
namespace periods {

namespace {

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

// Left-to-right reader over one value; every parser consumes the whole string.
class Cursor {
public:
    explicit Cursor(const std::string& text) : text_(text), pos_(0) {}

    bool digits(size_t min_len, size_t max_len, int& out) {
        size_t start = pos_;
        while (pos_ < text_.size() && pos_ - start < max_len &&
               std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
        size_t len = pos_ - start;
        if (len < min_len) return false;
        out = std::atoi(text_.substr(start, len).c_str());
        return true;
    }

    bool letters(size_t len, std::string& out) {
        if (pos_ + len > text_.size()) return false;
        for (size_t i = 0; i < len; ++i) {
            if (!std::isalpha(static_cast<unsigned char>(text_[pos_ + i]))) return false;
        }
        out = text_.substr(pos_, len);
        pos_ += len;
        return true;
    }

    bool literal(char c) {
        if (pos_ < text_.size() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool spaces() {
        size_t start = pos_;
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) ++pos_;
        return pos_ > start;
    }

    bool at_end() const { return pos_ == text_.size(); }

private:
    const std::string& text_;
    size_t pos_;
};

int month_from_abbreviation(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    for (int i = 0; i < 12; ++i) {
        std::string candidate = kMonthNamesShort[i];
        std::transform(candidate.begin(), candidate.end(), candidate.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        if (candidate == lower) return i + 1;
    }
    return 0;
}

enum class Order { YMD, MDY, DMY };

std::optional<Date> parse_numeric(const std::string& s, char sep, Order order,
                                  size_t first_min, size_t first_max) {
    Cursor c(s);
    int a = 0, b = 0, y = 0;
    if (order == Order::YMD) {
        if (!c.digits(4, 4, y) || !c.literal(sep) || !c.digits(2, 2, a) ||
            !c.literal(sep) || !c.digits(2, 2, b) || !c.at_end()) {
            return std::nullopt;
        }
        return Date::make(y, a, b);
    }
    if (!c.digits(first_min, first_max, a) || !c.literal(sep) || !c.digits(1, 2, b) ||
        !c.literal(sep) || !c.digits(4, 4, y) || !c.at_end()) {
        return std::nullopt;
    }
    return order == Order::MDY ? Date::make(y, a, b) : Date::make(y, b, a);
}

std::optional<Date> parse_dd_mmm_yyyy(const std::string& s) {
    Cursor c(s);
    int d = 0, y = 0;
    std::string mon;
    if (!c.digits(1, 2, d) || !c.literal('-') || !c.letters(3, mon) ||
        !c.literal('-') || !c.digits(4, 4, y) || !c.at_end()) {
        return std::nullopt;
    }
    int m = month_from_abbreviation(mon);
    if (m == 0) return std::nullopt;
    return Date::make(y, m, d);
}

std::optional<Date> parse_mmm_dd_yyyy(const std::string& s) {
    Cursor c(s);
    int d = 0, y = 0;
    std::string mon;
    if (!c.letters(3, mon) || !c.spaces() || !c.digits(1, 2, d)) return std::nullopt;
    c.literal(',');
    if (!c.spaces() || !c.digits(4, 4, y) || !c.at_end()) return std::nullopt;
    int m = month_from_abbreviation(mon);
    if (m == 0) return std::nullopt;
    return Date::make(y, m, d);
}

std::optional<Date> parse_yyyymmdd(const std::string& s) {
    Cursor c(s);
    int y = 0, m = 0, d = 0;
    if (!c.digits(4, 4, y) || !c.digits(2, 2, m) || !c.digits(2, 2, d) || !c.at_end()) {
        return std::nullopt;
    }
    return Date::make(y, m, d);
}

std::vector<DateFormat> build_catalog() {
    std::vector<DateFormat> catalog;
    catalog.push_back({"YYYY-MM-DD", "2024-01-15",
                       std::regex(R"(^\d{4}-\d{2}-\d{2}$)"),
                       [](const std::string& s) { return parse_numeric(s, '-', Order::YMD, 4, 4); }});
    catalog.push_back({"MM/DD/YYYY", "01/15/2024",
                       std::regex(R"(^\d{1,2}/\d{1,2}/\d{4}$)"),
                       [](const std::string& s) { return parse_numeric(s, '/', Order::MDY, 1, 2); }});
    catalog.push_back({"DD/MM/YYYY", "15/01/2024",
                       std::regex(R"(^\d{1,2}/\d{1,2}/\d{4}$)"),
                       [](const std::string& s) { return parse_numeric(s, '/', Order::DMY, 1, 2); }});
    catalog.push_back({"MM-DD-YYYY", "01-15-2024",
                       std::regex(R"(^\d{1,2}-\d{1,2}-\d{4}$)"),
                       [](const std::string& s) { return parse_numeric(s, '-', Order::MDY, 1, 2); }});
    catalog.push_back({"DD-MMM-YYYY", "15-Jan-2024",
                       std::regex(R"(^\d{1,2}-[A-Za-z]{3}-\d{4}$)"),
                       parse_dd_mmm_yyyy});
    catalog.push_back({"MMM DD, YYYY", "Jan 15, 2024",
                       std::regex(R"(^[A-Za-z]{3}\s+\d{1,2},?\s+\d{4}$)"),
                       parse_mmm_dd_yyyy});
    catalog.push_back({"YYYYMMDD", "20240115",
                       std::regex(R"(^\d{8}$)"),
                       parse_yyyymmdd});
    catalog.push_back({"M/D/YYYY", "1/5/2024",
                       std::regex(R"(^\d{1,2}/\d{1,2}/\d{4}$)"),
                       [](const std::string& s) { return parse_numeric(s, '/', Order::MDY, 1, 2); }});
    return catalog;
}

bool plausible(const std::optional<Date>& date) {
    return date && date->year >= kMinPlausibleYear && date->year <= kMaxPlausibleYear;
}

} // namespace

bool DateFormat::matches(const std::string& text) const {
    return std::regex_match(text, pattern);
}

const std::vector<DateFormat>& date_format_catalog() {
    static const std::vector<DateFormat> catalog = build_catalog();
    return catalog;
}

const DateFormat* find_date_format(const std::string& id) {
    for (const auto& format : date_format_catalog()) {
        if (format.id == id) return &format;
    }
    return nullptr;
}

FormatDetection detect_date_format(const std::vector<std::string>& samples) {
    FormatDetection result;

    std::vector<std::string> valid_samples;
    for (const auto& sample : samples) {
        std::string trimmed = trim(sample);
        if (!trimmed.empty()) valid_samples.push_back(trimmed);
    }
    if (valid_samples.empty()) return result;

    const auto& catalog = date_format_catalog();
    std::vector<double> scores(catalog.size(), 0.0);

    for (size_t f = 0; f < catalog.size(); ++f) {
        int valid_dates = 0;
        for (const auto& sample : valid_samples) {
            if (catalog[f].matches(sample) && plausible(catalog[f].parse(sample))) {
                ++valid_dates;
            }
        }
        scores[f] = static_cast<double>(valid_dates) / static_cast<double>(valid_samples.size());
    }

    const DateFormat* best = nullptr;
    double best_score = 0.0;
    for (size_t f = 0; f < catalog.size(); ++f) {
        if (scores[f] > best_score) {
            best_score = scores[f];
            best = &catalog[f];
        }
    }

    if (best && (best->id == "MM/DD/YYYY" || best->id == "DD/MM/YYYY")) {
        const DateFormat* mmdd = find_date_format("MM/DD/YYYY");
        const DateFormat* ddmm = find_date_format("DD/MM/YYYY");
        double mmdd_score = scores[static_cast<size_t>(mmdd - catalog.data())];
        double ddmm_score = scores[static_cast<size_t>(ddmm - catalog.data())];

        if (std::abs(mmdd_score - ddmm_score) < 0.1) {
            for (const auto& sample : valid_samples) {
                size_t first_slash = sample.find('/');
                size_t second_slash = sample.find('/', first_slash + 1);
                if (first_slash == std::string::npos || second_slash == std::string::npos ||
                    sample.find('/', second_slash + 1) != std::string::npos) {
                    continue;
                }
                int first = std::atoi(sample.substr(0, first_slash).c_str());
                int second = std::atoi(sample.substr(first_slash + 1, second_slash - first_slash - 1).c_str());

                if (first > 12 && first <= 31) {
                    best = ddmm;
                    break;
                }
                if (second > 12 && second <= 31) {
                    best = mmdd;
                    break;
                }
            }
        }
    }

    if (best) {
        result.format_id = best->id;
        result.format = best;
        result.confidence = scores[static_cast<size_t>(best - catalog.data())];
    }
    return result;
}

std::optional<Date> parse_date(const std::string& text, const DateFormat& format) {
    std::string trimmed = trim(text);
    if (trimmed.empty()) return std::nullopt;
    return format.parse(trimmed);
}

std::optional<Date> parse_date(const std::string& text, const std::string& format_id) {
    if (trim(text).empty()) return std::nullopt;

    const DateFormat* format = find_date_format(format_id);
    if (!format) {
        auto detected = detect_date_format({text});
        if (!detected.format) return std::nullopt;
        format = detected.format;
    }
    return parse_date(text, *format);
}

} // namespace periods
} // namespace pvm
