/**
 * @file record.hpp
 * @brief One input row keyed by the header row.
 */

#ifndef PVM_DATA_RECORD_HPP
#define PVM_DATA_RECORD_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pvm {
namespace data {

/**
 * @class RecordHeader
 * @brief Column names of a source plus a name -> position index
 *
 * Shared by every Record of one run so that records carry only values.
 * When a name repeats, the last column with that name wins, matching the
 * behaviour of building a name-keyed object left to right.
 */
class RecordHeader {
public:
    explicit RecordHeader(std::vector<std::string> columns);

    const std::vector<std::string>& columns() const { return columns_; }
    size_t size() const { return columns_.size(); }

    /**
     * @brief Position of a column
     * @return Index, or std::nullopt if the header has no such column
     */
    std::optional<size_t> index_of(const std::string& column) const;

    bool contains(const std::string& column) const { return index_of(column).has_value(); }

private:
    std::vector<std::string> columns_;
    std::unordered_map<std::string, size_t> index_;
};

/**
 * @class Record
 * @brief Immutable field-name -> raw value mapping for one row
 *
 * Always holds exactly one value per header column: short rows are padded
 * with empty strings and surplus fields are dropped when constructed.
 */
class Record {
public:
    Record(std::shared_ptr<const RecordHeader> header, std::vector<std::string> values);

    /**
     * @brief Value of a named column, empty string if the column is unknown
     */
    const std::string& get(const std::string& column) const;
    const std::string& operator[](const std::string& column) const { return get(column); }

    const std::string& value_at(size_t index) const { return values_[index]; }
    const std::vector<std::string>& values() const { return values_; }

    const RecordHeader& header() const { return *header_; }
    const std::shared_ptr<const RecordHeader>& header_ptr() const { return header_; }
    size_t size() const { return values_.size(); }

private:
    std::shared_ptr<const RecordHeader> header_;
    std::vector<std::string> values_;
};

} // namespace data
} // namespace pvm

#endif // PVM_DATA_RECORD_HPP
