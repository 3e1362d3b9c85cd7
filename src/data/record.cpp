/**
 * @file record.cpp
 * @brief Implementation of RecordHeader and Record
 */

#include "data/record.hpp"

#include <stdexcept>

namespace pvm {
namespace data {

namespace {
const std::string kEmpty;
}

RecordHeader::RecordHeader(std::vector<std::string> columns)
    : columns_(std::move(columns))
{
    for (size_t i = 0; i < columns_.size(); ++i)
    {
        index_[columns_[i]] = i;
    }
}

std::optional<size_t> RecordHeader::index_of(const std::string &column) const
{
    auto it = index_.find(column);
    if (it == index_.end())
        return std::nullopt;
    return it->second;
}

Record::Record(std::shared_ptr<const RecordHeader> header, std::vector<std::string> values)
    : header_(std::move(header)), values_(std::move(values))
{
    if (!header_)
    {
        throw std::invalid_argument("Record: header must not be null");
    }
    values_.resize(header_->size());
}

const std::string &Record::get(const std::string &column) const
{
    auto index = header_->index_of(column);
    if (!index)
        return kEmpty;
    return values_[*index];
}

} // namespace data
} // namespace pvm
