/**
 * @file chunk_source.cpp
 * @brief Implementation of the chunked byte sources
 */

#include "data/chunk_source.hpp"

#include <algorithm>
#include <stdexcept>

namespace pvm {
namespace data {

FileChunkSource::FileChunkSource(const std::string &filepath, size_t chunk_size)
    : filepath_(filepath), chunk_size_(chunk_size), size_(0)
{
    if (chunk_size_ == 0)
    {
        throw std::invalid_argument("FileChunkSource: chunk size must be positive");
    }

    file_.open(filepath_, std::ios::binary);
    if (!file_.is_open())
    {
        throw std::runtime_error("Could not open file: " + filepath_);
    }

    file_.seekg(0, std::ios::end);
    auto end = file_.tellg();
    if (end < 0)
    {
        throw std::runtime_error("Could not determine size of file: " + filepath_);
    }
    size_ = static_cast<std::uint64_t>(end);
    file_.seekg(0, std::ios::beg);
}

bool FileChunkSource::read_chunk(std::string &out)
{
    out.resize(chunk_size_);
    file_.read(&out[0], static_cast<std::streamsize>(chunk_size_));
    std::streamsize got = file_.gcount();

    if (file_.bad())
    {
        throw std::runtime_error("Read error on file: " + filepath_);
    }

    out.resize(static_cast<size_t>(got));
    return got > 0;
}

void FileChunkSource::rewind()
{
    file_.clear();
    file_.seekg(0, std::ios::beg);
    if (!file_)
    {
        throw std::runtime_error("Could not rewind file: " + filepath_);
    }
}

StringChunkSource::StringChunkSource(std::string text, size_t chunk_size)
    : text_(std::move(text)), chunk_size_(chunk_size)
{
    if (chunk_size_ == 0)
    {
        throw std::invalid_argument("StringChunkSource: chunk size must be positive");
    }
}

StringChunkSource::StringChunkSource(std::string text, std::vector<size_t> split_offsets)
    : text_(std::move(text)), chunk_size_(0), splits_(std::move(split_offsets))
{
    std::sort(splits_.begin(), splits_.end());
    splits_.erase(std::unique(splits_.begin(), splits_.end()), splits_.end());
}

bool StringChunkSource::read_chunk(std::string &out)
{
    if (position_ >= text_.size())
    {
        out.clear();
        return false;
    }

    size_t end = text_.size();
    if (chunk_size_ > 0)
    {
        end = std::min(text_.size(), position_ + chunk_size_);
    }
    else
    {
        while (next_split_ < splits_.size() && splits_[next_split_] <= position_)
            ++next_split_;
        if (next_split_ < splits_.size())
            end = std::min(text_.size(), splits_[next_split_]);
    }

    out.assign(text_, position_, end - position_);
    position_ = end;
    return true;
}

} // namespace data
} // namespace pvm
