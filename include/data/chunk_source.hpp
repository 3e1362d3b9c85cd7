/**
 * @file chunk_source.hpp
 * @brief Byte sources read in bounded chunks
 *
 * The parser never sees a whole file: it pulls one chunk at a time from a
 * ChunkSource. Sources are rewindable so the same input can be scanned and
 * then aggregated in a second pass.
 */

#ifndef PVM_DATA_CHUNK_SOURCE_HPP
#define PVM_DATA_CHUNK_SOURCE_HPP

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

namespace pvm {
namespace data {

constexpr size_t kDefaultChunkSize = 1024 * 1024; ///< 1 MiB

/**
 * @class ChunkSource
 * @brief Abstract chunked byte reader
 */
class ChunkSource {
public:
    virtual ~ChunkSource() = default;

    /**
     * @brief Total size in bytes, used for progress reporting
     */
    virtual std::uint64_t size() const = 0;

    /**
     * @brief Read the next chunk
     * @param out Replaced with the chunk contents
     * @return false once the input is exhausted (out is then empty)
     * @throws std::runtime_error on I/O failure
     */
    virtual bool read_chunk(std::string &out) = 0;

    /**
     * @brief Restart from the first byte
     * @throws std::runtime_error if the source cannot be rewound
     */
    virtual void rewind() = 0;
};

/**
 * @class FileChunkSource
 * @brief Reads a file from disk in fixed-size chunks
 */
class FileChunkSource : public ChunkSource {
public:
    /**
     * @brief Open a file
     * @param filepath Path to the file
     * @param chunk_size Bytes per chunk (default 1 MiB)
     * @throws std::runtime_error if the file cannot be opened
     * @throws std::invalid_argument if chunk_size is zero
     */
    explicit FileChunkSource(const std::string &filepath, size_t chunk_size = kDefaultChunkSize);

    std::uint64_t size() const override { return size_; }
    bool read_chunk(std::string &out) override;
    void rewind() override;

    const std::string &path() const { return filepath_; }

private:
    std::string filepath_;
    size_t chunk_size_;
    std::uint64_t size_;
    std::ifstream file_;
};

/**
 * @class StringChunkSource
 * @brief Serves an in-memory string in chunks
 *
 * Either fixed-size chunks, or explicit split offsets so tests can cut the
 * input at any byte position.
 */
class StringChunkSource : public ChunkSource {
public:
    explicit StringChunkSource(std::string text, size_t chunk_size = kDefaultChunkSize);
    StringChunkSource(std::string text, std::vector<size_t> split_offsets);

    std::uint64_t size() const override { return text_.size(); }
    bool read_chunk(std::string &out) override;
    void rewind() override { position_ = 0; next_split_ = 0; }

private:
    std::string text_;
    size_t chunk_size_;
    std::vector<size_t> splits_;
    size_t position_ = 0;
    size_t next_split_ = 0;
};

} // namespace data
} // namespace pvm

#endif // PVM_DATA_CHUNK_SOURCE_HPP
