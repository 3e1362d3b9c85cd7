/**
 * @file csv_parser.hpp
 * @brief Streaming delimited-text parser and record sources
 *
 * CsvTokenizer is a two-state (normal / in-quotes) character machine that
 * keeps its state between chunks: the field being built, the row being
 * built, the quote flag and a pending CR. A chunk may therefore end
 * anywhere - inside a field, inside a quoted section, between a CR and its
 * LF - and the rows produced are identical to parsing the whole input in
 * one piece. Incomplete rows are never emitted until their terminator (or
 * end of input) arrives.
 *
 * RecordSource is the seam the aggregation layer consumes: CSV text
 * through CsvRecordSource, pre-tokenized spreadsheet rows through
 * RowArraySource. Both turn the first non-blank row into the header and
 * every later row into a Record.
 */

#ifndef PVM_DATA_CSV_PARSER_HPP
#define PVM_DATA_CSV_PARSER_HPP

#include "data/chunk_source.hpp"
#include "data/record.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace pvm {
namespace data {

/**
 * @class CsvTokenizer
 * @brief Incremental row tokenizer
 *
 * Rules:
 * - Normal state: the delimiter ends a field; CR, LF or CRLF ends a row;
 *   a quote enters the quoted state; unquoted whitespace at either end of
 *   a field is trimmed.
 * - Quoted state: "" is a literal quote, a lone quote leaves the state,
 *   everything else (delimiters, line breaks) is kept verbatim.
 * - A row made of one empty field is dropped.
 * - Malformed quoting never fails; text is kept as literally as possible.
 */
class CsvTokenizer {
public:
    using RowCallback = std::function<void(std::vector<std::string> &&)>;

    explicit CsvTokenizer(char delimiter = ',', char quote = '"');

    /**
     * @brief Consume a chunk, emitting every row it completes
     */
    void feed(std::string_view chunk, const RowCallback &on_row);

    /**
     * @brief End of input: flush a trailing row that has no terminator
     */
    void finish(const RowCallback &on_row);

    /**
     * @brief Drop all carried state
     */
    void reset();

    bool in_quotes() const { return state_ != State::NORMAL; }
    bool has_partial_row() const;

private:
    enum class State {
        NORMAL,
        IN_QUOTES,
        QUOTE_IN_QUOTES ///< Saw a quote inside quotes; the next byte decides
    };

    void end_field();
    void end_row(const RowCallback &on_row);

    char delimiter_;
    char quote_;
    State state_ = State::NORMAL;
    bool skip_lf_ = false;

    std::string field_;
    std::vector<std::string> row_;
    bool field_quoted_ = false;
    size_t quoted_begin_ = 0; ///< field_ size when the first quote opened
    size_t quoted_end_ = 0;   ///< field_ size when the last quote closed
};

/**
 * @struct ParseHandlers
 * @brief Callbacks driven by a RecordSource
 *
 * Every member is optional. `should_cancel` is polled once per chunk and
 * additionally every `cancel_check_interval` records.
 */
struct ParseHandlers {
    std::function<void(const std::vector<std::string> &)> on_headers;
    std::function<void(const Record &, std::uint64_t row_number)> on_record;
    std::function<void(std::uint64_t bytes_read, std::uint64_t total_bytes, std::uint64_t rows)> on_progress;
    std::function<bool()> should_cancel;

    std::uint64_t progress_interval = 100;
    std::uint64_t cancel_check_interval = 10000;
};

/**
 * @struct ParseOutcome
 * @brief Summary of one pass over a source
 */
struct ParseOutcome {
    bool cancelled = false;
    std::uint64_t row_count = 0;        ///< Data rows delivered (header excluded)
    std::vector<std::string> headers;
};

/**
 * @class RecordSource
 * @brief Restartable producer of records
 *
 * Each call to parse() is a complete, independent pass from the first row.
 * Exceptions thrown by handlers or by the transport propagate to the caller.
 */
class RecordSource {
public:
    virtual ~RecordSource() = default;
    virtual ParseOutcome parse(const ParseHandlers &handlers) = 0;
};

/**
 * @class CsvRecordSource
 * @brief Delimited text pulled from a ChunkSource
 *
 * A UTF-8 byte order mark at the start of the stream is dropped, even when
 * the chunk boundaries split it.
 */
class CsvRecordSource : public RecordSource {
public:
    explicit CsvRecordSource(ChunkSource &chunks, char delimiter = ',');

    ParseOutcome parse(const ParseHandlers &handlers) override;

private:
    ChunkSource &chunks_;
    char delimiter_;
};

/**
 * @class RowArraySource
 * @brief Rows already tokenized by an external reader (e.g. a spreadsheet)
 *
 * Header cells are trimmed; data cells are passed through as-is. Rows whose
 * cells are all empty are skipped.
 */
class RowArraySource : public RecordSource {
public:
    explicit RowArraySource(std::vector<std::vector<std::string>> rows);

    ParseOutcome parse(const ParseHandlers &handlers) override;

private:
    std::vector<std::vector<std::string>> rows_;
};

} // namespace data
} // namespace pvm

#endif // PVM_DATA_CSV_PARSER_HPP
