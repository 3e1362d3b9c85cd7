/**
 * @file csv_parser.cpp
 * @brief Implementation of CsvTokenizer and the record sources
 */

#include "data/csv_parser.hpp"
#include "data/field_parsing.hpp"

#include <algorithm>
#include <cctype>

namespace pvm {
namespace data {

namespace {

constexpr std::string_view kUtf8Bom{"\xEF\xBB\xBF", 3};

bool is_blank(const std::string &s)
{
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

bool poll(const ParseHandlers &handlers)
{
    return handlers.should_cancel && handlers.should_cancel();
}

} // namespace

// ============================================================================
// CsvTokenizer
// ============================================================================

CsvTokenizer::CsvTokenizer(char delimiter, char quote)
    : delimiter_(delimiter), quote_(quote)
{
}

void CsvTokenizer::feed(std::string_view chunk, const RowCallback &on_row)
{
    for (char c : chunk)
    {
        if (skip_lf_)
        {
            skip_lf_ = false;
            if (c == '\n')
                continue;
        }

        if (state_ == State::QUOTE_IN_QUOTES)
        {
            if (c == quote_)
            {
                // Escaped quote
                field_ += c;
                state_ = State::IN_QUOTES;
                continue;
            }
            state_ = State::NORMAL;
            quoted_end_ = field_.size();
        }

        if (state_ == State::IN_QUOTES)
        {
            if (c == quote_)
                state_ = State::QUOTE_IN_QUOTES;
            else
                field_ += c;
            continue;
        }

        if (c == quote_)
        {
            if (!field_quoted_)
            {
                if (is_blank(field_))
                    field_.clear();
                field_quoted_ = true;
                quoted_begin_ = field_.size();
            }
            state_ = State::IN_QUOTES;
        }
        else if (c == delimiter_)
        {
            end_field();
        }
        else if (c == '\r')
        {
            end_row(on_row);
            skip_lf_ = true;
        }
        else if (c == '\n')
        {
            end_row(on_row);
        }
        else
        {
            field_ += c;
        }
    }
}

void CsvTokenizer::finish(const RowCallback &on_row)
{
    bool partial = has_partial_row();

    if (state_ != State::NORMAL)
    {
        // An unterminated quote keeps whatever it collected
        quoted_end_ = field_.size();
        state_ = State::NORMAL;
    }

    if (partial)
        end_row(on_row);

    reset();
}

void CsvTokenizer::reset()
{
    state_ = State::NORMAL;
    skip_lf_ = false;
    field_.clear();
    row_.clear();
    field_quoted_ = false;
    quoted_begin_ = 0;
    quoted_end_ = 0;
}

bool CsvTokenizer::has_partial_row() const
{
    return !field_.empty() || !row_.empty() || field_quoted_ || state_ != State::NORMAL;
}

void CsvTokenizer::end_field()
{
    if (!field_quoted_)
    {
        field_ = trim(field_);
    }
    else
    {
        size_t end = field_.size();
        while (end > quoted_end_ && std::isspace(static_cast<unsigned char>(field_[end - 1])))
            --end;
        field_.erase(end);

        size_t begin = 0;
        while (begin < quoted_begin_ && std::isspace(static_cast<unsigned char>(field_[begin])))
            ++begin;
        field_.erase(0, begin);
    }

    row_.push_back(std::move(field_));
    field_.clear();
    field_quoted_ = false;
    quoted_begin_ = 0;
    quoted_end_ = 0;
}

void CsvTokenizer::end_row(const RowCallback &on_row)
{
    end_field();

    bool blank = row_.size() == 1 && row_.front().empty();
    if (!blank)
        on_row(std::move(row_));

    row_.clear();
}

// ============================================================================
// CsvRecordSource
// ============================================================================

CsvRecordSource::CsvRecordSource(ChunkSource &chunks, char delimiter)
    : chunks_(chunks), delimiter_(delimiter)
{
}

ParseOutcome CsvRecordSource::parse(const ParseHandlers &handlers)
{
    ParseOutcome outcome;
    chunks_.rewind();

    CsvTokenizer tokenizer(delimiter_);
    std::shared_ptr<const RecordHeader> header;
    const std::uint64_t total_bytes = chunks_.size();
    std::uint64_t bytes_read = 0;
    bool cancelled = false;

    auto on_row = [&](std::vector<std::string> &&row)
    {
        if (cancelled)
            return;

        if (!header)
        {
            header = std::make_shared<const RecordHeader>(std::move(row));
            outcome.headers = header->columns();
            if (handlers.on_headers)
                handlers.on_headers(outcome.headers);
            return;
        }

        ++outcome.row_count;
        if (handlers.on_record)
            handlers.on_record(Record(header, std::move(row)), outcome.row_count);

        if (handlers.on_progress && handlers.progress_interval > 0 &&
            outcome.row_count % handlers.progress_interval == 0)
        {
            handlers.on_progress(bytes_read, total_bytes, outcome.row_count);
        }

        if (handlers.cancel_check_interval > 0 &&
            outcome.row_count % handlers.cancel_check_interval == 0 && poll(handlers))
        {
            cancelled = true;
        }
    };

    std::string chunk;
    std::string leading;
    bool bom_resolved = false;
    while (true)
    {
        if (poll(handlers))
        {
            outcome.cancelled = true;
            return outcome;
        }

        if (!chunks_.read_chunk(chunk))
            break;

        bytes_read += chunk.size();
        if (bom_resolved)
        {
            tokenizer.feed(chunk, on_row);
        }
        else
        {
            // A byte order mark can straddle chunks; hold bytes until it is decided
            leading.append(chunk);
            if (leading.size() < kUtf8Bom.size() && kUtf8Bom.compare(0, leading.size(), leading) == 0)
                continue;
            bom_resolved = true;
            std::string_view text(leading);
            if (text.substr(0, kUtf8Bom.size()) == kUtf8Bom)
                text.remove_prefix(kUtf8Bom.size());
            tokenizer.feed(text, on_row);
            leading.clear();
        }

        if (cancelled)
        {
            outcome.cancelled = true;
            return outcome;
        }

        if (handlers.on_progress)
            handlers.on_progress(bytes_read, total_bytes, outcome.row_count);
    }

    if (!bom_resolved)
        tokenizer.feed(leading, on_row);
    tokenizer.finish(on_row);
    outcome.cancelled = cancelled;
    return outcome;
}

// ============================================================================
// RowArraySource
// ============================================================================

RowArraySource::RowArraySource(std::vector<std::vector<std::string>> rows)
    : rows_(std::move(rows))
{
}

ParseOutcome RowArraySource::parse(const ParseHandlers &handlers)
{
    ParseOutcome outcome;
    std::shared_ptr<const RecordHeader> header;
    const std::uint64_t total = rows_.size();

    if (poll(handlers))
    {
        outcome.cancelled = true;
        return outcome;
    }

    for (size_t i = 0; i < rows_.size(); ++i)
    {
        const auto &row = rows_[i];
        if (std::all_of(row.begin(), row.end(), [](const std::string &cell) { return cell.empty(); }))
            continue;

        if (!header)
        {
            std::vector<std::string> columns;
            columns.reserve(row.size());
            for (const auto &cell : row)
                columns.push_back(trim(cell));
            header = std::make_shared<const RecordHeader>(std::move(columns));
            outcome.headers = header->columns();
            if (handlers.on_headers)
                handlers.on_headers(outcome.headers);
            continue;
        }

        ++outcome.row_count;
        if (handlers.on_record)
            handlers.on_record(Record(header, row), outcome.row_count);

        if (handlers.on_progress && handlers.progress_interval > 0 &&
            outcome.row_count % handlers.progress_interval == 0)
        {
            handlers.on_progress(i + 1, total, outcome.row_count);
        }

        if (handlers.cancel_check_interval > 0 &&
            outcome.row_count % handlers.cancel_check_interval == 0 && poll(handlers))
        {
            outcome.cancelled = true;
            return outcome;
        }
    }

    if (handlers.on_progress)
        handlers.on_progress(total, total, outcome.row_count);

    return outcome;
}

} // namespace data
} // namespace pvm
