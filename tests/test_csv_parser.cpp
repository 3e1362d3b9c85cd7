#include <catch2/catch_test_macros.hpp>
#include "data/csv_parser.hpp"
#include <atomic>
#include <stdexcept>

using namespace pvm::data;

namespace {

struct Collected {
    std::vector<std::string> headers;
    std::vector<std::vector<std::string>> rows;
    ParseOutcome outcome;
};

Collected collect(RecordSource &source, ParseHandlers handlers = {}) {
    Collected c;
    handlers.on_headers = [&c](const std::vector<std::string> &h) { c.headers = h; };
    handlers.on_record = [&c](const Record &record, std::uint64_t) { c.rows.push_back(record.values()); };
    c.outcome = source.parse(handlers);
    return c;
}

Collected parse_text(const std::string &text, size_t chunk_size = kDefaultChunkSize, char delimiter = ',') {
    StringChunkSource chunks(text, chunk_size);
    CsvRecordSource source(chunks, delimiter);
    return collect(source);
}

} // namespace

TEST_CASE("CsvTokenizer is independent of chunk boundaries", "[CsvParser]") {
    const std::string text = "A,B\n\"x,y\",5\n";

    for (size_t split = 0; split <= text.size(); ++split) {
        StringChunkSource chunks(text, std::vector<size_t>{split});
        CsvRecordSource source(chunks);
        auto c = collect(source);

        INFO("split at " << split);
        REQUIRE(c.headers == std::vector<std::string>{"A", "B"});
        REQUIRE(c.rows.size() == 1);
        REQUIRE(c.rows[0] == std::vector<std::string>{"x,y", "5"});
    }
}

TEST_CASE("CsvTokenizer handles CRLF split across chunks", "[CsvParser]") {
    const std::string text = "a,b\r\n1,2\r\n3,4\r\n";

    for (size_t split = 0; split <= text.size(); ++split) {
        StringChunkSource chunks(text, std::vector<size_t>{split});
        CsvRecordSource source(chunks);
        auto c = collect(source);

        INFO("split at " << split);
        REQUIRE(c.rows.size() == 2);
        REQUIRE(c.rows[0] == std::vector<std::string>{"1", "2"});
        REQUIRE(c.rows[1] == std::vector<std::string>{"3", "4"});
    }

    // One byte per chunk
    auto c = parse_text(text, 1);
    REQUIRE(c.rows.size() == 2);
}

TEST_CASE("CsvRecordSource skips a leading UTF-8 byte order mark", "[CsvParser]") {
    const std::string text = "\xEF\xBB\xBF" "date,region\n2024-01-05,East\n";

    for (size_t split = 0; split <= text.size(); ++split) {
        StringChunkSource chunks(text, std::vector<size_t>{split});
        CsvRecordSource source(chunks);
        auto c = collect(source);

        INFO("split at " << split);
        REQUIRE(c.headers == std::vector<std::string>{"date", "region"});
        REQUIRE(c.rows.size() == 1);
        REQUIRE(c.rows[0] == std::vector<std::string>{"2024-01-05", "East"});
    }

    SECTION("one byte per chunk") {
        auto c = parse_text(text, 1);
        REQUIRE(c.headers.front() == "date");
        REQUIRE(c.rows.size() == 1);
    }

    SECTION("only the first bytes of the stream are checked") {
        auto c = parse_text("a,b\n\xEF\xBB\xBFx,1\n");
        REQUIRE(c.rows[0][0] == "\xEF\xBB\xBFx");
    }

    SECTION("a partial mark is kept as text") {
        auto c = parse_text("\xEF\xBB", 1);
        REQUIRE(c.headers == std::vector<std::string>{"\xEF\xBB"});
    }
}

TEST_CASE("CsvTokenizer quoting rules", "[CsvParser]") {
    SECTION("escaped quotes") {
        auto c = parse_text("name,n\n\"say \"\"hi\"\"\",1\n");
        REQUIRE(c.rows.size() == 1);
        REQUIRE(c.rows[0][0] == "say \"hi\"");
    }

    SECTION("embedded newline inside quotes") {
        auto c = parse_text("name,n\n\"two\nlines\",1\n");
        REQUIRE(c.rows.size() == 1);
        REQUIRE(c.rows[0][0] == "two\nlines");
    }

    SECTION("unquoted fields are trimmed, quoted content is kept") {
        auto c = parse_text("a,b\n  East  ,\"  padded  \"\n");
        REQUIRE(c.rows[0][0] == "East");
        REQUIRE(c.rows[0][1] == "  padded  ");
    }

    SECTION("unterminated quote at end of input keeps the collected text") {
        auto c = parse_text("a,b\n1,\"open");
        REQUIRE(c.rows.size() == 1);
        REQUIRE(c.rows[0] == std::vector<std::string>{"1", "open"});
    }

    SECTION("last row without a trailing newline") {
        auto c = parse_text("a,b\n1,2");
        REQUIRE(c.rows.size() == 1);
        REQUIRE(c.rows[0] == std::vector<std::string>{"1", "2"});
    }
}

TEST_CASE("CsvRecordSource row shaping", "[CsvParser]") {
    SECTION("blank rows are dropped") {
        auto c = parse_text("a,b\n\n1,2\n   \n\r\n3,4\n");
        REQUIRE(c.rows.size() == 2);
        REQUIRE(c.outcome.row_count == 2);
    }

    SECTION("short rows are padded and long rows truncated") {
        auto c = parse_text("a,b,c\n1\n1,2,3,4\n");
        REQUIRE(c.rows.size() == 2);
        REQUIRE(c.rows[0] == std::vector<std::string>{"1", "", ""});
        REQUIRE(c.rows[1] == std::vector<std::string>{"1", "2", "3"});
    }

    SECTION("alternate delimiter") {
        auto c = parse_text("a;b\n\"1;5\";2\n", kDefaultChunkSize, ';');
        REQUIRE(c.headers == std::vector<std::string>{"a", "b"});
        REQUIRE(c.rows[0] == std::vector<std::string>{"1;5", "2"});
    }

    SECTION("empty input has no header") {
        auto c = parse_text("");
        REQUIRE(c.headers.empty());
        REQUIRE(c.rows.empty());
        REQUIRE_FALSE(c.outcome.cancelled);
    }

    SECTION("records look up values by column") {
        StringChunkSource chunks("region,sales\nEast,10\n");
        CsvRecordSource source(chunks);
        std::string region;
        ParseHandlers handlers;
        handlers.on_record = [&region](const Record &record, std::uint64_t) { region = record["region"]; };
        source.parse(handlers);
        REQUIRE(region == "East");
    }

    SECTION("a source can be parsed twice") {
        StringChunkSource chunks("a\n1\n2\n", 2);
        CsvRecordSource source(chunks);
        REQUIRE(collect(source).rows.size() == 2);
        REQUIRE(collect(source).rows.size() == 2);
    }
}

TEST_CASE("CsvRecordSource progress and cancellation", "[CsvParser]") {
    std::string text = "a,b\n";
    for (int i = 0; i < 50; ++i) {
        text += std::to_string(i) + ",x\n";
    }

    SECTION("progress is reported every interval and at the end") {
        StringChunkSource chunks(text, 16);
        CsvRecordSource source(chunks);

        std::vector<std::uint64_t> row_marks;
        std::uint64_t last_bytes = 0;
        ParseHandlers handlers;
        handlers.progress_interval = 10;
        handlers.on_progress = [&](std::uint64_t bytes, std::uint64_t total, std::uint64_t rows) {
            REQUIRE(total == text.size());
            REQUIRE(bytes >= last_bytes);
            last_bytes = bytes;
            row_marks.push_back(rows);
        };
        auto c = collect(source, handlers);

        REQUIRE(c.rows.size() == 50);
        REQUIRE(last_bytes == text.size());
        REQUIRE(row_marks.back() == 50);
    }

    SECTION("cancellation stops delivery") {
        StringChunkSource chunks(text);
        CsvRecordSource source(chunks);

        std::atomic<bool> cancel{false};
        ParseHandlers handlers;
        handlers.cancel_check_interval = 5;
        handlers.should_cancel = [&cancel]() { return cancel.load(); };
        size_t delivered = 0;
        handlers.on_record = [&](const Record &, std::uint64_t row) {
            ++delivered;
            if (row == 12)
                cancel.store(true);
        };

        auto outcome = source.parse(handlers);
        REQUIRE(outcome.cancelled);
        REQUIRE(delivered == 15);
    }

    SECTION("a flag set before parsing delivers nothing") {
        StringChunkSource chunks(text);
        CsvRecordSource source(chunks);
        ParseHandlers handlers;
        handlers.should_cancel = []() { return true; };
        auto c = collect(source, handlers);
        REQUIRE(c.outcome.cancelled);
        REQUIRE(c.rows.empty());
    }

    SECTION("handler exceptions propagate") {
        StringChunkSource chunks(text);
        CsvRecordSource source(chunks);
        ParseHandlers handlers;
        handlers.on_record = [](const Record &, std::uint64_t row) {
            if (row == 3)
                throw std::runtime_error("boom");
        };
        REQUIRE_THROWS_AS(source.parse(handlers), std::runtime_error);
    }
}

TEST_CASE("RowArraySource", "[CsvParser]") {
    RowArraySource source({
        {" region ", "sales"},
        {"East", "10"},
        {"", ""},
        {"West"},
    });

    auto c = collect(source);
    REQUIRE(c.headers == std::vector<std::string>{"region", "sales"});
    REQUIRE(c.rows.size() == 2);
    REQUIRE(c.rows[1] == std::vector<std::string>{"West", ""});

    SECTION("cancellation") {
        size_t seen = 0;
        ParseHandlers handlers;
        handlers.cancel_check_interval = 1;
        handlers.should_cancel = [&seen]() { return seen > 0; };
        handlers.on_record = [&seen](const Record &, std::uint64_t) { ++seen; };
        auto outcome = source.parse(handlers);
        REQUIRE(outcome.cancelled);
        REQUIRE(seen == 1);
    }
}
