#include <gtest/gtest.h>
#include <ghoti.io/dsv.h>
#include "../../src/dsv/dsv_internal.h"
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

using namespace gdsv;

static Write_Options tab_nonnumeric() {
    Write_Options opts = write_options_default();
    opts.dialect.delimiter = '\t';
    opts.dialect.quoting = GDSV_QUOTE_NONNUMERIC;
    return opts;
}

static std::string write_one(const Row & row, const Write_Options * opts,
    Status * status_out = nullptr) {
    Buffer_Sink buffer;
    Writer writer(buffer.sink(), opts);
    Error err;
    Status status = writer.write_row(row, &err);
    if (status_out) {
        *status_out = status;
    }
    return buffer.str();
}

// Quoting modes
TEST(DsvWriter, NonnumericQuotesTextOnly) {
    Write_Options opts = tab_nonnumeric();
    EXPECT_EQ(write_one(Row{"Sam", 18, "Baker"}, &opts), "\"Sam\"\t18\t\"Baker\"\r\n");
}

TEST(DsvWriter, NonnumericNumberLikeText) {
    Write_Options opts = tab_nonnumeric();
    EXPECT_EQ(write_one(Row{"18", 2.5}, &opts), "\"18\"\t2.5\r\n");
}

TEST(DsvWriter, NonnumericAbsentIsQuotedEmpty) {
    Write_Options opts = tab_nonnumeric();
    EXPECT_EQ(write_one(Row{Value(), 1}, &opts), "\"\"\t1\r\n");
}

TEST(DsvWriter, QuoteAllQuotesNumbers) {
    Write_Options opts = write_options_default();
    opts.dialect.quoting = GDSV_QUOTE_ALL;
    EXPECT_EQ(write_one(Row{"a", 18, Value()}, &opts), "\"a\",\"18\",\"\"\r\n");
}

TEST(DsvWriter, MinimalQuotesOnlyWhenNeeded) {
    EXPECT_EQ(write_one(Row{"plain", "a,b", "say \"hi\"", "x\ny", "cr\r", 7},
                  nullptr),
        "plain,\"a,b\",\"say \"\"hi\"\"\",\"x\ny\",\"cr\r\",7\r\n");
}

TEST(DsvWriter, MinimalQuotesLeadingSpaceWhenSkipped) {
    Write_Options opts = write_options_default();
    EXPECT_EQ(write_one(Row{"a", " b"}, &opts), "a, b\r\n");
    opts.dialect.skip_initial_space = true;
    EXPECT_EQ(write_one(Row{"a", " b", "c "}, &opts), "a,\" b\",c \r\n");
}

TEST(DsvWriter, IntegersBeyondDoublePrecision) {
    EXPECT_EQ(write_one(Row{int64_t(9007199254740993)}, nullptr),
        "9007199254740993\r\n");
    EXPECT_EQ(write_one(Row{std::numeric_limits<long long>::min(),
                            std::numeric_limits<long long>::max()},
                  nullptr),
        "-9223372036854775808,9223372036854775807\r\n");

    Buffer_Sink buffer;
    Writer writer(buffer.sink(), nullptr);
    ASSERT_EQ(writer.record_begin(), GDSV_OK);
    ASSERT_EQ(writer.field(Value(int64_t(-9007199254740993))), GDSV_OK);
    ASSERT_EQ(writer.record_end(), GDSV_OK);
    EXPECT_EQ(buffer.str(), "-9007199254740993\r\n");
}

TEST(DsvWriter, MinimalSingleEmptyField) {
    EXPECT_EQ(write_one(Row{""}, nullptr), "\"\"\r\n");
    EXPECT_EQ(write_one(Row{Value()}, nullptr), "\"\"\r\n");
    EXPECT_EQ(write_one(Row{"", ""}, nullptr), ",\r\n");
}

TEST(DsvWriter, EmptyRow) {
    EXPECT_EQ(write_one(Row{}, nullptr), "\r\n");
}

TEST(DsvWriter, QuoteNoneEscapesSpecials) {
    Write_Options opts = write_options_default();
    opts.dialect.quoting = GDSV_QUOTE_NONE;
    opts.dialect.escape = '\\';
    EXPECT_EQ(write_one(Row{"a,b", "q\"q", "back\\slash", 5}, &opts),
        "a\\,b,q\\\"q,back\\\\slash,5\r\n");
}

TEST(DsvWriter, QuoteNoneWithoutEscapeFails) {
    Write_Options opts = write_options_default();
    opts.dialect.quoting = GDSV_QUOTE_NONE;
    Status status = GDSV_OK;
    std::string out = write_one(Row{"ok", "a,b"}, &opts, &status);
    EXPECT_EQ(status, GDSV_E_NEED_ESCAPE);
    EXPECT_EQ(out, "");
}

TEST(DsvWriter, QuoteNoneSingleEmptyFieldFails) {
    Write_Options opts = write_options_default();
    opts.dialect.quoting = GDSV_QUOTE_NONE;
    opts.dialect.escape = '\\';
    Status status = GDSV_OK;
    EXPECT_EQ(write_one(Row{""}, &opts, &status), "");
    EXPECT_EQ(status, GDSV_E_NEED_ESCAPE);
}

TEST(DsvWriter, EscapedQuoteWithoutDoublequote) {
    Write_Options opts = write_options_default();
    opts.dialect.doublequote = false;
    opts.dialect.escape = '\\';
    EXPECT_EQ(write_one(Row{"a\"b"}, &opts), "a\\\"b\r\n");

    Write_Options no_escape = write_options_default();
    no_escape.dialect.doublequote = false;
    Status status = GDSV_OK;
    write_one(Row{"a\"b"}, &no_escape, &status);
    EXPECT_EQ(status, GDSV_E_NEED_ESCAPE);
}

TEST(DsvWriter, CustomNewline) {
    Write_Options opts = write_options_default();
    opts.newline = "\n";
    EXPECT_EQ(write_one(Row{"a", "b"}, &opts), "a,b\n");
}

TEST(DsvWriter, CustomDelimiterAndQuote) {
    Write_Options opts = write_options_default();
    opts.dialect.delimiter = ';';
    opts.dialect.quote = '\'';
    EXPECT_EQ(write_one(Row{"it's", "a;b", "c,d"}, &opts),
        "'it''s';'a;b';c,d\r\n");
}

// Escape helper
TEST(DsvWriter, EscapeFieldReportsQuoting) {
    Dialect d = dialect_default();
    std::string out;
    bool wants_quote = true;
    EXPECT_EQ(dsv_escape_field("abc", 3, d, "\r\n", &out, &wants_quote), GDSV_OK);
    EXPECT_EQ(out, "abc");
    EXPECT_FALSE(wants_quote);

    out.clear();
    EXPECT_EQ(dsv_escape_field("a\"b", 3, d, "\r\n", &out, &wants_quote), GDSV_OK);
    EXPECT_EQ(out, "a\"\"b");
    EXPECT_TRUE(wants_quote);

    out.clear();
    EXPECT_EQ(dsv_escape_field("a|b", 3, d, "|", &out, &wants_quote), GDSV_OK);
    EXPECT_TRUE(wants_quote);

    out.clear();
    EXPECT_EQ(dsv_escape_field(" a", 2, d, "\r\n", &out, &wants_quote), GDSV_OK);
    EXPECT_FALSE(wants_quote);
    d.skip_initial_space = true;
    EXPECT_EQ(dsv_escape_field(" a", 2, d, "\r\n", &out, &wants_quote), GDSV_OK);
    EXPECT_TRUE(wants_quote);

    EXPECT_EQ(dsv_escape_field(nullptr, 0, d, "\r\n", &out, &wants_quote), GDSV_OK);
    EXPECT_EQ(dsv_escape_field(nullptr, 1, d, "\r\n", &out, &wants_quote),
        GDSV_E_INVALID);
}

// Multiple rows
TEST(DsvWriter, WriteRowsMatchesSingleRows) {
    std::vector<Row> rows = {
        {"Name", "Age", "Occupation"},
        {"Sam", 18, "Baker"},
        {"Terry", 25, "Stock Broker"},
        {"Don", 36, "Post Person"}};
    Write_Options opts = tab_nonnumeric();

    Buffer_Sink batch;
    Writer batch_writer(batch.sink(), &opts);
    ASSERT_EQ(batch_writer.write_rows(rows), GDSV_OK);

    Buffer_Sink single;
    Writer single_writer(single.sink(), &opts);
    for (const Row & row : rows) {
        ASSERT_EQ(single_writer.write_row(row), GDSV_OK);
    }

    EXPECT_EQ(batch.str(), single.str());
    EXPECT_EQ(batch.str(),
        "\"Name\"\t\"Age\"\t\"Occupation\"\r\n"
        "\"Sam\"\t18\t\"Baker\"\r\n"
        "\"Terry\"\t25\t\"Stock Broker\"\r\n"
        "\"Don\"\t36\t\"Post Person\"\r\n");
    EXPECT_EQ(batch_writer.record_count(), 4u);
}

TEST(DsvWriter, WriteRowsReportsFailingRow) {
    Write_Options opts = write_options_default();
    opts.dialect.quoting = GDSV_QUOTE_NONE;
    std::vector<Row> rows = {{"a"}, {"b"}, {"c,d"}, {"e"}};
    Buffer_Sink buffer;
    Writer writer(buffer.sink(), &opts);
    Error err;
    EXPECT_EQ(writer.write_rows(rows, &err), GDSV_E_NEED_ESCAPE);
    EXPECT_EQ(err.row_index, 2u);
    EXPECT_EQ(buffer.str(), "a\r\nb\r\n");
}

// Structural API
TEST(DsvWriter, StructuralRecord) {
    Buffer_Sink buffer;
    Writer writer(buffer.sink(), nullptr);
    EXPECT_EQ(writer.state(), GDSV_WRITER_STATE_INITIAL);
    ASSERT_EQ(writer.record_begin(), GDSV_OK);
    EXPECT_EQ(writer.state(), GDSV_WRITER_STATE_IN_RECORD);
    ASSERT_EQ(writer.field("a", 1), GDSV_OK);
    ASSERT_EQ(writer.field(Value(2)), GDSV_OK);
    ASSERT_EQ(writer.field("x,y", 3), GDSV_OK);
    ASSERT_EQ(writer.record_end(), GDSV_OK);
    ASSERT_EQ(writer.finish(), GDSV_OK);
    EXPECT_EQ(writer.state(), GDSV_WRITER_STATE_FINISHED);
    EXPECT_EQ(buffer.str(), "a,2,\"x,y\"\r\n");
}

TEST(DsvWriter, StructuralMatchesWriteRow) {
    Row row = {"", "b", Value(), 3.25};
    Buffer_Sink structural;
    Writer writer(structural.sink(), nullptr);
    ASSERT_EQ(writer.record_begin(), GDSV_OK);
    for (const Value & value : row) {
        ASSERT_EQ(writer.field(value), GDSV_OK);
    }
    ASSERT_EQ(writer.record_end(), GDSV_OK);

    EXPECT_EQ(structural.str(), write_one(row, nullptr));
    EXPECT_EQ(structural.str(), ",b,,3.25\r\n");
}

TEST(DsvWriter, StructuralSingleEmptyField) {
    Buffer_Sink buffer;
    Writer writer(buffer.sink(), nullptr);
    ASSERT_EQ(writer.record_begin(), GDSV_OK);
    ASSERT_EQ(writer.field("", 0), GDSV_OK);
    ASSERT_EQ(writer.record_end(), GDSV_OK);
    EXPECT_EQ(buffer.str(), "\"\"\r\n");
}

TEST(DsvWriter, StructuralMisuse) {
    Buffer_Sink buffer;
    Writer writer(buffer.sink(), nullptr);
    Error err;
    EXPECT_EQ(writer.field("a", 1, &err), GDSV_E_STATE);
    EXPECT_EQ(err.code, GDSV_E_STATE);
    EXPECT_EQ(writer.record_end(&err), GDSV_E_STATE);

    ASSERT_EQ(writer.record_begin(), GDSV_OK);
    EXPECT_EQ(writer.record_begin(&err), GDSV_E_STATE);
    EXPECT_EQ(writer.write_row(Row{"x"}, &err), GDSV_E_STATE);
    EXPECT_EQ(writer.field(nullptr, 3, &err), GDSV_E_INVALID);
}

TEST(DsvWriter, FinishClosesOpenRecord) {
    Buffer_Sink buffer;
    Writer writer(buffer.sink(), nullptr);
    ASSERT_EQ(writer.record_begin(), GDSV_OK);
    ASSERT_EQ(writer.field("a", 1), GDSV_OK);
    ASSERT_EQ(writer.finish(), GDSV_OK);
    EXPECT_EQ(buffer.str(), "a\r\n");
    EXPECT_EQ(writer.record_count(), 1u);

    EXPECT_EQ(writer.write_row(Row{"b"}), GDSV_E_STATE);
    EXPECT_EQ(writer.record_begin(), GDSV_E_STATE);
    EXPECT_EQ(writer.finish(), GDSV_OK);
    EXPECT_EQ(buffer.str(), "a\r\n");
}

TEST(DsvWriter, InvalidConfiguration) {
    Buffer_Sink buffer;
    Write_Options opts = write_options_default();
    opts.newline = "";
    Writer empty_newline(buffer.sink(), &opts);
    EXPECT_EQ(empty_newline.write_row(Row{"a"}), GDSV_E_INVALID);

    opts = write_options_default();
    opts.dialect.delimiter = '"';
    Writer bad_dialect(buffer.sink(), &opts);
    Error err;
    EXPECT_EQ(bad_dialect.record_begin(&err), GDSV_E_INVALID);
    EXPECT_EQ(err.code, GDSV_E_INVALID);

    Sink no_write;
    no_write.write = nullptr;
    no_write.flush = nullptr;
    no_write.user = nullptr;
    Writer no_sink(no_write, nullptr);
    EXPECT_EQ(no_sink.write_row(Row{"a"}), GDSV_E_INVALID);
    EXPECT_TRUE(buffer.str().empty());
}

TEST(DsvWriter, OptionsAreCopied) {
    Buffer_Sink buffer;
    std::string newline = "\n";
    Write_Options opts = write_options_default();
    opts.newline = newline.c_str();
    Writer writer(buffer.sink(), &opts);
    newline = "XX";
    ASSERT_EQ(writer.write_row(Row{"a"}), GDSV_OK);
    EXPECT_EQ(buffer.str(), "a\n");
    EXPECT_STREQ(writer.options().newline, "\n");
}

TEST(DsvWriter, SinkFailure) {
    char storage[6];
    Fixed_Buffer_Sink fixed(storage, sizeof(storage));
    Writer writer(fixed.sink(), nullptr);
    Error err;
    ASSERT_EQ(writer.write_row(Row{"abc"}, &err), GDSV_OK);
    EXPECT_EQ(writer.write_row(Row{"defg"}, &err), GDSV_E_WRITE);
    EXPECT_EQ(err.code, GDSV_E_WRITE);
    EXPECT_TRUE(fixed.truncated());
    EXPECT_EQ(fixed.used(), sizeof(storage));
    EXPECT_EQ(std::string(storage, 5), "abc\r\n");
    EXPECT_EQ(writer.record_count(), 1u);
}
