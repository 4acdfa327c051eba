#include <gtest/gtest.h>
#include <ghoti.io/dsv.h>
#include <string>
#include <vector>

using namespace gdsv;

static const char * COMPLEX_INPUT =
    "\"Name\"\t\"Age\"\t\"Occupation\"\r\n"
    "\"John\"\t30\t\"Plumber\"\r\n"
    "\"Cindy\"\t45\t\"CEO\"\r\n"
    "\"Sara\"\t28\t\"Clerk\"\r\n"
    "\"James\"\t19\t\"Stock Boy\"\r\n";

static Dict_Read_Options tab_nonnumeric() {
    Dict_Read_Options opts = dict_read_options_default();
    opts.parse.dialect.delimiter = '\t';
    opts.parse.dialect.quoting = GDSV_QUOTE_NONNUMERIC;
    return opts;
}

TEST(DsvDictReader, HeaderFromFirstRow) {
    String_Source input(COMPLEX_INPUT);
    Dict_Read_Options opts = tab_nonnumeric();
    Dict_Reader reader(input.source(), &opts);
    Error err;

    const Header * header = reader.fieldnames(&err);
    ASSERT_NE(header, nullptr);
    EXPECT_EQ(header->names(),
        (std::vector<std::string>{"Name", "Age", "Occupation"}));
    EXPECT_EQ(reader.line_num(), 1u);

    size_t idx = 0;
    EXPECT_EQ(header->index("Occupation", &idx), GDSV_OK);
    EXPECT_EQ(idx, 2u);
    EXPECT_EQ(header->index("Salary", &idx), GDSV_E_INVALID);
}

TEST(DsvDictReader, EndToEndExample) {
    String_Source input(COMPLEX_INPUT);
    Dict_Read_Options opts = tab_nonnumeric();
    Dict_Reader reader(input.source(), &opts);
    Record record;
    Error err;

    ASSERT_EQ(reader.read_record(record, &err), GDSV_OK);
    EXPECT_EQ(record.get("Name"), Value("John"));
    EXPECT_TRUE(record.get("Age").is_number());
    EXPECT_EQ(record.get("Age").as_number(), 30.0);
    EXPECT_EQ(record.get("Occupation"), Value("Plumber"));
    EXPECT_EQ(reader.line_num(), 2u);
    EXPECT_EQ(record.line(), 2u);
}

TEST(DsvDictReader, LineNumbersForDataRows) {
    String_Source input(COMPLEX_INPUT);
    Dict_Read_Options opts = tab_nonnumeric();
    Dict_Reader reader(input.source(), &opts);
    Record record;
    Error err;

    std::vector<std::string> processed;
    Status status;
    while ((status = reader.read_record(record, &err)) == GDSV_OK) {
        processed.push_back("[" + std::to_string(reader.line_num()) + "]" +
            record.get("Name").as_text() + " works as a " +
            record.get("Occupation").as_text());
    }
    EXPECT_EQ(status, GDSV_END);
    EXPECT_EQ(processed, (std::vector<std::string>{
        "[2]John works as a Plumber",
        "[3]Cindy works as a CEO",
        "[4]Sara works as a Clerk",
        "[5]James works as a Stock Boy"}));
}

TEST(DsvDictReader, UnquotedInputUnderMinimalIsText) {
    String_Source input("Name\tAge\tOccupation\nJohn\t30\tPlumber\n");
    Dict_Read_Options opts = dict_read_options_default();
    opts.parse.dialect.delimiter = '\t';
    Dict_Reader reader(input.source(), &opts);
    Record record;
    ASSERT_EQ(reader.read_record(record, nullptr), GDSV_OK);
    EXPECT_EQ(record.get("Age"), Value("30"));
    EXPECT_EQ(record.line(), 2u);
}

TEST(DsvDictReader, ShortRowPadsWithAbsent) {
    String_Source input("a,b,c\n1\n");
    Dict_Reader reader(input.source(), nullptr);
    Record record;
    ASSERT_EQ(reader.read_record(record, nullptr), GDSV_OK);
    ASSERT_EQ(record.values().size(), 3u);
    EXPECT_EQ(record.get("a"), Value("1"));
    EXPECT_TRUE(record.get("b").is_absent());
    EXPECT_TRUE(record.get("c").is_absent());
    EXPECT_NE(record.find("c"), nullptr);
    EXPECT_TRUE(record.overflow().empty());
}

TEST(DsvDictReader, ShortRowUsesRestValue) {
    String_Source input("a,b\n1\n");
    Dict_Read_Options opts = dict_read_options_default();
    opts.rest_value = Value("n/a");
    Dict_Reader reader(input.source(), &opts);
    Record record;
    ASSERT_EQ(reader.read_record(record, nullptr), GDSV_OK);
    EXPECT_EQ(record.get("b"), Value("n/a"));
}

TEST(DsvDictReader, LongRowCollectsOverflow) {
    String_Source input("a,b\n1,2,3,4\n");
    Dict_Read_Options opts = dict_read_options_default();
    opts.rest_key = "rest";
    Dict_Reader reader(input.source(), &opts);
    Record record;
    ASSERT_EQ(reader.read_record(record, nullptr), GDSV_OK);
    EXPECT_EQ(record.values(), (Row{"1", "2"}));
    EXPECT_EQ(record.overflow(), (Row{"3", "4"}));
    EXPECT_EQ(reader.rest_key(), "rest");
    EXPECT_EQ(record.items().size(), 2u);
}

TEST(DsvDictReader, ItemsInColumnOrder) {
    String_Source input("z,y,x\n1,2,3\n");
    Dict_Reader reader(input.source(), nullptr);
    Record record;
    ASSERT_EQ(reader.read_record(record, nullptr), GDSV_OK);
    std::vector<std::pair<std::string, Value>> items = record.items();
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0].first, "z");
    EXPECT_EQ(items[0].second, Value("1"));
    EXPECT_EQ(items[2].first, "x");
    EXPECT_EQ(items[2].second, Value("3"));
}

TEST(DsvDictReader, UnknownColumn) {
    String_Source input("a\n1\n");
    Dict_Reader reader(input.source(), nullptr);
    Record record;
    ASSERT_EQ(reader.read_record(record, nullptr), GDSV_OK);
    EXPECT_EQ(record.find("missing"), nullptr);
    EXPECT_TRUE(record.get("missing").is_absent());
}

TEST(DsvDictReader, BlankLinesSkippedButCounted) {
    String_Source input("a,b\n\n1,2\n\n\n3,4\n");
    Dict_Reader reader(input.source(), nullptr);
    Record record;
    ASSERT_EQ(reader.read_record(record, nullptr), GDSV_OK);
    EXPECT_EQ(record.get("a"), Value("1"));
    EXPECT_EQ(reader.line_num(), 3u);
    ASSERT_EQ(reader.read_record(record, nullptr), GDSV_OK);
    EXPECT_EQ(record.get("a"), Value("3"));
    EXPECT_EQ(reader.line_num(), 6u);
    EXPECT_EQ(reader.read_record(record, nullptr), GDSV_END);
}

TEST(DsvDictReader, ExplicitFieldnames) {
    String_Source input("1,2\n3,4\n");
    Dict_Read_Options opts = dict_read_options_default();
    opts.fieldnames = {"x", "y"};
    Dict_Reader reader(input.source(), &opts);
    Record record;
    ASSERT_EQ(reader.read_record(record, nullptr), GDSV_OK);
    EXPECT_EQ(record.get("x"), Value("1"));
    EXPECT_EQ(record.line(), 1u);
    ASSERT_EQ(reader.read_record(record, nullptr), GDSV_OK);
    EXPECT_EQ(record.get("y"), Value("4"));
}

TEST(DsvDictReader, DuplicateColumnLastWins) {
    String_Source input("a,b,a\n1,2,3\n");
    Dict_Reader reader(input.source(), nullptr);
    Record record;
    ASSERT_EQ(reader.read_record(record, nullptr), GDSV_OK);
    EXPECT_EQ(record.get("a"), Value("3"));
    EXPECT_EQ(record.values().size(), 3u);
}

TEST(DsvDictReader, DuplicateColumnFirstWins) {
    String_Source input("a,b,a\n1,2,3\n");
    Dict_Read_Options opts = dict_read_options_default();
    opts.header_dup_mode = GDSV_DUPCOL_FIRST_WINS;
    Dict_Reader reader(input.source(), &opts);
    Record record;
    ASSERT_EQ(reader.read_record(record, nullptr), GDSV_OK);
    EXPECT_EQ(record.get("a"), Value("1"));
}

TEST(DsvDictReader, DuplicateColumnError) {
    String_Source input("a,b,a\n1,2,3\n");
    Dict_Read_Options opts = dict_read_options_default();
    opts.header_dup_mode = GDSV_DUPCOL_ERROR;
    Dict_Reader reader(input.source(), &opts);
    Record record;
    Error err;
    EXPECT_EQ(reader.fieldnames(&err), nullptr);
    EXPECT_EQ(err.code, GDSV_E_DUPLICATE_COLUMN);
    EXPECT_EQ(err.line, 1);

    Error again;
    EXPECT_EQ(reader.read_record(record, &again), GDSV_E_DUPLICATE_COLUMN);
    EXPECT_EQ(again.code, GDSV_E_DUPLICATE_COLUMN);
}

TEST(DsvDictReader, EmptyInput) {
    String_Source input("");
    Dict_Reader reader(input.source(), nullptr);
    Record record;
    Error err;
    EXPECT_EQ(reader.fieldnames(&err), nullptr);
    EXPECT_EQ(reader.read_record(record, &err), GDSV_END);
}

TEST(DsvDictReader, HeaderOnly) {
    String_Source input("a,b\n");
    Dict_Reader reader(input.source(), nullptr);
    Record record;
    EXPECT_EQ(reader.read_record(record, nullptr), GDSV_END);
    const Header * header = reader.fieldnames(nullptr);
    ASSERT_NE(header, nullptr);
    EXPECT_EQ(header->size(), 2u);
}

TEST(DsvDictReader, RowErrorDoesNotStopReading) {
    String_Source input("\"n\",\"v\"\n\"a\",oops\n\"b\",2\n");
    Dict_Read_Options opts = dict_read_options_default();
    opts.parse.dialect.quoting = GDSV_QUOTE_NONNUMERIC;
    Dict_Reader reader(input.source(), &opts);
    Record record;
    Error err;
    EXPECT_EQ(reader.read_record(record, &err), GDSV_E_NUMBER);
    EXPECT_EQ(err.line, 2);
    ASSERT_EQ(reader.read_record(record, &err), GDSV_OK);
    EXPECT_EQ(record.get("v"), Value(2));
    EXPECT_EQ(record.line(), 3u);
}
