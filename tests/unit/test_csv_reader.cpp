#include <facsforge/error.hpp>
#include <facsforge/event_matrix.hpp>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>

#include "io/csv_reader.hpp"

namespace facsforge
{
namespace
{

std::string write_temp(const std::string& name, const std::string& content)
{
    auto path = std::filesystem::temp_directory_path() / ("facsforge_" + name);
    std::ofstream out(path, std::ios::binary);
    out << content;
    return path.string();
}

// ═══════════════════════════════════════════════════════════════════════════
// Text parsing
// ═══════════════════════════════════════════════════════════════════════════

TEST(CsvReader, CommaDelimited)
{
    auto t = parse_csv_text("FSC-A,SSC-A\n1,2\n3,4\n");
    EXPECT_TRUE(t.error.empty());
    EXPECT_EQ(t.delimiter, ',');
    EXPECT_EQ(t.headers, (std::vector<std::string>{"FSC-A", "SSC-A"}));
    ASSERT_EQ(t.rows.size(), 2u);
    EXPECT_EQ(t.rows[1][1], "4");
}

TEST(CsvReader, TabAndSemicolonDetected)
{
    EXPECT_EQ(parse_csv_text("a\tb\tc\n1\t2\t3\n").delimiter, '\t');
    EXPECT_EQ(parse_csv_text("a;b;c\n1;2;3\n").delimiter, ';');
}

TEST(CsvReader, QuotedFieldsAndEscapedQuotes)
{
    auto t = parse_csv_text("name,note\n\"CD4, helper\",\"say \"\"hi\"\"\"\n");
    ASSERT_EQ(t.rows.size(), 1u);
    EXPECT_EQ(t.rows[0][0], "CD4, helper");
    EXPECT_EQ(t.rows[0][1], "say \"hi\"");
}

TEST(CsvReader, CrlfAndBlankLines)
{
    auto t = parse_csv_text("a,b\r\n1,2\r\n\r\n3,4\r\n");
    ASSERT_EQ(t.rows.size(), 2u);
    EXPECT_EQ(t.rows[1][0], "3");
}

TEST(CsvReader, ShortRowsPadded)
{
    auto t = parse_csv_text("a,b,c\n1\n");
    ASSERT_EQ(t.rows.size(), 1u);
    EXPECT_EQ(t.rows[0].size(), 3u);
    EXPECT_EQ(t.rows[0][2], "");
}

TEST(CsvReader, HeaderPrefixSkipsPreamble)
{
    auto t = parse_csv_text("Sort report\nPlate: 1\n\nWell,FSC-A\nA1,5\n", "Well,");
    EXPECT_EQ(t.preamble_lines, 3u);
    EXPECT_EQ(t.headers[0], "Well");
    ASSERT_EQ(t.rows.size(), 1u);
}

TEST(CsvReader, HeaderPrefixFallsBackToFirstLine)
{
    auto t = parse_csv_text("FSC-A,SSC-A\n1,2\n", "Well,");
    EXPECT_EQ(t.preamble_lines, 0u);
    EXPECT_EQ(t.headers[0], "FSC-A");
}

TEST(CsvReader, EmptyTextReportsError)
{
    EXPECT_FALSE(parse_csv_text("").error.empty());
    EXPECT_FALSE(parse_csv_text("  \n\n").error.empty());
}

TEST(CsvReader, StrictNumericParse)
{
    double v = 0.0;
    EXPECT_TRUE(try_parse_double("-12.5", v));
    EXPECT_DOUBLE_EQ(v, -12.5);
    EXPECT_TRUE(try_parse_double("1e3 ", v));
    EXPECT_DOUBLE_EQ(v, 1000.0);
    EXPECT_FALSE(try_parse_double("12abc", v));
    EXPECT_FALSE(try_parse_double("", v));
    EXPECT_FALSE(try_parse_double("A1", v));
}

TEST(CsvReader, MissingFileReportsError)
{
    auto t = read_csv_file("/nonexistent/facsforge/none.csv");
    EXPECT_FALSE(t.error.empty());
}

// ═══════════════════════════════════════════════════════════════════════════
// Event loading
// ═══════════════════════════════════════════════════════════════════════════

TEST(LoadEventsCsv, LoadsNumericTable)
{
    auto path = write_temp("events_ok.csv", "FSC-A,SSC-A,CD4\n1,2,-3.5\n4,5,6\n");
    auto m = load_events_csv(path);
    EXPECT_EQ(m.rows(), 2u);
    EXPECT_EQ(m.channel_count(), 3u);
    EXPECT_DOUBLE_EQ(m.column("CD4")[0], -3.5);
    std::filesystem::remove(path);
}

TEST(LoadEventsCsv, NonNumericCellIsIoError)
{
    auto path = write_temp("events_bad.csv", "FSC-A,SSC-A\n1,two\n");
    try
    {
        load_events_csv(path);
        FAIL() << "expected IoError";
    }
    catch (const IoError& e)
    {
        EXPECT_NE(std::string(e.what()).find("SSC-A"), std::string::npos);
    }
    std::filesystem::remove(path);
}

TEST(LoadEventsCsv, DuplicateHeaderIsIoError)
{
    auto path = write_temp("events_dup.csv", "A,A\n1,2\n");
    EXPECT_THROW(load_events_csv(path), IoError);
    std::filesystem::remove(path);
}

TEST(LoadEventsCsv, MissingFileIsIoError)
{
    EXPECT_THROW(load_events_csv("/nonexistent/facsforge/events.csv"), IoError);
}

}   // namespace
}   // namespace facsforge
