#include "core/errors.hpp"
#include "io/table_readers/csv_table_reader.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

TEST(CsvTableReaderTest, ReadsHeaderAndRows) {
  CsvTableReader reader;
  RawTable table = reader.read_string(
      "ip,timestamp,url,status\n"
      "10.0.0.1,2023-01-01T00:00:00Z,/login,200\n"
      "10.0.0.2,2023-01-01T00:00:05Z,/admin,403\n");

  ASSERT_EQ(table.header.size(), 4u);
  EXPECT_EQ(table.header[0], "ip");
  EXPECT_EQ(table.header[3], "status");
  ASSERT_EQ(table.rows.size(), 2u);
  EXPECT_EQ(table.rows[1][2], "/admin");
  EXPECT_EQ(table.row_line_numbers[0], 2u);
  EXPECT_EQ(table.row_line_numbers[1], 3u);
}

TEST(CsvTableReaderTest, HandlesQuotedFieldsAndEscapedQuotes) {
  CsvTableReader reader;
  RawTable table = reader.read_string(
      "ip,request,agent\n"
      "10.0.0.1,\"GET /a,b HTTP/1.1\",\"say \"\"hi\"\"\"\n");

  ASSERT_EQ(table.rows.size(), 1u);
  ASSERT_EQ(table.rows[0].size(), 3u);
  EXPECT_EQ(table.rows[0][1], "GET /a,b HTTP/1.1");
  EXPECT_EQ(table.rows[0][2], "say \"hi\"");
}

TEST(CsvTableReaderTest, QuotedNewlineStaysInsideField) {
  CsvTableReader reader;
  RawTable table = reader.read_string("a,b\n\"line1\nline2\",x\ny,z\n");

  ASSERT_EQ(table.rows.size(), 2u);
  EXPECT_EQ(table.rows[0][0], "line1\nline2");
  EXPECT_EQ(table.row_line_numbers[0], 2u);
  // The quoted newline consumed a physical line
  EXPECT_EQ(table.row_line_numbers[1], 4u);
}

TEST(CsvTableReaderTest, StripsBomCarriageReturnsAndBlankLines) {
  CsvTableReader reader;
  RawTable table = reader.read_string(
      "\xEF\xBB\xBF Address , Status \r\n\r\n1.2.3.4,200\r\n\n5.6.7.8,500");

  ASSERT_EQ(table.header.size(), 2u);
  EXPECT_EQ(table.header[0], "Address");
  EXPECT_EQ(table.header[1], "Status");
  ASSERT_EQ(table.rows.size(), 2u);
  EXPECT_EQ(table.rows[0][1], "200");
  // Last line has no trailing newline
  EXPECT_EQ(table.rows[1][1], "500");
}

TEST(CsvTableReaderTest, KeepsShortRowsForLaterValidation) {
  CsvTableReader reader;
  RawTable table = reader.read_string("a,b,c\n1,2\n1,2,3,4\n");

  ASSERT_EQ(table.rows.size(), 2u);
  EXPECT_EQ(table.rows[0].size(), 2u);
  EXPECT_EQ(table.rows[1].size(), 4u);
}

TEST(CsvTableReaderTest, CustomDelimiter) {
  CsvTableReader reader('\t');
  RawTable table = reader.read_string("ip\tstatus\n1.2.3.4\t404\n");

  ASSERT_EQ(table.header.size(), 2u);
  ASSERT_EQ(table.rows.size(), 1u);
  EXPECT_EQ(table.rows[0][1], "404");
}

TEST(CsvTableReaderTest, EmptyInputHasNoHeader) {
  CsvTableReader reader;
  EXPECT_THROW(reader.read_string(""), TableReadError);
  EXPECT_THROW(reader.read_string("\n\n"), TableReadError);
}

TEST(CsvTableReaderTest, MissingFileThrows) {
  CsvTableReader reader;
  auto path = std::filesystem::temp_directory_path() / "logrisk_no_such.csv";
  EXPECT_THROW(reader.read_file(path.string()), TableReadError);
}

TEST(CsvTableReaderTest, ReadsFromFile) {
  auto path = std::filesystem::temp_directory_path() / "logrisk_reader.csv";
  {
    std::ofstream out(path);
    out << "ip,status\n1.2.3.4,200\n";
  }

  CsvTableReader reader;
  RawTable table = reader.read_file(path.string());
  std::filesystem::remove(path);

  ASSERT_EQ(table.rows.size(), 1u);
  EXPECT_EQ(table.rows[0][0], "1.2.3.4");
}
