#include "analysis/schema_normalizer.hpp"
#include "core/errors.hpp"
#include "core/log_record.hpp"

#include <gtest/gtest.h>

namespace {
RawTable make_table(std::vector<std::string> header,
                    std::vector<std::vector<std::string>> rows) {
  RawTable table;
  table.header = std::move(header);
  for (size_t i = 0; i < rows.size(); i++)
    table.row_line_numbers.push_back(i + 2);
  table.rows = std::move(rows);
  return table;
}
} // namespace

TEST(SchemaNormalizerTest, ResolvesAliasesCaseInsensitively) {
  SchemaNormalizer normalizer;
  ColumnMapping mapping =
      normalizer.resolve_columns({"Time", "URL", " IP ", "Staus", "agent"});

  EXPECT_EQ(mapping.timestamp, 0u);
  EXPECT_EQ(mapping.endpoint, 1u);
  EXPECT_EQ(mapping.address, 2u);
  EXPECT_EQ(mapping.status, 3u);
}

TEST(SchemaNormalizerTest, EarlierAliasWins) {
  SchemaNormalizer normalizer;
  // "address" is listed before "client_ip"
  ColumnMapping mapping = normalizer.resolve_columns(
      {"client_ip", "address", "timestamp", "path", "status"});
  EXPECT_EQ(mapping.address, 1u);
}

TEST(SchemaNormalizerTest, MissingStatusHeaderFailsTheBatch) {
  SchemaNormalizer normalizer;
  RawTable table = make_table({"ip", "timestamp", "url", "agent"},
                              {{"1.2.3.4", "1672574401", "/", "curl"}});
  try {
    normalizer.normalize(table);
    FAIL() << "Expected SchemaValidationError";
  } catch (const SchemaValidationError &e) {
    EXPECT_EQ(e.missing_field(), "status");
    EXPECT_STREQ(e.kind(), "schema_validation");
  }
}

TEST(SchemaNormalizerTest, NoFuzzyMatching) {
  SchemaNormalizer normalizer;
  EXPECT_THROW(normalizer.resolve_columns(
                   {"ip_addr", "timestamp", "url", "status"}),
               SchemaValidationError);
}

TEST(SchemaNormalizerTest, ProducesTypedRecords) {
  SchemaNormalizer normalizer;
  RawTable table = make_table(
      {"source_ip", "datetime", "request", "response_code"},
      {{"10.0.0.1", "01/Jan/2023:12:00:01 +0000", "GET /login HTTP/1.1", "401"},
       {"10.0.0.2", "2023-01-01T12:00:02Z", "/home", "200.0"}});

  NormalizedBatch batch = normalizer.normalize(table);
  ASSERT_EQ(batch.records.size(), 2u);
  EXPECT_TRUE(batch.rejected_rows.empty());
  EXPECT_EQ(batch.rows_read, 2u);

  const LogRecord &first = batch.records[0];
  EXPECT_EQ(first.address, "10.0.0.1");
  EXPECT_EQ(first.timestamp_ms, 1672574401000);
  EXPECT_EQ(first.endpoint, "/login");
  EXPECT_EQ(first.status, 401);
  EXPECT_EQ(first.source_row, 2u);

  EXPECT_EQ(batch.records[1].status, 200);
  EXPECT_EQ(batch.records[1].endpoint, "/home");
}

TEST(SchemaNormalizerTest, DropsMalformedRowsAndCountsThem) {
  SchemaNormalizer normalizer;
  RawTable table = make_table(
      {"ip", "timestamp", "url", "status"},
      {{"10.0.0.1", "1672574401", "/ok", "200"},
       {"10.0.0.1", "not-a-time", "/x", "200"},
       {"10.0.0.1", "1672574401", "/x", "abc"},
       {"10.0.0.1", "1672574401", "/x", "999"},
       {"", "1672574401", "/x", "200"},
       {"10.0.0.1", "1672574401", "  ", "200"},
       {"10.0.0.1", "1672574401", "/x"},
       {"10.0.0.1", "-5", "/x", "200"}});

  NormalizedBatch batch = normalizer.normalize(table);
  ASSERT_EQ(batch.records.size(), 1u);
  EXPECT_EQ(batch.rows_read, 8u);
  ASSERT_EQ(batch.rejected_rows.size(), 7u);

  EXPECT_EQ(batch.rejected_rows[0].kind, ParseErrorKind::TIMESTAMP);
  EXPECT_EQ(batch.rejected_rows[0].row_number, 3u);
  EXPECT_EQ(batch.rejected_rows[1].kind, ParseErrorKind::STATUS);
  EXPECT_EQ(batch.rejected_rows[2].kind, ParseErrorKind::STATUS);
  EXPECT_EQ(batch.rejected_rows[3].kind, ParseErrorKind::ADDRESS);
  EXPECT_EQ(batch.rejected_rows[4].kind, ParseErrorKind::ENDPOINT);
  EXPECT_EQ(batch.rejected_rows[5].kind, ParseErrorKind::COLUMN_COUNT);
  EXPECT_EQ(batch.rejected_rows[6].kind, ParseErrorKind::TIMESTAMP);
}

TEST(LogRecordTest, StatusCodeParsing) {
  EXPECT_EQ(Records::parse_status_code("200"), 200);
  EXPECT_EQ(Records::parse_status_code(" 404 "), 404);
  EXPECT_EQ(Records::parse_status_code("503.0"), 503);
  EXPECT_FALSE(Records::parse_status_code("200.5").has_value());
  EXPECT_FALSE(Records::parse_status_code("99").has_value());
  EXPECT_FALSE(Records::parse_status_code("600").has_value());
  EXPECT_FALSE(Records::parse_status_code("-").has_value());
}

TEST(LogRecordTest, EndpointNormalization) {
  EXPECT_EQ(Records::normalize_endpoint("GET /index.html HTTP/1.1"),
            "/index.html");
  EXPECT_EQ(Records::normalize_endpoint("POST /api/login"), "/api/login");
  EXPECT_EQ(Records::normalize_endpoint("  /plain/path "), "/plain/path");
  EXPECT_EQ(Records::normalize_endpoint("FETCH /x"), "FETCH /x");
}
