#ifndef LOG_RECORD_HPP
#define LOG_RECORD_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Untyped table as it arrives from the upload: one header row plus cells
struct RawTable {
  std::vector<std::string> header;
  std::vector<std::vector<std::string>> rows;
  // 1-based line of each row in the source, for rejection reports
  std::vector<size_t> row_line_numbers;
};

struct LogRecord {
  std::string address;
  int64_t timestamp_ms = 0;
  std::string endpoint;
  int status = 0;

  // Row in the source table this record was built from
  size_t source_row = 0;
};

enum class ParseErrorKind { TIMESTAMP, STATUS, ADDRESS, ENDPOINT, COLUMN_COUNT };

constexpr size_t PARSE_ERROR_KIND_COUNT = 5;

const char *parse_error_kind_to_string(ParseErrorKind kind);

// Row-level rejection. Never thrown: the row is dropped and counted.
struct ParseError {
  size_t row_number = 0;
  ParseErrorKind kind = ParseErrorKind::TIMESTAMP;
  std::string detail;
};

namespace Records {

// HTTP-style status in [100, 599]; "200.0" is accepted, "200.5" is not
std::optional<int> parse_status_code(std::string_view field);

// Reduces "GET /index.html HTTP/1.1" to "/index.html"; other values are
// returned trimmed
std::string normalize_endpoint(std::string_view field);

} // namespace Records

#endif // LOG_RECORD_HPP
