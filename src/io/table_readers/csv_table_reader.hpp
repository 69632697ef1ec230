#ifndef CSV_TABLE_READER_HPP
#define CSV_TABLE_READER_HPP

#include "core/log_record.hpp"

#include <string>
#include <string_view>

// Reads a delimited table (header + rows) with RFC 4180 quoting. Rows are
// kept exactly as read; cell-count checks belong to the schema normalizer.
class CsvTableReader {
public:
  explicit CsvTableReader(char delimiter = ',');

  // Throws TableReadError when the file cannot be opened or has no header
  RawTable read_file(const std::string &filepath) const;
  RawTable read_string(std::string_view text) const;

private:
  char delimiter_;
};

#endif // CSV_TABLE_READER_HPP
