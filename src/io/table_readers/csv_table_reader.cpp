#include "csv_table_reader.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <fstream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

CsvTableReader::CsvTableReader(char delimiter) : delimiter_(delimiter) {}

RawTable CsvTableReader::read_file(const std::string &filepath) const {
  std::ifstream in(filepath, std::ios::binary);
  if (!in.is_open()) {
    LOG(LogLevel::ERROR, LogComponent::IO_READER,
        "Failed to open input table: " << filepath);
    throw TableReadError("Failed to open input table: " + filepath);
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();
  LOG(LogLevel::INFO, LogComponent::IO_READER,
      "Successfully opened input table: " << filepath);
  return read_string(buffer.str());
}

RawTable CsvTableReader::read_string(std::string_view text) const {
  // UTF-8 byte order mark
  if (text.size() >= 3 && text.substr(0, 3) == "\xEF\xBB\xBF")
    text.remove_prefix(3);

  RawTable table;
  std::vector<std::string> row;
  std::string field;
  bool in_quotes = false;
  bool field_was_quoted = false;
  size_t line_number = 1;
  size_t row_start_line = 1;

  auto finish_row = [&]() {
    row.push_back(std::move(field));
    field.clear();

    bool blank = row.size() == 1 && row[0].empty() && !field_was_quoted;
    field_was_quoted = false;
    if (blank) {
      row.clear();
      return;
    }

    if (table.header.empty()) {
      for (auto &cell : row)
        table.header.push_back(Utils::trim_copy(cell));
    } else {
      table.rows.push_back(std::move(row));
      table.row_line_numbers.push_back(row_start_line);
    }
    row.clear();
  };

  for (size_t i = 0; i < text.size(); i++) {
    char c = text[i];

    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < text.size() && text[i + 1] == '"') {
          field.push_back('"');
          i++;
        } else {
          in_quotes = false;
        }
      } else {
        if (c == '\n')
          line_number++;
        field.push_back(c);
      }
      continue;
    }

    if (c == '"' && field.empty()) {
      in_quotes = true;
      field_was_quoted = true;
    } else if (c == delimiter_) {
      row.push_back(std::move(field));
      field.clear();
    } else if (c == '\r') {
      // CRLF line endings, a lone CR is dropped
      continue;
    } else if (c == '\n') {
      finish_row();
      line_number++;
      row_start_line = line_number;
    } else {
      field.push_back(c);
    }
  }

  if (in_quotes)
    LOG(LogLevel::WARN, LogComponent::IO_READER,
        "Unterminated quoted field starting on line " << row_start_line
                                                      << ", closing at EOF");

  if (!field.empty() || !row.empty() || field_was_quoted)
    finish_row();

  if (table.header.empty())
    throw TableReadError("Input table has no header row");

  LOG(LogLevel::DEBUG, LogComponent::IO_READER,
      "Read table with " << table.header.size() << " columns and "
                         << table.rows.size() << " rows");
  return table;
}
