#include "schema_normalizer.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <optional>
#include <sstream>
#include <string>
#include <vector>

const char *canonical_field_to_string(CanonicalField field) {
  switch (field) {
  case CanonicalField::ADDRESS:
    return "address";
  case CanonicalField::TIMESTAMP:
    return "timestamp";
  case CanonicalField::ENDPOINT:
    return "endpoint";
  case CanonicalField::STATUS:
    return "status";
  }
  return "unknown";
}

const SchemaNormalizer::AliasTable &SchemaNormalizer::alias_table() {
  // The first alias present in the header wins
  static const AliasTable table = {{
      {CanonicalField::ADDRESS,
       {"address", "ip", "ip_address", "source_ip", "client_ip",
        "remote_addr"}},
      {CanonicalField::TIMESTAMP, {"timestamp", "time", "datetime", "event_time"}},
      {CanonicalField::ENDPOINT, {"endpoint", "url", "uri", "path", "request"}},
      {CanonicalField::STATUS,
       {"status", "staus", "status_code", "response_code"}},
  }};
  return table;
}

ColumnMapping
SchemaNormalizer::resolve_columns(const std::vector<std::string> &header) const {
  std::vector<std::string> normalized;
  normalized.reserve(header.size());
  for (const auto &name : header)
    normalized.push_back(Utils::to_lower_copy(Utils::trim_copy(name)));

  auto find_column = [&](const std::vector<std::string> &aliases)
      -> std::optional<size_t> {
    for (const auto &alias : aliases)
      for (size_t i = 0; i < normalized.size(); i++)
        if (normalized[i] == alias)
          return i;
    return std::nullopt;
  };

  ColumnMapping mapping;
  for (const auto &[field, aliases] : alias_table()) {
    auto column = find_column(aliases);
    if (!column) {
      std::ostringstream summary;
      for (size_t i = 0; i < header.size(); i++)
        summary << (i ? ", " : "") << header[i];
      LOG(LogLevel::WARN, LogComponent::SCHEMA,
          "No header matches canonical field '"
              << canonical_field_to_string(field) << "'");
      throw SchemaValidationError(canonical_field_to_string(field),
                                  summary.str());
    }

    LOG(LogLevel::DEBUG, LogComponent::SCHEMA,
        "Resolved '" << canonical_field_to_string(field) << "' to column "
                     << *column << " ('" << header[*column] << "')");

    switch (field) {
    case CanonicalField::ADDRESS:
      mapping.address = *column;
      break;
    case CanonicalField::TIMESTAMP:
      mapping.timestamp = *column;
      break;
    case CanonicalField::ENDPOINT:
      mapping.endpoint = *column;
      break;
    case CanonicalField::STATUS:
      mapping.status = *column;
      break;
    }
  }
  return mapping;
}

NormalizedBatch SchemaNormalizer::normalize(const RawTable &table) const {
  NormalizedBatch batch;
  batch.mapping = resolve_columns(table.header);
  batch.rows_read = table.rows.size();
  batch.records.reserve(table.rows.size());

  const auto &mapping = batch.mapping;
  for (size_t i = 0; i < table.rows.size(); i++) {
    const auto &row = table.rows[i];
    size_t row_number =
        i < table.row_line_numbers.size() ? table.row_line_numbers[i] : i + 2;

    auto reject = [&](ParseErrorKind kind, std::string detail) {
      LOG(LogLevel::DEBUG, LogComponent::SCHEMA,
          "Dropping row " << row_number << " ("
                          << parse_error_kind_to_string(kind)
                          << "): " << detail);
      batch.rejected_rows.push_back({row_number, kind, std::move(detail)});
    };

    if (row.size() != table.header.size()) {
      reject(ParseErrorKind::COLUMN_COUNT,
             "expected " + std::to_string(table.header.size()) +
                 " cells, found " + std::to_string(row.size()));
      continue;
    }

    LogRecord record;
    record.source_row = row_number;

    record.address = Utils::trim_copy(row[mapping.address]);
    if (record.address.empty()) {
      reject(ParseErrorKind::ADDRESS, "empty address");
      continue;
    }

    auto timestamp = Utils::parse_timestamp_ms(row[mapping.timestamp]);
    if (!timestamp) {
      reject(ParseErrorKind::TIMESTAMP,
             "unparsable timestamp '" + row[mapping.timestamp] + "'");
      continue;
    }
    if (*timestamp < 0) {
      reject(ParseErrorKind::TIMESTAMP,
             "timestamp before epoch '" + row[mapping.timestamp] + "'");
      continue;
    }
    record.timestamp_ms = *timestamp;

    record.endpoint = Records::normalize_endpoint(row[mapping.endpoint]);
    if (record.endpoint.empty()) {
      reject(ParseErrorKind::ENDPOINT, "empty endpoint");
      continue;
    }

    auto status = Records::parse_status_code(row[mapping.status]);
    if (!status) {
      reject(ParseErrorKind::STATUS,
             "invalid status '" + row[mapping.status] + "'");
      continue;
    }
    record.status = *status;

    batch.records.push_back(std::move(record));
  }

  if (!batch.rejected_rows.empty())
    LOG(LogLevel::WARN, LogComponent::SCHEMA,
        "Dropped " << batch.rejected_rows.size() << " of " << batch.rows_read
                   << " rows during normalization");
  LOG(LogLevel::INFO, LogComponent::SCHEMA,
      "Normalized " << batch.records.size() << " records");
  return batch;
}
