#ifndef SCHEMA_NORMALIZER_HPP
#define SCHEMA_NORMALIZER_HPP

#include "core/log_record.hpp"

#include <array>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

enum class CanonicalField { ADDRESS, TIMESTAMP, ENDPOINT, STATUS };

constexpr size_t CANONICAL_FIELD_COUNT = 4;

const char *canonical_field_to_string(CanonicalField field);

// Column index of every canonical field in the source header
struct ColumnMapping {
  size_t address = 0;
  size_t timestamp = 0;
  size_t endpoint = 0;
  size_t status = 0;
};

struct NormalizedBatch {
  std::vector<LogRecord> records;
  std::vector<ParseError> rejected_rows;
  size_t rows_read = 0;
  ColumnMapping mapping;
};

// Maps arbitrary header spellings onto the canonical record shape using a
// fixed alias table. There is no fuzzy matching: a header either equals one
// of the listed aliases (case-insensitively, after trimming) or it is ignored.
class SchemaNormalizer {
public:
  using AliasTable =
      std::array<std::pair<CanonicalField, std::vector<std::string>>,
                 CANONICAL_FIELD_COUNT>;

  static const AliasTable &alias_table();

  // Throws SchemaValidationError naming the first unresolved field
  ColumnMapping resolve_columns(const std::vector<std::string> &header) const;

  // Structural failures throw; malformed rows are dropped into rejected_rows
  NormalizedBatch normalize(const RawTable &table) const;
};

#endif // SCHEMA_NORMALIZER_HPP
