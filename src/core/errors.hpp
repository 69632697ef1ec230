#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

// Base for every failure that aborts a whole batch
class LogRiskError : public std::runtime_error {
public:
  explicit LogRiskError(const std::string &message)
      : std::runtime_error(message) {}

  virtual const char *kind() const noexcept = 0;
};

// A required canonical column could not be matched to any header
class SchemaValidationError : public LogRiskError {
public:
  SchemaValidationError(const std::string &missing_field,
                        const std::string &header_summary)
      : LogRiskError("Required field '" + missing_field +
                     "' could not be resolved from headers [" +
                     header_summary + "]"),
        missing_field_(missing_field) {}

  const char *kind() const noexcept override { return "schema_validation"; }
  const std::string &missing_field() const { return missing_field_; }

private:
  std::string missing_field_;
};

// Nothing survived normalization, so there is no batch to score
class EmptyBatchError : public LogRiskError {
public:
  EmptyBatchError(size_t rows_read, size_t rows_dropped)
      : LogRiskError("No valid records after normalization (" +
                     std::to_string(rows_read) + " rows read, " +
                     std::to_string(rows_dropped) + " dropped)"),
        rows_read_(rows_read), rows_dropped_(rows_dropped) {}

  const char *kind() const noexcept override { return "empty_batch"; }
  size_t rows_read() const { return rows_read_; }
  size_t rows_dropped() const { return rows_dropped_; }

private:
  size_t rows_read_;
  size_t rows_dropped_;
};

// The input table itself is unreadable or has no header
class TableReadError : public LogRiskError {
public:
  explicit TableReadError(const std::string &message)
      : LogRiskError(message) {}

  const char *kind() const noexcept override { return "table_read"; }
};

#endif // ERRORS_HPP
