#include "log_record.hpp"
#include "utils/utils.hpp"

#include <cmath>
#include <optional>
#include <string>
#include <string_view>

const char *parse_error_kind_to_string(ParseErrorKind kind) {
  switch (kind) {
  case ParseErrorKind::TIMESTAMP:
    return "timestamp";
  case ParseErrorKind::STATUS:
    return "status";
  case ParseErrorKind::ADDRESS:
    return "address";
  case ParseErrorKind::ENDPOINT:
    return "endpoint";
  case ParseErrorKind::COLUMN_COUNT:
    return "column_count";
  }
  return "unknown";
}

namespace Records {

namespace {

bool is_http_method(std::string_view token) {
  static const std::string_view methods[] = {
      "GET", "POST", "PUT", "DELETE", "HEAD", "OPTIONS", "PATCH", "CONNECT",
      "TRACE"};
  for (auto method : methods)
    if (token == method)
      return true;
  return false;
}

} // namespace

std::optional<int> parse_status_code(std::string_view field) {
  std::string trimmed = Utils::trim_copy(field);
  if (trimmed.empty() || trimmed == "-")
    return std::nullopt;

  std::optional<int> status = Utils::string_to_number<int>(trimmed);
  if (!status) {
    auto as_double = Utils::string_to_number<double>(trimmed);
    if (!as_double || !std::isfinite(*as_double) ||
        std::floor(*as_double) != *as_double)
      return std::nullopt;
    if (*as_double < 100.0 || *as_double > 599.0)
      return std::nullopt;
    status = static_cast<int>(*as_double);
  }

  if (*status < 100 || *status > 599)
    return std::nullopt;
  return status;
}

std::string normalize_endpoint(std::string_view field) {
  std::string trimmed = Utils::trim_copy(field);

  // Find the first space for the method
  size_t method_end = trimmed.find(' ');
  if (method_end == std::string::npos ||
      !is_http_method(std::string_view(trimmed).substr(0, method_end)))
    return trimmed;

  // Find the last space for the protocol
  size_t protocol_start = trimmed.rfind(' ');
  std::string path;
  if (protocol_start == method_end ||
      trimmed.compare(protocol_start + 1, 5, "HTTP/") != 0)
    path = trimmed.substr(method_end + 1);
  else
    path = trimmed.substr(method_end + 1, protocol_start - (method_end + 1));

  Utils::trim_inplace(path);
  if (path.empty())
    path = "/";
  return path;
}

} // namespace Records
