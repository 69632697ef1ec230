#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

namespace Utils {
std::vector<std::string_view> split_string_view(std::string_view str,
                                                char delimiter);

// Expected format: 23/May/2025:00:00:35 +0530, optionally wrapped in [...]
std::optional<int64_t> convert_log_time_to_ms(std::string_view log_time_str);

// 2023-01-01, 2023-01-01 10:00:00, 2023-01-01T10:00:00.250+02:00 ...
std::optional<int64_t> convert_iso_time_to_ms(std::string_view iso_time_str);

// Tries every supported timestamp layout, including epoch seconds
std::optional<int64_t> parse_timestamp_ms(std::string_view time_str);

std::string format_iso8601_ms(int64_t epoch_ms);

template <typename T> std::optional<T> string_to_number(std::string_view s) {
  if (s.empty())
    return std::nullopt;

  T value;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);

  if (ec == std::errc() && ptr == s.data() + s.size())
    return value;
  return std::nullopt;
}

inline void ltrim_inplace(std::string &s) {
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) {
            return !std::isspace(ch);
          }));
}

inline void rtrim_inplace(std::string &s) {
  s.erase(std::find_if(s.rbegin(), s.rend(),
                       [](unsigned char ch) { return !std::isspace(ch); })
              .base(),
          s.end());
}

inline void trim_inplace(std::string &s) {
  ltrim_inplace(s);
  rtrim_inplace(s);
}

inline std::string trim_copy(std::string_view sv) {
  std::string s{sv};
  trim_inplace(s);
  return s;
}

inline std::string to_lower_copy(std::string_view sv) {
  std::string s{sv};
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char ch) { return std::tolower(ch); });
  return s;
}
} // namespace Utils

#endif // UTILS_HPP
