#include "utils.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace Utils {

namespace {

std::optional<int> read_fixed_int(std::string_view s, size_t &pos,
                                  size_t digits) {
  if (pos + digits > s.size())
    return std::nullopt;
  int value = 0;
  for (size_t i = 0; i < digits; i++) {
    char c = s[pos + i];
    if (c < '0' || c > '9')
      return std::nullopt;
    value = value * 10 + (c - '0');
  }
  pos += digits;
  return value;
}

bool is_leap_year(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
  static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && is_leap_year(year))
    return 29;
  return days[month - 1];
}

std::optional<int64_t> to_epoch_ms(int year, int month, int day, int hour,
                                   int minute, int second, int millis,
                                   int tz_offset_seconds) {
  if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month))
    return std::nullopt;
  if (hour > 23 || minute > 59 || second > 60)
    return std::nullopt;

  std::tm t{};
  t.tm_year = year - 1900;
  t.tm_mon = month - 1;
  t.tm_mday = day;
  t.tm_hour = hour;
  t.tm_min = minute;
  t.tm_sec = second;

  // timegm treats the struct as UTC, the offset is applied afterwards
  std::time_t epoch_seconds = timegm(&t);
  epoch_seconds -= tz_offset_seconds;

  return static_cast<int64_t>(epoch_seconds) * 1000 + millis;
}

std::string_view strip_brackets(std::string_view s) {
  if (s.size() >= 2 && s.front() == '[' && s.back() == ']')
    return s.substr(1, s.size() - 2);
  return s;
}

} // namespace

std::vector<std::string_view> split_string_view(std::string_view str,
                                                char delimiter) {
  std::vector<std::string_view> result;
  size_t start = 0;
  size_t end = str.find(delimiter);
  while (end != std::string_view::npos) {
    result.push_back(str.substr(start, end - start));
    start = end + 1;
    end = str.find(delimiter, start);
  }
  result.push_back(str.substr(start));
  return result;
}

std::optional<int64_t> convert_log_time_to_ms(std::string_view log_time_str) {
  std::string trimmed = trim_copy(log_time_str);
  std::string_view s = strip_brackets(trimmed);
  if (s.empty() || s == "-")
    return std::nullopt;

  size_t pos = 0;

  // Day
  size_t slash = s.find('/');
  if (slash == std::string_view::npos || slash == 0 || slash > 2)
    return std::nullopt;
  auto day = read_fixed_int(s, pos, slash);
  if (!day || s[pos] != '/')
    return std::nullopt;
  pos++;

  // Month
  static const std::unordered_map<std::string_view, int> month_map = {
      {"Jan", 1}, {"Feb", 2}, {"Mar", 3}, {"Apr", 4},  {"May", 5},  {"Jun", 6},
      {"Jul", 7}, {"Aug", 8}, {"Sep", 9}, {"Oct", 10}, {"Nov", 11}, {"Dec", 12}};
  if (pos + 4 > s.size())
    return std::nullopt;
  auto it = month_map.find(s.substr(pos, 3));
  if (it == month_map.end())
    return std::nullopt;
  pos += 3;
  if (s[pos] != '/')
    return std::nullopt;
  pos++;

  // Year, hour, minute, second
  auto year = read_fixed_int(s, pos, 4);
  if (!year || pos >= s.size() || s[pos++] != ':')
    return std::nullopt;
  auto hour = read_fixed_int(s, pos, 2);
  if (!hour || pos >= s.size() || s[pos++] != ':')
    return std::nullopt;
  auto minute = read_fixed_int(s, pos, 2);
  if (!minute || pos >= s.size() || s[pos++] != ':')
    return std::nullopt;
  auto second = read_fixed_int(s, pos, 2);
  if (!second)
    return std::nullopt;

  // Timezone
  if (pos >= s.size() || s[pos++] != ' ')
    return std::nullopt;
  if (pos >= s.size() || (s[pos] != '+' && s[pos] != '-'))
    return std::nullopt;
  char tz_sign = s[pos++];
  auto tz_hour = read_fixed_int(s, pos, 2);
  auto tz_min = read_fixed_int(s, pos, 2);
  if (!tz_hour || !tz_min || pos != s.size())
    return std::nullopt;

  int tz_offset_seconds = (*tz_hour * 3600) + (*tz_min * 60);
  if (tz_sign == '-')
    tz_offset_seconds = -tz_offset_seconds;

  return to_epoch_ms(*year, it->second, *day, *hour, *minute, *second, 0,
                     tz_offset_seconds);
}

std::optional<int64_t> convert_iso_time_to_ms(std::string_view iso_time_str) {
  std::string trimmed = trim_copy(iso_time_str);
  std::string_view s = trimmed;
  size_t pos = 0;

  auto year = read_fixed_int(s, pos, 4);
  if (!year || pos >= s.size() || s[pos++] != '-')
    return std::nullopt;
  auto month = read_fixed_int(s, pos, 2);
  if (!month || pos >= s.size() || s[pos++] != '-')
    return std::nullopt;
  auto day = read_fixed_int(s, pos, 2);
  if (!day)
    return std::nullopt;

  if (pos == s.size())
    return to_epoch_ms(*year, *month, *day, 0, 0, 0, 0, 0);

  if (s[pos] != ' ' && s[pos] != 'T')
    return std::nullopt;
  pos++;

  auto hour = read_fixed_int(s, pos, 2);
  if (!hour || pos >= s.size() || s[pos++] != ':')
    return std::nullopt;
  auto minute = read_fixed_int(s, pos, 2);
  if (!minute)
    return std::nullopt;

  int second = 0;
  if (pos < s.size() && s[pos] == ':') {
    pos++;
    auto sec = read_fixed_int(s, pos, 2);
    if (!sec)
      return std::nullopt;
    second = *sec;
  }

  int millis = 0;
  if (pos < s.size() && s[pos] == '.') {
    pos++;
    size_t digits = 0;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
      if (digits < 3)
        millis = millis * 10 + (s[pos] - '0');
      digits++;
      pos++;
    }
    if (digits == 0)
      return std::nullopt;
    for (size_t i = digits; i < 3; i++)
      millis *= 10;
  }

  int tz_offset_seconds = 0;
  if (pos < s.size()) {
    if (s[pos] == 'Z' || s[pos] == 'z') {
      pos++;
    } else if (s[pos] == '+' || s[pos] == '-') {
      char tz_sign = s[pos++];
      auto tz_hour = read_fixed_int(s, pos, 2);
      if (!tz_hour)
        return std::nullopt;
      if (pos < s.size() && s[pos] == ':')
        pos++;
      auto tz_min = read_fixed_int(s, pos, 2);
      if (!tz_min)
        return std::nullopt;
      tz_offset_seconds = (*tz_hour * 3600) + (*tz_min * 60);
      if (tz_sign == '-')
        tz_offset_seconds = -tz_offset_seconds;
    }
  }
  if (pos != s.size())
    return std::nullopt;

  return to_epoch_ms(*year, *month, *day, *hour, *minute, second, millis,
                     tz_offset_seconds);
}

std::optional<int64_t> parse_timestamp_ms(std::string_view time_str) {
  std::string trimmed = trim_copy(time_str);
  std::string_view s = strip_brackets(trimmed);
  if (s.empty() || s == "-")
    return std::nullopt;

  if (s.find('/') != std::string_view::npos)
    return convert_log_time_to_ms(s);

  if (s.size() >= 10 && s[4] == '-')
    return convert_iso_time_to_ms(s);

  // Plain epoch seconds, possibly fractional
  auto seconds = string_to_number<double>(s);
  if (!seconds || !std::isfinite(*seconds))
    return std::nullopt;
  return static_cast<int64_t>(std::llround(*seconds * 1000.0));
}

std::string format_iso8601_ms(int64_t epoch_ms) {
  int64_t seconds = epoch_ms / 1000;
  if (epoch_ms % 1000 < 0)
    seconds--;
  std::time_t t = static_cast<std::time_t>(seconds);
  std::tm tm_utc{};
  gmtime_r(&t, &tm_utc);

  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
  return buffer;
}

} // namespace Utils
