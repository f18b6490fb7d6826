#include "ulidgen/core/time.h"

#include <iomanip>
#include <optional>
#include <sstream>

namespace ulidgen::core {

namespace {

using ParseResult = Result<std::int64_t, std::string>;

constexpr std::int64_t kMillisPerSecond = 1000;
constexpr std::int64_t kMillisPerMinute = 60 * kMillisPerSecond;
constexpr std::int64_t kMillisPerHour = 60 * kMillisPerMinute;
constexpr std::int64_t kMillisPerDay = 24 * kMillisPerHour;

// "YYYY-MM-DDTHH:MM:SS" is the fixed-width prefix every accepted input shares.
constexpr std::size_t kFixedPrefixLength = 19;

bool is_digit(const char c) {
  return c >= '0' && c <= '9';
}

// read_fixed_digits parses exactly `count` decimal digits starting at `pos`.
std::optional<int> read_fixed_digits(std::string_view text, std::size_t pos, std::size_t count) {
  if (pos + count > text.size()) {
    return std::nullopt;
  }
  int value = 0;
  for (std::size_t i = pos; i < pos + count; ++i) {
    if (!is_digit(text[i])) {
      return std::nullopt;
    }
    value = value * 10 + (text[i] - '0');
  }
  return value;
}

}  // namespace

ParseResult parse_rfc3339_millis(std::string_view text) {
  if (text.size() <= kFixedPrefixLength) {
    return ParseResult::err("input is too short");
  }

  const auto year = read_fixed_digits(text, 0, 4);
  const auto month = read_fixed_digits(text, 5, 2);
  const auto day = read_fixed_digits(text, 8, 2);
  if (!year || !month || !day || text[4] != '-' || text[7] != '-') {
    return ParseResult::err("invalid date");
  }

  const char separator = text[10];
  if (separator != 'T' && separator != 't' && separator != ' ') {
    return ParseResult::err("expected 'T' between date and time");
  }

  const auto hour = read_fixed_digits(text, 11, 2);
  const auto minute = read_fixed_digits(text, 14, 2);
  const auto second = read_fixed_digits(text, 17, 2);
  if (!hour || !minute || !second || text[13] != ':' || text[16] != ':') {
    return ParseResult::err("invalid time");
  }
  if (*hour > 23 || *minute > 59 || *second > 59) {
    return ParseResult::err("time field out of range");
  }

  const std::chrono::year_month_day ymd{std::chrono::year{*year},
                                        std::chrono::month{static_cast<unsigned>(*month)},
                                        std::chrono::day{static_cast<unsigned>(*day)}};
  if (!ymd.ok()) {
    return ParseResult::err("date field out of range");
  }

  std::size_t pos = kFixedPrefixLength;

  // Fraction: any number of digits, truncated to milliseconds.
  std::int64_t fraction_millis = 0;
  if (text[pos] == '.') {
    ++pos;
    const std::size_t digits_start = pos;
    std::int64_t scale = 100;
    while (pos < text.size() && is_digit(text[pos])) {
      fraction_millis += (text[pos] - '0') * scale;
      scale /= 10;
      ++pos;
    }
    if (pos == digits_start) {
      return ParseResult::err("missing digits after '.'");
    }
  }

  if (pos >= text.size()) {
    return ParseResult::err("missing UTC offset");
  }

  std::int64_t offset_millis = 0;
  const char zone = text[pos];
  if (zone == 'Z' || zone == 'z') {
    ++pos;
  } else if (zone == '+' || zone == '-') {
    const auto offset_hours = read_fixed_digits(text, pos + 1, 2);
    const auto offset_minutes = read_fixed_digits(text, pos + 4, 2);
    if (!offset_hours || !offset_minutes || text[pos + 3] != ':') {
      return ParseResult::err("invalid UTC offset");
    }
    if (*offset_hours > 23 || *offset_minutes > 59) {
      return ParseResult::err("UTC offset out of range");
    }
    offset_millis = *offset_hours * kMillisPerHour + *offset_minutes * kMillisPerMinute;
    if (zone == '-') {
      offset_millis = -offset_millis;
    }
    pos += 6;
  } else {
    return ParseResult::err("invalid UTC offset");
  }

  if (pos != text.size()) {
    return ParseResult::err("trailing characters after datetime");
  }

  const std::int64_t days = std::chrono::sys_days{ymd}.time_since_epoch().count();
  const std::int64_t local_millis = days * kMillisPerDay + *hour * kMillisPerHour +
                                    *minute * kMillisPerMinute + *second * kMillisPerSecond +
                                    fraction_millis;
  return ParseResult::ok(local_millis - offset_millis);
}

std::string format_rfc3339_millis(std::int64_t unix_millis) {
  const std::chrono::sys_time<std::chrono::milliseconds> point{
      std::chrono::milliseconds{unix_millis}};
  const auto day_point = std::chrono::floor<std::chrono::days>(point);
  const std::chrono::year_month_day ymd{day_point};

  const std::int64_t millis_of_day = (point - day_point).count();
  const std::int64_t hour = millis_of_day / kMillisPerHour;
  const std::int64_t minute = (millis_of_day % kMillisPerHour) / kMillisPerMinute;
  const std::int64_t second = (millis_of_day % kMillisPerMinute) / kMillisPerSecond;
  const std::int64_t millis = millis_of_day % kMillisPerSecond;

  std::ostringstream oss;
  oss << std::setfill('0');

  // Years outside 0000..9999 use the signed ISO 8601 expanded form, e.g. +10889.
  const int year = static_cast<int>(ymd.year());
  if (year > 9999) {
    oss << '+';
  } else if (year < 0) {
    oss << '-';
  }
  oss << std::setw(4) << (year < 0 ? -year : year) << '-' << std::setw(2)
      << static_cast<unsigned>(ymd.month()) << '-' << std::setw(2)
      << static_cast<unsigned>(ymd.day()) << 'T' << std::setw(2) << hour << ':' << std::setw(2)
      << minute << ':' << std::setw(2) << second;
  if (millis != 0) {
    oss << '.' << std::setw(3) << millis;
  }
  oss << "+00:00";
  return oss.str();
}

}  // namespace ulidgen::core
