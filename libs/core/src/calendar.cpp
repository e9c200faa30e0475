/**
 * @file calendar.cpp
 * @brief Timestamp parsing and formatting.
 * @author Watosn
 */

#include "windcurtail/core/calendar.hpp"

#include <array>
#include <cctype>
#include <charconv>

#include <fmt/format.h>

namespace windcurtail::core {
namespace {

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())) != 0) {
    s.remove_prefix(1);
  }
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())) != 0) {
    s.remove_suffix(1);
  }
  return s;
}

bool parse_int(std::string_view text, int& value) {
  if (text.empty()) {
    return false;
  }
  const auto* first = text.data();
  const auto* last = text.data() + text.size();
  const auto res = std::from_chars(first, last, value);
  return res.ec == std::errc{} && res.ptr == last;
}

bool parse_unsigned(std::string_view text, unsigned& value) {
  int v = 0;
  if (!parse_int(text, v) || v < 0) {
    return false;
  }
  value = static_cast<unsigned>(v);
  return true;
}

bool valid_clock(int h, int m, int s) { return h >= 0 && h <= 23 && m >= 0 && m <= 59 && s >= 0 && s <= 59; }

// Splits "HH[:MM[:SS]]" into its fields; missing trailing fields are zero.
bool parse_clock_fields(std::string_view text, int& h, int& m, int& s) {
  h = 0;
  m = 0;
  s = 0;
  std::array<int*, 3> out{&h, &m, &s};
  std::size_t field = 0;
  while (true) {
    const auto colon = text.find(':');
    const auto token = text.substr(0, colon);
    if (field >= out.size() || !parse_int(token, *out[field])) {
      return false;
    }
    ++field;
    if (colon == std::string_view::npos) {
      break;
    }
    text.remove_prefix(colon + 1);
  }
  return true;
}

}  // namespace

std::optional<LocalTime> parse_iso_local_time(std::string_view text) {
  text = trim(text);
  if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
    return std::nullopt;
  }
  int year = 0;
  unsigned month = 0;
  unsigned day = 0;
  if (!parse_int(text.substr(0, 4), year) || !parse_unsigned(text.substr(5, 2), month) ||
      !parse_unsigned(text.substr(8, 2), day) || !is_valid_civil_date(year, month, day)) {
    return std::nullopt;
  }
  if (text.size() == 10) {
    return make_local_time(year, month, day);
  }
  if (text[10] != ' ' && text[10] != 'T') {
    return std::nullopt;
  }
  int h = 0;
  int m = 0;
  int s = 0;
  if (!parse_clock_fields(trim(text.substr(11)), h, m, s) || !valid_clock(h, m, s)) {
    return std::nullopt;
  }
  return make_local_time(year, month, day, h, m, s);
}

std::optional<LocalTime> parse_hour_ending_time(std::string_view text) {
  text = trim(text);
  if (text.size() < 13 || text[2] != '/' || text[5] != '/' || text[10] != ' ') {
    return std::nullopt;
  }
  unsigned month = 0;
  unsigned day = 0;
  int year = 0;
  int hour = 0;
  if (!parse_unsigned(text.substr(0, 2), month) || !parse_unsigned(text.substr(3, 2), day) ||
      !parse_int(text.substr(6, 4), year) || !parse_int(trim(text.substr(11)), hour) ||
      !is_valid_civil_date(year, month, day) || hour < 0 || hour > 24) {
    return std::nullopt;
  }
  return make_local_time(year, month, day, hour);
}

std::optional<LocalTime> parse_local_time(std::string_view text) {
  if (auto t = parse_iso_local_time(text)) {
    return t;
  }
  return parse_hour_ending_time(text);
}

std::optional<MonthDay> parse_month_day(std::string_view text) {
  text = trim(text);
  const auto dash = text.find('-');
  if (dash == std::string_view::npos) {
    return std::nullopt;
  }
  MonthDay md{};
  if (!parse_unsigned(text.substr(0, dash), md.month) || !parse_unsigned(text.substr(dash + 1), md.day)) {
    return std::nullopt;
  }
  // Leap year so 02-29 is a legal season boundary.
  if (!is_valid_civil_date(2000, md.month, md.day)) {
    return std::nullopt;
  }
  return md;
}

std::optional<CivilDate> parse_month_name_date(std::string_view text) {
  static constexpr std::array<std::string_view, 12> kMonths{"jan", "feb", "mar", "apr", "may", "jun",
                                                            "jul", "aug", "sep", "oct", "nov", "dec"};
  text = trim(text);
  const auto sp1 = text.find(' ');
  if (sp1 == std::string_view::npos || sp1 < 3) {
    return std::nullopt;
  }
  std::string mon;
  for (const char c : text.substr(0, 3)) {
    mon.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  unsigned month = 0;
  for (std::size_t i = 0; i < kMonths.size(); ++i) {
    if (kMonths[i] == mon) {
      month = static_cast<unsigned>(i + 1);
    }
  }
  const auto rest = trim(text.substr(sp1 + 1));
  const auto sp2 = rest.find(' ');
  if (month == 0U || sp2 == std::string_view::npos) {
    return std::nullopt;
  }
  CivilDate out{.month = month};
  if (!parse_unsigned(rest.substr(0, sp2), out.day) || !parse_int(trim(rest.substr(sp2 + 1)), out.year) ||
      !is_valid_civil_date(out.year, out.month, out.day)) {
    return std::nullopt;
  }
  return out;
}

std::optional<std::int64_t> parse_time_of_day(std::string_view text) {
  int h = 0;
  int m = 0;
  int s = 0;
  if (!parse_clock_fields(trim(text), h, m, s) || !valid_clock(h, m, s)) {
    return std::nullopt;
  }
  return static_cast<std::int64_t>(h) * constants::kSecondsPerHour + m * 60 + s;
}

std::string format_local_time(const LocalTime& t) {
  const std::int64_t day = day_index(t);
  const CivilDate d = civil_from_days(day);
  const std::int64_t sod = t.seconds - day * constants::kSecondsPerDay;
  return fmt::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}", d.year, d.month, d.day, sod / 3600, (sod / 60) % 60,
                     sod % 60);
}

}  // namespace windcurtail::core
