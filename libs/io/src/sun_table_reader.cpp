/**
 * @file sun_table_reader.cpp
 * @brief Sunrise/sunset table reader implementation.
 * @author Watosn
 */

#include "windcurtail/io/sun_table_reader.hpp"

#include <algorithm>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "windcurtail/core/calendar.hpp"
#include "windcurtail/io/csv_table.hpp"

namespace windcurtail::io {
namespace {

std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
    s.remove_prefix(1);
  }
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
    s.remove_suffix(1);
  }
  return s;
}

}  // namespace

SunTable read_sun_table(const std::filesystem::path& path, const std::string& turbine_name, int year) {
  const auto read = read_csv(path);
  if (read.status != core::Status::Ok) {
    return SunTable{.status = read.status, .message = read.message};
  }
  const auto& table = read.table;
  const auto date_col = table.column("date");
  const auto rise_col = table.column("rise");
  const auto set_col = table.column("set");
  const auto name_col = table.column("turbine_name");
  if (!date_col || !rise_col || !set_col || !name_col) {
    return SunTable{.status = core::Status::InvalidInput,
                    .message = fmt::format("{}: expected columns date, rise, set, turbine_name", path.string())};
  }

  SunTable out{};
  std::size_t matched = 0;
  for (const auto& row : table.rows) {
    if (trim(cell(row, *name_col)) != trim(turbine_name)) {
      continue;
    }
    ++matched;
    const auto date = core::parse_month_name_date(cell(row, *date_col));
    const auto rise = core::parse_time_of_day(cell(row, *rise_col));
    const auto set = core::parse_time_of_day(cell(row, *set_col));
    if (!date || !rise || !set || !core::is_valid_civil_date(year, date->month, date->day)) {
      ++out.skipped_rows;
      continue;
    }
    const std::int64_t day = core::days_from_civil(year, date->month, date->day);
    const core::LocalTime midnight = core::start_of_day(day);
    out.days.push_back(curtailment::SunDay{.day = day,
                                           .sunrise = core::LocalTime{.seconds = midnight.seconds + *rise},
                                           .sunset = core::LocalTime{.seconds = midnight.seconds + *set}});
  }

  if (matched == 0) {
    return SunTable{.status = core::Status::DataUnavailable,
                    .message = fmt::format("no sun data found for turbine '{}' in {}", turbine_name, path.string())};
  }
  if (out.skipped_rows > 0) {
    spdlog::warn("{}: skipped {} sun rows for '{}' (unparseable or not in {})", path.string(), out.skipped_rows,
                 turbine_name, year);
  }
  std::stable_sort(out.days.begin(), out.days.end(),
                   [](const curtailment::SunDay& a, const curtailment::SunDay& b) { return a.day < b.day; });
  spdlog::info("loaded {} sun days for '{}'", out.days.size(), turbine_name);
  return out;
}

}  // namespace windcurtail::io
