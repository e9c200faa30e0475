/**
 * @file observed_power_reader.cpp
 * @brief Metered farm output reader implementation.
 * @author Watosn
 */

#include "windcurtail/io/observed_power_reader.hpp"

#include <cmath>
#include <cstdint>
#include <unordered_map>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "windcurtail/core/calendar.hpp"
#include "windcurtail/io/csv_table.hpp"

namespace windcurtail::io {

ObservedPowerSeries read_observed_power(const ObservedPowerConfig& config) {
  const auto read = read_csv(config.csv_file);
  if (read.status != core::Status::Ok) {
    return ObservedPowerSeries{.status = read.status, .message = read.message};
  }
  const auto& table = read.table;
  const auto power_col = table.column(config.power_column);
  if (!power_col) {
    return ObservedPowerSeries{
        .status = core::Status::InvalidInput,
        .message = fmt::format("{}: missing column '{}'", config.csv_file.string(), config.power_column)};
  }
  const std::size_t time_col = table.column(config.time_column).value_or(0U);
  if (time_col == *power_col) {
    return ObservedPowerSeries{.status = core::Status::InvalidInput,
                               .message = fmt::format("{}: no timestamp column", config.csv_file.string())};
  }

  ObservedPowerSeries out{};
  out.rows.reserve(table.rows.size());
  for (std::size_t i = 0; i < table.rows.size(); ++i) {
    const auto& row = table.rows[i];
    const auto time = core::parse_local_time(cell(row, time_col));
    if (!time) {
      spdlog::debug("{}:{}: unparseable timestamp '{}'", config.csv_file.string(), table.line_numbers[i],
                    cell(row, time_col));
      ++out.skipped_rows;
      continue;
    }
    out.rows.push_back(
        ObservedPowerSample{.time = *time, .power_kw = parse_cell(cell(row, *power_col)) * config.scale_to_kw});
  }

  if (out.skipped_rows > 0) {
    spdlog::warn("{}: skipped {} rows with malformed timestamps", config.csv_file.string(), out.skipped_rows);
  }
  if (out.rows.empty()) {
    out.status = core::Status::DataUnavailable;
    out.message = fmt::format("{}: no observed power rows", config.csv_file.string());
    return out;
  }
  spdlog::info("read {} observed power rows from {}", out.rows.size(), config.csv_file.string());
  return out;
}

std::vector<double> align_to_weather(std::span<const core::WeatherSample> weather,
                                     std::span<const ObservedPowerSample> observed) {
  std::unordered_map<std::int64_t, std::pair<double, int>> by_time;
  by_time.reserve(observed.size());
  for (const auto& sample : observed) {
    if (std::isnan(sample.power_kw)) {
      continue;
    }
    auto& acc = by_time[sample.time.seconds];
    acc.first += sample.power_kw;
    acc.second += 1;
  }

  std::vector<double> out;
  out.reserve(weather.size());
  std::size_t missing = 0;
  for (const auto& row : weather) {
    const auto it = by_time.find(row.time.seconds);
    if (it == by_time.end()) {
      spdlog::debug("no observed power at {}", core::format_local_time(row.time));
      out.push_back(core::kMissing);
      ++missing;
      continue;
    }
    out.push_back(it->second.first / static_cast<double>(it->second.second));
  }
  if (missing > 0) {
    spdlog::warn("{} of {} weather rows have no observed power", missing, weather.size());
  }
  return out;
}

}  // namespace windcurtail::io
