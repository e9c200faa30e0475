/**
 * @file weather_reader.cpp
 * @brief Station weather CSV reader implementation.
 * @author Watosn
 */

#include "windcurtail/io/weather_reader.hpp"

#include <optional>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "windcurtail/core/calendar.hpp"
#include "windcurtail/io/csv_table.hpp"

namespace windcurtail::io {

WeatherSeries read_weather_csv(const WeatherCsvConfig& config) {
  const auto read = read_csv(config.csv_file);
  if (read.status != core::Status::Ok) {
    return WeatherSeries{.status = read.status, .message = read.message};
  }
  const auto& table = read.table;
  const auto& names = config.columns;

  // Exports written through a latin-1 round trip carry a mangled degree sign.
  const auto time_col = table.column(names.time);
  const auto wind_col = table.column(names.wind_speed);
  const auto temp_col = table.column({names.temperature, "Temp (Â°C)", "Temp (C)"});
  const auto precip_col = table.column(names.precipitation);
  const auto pressure_col = table.column(names.pressure);

  const std::pair<const std::optional<std::size_t>*, const std::string*> required[] = {
      {&time_col, &names.time},
      {&wind_col, &names.wind_speed},
      {&temp_col, &names.temperature},
      {&precip_col, &names.precipitation},
  };
  for (const auto& [col, name] : required) {
    if (!col->has_value()) {
      return WeatherSeries{.status = core::Status::InvalidInput,
                           .message = fmt::format("{}: missing column '{}'", config.csv_file.string(), *name)};
    }
  }
  if (!pressure_col) {
    spdlog::warn("{}: no '{}' column, site density falls back to standard", config.csv_file.string(), names.pressure);
  }

  WeatherSeries out{};
  out.rows.reserve(table.rows.size());
  for (std::size_t i = 0; i < table.rows.size(); ++i) {
    const auto& row = table.rows[i];
    const auto time = core::parse_local_time(cell(row, *time_col));
    if (!time) {
      spdlog::debug("{}:{}: unparseable timestamp '{}'", config.csv_file.string(), table.line_numbers[i],
                    cell(row, *time_col));
      ++out.skipped_rows;
      continue;
    }
    out.rows.push_back(core::WeatherSample{
        .time = *time,
        .wind_speed_ref_mps = parse_cell(cell(row, *wind_col)) * config.wind_speed_conversion,
        .temperature_c = parse_cell(cell(row, *temp_col)),
        .pressure_kpa = pressure_col ? parse_cell(cell(row, *pressure_col)) : core::kMissing,
        .precipitation_mm = parse_cell(cell(row, *precip_col)),
        .surface_roughness_m = 0.0});
  }

  if (out.skipped_rows > 0) {
    spdlog::warn("{}: skipped {} rows with malformed timestamps", config.csv_file.string(), out.skipped_rows);
  }
  if (out.rows.empty()) {
    out.status = core::Status::DataUnavailable;
    out.message = fmt::format("{}: no weather rows", config.csv_file.string());
    return out;
  }
  spdlog::info("read {} weather rows from {}", out.rows.size(), config.csv_file.string());
  return out;
}

}  // namespace windcurtail::io
