/**
 * @file weather_reader.hpp
 * @brief Hourly station weather CSV reader.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "windcurtail/core/constants.hpp"
#include "windcurtail/core/types.hpp"

namespace windcurtail::io {

/**
 * @brief Header names of the weather columns.
 */
struct WeatherColumns {
  std::string time{"Date/Time (LST)"};
  std::string wind_speed{"Wind Spd (km/h)"};
  std::string temperature{"Temp (°C)"};
  std::string precipitation{"Precip. Amount (mm)"};
  std::string pressure{"Stn Press (kPa)"};
};

struct WeatherCsvConfig {
  std::filesystem::path csv_file{};
  WeatherColumns columns{};
  double wind_speed_conversion{core::constants::kKmhToMps};
};

/**
 * @brief Parsed weather rows in file order.
 *
 * Roughness is left at zero; the caller assigns it from the turbine's seasonal table.
 */
struct WeatherSeries {
  std::vector<core::WeatherSample> rows{};
  std::size_t skipped_rows{};
  core::Status status{core::Status::Ok};
  std::string message{};
};

/**
 * @brief Read a station weather CSV.
 *
 * Time, wind speed, temperature and precipitation columns are required; a missing pressure
 * column is tolerated (pressure then reads as missing). Rows with an unparseable timestamp are
 * skipped.
 */
[[nodiscard]] WeatherSeries read_weather_csv(const WeatherCsvConfig& config);

}  // namespace windcurtail::io
