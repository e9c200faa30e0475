/**
 * @file observed_power_reader.hpp
 * @brief Metered farm output reader and alignment to the weather clock.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <span>
#include <string>
#include <vector>

#include "windcurtail/core/constants.hpp"
#include "windcurtail/core/types.hpp"

namespace windcurtail::io {

struct ObservedPowerSample {
  core::LocalTime time{};
  double power_kw{core::kMissing};
};

struct ObservedPowerConfig {
  std::filesystem::path csv_file{};
  std::string time_column{"Date (HE)"};
  std::string power_column{"Volume"};
  double scale_to_kw{core::constants::kKwPerMw};
};

struct ObservedPowerSeries {
  std::vector<ObservedPowerSample> rows{};
  std::size_t skipped_rows{};
  core::Status status{core::Status::Ok};
  std::string message{};
};

/**
 * @brief Read farm output, scaled to kW.
 *
 * When `time_column` is absent the first column is used as the timestamp.
 */
[[nodiscard]] ObservedPowerSeries read_observed_power(const ObservedPowerConfig& config);

/**
 * @brief Farm power at each weather timestamp; NaN where nothing was observed.
 *
 * Duplicate timestamps are averaged.
 */
[[nodiscard]] std::vector<double> align_to_weather(std::span<const core::WeatherSample> weather,
                                                   std::span<const ObservedPowerSample> observed);

}  // namespace windcurtail::io
