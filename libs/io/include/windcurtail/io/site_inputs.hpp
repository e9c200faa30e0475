/**
 * @file site_inputs.hpp
 * @brief One-call loading of everything a farm run needs.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "windcurtail/core/config.hpp"
#include "windcurtail/curtailment/curtailment_engine.hpp"
#include "windcurtail/curve/turbine_profile.hpp"
#include "windcurtail/io/turbine_catalog.hpp"
#include "windcurtail/io/weather_reader.hpp"

namespace windcurtail::io {

struct SiteInputPaths {
  std::filesystem::path catalog_csv{};
  std::string turbine_name{};
  std::filesystem::path power_curve_file{};
  std::filesystem::path weather_csv{};
  std::filesystem::path sun_csv{};
};

/**
 * @brief Turbine, weather (with seasonal roughness assigned) and sun days of one farm.
 */
struct SiteInputs {
  TurbineRecord record{};
  curve::TurbineProfile turbine{};
  std::vector<core::WeatherSample> weather{};
  std::vector<curtailment::SunDay> sun_days{};
};

struct SiteInputsLoad {
  SiteInputs inputs{};
  core::Status status{core::Status::Ok};
  std::string message{};
};

/**
 * @brief Load and cross-check catalog row, power curve, weather and sun table.
 *
 * Any missing file, missing column, unknown turbine, unusable curve or empty series is reported
 * through `status` and `message`.
 */
[[nodiscard]] SiteInputsLoad load_site_inputs(const SiteInputPaths& paths, const core::ModelConfig& config);

}  // namespace windcurtail::io
