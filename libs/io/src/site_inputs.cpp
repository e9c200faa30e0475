/**
 * @file site_inputs.cpp
 * @brief Farm input loading implementation.
 * @author Watosn
 */

#include "windcurtail/io/site_inputs.hpp"

#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "windcurtail/atmo/roughness.hpp"
#include "windcurtail/io/sun_table_reader.hpp"

namespace windcurtail::io {

SiteInputsLoad load_site_inputs(const SiteInputPaths& paths, const core::ModelConfig& config) {
  auto catalog = TurbineCatalog::load(paths.catalog_csv);
  if (catalog.status != core::Status::Ok) {
    return SiteInputsLoad{.status = catalog.status, .message = std::move(catalog.message)};
  }
  const TurbineRecord* record = catalog.catalog.find(paths.turbine_name);
  if (record == nullptr) {
    return SiteInputsLoad{.status = core::Status::DataUnavailable,
                          .message = fmt::format("turbine '{}' not found in {}", paths.turbine_name,
                                                 paths.catalog_csv.string())};
  }
  if (const auto problem = atmo::validate_roughness(record->roughness); !problem.empty()) {
    spdlog::warn("{}: {}", record->asset_name, problem);
  }

  auto curve = curve::PowerCurve::load_table(paths.power_curve_file);
  if (curve.status != core::Status::Ok) {
    return SiteInputsLoad{.status = curve.status, .message = std::move(curve.message)};
  }
  if (const auto check = curve.curve.validate(); !check.valid) {
    return SiteInputsLoad{.status = core::Status::InvalidInput,
                          .message = fmt::format("{}: {}", paths.power_curve_file.string(), check.message)};
  }

  SiteInputsLoad out{};
  out.inputs.record = *record;
  out.inputs.turbine =
      make_turbine_profile(*record, std::move(curve.curve), config.reference_height_m, config.loss_fraction);
  if (const auto problem = curve::validate_turbine_profile(out.inputs.turbine); !problem.empty()) {
    return SiteInputsLoad{.status = core::Status::InvalidInput, .message = problem};
  }

  auto weather = read_weather_csv(
      WeatherCsvConfig{.csv_file = paths.weather_csv, .wind_speed_conversion = config.wind_speed_conversion});
  if (weather.status != core::Status::Ok) {
    return SiteInputsLoad{.status = weather.status, .message = std::move(weather.message)};
  }
  out.inputs.weather = std::move(weather.rows);
  if (const auto unusable = atmo::assign_seasonal_roughness(out.inputs.weather, record->roughness); unusable > 0) {
    spdlog::warn("{} weather rows got a non-positive roughness and will use the default", unusable);
  }

  // The sun table is keyed by the catalog's asset name, not by the caller's search text.
  auto sun = read_sun_table(paths.sun_csv, record->asset_name, config.year);
  if (sun.status != core::Status::Ok) {
    return SiteInputsLoad{.status = sun.status, .message = std::move(sun.message)};
  }
  out.inputs.sun_days = std::move(sun.days);

  spdlog::info("loaded site '{}' (model {}, station {}, hub {} m, {} units)", record->asset_name, record->model,
               record->station_name, record->hub_height_m, record->number_of_units);
  return out;
}

}  // namespace windcurtail::io
