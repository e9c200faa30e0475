/**
 * @file backcalc_batch_cli.cpp
 * @brief Implied hub wind speed from metered output, with curtailment columns.
 * @author Watosn
 */

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include "windcurtail/atmo/air_density.hpp"
#include "windcurtail/core/config.hpp"
#include "windcurtail/curtailment/curtailment_engine.hpp"
#include "windcurtail/estimators/inverse_estimator.hpp"
#include "windcurtail/io/observed_power_reader.hpp"
#include "windcurtail/io/series_writer.hpp"
#include "windcurtail/io/site_inputs.hpp"

int main(int argc, char** argv) {
  spdlog::cfg::load_env_levels();
  if (argc < 9 || argc > 10) {
    spdlog::error(
        "usage: backcalc_batch_cli <catalog_csv> <turbine_name> <power_curve> <weather_csv> <sun_csv> "
        "<observed_power_csv> <output_file> <format:csv|json> [config_file]");
    return 1;
  }

  const windcurtail::io::SiteInputPaths paths{.catalog_csv = argv[1],
                                              .turbine_name = argv[2],
                                              .power_curve_file = argv[3],
                                              .weather_csv = argv[4],
                                              .sun_csv = argv[5]};
  const std::filesystem::path observed_path = argv[6];
  const std::filesystem::path output_path = argv[7];
  const auto format = windcurtail::io::parse_output_format(argv[8]);
  const std::string config_file = (argc >= 10) ? argv[9] : "";
  if (!format) {
    spdlog::error("format must be csv or json");
    return 4;
  }

  windcurtail::core::ModelConfigLoad config{};
  if (!config_file.empty()) {
    config = windcurtail::core::load_model_config(config_file);
    if (config.status != windcurtail::core::Status::Ok) {
      spdlog::error("config: {}", config.message);
      return 5;
    }
  }
  const auto& cfg = config.config;

  const auto site = windcurtail::io::load_site_inputs(paths, cfg);
  if (site.status != windcurtail::core::Status::Ok) {
    spdlog::error("{}", site.message);
    return 2;
  }
  const auto observed = windcurtail::io::read_observed_power(windcurtail::io::ObservedPowerConfig{
      .csv_file = observed_path, .scale_to_kw = cfg.observed_power_scale_kw});
  if (observed.status != windcurtail::core::Status::Ok) {
    spdlog::error("{}", observed.message);
    return 2;
  }
  const auto rules = windcurtail::curtailment::make_rules(cfg);
  if (!rules) {
    spdlog::error("season {:02d}-{:02d} to {:02d}-{:02d} does not exist in {}", cfg.season_start.month,
                  cfg.season_start.day, cfg.season_end.month, cfg.season_end.day, cfg.year);
    return 5;
  }

  const auto farm_power_kw = windcurtail::io::align_to_weather(site.inputs.weather, observed.rows);
  const windcurtail::atmo::AirDensityModel density(cfg);
  const windcurtail::estimators::InversePowerEstimator inverse(site.inputs.turbine, density, cfg.density_correction);
  const auto backcalc = inverse.estimate(site.inputs.weather, farm_power_kw);
  if (backcalc.status != windcurtail::core::Status::Ok) {
    spdlog::error("back-calculation failed: {}", backcalc.message);
    return 7;
  }

  const auto engine = windcurtail::curtailment::CurtailmentWindowEngine::Create(*rules, site.inputs.sun_days);
  const auto inputs = windcurtail::curtailment::curtailment_inputs(site.inputs.weather, backcalc.rows);
  const auto corrected = engine->evaluate(inputs);

  std::ofstream out(output_path);
  if (!out) {
    spdlog::error("failed to open output file: {}", output_path.string());
    return 3;
  }
  const windcurtail::io::RunMetadata metadata{
      .schema = "backcalc_power_v1",
      .fields = {{"turbine", site.inputs.turbine.name},
                 {"model", site.inputs.record.model},
                 {"year", std::to_string(cfg.year)},
                 {"density_correction", windcurtail::core::density_correction_to_string(cfg.density_correction)},
                 {"observed_csv", observed_path.string()}}};
  const auto written = windcurtail::io::write_backcalc_series(out, *format, metadata, site.inputs.weather,
                                                               farm_power_kw, backcalc.rows, corrected);
  if (written != windcurtail::core::Status::Ok) {
    spdlog::error("failed to write {}: {}", output_path.string(), windcurtail::io::status_to_string(written));
    return 6;
  }

  spdlog::info("wrote {} rows to {}", corrected.size(), output_path.string());
  fmt::print("turbine={} rows={} unresolved={} windows={}\n", site.inputs.turbine.name, backcalc.rows.size(),
             backcalc.unresolved, engine->windows().size());
  return 0;
}
