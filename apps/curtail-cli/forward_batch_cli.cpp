/**
 * @file forward_batch_cli.cpp
 * @brief Weather-driven power estimate with blanket/smart curtailment columns.
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
#include "windcurtail/atmo/wind_profile.hpp"
#include "windcurtail/core/config.hpp"
#include "windcurtail/curtailment/curtailment_engine.hpp"
#include "windcurtail/estimators/forward_estimator.hpp"
#include "windcurtail/io/series_writer.hpp"
#include "windcurtail/io/site_inputs.hpp"

int main(int argc, char** argv) {
  spdlog::cfg::load_env_levels();
  if (argc < 8 || argc > 9) {
    spdlog::error(
        "usage: forward_batch_cli <catalog_csv> <turbine_name> <power_curve> <weather_csv> <sun_csv> <output_file> "
        "<format:csv|json> [config_file]");
    return 1;
  }

  const windcurtail::io::SiteInputPaths paths{.catalog_csv = argv[1],
                                              .turbine_name = argv[2],
                                              .power_curve_file = argv[3],
                                              .weather_csv = argv[4],
                                              .sun_csv = argv[5]};
  const std::filesystem::path output_path = argv[6];
  const auto format = windcurtail::io::parse_output_format(argv[7]);
  const std::string config_file = (argc >= 9) ? argv[8] : "";
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
  const auto rules = windcurtail::curtailment::make_rules(cfg);
  if (!rules) {
    spdlog::error("season {:02d}-{:02d} to {:02d}-{:02d} does not exist in {}", cfg.season_start.month,
                  cfg.season_start.day, cfg.season_end.month, cfg.season_end.day, cfg.year);
    return 5;
  }

  const auto profile = windcurtail::atmo::make_wind_profile(cfg);
  const windcurtail::atmo::AirDensityModel density(cfg);
  const windcurtail::estimators::ForwardPowerEstimator forward(site.inputs.turbine, *profile, density,
                                                               cfg.density_correction);
  windcurtail::estimators::ForwardSeriesStats stats{};
  const auto estimates = forward.estimate(site.inputs.weather, &stats);

  const auto engine = windcurtail::curtailment::CurtailmentWindowEngine::Create(*rules, site.inputs.sun_days);
  const auto inputs = windcurtail::curtailment::curtailment_inputs(site.inputs.weather, estimates);
  const auto corrected = engine->evaluate(inputs);

  std::ofstream out(output_path);
  if (!out) {
    spdlog::error("failed to open output file: {}", output_path.string());
    return 3;
  }
  const windcurtail::io::RunMetadata metadata{
      .schema = "forward_power_v1",
      .fields = {{"turbine", site.inputs.turbine.name},
                 {"model", site.inputs.record.model},
                 {"year", std::to_string(cfg.year)},
                 {"wind_profile", windcurtail::core::wind_profile_to_string(cfg.wind_profile)},
                 {"density_correction", windcurtail::core::density_correction_to_string(cfg.density_correction)},
                 {"weather_csv", paths.weather_csv.string()}}};
  const auto written = windcurtail::io::write_forward_series(out, *format, metadata, site.inputs.weather, estimates,
                                                              corrected);
  if (written != windcurtail::core::Status::Ok) {
    spdlog::error("failed to write {}: {}", output_path.string(), windcurtail::io::status_to_string(written));
    return 6;
  }

  spdlog::info("wrote {} rows to {}", corrected.size(), output_path.string());
  fmt::print("turbine={} rows={} failed_rows={} roughness_substituted={} density_fallbacks={} windows={}\n",
             site.inputs.turbine.name, stats.rows, stats.failed_rows, stats.roughness_substituted,
             stats.density_fallbacks, engine->windows().size());
  return 0;
}
