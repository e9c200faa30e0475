/**
 * @file validation_cli.cpp
 * @brief Modeled vs observed seasonal energy error across sites, from written series.
 * @author Watosn
 */

#include <cstdlib>
#include <filesystem>
#include <vector>

#include <fmt/format.h>
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include "windcurtail/curtailment/validation_summary.hpp"
#include "windcurtail/io/series_reader.hpp"

namespace {

std::vector<double> base_power(const windcurtail::io::CorrectedSeries& series) {
  std::vector<double> out;
  out.reserve(series.rows.size());
  for (const auto& row : series.rows) {
    out.push_back(row.power_kw);
  }
  return out;
}

}  // namespace

int main(int argc, char** argv) {
  spdlog::cfg::load_env_levels();
  if (argc < 4 || (argc - 1) % 3 != 0) {
    spdlog::error("usage: validation_cli <number_of_units> <forward_series_csv> <backcalc_series_csv> [...]");
    return 1;
  }

  std::vector<windcurtail::curtailment::EnergyComparison> sites;
  for (int i = 1; i + 2 < argc; i += 3) {
    const int number_of_units = std::atoi(argv[i]);
    const std::filesystem::path forward_path = argv[i + 1];
    const std::filesystem::path backcalc_path = argv[i + 2];
    if (number_of_units < 1) {
      spdlog::error("number_of_units must be >= 1 (got '{}')", argv[i]);
      return 5;
    }
    const auto forward = windcurtail::io::read_corrected_series(forward_path);
    const auto backcalc = windcurtail::io::read_corrected_series(backcalc_path);
    if (forward.status != windcurtail::core::Status::Ok || backcalc.status != windcurtail::core::Status::Ok) {
      spdlog::error("{}", forward.status != windcurtail::core::Status::Ok ? forward.message : backcalc.message);
      return 2;
    }
    const auto modeled = base_power(forward);
    const auto observed = base_power(backcalc);
    sites.push_back(windcurtail::curtailment::EnergyComparison{
        .site = forward_path.stem().string(),
        .modeled_mwh = windcurtail::curtailment::series_energy_mwh(modeled, number_of_units),
        .observed_mwh = windcurtail::curtailment::series_energy_mwh(observed, number_of_units)});
    fmt::print("site={} modeled_mwh={:.3f} observed_mwh={:.3f}\n", sites.back().site, sites.back().modeled_mwh,
               sites.back().observed_mwh);
  }

  const auto summary = windcurtail::curtailment::summarize_validation(sites);
  if (summary.status != windcurtail::core::Status::Ok) {
    spdlog::error("validation failed: {}", summary.message);
    return 7;
  }
  fmt::print("sites={} rmse_mwh={:.3f} mape_pct={:.2f}\n", summary.sites_compared, summary.rmse_mwh, summary.mape_pct);
  return 0;
}
