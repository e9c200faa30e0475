/**
 * @file power_curve_cli.cpp
 * @brief Power curve inspection: validation plus forward or inverse lookups.
 * @author Watosn
 */

#include <cstdlib>
#include <string>

#include <fmt/format.h>
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include "windcurtail/curve/power_curve.hpp"

int main(int argc, char** argv) {
  spdlog::cfg::load_env_levels();
  if (argc < 2) {
    spdlog::error("usage: power_curve_cli <power_curve> [power|wind] [value...]");
    spdlog::error("power: wind speed [m/s] -> power [kW]; wind: power [kW] -> wind speed [m/s]");
    return 1;
  }

  const auto load = windcurtail::curve::PowerCurve::load_table(argv[1]);
  if (load.status != windcurtail::core::Status::Ok) {
    spdlog::error("{}", load.message);
    return 2;
  }
  const auto& curve = load.curve;
  const auto check = curve.validate();
  fmt::print("samples={} rated_kw={} valid={} monotone={} non_negative={}\n", curve.size(), curve.rated_power_kw(),
             check.valid, check.monotone_wind_speed, check.non_negative_power);
  if (!check.valid) {
    spdlog::error("{}", check.message);
    return 3;
  }
  if (argc < 3) {
    for (const auto& s : curve.samples()) {
      fmt::print("{} {}\n", s.wind_speed_mps, s.power_kw);
    }
    return 0;
  }

  const std::string mode = argv[2];
  if (mode != "power" && mode != "wind") {
    spdlog::error("mode must be power or wind");
    return 4;
  }
  for (int i = 3; i < argc; ++i) {
    const double x = std::atof(argv[i]);
    if (mode == "power") {
      fmt::print("wind_mps={} power_kw={}\n", x, curve.lookup_power(x));
    } else {
      fmt::print("power_kw={} wind_mps={}\n", x, curve.lookup_wind_speed(x));
    }
  }
  return 0;
}
