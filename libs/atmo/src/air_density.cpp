/**
 * @file air_density.cpp
 * @brief Air density model implementation.
 * @author Watosn
 */

#include "windcurtail/atmo/air_density.hpp"

#include <cmath>

#include <spdlog/spdlog.h>

namespace windcurtail::atmo {

DensitySample AirDensityModel::evaluate(double pressure_kpa, double temperature_c) const {
  DensitySample out{.density_kg_m3 = rho_std_};
  double t_c = temperature_c;
  if (t_c < core::constants::kAbsoluteZeroC) {
    spdlog::debug("temperature {} C is below absolute zero, using {} C", t_c, core::constants::kAbsoluteZeroC);
    t_c = core::constants::kAbsoluteZeroC;
    out.temperature_clamped = true;
  }

  const double t_k = t_c - core::constants::kAbsoluteZeroC;
  const double rho = pressure_kpa * core::constants::kPaPerKPa / (gas_constant_ * t_k);
  if (!std::isfinite(rho) || !(rho > 0.0)) {
    spdlog::debug("air density unavailable (p={} kPa, T={} C), using standard density", pressure_kpa, temperature_c);
    out.fallback_to_standard = true;
    return out;
  }
  out.density_kg_m3 = rho;
  return out;
}

double AirDensityModel::adjustment_factor(double density_kg_m3) const {
  if (!std::isfinite(density_kg_m3) || !(density_kg_m3 > 0.0)) {
    return 1.0;
  }
  return std::cbrt(rho_std_ / density_kg_m3);
}

double AirDensityModel::equivalent_wind_speed_scale(double density_kg_m3) const {
  if (!std::isfinite(density_kg_m3) || !(density_kg_m3 > 0.0)) {
    return 1.0;
  }
  return std::cbrt(density_kg_m3 / rho_std_);
}

}  // namespace windcurtail::atmo
