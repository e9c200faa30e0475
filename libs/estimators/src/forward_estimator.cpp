/**
 * @file forward_estimator.cpp
 * @brief Forward power estimation implementation.
 * @author Watosn
 */

#include "windcurtail/estimators/forward_estimator.hpp"

#include <cmath>

#include <spdlog/spdlog.h>

#include "windcurtail/core/calendar.hpp"

namespace windcurtail::estimators {

ForwardRowResult ForwardPowerEstimator::estimate_row(const core::WeatherSample& row) const {
  ForwardRowResult out{.estimate = core::PowerEstimate{.time = row.time}};

  const auto hub = profile_.to_hub_height(row.wind_speed_ref_mps, turbine_.hub_height_m, row.surface_roughness_m,
                                          turbine_.reference_height_m);
  out.roughness_substituted = hub.roughness_substituted;
  if (hub.status != core::Status::Ok) {
    out.status = hub.status;
    return out;
  }

  const auto site = density_.evaluate(row.pressure_kpa, row.temperature_c);
  out.density_fallback = site.fallback_to_standard;
  out.temperature_clamped = site.temperature_clamped;

  double factor = 1.0;
  if (mode_ == core::DensityCorrection::SiteDensity) {
    factor = density_.equivalent_wind_speed_scale(site.density_kg_m3);
  } else {
    factor = density_.adjustment_factor(density_.rho_std());
  }

  const double adjusted = hub.wind_speed_mps * factor;
  const double power = turbine_.power_curve.lookup_power(adjusted) * (1.0 - turbine_.loss_fraction);
  if (!std::isfinite(hub.wind_speed_mps) || !std::isfinite(power)) {
    out.status = core::Status::NumericalError;
    return out;
  }

  out.estimate.hub_wind_speed_mps = hub.wind_speed_mps;
  out.estimate.estimated_power_kw = power;
  out.estimate.adjustment_factor = factor;
  out.estimate.site_density_kg_m3 = site.density_kg_m3;
  return out;
}

std::vector<core::PowerEstimate> ForwardPowerEstimator::estimate(std::span<const core::WeatherSample> rows,
                                                                 ForwardSeriesStats* stats) const {
  ForwardSeriesStats local{};
  std::vector<core::PowerEstimate> out;
  out.reserve(rows.size());
  for (std::size_t i = 0; i < rows.size(); ++i) {
    const auto r = estimate_row(rows[i]);
    ++local.rows;
    local.roughness_substituted += r.roughness_substituted ? 1U : 0U;
    local.density_fallbacks += r.density_fallback ? 1U : 0U;
    local.temperature_clamps += r.temperature_clamped ? 1U : 0U;
    if (r.status != core::Status::Ok) {
      ++local.failed_rows;
      spdlog::debug("row {} ({}) failed, emitting zero power", i, core::format_local_time(rows[i].time));
      out.push_back(core::PowerEstimate{.time = rows[i].time, .hub_wind_speed_mps = 0.0, .estimated_power_kw = 0.0});
      continue;
    }
    out.push_back(r.estimate);
  }

  if (local.failed_rows > 0U) {
    spdlog::warn("{} of {} rows could not be evaluated and were set to zero power", local.failed_rows, local.rows);
  }
  if (local.roughness_substituted > 0U) {
    spdlog::warn("default surface roughness substituted for {} rows", local.roughness_substituted);
  }
  if (local.temperature_clamps > 0U) {
    spdlog::warn("temperature clamped to absolute zero for {} rows", local.temperature_clamps);
  }
  if (local.density_fallbacks > 0U && mode_ == core::DensityCorrection::SiteDensity) {
    spdlog::warn("standard air density used for {} rows lacking pressure/temperature", local.density_fallbacks);
  }
  spdlog::info("calculated power output for {} time periods", local.rows);
  if (stats != nullptr) {
    *stats = local;
  }
  return out;
}

}  // namespace windcurtail::estimators
