/**
 * @file inverse_estimator.cpp
 * @brief Back-calculation implementation.
 * @author Watosn
 */

#include "windcurtail/estimators/inverse_estimator.hpp"

#include <cmath>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace windcurtail::estimators {

Eigen::ArrayXd InversePowerEstimator::implied_wind_speed(const Eigen::ArrayXd& per_unit_power_kw,
                                                         const Eigen::ArrayXd& density_kg_m3) const {
  Eigen::ArrayXd correction = Eigen::ArrayXd::Ones(per_unit_power_kw.size());
  if (mode_ == core::DensityCorrection::SiteDensity) {
    correction = density_kg_m3.unaryExpr([this](double rho) { return density_.adjustment_factor(rho); });
  } else {
    correction.setConstant(density_.adjustment_factor(density_.rho_std()));
  }

  const Eigen::ArrayXd corrected = per_unit_power_kw / (1.0 - turbine_.loss_fraction) * correction;
  const auto& curve = turbine_.power_curve;
  return corrected.unaryExpr([&curve](double p) { return curve.lookup_wind_speed(p); });
}

BackCalcSeries InversePowerEstimator::estimate(std::span<const core::WeatherSample> weather,
                                               std::span<const double> farm_power_kw) const {
  if (weather.size() != farm_power_kw.size()) {
    return BackCalcSeries{.status = core::Status::InvalidInput,
                          .message = fmt::format("observed power has {} rows, weather has {}", farm_power_kw.size(),
                                                 weather.size())};
  }
  if (turbine_.number_of_units < 1) {
    return BackCalcSeries{.status = core::Status::InvalidInput, .message = "number of units must be at least 1"};
  }

  const auto n = static_cast<Eigen::Index>(weather.size());
  const Eigen::Map<const Eigen::ArrayXd> farm(farm_power_kw.data(), n);
  const Eigen::ArrayXd per_unit = farm / static_cast<double>(turbine_.number_of_units);

  Eigen::ArrayXd rho(n);
  for (Eigen::Index i = 0; i < n; ++i) {
    const auto& w = weather[static_cast<std::size_t>(i)];
    rho(i) = density_.density(w.pressure_kpa, w.temperature_c);
  }

  const Eigen::ArrayXd implied = implied_wind_speed(per_unit, rho);

  BackCalcSeries out{};
  out.rows.reserve(weather.size());
  for (Eigen::Index i = 0; i < n; ++i) {
    if (std::isnan(implied(i))) {
      ++out.unresolved;
    }
    out.rows.push_back(core::BackCalcEstimate{.time = weather[static_cast<std::size_t>(i)].time,
                                              .implied_hub_wind_speed_mps = implied(i),
                                              .per_unit_power_kw = per_unit(i),
                                              .site_density_kg_m3 = rho(i)});
  }
  if (out.unresolved > 0U) {
    spdlog::warn("{} of {} observed power values outside the power curve range (wind speed left missing)",
                 out.unresolved, out.rows.size());
  }
  spdlog::info("back-calculated wind speed for {} time periods", out.rows.size());
  return out;
}

}  // namespace windcurtail::estimators
