/**
 * @file inverse_estimator.hpp
 * @brief Observed power to implied hub-height wind speed (back-calculation).
 * @author Watosn
 */
#pragma once

#include <span>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "windcurtail/atmo/air_density.hpp"
#include "windcurtail/core/config.hpp"
#include "windcurtail/curve/turbine_profile.hpp"

namespace windcurtail::estimators {

/**
 * @brief Back-calculated series with status.
 */
struct BackCalcSeries {
  std::vector<core::BackCalcEstimate> rows{};
  std::size_t unresolved{};
  core::Status status{core::Status::Ok};
  std::string message{};
};

/**
 * @brief Inverts the power curve over whole observed-power series.
 */
class InversePowerEstimator {
 public:
  InversePowerEstimator(const curve::TurbineProfile& turbine,
                        const atmo::AirDensityModel& density,
                        core::DensityCorrection mode = core::DensityCorrection::StandardDensity)
      : turbine_(turbine), density_(density), mode_(mode) {}

  /**
   * @brief Vectorized core: per-unit power and site density to implied wind speed.
   * @param per_unit_power_kw Observed per-unit power.
   * @param density_kg_m3 Site density, same length (only read in site-density mode).
   * @return Implied hub wind speed, NaN where the corrected power is outside the curve's range.
   */
  [[nodiscard]] Eigen::ArrayXd implied_wind_speed(const Eigen::ArrayXd& per_unit_power_kw,
                                                  const Eigen::ArrayXd& density_kg_m3) const;

  /**
   * @brief Back-calculate a farm-level observed series aligned index-by-index with the weather rows.
   * @param weather Weather rows supplying time, pressure and temperature.
   * @param farm_power_kw Farm-level observed power; NaN marks a missing observation.
   */
  [[nodiscard]] BackCalcSeries estimate(std::span<const core::WeatherSample> weather,
                                        std::span<const double> farm_power_kw) const;

 private:
  const curve::TurbineProfile& turbine_;
  const atmo::AirDensityModel& density_;
  core::DensityCorrection mode_{};
};

}  // namespace windcurtail::estimators
