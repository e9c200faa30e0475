/**
 * @file forward_estimator.hpp
 * @brief Weather row to expected turbine power.
 * @author Watosn
 */
#pragma once

#include <span>
#include <vector>

#include "windcurtail/atmo/air_density.hpp"
#include "windcurtail/core/config.hpp"
#include "windcurtail/core/interfaces.hpp"
#include "windcurtail/curve/turbine_profile.hpp"

namespace windcurtail::estimators {

/**
 * @brief One row's estimate plus the status of its evaluation.
 */
struct ForwardRowResult {
  core::PowerEstimate estimate{};
  bool roughness_substituted{};
  bool density_fallback{};
  bool temperature_clamped{};
  core::Status status{core::Status::Ok};
};

/**
 * @brief Counters gathered while mapping a series.
 */
struct ForwardSeriesStats {
  std::size_t rows{};
  std::size_t failed_rows{};
  std::size_t roughness_substituted{};
  std::size_t density_fallbacks{};
  std::size_t temperature_clamps{};
};

/**
 * @brief Composes wind profile, density correction and power curve.
 */
class ForwardPowerEstimator {
 public:
  /**
   * @brief Construct from a turbine and the physical models.
   * @param turbine Turbine profile (power curve, hub and reference height, losses).
   * @param profile Wind profile used for hub-height extrapolation.
   * @param density Air density model.
   * @param mode Density used in the wind-speed correction.
   */
  ForwardPowerEstimator(const curve::TurbineProfile& turbine,
                        const core::IWindProfileModel& profile,
                        const atmo::AirDensityModel& density,
                        core::DensityCorrection mode = core::DensityCorrection::StandardDensity)
      : turbine_(turbine), profile_(profile), density_(density), mode_(mode) {}

  /**
   * @brief Evaluate one weather row.
   * @return Estimate with `status != Ok` when the row cannot be evaluated.
   */
  [[nodiscard]] ForwardRowResult estimate_row(const core::WeatherSample& row) const;

  /**
   * @brief Map a whole series; failed rows become zero-valued estimates.
   * @return Exactly one estimate per input row, in input order.
   */
  [[nodiscard]] std::vector<core::PowerEstimate> estimate(std::span<const core::WeatherSample> rows,
                                                          ForwardSeriesStats* stats = nullptr) const;

 private:
  const curve::TurbineProfile& turbine_;
  const core::IWindProfileModel& profile_;
  const atmo::AirDensityModel& density_;
  core::DensityCorrection mode_{};
};

}  // namespace windcurtail::estimators
