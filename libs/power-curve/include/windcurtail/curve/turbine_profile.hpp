/**
 * @file turbine_profile.hpp
 * @brief Turbine (farm) description consumed by the estimators.
 * @author Watosn
 */
#pragma once

#include <string>

#include "windcurtail/curve/power_curve.hpp"

namespace windcurtail::curve {

/**
 * @brief Hub height, unit count, capacity, losses and power curve of one farm.
 *
 * `rated_capacity_kw` is the farm total; the power curve is per unit.
 */
struct TurbineProfile {
  std::string name{};
  double hub_height_m{};
  int number_of_units{1};
  double rated_capacity_kw{};
  PowerCurve power_curve{};
  double reference_height_m{10.0};
  double loss_fraction{};
};

/**
 * @brief Check the fields the estimators depend on.
 * @return Empty string when usable, otherwise the first problem found.
 */
[[nodiscard]] std::string validate_turbine_profile(const TurbineProfile& profile);

}  // namespace windcurtail::curve
