/**
 * @file turbine_profile.cpp
 * @brief Turbine profile checks.
 * @author Watosn
 */

#include "windcurtail/curve/turbine_profile.hpp"

#include <fmt/format.h>

namespace windcurtail::curve {

std::string validate_turbine_profile(const TurbineProfile& profile) {
  if (!(profile.hub_height_m > 0.0)) {
    return fmt::format("turbine '{}': hub height must be positive", profile.name);
  }
  if (!(profile.reference_height_m > 0.0)) {
    return fmt::format("turbine '{}': reference height must be positive", profile.name);
  }
  if (profile.number_of_units < 1) {
    return fmt::format("turbine '{}': number of units must be at least 1", profile.name);
  }
  if (!(profile.loss_fraction >= 0.0 && profile.loss_fraction < 1.0)) {
    return fmt::format("turbine '{}': loss fraction must lie in [0, 1)", profile.name);
  }
  if (profile.power_curve.size() < 2U) {
    return fmt::format("turbine '{}': power curve is missing", profile.name);
  }
  return {};
}

}  // namespace windcurtail::curve
