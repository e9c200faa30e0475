/**
 * @file interfaces.hpp
 * @brief Core model interfaces.
 * @author Watosn
 */
#pragma once

#include "windcurtail/core/types.hpp"

namespace windcurtail::core {

/**
 * @brief Hub-height wind speed and how it was obtained.
 */
struct HubWindSample {
  double wind_speed_mps{};
  double roughness_m{};
  bool roughness_substituted{};
  bool extrapolated{};
  Status status{Status::Ok};
};

/**
 * @brief Vertical wind profile used to move a measured speed to hub height.
 */
class IWindProfileModel {
 public:
  virtual ~IWindProfileModel() = default;
  [[nodiscard]] virtual HubWindSample to_hub_height(double wind_speed_ref_mps, double hub_height_m,
                                                    double surface_roughness_m, double ref_height_m) const = 0;
};

}  // namespace windcurtail::core
