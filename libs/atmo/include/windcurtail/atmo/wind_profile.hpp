/**
 * @file wind_profile.hpp
 * @brief Wind speed extrapolation from measurement height to hub height.
 * @author Watosn
 */
#pragma once

#include <memory>

#include "windcurtail/core/config.hpp"
#include "windcurtail/core/constants.hpp"
#include "windcurtail/core/interfaces.hpp"

namespace windcurtail::atmo {

/**
 * @brief Logarithmic wind profile, v_hub = v_ref * ln(h_hub/z0) / ln(h_ref/z0).
 *
 * Non-positive roughness is replaced by the default roughness. When either height does not
 * exceed the roughness length the reference speed is returned unchanged.
 */
class WindProfileExtrapolator final : public core::IWindProfileModel {
 public:
  explicit WindProfileExtrapolator(double default_roughness_m = core::constants::kDefaultRoughnessM)
      : default_roughness_m_(default_roughness_m) {}

  [[nodiscard]] core::HubWindSample to_hub_height(double wind_speed_ref_mps, double hub_height_m,
                                                  double surface_roughness_m, double ref_height_m) const override;

 private:
  double default_roughness_m_{};
};

/**
 * @brief Power-law (Hellmann) profile, v_hub = v_ref * (h_hub/h_ref)^alpha. Roughness is ignored.
 */
class PowerLawWindProfile final : public core::IWindProfileModel {
 public:
  explicit PowerLawWindProfile(double alpha = 0.143) : alpha_(alpha) {}

  [[nodiscard]] core::HubWindSample to_hub_height(double wind_speed_ref_mps, double hub_height_m,
                                                  double surface_roughness_m, double ref_height_m) const override;

 private:
  double alpha_{};
};

/**
 * @brief Profile law selected by `config.wind_profile`.
 */
std::unique_ptr<core::IWindProfileModel> make_wind_profile(const core::ModelConfig& config);

}  // namespace windcurtail::atmo
