/**
 * @file wind_profile.cpp
 * @brief Wind profile implementations.
 * @author Watosn
 */

#include "windcurtail/atmo/wind_profile.hpp"

#include <cmath>

#include <spdlog/spdlog.h>

namespace windcurtail::atmo {

core::HubWindSample WindProfileExtrapolator::to_hub_height(double wind_speed_ref_mps, double hub_height_m,
                                                           double surface_roughness_m, double ref_height_m) const {
  if (!std::isfinite(wind_speed_ref_mps)) {
    return core::HubWindSample{.wind_speed_mps = wind_speed_ref_mps, .status = core::Status::InvalidInput};
  }

  core::HubWindSample out{.wind_speed_mps = wind_speed_ref_mps, .roughness_m = surface_roughness_m};
  if (!(surface_roughness_m > 0.0)) {
    spdlog::debug("invalid surface roughness {}, using {}", surface_roughness_m, default_roughness_m_);
    out.roughness_m = default_roughness_m_;
    out.roughness_substituted = true;
  }

  if (!(hub_height_m > out.roughness_m) || !(ref_height_m > out.roughness_m)) {
    spdlog::debug("heights (hub {}, ref {}) must exceed surface roughness {}", hub_height_m, ref_height_m, out.roughness_m);
    return out;
  }

  const double denom = std::log(ref_height_m / out.roughness_m);
  const double v_hub = wind_speed_ref_mps * (std::log(hub_height_m / out.roughness_m) / denom);
  if (!std::isfinite(v_hub)) {
    return out;
  }
  out.wind_speed_mps = v_hub;
  out.extrapolated = true;
  return out;
}

core::HubWindSample PowerLawWindProfile::to_hub_height(double wind_speed_ref_mps, double hub_height_m,
                                                       double surface_roughness_m, double ref_height_m) const {
  if (!std::isfinite(wind_speed_ref_mps)) {
    return core::HubWindSample{.wind_speed_mps = wind_speed_ref_mps, .status = core::Status::InvalidInput};
  }
  core::HubWindSample out{.wind_speed_mps = wind_speed_ref_mps, .roughness_m = surface_roughness_m};
  if (!(hub_height_m > 0.0) || !(ref_height_m > 0.0)) {
    return out;
  }
  const double v_hub = wind_speed_ref_mps * std::pow(hub_height_m / ref_height_m, alpha_);
  if (std::isfinite(v_hub)) {
    out.wind_speed_mps = v_hub;
    out.extrapolated = true;
  }
  return out;
}

std::unique_ptr<core::IWindProfileModel> make_wind_profile(const core::ModelConfig& config) {
  if (config.wind_profile == core::WindProfileLaw::PowerLaw) {
    return std::make_unique<PowerLawWindProfile>(config.power_law_alpha);
  }
  return std::make_unique<WindProfileExtrapolator>();
}

}  // namespace windcurtail::atmo
