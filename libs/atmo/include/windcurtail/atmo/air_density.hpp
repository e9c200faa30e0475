/**
 * @file air_density.hpp
 * @brief Ideal-gas air density and power-curve density correction.
 * @author Watosn
 */
#pragma once

#include "windcurtail/core/config.hpp"
#include "windcurtail/core/constants.hpp"

namespace windcurtail::atmo {

/**
 * @brief Density evaluation with flags for the corrections applied.
 */
struct DensitySample {
  double density_kg_m3{};
  bool temperature_clamped{};
  bool fallback_to_standard{};
};

/**
 * @brief Dry-air density model, rho = p / (R * T).
 */
class AirDensityModel {
 public:
  AirDensityModel(double rho_std_kg_m3 = core::constants::kStandardAirDensityKgM3,
                  double gas_constant_j_kgk = core::constants::kDryAirGasConstantJKgK)
      : rho_std_(rho_std_kg_m3), gas_constant_(gas_constant_j_kgk) {}

  explicit AirDensityModel(const core::ModelConfig& config)
      : AirDensityModel(config.rho_std_kg_m3, config.gas_constant_j_kgk) {}

  /**
   * @brief Density from station pressure [kPa] and temperature [degC].
   *
   * Temperatures below absolute zero are clamped to it; a non-finite or non-positive result
   * falls back to the standard density.
   */
  [[nodiscard]] DensitySample evaluate(double pressure_kpa, double temperature_c) const;

  [[nodiscard]] double density(double pressure_kpa, double temperature_c) const {
    return evaluate(pressure_kpa, temperature_c).density_kg_m3;
  }

  /**
   * @brief (rho_std / rho)^(1/3); 1 for an unusable density.
   */
  [[nodiscard]] double adjustment_factor(double density_kg_m3) const;

  /**
   * @brief (rho / rho_std)^(1/3), the speed at standard density carrying the same kinetic energy flux.
   */
  [[nodiscard]] double equivalent_wind_speed_scale(double density_kg_m3) const;

  [[nodiscard]] double rho_std() const noexcept { return rho_std_; }
  [[nodiscard]] double gas_constant() const noexcept { return gas_constant_; }

 private:
  double rho_std_{};
  double gas_constant_{};
};

}  // namespace windcurtail::atmo
