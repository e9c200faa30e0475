/**
 * @file config.hpp
 * @brief Immutable model configuration and its YAML loader.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <set>
#include <string>

#include "windcurtail/core/constants.hpp"
#include "windcurtail/core/types.hpp"

namespace windcurtail::core {

/**
 * @brief Which air density feeds the power-curve correction factor.
 *
 * `StandardDensity` keeps the historical behaviour: the site density is computed and reported,
 * but the standard constant is used for the factor (which is then exactly 1).
 */
enum class DensityCorrection : std::uint8_t { StandardDensity, SiteDensity };

/**
 * @brief Vertical wind profile law used for hub-height extrapolation.
 */
enum class WindProfileLaw : std::uint8_t { Logarithmic, PowerLaw };

/**
 * @brief Run-wide constants, thresholds and season definition.
 */
struct ModelConfig {
  double reference_height_m{10.0};
  double rho_std_kg_m3{constants::kStandardAirDensityKgM3};
  double gas_constant_j_kgk{constants::kDryAirGasConstantJKgK};
  double loss_fraction{0.0};
  std::set<double> cut_in_thresholds_mps{5.0, 5.5, 6.0, 6.5, 7.0, 7.5, 8.0};
  MonthDay season_start{.month = 7, .day = 15};
  MonthDay season_end{.month = 9, .day = 30};
  int year{2020};
  double buffer_hours{1.0};
  double smart_min_temperature_c{9.5};
  double smart_max_precipitation_mm{1.0};
  DensityCorrection density_correction{DensityCorrection::StandardDensity};
  WindProfileLaw wind_profile{WindProfileLaw::Logarithmic};
  double power_law_alpha{0.143};
  double wind_speed_conversion{constants::kKmhToMps};
  double observed_power_scale_kw{constants::kKwPerMw};
};

/**
 * @brief Loader output: parsed config plus status and reason on failure.
 */
struct ModelConfigLoad {
  ModelConfig config{};
  Status status{Status::Ok};
  std::string message{};
};

/**
 * @brief Check ranges and cross-field consistency.
 * @return Empty string when valid, otherwise the first problem found.
 */
[[nodiscard]] std::string validate_model_config(const ModelConfig& config);

/**
 * @brief Load a YAML mapping of overrides on top of the defaults.
 *
 * A missing file is `DataUnavailable`; YAML syntax errors, values of the wrong type and
 * failed validation are `InvalidInput`. Unknown keys are logged and ignored.
 */
[[nodiscard]] ModelConfigLoad load_model_config(const std::filesystem::path& path);

/**
 * @brief Parse YAML overrides from text already in memory.
 */
[[nodiscard]] ModelConfigLoad parse_model_config(const std::string& text);

[[nodiscard]] const char* density_correction_to_string(DensityCorrection mode);

[[nodiscard]] const char* wind_profile_to_string(WindProfileLaw law);

}  // namespace windcurtail::core
