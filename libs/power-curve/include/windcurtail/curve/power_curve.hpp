/**
 * @file power_curve.hpp
 * @brief Manufacturer power curve with forward and inverse lookup.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "windcurtail/core/types.hpp"

namespace windcurtail::curve {

/**
 * @brief Non-fatal quality report for a power curve.
 */
struct CurveValidation {
  bool valid{};
  bool monotone_wind_speed{true};
  bool non_negative_power{true};
  std::string message{};
};

class PowerCurve;

/**
 * @brief Loader output bundle.
 */
struct PowerCurveLoad;

/**
 * @brief Piecewise-linear turbine power curve.
 *
 * Forward lookups use all samples ordered by wind speed. Inverse lookups use the ascending
 * branch only: repeated power values keep the lowest wind speed (so 0 kW maps to the first
 * zero-power sample), and samples past the first peak (cut-out decline) are ignored.
 */
class PowerCurve {
 public:
  PowerCurve() = default;

  /**
   * @brief Build from samples in file order (order is kept for validation).
   */
  explicit PowerCurve(std::vector<core::PowerCurveSample> samples);

  /**
   * @brief Linear interpolation of power at a wind speed.
   * @return Power [kW]; 0 outside the sampled wind-speed range or for non-finite input, never negative.
   */
  [[nodiscard]] double lookup_power(double wind_speed_mps) const;

  /**
   * @brief Inverse interpolation of wind speed producing a power value.
   * @return Wind speed [m/s], or NaN when the power lies outside the achievable range.
   */
  [[nodiscard]] double lookup_wind_speed(double power_kw) const;

  /**
   * @brief Check sample count, wind-speed ordering and power sign. Problems other than
   * too few samples are reported but leave the curve usable.
   */
  [[nodiscard]] CurveValidation validate() const;

  [[nodiscard]] bool empty() const noexcept { return samples_.empty(); }
  [[nodiscard]] std::size_t size() const noexcept { return samples_.size(); }
  [[nodiscard]] const std::vector<core::PowerCurveSample>& samples() const noexcept { return samples_; }
  [[nodiscard]] const std::vector<core::PowerCurveSample>& inverse_samples() const noexcept { return inverse_; }
  [[nodiscard]] double rated_power_kw() const noexcept { return inverse_.empty() ? 0.0 : inverse_.back().power_kw; }

  /**
   * @brief Load a whitespace/tab/comma separated table of (wind speed, power) rows.
   *
   * A leading non-numeric line is treated as the header.
   */
  static PowerCurveLoad load_table(const std::filesystem::path& path);

 private:
  std::vector<core::PowerCurveSample> samples_{};
  std::vector<core::PowerCurveSample> forward_{};
  std::vector<core::PowerCurveSample> inverse_{};
};

struct PowerCurveLoad {
  PowerCurve curve{};
  core::Status status{core::Status::Ok};
  std::string message{};
};

}  // namespace windcurtail::curve
