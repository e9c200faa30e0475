/**
 * @file types.hpp
 * @brief Core domain types for windcurtail.
 * @author Watosn
 */
#pragma once

#include <cmath>
#include <cstdint>
#include <limits>
#include <map>

namespace windcurtail::core {

/**
 * @brief Standard status code used by model outputs.
 */
enum class Status : std::uint8_t { Ok, InvalidInput, NotImplemented, DataUnavailable, NumericalError };

/**
 * @brief Quiet NaN used as the "missing value" marker in series.
 */
inline constexpr double kMissing = std::numeric_limits<double>::quiet_NaN();

[[nodiscard]] inline bool is_missing(double v) { return std::isnan(v); }

/**
 * @brief Local standard time expressed as whole seconds since 1970-01-01 00:00.
 *
 * No time zone or DST is attached; all site series are in the same local clock.
 */
struct LocalTime {
  std::int64_t seconds{};
};

inline bool operator==(const LocalTime& a, const LocalTime& b) { return a.seconds == b.seconds; }
inline bool operator!=(const LocalTime& a, const LocalTime& b) { return a.seconds != b.seconds; }
inline bool operator<(const LocalTime& a, const LocalTime& b) { return a.seconds < b.seconds; }
inline bool operator<=(const LocalTime& a, const LocalTime& b) { return a.seconds <= b.seconds; }
inline bool operator>(const LocalTime& a, const LocalTime& b) { return a.seconds > b.seconds; }
inline bool operator>=(const LocalTime& a, const LocalTime& b) { return a.seconds >= b.seconds; }

/**
 * @brief Calendar month and day, used for season boundaries.
 */
struct MonthDay {
  unsigned month{1};
  unsigned day{1};
};

/**
 * @brief One meteorological observation (typically hourly).
 */
struct WeatherSample {
  LocalTime time{};
  double wind_speed_ref_mps{};
  double temperature_c{};
  double pressure_kpa{kMissing};
  double precipitation_mm{};
  double surface_roughness_m{};
};

/**
 * @brief One (wind speed, power) point of a manufacturer power curve.
 */
struct PowerCurveSample {
  double wind_speed_mps{};
  double power_kw{};
};

/**
 * @brief Seasonal surface roughness lengths for one site.
 */
struct SeasonalRoughness {
  double summer_jun_jul_m{};
  double preharvest_aug_m{};
  double postharvest_sep_nov_m{};
  double snow_dec_feb_m{};
  double spring_mar_may_m{};
};

/**
 * @brief Forward estimator output for one weather row.
 */
struct PowerEstimate {
  LocalTime time{};
  double hub_wind_speed_mps{};
  double estimated_power_kw{};
  double adjustment_factor{1.0};
  double site_density_kg_m3{};
};

/**
 * @brief Inverse estimator output for one observed-power row.
 *
 * `implied_hub_wind_speed_mps` is NaN when the observation cannot be inverted.
 */
struct BackCalcEstimate {
  LocalTime time{};
  double implied_hub_wind_speed_mps{kMissing};
  double per_unit_power_kw{kMissing};
  double site_density_kg_m3{};
};

/**
 * @brief Blanket/smart corrected power for one cut-in threshold.
 */
struct ThresholdCorrection {
  double blanket_kw{};
  double smart_kw{};
};

/**
 * @brief Per-threshold corrections keyed by the numeric threshold [m/s].
 */
using CorrectionMap = std::map<double, ThresholdCorrection>;

}  // namespace windcurtail::core

namespace windcurtail {

using Status = core::Status;
using LocalTime = core::LocalTime;
using MonthDay = core::MonthDay;
using WeatherSample = core::WeatherSample;
using PowerCurveSample = core::PowerCurveSample;
using SeasonalRoughness = core::SeasonalRoughness;
using PowerEstimate = core::PowerEstimate;
using BackCalcEstimate = core::BackCalcEstimate;
using ThresholdCorrection = core::ThresholdCorrection;
using CorrectionMap = core::CorrectionMap;

}  // namespace windcurtail
