/**
 * @file roughness.cpp
 * @brief Seasonal roughness lookup implementation.
 * @author Watosn
 */

#include "windcurtail/atmo/roughness.hpp"

#include <array>
#include <utility>

#include <fmt/format.h>

#include "windcurtail/core/calendar.hpp"

namespace windcurtail::atmo {

RoughnessSeason season_for_month(unsigned month) {
  switch (month) {
    case 6:
    case 7:
      return RoughnessSeason::SummerJunJul;
    case 8:
      return RoughnessSeason::PreharvestAug;
    case 9:
    case 10:
    case 11:
      return RoughnessSeason::PostharvestSepNov;
    case 12:
    case 1:
    case 2:
      return RoughnessSeason::SnowDecFeb;
    case 3:
    case 4:
    case 5:
      return RoughnessSeason::SpringMarMay;
    default:
      return RoughnessSeason::Unknown;
  }
}

const char* season_name(RoughnessSeason season) {
  switch (season) {
    case RoughnessSeason::SummerJunJul:
      return "Summer Jun-Jul";
    case RoughnessSeason::PreharvestAug:
      return "Pre-harvest Aug";
    case RoughnessSeason::PostharvestSepNov:
      return "Post-harvest/pre-snow Sep-Nov";
    case RoughnessSeason::SnowDecFeb:
      return "Snow covered Dec-Feb";
    case RoughnessSeason::SpringMarMay:
      return "Spring Mar-May";
    default:
      return "Unknown";
  }
}

double roughness_for_month(const core::SeasonalRoughness& table, unsigned month) {
  switch (season_for_month(month)) {
    case RoughnessSeason::SummerJunJul:
      return table.summer_jun_jul_m;
    case RoughnessSeason::PreharvestAug:
      return table.preharvest_aug_m;
    case RoughnessSeason::PostharvestSepNov:
      return table.postharvest_sep_nov_m;
    case RoughnessSeason::SnowDecFeb:
      return table.snow_dec_feb_m;
    case RoughnessSeason::SpringMarMay:
      return table.spring_mar_may_m;
    default:
      return core::kMissing;
  }
}

double roughness_at(const core::SeasonalRoughness& table, const core::LocalTime& time) {
  return roughness_for_month(table, core::civil_from_days(core::day_index(time)).month);
}

std::size_t assign_seasonal_roughness(std::span<core::WeatherSample> rows, const core::SeasonalRoughness& table) {
  std::size_t unusable = 0;
  for (auto& row : rows) {
    row.surface_roughness_m = roughness_at(table, row.time);
    if (!(row.surface_roughness_m > 0.0)) {
      ++unusable;
    }
  }
  return unusable;
}

std::string validate_roughness(const core::SeasonalRoughness& table) {
  const std::array<std::pair<RoughnessSeason, double>, 5> entries{{
      {RoughnessSeason::SummerJunJul, table.summer_jun_jul_m},
      {RoughnessSeason::PreharvestAug, table.preharvest_aug_m},
      {RoughnessSeason::PostharvestSepNov, table.postharvest_sep_nov_m},
      {RoughnessSeason::SnowDecFeb, table.snow_dec_feb_m},
      {RoughnessSeason::SpringMarMay, table.spring_mar_may_m},
  }};
  for (const auto& [season, value] : entries) {
    if (!(value > 0.0)) {
      return fmt::format("invalid roughness value for '{}': {}", season_name(season), value);
    }
  }
  return {};
}

}  // namespace windcurtail::atmo
