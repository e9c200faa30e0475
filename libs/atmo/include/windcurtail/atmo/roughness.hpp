/**
 * @file roughness.hpp
 * @brief Seasonal surface roughness lookup.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <span>
#include <string>

#include "windcurtail/core/types.hpp"

namespace windcurtail::atmo {

/**
 * @brief Land-cover season used to pick a roughness length.
 */
enum class RoughnessSeason : unsigned char { SummerJunJul, PreharvestAug, PostharvestSepNov, SnowDecFeb, SpringMarMay, Unknown };

[[nodiscard]] RoughnessSeason season_for_month(unsigned month);

[[nodiscard]] const char* season_name(RoughnessSeason season);

/**
 * @brief Roughness length [m] for a month; NaN for an invalid month.
 */
[[nodiscard]] double roughness_for_month(const core::SeasonalRoughness& table, unsigned month);

/**
 * @brief Roughness length [m] for the month of a local timestamp.
 */
[[nodiscard]] double roughness_at(const core::SeasonalRoughness& table, const core::LocalTime& time);

/**
 * @brief Fill `surface_roughness_m` of each row from the seasonal table.
 * @return Number of rows that received a non-positive or missing roughness.
 */
std::size_t assign_seasonal_roughness(std::span<core::WeatherSample> rows, const core::SeasonalRoughness& table);

/**
 * @brief Check that every season has a positive roughness.
 * @return Empty string when valid, otherwise the first offending season.
 */
[[nodiscard]] std::string validate_roughness(const core::SeasonalRoughness& table);

}  // namespace windcurtail::atmo
