/**
 * @file constants.hpp
 * @brief Shared physical and unit constants.
 * @author Watosn
 */
#pragma once

#include <cstdint>

namespace windcurtail::core::constants {

inline constexpr double kStandardAirDensityKgM3 = 1.225;
inline constexpr double kDryAirGasConstantJKgK = 287.05;
inline constexpr double kAbsoluteZeroC = -273.15;
inline constexpr double kDefaultRoughnessM = 0.1;
inline constexpr double kPaPerKPa = 1000.0;
inline constexpr double kKmhToMps = 0.27778;
inline constexpr double kKwPerMw = 1000.0;
inline constexpr std::int64_t kSecondsPerHour = 3600;
inline constexpr std::int64_t kSecondsPerDay = 86400;

}  // namespace windcurtail::core::constants
