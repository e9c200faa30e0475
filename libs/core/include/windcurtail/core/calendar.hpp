/**
 * @file calendar.hpp
 * @brief Civil calendar and local-time helpers.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "windcurtail/core/constants.hpp"
#include "windcurtail/core/types.hpp"

namespace windcurtail::core {

/**
 * @brief Proleptic Gregorian calendar date.
 */
struct CivilDate {
  int year{1970};
  unsigned month{1};
  unsigned day{1};
};

inline std::int64_t days_from_civil(int y, unsigned m, unsigned d) {
  y -= static_cast<int>(m <= 2);
  const int era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153U * (m + (m > 2 ? -3U : 9U)) + 2U) / 5U + d - 1U;
  const unsigned doe = yoe * 365U + yoe / 4U - yoe / 100U + doy;
  return static_cast<std::int64_t>(era) * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

inline CivilDate civil_from_days(std::int64_t z) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460U + doe / 36524U - doe / 146096U) / 365U;
  const unsigned doy = doe - (365U * yoe + yoe / 4U - yoe / 100U);
  const unsigned mp = (5U * doy + 2U) / 153U;
  const unsigned d = doy - (153U * mp + 2U) / 5U + 1U;
  const unsigned m = mp < 10U ? mp + 3U : mp - 9U;
  const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400 + static_cast<std::int64_t>(m <= 2U);
  return CivilDate{.year = static_cast<int>(y), .month = m, .day = d};
}

inline bool is_leap_year(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

inline unsigned days_in_month(int y, unsigned m) {
  constexpr unsigned kDays[12] = {31U, 28U, 31U, 30U, 31U, 30U, 31U, 31U, 30U, 31U, 30U, 31U};
  if (m < 1U || m > 12U) {
    return 0U;
  }
  return (m == 2U && is_leap_year(y)) ? 29U : kDays[m - 1U];
}

inline bool is_valid_civil_date(int y, unsigned m, unsigned d) { return d >= 1U && d <= days_in_month(y, m); }

/**
 * @brief Day number (days since 1970-01-01) of a local timestamp.
 */
inline std::int64_t day_index(const LocalTime& t) {
  const std::int64_t q = t.seconds / constants::kSecondsPerDay;
  return (t.seconds % constants::kSecondsPerDay < 0) ? q - 1 : q;
}

inline LocalTime start_of_day(std::int64_t day) { return LocalTime{.seconds = day * constants::kSecondsPerDay}; }

inline LocalTime make_local_time(int y, unsigned m, unsigned d, int hour = 0, int minute = 0, int second = 0) {
  return LocalTime{.seconds = days_from_civil(y, m, d) * constants::kSecondsPerDay + hour * constants::kSecondsPerHour +
                              minute * 60 + second};
}

/**
 * @brief Anchor a month-day to a given year at 00:00.
 * @return Empty when the month-day does not exist in that year (e.g. 02-29 in 2021).
 */
inline std::optional<LocalTime> anchor_month_day(const MonthDay& md, int year) {
  if (!is_valid_civil_date(year, md.month, md.day)) {
    return std::nullopt;
  }
  return make_local_time(year, md.month, md.day);
}

/**
 * @brief Parse `YYYY-MM-DD HH[:MM[:SS]]` (a `T` separator is also accepted) or a bare `YYYY-MM-DD`.
 */
[[nodiscard]] std::optional<LocalTime> parse_iso_local_time(std::string_view text);

/**
 * @brief Parse hour-ending `MM/DD/YYYY HH`, where hour 24 rolls over to 00 of the next day.
 */
[[nodiscard]] std::optional<LocalTime> parse_hour_ending_time(std::string_view text);

/**
 * @brief Parse either timestamp format accepted by the series readers.
 */
[[nodiscard]] std::optional<LocalTime> parse_local_time(std::string_view text);

/**
 * @brief Parse `MM-DD`.
 */
[[nodiscard]] std::optional<MonthDay> parse_month_day(std::string_view text);

/**
 * @brief Parse `Mon DD YYYY` (e.g. `Jul 15 2020`).
 */
[[nodiscard]] std::optional<CivilDate> parse_month_name_date(std::string_view text);

/**
 * @brief Parse a clock time `HH:MM[:SS]` into seconds after midnight.
 */
[[nodiscard]] std::optional<std::int64_t> parse_time_of_day(std::string_view text);

/**
 * @brief Format as `YYYY-MM-DD HH:MM:SS`.
 */
[[nodiscard]] std::string format_local_time(const LocalTime& t);

}  // namespace windcurtail::core
