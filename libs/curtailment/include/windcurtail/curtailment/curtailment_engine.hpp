/**
 * @file curtailment_engine.hpp
 * @brief Seasonal sunrise/sunset curtailment windows and blanket/smart rules.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <span>
#include <utility>
#include <vector>

#include "windcurtail/core/config.hpp"
#include "windcurtail/core/types.hpp"

namespace windcurtail::curtailment {

/**
 * @brief Sunrise and sunset of one calendar day (local time).
 */
struct SunDay {
  std::int64_t day{};
  core::LocalTime sunrise{};
  core::LocalTime sunset{};
};

/**
 * @brief Buffered daylight boundaries of one day.
 *
 * Timestamps at or before `restricted_start`, or at or after `restricted_end`, are restricted.
 */
struct CurtailmentWindow {
  std::int64_t day{};
  core::LocalTime restricted_start{};
  core::LocalTime restricted_end{};
};

/**
 * @brief Season, thresholds and smart-rule limits anchored to one processing year.
 */
struct CurtailmentRules {
  std::set<double> thresholds_mps{};
  core::LocalTime season_start{};
  core::LocalTime season_end{};
  std::int64_t buffer_seconds{core::constants::kSecondsPerHour};
  double smart_min_temperature_c{9.5};
  double smart_max_precipitation_mm{1.0};
};

/**
 * @brief Build rules from the model config; empty when a season boundary does not exist in the year.
 */
[[nodiscard]] std::optional<CurtailmentRules> make_rules(const core::ModelConfig& config);

/**
 * @brief Values the rules read from one timestamp.
 *
 * `wind_speed_mps` is the hub speed (forward) or the implied speed (back-calculation).
 */
struct CurtailmentInput {
  core::LocalTime time{};
  double wind_speed_mps{core::kMissing};
  double temperature_c{core::kMissing};
  double precipitation_mm{core::kMissing};
  double power_kw{};
};

/**
 * @brief Where a timestamp falls relative to the season and that day's window.
 */
enum class RowPhase : std::uint8_t { OutOfSeason, NoWindow, Unrestricted, Restricted };

/**
 * @brief Uncorrected power and its per-threshold blanket/smart corrections.
 */
struct CorrectedRow {
  core::LocalTime time{};
  double power_kw{};
  RowPhase phase{RowPhase::OutOfSeason};
  core::CorrectionMap corrections{};
};

/**
 * @brief Evaluates blanket/smart curtailment against a precomputed per-day window table.
 *
 * The window table is built once and only read afterwards; evaluation is a pure function of
 * the row and the table.
 */
class CurtailmentWindowEngine {
 public:
  /**
   * @brief Factory deriving a window for every in-season day of the sun table.
   *
   * Days whose buffered start is not before the buffered end contribute no window.
   */
  static std::unique_ptr<CurtailmentWindowEngine> Create(const CurtailmentRules& rules, std::span<const SunDay> sun_days);

  /**
   * @brief Buffered window of one day: (sunrise + buffer, sunset - buffer).
   */
  [[nodiscard]] static CurtailmentWindow derive_window(const SunDay& sun, std::int64_t buffer_seconds);

  [[nodiscard]] bool in_season(const core::LocalTime& t) const;
  [[nodiscard]] const CurtailmentWindow* window_for(std::int64_t day) const;
  [[nodiscard]] RowPhase classify(const core::LocalTime& t) const;

  /**
   * @brief Evaluate one row for every threshold independently.
   */
  [[nodiscard]] CorrectedRow evaluate(const CurtailmentInput& row) const;

  /**
   * @brief Evaluate a series; output is index-aligned with the input.
   */
  [[nodiscard]] std::vector<CorrectedRow> evaluate(std::span<const CurtailmentInput> rows) const;

  [[nodiscard]] const CurtailmentRules& rules() const noexcept { return rules_; }
  [[nodiscard]] const std::map<std::int64_t, CurtailmentWindow>& windows() const noexcept { return windows_; }

 private:
  CurtailmentWindowEngine(CurtailmentRules rules, std::map<std::int64_t, CurtailmentWindow> windows)
      : rules_(std::move(rules)), windows_(std::move(windows)) {}

  CurtailmentRules rules_{};
  std::map<std::int64_t, CurtailmentWindow> windows_{};
};

/**
 * @brief Pair forward estimates with their weather rows.
 * @return Empty when the two series are not the same length.
 */
[[nodiscard]] std::vector<CurtailmentInput> curtailment_inputs(std::span<const core::WeatherSample> weather,
                                                               std::span<const core::PowerEstimate> estimates);

/**
 * @brief Pair back-calculated estimates with their weather rows; power is the per-unit observation.
 * @return Empty when the two series are not the same length.
 */
[[nodiscard]] std::vector<CurtailmentInput> curtailment_inputs(std::span<const core::WeatherSample> weather,
                                                               std::span<const core::BackCalcEstimate> estimates);

[[nodiscard]] const char* row_phase_to_string(RowPhase phase);

}  // namespace windcurtail::curtailment
