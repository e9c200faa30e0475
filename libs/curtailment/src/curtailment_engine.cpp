/**
 * @file curtailment_engine.cpp
 * @brief Curtailment window derivation and rule evaluation.
 * @author Watosn
 */

#include "windcurtail/curtailment/curtailment_engine.hpp"

#include <cmath>

#include <spdlog/spdlog.h>

#include "windcurtail/core/calendar.hpp"

namespace windcurtail::curtailment {

std::optional<CurtailmentRules> make_rules(const core::ModelConfig& config) {
  const auto start = core::anchor_month_day(config.season_start, config.year);
  const auto end = core::anchor_month_day(config.season_end, config.year);
  if (!start.has_value() || !end.has_value()) {
    return std::nullopt;
  }
  return CurtailmentRules{
      .thresholds_mps = config.cut_in_thresholds_mps,
      .season_start = *start,
      .season_end = *end,
      .buffer_seconds = static_cast<std::int64_t>(
          std::llround(config.buffer_hours * static_cast<double>(core::constants::kSecondsPerHour))),
      .smart_min_temperature_c = config.smart_min_temperature_c,
      .smart_max_precipitation_mm = config.smart_max_precipitation_mm,
  };
}

CurtailmentWindow CurtailmentWindowEngine::derive_window(const SunDay& sun, std::int64_t buffer_seconds) {
  return CurtailmentWindow{.day = sun.day,
                           .restricted_start = core::LocalTime{.seconds = sun.sunrise.seconds + buffer_seconds},
                           .restricted_end = core::LocalTime{.seconds = sun.sunset.seconds - buffer_seconds}};
}

std::unique_ptr<CurtailmentWindowEngine> CurtailmentWindowEngine::Create(const CurtailmentRules& rules,
                                                                         std::span<const SunDay> sun_days) {
  const std::int64_t first_day = core::day_index(rules.season_start);
  const std::int64_t last_day = core::day_index(rules.season_end);

  std::map<std::int64_t, CurtailmentWindow> windows;
  std::size_t inverted = 0;
  for (const auto& sun : sun_days) {
    if (sun.day < first_day || sun.day > last_day) {
      continue;
    }
    const auto w = derive_window(sun, rules.buffer_seconds);
    if (!(w.restricted_start < w.restricted_end)) {
      ++inverted;
      spdlog::debug("no restricted interval on {}: buffered sunrise is not before buffered sunset",
                    core::format_local_time(core::start_of_day(sun.day)));
      continue;
    }
    windows.emplace(sun.day, w);
  }

  if (inverted > 0U) {
    spdlog::warn("{} in-season days have too little daylight for a window and are skipped", inverted);
  }
  if (windows.empty()) {
    spdlog::warn("no sun data found for season {} to {}", core::format_local_time(rules.season_start),
                 core::format_local_time(rules.season_end));
  } else {
    spdlog::info("derived curtailment windows for {} days", windows.size());
  }
  return std::unique_ptr<CurtailmentWindowEngine>(new CurtailmentWindowEngine(rules, std::move(windows)));
}

bool CurtailmentWindowEngine::in_season(const core::LocalTime& t) const {
  return rules_.season_start <= t && t <= rules_.season_end;
}

const CurtailmentWindow* CurtailmentWindowEngine::window_for(std::int64_t day) const {
  const auto it = windows_.find(day);
  return it == windows_.end() ? nullptr : &it->second;
}

RowPhase CurtailmentWindowEngine::classify(const core::LocalTime& t) const {
  if (!in_season(t)) {
    return RowPhase::OutOfSeason;
  }
  const auto* w = window_for(core::day_index(t));
  if (w == nullptr) {
    return RowPhase::NoWindow;
  }
  if (t <= w->restricted_start || t >= w->restricted_end) {
    return RowPhase::Restricted;
  }
  return RowPhase::Unrestricted;
}

CorrectedRow CurtailmentWindowEngine::evaluate(const CurtailmentInput& row) const {
  CorrectedRow out{.time = row.time, .power_kw = row.power_kw, .phase = classify(row.time)};
  for (const double threshold : rules_.thresholds_mps) {
    ThresholdCorrection c{.blanket_kw = row.power_kw, .smart_kw = row.power_kw};
    if (out.phase == RowPhase::Restricted && !std::isnan(row.wind_speed_mps) && row.wind_speed_mps <= threshold) {
      c.blanket_kw = 0.0;
      if (row.temperature_c > rules_.smart_min_temperature_c && row.precipitation_mm < rules_.smart_max_precipitation_mm) {
        c.smart_kw = 0.0;
      }
    }
    out.corrections.emplace(threshold, c);
  }
  return out;
}

std::vector<CorrectedRow> CurtailmentWindowEngine::evaluate(std::span<const CurtailmentInput> rows) const {
  std::vector<CorrectedRow> out;
  out.reserve(rows.size());
  for (const auto& row : rows) {
    out.push_back(evaluate(row));
  }
  return out;
}

std::vector<CurtailmentInput> curtailment_inputs(std::span<const core::WeatherSample> weather,
                                                 std::span<const core::PowerEstimate> estimates) {
  if (weather.size() != estimates.size()) {
    spdlog::error("cannot pair {} estimates with {} weather rows", estimates.size(), weather.size());
    return {};
  }
  std::vector<CurtailmentInput> out;
  out.reserve(weather.size());
  for (std::size_t i = 0; i < weather.size(); ++i) {
    out.push_back(CurtailmentInput{.time = estimates[i].time,
                                   .wind_speed_mps = estimates[i].hub_wind_speed_mps,
                                   .temperature_c = weather[i].temperature_c,
                                   .precipitation_mm = weather[i].precipitation_mm,
                                   .power_kw = estimates[i].estimated_power_kw});
  }
  return out;
}

std::vector<CurtailmentInput> curtailment_inputs(std::span<const core::WeatherSample> weather,
                                                 std::span<const core::BackCalcEstimate> estimates) {
  if (weather.size() != estimates.size()) {
    spdlog::error("cannot pair {} back-calculated rows with {} weather rows", estimates.size(), weather.size());
    return {};
  }
  std::vector<CurtailmentInput> out;
  out.reserve(weather.size());
  for (std::size_t i = 0; i < weather.size(); ++i) {
    out.push_back(CurtailmentInput{.time = estimates[i].time,
                                   .wind_speed_mps = estimates[i].implied_hub_wind_speed_mps,
                                   .temperature_c = weather[i].temperature_c,
                                   .precipitation_mm = weather[i].precipitation_mm,
                                   .power_kw = estimates[i].per_unit_power_kw});
  }
  return out;
}

const char* row_phase_to_string(RowPhase phase) {
  switch (phase) {
    case RowPhase::OutOfSeason:
      return "out_of_season";
    case RowPhase::NoWindow:
      return "no_window";
    case RowPhase::Unrestricted:
      return "unrestricted";
    case RowPhase::Restricted:
      return "restricted";
    default:
      return "unknown";
  }
}

}  // namespace windcurtail::curtailment
