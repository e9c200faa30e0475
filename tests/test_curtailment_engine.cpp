/**
 * @file test_curtailment_engine.cpp
 * @brief Sunrise/sunset window and blanket/smart rule tests.
 * @author Watosn
 */

#include <cmath>
#include <vector>

#include <spdlog/spdlog.h>

#include "windcurtail/core/calendar.hpp"
#include "windcurtail/curtailment/curtailment_engine.hpp"

namespace {

using windcurtail::core::make_local_time;

windcurtail::curtailment::SunDay sun_day(unsigned month, unsigned day, int rise_h, int set_h) {
  return windcurtail::curtailment::SunDay{.day = windcurtail::core::days_from_civil(2020, month, day),
                                          .sunrise = make_local_time(2020, month, day, rise_h),
                                          .sunset = make_local_time(2020, month, day, set_h)};
}

windcurtail::curtailment::CurtailmentInput input(windcurtail::core::LocalTime t, double wind, double temp, double precip) {
  return windcurtail::curtailment::CurtailmentInput{
      .time = t, .wind_speed_mps = wind, .temperature_c = temp, .precipitation_mm = precip, .power_kw = 250.0};
}

}  // namespace

int main() {
  using namespace windcurtail;

  const auto rules = curtailment::make_rules(core::ModelConfig{});
  if (!rules || rules->buffer_seconds != 3600 || rules->season_start != make_local_time(2020, 7, 15) ||
      rules->season_end != make_local_time(2020, 9, 30) || rules->thresholds_mps.size() != 7U) {
    spdlog::error("rules from default config wrong");
    return 1;
  }

  const std::vector<curtailment::SunDay> sun{
      sun_day(7, 14, 6, 20),  // before the season, ignored
      sun_day(7, 15, 6, 20), sun_day(7, 16, 6, 20), sun_day(9, 30, 7, 19),
      sun_day(8, 1, 10, 11),  // buffered window is inverted
  };
  const auto engine = curtailment::CurtailmentWindowEngine::Create(*rules, sun);
  if (engine->windows().size() != 3U || engine->window_for(core::days_from_civil(2020, 7, 14)) != nullptr ||
      engine->window_for(core::days_from_civil(2020, 8, 1)) != nullptr) {
    spdlog::error("window table wrong: {} windows", engine->windows().size());
    return 2;
  }
  const auto* w = engine->window_for(core::days_from_civil(2020, 7, 16));
  if (w == nullptr || w->restricted_start != make_local_time(2020, 7, 16, 7) ||
      w->restricted_end != make_local_time(2020, 7, 16, 19)) {
    spdlog::error("window derivation wrong");
    return 3;
  }

  // 06:30, below threshold, warm and dry: blanket and smart both zero.
  const auto early = engine->evaluate(input(make_local_time(2020, 7, 16, 6, 30), 4.0, 10.0, 0.0));
  const auto& e5 = early.corrections.at(5.0);
  if (early.phase != curtailment::RowPhase::Restricted || e5.blanket_kw != 0.0 || e5.smart_kw != 0.0 ||
      early.power_kw != 250.0) {
    spdlog::error("restricted warm/dry row not curtailed");
    return 4;
  }
  // Same row but cold: only blanket curtailed.
  const auto cold = engine->evaluate(input(make_local_time(2020, 7, 16, 6, 30), 4.0, 5.0, 0.0));
  if (cold.corrections.at(5.0).blanket_kw != 0.0 || cold.corrections.at(5.0).smart_kw != 250.0) {
    spdlog::error("smart rule must not curtail cold rows");
    return 5;
  }
  // Wet: only blanket curtailed.
  const auto wet = engine->evaluate(input(make_local_time(2020, 7, 16, 21), 4.0, 15.0, 1.0));
  if (wet.corrections.at(5.0).blanket_kw != 0.0 || wet.corrections.at(5.0).smart_kw != 250.0) {
    spdlog::error("smart rule must not curtail wet rows");
    return 6;
  }
  // Exactly on the smart temperature bound is not warm enough.
  const auto bound = engine->evaluate(input(make_local_time(2020, 7, 16, 6, 30), 4.0, 9.5, 0.0));
  if (bound.corrections.at(5.0).smart_kw != 250.0) {
    spdlog::error("temperature bound must be strict");
    return 7;
  }

  // Midday is unrestricted.
  const auto noon = engine->evaluate(input(make_local_time(2020, 7, 16, 12), 4.0, 10.0, 0.0));
  if (noon.phase != curtailment::RowPhase::Unrestricted) {
    spdlog::error("midday must be unrestricted");
    return 8;
  }
  for (const auto& entry : noon.corrections) {
    if (entry.second.blanket_kw != 250.0 || entry.second.smart_kw != 250.0) {
      spdlog::error("midday row curtailed at {}", entry.first);
      return 9;
    }
  }

  // Window edges are inclusive on both sides.
  const auto at_start = engine->evaluate(input(make_local_time(2020, 7, 16, 7), 4.0, 10.0, 0.0));
  const auto at_end = engine->evaluate(input(make_local_time(2020, 7, 16, 19), 4.0, 10.0, 0.0));
  const auto inside = engine->evaluate(input(make_local_time(2020, 7, 16, 7, 0, 1), 4.0, 10.0, 0.0));
  if (at_start.phase != curtailment::RowPhase::Restricted || at_end.phase != curtailment::RowPhase::Restricted ||
      inside.phase != curtailment::RowPhase::Unrestricted) {
    spdlog::error("window edge handling wrong");
    return 10;
  }

  // Thresholds are independent and monotone.
  const auto mid = engine->evaluate(input(make_local_time(2020, 7, 16, 5), 6.2, 10.0, 0.0));
  bool curtailed_below = false;
  for (const auto& entry : mid.corrections) {
    const bool curtailed = entry.second.blanket_kw == 0.0;
    if (curtailed != (6.2 <= entry.first)) {
      spdlog::error("threshold {} evaluated wrongly", entry.first);
      return 11;
    }
    if (curtailed_below && !curtailed) {
      spdlog::error("threshold monotonicity violated at {}", entry.first);
      return 12;
    }
    curtailed_below = curtailed_below || curtailed;
  }
  const auto equal = engine->evaluate(input(make_local_time(2020, 7, 16, 5), 6.5, 10.0, 0.0));
  if (equal.corrections.at(6.5).blanket_kw != 0.0 || equal.corrections.at(6.0).blanket_kw != 250.0) {
    spdlog::error("wind equal to the threshold must be curtailed");
    return 13;
  }

  // Missing wind never curtails.
  const auto missing = engine->evaluate(input(make_local_time(2020, 7, 16, 5), std::nan(""), 10.0, 0.0));
  for (const auto& entry : missing.corrections) {
    if (entry.second.blanket_kw != 250.0 || entry.second.smart_kw != 250.0) {
      spdlog::error("missing wind curtailed at {}", entry.first);
      return 14;
    }
  }

  // Season boundaries.
  const auto before = engine->evaluate(input(core::LocalTime{.seconds = make_local_time(2020, 7, 15).seconds - 1}, 0.0, 20.0, 0.0));
  const auto at_season_start = engine->evaluate(input(make_local_time(2020, 7, 15), 0.0, 20.0, 0.0));
  if (before.phase != curtailment::RowPhase::OutOfSeason || before.corrections.at(8.0).blanket_kw != 250.0 ||
      at_season_start.phase != curtailment::RowPhase::Restricted || at_season_start.corrections.at(5.0).blanket_kw != 0.0) {
    spdlog::error("season start boundary wrong");
    return 15;
  }
  const auto last_midnight = engine->evaluate(input(make_local_time(2020, 9, 30), 0.0, 20.0, 0.0));
  const auto last_evening = engine->evaluate(input(make_local_time(2020, 9, 30, 21), 0.0, 20.0, 0.0));
  if (last_midnight.phase != curtailment::RowPhase::Restricted || last_evening.phase != curtailment::RowPhase::OutOfSeason) {
    spdlog::error("season end boundary wrong");
    return 16;
  }

  // In season but without a window (no sun data, or inverted window).
  const auto no_sun = engine->evaluate(input(make_local_time(2020, 8, 20, 5), 0.0, 20.0, 0.0));
  const auto short_day = engine->evaluate(input(make_local_time(2020, 8, 1, 5), 0.0, 20.0, 0.0));
  if (no_sun.phase != curtailment::RowPhase::NoWindow || short_day.phase != curtailment::RowPhase::NoWindow ||
      no_sun.corrections.at(5.0).blanket_kw != 250.0 || short_day.corrections.at(5.0).smart_kw != 250.0) {
    spdlog::error("days without a window must pass through");
    return 17;
  }

  // Evaluation is pure: same input, same output, input order preserved.
  const std::vector<curtailment::CurtailmentInput> rows{
      input(make_local_time(2020, 7, 16, 5), 4.0, 12.0, 0.0), input(make_local_time(2020, 7, 16, 12), 4.0, 12.0, 0.0),
      input(make_local_time(2020, 7, 16, 22), 9.0, 12.0, 0.0)};
  const auto a = engine->evaluate(rows);
  const auto b = engine->evaluate(rows);
  if (a.size() != 3U || a[1].time != rows[1].time || a[2].corrections.at(8.0).blanket_kw != 250.0) {
    spdlog::error("series evaluation wrong");
    return 18;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    for (const auto& entry : a[i].corrections) {
      const auto& other = b[i].corrections.at(entry.first);
      if (entry.second.blanket_kw != other.blanket_kw || entry.second.smart_kw != other.smart_kw) {
        spdlog::error("evaluation not repeatable at row {}", i);
        return 19;
      }
    }
  }

  std::vector<core::WeatherSample> weather(2);
  std::vector<core::PowerEstimate> estimates(3);
  if (!curtailment::curtailment_inputs(weather, estimates).empty()) {
    spdlog::error("mismatched pairing must give no inputs");
    return 20;
  }
  return 0;
}
