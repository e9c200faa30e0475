/**
 * @file test_model_config.cpp
 * @brief Model configuration defaults, parsing and calendar helper tests.
 * @author Watosn
 */

#include <filesystem>
#include <set>

#include <spdlog/spdlog.h>

#include "windcurtail/core/calendar.hpp"
#include "windcurtail/core/config.hpp"

int main() {
  using namespace windcurtail;

  const core::ModelConfig defaults{};
  if (defaults.reference_height_m != 10.0 || defaults.cut_in_thresholds_mps.size() != 7U ||
      *defaults.cut_in_thresholds_mps.begin() != 5.0 || *defaults.cut_in_thresholds_mps.rbegin() != 8.0 ||
      defaults.season_start.month != 7U || defaults.season_start.day != 15U || defaults.season_end.month != 9U ||
      defaults.season_end.day != 30U || defaults.density_correction != core::DensityCorrection::StandardDensity ||
      defaults.wind_profile != core::WindProfileLaw::Logarithmic || defaults.buffer_hours != 1.0) {
    spdlog::error("defaults do not match the documented values");
    return 1;
  }
  if (!core::validate_model_config(defaults).empty()) {
    spdlog::error("defaults must validate");
    return 2;
  }

  const auto parsed = core::parse_model_config(
      "# site overrides\n"
      "reference_height_m: 12\n"
      "cut_in_thresholds_mps: [6.0, 4.5, 5]\n"
      "season_start: \"06-01\"   # earlier start\n"
      "season_end: 10-15\n"
      "year: 2021\n"
      "density_correction: site\n"
      "wind_profile: power\n"
      "power_law_alpha: 0.2\n"
      "\n"
      "some_future_key: 3\n");
  const auto& c = parsed.config;
  if (parsed.status != core::Status::Ok || c.reference_height_m != 12.0 || c.cut_in_thresholds_mps.size() != 3U ||
      *c.cut_in_thresholds_mps.begin() != 4.5 || c.season_start.month != 6U || c.season_end.day != 15U ||
      c.year != 2021 || c.density_correction != core::DensityCorrection::SiteDensity ||
      c.wind_profile != core::WindProfileLaw::PowerLaw || c.power_law_alpha != 0.2 || c.loss_fraction != 0.0) {
    spdlog::error("override parsing failed: {}", parsed.message);
    return 3;
  }
  const auto single = core::parse_model_config("cut_in_thresholds_mps: 6.5\n");
  if (single.status != core::Status::Ok || single.config.cut_in_thresholds_mps != std::set<double>{6.5}) {
    spdlog::error("a scalar threshold must be accepted: {}", single.message);
    return 14;
  }
  if (core::parse_model_config("# only a comment\n").status != core::Status::Ok) {
    spdlog::error("an empty document must yield the defaults");
    return 15;
  }

  if (core::parse_model_config("loss_fraction: abc\n").status != core::Status::InvalidInput ||
      core::parse_model_config("loss_fraction: 1.0\n").status != core::Status::InvalidInput ||
      core::parse_model_config("year: 2020.5\n").status != core::Status::InvalidInput ||
      core::parse_model_config("just text\n").status != core::Status::InvalidInput ||
      core::parse_model_config("cut_in_thresholds_mps: [5.0, 6.0\n").status != core::Status::InvalidInput ||
      core::parse_model_config("season_start: \"02-30\"\n").status != core::Status::InvalidInput ||
      core::parse_model_config("season_start: \"10-01\"\nseason_end: \"09-01\"\n").status !=
          core::Status::InvalidInput ||
      core::parse_model_config("density_correction: exact\n").status != core::Status::InvalidInput ||
      core::parse_model_config("cut_in_thresholds_mps: []\n").status != core::Status::InvalidInput) {
    spdlog::error("malformed config must be rejected");
    return 4;
  }
  if (core::load_model_config(std::filesystem::temp_directory_path() / "windcurtail_missing.yaml").status !=
      core::Status::DataUnavailable) {
    spdlog::error("missing config file must be DataUnavailable");
    return 5;
  }
#ifdef WINDCURTAIL_SOURCE_DIR
  const auto from_file =
      core::load_model_config(std::filesystem::path(WINDCURTAIL_SOURCE_DIR) / "tests" / "data" / "model.yaml");
  if (from_file.status != core::Status::Ok || from_file.config.cut_in_thresholds_mps.size() != 7U ||
      from_file.config.season_start.month != 7U || from_file.config.year != 2020) {
    spdlog::error("fixture config failed to load: {}", from_file.message);
    return 16;
  }
#endif

  // Calendar helpers.
  if (core::days_from_civil(1970, 1, 1) != 0 || core::days_from_civil(2020, 7, 15) != 18458) {
    spdlog::error("days_from_civil wrong");
    return 6;
  }
  const auto back = core::civil_from_days(18458);
  if (back.year != 2020 || back.month != 7U || back.day != 15U) {
    spdlog::error("civil_from_days wrong");
    return 7;
  }
  const auto iso = core::parse_local_time("2020-07-15 06:30");
  if (!iso || *iso != core::make_local_time(2020, 7, 15, 6, 30) ||
      core::format_local_time(*iso) != "2020-07-15 06:30:00") {
    spdlog::error("ISO timestamp parsing failed");
    return 8;
  }
  const auto he24 = core::parse_local_time("07/15/2020 24");
  const auto he01 = core::parse_local_time("07/15/2020 01");
  if (!he24 || *he24 != core::make_local_time(2020, 7, 16) || !he01 || *he01 != core::make_local_time(2020, 7, 15, 1)) {
    spdlog::error("hour-ending timestamp parsing failed");
    return 9;
  }
  if (core::parse_local_time("2020-13-01 00:00") || core::parse_local_time("yesterday")) {
    spdlog::error("invalid timestamps must not parse");
    return 10;
  }
  const auto named = core::parse_month_name_date("Jul 15 2019");
  const auto tod = core::parse_time_of_day("05:42:10");
  if (!named || named->month != 7U || named->day != 15U || named->year != 2019 || !tod || *tod != 5 * 3600 + 42 * 60 + 10) {
    spdlog::error("sun table field parsing failed");
    return 11;
  }
  if (core::anchor_month_day(core::MonthDay{.month = 2, .day = 29}, 2021) ||
      !core::anchor_month_day(core::MonthDay{.month = 2, .day = 29}, 2020)) {
    spdlog::error("leap day anchoring wrong");
    return 12;
  }
  if (core::day_index(core::LocalTime{.seconds = -1}) != -1) {
    spdlog::error("day_index must floor");
    return 13;
  }
  return 0;
}
