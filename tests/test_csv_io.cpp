/**
 * @file test_csv_io.cpp
 * @brief Weather, sun table, catalog, observed power readers and series writer tests.
 * @author Watosn
 */

#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "windcurtail/core/calendar.hpp"
#include "windcurtail/io/csv_table.hpp"
#include "windcurtail/io/observed_power_reader.hpp"
#include "windcurtail/io/series_reader.hpp"
#include "windcurtail/io/series_writer.hpp"
#include "windcurtail/io/sun_table_reader.hpp"
#include "windcurtail/io/turbine_catalog.hpp"
#include "windcurtail/io/weather_reader.hpp"

namespace {

bool approx(double a, double b, double tol) { return std::abs(a - b) <= tol; }

bool write_text(const std::filesystem::path& p, const std::string& text) {
  std::ofstream out(p);
  if (!out) {
    return false;
  }
  out << text;
  return true;
}

}  // namespace

int main() {
  namespace fs = std::filesystem;
  using namespace windcurtail;
#ifndef WINDCURTAIL_SOURCE_DIR
  spdlog::error("WINDCURTAIL_SOURCE_DIR missing");
  return 100;
#else
  const fs::path data = fs::path(WINDCURTAIL_SOURCE_DIR) / "tests" / "data";

  const auto fields = io::split_csv_line(R"("a, b",c,,"say ""hi""")");
  if (fields.size() != 4U || fields[0] != "a, b" || fields[1] != "c" || !fields[2].empty() || fields[3] != "say \"hi\"") {
    spdlog::error("quoted CSV split failed");
    return 1;
  }
  if (!std::isnan(io::parse_cell("")) || !std::isnan(io::parse_cell("n/a")) || io::parse_cell(" 2.5 ") != 2.5) {
    spdlog::error("cell parsing failed");
    return 2;
  }

  // Weather.
  const auto weather = io::read_weather_csv(io::WeatherCsvConfig{.csv_file = data / "weather_station.csv"});
  if (weather.status != core::Status::Ok || weather.rows.size() != 26U || weather.skipped_rows != 1U) {
    spdlog::error("weather read failed: {} rows, {} skipped, {}", weather.rows.size(), weather.skipped_rows,
                  weather.message);
    return 3;
  }
  const auto& w0 = weather.rows.front();
  if (w0.time != core::make_local_time(2020, 7, 14, 22) || !approx(w0.wind_speed_ref_mps, 10.0 * 0.27778, 1e-12) ||
      w0.temperature_c != 18.0 || w0.pressure_kpa != 92.1 || w0.precipitation_mm != 0.0) {
    spdlog::error("first weather row wrong");
    return 4;
  }
  if (!std::isnan(weather.rows[7].wind_speed_ref_mps) || !std::isnan(weather.rows[8].precipitation_mm) ||
      !std::isnan(weather.rows[23].pressure_kpa)) {
    spdlog::error("empty weather cells must read as missing");
    return 5;
  }

  const auto tmp = fs::temp_directory_path();
  const auto no_precip = tmp / "windcurtail_weather_no_precip.csv";
  if (!write_text(no_precip, "Date/Time (LST),Temp (°C),Wind Spd (km/h)\n2020-07-15 00:00,10,20\n")) {
    spdlog::error("failed to write temp file");
    return 6;
  }
  const auto missing_col = io::read_weather_csv(io::WeatherCsvConfig{.csv_file = no_precip});
  if (missing_col.status != core::Status::InvalidInput ||
      missing_col.message.find("Precip. Amount (mm)") == std::string::npos) {
    spdlog::error("missing weather column must be a structural failure");
    return 7;
  }
  if (io::read_weather_csv(io::WeatherCsvConfig{.csv_file = tmp / "windcurtail_no_weather.csv"}).status !=
      core::Status::DataUnavailable) {
    spdlog::error("missing weather file must be DataUnavailable");
    return 8;
  }
  const auto renamed = tmp / "windcurtail_weather_renamed.csv";
  if (!write_text(renamed, "when,t,ws,rain\n2020-07-15 00:00,10,5,0\n")) {
    spdlog::error("failed to write temp file");
    return 6;
  }
  io::WeatherCsvConfig renamed_cfg{.csv_file = renamed, .wind_speed_conversion = 1.0};
  renamed_cfg.columns = io::WeatherColumns{
      .time = "when", .wind_speed = "ws", .temperature = "t", .precipitation = "rain", .pressure = "p"};
  const auto custom = io::read_weather_csv(renamed_cfg);
  if (custom.status != core::Status::Ok || custom.rows.size() != 1U || custom.rows[0].wind_speed_ref_mps != 5.0 ||
      !std::isnan(custom.rows[0].pressure_kpa)) {
    spdlog::error("configurable columns failed: {}", custom.message);
    return 9;
  }

  // Sun table.
  const auto sun = io::read_sun_table(data / "sun_times.csv", "Prairie Ridge Wind, Phase 1", 2020);
  if (sun.status != core::Status::Ok || sun.days.size() != 3U ||
      sun.days[1].day != core::days_from_civil(2020, 7, 15) ||
      sun.days[1].sunrise != core::make_local_time(2020, 7, 15, 5, 30) ||
      sun.days[1].sunset != core::make_local_time(2020, 7, 15, 21, 30)) {
    spdlog::error("sun table read failed: {}", sun.message);
    return 10;
  }
  const auto coulee = io::read_sun_table(data / "sun_times.csv", "Coulee Hills", 2020);
  if (coulee.status != core::Status::Ok || coulee.days.size() != 1U || coulee.skipped_rows != 1U) {
    spdlog::error("unparseable sun rows must be skipped");
    return 11;
  }
  if (io::read_sun_table(data / "sun_times.csv", "Nowhere Wind", 2020).status != core::Status::DataUnavailable) {
    spdlog::error("turbine without sun rows must fail");
    return 12;
  }

  // Catalog.
  const auto catalog = io::TurbineCatalog::load(data / "turbine_catalog.csv");
  if (catalog.status != core::Status::Ok || catalog.catalog.size() != 2U) {
    spdlog::error("catalog load failed: {}", catalog.message);
    return 13;
  }
  const auto* prairie = catalog.catalog.find("prairie RIDGE");
  if (prairie == nullptr || prairie->asset_name != "Prairie Ridge Wind, Phase 1" || prairie->hub_height_m != 80.0 ||
      prairie->number_of_units != 10 || prairie->total_capacity_kw != 20000.0 || prairie->station_name != "LETHBRIDGE" ||
      prairie->roughness.summer_jun_jul_m != 0.1 || prairie->roughness.snow_dec_feb_m != 0.001) {
    spdlog::error("catalog lookup failed");
    return 14;
  }
  if (catalog.catalog.find("Nowhere") != nullptr || catalog.catalog.find("") != nullptr) {
    spdlog::error("unknown turbine must not be found");
    return 15;
  }
  const auto profile = io::make_turbine_profile(*prairie, curve::PowerCurve(std::vector<core::PowerCurveSample>{{3.0, 0.0}, {12.0, 2000.0}}), 10.0, 0.05);
  if (profile.name != prairie->asset_name || profile.number_of_units != 10 || profile.loss_fraction != 0.05 ||
      profile.rated_capacity_kw != 20000.0) {
    spdlog::error("profile from catalog wrong");
    return 16;
  }

  // Observed power, aligned to the weather clock.
  const auto observed = io::read_observed_power(io::ObservedPowerConfig{.csv_file = data / "observed_power.csv"});
  if (observed.status != core::Status::Ok || observed.rows.size() != 24U ||
      observed.rows[1].time != core::make_local_time(2020, 7, 15, 0) || observed.rows[1].power_kw != 900.0) {
    spdlog::error("observed power read failed: {}", observed.message);
    return 17;
  }
  const auto aligned = io::align_to_weather(weather.rows, observed.rows);
  if (aligned.size() != weather.rows.size() || !std::isnan(aligned[0]) || aligned[1] != 900.0 ||
      !std::isnan(aligned[14]) || aligned[5] != 8900.0) {
    spdlog::error("observed power alignment failed");
    return 18;
  }
  const std::vector<io::ObservedPowerSample> dup{{core::make_local_time(2020, 7, 14, 22), 100.0},
                                                 {core::make_local_time(2020, 7, 14, 22), 300.0}};
  if (io::align_to_weather(weather.rows, dup)[0] != 200.0) {
    spdlog::error("duplicate observations must be averaged");
    return 19;
  }

  // Writers.
  const std::vector<core::WeatherSample> wrows{weather.rows[2], weather.rows[7]};
  const std::vector<core::PowerEstimate> est{
      {.time = wrows[0].time, .hub_wind_speed_mps = 4.0, .estimated_power_kw = 75.0, .site_density_kg_m3 = 1.1},
      {.time = wrows[1].time, .hub_wind_speed_mps = 0.0, .estimated_power_kw = 0.0, .site_density_kg_m3 = 1.1}};
  const std::vector<curtailment::CorrectedRow> corr{
      {.time = wrows[0].time, .power_kw = 75.0, .phase = curtailment::RowPhase::Restricted,
       .corrections = {{5.0, {.blanket_kw = 0.0, .smart_kw = 75.0}}, {5.5, {.blanket_kw = 0.0, .smart_kw = 0.0}}}},
      {.time = wrows[1].time, .power_kw = 0.0, .phase = curtailment::RowPhase::Unrestricted,
       .corrections = {{5.0, {.blanket_kw = 0.0, .smart_kw = 0.0}}, {5.5, {.blanket_kw = 0.0, .smart_kw = 0.0}}}}};
  const io::RunMetadata meta{.schema = "forward_power_v1", .fields = {{"turbine", "test"}}};

  std::ostringstream csv;
  if (io::write_forward_series(csv, io::OutputFormat::Csv, meta, wrows, est, corr) != core::Status::Ok) {
    spdlog::error("forward CSV write failed");
    return 20;
  }
  const std::string text = csv.str();
  if (text.rfind("#record_type=metadata,schema=forward_power_v1,project=windcurtail", 0) != 0 ||
      text.find("phase,blanket_5.0,blanket_5.5,smart_5.0,smart_5.5\n") == std::string::npos ||
      text.find("2020-07-15 00:00:00,16,0,") == std::string::npos || text.find(",nan,") == std::string::npos) {
    spdlog::error("forward CSV layout wrong:\n{}", text);
    return 21;
  }
  std::ostringstream json;
  if (io::write_forward_series(json, io::OutputFormat::JsonLines, meta, wrows, est, corr) != core::Status::Ok ||
      json.str().find(R"("wind_ref_mps":null)") == std::string::npos ||
      json.str().find(R"("blanket_5.5":0)") == std::string::npos) {
    spdlog::error("forward JSON layout wrong:\n{}", json.str());
    return 22;
  }
  std::ostringstream bad;
  if (io::write_forward_series(bad, io::OutputFormat::Csv, meta, wrows, est, std::vector<curtailment::CorrectedRow>{}) !=
      core::Status::InvalidInput) {
    spdlog::error("length mismatch must be rejected by the writer");
    return 23;
  }

  // What the writer emits, the series reader takes back.
  const auto series_file = tmp / "windcurtail_series_test.csv";
  if (!write_text(series_file, text)) {
    spdlog::error("failed to write temp file");
    return 6;
  }
  const auto reread = io::read_corrected_series(series_file);
  if (reread.status != core::Status::Ok || reread.rows.size() != 2U || reread.base_column != "power_kw" ||
      reread.rows[0].power_kw != 75.0 || reread.rows[0].phase != curtailment::RowPhase::Restricted ||
      reread.rows[0].corrections.size() != 2U || reread.rows[0].corrections.at(5.5).blanket_kw != 0.0 ||
      reread.rows[0].corrections.at(5.0).smart_kw != 75.0) {
    spdlog::error("series reader failed: {}", reread.message);
    return 24;
  }

  if (io::threshold_label(5.0) != "5.0" || io::threshold_label(5.25) != "5.25" || !io::parse_output_format("json") ||
      io::parse_output_format("xml")) {
    spdlog::error("label/format helpers wrong");
    return 25;
  }

  fs::remove(no_precip);
  fs::remove(renamed);
  fs::remove(series_file);
  return 0;
#endif
}
