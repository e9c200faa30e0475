/**
 * @file loss_summary_cli.cpp
 * @brief Energy and time lost to curtailment, per threshold, from a written series.
 * @author Watosn
 */

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include <fmt/format.h>
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include "windcurtail/curtailment/loss_summary.hpp"
#include "windcurtail/io/series_reader.hpp"
#include "windcurtail/io/series_writer.hpp"

int main(int argc, char** argv) {
  spdlog::cfg::load_env_levels();
  if (argc < 5 || argc > 6) {
    spdlog::error("usage: loss_summary_cli <series_csv> <number_of_units> <output_file> <format:csv|json> [hours_per_row]");
    return 1;
  }

  const std::filesystem::path series_path = argv[1];
  const int number_of_units = std::atoi(argv[2]);
  const std::filesystem::path output_path = argv[3];
  const auto format = windcurtail::io::parse_output_format(argv[4]);
  const double hours_per_row = (argc >= 6) ? std::atof(argv[5]) : 1.0;
  if (!format) {
    spdlog::error("format must be csv or json");
    return 4;
  }
  if (number_of_units < 1 || !(hours_per_row > 0.0)) {
    spdlog::error("number_of_units must be >= 1 and hours_per_row > 0");
    return 5;
  }

  const auto series = windcurtail::io::read_corrected_series(series_path);
  if (series.status != windcurtail::core::Status::Ok) {
    spdlog::error("{}", series.message);
    return 2;
  }

  const auto summary = windcurtail::curtailment::summarize_losses(series.rows, number_of_units, hours_per_row);
  if (summary.status != windcurtail::core::Status::Ok) {
    spdlog::error("loss summary failed: {}", windcurtail::io::status_to_string(summary.status));
    return 7;
  }

  std::ofstream out(output_path);
  if (!out) {
    spdlog::error("failed to open output file: {}", output_path.string());
    return 3;
  }
  const windcurtail::io::RunMetadata metadata{.schema = "loss_summary_v1",
                                              .fields = {{"series_csv", series_path.string()},
                                                         {"base_column", series.base_column},
                                                         {"number_of_units", std::to_string(number_of_units)}}};
  if (const auto written = windcurtail::io::write_loss_summary(out, *format, metadata, summary);
      written != windcurtail::core::Status::Ok) {
    spdlog::error("failed to write {}: {}", output_path.string(), windcurtail::io::status_to_string(written));
    return 6;
  }

  fmt::print("rows={} total_energy_mwh={:.3f}\n", summary.rows, summary.total_energy_mwh);
  for (const auto& t : summary.thresholds) {
    fmt::print("threshold={} blanket_mwh={:.3f} ({:.2f}%) smart_mwh={:.3f} ({:.2f}%) hours_blanket={} hours_smart={}\n",
               windcurtail::io::threshold_label(t.threshold_mps), t.energy_lost_blanket_mwh,
               t.production_lost_blanket_pct, t.energy_lost_smart_mwh, t.production_lost_smart_pct,
               t.hours_curtailed_blanket, t.hours_curtailed_smart);
  }
  return 0;
}
