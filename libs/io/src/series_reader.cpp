/**
 * @file series_reader.cpp
 * @brief Corrected series reader implementation.
 * @author Watosn
 */

#include "windcurtail/io/series_reader.hpp"

#include <cmath>
#include <map>
#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "windcurtail/core/calendar.hpp"
#include "windcurtail/io/csv_table.hpp"

namespace windcurtail::io {
namespace {

constexpr std::string_view kBlanketPrefix = "blanket_";
constexpr std::string_view kSmartPrefix = "smart_";

curtailment::RowPhase parse_phase(std::string_view text) {
  if (text == "restricted") {
    return curtailment::RowPhase::Restricted;
  }
  if (text == "unrestricted") {
    return curtailment::RowPhase::Unrestricted;
  }
  if (text == "no_window") {
    return curtailment::RowPhase::NoWindow;
  }
  return curtailment::RowPhase::OutOfSeason;
}

}  // namespace

CorrectedSeries read_corrected_series(const std::filesystem::path& path) {
  const auto read = read_csv(path);
  if (read.status != core::Status::Ok) {
    return CorrectedSeries{.status = read.status, .message = read.message};
  }
  const auto& table = read.table;

  const auto time_col = table.column("time");
  auto base_col = table.column("power_kw");
  std::string base_name = "power_kw";
  if (!base_col) {
    base_col = table.column("per_unit_power_kw");
    base_name = "per_unit_power_kw";
  }
  if (!time_col || !base_col) {
    return CorrectedSeries{.status = core::Status::InvalidInput,
                           .message = fmt::format("{}: expected time and power_kw or per_unit_power_kw columns",
                                                  path.string())};
  }
  const auto phase_col = table.column("phase");

  // threshold -> (blanket column, smart column)
  std::map<double, std::pair<std::size_t, std::size_t>> columns;
  for (std::size_t c = 0; c < table.header.size(); ++c) {
    const std::string_view name = table.header[c];
    if (!name.starts_with(kBlanketPrefix)) {
      continue;
    }
    const double threshold = parse_cell(name.substr(kBlanketPrefix.size()));
    const auto smart_col = table.column(fmt::format("{}{}", kSmartPrefix, name.substr(kBlanketPrefix.size())));
    if (std::isnan(threshold) || !smart_col) {
      return CorrectedSeries{.status = core::Status::InvalidInput,
                             .message = fmt::format("{}: column '{}' has no usable smart counterpart", path.string(),
                                                    name)};
    }
    columns.emplace(threshold, std::make_pair(c, *smart_col));
  }
  if (columns.empty()) {
    return CorrectedSeries{.status = core::Status::InvalidInput,
                           .message = fmt::format("{}: no blanket_<threshold> columns", path.string())};
  }

  CorrectedSeries out{.base_column = base_name};
  out.rows.reserve(table.rows.size());
  std::size_t skipped = 0;
  for (std::size_t i = 0; i < table.rows.size(); ++i) {
    const auto& row = table.rows[i];
    const auto time = core::parse_local_time(cell(row, *time_col));
    if (!time) {
      spdlog::debug("{}:{}: unparseable timestamp", path.string(), table.line_numbers[i]);
      ++skipped;
      continue;
    }
    curtailment::CorrectedRow corrected{.time = *time,
                                        .power_kw = parse_cell(cell(row, *base_col)),
                                        .phase = phase_col ? parse_phase(cell(row, *phase_col))
                                                           : curtailment::RowPhase::OutOfSeason};
    for (const auto& [threshold, cols] : columns) {
      corrected.corrections.emplace(threshold, core::ThresholdCorrection{.blanket_kw = parse_cell(cell(row, cols.first)),
                                                                         .smart_kw = parse_cell(cell(row, cols.second))});
    }
    out.rows.push_back(std::move(corrected));
  }
  if (skipped > 0) {
    spdlog::warn("{}: skipped {} rows with malformed timestamps", path.string(), skipped);
  }
  spdlog::info("read {} corrected rows ({} thresholds) from {}", out.rows.size(), columns.size(), path.string());
  return out;
}

}  // namespace windcurtail::io
