/**
 * @file series_writer.cpp
 * @brief Series and summary writers implementation.
 * @author Watosn
 */

#include "windcurtail/io/series_writer.hpp"

#include <cmath>
#include <ctime>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "windcurtail/core/calendar.hpp"

namespace windcurtail::io {
namespace {

std::string csv_value(double v) { return std::isnan(v) ? std::string("nan") : fmt::format("{}", v); }

std::string json_value(double v) { return std::isfinite(v) ? fmt::format("{}", v) : std::string("null"); }

void write_metadata(std::ostream& out, OutputFormat format, const RunMetadata& metadata) {
  const std::time_t now = std::time(nullptr);
  if (format == OutputFormat::Csv) {
    out << fmt::format("#record_type=metadata,schema={},project=windcurtail,generated_unix_utc={}", metadata.schema,
                       static_cast<long long>(now));
    for (const auto& [key, value] : metadata.fields) {
      out << ',' << key << '=' << value;
    }
    out << '\n';
    return;
  }
  out << fmt::format(R"({{"record_type":"metadata","schema":"{}","project":"windcurtail","generated_unix_utc":{})",
                     metadata.schema, static_cast<long long>(now));
  for (const auto& [key, value] : metadata.fields) {
    out << fmt::format(R"(,"{}":"{}")", key, value);
  }
  out << "}\n";
}

std::string correction_header(const core::CorrectionMap& corrections) {
  std::string header;
  for (const auto& entry : corrections) {
    header += fmt::format(",blanket_{}", threshold_label(entry.first));
  }
  for (const auto& entry : corrections) {
    header += fmt::format(",smart_{}", threshold_label(entry.first));
  }
  return header;
}

std::string correction_csv(const core::CorrectionMap& corrections) {
  std::string cells;
  for (const auto& entry : corrections) {
    cells += ',' + csv_value(entry.second.blanket_kw);
  }
  for (const auto& entry : corrections) {
    cells += ',' + csv_value(entry.second.smart_kw);
  }
  return cells;
}

std::string correction_json(const core::CorrectionMap& corrections) {
  std::string fields;
  for (const auto& entry : corrections) {
    fields += fmt::format(R"(,"blanket_{}":{})", threshold_label(entry.first), json_value(entry.second.blanket_kw));
  }
  for (const auto& entry : corrections) {
    fields += fmt::format(R"(,"smart_{}":{})", threshold_label(entry.first), json_value(entry.second.smart_kw));
  }
  return fields;
}

}  // namespace

std::optional<OutputFormat> parse_output_format(std::string_view text) {
  if (text == "csv") {
    return OutputFormat::Csv;
  }
  if (text == "json") {
    return OutputFormat::JsonLines;
  }
  return std::nullopt;
}

const char* status_to_string(core::Status status) {
  switch (status) {
    case core::Status::Ok:
      return "ok";
    case core::Status::InvalidInput:
      return "invalid_input";
    case core::Status::NotImplemented:
      return "not_implemented";
    case core::Status::DataUnavailable:
      return "data_unavailable";
    case core::Status::NumericalError:
      return "numerical_error";
    default:
      return "unknown";
  }
}

std::string threshold_label(double threshold_mps) {
  if (std::floor(threshold_mps) == threshold_mps) {
    return fmt::format("{:.1f}", threshold_mps);
  }
  return fmt::format("{}", threshold_mps);
}

core::Status write_forward_series(std::ostream& out, OutputFormat format, const RunMetadata& metadata,
                                  std::span<const core::WeatherSample> weather,
                                  std::span<const core::PowerEstimate> estimates,
                                  std::span<const curtailment::CorrectedRow> corrected) {
  if (weather.size() != estimates.size() || weather.size() != corrected.size()) {
    spdlog::error("forward series length mismatch: weather={} estimates={} corrected={}", weather.size(),
                  estimates.size(), corrected.size());
    return core::Status::InvalidInput;
  }
  write_metadata(out, format, metadata);
  if (format == OutputFormat::Csv) {
    out << "time,temp_c,precip_mm,wind_ref_mps,wind_hub_mps,power_kw,density_kg_m3,adjustment_factor,phase"
        << (corrected.empty() ? std::string{} : correction_header(corrected.front().corrections)) << '\n';
  }

  for (std::size_t i = 0; i < weather.size(); ++i) {
    const auto& w = weather[i];
    const auto& e = estimates[i];
    const auto& c = corrected[i];
    if (format == OutputFormat::JsonLines) {
      out << fmt::format(R"({{"record_type":"sample","schema":"{}","time":"{}","temp_c":{},"precip_mm":{},)"
                         R"("wind_ref_mps":{},"wind_hub_mps":{},"power_kw":{},"density_kg_m3":{},)"
                         R"("adjustment_factor":{},"phase":"{}")",
                         metadata.schema, core::format_local_time(w.time), json_value(w.temperature_c),
                         json_value(w.precipitation_mm), json_value(w.wind_speed_ref_mps),
                         json_value(e.hub_wind_speed_mps), json_value(e.estimated_power_kw),
                         json_value(e.site_density_kg_m3), json_value(e.adjustment_factor),
                         curtailment::row_phase_to_string(c.phase))
          << correction_json(c.corrections) << "}\n";
    } else {
      out << core::format_local_time(w.time) << ',' << csv_value(w.temperature_c) << ','
          << csv_value(w.precipitation_mm) << ',' << csv_value(w.wind_speed_ref_mps) << ','
          << csv_value(e.hub_wind_speed_mps) << ',' << csv_value(e.estimated_power_kw) << ','
          << csv_value(e.site_density_kg_m3) << ',' << csv_value(e.adjustment_factor) << ','
          << curtailment::row_phase_to_string(c.phase) << correction_csv(c.corrections) << '\n';
    }
  }
  return out ? core::Status::Ok : core::Status::DataUnavailable;
}

core::Status write_backcalc_series(std::ostream& out, OutputFormat format, const RunMetadata& metadata,
                                   std::span<const core::WeatherSample> weather,
                                   std::span<const double> farm_power_kw,
                                   std::span<const core::BackCalcEstimate> estimates,
                                   std::span<const curtailment::CorrectedRow> corrected) {
  if (weather.size() != farm_power_kw.size() || weather.size() != estimates.size() ||
      weather.size() != corrected.size()) {
    spdlog::error("back-calc series length mismatch: weather={} observed={} estimates={} corrected={}",
                  weather.size(), farm_power_kw.size(), estimates.size(), corrected.size());
    return core::Status::InvalidInput;
  }
  write_metadata(out, format, metadata);
  if (format == OutputFormat::Csv) {
    out << "time,temp_c,precip_mm,observed_power_kw,per_unit_power_kw,wind_hub_mps,density_kg_m3,phase"
        << (corrected.empty() ? std::string{} : correction_header(corrected.front().corrections)) << '\n';
  }

  for (std::size_t i = 0; i < weather.size(); ++i) {
    const auto& w = weather[i];
    const auto& e = estimates[i];
    const auto& c = corrected[i];
    if (format == OutputFormat::JsonLines) {
      out << fmt::format(R"({{"record_type":"sample","schema":"{}","time":"{}","temp_c":{},"precip_mm":{},)"
                         R"("observed_power_kw":{},"per_unit_power_kw":{},"wind_hub_mps":{},"density_kg_m3":{},)"
                         R"("phase":"{}")",
                         metadata.schema, core::format_local_time(w.time), json_value(w.temperature_c),
                         json_value(w.precipitation_mm), json_value(farm_power_kw[i]),
                         json_value(e.per_unit_power_kw), json_value(e.implied_hub_wind_speed_mps),
                         json_value(e.site_density_kg_m3), curtailment::row_phase_to_string(c.phase))
          << correction_json(c.corrections) << "}\n";
    } else {
      out << core::format_local_time(w.time) << ',' << csv_value(w.temperature_c) << ','
          << csv_value(w.precipitation_mm) << ',' << csv_value(farm_power_kw[i]) << ','
          << csv_value(e.per_unit_power_kw) << ',' << csv_value(e.implied_hub_wind_speed_mps) << ','
          << csv_value(e.site_density_kg_m3) << ',' << curtailment::row_phase_to_string(c.phase)
          << correction_csv(c.corrections) << '\n';
    }
  }
  return out ? core::Status::Ok : core::Status::DataUnavailable;
}

core::Status write_loss_summary(std::ostream& out, OutputFormat format, const RunMetadata& metadata,
                                const curtailment::LossSummary& summary) {
  write_metadata(out, format, metadata);
  if (format == OutputFormat::Csv) {
    out << "threshold_mps,total_energy_mwh,energy_lost_blanket_mwh,energy_lost_smart_mwh,"
           "production_lost_blanket_pct,production_lost_smart_pct,hours_curtailed_blanket,hours_curtailed_smart,"
           "time_curtailed_blanket_pct,time_curtailed_smart_pct\n";
  }
  for (const auto& t : summary.thresholds) {
    if (format == OutputFormat::JsonLines) {
      out << fmt::format(R"({{"record_type":"summary","schema":"{}","threshold_mps":{},"total_energy_mwh":{},)"
                         R"("energy_lost_blanket_mwh":{},"energy_lost_smart_mwh":{},)"
                         R"("production_lost_blanket_pct":{},"production_lost_smart_pct":{},)"
                         R"("hours_curtailed_blanket":{},"hours_curtailed_smart":{},)"
                         R"("time_curtailed_blanket_pct":{},"time_curtailed_smart_pct":{},"status":"{}"}})",
                         metadata.schema, t.threshold_mps, json_value(summary.total_energy_mwh),
                         json_value(t.energy_lost_blanket_mwh), json_value(t.energy_lost_smart_mwh),
                         json_value(t.production_lost_blanket_pct), json_value(t.production_lost_smart_pct),
                         json_value(t.hours_curtailed_blanket), json_value(t.hours_curtailed_smart),
                         json_value(t.time_curtailed_blanket_pct), json_value(t.time_curtailed_smart_pct),
                         status_to_string(summary.status))
          << '\n';
    } else {
      out << threshold_label(t.threshold_mps) << ',' << csv_value(summary.total_energy_mwh) << ','
          << csv_value(t.energy_lost_blanket_mwh) << ',' << csv_value(t.energy_lost_smart_mwh) << ','
          << csv_value(t.production_lost_blanket_pct) << ',' << csv_value(t.production_lost_smart_pct) << ','
          << csv_value(t.hours_curtailed_blanket) << ',' << csv_value(t.hours_curtailed_smart) << ','
          << csv_value(t.time_curtailed_blanket_pct) << ',' << csv_value(t.time_curtailed_smart_pct) << '\n';
    }
  }
  return out ? core::Status::Ok : core::Status::DataUnavailable;
}

}  // namespace windcurtail::io
