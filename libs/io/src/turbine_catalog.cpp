/**
 * @file turbine_catalog.cpp
 * @brief Wind farm catalog reader implementation.
 * @author Watosn
 */

#include "windcurtail/io/turbine_catalog.hpp"

#include <cctype>
#include <cmath>
#include <optional>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "windcurtail/core/constants.hpp"
#include "windcurtail/io/csv_table.hpp"

namespace windcurtail::io {
namespace {

std::string lower(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (const char c : s) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

}  // namespace

TurbineCatalogLoad TurbineCatalog::load(const std::filesystem::path& path) {
  const auto read = read_csv(path);
  if (read.status != core::Status::Ok) {
    return TurbineCatalogLoad{.status = read.status, .message = read.message};
  }
  const auto& table = read.table;

  const auto name_col = table.column("Asset Name");
  const auto station_col = table.column("Nearby_Station");
  const auto model_col = table.column("Model");
  const auto hub_col = table.column("hub_height");
  const auto units_col = table.column("number_of_turbines");
  const auto capacity_col = table.column("total_capacity_MW");
  const auto summer_col = table.column("Summer Jun-Jul");
  const auto preharvest_col = table.column("Pre-harvest Aug");
  const auto postharvest_col = table.column("Post-harvest/pre-snow Sep-Nov");
  const auto snow_col = table.column("Snow covered Dec-Feb");
  const auto spring_col = table.column("Spring Mar-May");

  const std::pair<const std::optional<std::size_t>*, const char*> required[] = {
      {&name_col, "Asset Name"},
      {&station_col, "Nearby_Station"},
      {&model_col, "Model"},
      {&hub_col, "hub_height"},
      {&units_col, "number_of_turbines"},
      {&capacity_col, "total_capacity_MW"},
      {&summer_col, "Summer Jun-Jul"},
      {&preharvest_col, "Pre-harvest Aug"},
      {&postharvest_col, "Post-harvest/pre-snow Sep-Nov"},
      {&snow_col, "Snow covered Dec-Feb"},
      {&spring_col, "Spring Mar-May"},
  };
  for (const auto& [col, name] : required) {
    if (!col->has_value()) {
      return TurbineCatalogLoad{.status = core::Status::InvalidInput,
                                .message = fmt::format("{}: missing column '{}'", path.string(), name)};
    }
  }

  TurbineCatalogLoad out{};
  for (std::size_t i = 0; i < table.rows.size(); ++i) {
    const auto& row = table.rows[i];
    const double units = parse_cell(cell(row, *units_col));
    TurbineRecord record{
        .asset_name = std::string(cell(row, *name_col)),
        .station_name = std::string(cell(row, *station_col)),
        .model = std::string(cell(row, *model_col)),
        .hub_height_m = parse_cell(cell(row, *hub_col)),
        .number_of_units = std::isfinite(units) ? static_cast<int>(units) : 0,
        .total_capacity_kw = parse_cell(cell(row, *capacity_col)) * core::constants::kKwPerMw,
        .roughness = core::SeasonalRoughness{.summer_jun_jul_m = parse_cell(cell(row, *summer_col)),
                                             .preharvest_aug_m = parse_cell(cell(row, *preharvest_col)),
                                             .postharvest_sep_nov_m = parse_cell(cell(row, *postharvest_col)),
                                             .snow_dec_feb_m = parse_cell(cell(row, *snow_col)),
                                             .spring_mar_may_m = parse_cell(cell(row, *spring_col))}};
    if (record.asset_name.empty()) {
      spdlog::warn("{}:{}: catalog row without an asset name ignored", path.string(), table.line_numbers[i]);
      continue;
    }
    out.catalog.records_.push_back(std::move(record));
  }

  if (out.catalog.records_.empty()) {
    out.status = core::Status::DataUnavailable;
    out.message = fmt::format("{}: catalog has no turbines", path.string());
    return out;
  }
  spdlog::info("loaded {} catalog entries from {}", out.catalog.records_.size(), path.string());
  return out;
}

const TurbineRecord* TurbineCatalog::find(std::string_view name) const {
  const std::string needle = lower(name);
  if (needle.empty()) {
    return nullptr;
  }
  for (const auto& record : records_) {
    if (lower(record.asset_name).find(needle) != std::string::npos) {
      return &record;
    }
  }
  return nullptr;
}

curve::TurbineProfile make_turbine_profile(const TurbineRecord& record, curve::PowerCurve power_curve,
                                           double reference_height_m, double loss_fraction) {
  return curve::TurbineProfile{.name = record.asset_name,
                               .hub_height_m = record.hub_height_m,
                               .number_of_units = record.number_of_units,
                               .rated_capacity_kw = record.total_capacity_kw,
                               .power_curve = std::move(power_curve),
                               .reference_height_m = reference_height_m,
                               .loss_fraction = loss_fraction};
}

}  // namespace windcurtail::io
