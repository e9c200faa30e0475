/**
 * @file turbine_catalog.hpp
 * @brief Wind farm catalog (one row per farm) reader.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "windcurtail/core/types.hpp"
#include "windcurtail/curve/turbine_profile.hpp"

namespace windcurtail::io {

/**
 * @brief One catalog row.
 */
struct TurbineRecord {
  std::string asset_name{};
  std::string station_name{};
  std::string model{};
  double hub_height_m{};
  int number_of_units{1};
  double total_capacity_kw{};
  core::SeasonalRoughness roughness{};
};

class TurbineCatalog;

struct TurbineCatalogLoad;

/**
 * @brief In-memory catalog with name lookup.
 */
class TurbineCatalog {
 public:
  static TurbineCatalogLoad load(const std::filesystem::path& path);

  /**
   * @brief First record whose asset name contains `name` (case-insensitive).
   */
  [[nodiscard]] const TurbineRecord* find(std::string_view name) const;

  [[nodiscard]] const std::vector<TurbineRecord>& records() const noexcept { return records_; }
  [[nodiscard]] std::size_t size() const noexcept { return records_.size(); }

 private:
  std::vector<TurbineRecord> records_{};
};

struct TurbineCatalogLoad {
  TurbineCatalog catalog{};
  core::Status status{core::Status::Ok};
  std::string message{};
};

/**
 * @brief Build the estimator-facing profile from a catalog row and its power curve.
 */
[[nodiscard]] curve::TurbineProfile make_turbine_profile(const TurbineRecord& record, curve::PowerCurve power_curve,
                                                         double reference_height_m, double loss_fraction);

}  // namespace windcurtail::io
