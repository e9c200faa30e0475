/**
 * @file validation_summary.hpp
 * @brief Modeled vs observed energy and hub-speed distribution agreement across sites.
 * @author Watosn
 */
#pragma once

#include <span>
#include <string>
#include <vector>

#include "windcurtail/core/types.hpp"

namespace windcurtail::curtailment {

/**
 * @brief Seasonal energy of one site from two sources.
 */
struct EnergyComparison {
  std::string site{};
  double modeled_mwh{};
  double observed_mwh{};
};

/**
 * @brief Error of modeled energy against observed energy over the compared sites.
 *
 * Sites with a missing value on either side are skipped. MAPE additionally skips sites
 * whose observed energy is zero.
 */
struct ValidationSummary {
  std::size_t sites_compared{};
  double rmse_mwh{};
  double mape_pct{};
  core::Status status{core::Status::Ok};
  std::string message{};
};

struct DistributionComparison {
  std::vector<double> modeled_density{};
  std::vector<double> observed_density{};
  double rmse{};
  core::Status status{core::Status::Ok};
  std::string message{};
};

/**
 * @brief Farm energy of a per-unit power series; missing rows count as zero.
 * @param per_unit_kw Per-unit power [kW].
 * @param number_of_units Units in the farm.
 * @param hours_per_row Duration represented by each row.
 * @return Energy [MWh], NaN when the arguments are invalid.
 */
[[nodiscard]] double series_energy_mwh(std::span<const double> per_unit_kw, int number_of_units,
                                       double hours_per_row = 1.0);

[[nodiscard]] ValidationSummary summarize_validation(std::span<const EnergyComparison> sites);

/**
 * @brief RMSE between the density-normalized hub-speed histograms of two series.
 *
 * Bins are `[e_i, e_i+1)` with the last bin closed; values outside the edges and missing
 * values are not counted.
 */
[[nodiscard]] DistributionComparison compare_wind_distributions(std::span<const double> modeled_mps,
                                                                std::span<const double> observed_mps,
                                                                std::span<const double> bin_edges_mps);

}  // namespace windcurtail::curtailment
