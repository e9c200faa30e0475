/**
 * @file test_validation_summary.cpp
 * @brief Modeled vs observed energy and wind distribution metric tests.
 * @author Watosn
 */

#include <cmath>
#include <vector>

#include <spdlog/spdlog.h>

#include "windcurtail/curtailment/validation_summary.hpp"

namespace {

bool approx(double a, double b, double tol) { return std::abs(a - b) <= tol; }

}  // namespace

int main() {
  using namespace windcurtail;
  const double nan = std::nan("");

  const std::vector<double> per_unit{500.0, nan, 1000.0};
  if (!approx(curtailment::series_energy_mwh(per_unit, 4), 6.0, 1e-12) ||
      !approx(curtailment::series_energy_mwh(per_unit, 4, 0.5), 3.0, 1e-12)) {
    spdlog::error("series energy failed: {}", curtailment::series_energy_mwh(per_unit, 4));
    return 1;
  }
  if (!std::isnan(curtailment::series_energy_mwh(per_unit, 0))) {
    spdlog::error("series energy accepted zero units");
    return 2;
  }

  // The site missing modeled energy is dropped; the zero-observed site counts for RMSE only.
  const std::vector<curtailment::EnergyComparison> sites{
      {.site = "A", .modeled_mwh = 110.0, .observed_mwh = 100.0},
      {.site = "B", .modeled_mwh = 90.0, .observed_mwh = 100.0},
      {.site = "C", .modeled_mwh = nan, .observed_mwh = 50.0},
      {.site = "D", .modeled_mwh = 20.0, .observed_mwh = 0.0},
  };
  const auto v = curtailment::summarize_validation(sites);
  if (v.status != core::Status::Ok || v.sites_compared != 3U) {
    spdlog::error("validation status failed: compared={}", v.sites_compared);
    return 3;
  }
  if (!approx(v.rmse_mwh, std::sqrt(200.0), 1e-12) || !approx(v.mape_pct, 10.0, 1e-12)) {
    spdlog::error("validation metrics failed: rmse={} mape={}", v.rmse_mwh, v.mape_pct);
    return 4;
  }

  const std::vector<curtailment::EnergyComparison> only_zero{{.site = "D", .modeled_mwh = 5.0, .observed_mwh = 0.0}};
  const auto z = curtailment::summarize_validation(only_zero);
  if (z.status != core::Status::Ok || !approx(z.rmse_mwh, 5.0, 1e-12) || !std::isnan(z.mape_pct)) {
    spdlog::error("zero observed handling failed: rmse={} mape={}", z.rmse_mwh, z.mape_pct);
    return 5;
  }

  const std::vector<curtailment::EnergyComparison> missing{{.site = "C", .modeled_mwh = nan, .observed_mwh = 50.0}};
  if (curtailment::summarize_validation(missing).status != core::Status::DataUnavailable ||
      curtailment::summarize_validation({}).status != core::Status::DataUnavailable) {
    spdlog::error("empty comparison not reported as unavailable");
    return 6;
  }

  // Out-of-range and missing speeds are not counted; the last bin includes its upper edge.
  const std::vector<double> edges{4.0, 6.0, 8.0};
  const std::vector<double> modeled{4.0, 5.0, 7.0, 8.0, 3.0, nan};
  const std::vector<double> observed{5.0, 5.0, 5.0, 7.0};
  const auto d = curtailment::compare_wind_distributions(modeled, observed, edges);
  if (d.status != core::Status::Ok || d.modeled_density.size() != 2U || !approx(d.modeled_density[0], 0.25, 1e-12) ||
      !approx(d.modeled_density[1], 0.25, 1e-12) || !approx(d.observed_density[0], 0.375, 1e-12) ||
      !approx(d.observed_density[1], 0.125, 1e-12)) {
    spdlog::error("density histogram failed");
    return 7;
  }
  if (!approx(d.rmse, 0.125, 1e-12)) {
    spdlog::error("distribution rmse failed: {}", d.rmse);
    return 8;
  }

  const std::vector<double> flat_edges{4.0, 4.0};
  if (curtailment::compare_wind_distributions(modeled, observed, flat_edges).status != core::Status::InvalidInput) {
    spdlog::error("non-increasing bin edges accepted");
    return 9;
  }
  const std::vector<double> calm{1.0, 2.0};
  const auto empty_bins = curtailment::compare_wind_distributions(modeled, calm, edges);
  if (empty_bins.status != core::Status::DataUnavailable || !std::isnan(empty_bins.rmse)) {
    spdlog::error("series outside every bin not reported as unavailable");
    return 10;
  }

  return 0;
}
