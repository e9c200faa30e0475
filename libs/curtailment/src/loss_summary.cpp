/**
 * @file loss_summary.cpp
 * @brief Curtailment loss aggregation.
 * @author Watosn
 */

#include "windcurtail/curtailment/loss_summary.hpp"

#include <Eigen/Dense>

#include "windcurtail/core/constants.hpp"

namespace windcurtail::curtailment {
namespace {

Eigen::ArrayXd zero_missing(const Eigen::ArrayXd& a) {
  return a.isNaN().select(Eigen::ArrayXd::Zero(a.size()), a);
}

double percent(double part, double whole) { return whole != 0.0 ? part / whole * 100.0 : 0.0; }

}  // namespace

LossSummary summarize_losses(std::span<const CorrectedRow> rows, int number_of_units, double hours_per_row) {
  if (number_of_units < 1 || !(hours_per_row > 0.0)) {
    return LossSummary{.status = core::Status::InvalidInput};
  }

  LossSummary out{.rows = rows.size()};
  if (rows.empty()) {
    return out;
  }

  const auto n = static_cast<Eigen::Index>(rows.size());
  const double to_mwh = static_cast<double>(number_of_units) / core::constants::kKwPerMw * hours_per_row;

  Eigen::ArrayXd base(n);
  for (Eigen::Index i = 0; i < n; ++i) {
    base(i) = rows[static_cast<std::size_t>(i)].power_kw;
  }
  base = zero_missing(base) * to_mwh;
  out.total_energy_mwh = base.sum();
  const Eigen::Array<bool, Eigen::Dynamic, 1> producing = (base != 0.0);

  for (const auto& entry : rows.front().corrections) {
    const double threshold = entry.first;
    Eigen::ArrayXd blanket(n);
    Eigen::ArrayXd smart(n);
    for (Eigen::Index i = 0; i < n; ++i) {
      const auto& corr = rows[static_cast<std::size_t>(i)].corrections;
      const auto it = corr.find(threshold);
      const double b = (it != corr.end()) ? it->second.blanket_kw : rows[static_cast<std::size_t>(i)].power_kw;
      const double s = (it != corr.end()) ? it->second.smart_kw : rows[static_cast<std::size_t>(i)].power_kw;
      blanket(i) = b;
      smart(i) = s;
    }
    blanket = zero_missing(blanket) * to_mwh;
    smart = zero_missing(smart) * to_mwh;

    const double lost_b = out.total_energy_mwh - blanket.sum();
    const double lost_s = out.total_energy_mwh - smart.sum();
    const double hours_b = static_cast<double>(((blanket == 0.0) && producing).count()) * hours_per_row;
    const double hours_s = static_cast<double>(((smart == 0.0) && producing).count()) * hours_per_row;
    const double total_hours = static_cast<double>(rows.size()) * hours_per_row;

    out.thresholds.push_back(ThresholdLoss{.threshold_mps = threshold,
                                           .energy_lost_blanket_mwh = lost_b,
                                           .energy_lost_smart_mwh = lost_s,
                                           .production_lost_blanket_pct = percent(lost_b, out.total_energy_mwh),
                                           .production_lost_smart_pct = percent(lost_s, out.total_energy_mwh),
                                           .hours_curtailed_blanket = hours_b,
                                           .hours_curtailed_smart = hours_s,
                                           .time_curtailed_blanket_pct = percent(hours_b, total_hours),
                                           .time_curtailed_smart_pct = percent(hours_s, total_hours)});
  }
  return out;
}

}  // namespace windcurtail::curtailment
