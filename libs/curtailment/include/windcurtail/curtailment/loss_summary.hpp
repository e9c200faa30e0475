/**
 * @file loss_summary.hpp
 * @brief Farm-level energy and time lost to blanket vs smart curtailment.
 * @author Watosn
 */
#pragma once

#include <span>
#include <vector>

#include "windcurtail/curtailment/curtailment_engine.hpp"

namespace windcurtail::curtailment {

/**
 * @brief Losses for one cut-in threshold.
 *
 * A row counts as curtailed when its corrected power is zero while the uncorrected power is not.
 */
struct ThresholdLoss {
  double threshold_mps{};
  double energy_lost_blanket_mwh{};
  double energy_lost_smart_mwh{};
  double production_lost_blanket_pct{};
  double production_lost_smart_pct{};
  double hours_curtailed_blanket{};
  double hours_curtailed_smart{};
  double time_curtailed_blanket_pct{};
  double time_curtailed_smart_pct{};
};

/**
 * @brief Losses for every threshold, ordered by threshold.
 */
struct LossSummary {
  double total_energy_mwh{};
  std::size_t rows{};
  std::vector<ThresholdLoss> thresholds{};
  core::Status status{core::Status::Ok};
};

/**
 * @brief Summarize a corrected series.
 * @param rows Corrected rows carrying per-unit power [kW].
 * @param number_of_units Units in the farm; scales per-unit power to farm level.
 * @param hours_per_row Duration represented by each row.
 */
[[nodiscard]] LossSummary summarize_losses(std::span<const CorrectedRow> rows, int number_of_units,
                                           double hours_per_row = 1.0);

}  // namespace windcurtail::curtailment
